#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include <cstdint>
#include <string>

const std::string SERVER_NAME = "wordshift";
const std::string SERVER_VERSION = "0.1.0";

struct ServerConfig {
    uint16_t port;
    std::string flag;

    ServerConfig() : port(0) {}
};

enum class ConfigStatus {
    OK,
    SHOW_HELP,
    SHOW_VERSION,
    USAGE_ERROR,    // exit 2
    MISSING_FLAG    // exit 1
};

// Разбор аргументов: -p/--port (обязателен), -f/--flag, -h/--help, -V/--version.
// Без --flag используется env_flag (значение FLAG из окружения, может быть nullptr).
ConfigStatus parse_server_config(int argc, const char* const argv[], const char* env_flag,
                                 ServerConfig& config, std::string& error);

bool parse_port(const std::string& text, uint16_t& port);

std::string get_usage(const std::string& program);

#endif
