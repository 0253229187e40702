#include "server_config.hpp"
#include "../net/net_common.hpp"
#include <cctype>
#include <cstdlib>

namespace {

// "--name=value" или "--name value"; для коротких: "-xvalue" или "-x value"
bool take_value(int argc, const char* const argv[], int& i, const std::string& arg,
                const std::string& short_name, const std::string& long_name,
                std::string& value, bool& matched, std::string& error) {
    matched = false;

    if (arg == short_name || arg == long_name) {
        matched = true;
        if (i + 1 >= argc) {
            error = "missing value for " + long_name;
            return false;
        }
        value = argv[++i];
        return true;
    }

    std::string long_prefix = long_name + "=";
    if (arg.compare(0, long_prefix.size(), long_prefix) == 0) {
        matched = true;
        value = arg.substr(long_prefix.size());
        return true;
    }

    if (arg.size() > short_name.size() && arg.compare(0, short_name.size(), short_name) == 0 &&
        arg.compare(0, 2, "--") != 0) {
        matched = true;
        value = arg.substr(short_name.size());
        return true;
    }

    return true;
}

}

bool parse_port(const std::string& text, uint16_t& port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    long value = std::strtol(text.c_str(), nullptr, 10);
    if (!NET::is_valid_port(value)) {
        return false;
    }

    port = static_cast<uint16_t>(value);
    return true;
}

ConfigStatus parse_server_config(int argc, const char* const argv[], const char* env_flag,
                                 ServerConfig& config, std::string& error) {
    bool have_port = false;
    bool have_flag = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            return ConfigStatus::SHOW_HELP;
        }
        if (arg == "-V" || arg == "--version") {
            return ConfigStatus::SHOW_VERSION;
        }

        std::string value;
        bool matched = false;

        if (!take_value(argc, argv, i, arg, "-p", "--port", value, matched, error)) {
            return ConfigStatus::USAGE_ERROR;
        }
        if (matched) {
            if (!parse_port(value, config.port)) {
                error = "invalid port: '" + value + "'";
                return ConfigStatus::USAGE_ERROR;
            }
            have_port = true;
            continue;
        }

        if (!take_value(argc, argv, i, arg, "-f", "--flag", value, matched, error)) {
            return ConfigStatus::USAGE_ERROR;
        }
        if (matched) {
            config.flag = value;
            have_flag = true;
            continue;
        }

        error = "unexpected argument '" + arg + "'";
        return ConfigStatus::USAGE_ERROR;
    }

    if (!have_port) {
        error = "the following required arguments were not provided: --port <PORT>";
        return ConfigStatus::USAGE_ERROR;
    }

    if (!have_flag) {
        if (env_flag == nullptr) {
            error = "couldn't get flag (either provide it in --flag, or a FLAG env var)";
            return ConfigStatus::MISSING_FLAG;
        }
        config.flag = env_flag;
    }

    return ConfigStatus::OK;
}

std::string get_usage(const std::string& program) {
    return "Word association challenge server\n"
           "\n"
           "Usage: " + program + " --port <PORT> [--flag <FLAG>]\n"
           "\n"
           "Options:\n"
           "  -p, --port <PORT>  Port for the server to listen on (127.0.0.1)\n"
           "  -f, --flag <FLAG>  Flag to give the user on challenge completion.\n"
           "                     If not present, taken from the FLAG environment variable\n"
           "  -h, --help         Print help\n"
           "  -V, --version      Print version\n";
}
