#include <iostream>
#include <string>
#include <cstdlib>
#include "server_config.hpp"
#include "session_manager.hpp"
#include "../net/listener.hpp"
#include "../net/message_stream.hpp"

int main(int argc, char* argv[]) {
    std::string program = argc > 0 ? argv[0] : SERVER_NAME;

    ServerConfig config;
    std::string error;
    ConfigStatus status = parse_server_config(argc, argv, std::getenv("FLAG"), config, error);

    switch (status) {
        case ConfigStatus::SHOW_HELP:
            std::cout << get_usage(program);
            return 0;
        case ConfigStatus::SHOW_VERSION:
            std::cout << SERVER_NAME << " " << SERVER_VERSION << std::endl;
            return 0;
        case ConfigStatus::USAGE_ERROR:
            std::cerr << "error: " << error << "\n\n" << get_usage(program);
            return 2;
        case ConfigStatus::MISSING_FLAG:
            std::cerr << "Error: " << error << std::endl;
            return 1;
        case ConfigStatus::OK:
            break;
    }

    NetSocket::Listener listener;
    int bind_error = 0;
    if (!listener.bind_loopback(config.port, bind_error)) {
        std::cerr << "could not bind to " << NET::LOOPBACK_ADDRESS << ":" << config.port
                  << ", dying: " << NetSocket::get_socket_error_string(bind_error) << std::endl;
        return 1;
    }

    std::cout << "starting server on " << listener.get_address() << std::endl;

    SessionManager session_manager(listener, config.flag);
    session_manager.run();

    return 0;
}
