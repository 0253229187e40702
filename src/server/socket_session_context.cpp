#include "socket_session_context.hpp"
#include <iostream>

SocketSessionContext::SocketSessionContext(uint32_t session_id, int fd)
    : session_id_(session_id), stream_(fd) {}

NET::IoResult SocketSessionContext::read_message(std::string& buf) {
    return stream_.read_message(buf);
}

NET::IoResult SocketSessionContext::write_message(const std::string& buf) {
    return stream_.write_message(buf);
}

SessionContext::Clock::time_point SocketSessionContext::now() {
    return Clock::now();
}

void SocketSessionContext::log(const std::string& message) {
    std::cout << "[session " << session_id_ << "] " << message << std::endl;
}

void SocketSessionContext::log_error(const std::string& message) {
    std::cerr << "[session " << session_id_ << "] " << message << std::endl;
}
