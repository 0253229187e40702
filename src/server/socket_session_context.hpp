#ifndef SOCKET_SESSION_CONTEXT_HPP
#define SOCKET_SESSION_CONTEXT_HPP

#include <cstdint>
#include <string>
#include "session_context.hpp"
#include "../net/message_stream.hpp"

class SocketSessionContext : public SessionContext {
private:
    uint32_t session_id_;
    NetSocket::MessageStream stream_;

public:
    SocketSessionContext(uint32_t session_id, int fd);

    NET::IoResult read_message(std::string& buf) override;
    NET::IoResult write_message(const std::string& buf) override;
    Clock::time_point now() override;
    void log(const std::string& message) override;
    void log_error(const std::string& message) override;
};

#endif
