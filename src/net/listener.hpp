#ifndef LISTENER_HPP
#define LISTENER_HPP

#include <cstdint>
#include <string>
#include "socket_handle.hpp"

namespace NetSocket {

// TCP-сокет, слушающий на 127.0.0.1
class Listener {
private:
    SocketHandle socket_;
    uint16_t port_;

public:
    Listener();

    // port == 0 - порт выбирает ОС, узнать его можно через get_port()
    bool bind_loopback(uint16_t port, int& error);
    bool accept_connection(SocketHandle& client, int& error);

    bool is_bound() const { return socket_.is_valid(); }
    uint16_t get_port() const { return port_; }
    std::string get_address() const;

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;
};

}

#endif
