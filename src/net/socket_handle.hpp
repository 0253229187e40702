#ifndef SOCKET_HANDLE_HPP
#define SOCKET_HANDLE_HPP

#include <string>

namespace NetSocket {

class SocketHandle {
private:
    int fd_;
    std::string peer_;

public:
    SocketHandle();
    SocketHandle(int fd, const std::string& peer);
    ~SocketHandle();

    bool is_valid() const { return fd_ >= 0; }
    int get() const { return fd_; }
    const std::string& get_peer() const { return peer_; }

    // Закрывает соединение в обе стороны; сам дескриптор закрывается в деструкторе
    bool shutdown_both(int& error);
    void close();

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    SocketHandle(SocketHandle&& other) noexcept;
    SocketHandle& operator=(SocketHandle&& other) noexcept;
};

}

#endif
