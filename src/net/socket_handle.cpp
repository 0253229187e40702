#include "socket_handle.hpp"
#include <cerrno>
#include <utility>
#include <sys/socket.h>
#include <unistd.h>

namespace NetSocket {

SocketHandle::SocketHandle() : fd_(-1) {}

SocketHandle::SocketHandle(int fd, const std::string& peer)
    : fd_(fd), peer_(peer) {
}

SocketHandle::~SocketHandle() {
    close();
}

bool SocketHandle::shutdown_both(int& error) {
    error = 0;
    if (!is_valid()) {
        error = EBADF;
        return false;
    }
    if (::shutdown(fd_, SHUT_RDWR) != 0) {
        error = errno;
        return false;
    }
    return true;
}

void SocketHandle::close() {
    if (is_valid()) {
        ::close(fd_);
        fd_ = -1;
    }
}

SocketHandle::SocketHandle(SocketHandle&& other) noexcept
    : fd_(other.fd_), peer_(std::move(other.peer_)) {
    other.fd_ = -1;
}

SocketHandle& SocketHandle::operator=(SocketHandle&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        peer_ = std::move(other.peer_);
        other.fd_ = -1;
    }
    return *this;
}

}
