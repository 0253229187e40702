#include "listener.hpp"
#include "net_common.hpp"
#include <cerrno>
#include <cstring>
#include <utility>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace NetSocket {

namespace {

std::string format_peer_address(const struct sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) == nullptr) {
        return "unknown";
    }
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

}

Listener::Listener() : port_(0) {}

bool Listener::bind_loopback(uint16_t port, int& error) {
    error = 0;

    int sock = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (sock < 0) {
        error = errno;
        return false;
    }
    SocketHandle handle(sock, NET::LOOPBACK_ADDRESS);

    int set = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &set, sizeof(set)) < 0) {
        error = errno;
        return false;
    }

    struct sockaddr_in sk_addr;
    std::memset(&sk_addr, 0, sizeof(sk_addr));
    sk_addr.sin_family = AF_INET;
    sk_addr.sin_port = htons(port);
    if (inet_pton(AF_INET, NET::LOOPBACK_ADDRESS.c_str(), &sk_addr.sin_addr) != 1) {
        error = EINVAL;
        return false;
    }

    if (::bind(sock, reinterpret_cast<struct sockaddr*>(&sk_addr), sizeof(sk_addr)) < 0) {
        error = errno;
        return false;
    }

    if (::listen(sock, NET::LISTEN_BACKLOG) < 0) {
        error = errno;
        return false;
    }

    // Узнаем реальный порт (важно при port == 0)
    struct sockaddr_in bound_addr;
    socklen_t addrlen = sizeof(bound_addr);
    if (getsockname(sock, reinterpret_cast<struct sockaddr*>(&bound_addr), &addrlen) < 0) {
        error = errno;
        return false;
    }

    port_ = ntohs(bound_addr.sin_port);
    socket_ = std::move(handle);
    return true;
}

bool Listener::accept_connection(SocketHandle& client, int& error) {
    error = 0;

    struct sockaddr_in client_addr;
    std::memset(&client_addr, 0, sizeof(client_addr));
    socklen_t addrlen = sizeof(client_addr);

    int connfd = ::accept(socket_.get(), reinterpret_cast<struct sockaddr*>(&client_addr), &addrlen);
    if (connfd < 0) {
        error = errno;
        return false;
    }

    client = SocketHandle(connfd, format_peer_address(client_addr));
    return true;
}

std::string Listener::get_address() const {
    return NET::LOOPBACK_ADDRESS + ":" + std::to_string(port_);
}

}
