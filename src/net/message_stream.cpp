#include "message_stream.hpp"
#include <iostream>
#include <chrono>
#include <thread>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>

namespace NetSocket {

namespace {

// 1 - готово, 0 - таймаут, -1 - ошибка (errno в error)
int wait_for(int fd, short events, int timeout_ms, int& error) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;

    int rv = ::poll(&pfd, 1, timeout_ms);
    if (rv < 0) {
        error = errno;
        return -1;
    }
    if (rv == 0) {
        return 0;
    }
    if (pfd.revents & POLLNVAL) {
        error = EBADF;
        return -1;
    }
    // POLLHUP/POLLERR: следующий recv/send сам сообщит о причине
    return 1;
}

bool is_transient_error(int error) {
    return error == EAGAIN || error == EWOULDBLOCK || error == EINTR;
}

void retry_delay() {
    std::this_thread::sleep_for(std::chrono::milliseconds(NET::RETRY_DELAY_MS));
}

} // namespace

// ==================== Вспомогательные функции ====================

std::string get_socket_error_string(int error) {
    if (error == 0) return "No error";
    return "Error " + std::to_string(error) + ": " + std::strerror(error);
}

bool is_peer_closed_error(int error) {
    return error == EPIPE || error == ECONNRESET || error == ENOTCONN;
}

// ==================== MessageStream ====================

MessageStream::MessageStream(int fd, int max_tries, int coalesce_window_ms)
    : fd_(fd), max_tries_(max_tries), coalesce_window_ms_(coalesce_window_ms) {
}

bool MessageStream::take_pending_line(std::string& buf) {
    size_t newline = pending_.find('\n');
    if (newline == std::string::npos) {
        return false;
    }
    buf.assign(pending_, 0, newline + 1);
    pending_.erase(0, newline + 1);
    return true;
}

NET::IoResult MessageStream::read_first_chunk(std::string& buf) {
    char chunk[NET::READ_CHUNK_SIZE];
    int readable_tries = 0;
    int read_tries = 0;

    while (true) {
        int error = 0;
        if (wait_for(fd_, POLLIN, -1, error) < 0) {
            if (error == EINTR) continue;
            if (++readable_tries > max_tries_) {
                return NET::io_error(error);
            }
            retry_delay();
            continue;
        }

        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), MSG_DONTWAIT);
        if (n == 0) {
            return NET::io_error(EPIPE);
        }
        if (n > 0) {
            buf.append(chunk, static_cast<size_t>(n));
            return NET::io_ok(static_cast<size_t>(n));
        }

        error = errno;
        if (is_transient_error(error)) {
            continue;
        }
        if (is_peer_closed_error(error)) {
            return NET::io_error(error);
        }

        std::cerr << "failed to read from socket: " << get_socket_error_string(error) << std::endl;
        if (++read_tries > max_tries_) {
            std::cerr << "tried to read " << read_tries << " times and failed" << std::endl;
            return NET::io_error(error);
        }
        retry_delay();
    }
}

void MessageStream::read_rest_of_line(std::string& buf) {
    char chunk[NET::READ_CHUNK_SIZE];

    while (buf.find('\n') == std::string::npos && buf.size() < NET::MAX_MESSAGE_SIZE) {
        int error = 0;
        if (wait_for(fd_, POLLIN, coalesce_window_ms_, error) <= 0) {
            return;
        }

        size_t room = std::min(sizeof(chunk), NET::MAX_MESSAGE_SIZE - buf.size());
        ssize_t n = ::recv(fd_, chunk, room, MSG_DONTWAIT);
        if (n < 0 && is_transient_error(errno)) {
            continue;
        }
        if (n <= 0) {
            // закрытие или ошибка всплывут при следующем чтении
            return;
        }
        buf.append(chunk, static_cast<size_t>(n));
    }
}

NET::IoResult MessageStream::read_message(std::string& buf) {
    buf.clear();

    if (take_pending_line(buf)) {
        return NET::io_ok(buf.size());
    }

    buf.swap(pending_);
    if (buf.empty()) {
        NET::IoResult result = read_first_chunk(buf);
        if (!result.ok) {
            return result;
        }
    }

    if (coalesce_window_ms_ > 0) {
        read_rest_of_line(buf);
    }

    size_t newline = buf.find('\n');
    if (newline != std::string::npos && newline + 1 < buf.size()) {
        pending_.assign(buf, newline + 1, std::string::npos);
        buf.erase(newline + 1);
    }

    return NET::io_ok(buf.size());
}

NET::IoResult MessageStream::write_message(const std::string& buf) {
    size_t position = 0;
    int tries = 0;

    while (position < buf.size()) {
        int error = 0;
        if (wait_for(fd_, POLLOUT, -1, error) < 0) {
            if (error == EINTR) continue;
            if (++tries > max_tries_) {
                std::cerr << "failed to write to socket: " << get_socket_error_string(error) << std::endl;
                return NET::io_error(error);
            }
            retry_delay();
            continue;
        }

        ssize_t n = ::send(fd_, buf.data() + position, buf.size() - position,
                           MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n >= 0) {
            position += static_cast<size_t>(n);
            continue;
        }

        error = errno;
        if (is_transient_error(error)) {
            continue;
        }
        if (is_peer_closed_error(error)) {
            return NET::io_error(error);
        }
        if (++tries > max_tries_) {
            std::cerr << "failed to write to socket: " << get_socket_error_string(error) << std::endl;
            return NET::io_error(error);
        }
        retry_delay();
    }

    return NET::io_ok(position);
}

} // namespace NetSocket
