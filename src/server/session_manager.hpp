#ifndef SESSION_MANAGER_HPP
#define SESSION_MANAGER_HPP

#include <cstdint>
#include <string>
#include <unordered_map>
#include <mutex>
#include <condition_variable>
#include "../net/listener.hpp"
#include "../net/socket_handle.hpp"

// Принимает соединения и запускает каждую сессию в своем потоке.
// Сессии разделяют только неизменяемую таблицу слов и флаг.
class SessionManager {
private:
    NetSocket::Listener& listener_;
    const std::string flag_;
    std::unordered_map<uint32_t, std::string> sessions_;   // id -> адрес клиента
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    uint32_t next_session_id_;

    uint32_t register_session(const std::string& peer);
    void remove_session(uint32_t session_id);
    void handle_connection(uint32_t session_id, NetSocket::SocketHandle socket);

public:
    SessionManager(NetSocket::Listener& listener, const std::string& flag);
    ~SessionManager();

    // Бесконечный цикл приема соединений
    void run();

    // Принимает одно соединение и запускает для него сессию
    bool accept_next();

    void wait_for_idle();
    size_t get_session_count() const;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
};

#endif
