#ifndef SESSION_CONTEXT_HPP
#define SESSION_CONTEXT_HPP

#include <chrono>
#include <string>
#include "../net/net_common.hpp"

// Все, что сессии нужно от внешнего мира: сообщения, время и лог.
// Реальная реализация работает с сокетом, в тестах - подставная.
class SessionContext {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~SessionContext() {}

    // --- Сообщения ---
    // Очищает buf и кладет в него следующее сообщение клиента.
    virtual NET::IoResult read_message(std::string& buf) = 0;

    // Отправляет buf целиком.
    virtual NET::IoResult write_message(const std::string& buf) = 0;

    // --- Время ---
    virtual Clock::time_point now() = 0;

    // --- Лог ---
    virtual void log(const std::string& message) = 0;
    virtual void log_error(const std::string& message) = 0;
};

#endif
