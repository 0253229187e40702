#ifndef NET_COMMON_HPP
#define NET_COMMON_HPP

#include <string>
#include <cstdint>
#include <cstddef>

namespace NET {
    // Сетевые константы
    const std::string LOOPBACK_ADDRESS = "127.0.0.1";
    const int LISTEN_BACKLOG = 16;
    const size_t READ_CHUNK_SIZE = 1024;
    const size_t MAX_MESSAGE_SIZE = 4096;
    const int MAX_TRIES = 100;             // предел повторов при ошибках сокета
    const int COALESCE_WINDOW_MS = 50;     // ожидание хвоста фрагментированной строки
    const int RETRY_DELAY_MS = 10;

    // Результат операции ввода-вывода
    struct IoResult {
        bool ok;
        int error;      // errno; EPIPE - клиент закрыл соединение
        size_t bytes;
    };

    inline IoResult io_ok(size_t bytes) {
        IoResult result;
        result.ok = true;
        result.error = 0;
        result.bytes = bytes;
        return result;
    }

    inline IoResult io_error(int error) {
        IoResult result;
        result.ok = false;
        result.error = error;
        result.bytes = 0;
        return result;
    }

    inline bool is_valid_port(long port) {
        return port >= 0 && port <= UINT16_MAX;
    }
}

#endif // NET_COMMON_HPP
