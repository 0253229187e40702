#ifndef MESSAGE_STREAM_HPP
#define MESSAGE_STREAM_HPP

#include <string>
#include "net_common.hpp"

namespace NetSocket {

// Построчное чтение/запись поверх TCP-сокета.
// Одно сообщение - одна строка до '\n' включительно; строка без '\n'
// считается завершенной, если за COALESCE_WINDOW_MS не пришло новых байт.
class MessageStream {
private:
    int fd_;
    int max_tries_;
    int coalesce_window_ms_;
    std::string pending_;   // байты после последнего выданного '\n'

    NET::IoResult read_first_chunk(std::string& buf);
    void read_rest_of_line(std::string& buf);
    bool take_pending_line(std::string& buf);

public:
    explicit MessageStream(int fd,
                           int max_tries = NET::MAX_TRIES,
                           int coalesce_window_ms = NET::COALESCE_WINDOW_MS);

    // Очищает buf и помещает в него следующее сообщение.
    // Закрытие соединения клиентом возвращается как ошибка EPIPE.
    NET::IoResult read_message(std::string& buf);

    // Отправляет buf целиком, дописывая после частичных записей
    NET::IoResult write_message(const std::string& buf);

    int get_fd() const { return fd_; }
};

// Вспомогательные функции
std::string get_socket_error_string(int error);
bool is_peer_closed_error(int error);

} // namespace NetSocket

#endif // MESSAGE_STREAM_HPP
