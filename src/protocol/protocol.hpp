#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include <string>
#include <vector>

namespace Protocol {

// ==================== Константы протокола ====================

namespace Prefix {
    const std::string GREETING = "hello";
    const std::string READY = "ok";
}

// Ответы сервера; часть из них без '\n' - так их ждут существующие клиенты
namespace Reply {
    const std::string GREETING = "hello! let's play a game :3\n";
    const std::string BAD_GREETING = "that's not a nice greeting...\n";
    const std::string REFUSED = "okay, we can play later then...";
    const std::string TOO_SLOW = "you took too long!";
    const std::string WRONG_WORD = "you said the wrong word!\n";
    const std::string WIN_PREFIX = "good job! the flag is ";
}

// Общее время на игру, проверяется перед каждым раундом
const int TIME_LIMIT_SECONDS = 5;

// ==================== Разбор и форматирование ====================

// Побайтовая проверка префикса; регистр и пробелы не нормализуются
bool has_prefix(const std::string& message, const std::string& prefix);

// Срезает хвостовые пробельные символы и делит по одиночному пробелу.
// Пустые токены сохраняются: "a  b" -> {"a", "", "b"}
std::vector<std::string> split_reply(const std::string& message);

std::string strip_trailing_whitespace(const std::string& message);

// "w1 w2 ... w8\n"
std::string format_prompt(const std::vector<std::string>& words);

std::string format_win_message(const std::string& flag);

} // namespace Protocol

#endif // PROTOCOL_HPP
