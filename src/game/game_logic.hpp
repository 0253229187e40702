#ifndef GAME_LOGIC_HPP
#define GAME_LOGIC_HPP

#include <string>
#include <vector>
#include <cstddef>
#include "word_table.hpp"

namespace GameLogic {

const size_t ROUND_COUNT = 4;
const size_t WORDS_PER_ROUND = 8;

static_assert(ROUND_COUNT * WORDS_PER_ROUND == WORD_COUNT,
              "rounds must cover the whole word table");

// Результат проверки ответа на раунд
struct ReplyCheck {
    bool correct;
    size_t mismatch_index;
    std::string expected;
    std::string got;
};

class ShiftGame {
private:
    WordList keywords_;      // перестановка таблицы для этой сессии
    size_t current_round_;
    bool game_over_;
    bool game_won_;

public:
    ShiftGame();

    // Инициализация новой игры
    void start_new_game(const WordList& keywords);

    // Слова текущего раунда в порядке перестановки
    std::vector<std::string> get_round_words() const;

    // Сверяет первые 8 токенов с ответами. Верный ответ открывает
    // следующий раунд, неверный или неполный завершает игру.
    ReplyCheck check_reply(const std::vector<std::string>& tokens);

    // Геттеры
    size_t get_current_round() const { return current_round_; }
    bool is_game_over() const { return game_over_; }
    bool is_game_won() const { return game_won_; }
    const WordList& get_keywords() const { return keywords_; }
};

} // namespace GameLogic

#endif
