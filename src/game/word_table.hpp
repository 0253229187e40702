#ifndef WORD_TABLE_HPP
#define WORD_TABLE_HPP

#include <array>
#include <cstddef>
#include <random>
#include <string>

namespace GameLogic {

const size_t WORD_COUNT = 32;
const size_t ANSWER_SHIFT = 3;

using WordList = std::array<std::string, WORD_COUNT>;

// Утилиты для работы с таблицей слов
namespace WordTable {
    // Канонический порядок; позиции определяют функцию ответа
    const WordList& words();

    // Позиция слова в таблице или WORD_COUNT, если слова нет
    size_t index_of(const std::string& word);
    bool contains(const std::string& word);

    // WORDS[(index_of(word) + 3) % 32]; слово обязано быть в таблице
    const std::string& answer(const std::string& word);

    // Равномерная перестановка таблицы (Фишер-Йейтс)
    WordList permute(std::mt19937& rng);

    // Отдельный генератор на каждую сессию
    std::mt19937 make_session_rng();
}

} // namespace GameLogic

#endif
