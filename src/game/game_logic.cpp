// src/game/game_logic.cpp
#include "game_logic.hpp"

namespace GameLogic {

ShiftGame::ShiftGame()
    : keywords_(WordTable::words()), current_round_(0), game_over_(false), game_won_(false) {
}

void ShiftGame::start_new_game(const WordList& keywords) {
    keywords_ = keywords;
    current_round_ = 0;
    game_over_ = false;
    game_won_ = false;
}

std::vector<std::string> ShiftGame::get_round_words() const {
    if (game_over_ || current_round_ >= ROUND_COUNT) {
        return {};
    }

    size_t start = current_round_ * WORDS_PER_ROUND;
    return std::vector<std::string>(keywords_.begin() + start,
                                    keywords_.begin() + start + WORDS_PER_ROUND);
}

ReplyCheck ShiftGame::check_reply(const std::vector<std::string>& tokens) {
    ReplyCheck check;
    check.correct = false;
    check.mismatch_index = 0;

    if (game_over_) {
        return check;
    }

    std::vector<std::string> round_words = get_round_words();

    // Лишние токены после восьмого не смотрим
    for (size_t k = 0; k < round_words.size(); ++k) {
        const std::string& expected = WordTable::answer(round_words[k]);
        std::string got = k < tokens.size() ? tokens[k] : std::string();

        if (expected.empty() || got != expected) {
            check.mismatch_index = k;
            check.expected = expected;
            check.got = got;
            game_over_ = true;
            return check;
        }
    }

    check.correct = true;
    current_round_++;
    if (current_round_ >= ROUND_COUNT) {
        game_won_ = true;
        game_over_ = true;
    }

    return check;
}

} // namespace GameLogic
