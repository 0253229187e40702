// src/game/word_table.cpp
#include "word_table.hpp"
#include <algorithm>
#include <utility>

namespace GameLogic {

namespace {

const WordList WORDS = {{
    "sky", "lichen", "window", "road", "wall", "hill", "sand", "soil",
    "loam", "sun", "star", "root", "rain", "hand", "green", "blue",
    "red", "steam", "steel", "leaf", "house", "brush", "stair", "flower",
    "log", "vase", "painting", "cottage", "frog", "stone", "pond", "river"
}};

const std::string NO_WORD;

}

const WordList& WordTable::words() {
    return WORDS;
}

size_t WordTable::index_of(const std::string& word) {
    auto it = std::find(WORDS.begin(), WORDS.end(), word);
    return static_cast<size_t>(it - WORDS.begin());
}

bool WordTable::contains(const std::string& word) {
    return index_of(word) < WORD_COUNT;
}

const std::string& WordTable::answer(const std::string& word) {
    size_t index = index_of(word);
    if (index >= WORD_COUNT) {
        return NO_WORD;
    }
    return WORDS[(index + ANSWER_SHIFT) % WORD_COUNT];
}

WordList WordTable::permute(std::mt19937& rng) {
    WordList shuffled = WORDS;

    for (size_t i = WORD_COUNT - 1; i > 0; --i) {
        std::uniform_int_distribution<size_t> dist(0, i);
        std::swap(shuffled[i], shuffled[dist(rng)]);
    }

    return shuffled;
}

std::mt19937 WordTable::make_session_rng() {
    std::random_device rd;
    std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937(seed);
}

} // namespace GameLogic
