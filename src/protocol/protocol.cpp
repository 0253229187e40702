#include "protocol.hpp"

namespace Protocol {

namespace {

bool is_trailing_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

}

bool has_prefix(const std::string& message, const std::string& prefix) {
    return message.size() >= prefix.size() &&
           message.compare(0, prefix.size(), prefix) == 0;
}

std::string strip_trailing_whitespace(const std::string& message) {
    size_t end = message.size();
    while (end > 0 && is_trailing_whitespace(message[end - 1])) {
        --end;
    }
    return message.substr(0, end);
}

std::vector<std::string> split_reply(const std::string& message) {
    std::vector<std::string> tokens;
    std::string stripped = strip_trailing_whitespace(message);
    if (stripped.empty()) {
        return tokens;
    }

    size_t start = 0;
    size_t end = stripped.find(' ');

    while (end != std::string::npos) {
        tokens.push_back(stripped.substr(start, end - start));
        start = end + 1;
        end = stripped.find(' ', start);
    }
    tokens.push_back(stripped.substr(start));

    return tokens;
}

std::string format_prompt(const std::vector<std::string>& words) {
    std::string prompt;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) prompt += ' ';
        prompt += words[i];
    }
    prompt += '\n';
    return prompt;
}

std::string format_win_message(const std::string& flag) {
    return Reply::WIN_PREFIX + flag + "\n";
}

}
