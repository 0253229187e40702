#ifndef GAME_SESSION_HPP
#define GAME_SESSION_HPP

#include <cstdint>
#include <string>
#include "session_context.hpp"
#include "../game/game_logic.hpp"

enum class SessionPhase {
    AWAIT_GREETING,
    AWAIT_READY,
    AWAIT_ROUND,
    WON,
    REJECTED,
    CLOSED
};

enum class SessionOutcome {
    WON,
    BAD_GREETING,
    REFUSED,
    WRONG_WORD,
    TIMED_OUT,
    CLIENT_CLOSED,
    IO_ERROR
};

const char* outcome_to_string(SessionOutcome outcome);

// Одна сессия игры: приветствие, 4 раунда, флаг или отказ.
// Флаг отправляется только после четырех верных раундов подряд.
class GameSession {
private:
    uint32_t session_id_;
    SessionContext& context_;
    const std::string& flag_;
    GameLogic::ShiftGame game_;
    SessionContext::Clock::time_point start_time_;
    SessionPhase phase_;
    std::string recv_buf_;
    int last_error_;

    bool send(const std::string& message);
    bool receive();
    bool took_too_long();
    SessionOutcome reject(const std::string& reply, SessionOutcome outcome);
    SessionOutcome fail_io();

public:
    GameSession(uint32_t session_id, SessionContext& context,
                const std::string& flag, const GameLogic::WordList& keywords);

    // Проводит сессию до конца; сокет закрывает вызывающий
    SessionOutcome run();

    SessionPhase get_phase() const { return phase_; }
    size_t get_current_round() const { return game_.get_current_round(); }
    int get_last_error() const { return last_error_; }
    uint32_t get_session_id() const { return session_id_; }
};

#endif
