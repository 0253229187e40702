#include "game_session.hpp"
#include "../protocol/protocol.hpp"
#include "../net/message_stream.hpp"

const char* outcome_to_string(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::WON: return "won";
        case SessionOutcome::BAD_GREETING: return "bad greeting";
        case SessionOutcome::REFUSED: return "refused";
        case SessionOutcome::WRONG_WORD: return "wrong word";
        case SessionOutcome::TIMED_OUT: return "timed out";
        case SessionOutcome::CLIENT_CLOSED: return "client closed";
        case SessionOutcome::IO_ERROR: return "io error";
    }
    return "unknown";
}

GameSession::GameSession(uint32_t session_id, SessionContext& context,
                         const std::string& flag, const GameLogic::WordList& keywords)
    : session_id_(session_id), context_(context), flag_(flag),
      phase_(SessionPhase::AWAIT_GREETING), last_error_(0) {
    game_.start_new_game(keywords);
}

bool GameSession::send(const std::string& message) {
    NET::IoResult result = context_.write_message(message);
    if (!result.ok) {
        last_error_ = result.error;
    }
    return result.ok;
}

bool GameSession::receive() {
    NET::IoResult result = context_.read_message(recv_buf_);
    if (!result.ok) {
        last_error_ = result.error;
    }
    return result.ok;
}

bool GameSession::took_too_long() {
    return context_.now() - start_time_ > std::chrono::seconds(Protocol::TIME_LIMIT_SECONDS);
}

SessionOutcome GameSession::reject(const std::string& reply, SessionOutcome outcome) {
    phase_ = SessionPhase::REJECTED;
    if (!send(reply)) {
        return fail_io();
    }
    phase_ = SessionPhase::CLOSED;
    return outcome;
}

SessionOutcome GameSession::fail_io() {
    phase_ = SessionPhase::CLOSED;
    if (NetSocket::is_peer_closed_error(last_error_)) {
        return SessionOutcome::CLIENT_CLOSED;
    }
    return SessionOutcome::IO_ERROR;
}

SessionOutcome GameSession::run() {
    start_time_ = context_.now();
    phase_ = SessionPhase::AWAIT_GREETING;

    if (!receive()) return fail_io();

    if (!Protocol::has_prefix(recv_buf_, Protocol::Prefix::GREETING)) {
        return reject(Protocol::Reply::BAD_GREETING, SessionOutcome::BAD_GREETING);
    }
    if (!send(Protocol::Reply::GREETING)) return fail_io();

    phase_ = SessionPhase::AWAIT_READY;
    if (!receive()) return fail_io();

    if (!Protocol::has_prefix(recv_buf_, Protocol::Prefix::READY)) {
        return reject(Protocol::Reply::REFUSED, SessionOutcome::REFUSED);
    }

    phase_ = SessionPhase::AWAIT_ROUND;
    while (!game_.is_game_won()) {
        // Таймаут проверяется только на границе раундов
        if (took_too_long()) {
            return reject(Protocol::Reply::TOO_SLOW, SessionOutcome::TIMED_OUT);
        }

        if (!send(Protocol::format_prompt(game_.get_round_words()))) return fail_io();
        if (!receive()) return fail_io();

        GameLogic::ReplyCheck check = game_.check_reply(Protocol::split_reply(recv_buf_));
        if (!check.correct) {
            context_.log_error("expected " + check.expected + " got " + check.got);
            return reject(Protocol::Reply::WRONG_WORD, SessionOutcome::WRONG_WORD);
        }
    }

    phase_ = SessionPhase::WON;
    if (!send(Protocol::format_win_message(flag_))) return fail_io();

    phase_ = SessionPhase::CLOSED;
    return SessionOutcome::WON;
}
