#include "session_manager.hpp"
#include "game_session.hpp"
#include "socket_session_context.hpp"
#include "../game/word_table.hpp"
#include "../net/message_stream.hpp"
#include <iostream>
#include <chrono>
#include <thread>
#include <system_error>
#include <utility>

SessionManager::SessionManager(NetSocket::Listener& listener, const std::string& flag)
    : listener_(listener), flag_(flag), next_session_id_(1) {}

SessionManager::~SessionManager() {
    wait_for_idle();
}

uint32_t SessionManager::register_session(const std::string& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t session_id = next_session_id_++;
    sessions_[session_id] = peer;
    std::cout << "Active sessions: " << sessions_.size() << std::endl;
    return session_id;
}

void SessionManager::remove_session(uint32_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
    std::cout << "Active sessions: " << sessions_.size() << std::endl;
    if (sessions_.empty()) {
        idle_cv_.notify_all();
    }
}

void SessionManager::wait_for_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return sessions_.empty(); });
}

size_t SessionManager::get_session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionManager::accept_next() {
    NetSocket::SocketHandle client;
    int error = 0;

    if (!listener_.accept_connection(client, error)) {
        std::cerr << "accept failed: " << NetSocket::get_socket_error_string(error) << std::endl;
        return false;
    }

    uint32_t session_id = register_session(client.get_peer());
    try {
        std::thread(&SessionManager::handle_connection, this, session_id, std::move(client)).detach();
    } catch (const std::system_error& e) {
        std::cerr << "could not start session thread: " << e.what() << std::endl;
        remove_session(session_id);
        return false;
    }
    return true;
}

void SessionManager::run() {
    while (true) {
        if (!accept_next()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(NET::RETRY_DELAY_MS));
        }
    }
}

void SessionManager::handle_connection(uint32_t session_id, NetSocket::SocketHandle socket) {
    {
        SocketSessionContext context(session_id, socket.get());
        context.log("received connection: " + socket.get_peer());

        // Свой генератор на каждую сессию
        std::mt19937 rng = GameLogic::WordTable::make_session_rng();
        GameSession session(session_id, context, flag_, GameLogic::WordTable::permute(rng));

        SessionOutcome outcome = session.run();
        if (outcome == SessionOutcome::IO_ERROR) {
            context.log_error("handling connection failed: " +
                              NetSocket::get_socket_error_string(session.get_last_error()));
        }
        context.log(std::string("session finished: ") + outcome_to_string(outcome));

        context.log("shutting down connection");
        int error = 0;
        if (socket.shutdown_both(error)) {
            context.log("successfully shut down connection");
        } else {
            context.log_error("failed to shut down connection: " +
                              NetSocket::get_socket_error_string(error));
        }
        socket.close();
    }

    remove_session(session_id);
}
