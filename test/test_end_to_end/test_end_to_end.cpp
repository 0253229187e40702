/*
 * File: test/test_end_to_end/test_end_to_end.cpp
 * Description: Real loopback server runs: listener + SessionManager + a
 * scripted client that solves the prompts with the answer function.
 */
#include <unity.h>
#include "listener.hpp"
#include "session_manager.hpp"
#include "word_table.hpp"
#include "protocol.hpp"
#include <chrono>
#include <cstring>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

static const std::string FLAG = "flag{win}";

// --- Client helpers ---

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    // Keep a broken server from hanging the suite
    struct timeval tv;
    tv.tv_sec = 3;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

static bool sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

static std::string readLine(int fd) {
    std::string line;
    char c;
    while (::recv(fd, &c, 1, 0) == 1) {
        line += c;
        if (c == '\n') break;
    }
    return line;
}

static std::string readToEof(int fd) {
    std::string out;
    char chunk[512];
    ssize_t n;
    while ((n = ::recv(fd, chunk, sizeof(chunk), 0)) > 0) {
        out.append(chunk, static_cast<size_t>(n));
    }
    return out;
}

static std::string solve(const std::string& prompt) {
    std::vector<std::string> words = Protocol::split_reply(prompt);
    std::vector<std::string> answers;
    for (const std::string& w : words) answers.push_back(GameLogic::WordTable::answer(w));
    return Protocol::format_prompt(answers);
}

// Plays all four rounds; returns the prompts seen
static std::vector<std::string> playRounds(int fd) {
    std::vector<std::string> prompts;
    for (int round = 0; round < 4; ++round) {
        std::string prompt = readLine(fd);
        prompts.push_back(prompt);
        if (!sendAll(fd, solve(prompt))) break;
    }
    return prompts;
}

// --- Fixture ---

static NetSocket::Listener* listener = nullptr;
static SessionManager* manager = nullptr;
static std::thread acceptor;

static void startServer(int connections) {
    acceptor = std::thread([connections] {
        for (int i = 0; i < connections; ++i) {
            manager->accept_next();
        }
    });
}

void setUp(void) {
    listener = new NetSocket::Listener();
    int error = 0;
    TEST_ASSERT_TRUE(listener->bind_loopback(0, error));
    TEST_ASSERT_NOT_EQUAL(0, listener->get_port());
    manager = new SessionManager(*listener, FLAG);
}

void tearDown(void) {
    if (acceptor.joinable()) acceptor.join();
    delete manager;     // waits for running sessions
    manager = nullptr;
    delete listener;
    listener = nullptr;
}

// ============================================================================
// SCENARIOS
// ============================================================================

void test_happy_path(void) {
    startServer(1);
    int fd = connectTo(listener->get_port());
    TEST_ASSERT_TRUE(fd >= 0);

    TEST_ASSERT_TRUE(sendAll(fd, "hello\n"));
    TEST_ASSERT_EQUAL_STRING("hello! let's play a game :3\n", readLine(fd).c_str());
    TEST_ASSERT_TRUE(sendAll(fd, "ok\n"));

    std::vector<std::string> prompts = playRounds(fd);
    TEST_ASSERT_EQUAL(4, prompts.size());

    std::multiset<std::string> seen;
    for (const std::string& p : prompts) {
        std::vector<std::string> words = Protocol::split_reply(p);
        TEST_ASSERT_EQUAL(8, words.size());
        seen.insert(words.begin(), words.end());
    }
    const GameLogic::WordList& table = GameLogic::WordTable::words();
    TEST_ASSERT_TRUE(seen == std::multiset<std::string>(table.begin(), table.end()));

    TEST_ASSERT_EQUAL_STRING("good job! the flag is flag{win}\n", readToEof(fd).c_str());
    ::close(fd);
}

void test_bad_greeting(void) {
    startServer(1);
    int fd = connectTo(listener->get_port());
    TEST_ASSERT_TRUE(fd >= 0);

    TEST_ASSERT_TRUE(sendAll(fd, "hi\n"));
    TEST_ASSERT_EQUAL_STRING("that's not a nice greeting...\n", readToEof(fd).c_str());
    ::close(fd);
}

void test_refuses_to_play(void) {
    startServer(1);
    int fd = connectTo(listener->get_port());
    TEST_ASSERT_TRUE(fd >= 0);

    TEST_ASSERT_TRUE(sendAll(fd, "hello"));
    TEST_ASSERT_EQUAL_STRING("hello! let's play a game :3\n", readLine(fd).c_str());
    TEST_ASSERT_TRUE(sendAll(fd, "no"));
    TEST_ASSERT_EQUAL_STRING("okay, we can play later then...", readToEof(fd).c_str());
    ::close(fd);
}

void test_wrong_answer(void) {
    startServer(1);
    int fd = connectTo(listener->get_port());
    TEST_ASSERT_TRUE(fd >= 0);

    TEST_ASSERT_TRUE(sendAll(fd, "hello\n"));
    readLine(fd);
    TEST_ASSERT_TRUE(sendAll(fd, "ok\n"));

    std::string prompt = readLine(fd);
    std::vector<std::string> answers = Protocol::split_reply(solve(prompt));
    answers[3] = "banana";
    TEST_ASSERT_TRUE(sendAll(fd, Protocol::format_prompt(answers)));

    std::string rest = readToEof(fd);
    TEST_ASSERT_EQUAL_STRING("you said the wrong word!\n", rest.c_str());
    ::close(fd);
}

void test_fragmented_greeting(void) {
    startServer(1);
    int fd = connectTo(listener->get_port());
    TEST_ASSERT_TRUE(fd >= 0);

    TEST_ASSERT_TRUE(sendAll(fd, "hel"));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    TEST_ASSERT_TRUE(sendAll(fd, "lo"));
    TEST_ASSERT_EQUAL_STRING("hello! let's play a game :3\n", readLine(fd).c_str());

    TEST_ASSERT_TRUE(sendAll(fd, "ok\n"));
    playRounds(fd);
    TEST_ASSERT_EQUAL_STRING("good job! the flag is flag{win}\n", readToEof(fd).c_str());
    ::close(fd);
}

void test_pipelined_greeting_and_ready(void) {
    startServer(1);
    int fd = connectTo(listener->get_port());
    TEST_ASSERT_TRUE(fd >= 0);

    TEST_ASSERT_TRUE(sendAll(fd, "hello\nok\n"));
    TEST_ASSERT_EQUAL_STRING("hello! let's play a game :3\n", readLine(fd).c_str());
    playRounds(fd);
    TEST_ASSERT_EQUAL_STRING("good job! the flag is flag{win}\n", readToEof(fd).c_str());
    ::close(fd);
}

// ============================================================================
// DISPATCHER
// ============================================================================

void test_sessions_run_in_parallel(void) {
    startServer(2);

    // First client connects and stalls
    int idle = connectTo(listener->get_port());
    TEST_ASSERT_TRUE(idle >= 0);

    int fd = connectTo(listener->get_port());
    TEST_ASSERT_TRUE(fd >= 0);
    TEST_ASSERT_TRUE(sendAll(fd, "hello\n"));
    TEST_ASSERT_EQUAL_STRING("hello! let's play a game :3\n", readLine(fd).c_str());
    TEST_ASSERT_TRUE(sendAll(fd, "ok\n"));
    playRounds(fd);
    TEST_ASSERT_EQUAL_STRING("good job! the flag is flag{win}\n", readToEof(fd).c_str());
    ::close(fd);

    // The idle client is still waiting for its greeting
    TEST_ASSERT_TRUE(manager->get_session_count() >= 1);
    ::close(idle);
    if (acceptor.joinable()) acceptor.join();
    manager->wait_for_idle();
    TEST_ASSERT_EQUAL(0, manager->get_session_count());
}

void test_client_disconnect_does_not_stop_server(void) {
    startServer(2);

    int quitter = connectTo(listener->get_port());
    TEST_ASSERT_TRUE(quitter >= 0);
    TEST_ASSERT_TRUE(sendAll(quitter, "hello\n"));
    readLine(quitter);
    ::close(quitter);

    int fd = connectTo(listener->get_port());
    TEST_ASSERT_TRUE(fd >= 0);
    TEST_ASSERT_TRUE(sendAll(fd, "hello\n"));
    TEST_ASSERT_EQUAL_STRING("hello! let's play a game :3\n", readLine(fd).c_str());
    TEST_ASSERT_TRUE(sendAll(fd, "ok\n"));
    playRounds(fd);
    TEST_ASSERT_EQUAL_STRING("good job! the flag is flag{win}\n", readToEof(fd).c_str());
    ::close(fd);
}

void test_each_session_gets_its_own_order(void) {
    startServer(2);
    std::string first_prompts[2];

    for (int i = 0; i < 2; ++i) {
        int fd = connectTo(listener->get_port());
        TEST_ASSERT_TRUE(fd >= 0);
        TEST_ASSERT_TRUE(sendAll(fd, "hello\n"));
        readLine(fd);
        TEST_ASSERT_TRUE(sendAll(fd, "ok\n"));
        first_prompts[i] = readLine(fd);
        ::close(fd);
    }

    TEST_ASSERT_EQUAL(8, Protocol::split_reply(first_prompts[0]).size());
    TEST_ASSERT_TRUE(first_prompts[0] != first_prompts[1]);
}

// ============================================================================
// MAIN RUNNER
// ============================================================================
int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_happy_path);
    RUN_TEST(test_bad_greeting);
    RUN_TEST(test_refuses_to_play);
    RUN_TEST(test_wrong_answer);
    RUN_TEST(test_fragmented_greeting);
    RUN_TEST(test_pipelined_greeting_and_ready);

    RUN_TEST(test_sessions_run_in_parallel);
    RUN_TEST(test_client_disconnect_does_not_stop_server);
    RUN_TEST(test_each_session_gets_its_own_order);

    return UNITY_END();
}
