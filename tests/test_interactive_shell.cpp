#include <gtest/gtest.h>
#include <ssh/session.hpp>
#include "fake_transport.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

class InteractiveShellTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    std::unique_ptr<Session> session;

    std::mutex mutex;
    std::condition_variable cv;
    std::string output;
    std::vector<std::string> errors;

    void SetUp() override {
        session = std::make_unique<Session>(fake_factory(server));
        session->shell().set_handlers(
            [this](const std::string& text) {
                std::lock_guard<std::mutex> lock(mutex);
                output += text;
                cv.notify_all();
            },
            [this](const std::string& text) {
                std::lock_guard<std::mutex> lock(mutex);
                errors.push_back(text);
                cv.notify_all();
            });
    }

    void TearDown() override {
        session->shell().close();
        session->shell().set_handlers(nullptr, nullptr);
    }

    void connect() {
        ASSERT_TRUE(session->connect("10.0.0.5", 22, "alice", "secret123").is_ok());
    }

    bool wait_output(const std::string& expected) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [&] { return output == expected; });
    }

    bool wait_errors(size_t count) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [&] { return errors.size() >= count; });
    }
};

TEST_F(InteractiveShellTest, StartRequiresSession) {
    EXPECT_FALSE(session->shell().start());
    ASSERT_TRUE(wait_errors(1));
    EXPECT_EQ(errors[0].rfind("Failed to start interactive shell: ssh: not connected", 0), 0u);
    EXPECT_FALSE(session->shell().is_active());
    EXPECT_EQ(server->transports_created, 0);
}

TEST_F(InteractiveShellTest, UsesConfiguredPty) {
    SessionOptions opts;
    opts.pty.cols = 120;
    opts.pty.rows = 40;
    session = std::make_unique<Session>(fake_factory(server), opts);
    connect();
    ASSERT_TRUE(session->shell().start());
    EXPECT_EQ(server->shell->cols, 120);
    EXPECT_EQ(server->shell->rows, 40);
}

TEST_F(InteractiveShellTest, ForwardsFragmentsInOrder) {
    connect();
    ASSERT_TRUE(session->shell().start());
    EXPECT_TRUE(session->shell().is_active());

    server->shell->feed("alice@host:~$ ");
    server->shell->feed("total 0\r\n");
    server->shell->feed("\x1b[01;34mdir\x1b[0m\r\n");
    EXPECT_TRUE(wait_output("alice@host:~$ total 0\r\n\x1b[01;34mdir\x1b[0m\r\n"));
}

TEST_F(InteractiveShellTest, WriteAndResizeReachChannel) {
    connect();
    ASSERT_TRUE(session->shell().start());

    session->shell().write("ls -la\n");
    session->shell().write("\x03");
    session->shell().resize(100, 30);
    EXPECT_EQ(server->shell->input(), "ls -la\n\x03");
    EXPECT_EQ(server->shell->cols, 100);
    EXPECT_EQ(server->shell->rows, 30);
}

TEST_F(InteractiveShellTest, WriteWhileInactiveIsIgnored) {
    session->shell().write("ls\n");
    session->shell().resize(100, 30);
    EXPECT_FALSE(session->shell().is_active());
    EXPECT_TRUE(errors.empty());
}

TEST_F(InteractiveShellTest, RemoteCloseIsReported) {
    connect();
    ASSERT_TRUE(session->shell().start());

    server->shell->feed("logout\r\n");
    server->shell->close_from_remote();
    ASSERT_TRUE(wait_errors(1));
    EXPECT_EQ(errors[0], "Shell session closed by remote host");
    EXPECT_FALSE(session->shell().is_active());
    EXPECT_TRUE(wait_output("logout\r\n"));
    EXPECT_TRUE(session->is_connected());
}

TEST_F(InteractiveShellTest, RestartAfterRemoteClose) {
    connect();
    ASSERT_TRUE(session->shell().start());
    auto first = server->shell;
    first->close_from_remote();
    ASSERT_TRUE(wait_errors(1));

    ASSERT_TRUE(session->shell().start());
    EXPECT_NE(server->shell, first);
    EXPECT_TRUE(session->shell().is_active());
}

TEST_F(InteractiveShellTest, CloseIsIdempotent) {
    connect();
    ASSERT_TRUE(session->shell().start());
    session->shell().close();
    EXPECT_FALSE(session->shell().is_active());
    session->shell().close();
    EXPECT_FALSE(session->shell().is_active());
    EXPECT_TRUE(session->is_connected());
}

TEST_F(InteractiveShellTest, OpenFailureLeavesSessionUp) {
    server->shell_denied = true;
    connect();
    EXPECT_FALSE(session->shell().start());
    ASSERT_TRUE(wait_errors(1));
    EXPECT_NE(errors[0].find("Failed to request PTY"), std::string::npos);
    EXPECT_TRUE(session->is_connected());
}
