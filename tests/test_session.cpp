#include <gtest/gtest.h>
#include <ssh/session.hpp>
#include <core/config.hpp>
#include <algorithm>
#include <thread>
#include "fake_transport.hpp"

class SessionTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    std::unique_ptr<Session> session;

    void SetUp() override {
        session = std::make_unique<Session>(fake_factory(server));
    }

    void connect() {
        auto r = session->connect("10.0.0.5", 2222, "alice", "secret123");
        ASSERT_TRUE(r.is_ok()) << r.error;
    }
};

TEST_F(SessionTest, StartsDisconnected) {
    EXPECT_EQ(session->state(), SessionState::DISCONNECTED);
    EXPECT_FALSE(session->is_connected());
    EXPECT_EQ(session->connection_string(), "Not connected");
    EXPECT_EQ(session->fingerprint(), "");
}

TEST_F(SessionTest, PasswordLogin) {
    std::vector<std::string> status;
    auto r = session->connect("10.0.0.5", 2222, "alice", "secret123",
                              [&](const std::string& s) { status.push_back(s); });
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "Connected to alice@10.0.0.5:2222");
    EXPECT_EQ(session->state(), SessionState::CONNECTED);
    EXPECT_EQ(session->connection_string(), "alice@10.0.0.5:2222");
    EXPECT_EQ(session->fingerprint(), "SHA256:AB:CD:EF");
    EXPECT_FALSE(session->holds_credentials());

    EXPECT_EQ(server->last_host, "10.0.0.5");
    EXPECT_EQ(server->last_port, 2222);
    EXPECT_EQ(server->last_user, "alice");
    EXPECT_EQ(server->last_method, "password");
    ASSERT_FALSE(status.empty());
    EXPECT_EQ(status.front(), "Connecting to alice@10.0.0.5:2222...");
}

TEST_F(SessionTest, RejectedPasswordIsAuthError) {
    auto r = session->connect("10.0.0.5", 22, "alice", "wrong");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::AUTH);
    EXPECT_EQ(session->state(), SessionState::ERROR);
    EXPECT_FALSE(session->holds_credentials());
    EXPECT_EQ(server->closes, 1);
    EXPECT_FALSE(session->last_error().empty());
}

TEST_F(SessionTest, UnreachableHostIsTransportError) {
    server->refuse = true;
    auto r = session->connect("192.0.2.1", 22, "alice", "secret123");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::TRANSPORT);
    EXPECT_EQ(session->state(), SessionState::ERROR);
    EXPECT_FALSE(session->is_connected());
    EXPECT_FALSE(session->holds_credentials());
    EXPECT_EQ(session->last_error(), "Connection refused");
}

TEST_F(SessionTest, StatesDuringAttempt) {
    std::vector<SessionState> at_open;
    std::vector<SessionState> at_auth;
    bool secret_held = false;
    server->on_open = [&] { at_open.push_back(session->state()); };
    server->on_auth = [&] {
        at_auth.push_back(session->state());
        secret_held = session->holds_credentials();
    };

    connect();
    ASSERT_EQ(at_open.size(), 1u);
    EXPECT_EQ(at_open[0], SessionState::CONNECTING);
    ASSERT_EQ(at_auth.size(), 1u);
    EXPECT_EQ(at_auth[0], SessionState::AUTHENTICATING);
    EXPECT_TRUE(secret_held);
    EXPECT_FALSE(session->holds_credentials());
}

TEST_F(SessionTest, RefusedAttemptNeverAuthenticates) {
    server->refuse = true;
    int auth_calls = 0;
    server->on_auth = [&] { auth_calls++; };

    auto r = session->connect("192.0.2.1", 22, "alice", "secret123");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(auth_calls, 0);
    EXPECT_EQ(session->state(), SessionState::ERROR);
}

TEST_F(SessionTest, HandshakeTimeout) {
    server->refuse = true;
    server->refuse_kind = ErrorKind::TIMEOUT;
    server->refuse_error = "SSH handshake with 10.0.0.5:22 timed out";

    auto r = session->connect("10.0.0.5", 22, "alice", "secret123");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(session->state(), SessionState::ERROR);
    EXPECT_EQ(session->last_error(), "SSH handshake with 10.0.0.5:22 timed out");
    EXPECT_FALSE(session->holds_credentials());
}

TEST_F(SessionTest, AuthTimeout) {
    server->auth_times_out = true;

    auto r = session->connect("10.0.0.5", 22, "alice", "secret123");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(session->state(), SessionState::ERROR);
    EXPECT_FALSE(session->holds_credentials());
    EXPECT_EQ(server->closes, 1);
}

TEST_F(SessionTest, ConcurrentAttemptsUseTheirOwnPassword) {
    for (int i = 0; i < 20; i++) {
        session = std::make_unique<Session>(fake_factory(server));
        auto good = Result<std::string>::Err(ErrorKind::NONE, "not run");
        auto bad = Result<std::string>::Err(ErrorKind::NONE, "not run");

        std::thread a([&] { good = session->connect("10.0.0.5", 22, "alice", "secret123"); });
        std::thread b([&] { bad = session->connect("10.0.0.5", 22, "alice", "wrong"); });
        a.join();
        b.join();

        EXPECT_TRUE(good.is_ok()) << good.error;
        EXPECT_TRUE(bad.is_err());
        EXPECT_TRUE(session->is_connected());
    }
}

TEST_F(SessionTest, KeyboardInteractiveFallback) {
    server->methods = {"publickey", "keyboard-interactive"};
    std::vector<std::string> status;
    auto r = session->connect("10.0.0.5", 22, "alice", "secret123",
                              [&](const std::string& s) { status.push_back(s); });
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(server->last_method, "keyboard-interactive");
    EXPECT_NE(std::find(status.begin(), status.end(), "Using keyboard-interactive auth..."),
              status.end());
}

TEST_F(SessionTest, NoPasswordMethodOffered) {
    server->methods = {"publickey"};
    auto r = session->connect("10.0.0.5", 22, "alice", "secret123");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::AUTH);
    EXPECT_NE(r.error.find("publickey"), std::string::npos);
}

TEST_F(SessionTest, ConnectWhileConnectedIsRejected) {
    connect();
    auto r = session->connect("10.0.0.6", 22, "bob", "secret123");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::PRECONDITION);
    EXPECT_NE(r.error.find("Already connected to: alice@10.0.0.5:2222"), std::string::npos);
    EXPECT_EQ(server->transports_created, 1);
    EXPECT_EQ(session->connection_string(), "alice@10.0.0.5:2222");
}

TEST_F(SessionTest, KeyLogin) {
    auto r = session->connect_with_key("10.0.0.5", 22, "alice", "/keys/id_ed25519", "");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(server->last_method, "publickey");
    EXPECT_TRUE(session->is_connected());
}

TEST_F(SessionTest, UnreadableKeyIsLocalError) {
    auto r = session->connect_with_key("10.0.0.5", 22, "alice", "/keys/missing", "pass");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::LOCAL_IO);
    EXPECT_EQ(session->state(), SessionState::ERROR);
    EXPECT_FALSE(session->holds_credentials());
}

TEST_F(SessionTest, RetryAfterFailure) {
    ASSERT_TRUE(session->connect("10.0.0.5", 22, "alice", "wrong").is_err());
    auto r = session->connect("10.0.0.5", 22, "alice", "secret123");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(session->state(), SessionState::CONNECTED);
}

TEST_F(SessionTest, DisconnectIsIdempotent) {
    connect();
    session->disconnect();
    EXPECT_EQ(session->state(), SessionState::DISCONNECTED);
    EXPECT_EQ(server->closes, 1);

    session->disconnect();
    EXPECT_EQ(session->state(), SessionState::DISCONNECTED);
    EXPECT_EQ(server->closes, 1);
    EXPECT_EQ(session->connection_string(), "Not connected");
}

TEST_F(SessionTest, ExecuteBeforeConnect) {
    auto r = session->execute_command("ls");
    EXPECT_TRUE(r.is_error);
    EXPECT_EQ(r.kind, ErrorKind::PRECONDITION);
    EXPECT_EQ(r.output.rfind("ssh: not connected", 0), 0u);
    EXPECT_EQ(server->transports_created, 0);
    EXPECT_TRUE(server->executed.empty());
}

TEST_F(SessionTest, ExecuteCollectsOutput) {
    server->commands["uname"] = FakeCommand{{"Linux\n"}, "", 0};
    connect();

    auto r = session->execute_command("uname");
    EXPECT_FALSE(r.is_error);
    EXPECT_EQ(r.output, "Linux\n");
}

TEST_F(SessionTest, ExecuteEmptyOutput) {
    connect();
    auto r = session->execute_command("true");
    EXPECT_FALSE(r.is_error);
    EXPECT_EQ(r.output, "(no output)");
}

TEST_F(SessionTest, ExecuteReportsExitStatus) {
    server->commands["false"] = FakeCommand{{}, "oops\n", 2};
    connect();

    auto r = session->execute_command("false");
    EXPECT_FALSE(r.is_error);
    EXPECT_EQ(r.output, "oops\n[exit status 2]");
}

TEST_F(SessionTest, TimeoutKeepsPartialOutput) {
    FakeCommand slow;
    slow.chunks = {"line 1\n", "line 2"};
    slow.times_out = true;
    server->commands["tail -f log"] = slow;
    connect();

    auto r = session->execute_command("tail -f log");
    EXPECT_TRUE(r.is_error);
    EXPECT_EQ(r.kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(r.output.rfind("line 1\nline 2\n", 0), 0u);
    EXPECT_NE(r.output.find("timed out"), std::string::npos);
    EXPECT_TRUE(session->is_connected());
}

TEST_F(SessionTest, StreamingDeliversChunksInOrder) {
    server->commands["build"] = FakeCommand{{"a", "b", "c"}, "", 1};
    connect();

    std::string seen;
    auto r = session->execute_command_streaming("build",
        [&](const std::string& chunk) { seen += chunk; });
    EXPECT_EQ(seen, "abc");
    EXPECT_FALSE(r.is_error);
    EXPECT_EQ(r.output, "abc\n[exit status 1]");
}

TEST_F(SessionTest, DroppedTransportTearsDown) {
    connect();
    server->alive = false;

    auto r = session->execute_command("ls");
    EXPECT_TRUE(r.is_error);
    EXPECT_EQ(r.kind, ErrorKind::DISCONNECTED);
    EXPECT_EQ(session->state(), SessionState::DISCONNECTED);
    EXPECT_EQ(session->last_error(), "session disconnected");
    EXPECT_FALSE(session->is_usable());
}

TEST_F(SessionTest, DropDuringCommand) {
    FakeCommand dies;
    dies.chunks = {"partial"};
    dies.drops = true;
    server->commands["reboot"] = dies;
    connect();

    auto r = session->execute_command("reboot");
    EXPECT_EQ(r.kind, ErrorKind::DISCONNECTED);
    EXPECT_EQ(session->state(), SessionState::DISCONNECTED);
}

TEST_F(SessionTest, DisconnectClosesSubSessions) {
    connect();
    ASSERT_TRUE(session->shell().start());
    ASSERT_TRUE(session->sftp().start().is_ok());

    session->disconnect();
    EXPECT_FALSE(session->shell().is_active());
    EXPECT_FALSE(session->sftp().is_open());
}

TEST_F(SessionTest, OptionsFromConfig) {
    auto config = Config::parse("timeouts:\n  exec: 5\n  stream: 9\nterminal:\n  cols: 132\n");
    ASSERT_TRUE(config.is_ok()) << config.error;
    auto opts = SessionOptions::from_config(config.value);
    EXPECT_EQ(opts.exec_timeout, 5);
    EXPECT_EQ(opts.stream_timeout, 9);
    EXPECT_EQ(opts.connect_timeout, 30);
    EXPECT_EQ(opts.pty.cols, 132);
    EXPECT_EQ(opts.pty.rows, 24);
}
