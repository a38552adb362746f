#include <gtest/gtest.h>
#include "fakes.hpp"
#include <session/session_lifecycle.hpp>
#include <session/session_registry.hpp>
#include <future>
#include <set>
#include <thread>

using std::chrono::milliseconds;

class SessionLifecycleTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeConnectionFactory> factory = std::make_shared<FakeConnectionFactory>();
    std::shared_ptr<SessionRegistry> registry = std::make_shared<SessionRegistry>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    std::unique_ptr<SessionLifecycle> lifecycle;
    ConnectionParams params;

    void SetUp() override {
        PumpOptions options;
        options.poll = milliseconds(5);
        options.keepalive_interval = std::chrono::hours(1);
        lifecycle = std::make_unique<SessionLifecycle>(factory, registry, sink, options, milliseconds(500));
    }

    void TearDown() override { lifecycle.reset(); }

    std::shared_ptr<FakeShell> open(const std::string& id, const std::string& client) {
        auto shell = std::make_shared<FakeShell>();
        factory->queue_shell(shell);
        auto r = lifecycle->open(id, client, params);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return shell;
    }
};

// ── Open ──────────────────────────────────────────────────────

TEST_F(SessionLifecycleTest, OpenRegistersAndStreams) {
    auto shell = std::make_shared<FakeShell>();
    shell->push_output("Welcome\r\n$ ");
    factory->queue_shell(shell);

    ASSERT_TRUE(lifecycle->open("s1", "alice", params).is_ok());
    EXPECT_TRUE(registry->contains("s1"));
    EXPECT_EQ(sink->connected(), (std::vector<std::string>{"s1"}));
    EXPECT_TRUE(eventually([&] { return sink->joined_output("s1") == "Welcome\r\n$ "; }));
}

TEST_F(SessionLifecycleTest, DuplicateIdIsRejectedBeforeConnecting) {
    open("s1", "alice");
    auto r = lifecycle->open("s1", "bob", params);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::DUPLICATE);
    EXPECT_EQ(factory->shell_opens(), 1);
    EXPECT_EQ(registry->get("s1")->client_id, "alice");
}

TEST_F(SessionLifecycleTest, ConnectFailureLeavesNoTrace) {
    factory->fail_with("Authentication failed", ErrorKind::AUTH);
    auto r = lifecycle->open("s1", "alice", params);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::AUTH);
    EXPECT_EQ(registry->size(), 0u);
    EXPECT_TRUE(sink->connected().empty());
    EXPECT_TRUE(sink->closed().empty());
}

// ── Input ─────────────────────────────────────────────────────

TEST_F(SessionLifecycleTest, InputIsWrittenInOrder) {
    auto shell = open("s1", "alice");
    ASSERT_TRUE(lifecycle->input("s1", "alice", "l", false, false).is_ok());
    ASSERT_TRUE(lifecycle->input("s1", "alice", "s\r", false, false).is_ok());
    EXPECT_EQ(shell->writes(), (std::vector<std::string>{"l", "s\r"}));
}

TEST_F(SessionLifecycleTest, PastedLinesGetNewlineExceptTheLast) {
    auto shell = open("s1", "alice");
    lifecycle->input("s1", "alice", "echo one", true, false);
    lifecycle->input("s1", "alice", "echo two", true, true);
    lifecycle->input("s1", "alice", "x", false, false);
    EXPECT_EQ(shell->writes(), (std::vector<std::string>{"echo one\n", "echo two", "x"}));
}

TEST_F(SessionLifecycleTest, InputRequiresOwnership) {
    auto shell = open("s1", "alice");
    auto r = lifecycle->input("s1", "mallory", "rm -rf /\r", false, false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NOT_OWNER);
    EXPECT_TRUE(shell->writes().empty());
}

TEST_F(SessionLifecycleTest, InputToUnknownSession) {
    auto r = lifecycle->input("ghost", "alice", "x", false, false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NOT_FOUND);
}

// ── Resize ────────────────────────────────────────────────────

TEST_F(SessionLifecycleTest, ResizeClampsToLimits) {
    auto shell = open("s1", "alice");
    auto big = lifecycle->resize("s1", 10000, 10000);
    ASSERT_TRUE(big.has_value());
    EXPECT_EQ(big->cols, 500);
    EXPECT_EQ(big->rows, 200);

    auto small = lifecycle->resize("s1", 10, 10);
    ASSERT_TRUE(small.has_value());
    EXPECT_EQ(small->cols, 80);
    EXPECT_EQ(small->rows, 24);

    auto sizes = shell->sizes();
    ASSERT_EQ(sizes.size(), 2u);
    EXPECT_TRUE(sizes[0] == (TerminalSize{500, 200}));
    EXPECT_TRUE(sizes[1] == (TerminalSize{80, 24}));
}

TEST_F(SessionLifecycleTest, ResizeUnknownSessionIsNoOp) {
    EXPECT_FALSE(lifecycle->resize("ghost", 100, 40).has_value());
}

TEST(SessionLifecycleClamp, WithinRangeUnchanged) {
    auto s = SessionLifecycle::clamp_size(132, 43);
    EXPECT_EQ(s.cols, 132);
    EXPECT_EQ(s.rows, 43);
}

// ── Close ─────────────────────────────────────────────────────

TEST_F(SessionLifecycleTest, OwnerCloseTearsDownOnce) {
    auto shell = open("s1", "alice");
    ASSERT_TRUE(lifecycle->close("s1", "alice").is_ok());

    EXPECT_FALSE(registry->contains("s1"));
    EXPECT_EQ(shell->close_calls(), 1);
    auto closed = sink->closed();
    ASSERT_EQ(closed.size(), 1u);
    EXPECT_EQ(closed[0].reason, "Closed by client");

    auto again = lifecycle->close("s1", "alice");
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::NOT_FOUND);
    EXPECT_EQ(sink->closed_count("s1"), 1u);
}

TEST_F(SessionLifecycleTest, InputAfterCloseIsRejected) {
    open("s1", "alice");
    lifecycle->close("s1", "alice");
    EXPECT_EQ(lifecycle->input("s1", "alice", "x", false, false).kind, ErrorKind::NOT_FOUND);
}

TEST_F(SessionLifecycleTest, CloseRacingAnotherClientAdmitsOnlyOwner) {
    auto shell = open("s1", "alice");
    shell->hold_close();

    auto owner = std::async(std::launch::async, [&] { return lifecycle->close("s1", "alice"); });
    ASSERT_TRUE(eventually([&] { return shell->close_entered(); }));

    auto intruder = lifecycle->close("s1", "mallory");
    shell->open_gate();

    ASSERT_TRUE(intruder.is_err());
    EXPECT_EQ(intruder.kind, ErrorKind::NOT_OWNER);
    EXPECT_TRUE(owner.get().is_ok());
    EXPECT_EQ(sink->closed_count("s1"), 1u);
}

TEST_F(SessionLifecycleTest, ConcurrentOwnerClosesSucceedOnce) {
    open("s1", "alice");
    std::vector<std::future<Result<void>>> closes;
    for (int i = 0; i < 4; i++) {
        closes.push_back(std::async(std::launch::async, [&] { return lifecycle->close("s1", "alice"); }));
    }
    int ok = 0;
    for (auto& f : closes) {
        auto r = f.get();
        if (r.is_ok()) {
            ok++;
        } else {
            EXPECT_EQ(r.kind, ErrorKind::NOT_FOUND);
        }
    }
    EXPECT_EQ(ok, 1);
    EXPECT_EQ(sink->closed_count("s1"), 1u);
}

TEST_F(SessionLifecycleTest, CloseDuringOpenWaitsForConnectedNotice) {
    sink->connect_delay_ms = 50;
    factory->queue_shell(std::make_shared<FakeShell>());

    auto opening = std::async(std::launch::async, [&] { return lifecycle->open("s1", "alice", params); });
    ASSERT_TRUE(eventually([&] { return registry->contains("s1"); }));
    auto closed = lifecycle->close("s1", "alice");

    EXPECT_TRUE(opening.get().is_ok());
    EXPECT_TRUE(closed.is_ok()) << closed.error;
    EXPECT_EQ(sink->events(), (std::vector<std::string>{"connected:s1", "closed:s1"}));
    EXPECT_FALSE(registry->contains("s1"));
}

TEST_F(SessionLifecycleTest, OpenAndCloseRacingKeepNoticesOrdered) {
    for (int i = 0; i < 200; i++) {
        std::string id = "race-" + std::to_string(i);
        factory->queue_shell(std::make_shared<FakeShell>());

        auto opening = std::async(std::launch::async, [&] { return lifecycle->open(id, "alice", params); });
        while (!registry->contains(id)) std::this_thread::yield();
        auto closed = lifecycle->close(id, "alice");

        ASSERT_TRUE(opening.get().is_ok());
        ASSERT_TRUE(closed.is_ok()) << closed.error;
        ASSERT_TRUE(sink->wait_closed(id, milliseconds(1000)));
        EXPECT_EQ(sink->closed_count(id), 1u);
    }

    // Every session's connected notice precedes its closed notice
    std::set<std::string> connected;
    for (const auto& e : sink->events()) {
        if (e.compare(0, 10, "connected:") == 0) {
            connected.insert(e.substr(10));
        } else {
            EXPECT_EQ(connected.count(e.substr(7)), 1u) << e;
        }
    }
    EXPECT_EQ(connected.size(), 200u);
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(SessionLifecycleTest, RemoteHangUpReapsSession) {
    auto shell = open("s1", "alice");
    shell->push_output("logout\r\n");
    shell->hang_up();

    ASSERT_TRUE(sink->wait_closed("s1", milliseconds(2000)));
    EXPECT_TRUE(eventually([&] { return !registry->contains("s1"); }));
    EXPECT_EQ(sink->joined_output("s1"), "logout\r\n");
    EXPECT_EQ(sink->closed_count("s1"), 1u);
    EXPECT_EQ(sink->closed()[0].reason, "Connection closed by remote host");

    EXPECT_EQ(lifecycle->close("s1", "alice").kind, ErrorKind::NOT_FOUND);
}

// ── Bulk teardown ─────────────────────────────────────────────

TEST_F(SessionLifecycleTest, DisconnectClosesOnlyThatClient) {
    open("a1", "alice");
    open("a2", "alice");
    open("b1", "bob");

    EXPECT_EQ(lifecycle->disconnect_client("alice"), 2u);
    EXPECT_FALSE(registry->contains("a1"));
    EXPECT_FALSE(registry->contains("a2"));
    EXPECT_TRUE(registry->contains("b1"));
    EXPECT_EQ(sink->closed_count("a1"), 1u);
    EXPECT_EQ(sink->closed_count("b1"), 0u);
    EXPECT_EQ(sink->closed()[0].reason, "Client disconnected");

    EXPECT_EQ(lifecycle->disconnect_client("alice"), 0u);
}

TEST_F(SessionLifecycleTest, ShutdownClosesEverything) {
    auto s1 = open("s1", "alice");
    auto s2 = open("s2", "bob");
    lifecycle->shutdown();

    EXPECT_EQ(registry->size(), 0u);
    EXPECT_EQ(s1->close_calls(), 1);
    EXPECT_EQ(s2->close_calls(), 1);
    for (const auto& c : sink->closed()) EXPECT_EQ(c.reason, "Server shutting down");
    EXPECT_EQ(sink->closed().size(), 2u);

    // Nothing left for the destructor to do
    lifecycle.reset();
    EXPECT_EQ(sink->closed().size(), 2u);
}
