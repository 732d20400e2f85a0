#include "mcp_client.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

using namespace mcplink;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

McpServerConfig stub_config(const std::string& mode, const std::string& name = "stub") {
    McpServerConfig cfg;
    cfg.name = name;
    cfg.command = MCPLINK_STUB_SERVER;
    cfg.args = {mode};
    return cfg;
}

McpClient::Timeouts short_timeouts() {
    McpClient::Timeouts t;
    t.request = 3000ms;
    t.shutdown_grace = 1000ms;
    return t;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

McpErrorKind kind_of_call(McpClient& client, const std::string& tool, const json& args = json::object()) {
    try {
        client.call_tool(tool, args);
    } catch (const McpError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "call_tool(" << tool << ") did not throw";
    return McpErrorKind::invalid_state;
}

} // namespace

// ── Lifecycle ───────────────────────────────────────────────────────

TEST(McpClientTest, StartReachesRunning) {
    McpClient client(stub_config("normal"), short_timeouts());
    EXPECT_EQ(client.status(), ServerStatus::stopped);

    client.start();
    EXPECT_EQ(client.status(), ServerStatus::running);
    EXPECT_FALSE(client.last_error().has_value());
    EXPECT_GT(client.pid(), 0);

    EXPECT_EQ(client.server_info().name, "stub");
    EXPECT_EQ(client.protocol_version(), "2024-11-05");
    EXPECT_TRUE(client.capabilities().contains("tools"));

    auto tools = client.tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_TRUE(client.has_tool("fail"));
    EXPECT_FALSE(client.has_tool("missing"));

    client.stop();
    EXPECT_EQ(client.status(), ServerStatus::stopped);
    EXPECT_TRUE(client.tools().empty());
    EXPECT_EQ(client.pid(), -1);
}

TEST(McpClientTest, SilentServerFailsHandshakeWithinTimeout) {
    McpClient::Timeouts t;
    t.request = 300ms;
    t.shutdown_grace = 1000ms;
    McpClient client(stub_config("silent"), t);

    auto begin = std::chrono::steady_clock::now();
    try {
        client.start();
        FAIL() << "expected handshake failure";
    } catch (const McpError& e) {
        EXPECT_EQ(e.kind(), McpErrorKind::handshake);
    }
    auto elapsed = std::chrono::steady_clock::now() - begin;
    EXPECT_LT(elapsed, 3s);

    EXPECT_EQ(client.status(), ServerStatus::error);
    ASSERT_TRUE(client.last_error().has_value());
    EXPECT_EQ(client.last_error()->kind(), McpErrorKind::handshake);
    EXPECT_EQ(client.pending_count(), 0u);
}

TEST(McpClientTest, SpawnFailureLeavesError) {
    McpServerConfig cfg;
    cfg.name = "ghost";
    cfg.command = "/nonexistent/mcplink-no-such-server";
    McpClient client(cfg, short_timeouts());

    try {
        client.start();
        FAIL() << "expected spawn failure";
    } catch (const McpError& e) {
        EXPECT_EQ(e.kind(), McpErrorKind::spawn);
    }
    EXPECT_EQ(client.status(), ServerStatus::error);
    EXPECT_EQ(client.last_error()->kind(), McpErrorKind::spawn);
}

TEST(McpClientTest, StopIsIdempotent) {
    McpClient client(stub_config("normal"), short_timeouts());
    client.stop();
    EXPECT_EQ(client.status(), ServerStatus::stopped);

    client.start();
    client.stop();
    client.stop();
    EXPECT_EQ(client.status(), ServerStatus::stopped);
}

TEST(McpClientTest, StartTwiceIsRejected) {
    McpClient client(stub_config("normal"), short_timeouts());
    client.start();
    try {
        client.start();
        FAIL() << "expected invalid_state";
    } catch (const McpError& e) {
        EXPECT_EQ(e.kind(), McpErrorKind::invalid_state);
    }
    EXPECT_EQ(client.status(), ServerStatus::running);
}

TEST(McpClientTest, CanRestartAfterStop) {
    McpClient client(stub_config("normal"), short_timeouts());
    client.start();
    pid_t first = client.pid();
    client.stop();

    client.start();
    EXPECT_EQ(client.status(), ServerStatus::running);
    EXPECT_NE(client.pid(), first);
    EXPECT_EQ(client.call_tool("echo", {{"again", true}}).raw, json({{"again", true}}));
}

// ── Calls ───────────────────────────────────────────────────────────

TEST(McpClientTest, EchoCallReturnsResult) {
    McpClient client(stub_config("normal"), short_timeouts());
    client.start();

    auto result = client.call_tool("echo", {{"x", 1}});
    EXPECT_FALSE(result.is_error);
    EXPECT_EQ(result.raw, json({{"x", 1}}));
    EXPECT_EQ(client.pending_count(), 0u);
}

TEST(McpClientTest, ToolFailureIsDataNotException) {
    McpClient client(stub_config("normal"), short_timeouts());
    client.start();

    auto result = client.call_tool("fail", json::object());
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.text(), "tool failed on purpose");
    EXPECT_EQ(client.status(), ServerStatus::running);
}

TEST(McpClientTest, ServerErrorCarriesRpcCode) {
    McpClient client(stub_config("normal"), short_timeouts());
    client.start();

    try {
        client.call_tool("no_such_tool", json::object());
        FAIL() << "expected rpc_error";
    } catch (const McpError& e) {
        EXPECT_EQ(e.kind(), McpErrorKind::rpc_error);
        EXPECT_EQ(e.rpc_code(), -32602);
        EXPECT_FALSE(e.is_fatal());
    }
    EXPECT_EQ(client.status(), ServerStatus::running);
    EXPECT_EQ(client.call_tool("echo", {{"ok", 1}}).raw, json({{"ok", 1}}));
}

TEST(McpClientTest, CallWhileStoppedFailsWithoutWriting) {
    McpClient client(stub_config("normal"), short_timeouts());
    EXPECT_EQ(kind_of_call(client, "echo"), McpErrorKind::not_running);
    EXPECT_EQ(client.pending_count(), 0u);
    EXPECT_THROW(client.refresh_tools(), McpError);
}

TEST(McpClientTest, ConcurrentCallsGetTheirOwnResponses) {
    McpClient client(stub_config("delay"), short_timeouts());
    client.start();

    const int n = 50;
    std::vector<std::thread> callers;
    std::atomic<int> matched{0};
    std::atomic<int> failed{0};
    for (int i = 0; i < n; i++) {
        callers.emplace_back([&, i] {
            try {
                auto r = client.call_tool("echo", {{"caller", i}});
                if (r.raw.value("caller", -1) == i) matched++;
            } catch (const McpError&) {
                failed++;
            }
        });
    }
    for (auto& t : callers) t.join();

    EXPECT_EQ(matched.load(), n);
    EXPECT_EQ(failed.load(), 0);
    EXPECT_EQ(client.pending_count(), 0u);
}

TEST(McpClientTest, StopReleasesPendingCalls) {
    McpClient::Timeouts t;
    t.request = 10000ms;
    t.shutdown_grace = 1000ms;
    McpClient client(stub_config("hang"), t);
    client.start();

    std::atomic<int> shutdown_errors{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 3; i++) {
        callers.emplace_back([&] {
            if (kind_of_call(client, "echo") == McpErrorKind::shutdown) shutdown_errors++;
        });
    }
    ASSERT_TRUE(wait_until([&] { return client.pending_count() == 3; }));

    client.stop();
    for (auto& th : callers) th.join();

    EXPECT_EQ(shutdown_errors.load(), 3);
    EXPECT_EQ(client.pending_count(), 0u);
}

TEST(McpClientTest, RequestTimeoutDoesNotKillSession) {
    McpClient::Timeouts t;
    t.request = 200ms;
    t.shutdown_grace = 1000ms;
    McpClient client(stub_config("hang"), t);
    client.start();

    EXPECT_EQ(kind_of_call(client, "echo"), McpErrorKind::timeout);
    EXPECT_EQ(client.status(), ServerStatus::running);
    EXPECT_EQ(client.pending_count(), 0u);
}

TEST(McpClientTest, StopIsBoundedWhenServerStopsReading) {
    McpClient::Timeouts t;
    t.request = 10000ms;
    t.shutdown_grace = 500ms;
    McpClient client(stub_config("deaf"), t);
    client.start();

    std::atomic<int> kind{-1};
    std::thread caller([&] {
        json args = {{"big", std::string(1 << 20, 'x')}};
        kind = static_cast<int>(kind_of_call(client, "echo", args));
    });
    ASSERT_TRUE(wait_until([&] { return client.pending_count() == 1; }));
    std::this_thread::sleep_for(200ms);

    auto begin = std::chrono::steady_clock::now();
    client.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
    caller.join();

    EXPECT_EQ(kind.load(), static_cast<int>(McpErrorKind::shutdown));
    EXPECT_EQ(client.status(), ServerStatus::stopped);
    EXPECT_EQ(client.pending_count(), 0u);
}

TEST(McpClientTest, LargeCallToNonReadingServerTimesOut) {
    McpClient::Timeouts t;
    t.request = 300ms;
    t.shutdown_grace = 500ms;
    McpClient client(stub_config("deaf"), t);
    client.start();

    json args = {{"big", std::string(1 << 20, 'x')}};
    auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(kind_of_call(client, "echo", args), McpErrorKind::timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
    EXPECT_EQ(client.pending_count(), 0u);

    begin = std::chrono::steady_clock::now();
    client.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
}

// ── Process death ───────────────────────────────────────────────────

TEST(McpClientTest, ExternalKillMovesToError) {
    McpClient client(stub_config("normal"), short_timeouts());
    client.start();
    ASSERT_EQ(client.status(), ServerStatus::running);

    ASSERT_EQ(kill(client.pid(), SIGKILL), 0);
    ASSERT_TRUE(wait_until([&] { return client.status() == ServerStatus::error; }));

    auto err = client.last_error();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind(), McpErrorKind::process_exited);
    EXPECT_EQ(kind_of_call(client, "echo"), McpErrorKind::not_running);

    // error is sticky until an explicit stop()
    EXPECT_THROW(client.start(), McpError);
    client.stop();
    client.start();
    EXPECT_EQ(client.status(), ServerStatus::running);
}

TEST(McpClientTest, CrashDuringCallFailsTheCaller) {
    McpClient client(stub_config("crash"), short_timeouts());
    client.start();

    EXPECT_EQ(kind_of_call(client, "echo"), McpErrorKind::process_exited);
    ASSERT_TRUE(wait_until([&] { return client.status() == ServerStatus::error; }));
    ASSERT_TRUE(client.last_error().has_value());
    EXPECT_NE(std::string(client.last_error()->what()).find("exit code 3"), std::string::npos);
}

// ── Stream robustness ───────────────────────────────────────────────

TEST(McpClientTest, GarbageLinesDoNotBreakTheStream) {
    McpClient client(stub_config("garbage"), short_timeouts());
    client.start();
    EXPECT_EQ(client.tools().size(), 2u);

    for (int i = 0; i < 3; i++) {
        auto r = client.call_tool("echo", {{"round", i}});
        EXPECT_EQ(r.raw, json({{"round", i}}));
    }
    EXPECT_EQ(client.status(), ServerStatus::running);
}

TEST(McpClientTest, StderrChatterIsDrained) {
    McpClient client(stub_config("stderr"), short_timeouts());
    client.start();
    for (int i = 0; i < 20; i++) {
        EXPECT_EQ(client.call_tool("echo", {{"i", i}}).raw, json({{"i", i}}));
    }
}

TEST(McpClientTest, AnswersServerPingAndDeliversNotifications) {
    McpClient client(stub_config("ping"), short_timeouts());
    std::atomic<int> notifications{0};
    client.set_notification_handler([&](const Notification& n) {
        if (n.method == "notifications/message") notifications++;
    });
    client.start();

    EXPECT_EQ(client.call_tool("ping_seen", json::object()).text(), "yes");
    EXPECT_TRUE(wait_until([&] { return notifications.load() == 1; }));
}

TEST(McpClientTest, RefreshReplacesCatalogWhole) {
    McpClient client(stub_config("growing"), short_timeouts());
    client.start();
    EXPECT_EQ(client.tools().size(), 2u);

    client.refresh_tools();
    auto tools = client.tools();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[2].name, "extra_1");

    client.refresh_tools();
    EXPECT_EQ(client.tools().size(), 4u);
    EXPECT_TRUE(client.has_tool("extra_2"));
}

TEST(McpClientTest, ConcurrentReadersNeverSeeAMixedCatalog) {
    McpClient client(stub_config("growing"), short_timeouts());
    client.start();

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> reads{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; r++) {
        readers.emplace_back([&] {
            size_t last = 0;
            while (!done) {
                auto tools = client.tools();
                reads++;
                // Every list is echo, fail, extra_1 .. extra_k, and only grows
                bool ok = tools.size() >= 2 && tools.size() >= last &&
                          tools[0].name == "echo" && tools[1].name == "fail";
                for (size_t i = 2; ok && i < tools.size(); i++) {
                    ok = tools[i].name == "extra_" + std::to_string(i - 1);
                }
                if (!ok) torn++;
                last = tools.size();
            }
        });
    }

    for (int i = 0; i < 20; i++) client.refresh_tools();
    done = true;
    for (auto& th : readers) th.join();

    EXPECT_EQ(torn.load(), 0);
    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(client.tools().size(), 22u);
}
