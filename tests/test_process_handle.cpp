#include <gtest/gtest.h>
#include "daemon/process_handle.hpp"

#include <chrono>
#include <csignal>
#include <set>
#include <string>
#include <vector>

namespace {

struct Drained {
    std::vector<std::string> out;
    std::vector<std::string> err;
    std::vector<std::string> errors;
    std::optional<ExitInfo> exit;
    bool events_after_terminated = false;
};

Drained drain(ProcessHandle& handle) {
    Drained d;
    while (auto ev = handle.next_event()) {
        if (d.exit) d.events_after_terminated = true;
        switch (ev->kind) {
            case ProcessEvent::Kind::OutputLine:
                (ev->stream == OutputStream::Stdout ? d.out : d.err).push_back(ev->text);
                break;
            case ProcessEvent::Kind::ExecutionError:
                d.errors.push_back(ev->text);
                break;
            case ProcessEvent::Kind::Terminated:
                d.exit = ev->exit;
                break;
        }
    }
    return d;
}

std::shared_ptr<ProcessHandle> spawn_sh(const std::string& script) {
    auto outcome = ProcessHandle::spawn("/bin/sh", {"-c", script});
    EXPECT_TRUE(outcome.handle) << outcome.error;
    return outcome.handle;
}

} // namespace

TEST(ProcessHandleTest, CapturesBothStreamsAndExitCode) {
    auto handle = spawn_sh("echo hello; echo oops >&2; echo world; exit 3");
    ASSERT_TRUE(handle);
    EXPECT_GT(handle->pid(), 0);

    auto d = drain(*handle);
    EXPECT_EQ(d.out, (std::vector<std::string>{"hello", "world"}));
    EXPECT_EQ(d.err, (std::vector<std::string>{"oops"}));
    EXPECT_TRUE(d.errors.empty());
    ASSERT_TRUE(d.exit.has_value());
    ASSERT_TRUE(d.exit->exit_code.has_value());
    EXPECT_EQ(*d.exit->exit_code, 3);
    EXPECT_FALSE(d.exit->signal.has_value());
    EXPECT_FALSE(d.events_after_terminated);
    EXPECT_TRUE(handle->has_exited());
}

TEST(ProcessHandleTest, StreamEndsAfterTerminated) {
    auto handle = spawn_sh("true");
    ASSERT_TRUE(handle);
    auto d = drain(*handle);
    ASSERT_TRUE(d.exit.has_value());
    EXPECT_EQ(d.exit->exit_code.value_or(-1), 0);
    EXPECT_FALSE(handle->next_event().has_value());
}

TEST(ProcessHandleTest, UnterminatedLastLineIsFlushed) {
    auto handle = spawn_sh("printf 'first\\npartial'");
    ASSERT_TRUE(handle);
    auto d = drain(*handle);
    EXPECT_EQ(d.out, (std::vector<std::string>{"first", "partial"}));
}

TEST(ProcessHandleTest, CarriageReturnsAreStripped) {
    auto handle = spawn_sh("printf 'windows line\\r\\n'");
    ASSERT_TRUE(handle);
    auto d = drain(*handle);
    EXPECT_EQ(d.out, (std::vector<std::string>{"windows line"}));
}

TEST(ProcessHandleTest, ArgumentsArePassedVerbatim) {
    auto outcome = ProcessHandle::spawn("/bin/echo", {"--config", "/tmp/with space.yaml"});
    ASSERT_TRUE(outcome.handle) << outcome.error;
    auto d = drain(*outcome.handle);
    EXPECT_EQ(d.out, (std::vector<std::string>{"--config /tmp/with space.yaml"}));
}

TEST(ProcessHandleTest, MissingBinaryFailsAtSpawn) {
    auto outcome = ProcessHandle::spawn("/nonexistent/provider-daemon");
    EXPECT_FALSE(outcome.handle);
    EXPECT_NE(outcome.error.find("exec /nonexistent/provider-daemon"), std::string::npos);
    EXPECT_NE(outcome.error.find("No such file"), std::string::npos);
}

TEST(ProcessHandleTest, EmptyBinaryFailsAtSpawn) {
    auto outcome = ProcessHandle::spawn("");
    EXPECT_FALSE(outcome.handle);
    EXPECT_EQ(outcome.error, "no executable configured");
}

TEST(ProcessHandleTest, TerminateEndsWithSignal) {
    auto outcome = ProcessHandle::spawn("/bin/sleep", {"60"});
    ASSERT_TRUE(outcome.handle) << outcome.error;

    std::string err;
    EXPECT_TRUE(outcome.handle->terminate(std::chrono::milliseconds(0), err)) << err;

    auto d = drain(*outcome.handle);
    ASSERT_TRUE(d.exit.has_value());
    EXPECT_FALSE(d.exit->exit_code.has_value());
    EXPECT_EQ(d.exit->signal.value_or(0), SIGTERM);
    EXPECT_FALSE(outcome.handle->deadline_expired());
}

TEST(ProcessHandleTest, TerminateEscalatesToKill) {
    // The ignored disposition survives exec, so sleep shrugs off SIGTERM
    auto handle = spawn_sh("trap '' TERM; exec sleep 30");
    ASSERT_TRUE(handle);

    auto start = std::chrono::steady_clock::now();
    std::string err;
    EXPECT_TRUE(handle->terminate(std::chrono::milliseconds(300), err)) << err;

    auto d = drain(*handle);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(d.exit.has_value());
    EXPECT_EQ(d.exit->signal.value_or(0), SIGKILL);
    EXPECT_TRUE(handle->deadline_expired());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(ProcessHandleTest, KillAfterEnforcesTimeout) {
    auto outcome = ProcessHandle::spawn("/bin/sleep", {"30"});
    ASSERT_TRUE(outcome.handle) << outcome.error;
    outcome.handle->kill_after(std::chrono::milliseconds(200));

    auto d = drain(*outcome.handle);
    ASSERT_TRUE(d.exit.has_value());
    EXPECT_EQ(d.exit->signal.value_or(0), SIGKILL);
    EXPECT_TRUE(outcome.handle->deadline_expired());
}

TEST(ProcessHandleTest, DescendantHoldingPipesDoesNotHang) {
    auto handle = spawn_sh("sleep 5 & echo parent done");
    ASSERT_TRUE(handle);

    auto start = std::chrono::steady_clock::now();
    auto d = drain(*handle);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(d.out, (std::vector<std::string>{"parent done"}));
    ASSERT_TRUE(d.exit.has_value());
    EXPECT_EQ(d.exit->exit_code.value_or(-1), 0);
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST(ProcessHandleTest, SignalAfterExitIsHarmless) {
    auto handle = spawn_sh("exit 0");
    ASSERT_TRUE(handle);
    drain(*handle);

    std::string err;
    EXPECT_TRUE(handle->terminate(std::chrono::milliseconds(0), err));
    EXPECT_TRUE(handle->kill(err));
    EXPECT_TRUE(err.empty());
}

TEST(ProcessHandleTest, InstanceTokensAreUnique) {
    std::set<uint64_t> seen;
    for (int i = 0; i < 3; ++i) {
        auto handle = spawn_sh("exit 0");
        ASSERT_TRUE(handle);
        EXPECT_TRUE(seen.insert(handle->instance()).second);
        drain(*handle);
    }
}
