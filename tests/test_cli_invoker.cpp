#include <gtest/gtest.h>
#include "daemon/cli_invoker.hpp"
#include "core/models.hpp"
#include "log/log_sink.hpp"
#include "fake_process.hpp"
#include "fake_worker.hpp"

using namespace std::chrono_literals;

class CliInvokerTest : public ::testing::Test {
protected:
    FakeWorker worker{"invoker"};
    LogSink sink;
    RecordLog log;

    void SetUp() override { log.attach(sink); }

    CliInvoker invoker_for(const std::string& body,
                           std::chrono::milliseconds timeout = 5000ms) {
        return CliInvoker(sink, worker.write_script("provider-daemon", body), {}, timeout);
    }
};

TEST_F(CliInvokerTest, EmptyArrayIsEmptyList) {
    auto invoker = invoker_for("echo '[]'");
    auto result = invoker.invoke<std::vector<GpuInfo>>({"--get-gpus-json"});
    ASSERT_TRUE(result.ok) << result.error.message();
    EXPECT_TRUE(result.value.empty());
    EXPECT_EQ(result.raw_stdout, "[]");
}

TEST_F(CliInvokerTest, ArgumentsFollowBaseArguments) {
    std::string path = worker.write_script("provider-daemon",
        "printf '[\"%s\",\"%s\",\"%s\",\"%s\"]' \"$1\" \"$2\" \"$3\" \"$4\"");
    CliInvoker invoker(sink, path, {"--config", "/etc/daemon.yaml"}, 5000ms);

    auto result = invoker.invoke<std::vector<std::string>>({"--get-settings-json", "x y"});
    ASSERT_TRUE(result.ok) << result.error.message();
    EXPECT_EQ(result.value, (std::vector<std::string>{
        "--config", "/etc/daemon.yaml", "--get-settings-json", "x y"}));
}

TEST_F(CliInvokerTest, InvalidJsonIsMalformedResponse) {
    auto invoker = invoker_for("echo 'not json at all'");
    auto result = invoker.invoke_json({"--get-gpus-json"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InvokeError::Kind::MalformedResponse);
    EXPECT_EQ(result.error.kind_name(), "MalformedResponse");
    EXPECT_EQ(result.raw_stdout, "not json at all");
    EXPECT_NE(result.error.message().find("Output: 'not json at all'"), std::string::npos);
}

TEST_F(CliInvokerTest, SchemaMismatchIsMalformedResponse) {
    auto invoker = invoker_for("echo '{\"foo\": 1}'");
    auto result = invoker.invoke<ProviderSettings>({"--get-settings-json"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InvokeError::Kind::MalformedResponse);
    EXPECT_EQ(result.raw_stdout, "{\"foo\": 1}");
    EXPECT_TRUE(log.contains("Failed to parse JSON from daemon", LogCategory::Error));
}

TEST_F(CliInvokerTest, NonZeroExitKeepsStderrVerbatim) {
    auto invoker = invoker_for("echo 'config not found' >&2; exit 2");
    auto result = invoker.invoke_json({"--get-settings-json"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InvokeError::Kind::InvocationFailed);
    ASSERT_TRUE(result.error.exit_code.has_value());
    EXPECT_EQ(*result.error.exit_code, 2);
    EXPECT_EQ(result.error.stderr_text, "config not found");
    EXPECT_EQ(result.error.message(),
              "Daemon command [\"--get-settings-json\"] failed with status exit code 2: "
              "stderr: 'config not found', stdout: ''");
}

TEST_F(CliInvokerTest, MultiLineStderrIsJoinedByNewlines) {
    auto invoker = invoker_for(R"(printf 'line one\r\n  line two: "quoted"\n' >&2; exit 4)");
    auto result = invoker.invoke_json({"--get-settings-json"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.exit_code.value_or(-1), 4);
    EXPECT_EQ(result.error.stderr_text, "line one\n  line two: \"quoted\"");
}

TEST_F(CliInvokerTest, NonZeroExitWithValidJsonStillFails) {
    auto invoker = invoker_for("echo '[]'; exit 1");
    auto result = invoker.invoke_json({"--get-gpus-json"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InvokeError::Kind::InvocationFailed);
    EXPECT_EQ(result.error.stdout_text, "[]");
}

TEST_F(CliInvokerTest, MissingBinaryIsSpawnFailed) {
    CliInvoker invoker(sink, "/nonexistent/provider-daemon");
    auto result = invoker.invoke_json({"--get-gpus-json"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InvokeError::Kind::SpawnFailed);
    EXPECT_NE(result.error.message().find("Failed to execute daemon command [\"--get-gpus-json\"]"),
              std::string::npos);
}

TEST_F(CliInvokerTest, TimeoutKillsTheChild) {
    auto invoker = invoker_for("exec sleep 30", 300ms);
    auto start = std::chrono::steady_clock::now();
    auto result = invoker.invoke_json({"--get-gpus-json"});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, InvokeError::Kind::InvocationFailed);
    EXPECT_FALSE(result.error.exit_code.has_value());
    EXPECT_NE(result.error.detail.find("timed out after 300 ms"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(CliInvokerTest, SuccessLeavesAuditTrail) {
    auto invoker = invoker_for("echo '[]'");
    ASSERT_TRUE(invoker.invoke_json({"--get-gpus-json"}).ok);

    auto records = log.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].category, LogCategory::Status);
    EXPECT_EQ(records[0].message, "Invoking daemon: provider-daemon with args [\"--get-gpus-json\"]");
    EXPECT_EQ(records[1].category, LogCategory::Stdout);
    EXPECT_EQ(records[1].message, "Daemon response for [\"--get-gpus-json\"]: []");
    EXPECT_LT(records[0].id, records[1].id);
}

TEST_F(CliInvokerTest, FailureEndsWithErrorRecord) {
    auto invoker = invoker_for("exit 3");
    EXPECT_FALSE(invoker.invoke_json({"--get-network-status-json"}).ok);

    auto records = log.records();
    ASSERT_GE(records.size(), 2u);
    EXPECT_EQ(records.front().category, LogCategory::Status);
    EXPECT_EQ(records.back().category, LogCategory::Error);
    EXPECT_NE(records.back().message.find("exit code 3"), std::string::npos);
}

TEST(CliInvokerFormatTest, FormatArgs) {
    EXPECT_EQ(CliInvoker::format_args({}), "[]");
    EXPECT_EQ(CliInvoker::format_args({"--gpu-id", "nvidia-0"}), "[\"--gpu-id\", \"nvidia-0\"]");
    EXPECT_EQ(CliInvoker::format_args({"say \"hi\""}), "[\"say \\\"hi\\\"\"]");
}
