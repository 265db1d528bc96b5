#include <gtest/gtest.h>
#include "app.hpp"
#include "core/config.hpp"
#include "fake_worker.hpp"

#include <nlohmann/json.hpp>

#include <sstream>

using json = nlohmann::json;

namespace {

const char* DAEMON_SCRIPT = R"SH(
case "$1" in
  --get-gpus-json) echo '[]' ;;
  --get-settings-json)
    echo '{"default_hourly_rate":0.75,"preferred_currency":"USD","min_job_duration_minutes":10,"max_concurrent_jobs":1}' ;;
  --get-network-status-json) echo 'config not found' >&2; exit 2 ;;
  --set-gpu-config-json)
    printf '{"id":"%s","name":"RTX","model":"4090","vram_total_mb":1,"vram_free_mb":1,"is_available_for_rent":%s,"current_hourly_rate":%s}\n' "$3" "$7" "$5" ;;
  --serve) echo "daemon up"; exec sleep 30 ;;
  *) echo "unknown flag $1" >&2; exit 2 ;;
esac
)SH";

} // namespace

class AppTest : public ::testing::Test {
protected:
    FakeWorker worker{"app"};
    Config config;
    std::vector<json> lines;

    void SetUp() override {
        config.data().daemon_binary_path = worker.write_script("provider-daemon", DAEMON_SCRIPT);
        config.data().daemon_extra_args = {"--serve"};
        config.data().stop_timeout_ms = 2000;
        config.data().invoke_timeout_ms = 5000;
    }

    void run(const std::string& input) {
        std::istringstream in(input);
        std::ostringstream out;
        {
            App app(config, in, out);
            EXPECT_EQ(app.run(), 0);
        }
        std::istringstream written(out.str());
        std::string line;
        while (std::getline(written, line)) {
            lines.push_back(json::parse(line));
        }
    }

    const json* response(int id) const {
        for (const auto& j : lines) {
            if (j.contains("id") && j["id"] == id) return &j;
        }
        return nullptr;
    }

    std::vector<json> logs() const {
        std::vector<json> out;
        for (const auto& j : lines) {
            if (j.value("event", "") == "daemon_log") out.push_back(j["data"]);
        }
        return out;
    }

    bool logged(const std::string& text, const std::string& category) const {
        for (const auto& data : logs()) {
            if (data["category"] == category &&
                data["message"].get<std::string>().find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
};

TEST_F(AppTest, AnnouncesReadinessFirst) {
    run("");
    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(lines[0]["event"], "app_ready");
    EXPECT_EQ(lines[0]["data"]["status"], "offline");
    EXPECT_TRUE(logged("Provider shell initialized. Daemon is OFFLINE.", "status"));
}

TEST_F(AppTest, GetStatusWhenOffline) {
    run(R"({"id":1,"cmd":"get_status"})" "\n");
    const json* r = response(1);
    ASSERT_NE(r, nullptr);
    EXPECT_TRUE((*r)["ok"].get<bool>());
    EXPECT_EQ((*r)["data"]["status"], "offline");
    EXPECT_EQ((*r)["data"]["pid"], -1);
}

TEST_F(AppTest, UnknownCommandAndParseError) {
    run(R"({"id":1,"cmd":"reboot_gpu"})" "\n"
        "this is not json\n"
        R"({"id":2,"cmd":"get_status"})" "\n");

    const json* r = response(1);
    ASSERT_NE(r, nullptr);
    EXPECT_FALSE((*r)["ok"].get<bool>());
    EXPECT_EQ((*r)["error"], "Unknown command: reboot_gpu");

    bool saw_parse_error = false;
    for (const auto& j : lines) {
        if (j.contains("error") && j["error"].get<std::string>().rfind("Parse error:", 0) == 0) {
            saw_parse_error = true;
            EXPECT_TRUE(j["id"].is_null());
        }
    }
    EXPECT_TRUE(saw_parse_error);

    // The bridge kept serving after the bad line
    EXPECT_NE(response(2), nullptr);
}

TEST_F(AppTest, QueriesReturnTypedData) {
    run(R"({"id":1,"cmd":"get_gpus"})" "\n"
        R"({"id":2,"cmd":"get_settings"})" "\n"
        R"({"id":3,"cmd":"set_gpu_config","gpu_id":"nvidia-0","rate":2.5,"available":true})" "\n");

    const json* gpus = response(1);
    ASSERT_NE(gpus, nullptr);
    EXPECT_TRUE((*gpus)["ok"].get<bool>());
    EXPECT_TRUE((*gpus)["data"].is_array());
    EXPECT_TRUE((*gpus)["data"].empty());

    const json* settings = response(2);
    ASSERT_NE(settings, nullptr);
    ASSERT_TRUE((*settings)["ok"].get<bool>()) << settings->dump();
    EXPECT_EQ((*settings)["data"]["preferred_currency"], "USD");

    const json* gpu = response(3);
    ASSERT_NE(gpu, nullptr);
    ASSERT_TRUE((*gpu)["ok"].get<bool>()) << gpu->dump();
    EXPECT_EQ((*gpu)["data"]["id"], "nvidia-0");
    EXPECT_TRUE((*gpu)["data"]["is_available_for_rent"].get<bool>());
}

TEST_F(AppTest, QueryFailureCarriesDiagnostics) {
    run(R"({"id":7,"cmd":"get_network_status"})" "\n");
    const json* r = response(7);
    ASSERT_NE(r, nullptr);
    EXPECT_FALSE((*r)["ok"].get<bool>());
    EXPECT_EQ((*r)["error_kind"], "InvocationFailed");
    EXPECT_NE((*r)["error"].get<std::string>().find("config not found"), std::string::npos);
    EXPECT_TRUE(logged("config not found", "error"));
}

TEST_F(AppTest, InvalidRequestFields) {
    run(R"({"id":4,"cmd":"set_gpu_config","gpu_id":"nvidia-0"})" "\n");
    const json* r = response(4);
    ASSERT_NE(r, nullptr);
    EXPECT_FALSE((*r)["ok"].get<bool>());
    EXPECT_EQ((*r)["error"].get<std::string>().rfind("Invalid request:", 0), 0u);
}

TEST_F(AppTest, StartStopLifecycle) {
    run(R"({"id":1,"cmd":"start"})" "\n"
        R"({"id":2,"cmd":"get_status"})" "\n"
        R"({"id":3,"cmd":"start"})" "\n"
        R"({"id":4,"cmd":"stop"})" "\n"
        R"({"id":5,"cmd":"quit"})" "\n"
        R"({"id":6,"cmd":"get_status"})" "\n");

    const json* started = response(1);
    ASSERT_NE(started, nullptr);
    ASSERT_TRUE((*started)["ok"].get<bool>()) << started->dump();
    EXPECT_EQ((*started)["data"]["status"], "online");

    const json* status = response(2);
    ASSERT_NE(status, nullptr);
    EXPECT_GT((*status)["data"]["pid"].get<int>(), 0);

    const json* again = response(3);
    ASSERT_NE(again, nullptr);
    EXPECT_EQ((*again)["data"]["message"], "Daemon is already online or starting.");

    const json* stopped = response(4);
    ASSERT_NE(stopped, nullptr);
    EXPECT_TRUE((*stopped)["ok"].get<bool>());

    EXPECT_NE(response(5), nullptr);
    EXPECT_EQ(response(6), nullptr);  // nothing is served after quit

    EXPECT_TRUE(logged("Daemon stopped as expected.", "status"));
}

TEST_F(AppTest, LogIdsIncreaseInOutputOrder) {
    run(R"({"id":1,"cmd":"get_gpus"})" "\n"
        R"({"id":2,"cmd":"get_settings"})" "\n"
        R"({"id":3,"cmd":"start"})" "\n"
        R"({"id":4,"cmd":"stop"})" "\n");

    auto records = logs();
    ASSERT_FALSE(records.empty());
    uint64_t last = 0;
    for (const auto& data : records) {
        uint64_t id = data["id"].get<uint64_t>();
        EXPECT_GT(id, last);
        last = id;
        EXPECT_TRUE(data["timestamp"].is_string());
    }
}
