#include "app.hpp"
#include "api/provider_client.hpp"
#include "core/config.hpp"
#include "daemon/cli_invoker.hpp"
#include "daemon/supervisor.hpp"
#include "log/log_sink.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <istream>
#include <mutex>
#include <ostream>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace {

template <typename T>
json invoke_response(const InvokeResult<T>& result) {
    if (result.ok) {
        return {{"ok", true}, {"data", result.value}};
    }
    return {{"ok", false},
            {"error", result.error.message()},
            {"error_kind", result.error.kind_name()}};
}

json supervisor_response(const SupervisorResult& result, DaemonStatus status) {
    if (result.ok) {
        return {{"ok", true},
                {"data", {{"message", result.message}, {"status", status_name(status)}}}};
    }
    return {{"ok", false}, {"error", result.message}};
}

// Commands that shell out to the daemon run off the reader thread
bool is_query(const std::string& cmd) {
    return cmd == "get_gpus" || cmd == "get_settings" || cmd == "update_settings" ||
           cmd == "set_gpu_config" || cmd == "get_local_jobs" ||
           cmd == "get_network_status" || cmd == "get_financial_summary" ||
           cmd == "get_system_overview";
}

} // namespace

struct App::Impl {
    Config& config;
    std::istream& in;
    std::ostream& out;
    std::mutex out_mutex;

    LogSink sink;
    CliInvoker invoker;
    ProviderClient client;
    std::unique_ptr<DaemonSupervisor> supervisor;
    int sink_token = 0;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::vector<Worker> workers;

    Impl(Config& cfg, std::istream& input, std::ostream& output)
        : config(cfg),
          in(input),
          out(output),
          invoker(sink, Config::expand_home(cfg.data().daemon_binary_path), {},
                  std::chrono::milliseconds(cfg.data().invoke_timeout_ms)),
          client(sink, invoker) {
        SupervisorOptions options;
        options.binary_path = Config::expand_home(cfg.data().daemon_binary_path);
        options.args = cfg.daemon_args();
        options.stop_timeout = std::chrono::milliseconds(cfg.data().stop_timeout_ms);
        supervisor = std::make_unique<DaemonSupervisor>(sink, std::move(options));

        sink_token = sink.subscribe([this](const LogRecord& record) {
            write_line({{"event", "daemon_log"},
                        {"data", {{"id", record.id},
                                  {"message", record.message},
                                  {"timestamp", record.timestamp},
                                  {"category", category_name(record.category)}}}});
        });
    }

    ~Impl() {
        shutdown();
        sink.unsubscribe(sink_token);
    }

    void write_line(const json& j) {
        // Invalid UTF-8 in daemon output is replaced rather than thrown on
        std::string line = j.dump(-1, ' ', false, json::error_handler_t::replace);
        std::lock_guard<std::mutex> lock(out_mutex);
        out << line << '\n';
        out.flush();
    }

    void respond(const json& id, json body) {
        body["id"] = id;
        write_line(body);
    }

    json run_query(const std::string& cmd, const json& req) {
        if (cmd == "get_gpus") return invoke_response(client.get_gpus());
        if (cmd == "get_settings") return invoke_response(client.get_settings());
        if (cmd == "update_settings") {
            auto settings = req.at("settings").get<ProviderSettings>();
            return invoke_response(client.update_settings(settings));
        }
        if (cmd == "set_gpu_config") {
            return invoke_response(client.set_gpu_config(
                req.at("gpu_id").get<std::string>(),
                req.at("rate").get<float>(),
                req.at("available").get<bool>()));
        }
        if (cmd == "get_local_jobs") return invoke_response(client.get_local_jobs());
        if (cmd == "get_network_status") return invoke_response(client.get_network_status());
        if (cmd == "get_financial_summary") return invoke_response(client.get_financial_summary());
        if (cmd == "get_system_overview") return invoke_response(client.get_system_overview());
        return {{"ok", false}, {"error", "Unknown command: " + cmd}};
    }

    void dispatch_query(const std::string& cmd, const json& id, json req) {
        // Only the reader thread touches workers
        for (auto it = workers.begin(); it != workers.end();) {
            if (it->done->load()) {
                it->thread.join();
                it = workers.erase(it);
            } else {
                ++it;
            }
        }

        Worker worker;
        worker.done = std::make_shared<std::atomic<bool>>(false);
        worker.thread = std::thread([this, cmd, id, req = std::move(req), done = worker.done]() {
            json body;
            try {
                body = run_query(cmd, req);
            } catch (const json::exception& e) {
                body = {{"ok", false}, {"error", std::string("Invalid request: ") + e.what()}};
            }
            respond(id, std::move(body));
            done->store(true);
        });
        workers.push_back(std::move(worker));
    }

    /// Returns false when the host asked to quit
    bool handle_line(const std::string& line) {
        json req;
        try {
            req = json::parse(line);
        } catch (const json::parse_error& e) {
            spdlog::warn("Bridge: unparsable command line: {}", e.what());
            respond(json(), {{"ok", false}, {"error", std::string("Parse error: ") + e.what()}});
            return true;
        }

        json id;
        std::string cmd;
        if (req.is_object()) {
            if (req.contains("id")) id = req["id"];
            if (req.contains("cmd") && req["cmd"].is_string()) cmd = req["cmd"].get<std::string>();
        }

        if (cmd == "start") {
            auto result = supervisor->start();
            respond(id, supervisor_response(result, supervisor->status()));
            return true;
        }
        if (cmd == "stop") {
            auto result = supervisor->stop();
            respond(id, supervisor_response(result, supervisor->status()));
            return true;
        }
        if (cmd == "get_status") {
            respond(id, {{"ok", true},
                         {"data", {{"status", status_name(supervisor->status())},
                                   {"pid", supervisor->daemon_pid()}}}});
            return true;
        }
        if (cmd == "quit") {
            respond(id, {{"ok", true}});
            return false;
        }
        if (is_query(cmd)) {
            dispatch_query(cmd, id, std::move(req));
            return true;
        }

        respond(id, {{"ok", false}, {"error", "Unknown command: " + cmd}});
        return true;
    }

    void shutdown() {
        for (auto& worker : workers) {
            if (worker.thread.joinable()) worker.thread.join();
        }
        workers.clear();
        supervisor.reset();
    }
};

App::App(Config& config, std::istream& in, std::ostream& out)
    : impl_(std::make_unique<Impl>(config, in, out)) {}

App::~App() = default;

int App::run() {
    impl_->write_line({{"event", "app_ready"},
                       {"data", {{"status", status_name(impl_->supervisor->status())}}}});
    impl_->sink.emit(LogCategory::Status, "Provider shell initialized. Daemon is OFFLINE.");

    std::string line;
    while (std::getline(impl_->in, line)) {
        if (line.empty()) continue;
        if (!impl_->handle_line(line)) break;
    }

    impl_->shutdown();
    return 0;
}
