#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "daemon/supervisor.hpp"
#include "log/log_sink.hpp"
#include "app.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <signal.h>

static std::atomic<bool> g_stop_requested{false};

static void signal_handler(int /*sig*/) {
    g_stop_requested.store(true);
}

static int run_foreground(Config& config) {
    LogSink sink;
    sink.subscribe([](const LogRecord& record) {
        std::cout << "[" << record.timestamp << "] [" << category_name(record.category)
                  << "] " << record.message << std::endl;
    });

    SupervisorOptions options;
    options.binary_path = Config::expand_home(config.data().daemon_binary_path);
    options.args = config.daemon_args();
    options.stop_timeout = std::chrono::milliseconds(config.data().stop_timeout_ms);
    DaemonSupervisor supervisor(sink, std::move(options));

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    if (!supervisor.start().ok) {
        return 1;
    }

    bool stop_sent = false;
    while (!supervisor.wait_for({DaemonStatus::Offline, DaemonStatus::Error},
                                std::chrono::milliseconds(200))) {
        if (g_stop_requested.load() && !stop_sent) {
            stop_sent = true;
            auto result = supervisor.stop();
            if (!result.ok) {
                spdlog::error("Stop request failed: {}", result.message);
            }
        }
    }

    // Supervisor teardown joins the pump, flushing its last records
    return supervisor.status() == DaemonStatus::Error ? 1 : 0;
}

int main(int argc, char* argv[]) {
    Config config;
    bool loaded = config.load();
    init_logging(config.data());
    if (!loaded) {
        spdlog::debug("No usable config at {}, using defaults", Config::config_path());
    }

    int cli_result = CLI::run(argc, argv);

    if (cli_result == -2) {
        // run subcommand
        return run_foreground(config);
    }
    if (cli_result != -1) {
        // handled by CLI (help, version, queries, or error)
        return cli_result;
    }

    // No subcommand → JSON-lines bridge for the UI host
    signal(SIGPIPE, SIG_IGN);
    App app(config, std::cin, std::cout);
    return app.run();
}
