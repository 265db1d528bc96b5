#include "core/cli.hpp"
#include "core/config.hpp"
#include "api/provider_client.hpp"
#include "daemon/cli_invoker.hpp"
#include "log/log_sink.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

using json = nlohmann::json;

namespace {

template <typename T>
int print_result(const InvokeResult<T>& result) {
    if (!result.ok) {
        std::cerr << result.error.message() << "\n";
        return 1;
    }
    std::cout << json(result.value).dump(2) << "\n";
    return 0;
}

struct OneShot {
    Config config;
    bool loaded;
    LogSink sink;
    CliInvoker invoker;
    ProviderClient client;

    OneShot()
        : loaded(config.load()),
          invoker(sink, Config::expand_home(config.data().daemon_binary_path), {},
                  std::chrono::milliseconds(config.data().invoke_timeout_ms)),
          client(sink, invoker) {}
};

} // namespace

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return -1;  // no subcommand → JSON-lines bridge

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "bridge") == 0) {
        return -1;
    }
    if (std::strcmp(cmd, "run") == 0) {
        return -2;  // special: caller supervises in the foreground
    }
    if (std::strcmp(cmd, "gpus") == 0 || std::strcmp(cmd, "settings") == 0 ||
        std::strcmp(cmd, "jobs") == 0 || std::strcmp(cmd, "network") == 0 ||
        std::strcmp(cmd, "finance") == 0 || std::strcmp(cmd, "overview") == 0) {
        return cmd_query(cmd);
    }
    if (std::strcmp(cmd, "update-settings") == 0) {
        return cmd_update_settings(argc, argv);
    }
    if (std::strcmp(cmd, "set-gpu") == 0) {
        return cmd_set_gpu(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'dante-provider help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "dante-provider: supervisor shell for the GPU provider daemon\n"
        "\n"
        "Usage:\n"
        "  dante-provider                 JSON-lines bridge on stdin/stdout (default)\n"
        "  dante-provider bridge          Same as above\n"
        "  dante-provider run             Supervise the daemon in the foreground\n"
        "  dante-provider gpus            Print detected GPUs\n"
        "  dante-provider settings        Print provider settings\n"
        "  dante-provider update-settings <json>          Replace provider settings\n"
        "  dante-provider set-gpu <id> <rate> <true|false>  Set a GPU's rental config\n"
        "  dante-provider jobs            Print local jobs\n"
        "  dante-provider network         Print network status\n"
        "  dante-provider finance         Print financial summary\n"
        "  dante-provider overview        Print system overview\n"
        "  dante-provider version         Show version\n"
        "  dante-provider help            Show this help\n"
        "\n"
        "Configuration: " << Config::config_path() << "\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "dante-provider " << APP_VERSION << "\n";
    return 0;
}

// ── one-shot queries ────────────────────────────────────────

int CLI::cmd_query(const std::string& what) {
    OneShot shot;
    if (what == "gpus") return print_result(shot.client.get_gpus());
    if (what == "settings") return print_result(shot.client.get_settings());
    if (what == "jobs") return print_result(shot.client.get_local_jobs());
    if (what == "network") return print_result(shot.client.get_network_status());
    if (what == "finance") return print_result(shot.client.get_financial_summary());
    if (what == "overview") return print_result(shot.client.get_system_overview());
    std::cerr << "Unknown query: " << what << "\n";
    return 1;
}

int CLI::cmd_update_settings(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: dante-provider update-settings <json>\n";
        return 1;
    }

    ProviderSettings settings;
    try {
        settings = json::parse(argv[2]).get<ProviderSettings>();
    } catch (const json::exception& e) {
        std::cerr << "Invalid settings JSON: " << e.what() << "\n";
        return 1;
    }

    OneShot shot;
    return print_result(shot.client.update_settings(settings));
}

int CLI::cmd_set_gpu(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: dante-provider set-gpu <id> <rate> <true|false>\n";
        return 1;
    }

    float rate = 0.0f;
    try {
        size_t used = 0;
        rate = std::stof(argv[3], &used);
        if (used != std::strlen(argv[3])) throw std::invalid_argument("trailing characters");
    } catch (const std::exception&) {
        std::cerr << "Invalid rate: " << argv[3] << "\n";
        return 1;
    }

    bool available;
    if (std::strcmp(argv[4], "true") == 0) {
        available = true;
    } else if (std::strcmp(argv[4], "false") == 0) {
        available = false;
    } else {
        std::cerr << "Availability must be 'true' or 'false'\n";
        return 1;
    }

    OneShot shot;
    return print_result(shot.client.set_gpu_config(argv[2], rate, available));
}
