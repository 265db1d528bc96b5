#pragma once

#include <string>
#include <vector>

struct AppConfig {
    // Provider daemon (long-running and one-shot modes share the binary)
    std::string daemon_binary_path = "/usr/local/bin/provider-daemon";
    std::string daemon_config_path;          // passed as --config when set
    std::vector<std::string> daemon_extra_args;
    int stop_timeout_ms = 5000;              // SIGKILL after this; 0 = wait forever

    // One-shot JSON invocations
    int invoke_timeout_ms = 30000;           // 0 = wait forever

    // Diagnostics
    std::string log_level = "info";
    std::string log_file;                    // empty = stderr only
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    /// Arguments for the long-running daemon: [--config <path>] + extra args
    std::vector<std::string> daemon_args() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
