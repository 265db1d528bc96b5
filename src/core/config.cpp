#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/dante-provider";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/dante-provider";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::vector<std::string> Config::daemon_args() const {
    std::vector<std::string> args;
    if (!config_.daemon_config_path.empty()) {
        args.push_back("--config");
        args.push_back(expand_home(config_.daemon_config_path));
    }
    args.insert(args.end(), config_.daemon_extra_args.begin(), config_.daemon_extra_args.end());
    return args;
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Daemon section
        if (auto daemon = root["daemon"]) {
            config_.daemon_binary_path = daemon["binary_path"].as<std::string>(config_.daemon_binary_path);
            config_.daemon_config_path = daemon["config_path"].as<std::string>(config_.daemon_config_path);
            config_.stop_timeout_ms = daemon["stop_timeout_ms"].as<int>(config_.stop_timeout_ms);
            if (auto extra = daemon["extra_args"]) {
                config_.daemon_extra_args.clear();
                for (const auto& arg : extra) {
                    config_.daemon_extra_args.push_back(arg.as<std::string>());
                }
            }
        }

        // Invoker section
        if (auto invoker = root["invoker"]) {
            config_.invoke_timeout_ms = invoker["timeout_ms"].as<int>(config_.invoke_timeout_ms);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            config_.log_level = logging["level"].as<std::string>(config_.log_level);
            config_.log_file = logging["file"].as<std::string>(config_.log_file);
        }

        return true;
    } catch (const YAML::Exception&) {
        // Parse failed, use defaults
        return false;
    }
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    try {
        fs::create_directories(dir);

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Daemon section
        out << YAML::Key << "daemon" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "binary_path" << YAML::Value << config_.daemon_binary_path;
        out << YAML::Key << "config_path" << YAML::Value << config_.daemon_config_path;
        out << YAML::Key << "stop_timeout_ms" << YAML::Value << config_.stop_timeout_ms;
        out << YAML::Key << "extra_args" << YAML::Value << YAML::BeginSeq;
        for (const auto& arg : config_.daemon_extra_args) {
            out << arg;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;

        // Invoker section
        out << YAML::Key << "invoker" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "timeout_ms" << YAML::Value << config_.invoke_timeout_ms;
        out << YAML::EndMap;

        // Logging section
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.log_level;
        out << YAML::Key << "file" << YAML::Value << config_.log_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
