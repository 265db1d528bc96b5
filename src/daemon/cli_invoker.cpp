#include "daemon/cli_invoker.hpp"
#include "daemon/process_handle.hpp"
#include "log/log_sink.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void append_line(std::string& out, const std::string& line) {
    if (!out.empty()) out += '\n';
    out += line;
}

} // namespace

std::string InvokeError::kind_name() const {
    switch (kind) {
        case Kind::SpawnFailed:       return "SpawnFailed";
        case Kind::InvocationFailed:  return "InvocationFailed";
        case Kind::MalformedResponse: return "MalformedResponse";
    }
    return "SpawnFailed";
}

std::string InvokeError::message() const {
    std::string argv = CliInvoker::format_args(args);
    switch (kind) {
        case Kind::SpawnFailed:
            return "Failed to execute daemon command " + argv + ": " + detail;
        case Kind::InvocationFailed: {
            std::string status = exit_code ? "exit code " + std::to_string(*exit_code)
                                           : "no exit code";
            if (signal) status += ", signal " + std::to_string(*signal);
            std::string text = "Daemon command " + argv + " failed with status " + status;
            if (!detail.empty()) text += " (" + detail + ")";
            return text + ": stderr: '" + stderr_text + "', stdout: '" + stdout_text + "'";
        }
        case Kind::MalformedResponse:
            return "Failed to parse JSON from daemon for " + argv + ": " + detail +
                   ". Output: '" + stdout_text + "'";
    }
    return detail;
}

CliInvoker::CliInvoker(LogSink& sink, std::string binary_path,
                       std::vector<std::string> base_args,
                       std::chrono::milliseconds timeout)
    : sink_(sink),
      binary_path_(std::move(binary_path)),
      base_args_(std::move(base_args)),
      timeout_(timeout) {}

std::string CliInvoker::format_args(const std::vector<std::string>& args) {
    std::string out = "[";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ", ";
        out += json(args[i]).dump();
    }
    out += "]";
    return out;
}

void CliInvoker::report_failure(const InvokeError& error) const {
    std::string msg = error.message();
    spdlog::debug("{}: {}", error.kind_name(), msg);
    sink_.emit(LogCategory::Error, msg);
}

InvokeResult<json> CliInvoker::invoke_json(const std::vector<std::string>& args) const {
    InvokeResult<json> result;
    result.error.args = args;

    std::string name = fs::path(binary_path_).filename().string();
    sink_.emit(LogCategory::Status,
               "Invoking daemon: " + name + " with args " + format_args(args));

    std::vector<std::string> argv = base_args_;
    argv.insert(argv.end(), args.begin(), args.end());

    auto spawned = ProcessHandle::spawn(binary_path_, argv);
    if (!spawned.handle) {
        result.error.kind = InvokeError::Kind::SpawnFailed;
        result.error.detail = spawned.error;
        report_failure(result.error);
        return result;
    }

    auto& child = *spawned.handle;
    child.kill_after(timeout_);

    std::string out;
    std::string err;
    std::string exec_errors;
    bool terminated = false;
    ExitInfo exit;

    while (auto event = child.next_event()) {
        switch (event->kind) {
            case ProcessEvent::Kind::OutputLine:
                append_line(event->stream == OutputStream::Stdout ? out : err, event->text);
                break;
            case ProcessEvent::Kind::ExecutionError:
                append_line(exec_errors, event->text);
                break;
            case ProcessEvent::Kind::Terminated:
                terminated = true;
                exit = event->exit;
                break;
        }
    }

    result.raw_stdout = out;
    result.error.stdout_text = out;
    result.error.stderr_text = err;
    result.error.exit_code = exit.exit_code;
    result.error.signal = exit.signal;

    bool clean_exit = terminated && exit.exit_code && *exit.exit_code == 0;
    if (!clean_exit) {
        result.error.kind = InvokeError::Kind::InvocationFailed;
        if (child.deadline_expired()) {
            result.error.detail = "timed out after " + std::to_string(timeout_.count()) + " ms";
        } else if (!terminated) {
            result.error.detail = "exit status unavailable";
        }
        if (!exec_errors.empty()) {
            if (!result.error.detail.empty()) result.error.detail += "; ";
            result.error.detail += exec_errors;
        }
        report_failure(result.error);
        return result;
    }

    sink_.emit(LogCategory::Stdout,
               "Daemon response for " + format_args(args) + ": " + out);

    try {
        result.value = json::parse(out);
        result.ok = true;
    } catch (const json::parse_error& e) {
        result.error.kind = InvokeError::Kind::MalformedResponse;
        result.error.detail = e.what();
        report_failure(result.error);
    }
    return result;
}
