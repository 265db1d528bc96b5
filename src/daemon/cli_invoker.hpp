#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

class LogSink;

struct InvokeError {
    enum class Kind { SpawnFailed, InvocationFailed, MalformedResponse };

    Kind kind = Kind::SpawnFailed;
    std::vector<std::string> args;
    std::optional<int> exit_code;    // InvocationFailed; absent if signalled
    std::optional<int> signal;
    // Captured output as lines joined by '\n': line text is kept as
    // written, but a trailing newline and any "\r" before a newline
    // are dropped
    std::string stdout_text;
    std::string stderr_text;
    std::string detail;              // OS error, parse error or timeout note

    std::string kind_name() const;
    /// Full diagnostic line, as written to the error log record
    std::string message() const;
};

template <typename T>
struct InvokeResult {
    bool ok = false;
    T value{};
    std::string raw_stdout;
    InvokeError error;
};

/// Runs the provider daemon once in a JSON mode and parses what it prints.
///
/// Each call leaves an audit trail in the LogSink: a status record before
/// dispatch, then either the raw response (stdout) or the failure (error).
class CliInvoker {
public:
    /// timeout of 0 waits for the child indefinitely
    CliInvoker(LogSink& sink, std::string binary_path,
               std::vector<std::string> base_args = {},
               std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /// Run with args appended to the base arguments; stdout parsed as JSON
    InvokeResult<nlohmann::json> invoke_json(const std::vector<std::string>& args) const;

    /// invoke_json, then convert with from_json; conversion failures are
    /// reported as MalformedResponse
    template <typename T>
    InvokeResult<T> invoke(const std::vector<std::string>& args) const {
        InvokeResult<T> result;
        auto raw = invoke_json(args);
        result.raw_stdout = raw.raw_stdout;
        if (!raw.ok) {
            result.error = std::move(raw.error);
            return result;
        }
        try {
            result.value = raw.value.template get<T>();
            result.ok = true;
        } catch (const std::exception& e) {
            result.error.kind = InvokeError::Kind::MalformedResponse;
            result.error.args = args;
            result.error.exit_code = 0;
            result.error.stdout_text = raw.raw_stdout;
            result.error.detail = e.what();
            report_failure(result.error);
        }
        return result;
    }

    const std::string& binary_path() const { return binary_path_; }

    /// ["--a", "b"] rendering used in log records
    static std::string format_args(const std::vector<std::string>& args);

private:
    LogSink& sink_;
    std::string binary_path_;
    std::vector<std::string> base_args_;
    std::chrono::milliseconds timeout_;

    void report_failure(const InvokeError& error) const;
};
