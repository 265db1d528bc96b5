#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

enum class OutputStream { Stdout, Stderr };

struct ExitInfo {
    std::optional<int> exit_code;    // absent when killed by a signal
    std::optional<int> signal;
};

struct ProcessEvent {
    enum class Kind { OutputLine, ExecutionError, Terminated };

    Kind kind = Kind::OutputLine;
    OutputStream stream = OutputStream::Stdout;  // OutputLine only
    std::string text;                            // line, or error message
    ExitInfo exit;                               // Terminated only

    static ProcessEvent output(OutputStream stream, std::string line);
    static ProcessEvent error(std::string message);
    static ProcessEvent terminated(ExitInfo exit);
};

/// Ordered event stream of one process instance.
class EventSource {
public:
    virtual ~EventSource() = default;

    /// Blocks for the next event; std::nullopt once the stream has ended
    virtual std::optional<ProcessEvent> next_event() = 0;
};

/// Process-wide generation counter; every spawned instance draws one token
uint64_t next_instance_token();

/// A supervised child as seen by DaemonSupervisor.
class ChildProcess : public EventSource {
public:
    /// Unique per spawn within this process
    virtual uint64_t instance() const = 0;
    virtual pid_t pid() const = 0;

    /// SIGTERM now; SIGKILL if still running after grace (0 = never)
    virtual bool terminate(std::chrono::milliseconds grace, std::string& err) = 0;

    /// SIGKILL now
    virtual bool kill(std::string& err) = 0;
};

/// Exclusive owner of one spawned child process and its output pipes.
///
/// stdout/stderr are read line by line through next_event(), which must
/// only be called from a single reader thread. terminate()/kill() may be
/// called from any thread.
class ProcessHandle : public ChildProcess {
public:
    struct SpawnOutcome {
        std::shared_ptr<ProcessHandle> handle;   // null on failure
        std::string error;
    };

    /// fork/execvp binary with args; stdin is /dev/null.
    /// A missing or non-executable binary fails here, not as exit 127.
    static SpawnOutcome spawn(const std::string& binary_path,
                              const std::vector<std::string>& args = {});

    ~ProcessHandle() override;

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    uint64_t instance() const override { return instance_; }
    pid_t pid() const override { return pid_; }

    bool terminate(std::chrono::milliseconds grace, std::string& err) override;
    bool kill(std::string& err) override;

    /// SIGKILL once timeout elapses, without sending SIGTERM first
    void kill_after(std::chrono::milliseconds timeout);

    /// True if a kill deadline fired
    bool deadline_expired() const { return deadline_fired_.load(); }

    bool has_exited() const { return reaped_.load(); }

    std::optional<ProcessEvent> next_event() override;

private:
    ProcessHandle(pid_t pid, int stdout_fd, int stderr_fd);

    bool send_signal(int sig, std::string& err);
    bool try_reap();
    void read_stream(int& fd, std::string& buffer, OutputStream stream);
    void flush_partial(std::string& buffer, OutputStream stream);
    void enforce_deadline();
    void finish();

    const uint64_t instance_;
    const pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    std::string stdout_buf_;
    std::string stderr_buf_;

    std::deque<ProcessEvent> pending_;
    ExitInfo exit_;
    bool finished_ = false;          // no further events after pending_
    bool lost_exit_ = false;         // waitpid failed; no Terminated event

    std::mutex pid_mutex_;           // orders reaping against signal delivery
    std::atomic<bool> reaped_{false};
    std::atomic<int64_t> kill_deadline_ns_{0};
    std::atomic<bool> deadline_fired_{false};
};
