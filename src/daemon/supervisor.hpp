#pragma once

#include "daemon/daemon_status.hpp"
#include "daemon/process_handle.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class LogSink;

struct SupervisorResult {
    bool ok = false;
    std::string message;
};

struct SupervisorOptions {
    std::string binary_path;
    std::vector<std::string> args;
    std::chrono::milliseconds stop_timeout{5000};   // 0 = wait for the daemon indefinitely
};

/// Owns the provider daemon's lifecycle and the authoritative DaemonStatus.
///
/// start()/stop()/status() are safe to call from any thread. The status
/// lock is never held across a spawn, a signal or a wait. Each spawned
/// instance gets its own EventPump thread; pumps of replaced instances
/// keep logging but can no longer change status or the stored handle.
class DaemonSupervisor {
public:
    struct LaunchResult {
        std::shared_ptr<ChildProcess> process;   // null on failure
        std::string error;
    };
    using Launcher = std::function<LaunchResult(const std::string& binary,
                                                const std::vector<std::string>& args)>;

    /// launcher defaults to ProcessHandle::spawn
    DaemonSupervisor(LogSink& sink, SupervisorOptions options, Launcher launcher = {});

    /// Terminates a live daemon and joins every pump thread
    ~DaemonSupervisor();

    DaemonSupervisor(const DaemonSupervisor&) = delete;
    DaemonSupervisor& operator=(const DaemonSupervisor&) = delete;

    /// Spawn the daemon. No-op (ok) when already starting or online.
    /// Returns once spawned; "online" does not mean the daemon is ready.
    SupervisorResult start();

    /// Ask the daemon to exit. No-op (ok) when offline or stopping.
    /// Returns once the signal is sent; the pump finalizes the status.
    SupervisorResult stop();

    DaemonStatus status() const;

    /// pid of the current instance, -1 when none
    pid_t daemon_pid() const;

    /// Block until status is one of targets; false on timeout
    bool wait_for(std::initializer_list<DaemonStatus> targets,
                  std::chrono::milliseconds timeout) const;

    /// Join every pump thread whose process has ended or is ending
    void wait_for_pumps();

private:
    friend class EventPump;

    // Called from pump threads; no effect unless instance is current.
    void on_execution_error(uint64_t instance);
    std::optional<DaemonStatus> on_terminated(uint64_t instance, const ExitInfo& exit);
    bool on_stream_closed(uint64_t instance);

    void set_status_locked(DaemonStatus next);
    bool is_current_locked(uint64_t instance) const;
    void launch_pump(std::shared_ptr<ChildProcess> process);
    void reap_finished_pumps();

    LogSink& sink_;
    SupervisorOptions options_;
    Launcher launcher_;

    mutable std::mutex mutex_;
    mutable std::condition_variable status_cv_;
    DaemonStatus status_ = DaemonStatus::Offline;
    std::shared_ptr<ChildProcess> handle_;

    struct PumpThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex pumps_mutex_;
    std::vector<PumpThread> pumps_;
};
