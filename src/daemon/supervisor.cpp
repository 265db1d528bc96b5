#include "daemon/supervisor.hpp"
#include "daemon/event_pump.hpp"
#include "log/log_sink.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

DaemonSupervisor::LaunchResult spawn_process(const std::string& binary,
                                             const std::vector<std::string>& args) {
    auto outcome = ProcessHandle::spawn(binary, args);
    return {outcome.handle, outcome.error};
}

// Grace period used at teardown when stop_timeout is "wait forever"
constexpr std::chrono::milliseconds SHUTDOWN_GRACE{5000};

} // namespace

DaemonSupervisor::DaemonSupervisor(LogSink& sink, SupervisorOptions options, Launcher launcher)
    : sink_(sink),
      options_(std::move(options)),
      launcher_(launcher ? std::move(launcher) : Launcher(spawn_process)) {}

DaemonSupervisor::~DaemonSupervisor() {
    std::shared_ptr<ChildProcess> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live = handle_;
        if (live) {
            set_status_locked(DaemonStatus::Stopping);
        }
    }

    if (live) {
        auto grace = options_.stop_timeout.count() > 0 ? options_.stop_timeout : SHUTDOWN_GRACE;
        std::string err;
        if (!live->terminate(grace, err)) {
            spdlog::warn("Shutdown: SIGTERM to daemon failed ({}), killing", err);
            if (!live->kill(err)) {
                spdlog::error("Shutdown: SIGKILL to daemon failed: {}", err);
            }
        }
    }

    wait_for_pumps();
}

// ── State ───────────────────────────────────────────────────

void DaemonSupervisor::set_status_locked(DaemonStatus next) {
    if (status_ != next) {
        spdlog::debug("Daemon status {} -> {}", status_name(status_), status_name(next));
    }
    status_ = next;
    status_cv_.notify_all();
}

bool DaemonSupervisor::is_current_locked(uint64_t instance) const {
    return handle_ && handle_->instance() == instance;
}

DaemonStatus DaemonSupervisor::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

pid_t DaemonSupervisor::daemon_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ ? handle_->pid() : -1;
}

bool DaemonSupervisor::wait_for(std::initializer_list<DaemonStatus> targets,
                                std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return status_cv_.wait_for(lock, timeout, [&]() {
        return std::find(targets.begin(), targets.end(), status_) != targets.end();
    });
}

// ── start / stop ────────────────────────────────────────────

SupervisorResult DaemonSupervisor::start() {
    std::shared_ptr<ChildProcess> previous;
    bool already_running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == DaemonStatus::Starting || status_ == DaemonStatus::Online) {
            already_running = true;
        } else {
            set_status_locked(DaemonStatus::Starting);
            previous = std::move(handle_);
        }
    }
    if (already_running) {
        std::string msg = "Daemon is already online or starting.";
        sink_.emit(LogCategory::Status, msg);
        return {true, msg};
    }
    sink_.emit(LogCategory::Status, "Attempting to start provider daemon...");

    // Never run two daemons: kill whatever the previous instance left behind
    if (previous) {
        sink_.emit(LogCategory::Status,
                   "Killing lingering daemon process (pid " + std::to_string(previous->pid()) +
                   ") before restart.");
        std::string err;
        if (!previous->kill(err)) {
            sink_.emit(LogCategory::Error, "Failed to kill lingering daemon process: " + err);
        }
    }

    auto launched = launcher_(options_.binary_path, options_.args);
    std::string name = fs::path(options_.binary_path).filename().string();

    if (!launched.process) {
        std::string msg = "Failed to spawn daemon '" + name + "': " + launched.error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // A stop() during the spawn has already settled the status
            if (status_ == DaemonStatus::Starting) {
                set_status_locked(DaemonStatus::Error);
            }
        }
        sink_.emit(LogCategory::Error, msg);
        return {false, msg};
    }

    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != DaemonStatus::Starting) {
            // stop() ran while we were spawning
            superseded = true;
        } else {
            handle_ = launched.process;
            set_status_locked(DaemonStatus::Online);
        }
    }

    if (superseded) {
        std::string err;
        if (!launched.process->kill(err)) {
            spdlog::warn("Could not kill superseded daemon (pid {}): {}", launched.process->pid(), err);
        }
        std::string msg = "Daemon start aborted by a concurrent stop request.";
        sink_.emit(LogCategory::Error, msg);
        launch_pump(launched.process);
        return {false, msg};
    }

    sink_.emit(LogCategory::Status,
               "Daemon process " + name + " started successfully (pid " +
               std::to_string(launched.process->pid()) + ").");
    launch_pump(launched.process);
    return {true, "Daemon started successfully and events are being monitored."};
}

SupervisorResult DaemonSupervisor::stop() {
    std::shared_ptr<ChildProcess> target;
    std::string msg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == DaemonStatus::Offline || status_ == DaemonStatus::Stopping) {
            msg = "Daemon is already offline or stopping.";
        } else if (!handle_) {
            // Status claims a daemon but none is held
            set_status_locked(DaemonStatus::Offline);
            msg = "No active daemon process found to stop.";
        } else {
            set_status_locked(DaemonStatus::Stopping);
            target = handle_;
        }
    }

    if (!target) {
        sink_.emit(LogCategory::Status, msg);
        return {true, msg};
    }

    sink_.emit(LogCategory::Status, "Attempting to stop daemon...");

    std::string err;
    if (!target->terminate(options_.stop_timeout, err)) {
        msg = "Failed to send termination signal to daemon: " + err + ". Marking as error.";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (handle_ == target) {
                handle_.reset();
                set_status_locked(DaemonStatus::Error);
            }
        }
        sink_.emit(LogCategory::Error, msg);
        return {false, msg};
    }

    sink_.emit(LogCategory::Status, "Daemon termination signal sent.");
    return {true, "Daemon stop signal sent successfully. Waiting for termination event."};
}

// ── Pump callbacks ──────────────────────────────────────────

void DaemonSupervisor::on_execution_error(uint64_t instance) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_current_locked(instance)) {
        set_status_locked(DaemonStatus::Error);
    }
}

std::optional<DaemonStatus> DaemonSupervisor::on_terminated(uint64_t instance, const ExitInfo& exit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_current_locked(instance)) {
        return std::nullopt;
    }
    DaemonStatus previous = status_;
    handle_.reset();
    set_status_locked(classify_exit(previous, exit));
    return previous;
}

bool DaemonSupervisor::on_stream_closed(uint64_t instance) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_current_locked(instance)) {
        return false;
    }
    handle_.reset();
    if (status_ == DaemonStatus::Starting || status_ == DaemonStatus::Online) {
        set_status_locked(DaemonStatus::Offline);
        return true;
    }
    return false;
}

// ── Pump threads ────────────────────────────────────────────

void DaemonSupervisor::reap_finished_pumps() {
    auto it = pumps_.begin();
    while (it != pumps_.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = pumps_.erase(it);
        } else {
            ++it;
        }
    }
}

void DaemonSupervisor::launch_pump(std::shared_ptr<ChildProcess> process) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    uint64_t instance = process->instance();
    auto pump = std::make_shared<EventPump>(*this, sink_, std::move(process), instance);

    std::lock_guard<std::mutex> lock(pumps_mutex_);
    reap_finished_pumps();
    PumpThread entry;
    entry.done = done;
    entry.thread = std::thread([pump, done]() {
        pump->run();
        done->store(true);
    });
    pumps_.push_back(std::move(entry));
}

void DaemonSupervisor::wait_for_pumps() {
    std::vector<PumpThread> pending;
    {
        std::lock_guard<std::mutex> lock(pumps_mutex_);
        pending.swap(pumps_);
    }
    for (auto& entry : pending) {
        if (entry.thread.joinable()) {
            entry.thread.join();
        }
    }
}
