#pragma once

#include "daemon/daemon_status.hpp"
#include "daemon/process_handle.hpp"

#include <cstdint>
#include <memory>
#include <string>

class DaemonSupervisor;
class LogSink;

/// Final status after a Terminated event, given the status captured
/// before the event was applied.
DaemonStatus classify_exit(DaemonStatus previous, const ExitInfo& exit);

/// "Daemon terminated. Exit code: <n|killed by signal>[, signal: <s>]"
std::string describe_exit(const ExitInfo& exit);

/// Drains the event stream of one daemon instance into log records and
/// reports lifecycle events back to the supervisor, which ignores them
/// once a newer instance has replaced this one.
class EventPump {
public:
    EventPump(DaemonSupervisor& supervisor, LogSink& sink,
              std::shared_ptr<EventSource> source, uint64_t instance);

    /// Runs until Terminated has been handled or the stream ends
    void run();

private:
    DaemonSupervisor& supervisor_;
    LogSink& sink_;
    std::shared_ptr<EventSource> source_;
    uint64_t instance_;

    void handle_terminated(const ExitInfo& exit);
};
