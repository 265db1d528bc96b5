#include "daemon/event_pump.hpp"
#include "daemon/supervisor.hpp"
#include "log/log_sink.hpp"

#include <spdlog/spdlog.h>

DaemonStatus classify_exit(DaemonStatus previous, const ExitInfo& exit) {
    if (previous == DaemonStatus::Stopping) {
        return DaemonStatus::Offline;
    }
    if (!exit.exit_code || *exit.exit_code != 0) {
        return DaemonStatus::Error;
    }
    return DaemonStatus::Offline;
}

std::string describe_exit(const ExitInfo& exit) {
    std::string text = "Daemon terminated. Exit code: ";
    text += exit.exit_code ? std::to_string(*exit.exit_code) : "killed by signal";
    if (exit.signal) {
        text += ", signal: " + std::to_string(*exit.signal);
    }
    return text;
}

EventPump::EventPump(DaemonSupervisor& supervisor, LogSink& sink,
                     std::shared_ptr<EventSource> source, uint64_t instance)
    : supervisor_(supervisor), sink_(sink), source_(std::move(source)), instance_(instance) {}

void EventPump::run() {
    bool terminated = false;

    while (auto event = source_->next_event()) {
        switch (event->kind) {
            case ProcessEvent::Kind::OutputLine:
                sink_.emit(event->stream == OutputStream::Stdout ? LogCategory::Stdout
                                                                 : LogCategory::Stderr,
                           event->text);
                break;

            case ProcessEvent::Kind::ExecutionError:
                sink_.emit(LogCategory::Error, "Daemon execution error: " + event->text);
                supervisor_.on_execution_error(instance_);
                break;

            case ProcessEvent::Kind::Terminated:
                handle_terminated(event->exit);
                terminated = true;
                break;
        }
        if (terminated) break;
    }

    if (!terminated && supervisor_.on_stream_closed(instance_)) {
        sink_.emit(LogCategory::Error,
                   "Daemon event stream ended unexpectedly. Marking as offline.");
    }
}

void EventPump::handle_terminated(const ExitInfo& exit) {
    sink_.emit(LogCategory::Status, describe_exit(exit));

    auto previous = supervisor_.on_terminated(instance_, exit);
    if (!previous) {
        spdlog::debug("Instance {} terminated after being replaced; state untouched", instance_);
        return;
    }

    if (*previous == DaemonStatus::Stopping) {
        sink_.emit(LogCategory::Status, "Daemon stopped as expected.");
    } else if (exit.exit_code && *exit.exit_code != 0) {
        sink_.emit(LogCategory::Error,
                   "Daemon exited with non-zero status: " + std::to_string(*exit.exit_code));
    } else if (!exit.exit_code) {
        sink_.emit(LogCategory::Error, "Daemon terminated unexpectedly (e.g. by signal).");
    }
}
