#include "log/log_sink.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <deque>
#include <map>
#include <mutex>
#include <vector>

std::string category_name(LogCategory category) {
    switch (category) {
        case LogCategory::Status: return "status";
        case LogCategory::Stdout: return "stdout";
        case LogCategory::Stderr: return "stderr";
        case LogCategory::Error:  return "error";
    }
    return "status";
}

struct LogSink::Impl {
    std::mutex id_mutex;
    uint64_t last_id = 0;

    std::mutex sub_mutex;
    std::map<int, Subscriber> subscribers;
    int next_token = 1;

    // Records waiting for delivery, in id order. Whichever emit() finds
    // no delivery in progress drains the queue; callbacks run unlocked.
    std::mutex queue_mutex;
    std::deque<LogRecord> queue;
    bool delivering = false;
};

LogSink::LogSink() : impl_(std::make_unique<Impl>()) {}

LogSink::~LogSink() = default;

int LogSink::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(impl_->sub_mutex);
    int token = impl_->next_token++;
    impl_->subscribers.emplace(token, std::move(subscriber));
    return token;
}

void LogSink::unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(impl_->sub_mutex);
    impl_->subscribers.erase(token);
}

uint64_t LogSink::next_id() {
    std::lock_guard<std::mutex> lock(impl_->id_mutex);
    return ++impl_->last_id;
}

void LogSink::publish(const LogRecord& record) {
    // Snapshot so callbacks run without the subscriber lock held
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(impl_->sub_mutex);
        targets.reserve(impl_->subscribers.size());
        for (const auto& entry : impl_->subscribers) {
            targets.push_back(entry.second);
        }
    }

    if (targets.empty()) {
        spdlog::debug("daemon_log #{} [{}] (no subscriber) {}",
                      record.id, category_name(record.category), record.message);
        return;
    }

    for (const auto& target : targets) {
        try {
            target(record);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to deliver daemon_log #{}: {}", record.id, e.what());
        } catch (...) {
            spdlog::warn("Failed to deliver daemon_log #{}: unknown exception", record.id);
        }
    }
}

LogRecord LogSink::emit(LogCategory category, const std::string& message) {
    LogRecord record;
    record.message = message;
    record.timestamp = now_rfc3339();
    record.category = category;
    {
        std::lock_guard<std::mutex> lock(impl_->queue_mutex);
        record.id = next_id();
        impl_->queue.push_back(record);
        if (impl_->delivering) {
            return record;
        }
        impl_->delivering = true;
    }

    while (true) {
        LogRecord next;
        {
            std::lock_guard<std::mutex> lock(impl_->queue_mutex);
            if (impl_->queue.empty()) {
                impl_->delivering = false;
                break;
            }
            next = std::move(impl_->queue.front());
            impl_->queue.pop_front();
        }
        publish(next);
    }
    return record;
}

std::string LogSink::now_rfc3339() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}
