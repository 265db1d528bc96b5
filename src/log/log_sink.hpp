#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

enum class LogCategory { Status, Stdout, Stderr, Error };

std::string category_name(LogCategory category);

struct LogRecord {
    uint64_t id = 0;
    std::string message;
    std::string timestamp;           // RFC3339, UTC
    LogCategory category = LogCategory::Status;
};

/// Sequenced log channel between the supervisor and the UI layer.
/// Ids start at 1 and increase strictly in emission order. Delivery is
/// best-effort: subscriber failures are reported through spdlog and
/// never reach the producer.
///
/// Records are queued and delivered in id order with no lock held while
/// a subscriber runs. The emit() that finds no delivery in progress
/// drains the queue, so a slow subscriber holds up only that producer;
/// the others enqueue and return. An emit() from inside a subscriber is
/// delivered after the current callback. Once every emit() call has
/// returned, every record has been delivered.
class LogSink {
public:
    using Subscriber = std::function<void(const LogRecord&)>;

    LogSink();
    ~LogSink();

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    /// Register a subscriber; returns a token for unsubscribe()
    int subscribe(Subscriber subscriber);
    void unsubscribe(int token);

    uint64_t next_id();

    /// Deliver a record to every current subscriber
    void publish(const LogRecord& record);

    /// next_id + timestamp, then queued for delivery; returns the record
    LogRecord emit(LogCategory category, const std::string& message);

    /// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
    static std::string now_rfc3339();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
