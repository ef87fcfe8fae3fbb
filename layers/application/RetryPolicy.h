#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "DeviceDriver.h"
#include "core/protocol/ModbusProtocol.h"

namespace logging {
class LogSink;
}

namespace application {

struct RetrySettings {
    int maxAttempts = 3;
    std::chrono::milliseconds backoff{1000};
};

struct RetryState {
    int attempt = 0;
    int maxAttempts = 0;
    std::chrono::milliseconds backoff{0};
};

struct ReadOutcome {
    bool success = false;
    protocol::RawBlock block;
    std::string lastError;
    int attempts = 0;
};

using ReadFunction = std::function<protocol::ReadResult()>;
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

// Blocking sleep on the calling thread.
SleepFunction threadSleep();

/**
 * Bounded attempts with a constant backoff between them.
 *
 * Soft-fail exhaustion returns a failed outcome; hard-fail exhaustion throws
 * ExhaustedRetriesError. There is no sleep after the last attempt.
 */
class RetryPolicy {
public:
    // Throws ConfigError if maxAttempts < 1 or backoff is negative.
    RetryPolicy(RetrySettings settings, SleepFunction sleep, logging::LogSink& log);

    ReadOutcome execute(const ReadFunction& read, EscalationPolicy escalation, const std::string& context) const;

    const RetrySettings& settings() const noexcept { return settings_; }

private:
    RetrySettings settings_;
    SleepFunction sleep_;
    logging::LogSink& log_;
};

} // namespace application
