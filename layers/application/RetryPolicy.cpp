#include "RetryPolicy.h"

#include <thread>

#include "errors.h"
#include "layers/logging/logging_layer.h"

namespace application {

SleepFunction threadSleep() {
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

RetryPolicy::RetryPolicy(RetrySettings settings, SleepFunction sleep, logging::LogSink& log)
    : settings_(settings), sleep_(std::move(sleep)), log_(log) {
    if (settings_.maxAttempts < 1) {
        throw ConfigError("retries must be at least 1, got " + std::to_string(settings_.maxAttempts));
    }
    if (settings_.backoff.count() < 0) {
        throw ConfigError("retry_delay must not be negative");
    }
    if (!sleep_) {
        sleep_ = threadSleep();
    }
}

ReadOutcome RetryPolicy::execute(const ReadFunction& read, EscalationPolicy escalation, const std::string& context) const {
    ReadOutcome outcome;
    RetryState state{0, settings_.maxAttempts, settings_.backoff};

    while (state.attempt < state.maxAttempts) {
        ++state.attempt;
        outcome.attempts = state.attempt;

        protocol::ReadResult result = read();
        if (result.success) {
            outcome.success = true;
            outcome.block = std::move(result.values);
            outcome.lastError.clear();
            return outcome;
        }

        outcome.lastError = result.error;
        log_.warn(context + ": attempt " + std::to_string(state.attempt) + "/" + std::to_string(state.maxAttempts)
            + " failed: " + result.error);

        if (state.attempt < state.maxAttempts && state.backoff.count() > 0) {
            sleep_(state.backoff);
        }
    }

    if (escalation == EscalationPolicy::HardFail) {
        throw ExhaustedRetriesError(context, outcome.attempts, outcome.lastError);
    }

    log_.error(context + ": giving up after " + std::to_string(outcome.attempts) + " attempt(s)");
    return outcome;
}

} // namespace application
