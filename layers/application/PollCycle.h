#pragma once

#include <chrono>

#include "CancellationToken.h"
#include "DeviceDriver.h"
#include "RetryPolicy.h"
#include "core/protocol/TransportReader.h"

namespace logging {
class LogSink;
}

namespace application {

/**
 * One pass over the configured unit ids, strictly in declared order.
 * Only one read is in flight at a time.
 */
class PollCycle {
public:
    PollCycle(const DeviceDescriptor& descriptor,
              const DeviceDriver& driver,
              const protocol::TransportReader& reader,
              const RetryPolicy& retry,
              SleepFunction sleep,
              const CancellationToken& token,
              logging::LogSink& log);

    // Throws ExhaustedRetriesError on hard-fail exhaustion.
    PollCycleResult run() const;

    EscalationPolicy escalation() const noexcept { return escalation_; }
    std::chrono::milliseconds pacingDelay() const noexcept { return pacingDelay_; }

private:
    DecodedRecord pollUnit(int unitId) const;
    void echo(const DecodedRecord& record, const protocol::RawBlock& block) const;

    const DeviceDescriptor& descriptor_;
    const DeviceDriver& driver_;
    const protocol::TransportReader& reader_;
    const RetryPolicy& retry_;
    SleepFunction sleep_;
    const CancellationToken& token_;
    logging::LogSink& log_;
    EscalationPolicy escalation_;
    std::chrono::milliseconds pacingDelay_;
};

} // namespace application
