#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "CancellationToken.h"
#include "OutputSink.h"
#include "PollCycle.h"
#include "core/protocol/TransportReader.h"
#include "core/transport/IModbusTransport.h"

namespace application {

struct SchedulerSettings {
    std::chrono::milliseconds cycleInterval{2000};
    // Granularity at which a stop request interrupts the wait.
    std::chrono::milliseconds waitSlice{100};
};

using BoundaryHook = std::function<void()>;

/**
 * Fixed-interval polling loop. Owns the transport and closes it exactly
 * once, whichever way runForever() ends.
 */
class PollScheduler {
public:
    PollScheduler(std::unique_ptr<transport::IModbusTransport> transport,
                  const DeviceDescriptor& descriptor,
                  const DeviceDriver& driver,
                  const RetryPolicy& retry,
                  OutputSink& sink,
                  const CancellationToken& token,
                  logging::LogSink& log,
                  SleepFunction sleep,
                  SchedulerSettings settings);
    ~PollScheduler();

    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    // Runs before every wait: log rotation, disk usage.
    void setBoundaryHook(BoundaryHook hook) { boundaryHook_ = std::move(hook); }

    // Returns ExitOk after a stop request, ExitEscalation after a hard-fail.
    int runForever();

    void close();
    bool closed() const noexcept { return closed_; }

    const PollCycle& cycle() const noexcept { return cycle_; }

private:
    bool interruptibleWait();
    void deliver(const PollCycleResult& result);

    std::unique_ptr<transport::IModbusTransport> transport_;
    protocol::TransportReader reader_;
    PollCycle cycle_;
    OutputSink& sink_;
    const CancellationToken& token_;
    logging::LogSink& log_;
    SleepFunction sleep_;
    SchedulerSettings settings_;
    BoundaryHook boundaryHook_;
    bool closed_ = false;
};

} // namespace application
