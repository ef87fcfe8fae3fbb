#include "PollScheduler.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "errors.h"
#include "layers/logging/logging_layer.h"

namespace application {

namespace {

std::string secondsText(std::chrono::milliseconds duration) {
    std::ostringstream out;
    out << static_cast<double>(duration.count()) / 1000.0;
    return out.str();
}

} // namespace

PollScheduler::PollScheduler(std::unique_ptr<transport::IModbusTransport> transport,
                             const DeviceDescriptor& descriptor,
                             const DeviceDriver& driver,
                             const RetryPolicy& retry,
                             OutputSink& sink,
                             const CancellationToken& token,
                             logging::LogSink& log,
                             SleepFunction sleep,
                             SchedulerSettings settings)
    : transport_(std::move(transport)),
      reader_(*transport_, descriptor.registerKind),
      cycle_(descriptor, driver, reader_, retry, sleep, token, log),
      sink_(sink),
      token_(token),
      log_(log),
      sleep_(sleep ? std::move(sleep) : threadSleep()),
      settings_(settings) {
    if (settings_.cycleInterval.count() <= 0) {
        throw ConfigError("time_step must be positive");
    }
    if (settings_.waitSlice.count() <= 0) {
        settings_.waitSlice = std::chrono::milliseconds(100);
    }
}

PollScheduler::~PollScheduler() {
    close();
}

int PollScheduler::runForever() {
    log_.info("Polling " + transport_->describe() + " every " + secondsText(settings_.cycleInterval) + " s");

    int exitCode = ExitOk;
    try {
        while (true) {
            if (boundaryHook_) {
                boundaryHook_();
            }

            log_.info("--- Waiting " + secondsText(settings_.cycleInterval) + " seconds before next read cycle ---");
            if (!interruptibleWait()) {
                break;
            }

            const PollCycleResult result = cycle_.run();
            if (!result.empty()) {
                deliver(result);
            }
            if (token_.stopRequested()) {
                log_.info("Stopped during a cycle after " + std::to_string(result.size()) + " record(s)");
                break;
            }
        }
        log_.info("Stopped by user. Closing connection...");
    } catch (const ExhaustedRetriesError& e) {
        log_.error(std::string("Escalating, stopping the logger: ") + e.what());
        exitCode = ExitEscalation;
    }

    close();
    try {
        sink_.flush();
    } catch (const std::exception& e) {
        log_.error(std::string("Flushing output failed: ") + e.what());
    }
    log_.flush();
    return exitCode;
}

void PollScheduler::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    transport_->close();
    log_.info("Modbus client closed.");
}

bool PollScheduler::interruptibleWait() {
    auto remaining = settings_.cycleInterval;
    while (remaining.count() > 0) {
        if (token_.stopRequested()) {
            return false;
        }
        const auto slice = std::min(remaining, settings_.waitSlice);
        sleep_(slice);
        remaining -= slice;
    }
    return !token_.stopRequested();
}

void PollScheduler::deliver(const PollCycleResult& result) {
    try {
        sink_.append(result);
        sink_.flush();
    } catch (const std::exception& e) {
        log_.error(std::string("Writing output failed: ") + e.what());
    }
}

} // namespace application
