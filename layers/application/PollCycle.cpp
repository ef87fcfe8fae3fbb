#include "PollCycle.h"

#include <sstream>

#include "layers/logging/logging_layer.h"

namespace application {

PollCycle::PollCycle(const DeviceDescriptor& descriptor,
                     const DeviceDriver& driver,
                     const protocol::TransportReader& reader,
                     const RetryPolicy& retry,
                     SleepFunction sleep,
                     const CancellationToken& token,
                     logging::LogSink& log)
    : descriptor_(descriptor),
      driver_(driver),
      reader_(reader),
      retry_(retry),
      sleep_(std::move(sleep)),
      token_(token),
      log_(log),
      escalation_(descriptor.escalation.value_or(driver.defaultEscalation())),
      pacingDelay_(descriptor.pacingDelay.value_or(driver.defaultPacingDelay())) {
    if (!sleep_) {
        sleep_ = threadSleep();
    }
}

PollCycleResult PollCycle::run() const {
    PollCycleResult result;
    result.reserve(descriptor_.unitIds.size());

    bool first = true;
    for (const int unitId : descriptor_.unitIds) {
        if (!first && pacingDelay_.count() > 0) {
            sleep_(pacingDelay_);
        }
        first = false;

        if (token_.stopRequested()) {
            log_.info("Stop requested, " + std::to_string(descriptor_.unitIds.size() - result.size())
                + " unit(s) left unread in this cycle");
            break;
        }
        result.push_back(pollUnit(unitId));
    }
    return result;
}

DecodedRecord PollCycle::pollUnit(int unitId) const {
    const ReadTarget target = driver_.readTarget(descriptor_, unitId);
    const std::string context = driver_.typeName() + " unit " + std::to_string(unitId);

    const ReadOutcome outcome = retry_.execute(
        [this, &target]() { return reader_.readBlock(target.address, target.count, target.unitId); },
        escalation_,
        context);

    DecodedRecord record = outcome.success
        ? driver_.decode(unitId, outcome.block)
        : driver_.errorRecord(unitId, RecordStatus::DeviceError, outcome.lastError);

    if (record.status == RecordStatus::DecodeError) {
        log_.error(context + ": decode failed: " + record.detail);
    }
    echo(record, outcome.block);
    return record;
}

void PollCycle::echo(const DecodedRecord& record, const protocol::RawBlock& block) const {
    log_.info("Device " + std::to_string(record.unitId) + " [" + statusToString(record.status) + "]");
    for (const auto& line : driver_.displayLines(record)) {
        log_.info("  " + line);
    }

    if (!block.empty() && log_.minimumLevel() == logging::Level::Debug) {
        std::ostringstream raw;
        raw << "  raw:";
        for (const auto value : block) {
            raw << ' ' << value;
        }
        log_.debug(raw.str());
    }
}

} // namespace application
