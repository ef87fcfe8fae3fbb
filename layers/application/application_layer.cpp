#include "application_layer.h"

#include "PollScheduler.h"
#include "errors.h"
#include "layers/logging/logging_layer.h"
#include "layers/output/output_layer.h"
#include "layers/transport/transport_layer.h"

namespace application {

TransportFactory defaultTransportFactory() {
    return [](const config::TransportConfig& cfg) -> std::unique_ptr<transport::IModbusTransport> {
        if (cfg.type == transport::ConnectionType::Tcp) {
            return transport::makeTcpTransport(cfg.tcp);
        }
        return transport::makeSerialTransport(cfg.serial);
    };
}

LoggerApplication::LoggerApplication(config::LoggerConfig config, logging::LogSink& log, const CancellationToken& token)
    : config_(std::move(config)),
      log_(log),
      token_(token),
      registry_(makeDefaultRegistry()),
      transportFactory_(defaultTransportFactory()),
      sleep_(threadSleep()) {}

LoggerApplication::~LoggerApplication() = default;

void LoggerApplication::prepare() {
    driver_ = registry_.resolve(config_.device);

    const auto& fields = driver_->fieldNames();
    if (config_.logging.header.empty()) {
        header_ = output::defaultHeader(fields);
    } else if (config_.logging.header.size() != fields.size() + kMetadataColumns) {
        throw ConfigError("logging.header has " + std::to_string(config_.logging.header.size()) + " columns, "
            + driver_->typeName() + " produces " + std::to_string(fields.size() + kMetadataColumns));
    } else {
        header_ = config_.logging.header;
    }

    retry_.emplace(config_.retry, sleep_, log_);

    if (!sink_) {
        sink_ = std::make_unique<output::CsvOutputSink>(
            config_.logging.baseFolder, config_.logging.fileSuffix, header_, log_);
    }

    const auto escalation = config_.device.escalation.value_or(driver_->defaultEscalation());
    log_.info("Device " + driver_->typeName() + ": " + std::to_string(config_.device.unitIds.size()) + " unit(s), "
        + std::to_string(config_.device.registerCount) + " " + protocol::registerKindToString(config_.device.registerKind)
        + " registers from " + std::to_string(config_.device.startAddress) + ", " + escalationToString(escalation)
        + "-fail, " + std::to_string(config_.retry.maxAttempts) + " attempt(s)");
}

const DeviceDriver& LoggerApplication::driver() const {
    if (!driver_) {
        throw std::logic_error("LoggerApplication::prepare() has not run");
    }
    return *driver_;
}

int LoggerApplication::run() {
    if (!driver_) {
        prepare();
    }

    auto link = transportFactory_(config_.transport);
    if (!link) {
        throw TransportError("No transport for the configured connection type");
    }

    std::string error;
    if (!link->open(error)) {
        throw TransportError("Failed to connect to Modbus device " + link->describe() + ": " + error);
    }
    log_.info("Connected to Modbus device " + link->describe());

    SchedulerSettings settings;
    settings.cycleInterval = config_.logging.cycleInterval;

    PollScheduler scheduler(std::move(link), config_.device, *driver_, *retry_, *sink_, token_, log_, sleep_, settings);
    scheduler.setBoundaryHook([this]() { onCycleBoundary(); });
    return scheduler.runForever();
}

void LoggerApplication::onCycleBoundary() {
    log_.rotateIfNeeded();
    for (const auto& path : config_.logging.diskUsagePaths) {
        log_.reportDiskUsage(path);
    }
}

int runReportingErrors(logging::LogSink& log, const std::function<int()>& body) {
    try {
        return body();
    } catch (const ConfigError& e) {
        log.error(e.what());
        return ExitConfigError;
    } catch (const TransportError& e) {
        log.error(e.what());
        return ExitConnectionFailure;
    } catch (const std::exception& e) {
        log.error(std::string("Unexpected error: ") + e.what());
        log.flush();
        return ExitUnexpectedError;
    }
}

} // namespace application
