#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "CancellationToken.h"
#include "DriverRegistry.h"
#include "OutputSink.h"
#include "RetryPolicy.h"
#include "core/transport/IModbusTransport.h"
#include "layers/config/config_layer.h"

namespace logging {
class LogSink;
}

namespace application {

using TransportFactory =
    std::function<std::unique_ptr<transport::IModbusTransport>(const config::TransportConfig&)>;

// Serial -> RTU link, tcp -> TCP link.
TransportFactory defaultTransportFactory();

// Runs body; an exception escaping it is logged and mapped to its exit code.
int runReportingErrors(logging::LogSink& log, const std::function<int()>& body);

/**
 * Wires a validated configuration into a running logger: driver, header,
 * output sink, retry policy, transport and scheduler.
 */
class LoggerApplication {
public:
    LoggerApplication(config::LoggerConfig config, logging::LogSink& log, const CancellationToken& token);
    ~LoggerApplication();

    void setRegistry(DriverRegistry registry) { registry_ = std::move(registry); }
    void setTransportFactory(TransportFactory factory) { transportFactory_ = std::move(factory); }
    void setSleepFunction(SleepFunction sleep) { sleep_ = std::move(sleep); }
    void setOutputSink(std::unique_ptr<OutputSink> sink) { sink_ = std::move(sink); }

    // Resolves the driver and the output header. Throws ConfigError.
    void prepare();

    // Opens the transport and polls until stopped. Throws TransportError
    // when the initial connection fails, ConfigError if prepare() fails.
    int run();

    const DeviceDriver& driver() const;
    const std::vector<std::string>& header() const noexcept { return header_; }
    const config::LoggerConfig& configuration() const noexcept { return config_; }

private:
    void onCycleBoundary();

    config::LoggerConfig config_;
    logging::LogSink& log_;
    const CancellationToken& token_;
    DriverRegistry registry_;
    TransportFactory transportFactory_;
    SleepFunction sleep_;
    std::unique_ptr<DeviceDriver> driver_;
    std::vector<std::string> header_;
    std::unique_ptr<OutputSink> sink_;
    std::optional<RetryPolicy> retry_;
};

} // namespace application
