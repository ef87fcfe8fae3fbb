#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "layers/application/DeviceDriver.h"
#include "layers/application/RetryPolicy.h"
#include "layers/transport/transport_layer.h"

namespace config {

struct TransportConfig {
    transport::ConnectionType type = transport::ConnectionType::Rtu;
    transport::TcpSettings tcp;
    transport::SerialSettings serial;
};

struct LoggingConfig {
    std::string baseFolder;
    int retentionDays = 30;
    std::string fileSuffix;
    std::vector<std::string> header;    // empty: generated from the driver
    std::chrono::milliseconds cycleInterval{2000};
    std::vector<std::string> diskUsagePaths{"/"};
};

struct LoggerConfig {
    TransportConfig transport;
    application::RetrySettings retry;
    application::DeviceDescriptor device;
    LoggingConfig logging;
};

/**
 * Parses and validates a configuration document. Every problem found is
 * appended to errors as "<key path>: <message>"; returns true when there
 * were none.
 */
bool parseConfig(const std::string& text, LoggerConfig& out, std::vector<std::string>& errors);
bool loadConfigFile(const std::string& path, LoggerConfig& out, std::vector<std::string>& errors);

// Throws application::ConfigError listing every problem.
LoggerConfig loadConfig(const std::string& path);

} // namespace config
