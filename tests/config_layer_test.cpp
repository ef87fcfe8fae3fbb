#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "layers/application/errors.h"
#include "layers/config/config_layer.h"

namespace {

const char* const kSerialConfig = R"({
  "modbus":  { "type": "serial", "port": "/dev/ttyS0", "baudrate": 19200,
               "timeout": 0.2, "stopbits": 1, "bytesize": 8, "parity": "N" },
  "device":  { "name": "DCM_3366", "start_addr": 0, "reg_count": 40, "id_range": [1, 8] },
  "logging": { "base_folder": "/tmp/dc_meter", "log_retention_days": 30,
               "file_suffix": "dc_meter_log",
               "header": ["Datetime", "Device_ID", "Forward_energy_kWh", "Active_power_kW",
                          "Current_A", "Voltage_V", "Error"],
               "time_step": 2 }
})";

const char* const kTcpConfig = R"({
  "modbus":  { "type": "TCP", "host": "192.168.1.50", "port": 1502, "timeout": 1,
               "retries": 5, "retry_delay": 0.5 },
  "device":  { "name": "MultiInverterStation", "start_addr": 4000, "reg_count": 40,
               "id_list": [4, 2, 9], "register_type": "input", "station_unit_id": 3,
               "pacing_delay": 0.25, "escalation": "soft" },
  "logging": { "base_folder": "/tmp/station", "log_retention_days": 0, "file_suffix": "inv",
               "header": [], "time_step": 0.5, "disk_usage_paths": ["/", "/mnt/data"] }
})";

bool hasErrorContaining(const std::vector<std::string>& errors, const std::string& text) {
    return std::any_of(errors.begin(), errors.end(),
        [&text](const std::string& e) { return e.find(text) != std::string::npos; });
}

TEST(ConfigLayerTest, ParsesSerialConfiguration) {
    config::LoggerConfig cfg;
    std::vector<std::string> errors;
    ASSERT_TRUE(config::parseConfig(kSerialConfig, cfg, errors)) << (errors.empty() ? "" : errors.front());

    EXPECT_EQ(cfg.transport.type, transport::ConnectionType::Rtu);
    EXPECT_EQ(cfg.transport.serial.port, "/dev/ttyS0");
    EXPECT_EQ(cfg.transport.serial.baudRate, 19200U);
    EXPECT_EQ(cfg.transport.serial.parity, 'N');
    EXPECT_EQ(cfg.transport.serial.dataBits, 8);
    EXPECT_EQ(cfg.transport.serial.timeout, std::chrono::milliseconds(200));

    EXPECT_EQ(cfg.device.typeName, "DCM_3366");
    EXPECT_EQ(cfg.device.registerCount, 40);
    EXPECT_EQ(cfg.device.unitIds, (std::vector<int>{1, 2, 3, 4, 5, 6, 7, 8}));
    EXPECT_EQ(cfg.device.registerKind, protocol::RegisterKind::Holding);
    EXPECT_FALSE(cfg.device.escalation.has_value());
    EXPECT_FALSE(cfg.device.pacingDelay.has_value());

    EXPECT_EQ(cfg.retry.maxAttempts, 3);
    EXPECT_EQ(cfg.retry.backoff, std::chrono::milliseconds(1000));

    EXPECT_EQ(cfg.logging.header.size(), 7U);
    EXPECT_EQ(cfg.logging.cycleInterval, std::chrono::milliseconds(2000));
    EXPECT_EQ(cfg.logging.diskUsagePaths, (std::vector<std::string>{"/"}));
}

TEST(ConfigLayerTest, ParsesTcpConfigurationWithOptionalKeys) {
    config::LoggerConfig cfg;
    std::vector<std::string> errors;
    ASSERT_TRUE(config::parseConfig(kTcpConfig, cfg, errors)) << (errors.empty() ? "" : errors.front());

    EXPECT_EQ(cfg.transport.type, transport::ConnectionType::Tcp);
    EXPECT_EQ(cfg.transport.tcp.host, "192.168.1.50");
    EXPECT_EQ(cfg.transport.tcp.port, 1502);
    EXPECT_EQ(cfg.transport.tcp.timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(cfg.retry.maxAttempts, 5);
    EXPECT_EQ(cfg.retry.backoff, std::chrono::milliseconds(500));

    EXPECT_EQ(cfg.device.unitIds, (std::vector<int>{4, 2, 9}));
    EXPECT_EQ(cfg.device.registerKind, protocol::RegisterKind::Input);
    EXPECT_EQ(cfg.device.stationUnitId, 3);
    EXPECT_EQ(cfg.device.pacingDelay, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.device.escalation, application::EscalationPolicy::SoftFail);

    EXPECT_TRUE(cfg.logging.header.empty());
    EXPECT_EQ(cfg.logging.retentionDays, 0);
    EXPECT_EQ(cfg.logging.cycleInterval, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.logging.diskUsagePaths.size(), 2U);
}

TEST(ConfigLayerTest, SingleElementRangeIsOneUnit) {
    std::string text = kSerialConfig;
    text.replace(text.find("[1, 8]"), 6, "[5]");

    config::LoggerConfig cfg;
    std::vector<std::string> errors;
    ASSERT_TRUE(config::parseConfig(text, cfg, errors));
    EXPECT_EQ(cfg.device.unitIds, (std::vector<int>{5}));
}

TEST(ConfigLayerTest, LongRangeIsExplicitUnitList) {
    std::string text = kSerialConfig;
    text.replace(text.find("[1, 8]"), 6, "[7, 3, 5]");

    config::LoggerConfig cfg;
    std::vector<std::string> errors;
    ASSERT_TRUE(config::parseConfig(text, cfg, errors)) << (errors.empty() ? "" : errors.front());
    EXPECT_EQ(cfg.device.unitIds, (std::vector<int>{7, 3, 5}));
}

TEST(ConfigLayerTest, LongRangeChecksEveryUnitId) {
    std::string text = kSerialConfig;
    text.replace(text.find("[1, 8]"), 6, "[1, 2, 300]");

    config::LoggerConfig cfg;
    std::vector<std::string> errors;
    EXPECT_FALSE(config::parseConfig(text, cfg, errors));
    EXPECT_TRUE(hasErrorContaining(errors, "device.id_range"));
}

TEST(ConfigLayerTest, CollectsEveryProblem) {
    const char* const text = R"({
      "modbus":  { "type": "serial", "port": "/dev/ttyS0", "baudrate": 9600,
                   "stopbits": 3, "bytesize": 8, "parity": "X" },
      "device":  { "name": "EnergyMeter", "start_addr": 0, "reg_count": 200, "id_range": [8, 1] },
      "logging": { "base_folder": "/tmp/x", "log_retention_days": -1, "file_suffix": "x",
                   "header": ["a", 1], "time_step": 0 }
    })";

    config::LoggerConfig cfg;
    std::vector<std::string> errors;
    EXPECT_FALSE(config::parseConfig(text, cfg, errors));

    EXPECT_TRUE(hasErrorContaining(errors, "modbus.timeout: is required"));
    EXPECT_TRUE(hasErrorContaining(errors, "modbus.stopbits"));
    EXPECT_TRUE(hasErrorContaining(errors, "modbus.parity"));
    EXPECT_TRUE(hasErrorContaining(errors, "device.reg_count"));
    EXPECT_TRUE(hasErrorContaining(errors, "device.id_range"));
    EXPECT_TRUE(hasErrorContaining(errors, "logging.log_retention_days"));
    EXPECT_TRUE(hasErrorContaining(errors, "logging.header"));
    EXPECT_TRUE(hasErrorContaining(errors, "logging.time_step"));
    EXPECT_EQ(errors.size(), 8U);
}

TEST(ConfigLayerTest, RejectsUnknownConnectionType) {
    std::string text = kSerialConfig;
    text.replace(text.find("\"serial\""), 8, "\"usb\"");

    config::LoggerConfig cfg;
    std::vector<std::string> errors;
    EXPECT_FALSE(config::parseConfig(text, cfg, errors));
    EXPECT_TRUE(hasErrorContaining(errors, "modbus.type"));
}

TEST(ConfigLayerTest, TcpRequiresHostAndPort) {
    const char* const text = R"({
      "modbus":  { "type": "tcp", "timeout": 1 },
      "device":  { "name": "WeatherStation", "start_addr": 0, "reg_count": 7, "id_range": [1] },
      "logging": { "base_folder": "/tmp/w", "log_retention_days": 7, "file_suffix": "w",
                   "header": [], "time_step": 60 }
    })";

    config::LoggerConfig cfg;
    std::vector<std::string> errors;
    EXPECT_FALSE(config::parseConfig(text, cfg, errors));
    EXPECT_TRUE(hasErrorContaining(errors, "modbus.host: is required"));
    EXPECT_TRUE(hasErrorContaining(errors, "modbus.port: is required"));
}

TEST(ConfigLayerTest, MissingSectionsAndBadJson) {
    config::LoggerConfig cfg;
    std::vector<std::string> errors;
    EXPECT_FALSE(config::parseConfig("{}", cfg, errors));
    EXPECT_EQ(errors.size(), 3U);

    errors.clear();
    EXPECT_FALSE(config::parseConfig("{ \"modbus\": ", cfg, errors));
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_NE(errors[0].find("Invalid JSON"), std::string::npos);
}

TEST(ConfigLayerTest, LoadConfigThrowsConfigError) {
    EXPECT_THROW(config::loadConfig("/nonexistent/modbus_logger.json"), application::ConfigError);

    const auto path = std::filesystem::temp_directory_path() / "modbus_logger_config_test.json";
    {
        std::ofstream out(path);
        out << kSerialConfig;
    }
    const auto cfg = config::loadConfig(path.string());
    EXPECT_EQ(cfg.device.typeName, "DCM_3366");
    std::filesystem::remove(path);
}

} // namespace
