#include "config_layer.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

#include <boost/json.hpp>

#include "layers/application/errors.h"

namespace config {

namespace json = boost::json;

namespace {

std::string toLowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

// Collects messages under a key prefix ("modbus", "device", ...).
class Checker {
public:
    Checker(const json::object& obj, std::string section, std::vector<std::string>& errors)
        : obj_(obj), section_(std::move(section)), errors_(errors) {}

    void fail(const std::string& key, const std::string& message) {
        errors_.push_back(section_ + "." + key + ": " + message);
    }

    bool has(const char* key) const { return obj_.contains(key); }

    const json::value* find(const char* key, bool required) {
        const auto* value = obj_.if_contains(key);
        if (!value && required) {
            fail(key, "is required");
        }
        return value;
    }

    bool readString(const char* key, bool required, std::string& out) {
        const auto* value = find(key, required);
        if (!value) {
            return false;
        }
        if (!value->is_string()) {
            fail(key, "must be a string");
            return false;
        }
        out = std::string(value->as_string().c_str());
        return true;
    }

    bool readInteger(const char* key, bool required, std::int64_t minimum, std::int64_t maximum, std::int64_t& out) {
        const auto* value = find(key, required);
        if (!value) {
            return false;
        }
        if (!integerValue(*value, out)) {
            fail(key, "must be an integer");
            return false;
        }
        if (out < minimum || out > maximum) {
            fail(key, "must be in " + std::to_string(minimum) + ".." + std::to_string(maximum));
            return false;
        }
        return true;
    }

    // Seconds given as an integer or a real number.
    bool readSeconds(const char* key, bool required, bool allowZero, std::chrono::milliseconds& out) {
        const auto* value = find(key, required);
        if (!value) {
            return false;
        }
        double seconds = 0.0;
        if (value->is_double()) {
            seconds = value->as_double();
        } else if (value->is_int64()) {
            seconds = static_cast<double>(value->as_int64());
        } else if (value->is_uint64()) {
            seconds = static_cast<double>(value->as_uint64());
        } else {
            fail(key, "must be a number of seconds");
            return false;
        }
        if (!std::isfinite(seconds) || seconds < 0.0 || (!allowZero && seconds <= 0.0)) {
            fail(key, allowZero ? "must not be negative" : "must be greater than 0");
            return false;
        }
        out = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
        if (!allowZero && out.count() == 0) {
            out = std::chrono::milliseconds(1);
        }
        return true;
    }

    bool readStringArray(const char* key, bool required, std::vector<std::string>& out) {
        const auto* value = find(key, required);
        if (!value) {
            return false;
        }
        if (!value->is_array()) {
            fail(key, "must be an array of strings");
            return false;
        }
        std::vector<std::string> items;
        for (const auto& item : value->as_array()) {
            if (!item.is_string()) {
                fail(key, "must be an array of strings");
                return false;
            }
            items.emplace_back(item.as_string().c_str());
        }
        out = std::move(items);
        return true;
    }

    bool readIntegerArray(const char* key, std::vector<std::int64_t>& out) {
        const auto* value = find(key, false);
        if (!value) {
            return false;
        }
        if (!value->is_array()) {
            fail(key, "must be an array of integers");
            return false;
        }
        out.clear();
        for (const auto& item : value->as_array()) {
            std::int64_t number = 0;
            if (!integerValue(item, number)) {
                fail(key, "must be an array of integers");
                return false;
            }
            out.push_back(number);
        }
        return true;
    }

private:
    static bool integerValue(const json::value& value, std::int64_t& out) {
        if (value.is_int64()) {
            out = value.as_int64();
            return true;
        }
        if (value.is_uint64() && value.as_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            out = static_cast<std::int64_t>(value.as_uint64());
            return true;
        }
        return false;
    }

    const json::object& obj_;
    std::string section_;
    std::vector<std::string>& errors_;
};

const json::object* requireSection(const json::object& root, const char* name, std::vector<std::string>& errors) {
    const auto* value = root.if_contains(name);
    if (!value) {
        errors.push_back(std::string(name) + ": is required");
        return nullptr;
    }
    if (!value->is_object()) {
        errors.push_back(std::string(name) + ": must be an object");
        return nullptr;
    }
    return &value->as_object();
}

void parseModbus(const json::object& obj, LoggerConfig& out, std::vector<std::string>& errors) {
    Checker check(obj, "modbus", errors);

    std::chrono::milliseconds timeout{0};
    const bool haveTimeout = check.readSeconds("timeout", true, false, timeout);

    std::string type;
    if (check.readString("type", true, type)) {
        type = toLowerAscii(type);
        if (type == "tcp") {
            out.transport.type = transport::ConnectionType::Tcp;
            std::int64_t port = 0;
            check.readString("host", true, out.transport.tcp.host);
            if (check.readInteger("port", true, 1, 65535, port)) {
                out.transport.tcp.port = static_cast<std::uint16_t>(port);
            }
            if (haveTimeout) {
                out.transport.tcp.timeout = timeout;
            }
        } else if (type == "serial") {
            auto& serial = out.transport.serial;
            out.transport.type = transport::ConnectionType::Rtu;
            std::int64_t number = 0;
            check.readString("port", true, serial.port);
            if (check.readInteger("baudrate", true, 1, 4000000, number)) {
                serial.baudRate = static_cast<std::uint32_t>(number);
            }
            if (check.readInteger("stopbits", true, 1, 2, number)) {
                serial.stopBits = static_cast<std::uint8_t>(number);
            }
            if (check.readInteger("bytesize", true, 5, 8, number)) {
                serial.dataBits = static_cast<std::uint8_t>(number);
            }
            std::string parity;
            if (check.readString("parity", true, parity)) {
                if (parity.size() == 1 && (parity[0] == 'N' || parity[0] == 'E' || parity[0] == 'O')) {
                    serial.parity = parity[0];
                } else {
                    check.fail("parity", "must be one of N, E, O");
                }
            }
            if (haveTimeout) {
                serial.timeout = timeout;
            }
        } else {
            check.fail("type", "must be 'serial' or 'tcp', got '" + type + "'");
        }
    }

    std::int64_t retries = 0;
    if (check.readInteger("retries", false, 1, 100, retries)) {
        out.retry.maxAttempts = static_cast<int>(retries);
    }
    check.readSeconds("retry_delay", false, true, out.retry.backoff);
}

void parseUnitIds(Checker& check, application::DeviceDescriptor& device) {
    const bool hasRange = check.has("id_range");
    const bool hasList = check.has("id_list");
    if (hasRange && hasList) {
        check.fail("id_list", "cannot be combined with id_range");
        return;
    }
    if (!hasRange && !hasList) {
        check.fail("id_range", "is required");
        return;
    }

    std::vector<std::int64_t> ids;
    const char* key = hasRange ? "id_range" : "id_list";
    if (!check.readIntegerArray(key, ids)) {
        return;
    }
    if (ids.empty()) {
        check.fail(key, "must not be empty");
        return;
    }

    std::vector<int> unitIds;
    // Three or more id_range elements are the unit ids themselves, like id_list.
    if (hasRange && ids.size() <= 2) {
        const auto first = ids.front();
        const auto last = ids.back();
        if (first > last) {
            check.fail(key, "first id " + std::to_string(first) + " is greater than last id " + std::to_string(last));
            return;
        }
        if (first < 0 || last > 255) {
            check.fail(key, "unit ids must be in 0..255");
            return;
        }
        for (auto id = first; id <= last; ++id) {
            unitIds.push_back(static_cast<int>(id));
        }
    } else {
        for (const auto id : ids) {
            if (id < 0 || id > 255) {
                check.fail(key, "unit id " + std::to_string(id) + " outside 0..255");
                return;
            }
            unitIds.push_back(static_cast<int>(id));
        }
    }
    device.unitIds = std::move(unitIds);
}

void parseDevice(const json::object& obj, LoggerConfig& out, std::vector<std::string>& errors) {
    Checker check(obj, "device", errors);
    auto& device = out.device;

    check.readString("name", true, device.typeName);

    std::int64_t number = 0;
    if (check.readInteger("start_addr", true, 0, 65535, number)) {
        device.startAddress = static_cast<std::uint16_t>(number);
    }
    if (check.readInteger("reg_count", true, 1, protocol::kMaxRegistersPerRead, number)) {
        device.registerCount = static_cast<std::uint16_t>(number);
    }
    parseUnitIds(check, device);

    std::string registerType;
    if (check.readString("register_type", false, registerType)) {
        registerType = toLowerAscii(registerType);
        if (registerType == "holding") {
            device.registerKind = protocol::RegisterKind::Holding;
        } else if (registerType == "input") {
            device.registerKind = protocol::RegisterKind::Input;
        } else {
            check.fail("register_type", "must be 'holding' or 'input'");
        }
    }

    if (check.readInteger("station_unit_id", false, 0, 255, number)) {
        device.stationUnitId = static_cast<std::uint8_t>(number);
    }

    std::chrono::milliseconds pacing{0};
    if (check.readSeconds("pacing_delay", false, true, pacing)) {
        device.pacingDelay = pacing;
    }

    std::string escalation;
    if (check.readString("escalation", false, escalation)) {
        escalation = toLowerAscii(escalation);
        if (escalation == "soft") {
            device.escalation = application::EscalationPolicy::SoftFail;
        } else if (escalation == "hard") {
            device.escalation = application::EscalationPolicy::HardFail;
        } else {
            check.fail("escalation", "must be 'soft' or 'hard'");
        }
    }
}

void parseLogging(const json::object& obj, LoggerConfig& out, std::vector<std::string>& errors) {
    Checker check(obj, "logging", errors);
    auto& logging = out.logging;

    if (check.readString("base_folder", true, logging.baseFolder) && logging.baseFolder.empty()) {
        check.fail("base_folder", "must not be empty");
    }

    std::int64_t retention = 0;
    if (check.readInteger("log_retention_days", true, 0, 36500, retention)) {
        logging.retentionDays = static_cast<int>(retention);
    }

    if (check.readString("file_suffix", true, logging.fileSuffix) && logging.fileSuffix.empty()) {
        check.fail("file_suffix", "must not be empty");
    }

    check.readStringArray("header", true, logging.header);
    check.readSeconds("time_step", true, false, logging.cycleInterval);
    check.readStringArray("disk_usage_paths", false, logging.diskUsagePaths);
}

} // namespace

bool parseConfig(const std::string& text, LoggerConfig& out, std::vector<std::string>& errors) {
    const auto before = errors.size();

    boost::system::error_code ec;
    const json::value root = json::parse(text, ec);
    if (ec) {
        errors.push_back("Invalid JSON: " + ec.message());
        return false;
    }
    if (!root.is_object()) {
        errors.push_back("Configuration root must be an object");
        return false;
    }

    LoggerConfig parsed;
    const auto& obj = root.as_object();
    if (const auto* modbus = requireSection(obj, "modbus", errors)) {
        parseModbus(*modbus, parsed, errors);
    }
    if (const auto* device = requireSection(obj, "device", errors)) {
        parseDevice(*device, parsed, errors);
    }
    if (const auto* logging = requireSection(obj, "logging", errors)) {
        parseLogging(*logging, parsed, errors);
    }

    if (errors.size() != before) {
        return false;
    }
    out = std::move(parsed);
    return true;
}

bool loadConfigFile(const std::string& path, LoggerConfig& out, std::vector<std::string>& errors) {
    std::ifstream file(path);
    if (!file) {
        errors.push_back("Cannot open configuration file '" + path + "'");
        return false;
    }
    std::ostringstream text;
    text << file.rdbuf();
    return parseConfig(text.str(), out, errors);
}

LoggerConfig loadConfig(const std::string& path) {
    LoggerConfig config;
    std::vector<std::string> errors;
    if (!loadConfigFile(path, config, errors)) {
        std::string message = "Invalid configuration '" + path + "':";
        for (const auto& error : errors) {
            message += "\n  " + error;
        }
        throw application::ConfigError(message);
    }
    return config;
}

} // namespace config
