#include "DriverRegistry.h"

#include "errors.h"
#include "drivers/EnergyMeterDriver.h"
#include "drivers/MultiInverterStationDriver.h"
#include "drivers/RegisterDumpDriver.h"
#include "drivers/TemperatureLoggerDriver.h"
#include "drivers/WeatherStationDriver.h"

namespace application {

namespace {

template <typename Driver>
DriverFactory plainFactory() {
    return [](const DeviceDescriptor&) { return std::make_unique<Driver>(); };
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) {
            out += ", ";
        }
        out += name;
    }
    return out;
}

} // namespace

void DriverRegistry::add(const std::string& typeName, DriverFactory factory) {
    factories_[typeName] = std::move(factory);
}

std::unique_ptr<DeviceDriver> DriverRegistry::resolve(const DeviceDescriptor& descriptor) const {
    const auto it = factories_.find(descriptor.typeName);
    if (it == factories_.end()) {
        throw ConfigError("Unknown device type '" + descriptor.typeName + "', known types: " + joinNames(names()));
    }

    auto driver = it->second(descriptor);
    if (!driver) {
        throw ConfigError("No driver produced for device type '" + descriptor.typeName + "'");
    }

    std::string error;
    if (!driver->validate(descriptor, error)) {
        throw ConfigError("Device '" + descriptor.typeName + "': " + error);
    }
    return driver;
}

bool DriverRegistry::contains(const std::string& typeName) const {
    return factories_.count(typeName) != 0;
}

std::vector<std::string> DriverRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& entry : factories_) {
        out.push_back(entry.first);
    }
    return out;
}

DriverRegistry makeDefaultRegistry() {
    DriverRegistry registry;
    registry.add("EnergyMeter", plainFactory<EnergyMeterDriver>());
    registry.add("DCM_3366", plainFactory<EnergyMeterDriver>());
    registry.add("TemperatureLogger", plainFactory<TemperatureLoggerDriver>());
    registry.add("tp_700", plainFactory<TemperatureLoggerDriver>());
    registry.add("MultiInverterStation", plainFactory<MultiInverterStationDriver>());
    registry.add("WeatherStation", plainFactory<WeatherStationDriver>());
    registry.add("RegisterDump", [](const DeviceDescriptor& descriptor) {
        return std::make_unique<RegisterDumpDriver>(descriptor.startAddress, descriptor.registerCount);
    });
    return registry;
}

} // namespace application
