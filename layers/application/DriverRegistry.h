#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "DeviceDriver.h"

namespace application {

using DriverFactory = std::function<std::unique_ptr<DeviceDriver>(const DeviceDescriptor&)>;

class DriverRegistry {
public:
    // Later registrations under the same name replace earlier ones.
    void add(const std::string& typeName, DriverFactory factory);

    /**
     * Builds the driver for the descriptor and validates the descriptor
     * against it. Throws ConfigError for an unknown type name or a
     * descriptor the driver rejects.
     */
    std::unique_ptr<DeviceDriver> resolve(const DeviceDescriptor& descriptor) const;

    bool contains(const std::string& typeName) const;
    std::vector<std::string> names() const;

private:
    std::map<std::string, DriverFactory> factories_;
};

DriverRegistry makeDefaultRegistry();

} // namespace application
