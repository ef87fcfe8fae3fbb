#pragma once

#include "layers/application/DeviceDriver.h"

namespace application {

class WeatherStationDriver final : public DeviceDriver {
public:
    WeatherStationDriver();

    std::string typeName() const override { return "WeatherStation"; }
    const std::vector<std::string>& fieldNames() const override { return fields_; }
    std::uint16_t minimumRegisters() const override { return 7; }

protected:
    std::vector<std::optional<FieldValue>> decodeFields(const protocol::RawBlock& block) const override;

private:
    std::vector<std::string> fields_;
};

} // namespace application
