#pragma once

#include "layers/application/DeviceDriver.h"

namespace application {

// 24-channel temperature logger (TP-700), one IEEE-754 float per register pair.
class TemperatureLoggerDriver final : public DeviceDriver {
public:
    static constexpr std::size_t kChannels = 24;

    TemperatureLoggerDriver();

    std::string typeName() const override { return "TemperatureLogger"; }
    const std::vector<std::string>& fieldNames() const override { return fields_; }
    std::uint16_t minimumRegisters() const override { return static_cast<std::uint16_t>(kChannels * 2); }

protected:
    std::vector<std::optional<FieldValue>> decodeFields(const protocol::RawBlock& block) const override;

private:
    std::vector<std::string> fields_;
};

} // namespace application
