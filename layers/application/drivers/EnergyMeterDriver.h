#pragma once

#include "layers/application/DeviceDriver.h"

namespace application {

// DC energy meter (DCM-3366 register map), one block per unit id.
class EnergyMeterDriver final : public DeviceDriver {
public:
    EnergyMeterDriver();

    std::string typeName() const override { return "EnergyMeter"; }
    const std::vector<std::string>& fieldNames() const override { return fields_; }
    std::uint16_t minimumRegisters() const override { return 26; }

    std::vector<std::string> displayLines(const DecodedRecord& record) const override;

protected:
    std::vector<std::optional<FieldValue>> decodeFields(const protocol::RawBlock& block) const override;

private:
    std::vector<std::string> fields_;
};

} // namespace application
