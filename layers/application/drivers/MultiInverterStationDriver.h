#pragma once

#include "layers/application/DeviceDriver.h"

namespace application {

/**
 * Several logical inverters behind one TCP gateway.
 *
 * Every inverter occupies kStride registers in the gateway's map; the unit
 * id of the descriptor is the 1-based inverter index, the Modbus unit is
 * always DeviceDescriptor::stationUnitId.
 */
class MultiInverterStationDriver final : public DeviceDriver {
public:
    static constexpr std::uint16_t kStride = 40;
    static constexpr std::size_t kStrings = 4;

    MultiInverterStationDriver();

    std::string typeName() const override { return "MultiInverterStation"; }
    const std::vector<std::string>& fieldNames() const override { return fields_; }
    std::uint16_t minimumRegisters() const override { return 22; }

    EscalationPolicy defaultEscalation() const override { return EscalationPolicy::HardFail; }
    std::chrono::milliseconds defaultPacingDelay() const override { return std::chrono::milliseconds(200); }

    bool validate(const DeviceDescriptor& descriptor, std::string& error) const override;
    ReadTarget readTarget(const DeviceDescriptor& descriptor, int unitId) const override;

protected:
    std::vector<std::optional<FieldValue>> decodeFields(const protocol::RawBlock& block) const override;

private:
    std::vector<std::string> fields_;
};

} // namespace application
