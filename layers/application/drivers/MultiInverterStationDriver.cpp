#include "MultiInverterStationDriver.h"

#include "core/protocol/RegisterDecoder.h"

namespace application {

namespace {

constexpr std::size_t kSerialOffset = 0;
constexpr std::size_t kSerialRegisters = 5;
constexpr std::size_t kStatusOffset = 5;
constexpr std::size_t kTodayOffset = 6;
constexpr std::size_t kTotalOffset = 8;
constexpr std::size_t kStringsOffset = 10;

} // namespace

MultiInverterStationDriver::MultiInverterStationDriver()
    : fields_{"Serial_number", "Status", "Today_production_Wh", "Total_production_kWh"} {
    for (std::size_t s = 1; s <= kStrings; ++s) {
        const auto prefix = "PV" + std::to_string(s) + "_";
        fields_.push_back(prefix + "Voltage_V");
        fields_.push_back(prefix + "Current_A");
        fields_.push_back(prefix + "Power_W");
    }
}

bool MultiInverterStationDriver::validate(const DeviceDescriptor& descriptor, std::string& error) const {
    if (!DeviceDriver::validate(descriptor, error)) {
        return false;
    }
    if (descriptor.registerCount > kStride) {
        error = "reg_count " + std::to_string(descriptor.registerCount) + " overlaps the next inverter, stride is "
            + std::to_string(kStride);
        return false;
    }

    for (const int index : descriptor.unitIds) {
        if (index < 1) {
            error = "Inverter index " + std::to_string(index) + " must be 1 or greater";
            return false;
        }
        const auto last = static_cast<std::uint32_t>(descriptor.startAddress)
            + static_cast<std::uint32_t>(kStride) * static_cast<std::uint32_t>(index - 1)
            + descriptor.registerCount;
        if (last > 0x10000U) {
            error = "Inverter index " + std::to_string(index) + " maps outside the 16-bit register space";
            return false;
        }
    }
    return true;
}

ReadTarget MultiInverterStationDriver::readTarget(const DeviceDescriptor& descriptor, int unitId) const {
    const auto address = descriptor.startAddress + kStride * (unitId - 1);
    return {static_cast<std::uint16_t>(address), descriptor.registerCount, descriptor.stationUnitId};
}

std::vector<std::optional<FieldValue>> MultiInverterStationDriver::decodeFields(const protocol::RawBlock& block) const {
    std::vector<std::optional<FieldValue>> values;
    values.reserve(fields_.size());

    values.emplace_back(protocol::packedIdentifier(block, kSerialOffset, kSerialRegisters));
    values.emplace_back(static_cast<std::int64_t>(block[kStatusOffset]));
    values.emplace_back(static_cast<std::int64_t>(protocol::bigEndian32(block[kTodayOffset], block[kTodayOffset + 1])));
    values.emplace_back(static_cast<std::int64_t>(protocol::bigEndian32(block[kTotalOffset], block[kTotalOffset + 1])));

    for (std::size_t s = 0; s < kStrings; ++s) {
        const std::size_t base = kStringsOffset + s * 3;
        values.emplace_back(protocol::scaledValue(block[base], 10.0, 1));
        values.emplace_back(protocol::scaledValue(block[base + 1], 100.0, 2));
        values.emplace_back(protocol::scaledValue(block[base + 2], 10.0, 1));
    }
    return values;
}

} // namespace application
