#include "EnergyMeterDriver.h"

#include "core/protocol/RegisterDecoder.h"

namespace application {

namespace {

constexpr std::size_t kForwardEnergy = 0;
constexpr std::size_t kActivePower = 20;
constexpr std::size_t kCurrent = 22;
constexpr std::size_t kVoltage = 24;

std::optional<FieldValue> scaled32(const protocol::RawBlock& block, std::size_t offset, double divisor, int precision) {
    const auto raw = static_cast<std::int64_t>(protocol::bigEndian32(block[offset], block[offset + 1]));
    return protocol::scaledValue(raw, divisor, precision);
}

} // namespace

EnergyMeterDriver::EnergyMeterDriver()
    : fields_{"Forward_energy_kWh", "Active_power_kW", "Current_A", "Voltage_V"} {}

std::vector<std::optional<FieldValue>> EnergyMeterDriver::decodeFields(const protocol::RawBlock& block) const {
    return {
        scaled32(block, kForwardEnergy, 100.0, 3),
        scaled32(block, kActivePower, 1000.0, 3),
        scaled32(block, kCurrent, 10000.0, 4),
        scaled32(block, kVoltage, 10000.0, 1),
    };
}

std::vector<std::string> EnergyMeterDriver::displayLines(const DecodedRecord& record) const {
    static const char* const labels[] = {
        "Forward energy (kWh)", "Active power (kW)", "Current (A)", "Voltage (V)"};

    std::vector<std::string> lines;
    for (std::size_t i = 0; i < record.fields.size() && i < 4; ++i) {
        const auto text = formatValue(record.fields[i].value);
        lines.push_back(std::string(labels[i]) + ": " + (text.empty() ? "None" : text));
    }
    return lines;
}

} // namespace application
