#include "DeviceDriver.h"

#include "errors.h"
#include "core/protocol/RegisterDecoder.h"

namespace application {

const char* escalationToString(EscalationPolicy policy) noexcept {
    return policy == EscalationPolicy::HardFail ? "hard" : "soft";
}

bool DeviceDriver::validate(const DeviceDescriptor& descriptor, std::string& error) const {
    if (descriptor.registerCount < minimumRegisters()) {
        error = typeName() + " needs at least " + std::to_string(minimumRegisters()) + " registers, reg_count is "
            + std::to_string(descriptor.registerCount);
        return false;
    }
    if (descriptor.registerCount > protocol::kMaxRegistersPerRead) {
        error = "reg_count " + std::to_string(descriptor.registerCount) + " exceeds the per-request maximum of "
            + std::to_string(protocol::kMaxRegistersPerRead);
        return false;
    }
    if (static_cast<std::uint32_t>(descriptor.startAddress) + descriptor.registerCount > 0x10000U) {
        error = "start_addr + reg_count exceeds the 16-bit register space";
        return false;
    }
    for (const int unitId : descriptor.unitIds) {
        if (unitId < 0 || unitId > 255) {
            error = "Unit id " + std::to_string(unitId) + " outside 0..255";
            return false;
        }
    }
    return true;
}

ReadTarget DeviceDriver::readTarget(const DeviceDescriptor& descriptor, int unitId) const {
    return {descriptor.startAddress, descriptor.registerCount, static_cast<std::uint8_t>(unitId)};
}

DecodedRecord DeviceDriver::decode(int unitId, const protocol::RawBlock& block) const {
    if (!protocol::requireRegisters(block, minimumRegisters())) {
        return errorRecord(unitId, RecordStatus::DecodeError,
            "Block has " + std::to_string(block.size()) + " registers, " + std::to_string(minimumRegisters()) + " required");
    }

    std::vector<std::optional<FieldValue>> values;
    try {
        values = decodeFields(block);
    } catch (const DecodeError& e) {
        return errorRecord(unitId, RecordStatus::DecodeError, e.what());
    }

    const auto& names = fieldNames();
    if (values.size() != names.size()) {
        return errorRecord(unitId, RecordStatus::DecodeError,
            "Decoder produced " + std::to_string(values.size()) + " values for " + std::to_string(names.size()) + " fields");
    }

    DecodedRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.unitId = unitId;
    record.status = RecordStatus::Ok;
    record.fields.reserve(names.size());
    for (std::size_t i = 0; i < names.size(); ++i) {
        record.fields.push_back({names[i], std::move(values[i])});
    }
    return record;
}

DecodedRecord DeviceDriver::errorRecord(int unitId, RecordStatus status, const std::string& detail) const {
    DecodedRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.unitId = unitId;
    record.status = status;
    record.detail = detail;

    const auto& names = fieldNames();
    record.fields.reserve(names.size());
    for (const auto& name : names) {
        record.fields.push_back({name, std::nullopt});
    }
    return record;
}

std::vector<std::string> DeviceDriver::displayLines(const DecodedRecord& record) const {
    std::vector<std::string> lines;
    lines.reserve(record.fields.size());
    for (const auto& field : record.fields) {
        const auto text = formatValue(field.value);
        lines.push_back(field.name + ": " + (text.empty() ? "None" : text));
    }
    return lines;
}

} // namespace application
