#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "DecodedRecord.h"
#include "core/protocol/ModbusProtocol.h"

namespace application {

enum class EscalationPolicy {
    SoftFail,   // error row for the unit, cycle continues
    HardFail    // process stops, supervisor restarts it
};

const char* escalationToString(EscalationPolicy policy) noexcept;

struct DeviceDescriptor {
    std::string typeName;
    std::uint16_t startAddress = 0;
    std::uint16_t registerCount = 0;
    std::vector<int> unitIds;
    protocol::RegisterKind registerKind = protocol::RegisterKind::Holding;
    std::uint8_t stationUnitId = 1;
    std::optional<std::chrono::milliseconds> pacingDelay;
    std::optional<EscalationPolicy> escalation;
};

struct ReadTarget {
    std::uint16_t address = 0;
    std::uint16_t count = 0;
    std::uint8_t unitId = 1;
};

/**
 * Decoder for one instrument model.
 *
 * fieldNames() is fixed for the lifetime of the instance and every record
 * produced, including error records, carries exactly that many fields in
 * that order.
 */
class DeviceDriver {
public:
    virtual ~DeviceDriver() = default;

    virtual std::string typeName() const = 0;
    virtual const std::vector<std::string>& fieldNames() const = 0;
    virtual std::uint16_t minimumRegisters() const = 0;

    virtual EscalationPolicy defaultEscalation() const { return EscalationPolicy::SoftFail; }
    virtual std::chrono::milliseconds defaultPacingDelay() const { return std::chrono::milliseconds(0); }

    virtual bool validate(const DeviceDescriptor& descriptor, std::string& error) const;
    virtual ReadTarget readTarget(const DeviceDescriptor& descriptor, int unitId) const;

    DecodedRecord decode(int unitId, const protocol::RawBlock& block) const;
    DecodedRecord errorRecord(int unitId, RecordStatus status, const std::string& detail = {}) const;

    virtual std::vector<std::string> displayLines(const DecodedRecord& record) const;

protected:
    // Called with a block of at least minimumRegisters(); may throw DecodeError.
    virtual std::vector<std::optional<FieldValue>> decodeFields(const protocol::RawBlock& block) const = 0;
};

} // namespace application
