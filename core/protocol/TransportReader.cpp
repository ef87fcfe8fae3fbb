#include "TransportReader.h"

#include <string>

namespace protocol {

TransportReader::TransportReader(transport::IModbusTransport& transport, RegisterKind kind)
    : m_transport(transport)
    , m_kind(kind)
{
}

ReadResult TransportReader::readBlock(std::uint16_t address, std::uint16_t count, std::uint8_t unitId) const
{
    if (count == 0 || count > kMaxRegistersPerRead) {
        return {false, "Register count " + std::to_string(count) + " outside 1.." + std::to_string(kMaxRegistersPerRead), false, 0, {}};
    }
    if (static_cast<std::uint32_t>(address) + count > 0x10000U) {
        return {false, "Register range exceeds the 16-bit address space", false, 0, {}};
    }

    ReadRequest request;
    request.address = address;
    request.count = count;
    request.unitId = unitId;
    request.kind = m_kind;

    ReadResult result = m_transport.readRegisters(request);
    if (!result.success) {
        if (result.error.empty()) {
            result.error = "Read failed";
        }
        return result;
    }

    if (result.isException) {
        result.success = false;
        result.error = "Modbus exception code " + std::to_string(result.exceptionCode);
        return result;
    }

    if (result.values.size() != count) {
        result.success = false;
        result.error = "Short response: expected " + std::to_string(count) + " registers, got "
            + std::to_string(result.values.size());
        result.values.clear();
        return result;
    }

    return result;
}

} // namespace protocol
