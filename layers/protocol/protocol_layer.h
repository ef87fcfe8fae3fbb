#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "ModbusTypes.h"
#include "core/protocol/ModbusProtocol.h"

namespace protocol {

// Frame codec for the read requests the logger issues.
class ProtocolHandler {
public:
    // Returned by extractResponse when the head of the buffer cannot start a valid frame.
    static constexpr std::size_t kFrameCorrupt = std::numeric_limits<std::size_t>::max();

    ProtocolHandler() = default;

    // Full ADU with transport wrapper
    std::vector<std::uint8_t> createFrame(const ModbusRequest& request, FrameMode mode) const;

    // Consumed byte count; 0 while the frame is still incomplete.
    std::size_t extractResponse(const std::vector<std::uint8_t>& buffer, FrameMode mode, ModbusResponse& out) const;

    // Slave id + function + payload, no transport wrapper
    std::vector<std::uint8_t> createPdu(const ModbusRequest& request) const;
    ModbusResponse parsePdu(const std::vector<std::uint8_t>& pdu) const;

    static std::uint16_t crc16(const std::vector<std::uint8_t>& data);
    static std::uint16_t crc16(const std::uint8_t* data, std::size_t length);

    static FunctionCode functionFor(RegisterKind kind) noexcept;

private:
    std::size_t extractTcp(const std::vector<std::uint8_t>& buffer, ModbusResponse& out) const;
    std::size_t extractRtu(const std::vector<std::uint8_t>& buffer, ModbusResponse& out) const;
};

} // namespace protocol
