#include "protocol_layer.h"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace protocol {

namespace {

constexpr std::size_t kMbapHeaderSize = 6;   // transaction(2) + protocol(2) + length(2)
constexpr std::size_t kMaxTcpLength = 254;   // unit id + PDU

bool isReadFunction(std::uint8_t function) {
    return function == static_cast<std::uint8_t>(FunctionCode::ReadHoldingRegisters) ||
           function == static_cast<std::uint8_t>(FunctionCode::ReadInputRegisters);
}

} // namespace

std::vector<std::uint8_t> ProtocolHandler::createFrame(const ModbusRequest& request, FrameMode mode) const {
    auto pdu = createPdu(request);

    if (mode == FrameMode::Rtu) {
        auto frame = pdu;
        const auto crc = crc16(frame);
        frame.push_back(static_cast<std::uint8_t>(crc & 0xFF));
        frame.push_back(static_cast<std::uint8_t>((crc >> 8) & 0xFF));
        return frame;
    }

    std::vector<std::uint8_t> frame;
    frame.reserve(kMbapHeaderSize + pdu.size());
    frame.push_back(static_cast<std::uint8_t>((request.transactionId >> 8) & 0xFF));
    frame.push_back(static_cast<std::uint8_t>(request.transactionId & 0xFF));
    frame.push_back(0x00);
    frame.push_back(0x00);
    const auto length = static_cast<std::uint16_t>(pdu.size());
    frame.push_back(static_cast<std::uint8_t>((length >> 8) & 0xFF));
    frame.push_back(static_cast<std::uint8_t>(length & 0xFF));
    frame.insert(frame.end(), pdu.begin(), pdu.end());
    return frame;
}

std::size_t ProtocolHandler::extractResponse(const std::vector<std::uint8_t>& buffer,
                                             FrameMode mode,
                                             ModbusResponse& out) const {
    if (mode == FrameMode::Tcp) {
        return extractTcp(buffer, out);
    }
    return extractRtu(buffer, out);
}

std::size_t ProtocolHandler::extractTcp(const std::vector<std::uint8_t>& buffer, ModbusResponse& out) const {
    if (buffer.size() < kMbapHeaderSize) {
        return 0;
    }

    const auto protocolId = static_cast<std::uint16_t>((buffer[2] << 8) | buffer[3]);
    const auto len = static_cast<std::size_t>((buffer[4] << 8) | buffer[5]);
    if (protocolId != 0 || len < 2 || len > kMaxTcpLength) {
        return kFrameCorrupt;
    }
    if (buffer.size() < kMbapHeaderSize + len) {
        return 0;
    }

    std::vector<std::uint8_t> pdu(buffer.begin() + kMbapHeaderSize,
                                  buffer.begin() + static_cast<std::ptrdiff_t>(kMbapHeaderSize + len));
    try {
        out = parsePdu(pdu);
    } catch (const std::exception&) {
        return kFrameCorrupt;
    }
    out.transactionId = static_cast<std::uint16_t>((buffer[0] << 8) | buffer[1]);
    return kMbapHeaderSize + len;
}

std::size_t ProtocolHandler::extractRtu(const std::vector<std::uint8_t>& buffer, ModbusResponse& out) const {
    if (buffer.size() < 5) {
        return 0;
    }

    const std::uint8_t function = buffer[1];

    std::size_t frameLen = 0;
    if ((function & 0x80U) != 0U) {
        frameLen = 5; // slave + exception function + code + crc(2)
    } else if (isReadFunction(function)) {
        const std::size_t byteCount = buffer[2];
        if (byteCount == 0 || byteCount > 2 * kMaxRegistersPerRead) {
            return kFrameCorrupt;
        }
        frameLen = 3 + byteCount + 2; // slave + func + byteCount + data + crc(2)
    } else {
        return kFrameCorrupt;
    }

    if (buffer.size() < frameLen) {
        return 0;
    }

    const auto expected = static_cast<std::uint16_t>((buffer[frameLen - 1] << 8) | buffer[frameLen - 2]);
    const auto actual = crc16(buffer.data(), frameLen - 2);
    if (actual != expected) {
        return kFrameCorrupt;
    }

    std::vector<std::uint8_t> pdu(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(frameLen - 2));
    try {
        out = parsePdu(pdu);
    } catch (const std::exception&) {
        return kFrameCorrupt;
    }
    return frameLen;
}

std::uint16_t ProtocolHandler::crc16(const std::vector<std::uint8_t>& data) {
    return crc16(data.data(), data.size());
}

std::uint16_t ProtocolHandler::crc16(const std::uint8_t* data, std::size_t length) {
    std::uint16_t crc = 0xFFFF;
    for (std::size_t n = 0; n < length; ++n) {
        crc ^= data[n];
        for (int i = 0; i < 8; ++i) {
            if ((crc & 0x01U) != 0U) {
                crc >>= 1;
                crc ^= 0xA001;
            } else {
                crc >>= 1;
            }
        }
    }
    return crc;
}

FunctionCode ProtocolHandler::functionFor(RegisterKind kind) noexcept {
    return kind == RegisterKind::Input ? FunctionCode::ReadInputRegisters : FunctionCode::ReadHoldingRegisters;
}

std::vector<std::uint8_t> ProtocolHandler::createPdu(const ModbusRequest& request) const {
    std::vector<std::uint8_t> pdu;
    pdu.reserve(6);
    pdu.push_back(request.slaveId);
    pdu.push_back(static_cast<std::uint8_t>(request.function));

    pdu.push_back(static_cast<std::uint8_t>((request.startAddress >> 8) & 0xFF));
    pdu.push_back(static_cast<std::uint8_t>(request.startAddress & 0xFF));

    pdu.push_back(static_cast<std::uint8_t>((request.count >> 8) & 0xFF));
    pdu.push_back(static_cast<std::uint8_t>(request.count & 0xFF));
    return pdu;
}

ModbusResponse ProtocolHandler::parsePdu(const std::vector<std::uint8_t>& pdu) const {
    if (pdu.size() < 2) {
        throw std::runtime_error("PDU too short");
    }

    ModbusResponse response;
    response.slaveId = pdu[0];
    response.function = pdu[1];

    const auto func = pdu[1];
    if ((func & 0x80U) != 0U) {
        response.isException = true;
        response.function = static_cast<std::uint8_t>(func & 0x7FU);
        response.exceptionCode = pdu.size() > 2 ? pdu[2] : 0;
        return response;
    }

    if (!isReadFunction(func)) {
        throw std::runtime_error("Unexpected function code " + std::to_string(func));
    }
    if (pdu.size() < 3) {
        throw std::runtime_error("Read response without byte count");
    }

    const std::size_t byteCount = pdu[2];
    if ((byteCount % 2) != 0 || pdu.size() < 3 + byteCount) {
        throw std::runtime_error("Byte count does not match payload");
    }

    response.values.reserve(byteCount / 2);
    for (std::size_t i = 0; i + 1 < byteCount; i += 2) {
        response.values.push_back(static_cast<std::uint16_t>((pdu[3 + i] << 8) | pdu[3 + i + 1]));
    }

    return response;
}

} // namespace protocol
