#pragma once
#include <vector>
#include <cstdint>

namespace protocol {

enum class FunctionCode : std::uint8_t
{
    ReadHoldingRegisters = 0x03,
    ReadInputRegisters = 0x04
};

enum class FrameMode
{
    Tcp,    // MBAP header + PDU
    Rtu     // slave id + PDU + CRC16
};

struct ModbusRequest
{
    std::uint8_t  slaveId = 1;
    FunctionCode  function = FunctionCode::ReadHoldingRegisters;
    std::uint16_t startAddress = 0;
    std::uint16_t count = 0;
    std::uint16_t transactionId = 0;   // TCP only
};

struct ModbusResponse
{
    std::uint8_t  slaveId = 0;
    std::uint8_t  function = 0;
    std::uint16_t transactionId = 0;   // TCP only
    std::vector<std::uint16_t> values;
    bool          isException = false;
    std::uint8_t  exceptionCode = 0;
};

} // namespace protocol
