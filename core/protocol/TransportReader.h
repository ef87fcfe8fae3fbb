#pragma once

#include "core/protocol/ModbusProtocol.h"
#include "core/transport/IModbusTransport.h"

namespace protocol {

class TransportReader
{
public:
    TransportReader(transport::IModbusTransport& transport, RegisterKind kind);

    // Fails on link errors, exception responses and blocks whose length differs from count.
    ReadResult readBlock(std::uint16_t address, std::uint16_t count, std::uint8_t unitId) const;

    RegisterKind registerKind() const noexcept { return m_kind; }

private:
    transport::IModbusTransport& m_transport;
    RegisterKind m_kind;
};

} // namespace protocol
