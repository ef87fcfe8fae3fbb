#pragma once

#include <string>

#include "core/protocol/ModbusProtocol.h"

namespace transport {

class IModbusTransport
{
public:
    virtual ~IModbusTransport() = default;

    virtual bool open(std::string& error) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual protocol::ReadResult readRegisters(const protocol::ReadRequest& request) = 0;

    virtual std::string describe() const = 0;
};

} // namespace transport
