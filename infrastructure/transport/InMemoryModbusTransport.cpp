#include "InMemoryModbusTransport.h"

namespace transport {

bool InMemoryModbusTransport::open(std::string& error)
{
    if (!m_openError.empty()) {
        error = m_openError;
        return false;
    }
    m_open = true;
    return true;
}

void InMemoryModbusTransport::close()
{
    m_open = false;
    ++m_closeCount;
}

protocol::ReadResult InMemoryModbusTransport::readRegisters(const protocol::ReadRequest& request)
{
    m_calls.push_back({request.unitId, request.address, request.count, request.kind});

    if (!m_script.empty()) {
        const ScriptedReply reply = m_script.front();
        m_script.pop_front();
        if (!reply.error.empty()) {
            return {false, reply.error, false, 0, {}};
        }
        if (reply.isException) {
            return {true, {}, true, reply.exceptionCode, {}};
        }
        protocol::ReadResult shortResult;
        shortResult.success = true;
        shortResult.values.assign(static_cast<std::size_t>(reply.shortCount), 0);
        return shortResult;
    }

    const auto offline = m_offline.find(request.unitId);
    if (offline != m_offline.end() && offline->second) {
        return {false, "Timed out waiting for unit " + std::to_string(request.unitId), false, 0, {}};
    }

    protocol::ReadResult result;
    result.success = true;
    result.values.reserve(request.count);
    for (std::uint16_t offset = 0; offset < request.count; ++offset) {
        const auto key = std::make_pair(request.unitId, static_cast<std::uint16_t>(request.address + offset));
        const auto it = m_registers.find(key);
        result.values.push_back(it == m_registers.end() ? 0 : it->second);
    }

    return result;
}

void InMemoryModbusTransport::setRegister(std::uint8_t unitId, std::uint16_t address, std::uint16_t value)
{
    m_registers[{unitId, address}] = value;
}

void InMemoryModbusTransport::setRegisters(std::uint8_t unitId, std::uint16_t address, const std::vector<std::uint16_t>& values)
{
    for (std::size_t offset = 0; offset < values.size(); ++offset) {
        setRegister(unitId, static_cast<std::uint16_t>(address + offset), values[offset]);
    }
}

void InMemoryModbusTransport::queueFailure(const std::string& error)
{
    m_script.push_back({error, false, 0, -1});
}

void InMemoryModbusTransport::queueException(std::uint8_t exceptionCode)
{
    m_script.push_back({{}, true, exceptionCode, -1});
}

void InMemoryModbusTransport::queueShortResponse(std::uint16_t count)
{
    m_script.push_back({{}, false, 0, static_cast<int>(count)});
}

void InMemoryModbusTransport::setUnitOffline(std::uint8_t unitId, bool offline)
{
    m_offline[unitId] = offline;
}

} // namespace transport
