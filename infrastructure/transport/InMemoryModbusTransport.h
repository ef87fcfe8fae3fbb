#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/transport/IModbusTransport.h"

namespace transport {

/**
 * Register map held in memory, keyed by unit id and address.
 * Failures can be queued per request or forced for a unit, which makes
 * the retry and escalation paths reproducible without hardware.
 */
class InMemoryModbusTransport final : public IModbusTransport
{
public:
    struct ReadCall
    {
        std::uint8_t unitId = 0;
        std::uint16_t address = 0;
        std::uint16_t count = 0;
        protocol::RegisterKind kind = protocol::RegisterKind::Holding;
    };

    bool open(std::string& error) override;
    void close() override;
    bool isOpen() const override { return m_open; }

    protocol::ReadResult readRegisters(const protocol::ReadRequest& request) override;

    std::string describe() const override { return "memory"; }

    void setRegister(std::uint8_t unitId, std::uint16_t address, std::uint16_t value);
    void setRegisters(std::uint8_t unitId, std::uint16_t address, const std::vector<std::uint16_t>& values);

    // Next reads fail in order, one entry per read, before the map is consulted again.
    void queueFailure(const std::string& error);
    void queueException(std::uint8_t exceptionCode);
    void queueShortResponse(std::uint16_t count);

    void setUnitOffline(std::uint8_t unitId, bool offline = true);
    void setOpenFailure(const std::string& error) { m_openError = error; }

    const std::vector<ReadCall>& calls() const { return m_calls; }
    int closeCount() const { return m_closeCount; }

private:
    struct ScriptedReply
    {
        std::string error;
        bool isException = false;
        std::uint8_t exceptionCode = 0;
        int shortCount = -1;
    };

    std::map<std::pair<std::uint8_t, std::uint16_t>, std::uint16_t> m_registers;
    std::deque<ScriptedReply> m_script;
    std::map<std::uint8_t, bool> m_offline;
    std::vector<ReadCall> m_calls;
    std::string m_openError;
    bool m_open = false;
    int m_closeCount = 0;
};

} // namespace transport
