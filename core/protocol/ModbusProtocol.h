#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace protocol {

// Protocol limit for FC 0x03 / 0x04
inline constexpr std::uint16_t kMaxRegistersPerRead = 125;

enum class RegisterKind
{
    Holding,
    Input
};

struct ReadRequest
{
    std::uint16_t address = 0;
    std::uint16_t count = 0;
    std::uint8_t unitId = 1;
    RegisterKind kind = RegisterKind::Holding;
};

struct ReadResult
{
    bool success = false;
    std::string error;
    bool isException = false;
    std::uint8_t exceptionCode = 0;
    std::vector<std::uint16_t> values;
};

using RawBlock = std::vector<std::uint16_t>;

inline const char* registerKindToString(RegisterKind kind)
{
    return kind == RegisterKind::Input ? "input" : "holding";
}

} // namespace protocol
