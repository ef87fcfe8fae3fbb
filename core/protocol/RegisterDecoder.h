#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

// Word order on the wire is high register first; bytes inside a register are big-endian.
std::uint32_t bigEndian32(std::uint16_t hi, std::uint16_t lo) noexcept;

float ieee754FromRegisters(std::uint16_t hi, std::uint16_t lo) noexcept;

std::int16_t signed16(std::uint16_t raw) noexcept;

/**
 * round(raw / divisor, precision).
 * An empty raw value (device error) stays empty.
 */
std::optional<double> scaledValue(std::optional<std::int64_t> raw, double divisor, int precision);

/**
 * Rounds the exact binary value to `precision` decimals, ties to even,
 * and returns the double nearest to that decimal. 5.05 is stored as
 * 5.04999..., so roundTo(5.05, 1) is 5.0; roundTo(0.125, 2) is 0.12.
 * Non-finite values and negative precisions are returned unchanged.
 */
double roundTo(double value, int precision);

// Two big-endian bytes per register, lowercase hex.
std::string packedIdentifier(const std::vector<std::uint16_t>& registers);
std::string packedIdentifier(const std::vector<std::uint16_t>& block, std::size_t offset, std::size_t count);

inline bool requireRegisters(const std::vector<std::uint16_t>& block, std::size_t count) noexcept
{
    return block.size() >= count;
}

} // namespace protocol
