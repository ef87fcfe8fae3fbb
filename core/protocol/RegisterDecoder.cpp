#include "RegisterDecoder.h"

#include <array>
#include <charconv>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace protocol {

std::uint32_t bigEndian32(std::uint16_t hi, std::uint16_t lo) noexcept
{
    return (static_cast<std::uint32_t>(hi) << 16) | static_cast<std::uint32_t>(lo);
}

float ieee754FromRegisters(std::uint16_t hi, std::uint16_t lo) noexcept
{
    const std::uint32_t raw = bigEndian32(hi, lo);
    float value = 0.0F;
    std::memcpy(&value, &raw, sizeof(value));
    return value;
}

std::int16_t signed16(std::uint16_t raw) noexcept
{
    std::int16_t value = 0;
    std::memcpy(&value, &raw, sizeof(value));
    return value;
}

namespace {

// A finite double never has more fractional decimal digits than this.
constexpr int kExactFractionDigits = 1074;

// Adds one unit in the last place of a decimal string, carrying over the point.
void incrementDecimal(std::string& digits)
{
    for (auto i = digits.size(); i-- > 0;) {
        if (digits[i] == '.') {
            continue;
        }
        if (digits[i] == '-') {
            digits.insert(i + 1, 1, '1');
            return;
        }
        if (digits[i] != '9') {
            ++digits[i];
            return;
        }
        digits[i] = '0';
    }
    digits.insert(0, 1, '1');
}

} // namespace

double roundTo(double value, int precision)
{
    if (!std::isfinite(value) || precision < 0 || precision >= kExactFractionDigits) {
        return value;
    }

    std::array<char, 1500> buffer{};
    const auto written = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                       std::chars_format::fixed, kExactFractionDigits);
    if (written.ec != std::errc()) {
        return value;
    }
    const std::string exact(buffer.data(), written.ptr);

    const auto point = exact.find('.');
    if (point == std::string::npos) {
        return value;
    }
    const auto firstDropped = point + 1 + static_cast<std::size_t>(precision);
    std::string kept = exact.substr(0, precision == 0 ? point : firstDropped);

    bool roundUp = false;
    const char dropped = exact[firstDropped];
    if (dropped > '5') {
        roundUp = true;
    } else if (dropped == '5') {
        const bool exactTie = exact.find_first_not_of('0', firstDropped + 1) == std::string::npos;
        roundUp = !exactTie || ((kept.back() - '0') % 2 != 0);
    }
    if (roundUp) {
        incrementDecimal(kept);
    }

    double rounded = value;
    const auto parsed = std::from_chars(kept.data(), kept.data() + kept.size(), rounded);
    if (parsed.ec != std::errc()) {
        return value;
    }
    return rounded;
}

std::optional<double> scaledValue(std::optional<std::int64_t> raw, double divisor, int precision)
{
    if (!raw) {
        return std::nullopt;
    }
    return roundTo(static_cast<double>(*raw) / divisor, precision);
}

std::string packedIdentifier(const std::vector<std::uint16_t>& registers)
{
    return packedIdentifier(registers, 0, registers.size());
}

std::string packedIdentifier(const std::vector<std::uint16_t>& block, std::size_t offset, std::size_t count)
{
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (std::size_t i = offset; i < offset + count && i < block.size(); ++i) {
        out << std::setw(2) << ((block[i] >> 8) & 0xFF);
        out << std::setw(2) << (block[i] & 0xFF);
    }
    return out.str();
}

} // namespace protocol
