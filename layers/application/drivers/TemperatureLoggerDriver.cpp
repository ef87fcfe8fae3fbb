#include "TemperatureLoggerDriver.h"

#include <cmath>

#include "core/protocol/RegisterDecoder.h"

namespace application {

TemperatureLoggerDriver::TemperatureLoggerDriver() {
    fields_.reserve(kChannels);
    for (std::size_t i = 1; i <= kChannels; ++i) {
        fields_.push_back("CH" + std::to_string(i) + "_Temp");
    }
}

std::vector<std::optional<FieldValue>> TemperatureLoggerDriver::decodeFields(const protocol::RawBlock& block) const {
    std::vector<std::optional<FieldValue>> values;
    values.reserve(kChannels);
    for (std::size_t i = 0; i < kChannels; ++i) {
        const float temp = protocol::ieee754FromRegisters(block[2 * i], block[2 * i + 1]);
        if (!std::isfinite(temp)) {
            // open sensor input
            values.emplace_back(std::nullopt);
            continue;
        }
        values.emplace_back(protocol::roundTo(static_cast<double>(temp), 2));
    }
    return values;
}

} // namespace application
