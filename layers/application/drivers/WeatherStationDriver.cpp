#include "WeatherStationDriver.h"

#include "core/protocol/RegisterDecoder.h"

namespace application {

WeatherStationDriver::WeatherStationDriver()
    : fields_{"Irradiance_W_m2", "Wind_speed_m_s", "Wind_direction_deg", "Air_temp_C",
              "Humidity_pct", "Pressure_hPa", "Module_temp_C"} {}

std::vector<std::optional<FieldValue>> WeatherStationDriver::decodeFields(const protocol::RawBlock& block) const {
    return {
        static_cast<std::int64_t>(block[0]),
        protocol::scaledValue(block[1], 10.0, 1),
        static_cast<std::int64_t>(block[2]),
        protocol::scaledValue(protocol::signed16(block[3]), 10.0, 1),
        protocol::scaledValue(block[4], 10.0, 1),
        protocol::scaledValue(block[5], 10.0, 1),
        protocol::scaledValue(protocol::signed16(block[6]), 10.0, 1),
    };
}

} // namespace application
