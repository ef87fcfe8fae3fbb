#include "RegisterDumpDriver.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace application {

RegisterDumpDriver::RegisterDumpDriver(std::uint16_t startAddress, std::uint16_t count)
    : startAddress_(startAddress), count_(count) {
    fields_.reserve(count_);
    for (std::uint16_t i = 0; i < count_; ++i) {
        std::ostringstream name;
        name << 'R' << std::setw(4) << std::setfill('0') << i;
        fields_.push_back(name.str());
    }
}

std::vector<std::optional<FieldValue>> RegisterDumpDriver::decodeFields(const protocol::RawBlock& block) const {
    std::vector<std::optional<FieldValue>> values;
    values.reserve(count_);
    for (std::uint16_t i = 0; i < count_; ++i) {
        values.emplace_back(static_cast<std::int64_t>(block[i]));
    }
    return values;
}

std::vector<std::string> RegisterDumpDriver::displayLines(const DecodedRecord& record) const {
    std::vector<std::string> lines;
    for (std::size_t chunk = 0; chunk < record.fields.size(); chunk += kRegistersPerLine) {
        std::ostringstream line;
        line << "Registers " << (startAddress_ + chunk) << ":";
        const auto end = std::min(chunk + kRegistersPerLine, record.fields.size());
        for (std::size_t i = chunk; i < end; ++i) {
            const auto text = formatValue(record.fields[i].value);
            line << ' ' << (text.empty() ? "None" : text);
        }
        lines.push_back(line.str());
    }
    return lines;
}

} // namespace application
