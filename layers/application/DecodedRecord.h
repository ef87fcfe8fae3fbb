#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace application {

// Datetime, Device_ID and Error columns around the driver fields
inline constexpr std::size_t kMetadataColumns = 3;

enum class RecordStatus {
    Ok,
    DeviceError,
    DecodeError
};

using FieldValue = std::variant<std::int64_t, double, std::string>;

struct Field {
    std::string name;
    std::optional<FieldValue> value;
};

struct DecodedRecord {
    std::chrono::system_clock::time_point timestamp;
    int unitId = 0;
    std::vector<Field> fields;
    RecordStatus status = RecordStatus::Ok;
    std::string detail;     // failure reason, not part of the output row
};

using PollCycleResult = std::vector<DecodedRecord>;

const char* statusToString(RecordStatus status) noexcept;

// Empty string for a null value; reals use the shortest round-trip form.
std::string formatValue(const std::optional<FieldValue>& value);

} // namespace application
