#include "DecodedRecord.h"

#include <array>
#include <charconv>
#include <cmath>
#include <type_traits>

namespace application {

const char* statusToString(RecordStatus status) noexcept {
    switch (status) {
        case RecordStatus::Ok:
            return "No error";
        case RecordStatus::DeviceError:
            return "Error";
        case RecordStatus::DecodeError:
            return "Decode error";
    }
    return "Error";
}

std::string formatValue(const std::optional<FieldValue>& value) {
    if (!value) {
        return {};
    }

    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    return {};
                }
                std::array<char, 32> buffer{};
                const auto res = std::to_chars(buffer.data(), buffer.data() + buffer.size(), v);
                return std::string(buffer.data(), res.ptr);
            } else {
                return std::to_string(v);
            }
        },
        *value);
}

} // namespace application
