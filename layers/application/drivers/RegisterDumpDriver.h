#pragma once

#include "layers/application/DeviceDriver.h"

namespace application {

// Raw register passthrough for commissioning unknown devices.
class RegisterDumpDriver final : public DeviceDriver {
public:
    static constexpr std::size_t kRegistersPerLine = 10;

    RegisterDumpDriver(std::uint16_t startAddress, std::uint16_t count);

    std::string typeName() const override { return "RegisterDump"; }
    const std::vector<std::string>& fieldNames() const override { return fields_; }
    std::uint16_t minimumRegisters() const override { return count_; }

    std::vector<std::string> displayLines(const DecodedRecord& record) const override;

protected:
    std::vector<std::optional<FieldValue>> decodeFields(const protocol::RawBlock& block) const override;

private:
    std::uint16_t startAddress_;
    std::uint16_t count_;
    std::vector<std::string> fields_;
};

} // namespace application
