#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "layers/application/OutputSink.h"
#include "layers/logging/logging_layer.h"

namespace output {

// <base>/data/<YYYY-MM>/<YYYY-MM-DD>_<suffix>.csv
std::string dailyCsvPath(const std::string& baseFolder, const std::string& fileSuffix,
                         std::chrono::system_clock::time_point time);

// Datetime, Device_ID, <fields...>, Error
std::vector<std::string> defaultHeader(const std::vector<std::string>& fieldNames);

std::string csvEscape(const std::string& cell);

/**
 * Appends one row per record to the daily CSV file. The file and its
 * directories are created on demand and the header is written when the
 * file is new or empty.
 */
class CsvOutputSink final : public application::OutputSink {
public:
    CsvOutputSink(std::string baseFolder, std::string fileSuffix, std::vector<std::string> header,
                  logging::LogSink& log);

    void setClock(logging::Clock clock);

    void append(const application::PollCycleResult& result) override;
    void flush() override;

    const std::string& currentPath() const noexcept { return path_; }

private:
    void openFor(const std::string& path);

    std::string baseFolder_;
    std::string fileSuffix_;
    std::vector<std::string> header_;
    logging::LogSink& log_;
    logging::Clock clock_;
    std::ofstream file_;
    std::string path_;
};

} // namespace output
