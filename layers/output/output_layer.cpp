#include "output_layer.h"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace output {

namespace fs = std::filesystem;

std::string dailyCsvPath(const std::string& baseFolder, const std::string& fileSuffix,
                         std::chrono::system_clock::time_point time) {
    const fs::path path = fs::path(baseFolder) / "data" / logging::formatMonth(time)
        / (logging::formatDate(time) + "_" + fileSuffix + ".csv");
    return path.string();
}

std::vector<std::string> defaultHeader(const std::vector<std::string>& fieldNames) {
    std::vector<std::string> header;
    header.reserve(fieldNames.size() + application::kMetadataColumns);
    header.emplace_back("Datetime");
    header.emplace_back("Device_ID");
    header.insert(header.end(), fieldNames.begin(), fieldNames.end());
    header.emplace_back("Error");
    return header;
}

std::string csvEscape(const std::string& cell) {
    if (cell.find_first_of(",\"\r\n") == std::string::npos) {
        return cell;
    }
    std::string quoted = "\"";
    for (const char c : cell) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

CsvOutputSink::CsvOutputSink(std::string baseFolder, std::string fileSuffix, std::vector<std::string> header,
                             logging::LogSink& log)
    : baseFolder_(std::move(baseFolder)),
      fileSuffix_(std::move(fileSuffix)),
      header_(std::move(header)),
      log_(log),
      clock_([] { return std::chrono::system_clock::now(); }) {}

void CsvOutputSink::setClock(logging::Clock clock) {
    clock_ = clock ? std::move(clock) : logging::Clock([] { return std::chrono::system_clock::now(); });
}

void CsvOutputSink::openFor(const std::string& path) {
    if (file_.is_open() && path == path_) {
        return;
    }
    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory for '" + path + "': " + ec.message());
    }

    const bool isNew = !fs::exists(path, ec) || fs::file_size(path, ec) == 0;
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_) {
        throw std::runtime_error("Cannot open CSV file '" + path + "'");
    }
    path_ = path;

    if (isNew) {
        for (std::size_t i = 0; i < header_.size(); ++i) {
            file_ << (i ? "," : "") << csvEscape(header_[i]);
        }
        file_ << '\n';
        log_.info("Created CSV file " + path_);
    }
}

void CsvOutputSink::append(const application::PollCycleResult& result) {
    openFor(dailyCsvPath(baseFolder_, fileSuffix_, clock_()));

    for (const auto& record : result) {
        file_ << logging::formatTimestamp(record.timestamp) << ',' << record.unitId;
        for (const auto& field : record.fields) {
            file_ << ',' << csvEscape(application::formatValue(field.value));
        }
        file_ << ',' << application::statusToString(record.status) << '\n';
    }

    if (!file_) {
        const auto failed = path_;
        file_.close();
        path_.clear();
        throw std::runtime_error("Write to '" + failed + "' failed");
    }
}

void CsvOutputSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

} // namespace output
