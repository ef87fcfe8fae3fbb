#include "logging_layer.h"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace logging {

namespace fs = std::filesystem;

namespace {

std::tm toLocalTime(std::chrono::system_clock::time_point time) {
    const std::time_t raw = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &raw);
#else
    localtime_r(&raw, &local);
#endif
    return local;
}

std::string formatLocal(std::chrono::system_clock::time_point time, const char* pattern) {
    const std::tm local = toLocalTime(time);
    std::ostringstream out;
    out << std::put_time(&local, pattern);
    return out.str();
}

// Parses "YYYY-MM-DD" into local midnight of that day.
bool parseDate(const std::string& text, std::chrono::system_clock::time_point& out) {
    if (text.size() != 10) {
        return false;
    }
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%d");
    if (in.fail()) {
        return false;
    }
    tm.tm_isdst = -1;
    const std::time_t raw = std::mktime(&tm);
    if (raw == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(raw);
    return true;
}

double toGiB(std::uintmax_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
}

} // namespace

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    return formatLocal(time, "%Y-%m-%dT%H:%M:%S");
}

std::string formatDate(std::chrono::system_clock::time_point time) {
    return formatLocal(time, "%Y-%m-%d");
}

std::string formatMonth(std::chrono::system_clock::time_point time) {
    return formatLocal(time, "%Y-%m");
}

const char* levelToString(Level level) noexcept {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "INFO";
}

bool parseLevel(const std::string& text, Level& level) {
    if (text == "debug" || text == "DEBUG") {
        level = Level::Debug;
        return true;
    }
    if (text == "info" || text == "INFO") {
        level = Level::Info;
        return true;
    }
    if (text == "warn" || text == "WARN") {
        level = Level::Warn;
        return true;
    }
    if (text == "error" || text == "ERROR") {
        level = Level::Error;
        return true;
    }
    return false;
}

LogSink::LogSink(std::ostream& console)
    : console_(console), clock_([]() { return std::chrono::system_clock::now(); }) {}

LogSink::~LogSink() {
    flush();
}

void LogSink::setClock(Clock clock) {
    clock_ = std::move(clock);
}

bool LogSink::attachFolder(const std::string& folder, int retentionDays, std::string& error) {
    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
        error = "Cannot create log folder " + folder + ": " + ec.message();
        return false;
    }

    folder_ = folder;
    retentionDays_ = retentionDays;
    if (!openFileFor(formatDate(clock_()), error)) {
        return false;
    }
    cleanupOldLogs();
    return true;
}

bool LogSink::openFileFor(const std::string& date, std::string& error) {
    const auto path = (fs::path(folder_) / (date + ".log")).string();
    std::ofstream next(path, std::ios::app);
    if (!next) {
        error = "Cannot open log file " + path;
        return false;
    }

    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    file_ = std::move(next);
    filePath_ = path;
    currentDate_ = date;
    return true;
}

void LogSink::write(Level level, const std::string& message) {
    if (level < minimumLevel_) {
        return;
    }

    std::string line = formatTimestamp(clock_());
    line += " [";
    line += levelToString(level);
    line += "] ";
    line += message;
    line += '\n';

    console_ << line;
    console_.flush();
    if (file_.is_open()) {
        file_ << line;
        file_.flush();
    }
}

bool LogSink::rotateIfNeeded() {
    if (folder_.empty()) {
        return false;
    }

    const auto today = formatDate(clock_());
    if (today == currentDate_) {
        return false;
    }

    std::string error;
    if (!openFileFor(today, error)) {
        write(Level::Error, error);
        return false;
    }
    info("Log rotated to " + filePath_);
    cleanupOldLogs();
    return true;
}

std::size_t LogSink::cleanupOldLogs() {
    if (folder_.empty()) {
        return 0;
    }

    std::error_code ec;
    if (!fs::is_directory(folder_, ec)) {
        warn("Log folder '" + folder_ + "' not found");
        return 0;
    }

    const auto cutoff = clock_() - std::chrono::hours(24) * retentionDays_;
    std::vector<fs::path> expired;
    for (const auto& entry : fs::directory_iterator(folder_, ec)) {
        const auto path = entry.path();
        if (path.extension() != ".log" || path.string() == filePath_) {
            continue;
        }
        std::chrono::system_clock::time_point fileDate;
        if (!parseDate(path.stem().string(), fileDate)) {
            continue;
        }
        if (fileDate < cutoff) {
            expired.push_back(path);
        }
    }

    std::size_t deleted = 0;
    for (const auto& path : expired) {
        std::error_code removeError;
        if (fs::remove(path, removeError)) {
            info("Deleted old log: " + path.filename().string());
            ++deleted;
        } else if (removeError) {
            warn("Cannot delete old log " + path.filename().string() + ": " + removeError.message());
        }
    }

    if (deleted == 0) {
        debug("No old log files found to delete");
    } else {
        info("Deleted " + std::to_string(deleted) + " old log file(s)");
    }
    return deleted;
}

void LogSink::reportDiskUsage(const std::string& path, int barLength) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        error("Path '" + path + "' does not exist");
        return;
    }

    const auto space = fs::space(path, ec);
    if (ec) {
        error("Cannot read disk usage of '" + path + "': " + ec.message());
        return;
    }

    const auto used = space.capacity - space.free;
    const double usedRatio = space.capacity > 0 ? static_cast<double>(used) / static_cast<double>(space.capacity) : 0.0;
    const int usedBlocks = static_cast<int>(barLength * usedRatio);

    std::ostringstream out;
    out << "Disk " << path << " [" << std::string(static_cast<std::size_t>(usedBlocks), '#')
        << std::string(static_cast<std::size_t>(barLength - usedBlocks), '-') << "] "
        << std::fixed << std::setprecision(1) << usedRatio * 100.0 << "% used | "
        << std::setprecision(2) << "Total: " << toGiB(space.capacity) << " GB | Used: " << toGiB(used)
        << " GB | Free: " << toGiB(space.free) << " GB";
    write(Level::Info, out.str());
}

void LogSink::flush() {
    console_.flush();
    if (file_.is_open()) {
        file_.flush();
    }
}

} // namespace logging
