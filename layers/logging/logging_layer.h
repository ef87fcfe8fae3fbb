#pragma once

#include <chrono>
#include <cstddef>
#include <fstream>
#include <functional>
#include <ostream>
#include <string>

namespace logging {

enum class Level {
    Debug,
    Info,
    Warn,
    Error
};

using Clock = std::function<std::chrono::system_clock::time_point()>;

// "YYYY-MM-DDTHH:MM:SS" in local time
std::string formatTimestamp(std::chrono::system_clock::time_point time);
// "YYYY-MM-DD" in local time
std::string formatDate(std::chrono::system_clock::time_point time);
// "YYYY-MM" in local time
std::string formatMonth(std::chrono::system_clock::time_point time);

const char* levelToString(Level level) noexcept;
bool parseLevel(const std::string& text, Level& level);

/**
 * Process log: every line goes to the console stream and, once a folder is
 * attached, to <folder>/<YYYY-MM-DD>.log. Components get the sink by
 * reference; nothing redirects std::cout.
 */
class LogSink {
public:
    explicit LogSink(std::ostream& console);
    ~LogSink();

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    bool attachFolder(const std::string& folder, int retentionDays, std::string& error);

    void setMinimumLevel(Level level) noexcept { minimumLevel_ = level; }
    Level minimumLevel() const noexcept { return minimumLevel_; }
    void setClock(Clock clock);

    void write(Level level, const std::string& message);
    void debug(const std::string& message) { write(Level::Debug, message); }
    void info(const std::string& message) { write(Level::Info, message); }
    void warn(const std::string& message) { write(Level::Warn, message); }
    void error(const std::string& message) { write(Level::Error, message); }

    // Switches to a new file when the local date changed, then applies retention.
    bool rotateIfNeeded();

    // Deletes YYYY-MM-DD.log files older than the retention window; returns the count.
    std::size_t cleanupOldLogs();

    void reportDiskUsage(const std::string& path, int barLength = 40);

    void flush();

    const std::string& currentFilePath() const noexcept { return filePath_; }

private:
    bool openFileFor(const std::string& date, std::string& error);

    std::ostream& console_;
    std::ofstream file_;
    std::string folder_;
    std::string filePath_;
    std::string currentDate_;
    int retentionDays_ = 0;
    Level minimumLevel_ = Level::Info;
    Clock clock_;
};

} // namespace logging
