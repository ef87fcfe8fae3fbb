#pragma once

#include <stdexcept>
#include <string>

namespace application {

enum ExitCode : int {
    ExitOk = 0,
    ExitConfigError = 1,
    ExitUsageError = 2,
    ExitConnectionFailure = 3,
    ExitEscalation = 4,
    ExitUnexpectedError = 5
};

// Fatal at startup; polling never begins.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ExhaustedRetriesError : public std::runtime_error {
public:
    ExhaustedRetriesError(const std::string& context, int attempts, const std::string& lastError)
        : std::runtime_error(context + ": " + std::to_string(attempts) + " attempt(s) failed, last error: " + lastError),
          attempts_(attempts),
          lastError_(lastError) {}

    int attempts() const noexcept { return attempts_; }
    const std::string& lastError() const noexcept { return lastError_; }

private:
    int attempts_;
    std::string lastError_;
};

} // namespace application
