#pragma once

#include "DecodedRecord.h"

namespace application {

class OutputSink {
public:
    virtual ~OutputSink() = default;

    // Throws std::runtime_error when the destination cannot be written.
    virtual void append(const PollCycleResult& result) = 0;
    virtual void flush() = 0;
};

} // namespace application
