#pragma once

#include <atomic>

#include <synapse/common/logger.h>

namespace synapse
{
namespace common
{

// A logger whose verbosity can be tuned independently.
//
// Messages must pass both this logger's level and the process-wide
// level before they are emitted.
class SubsystemLogger
  : public Logger
{
    std::atomic<LogLevel> mLogLevel;

public:
    SubsystemLogger(const char* name, LogLevel level = logInfo);

    void logLevel(LogLevel level);

    LogLevel logLevel() const;

    bool masked(LogLevel level) const override;
}; // SubsystemLogger

} // common
} // synapse
