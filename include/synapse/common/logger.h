#pragma once

#include <cstdarg>
#include <stdexcept>
#include <string>

#include <synapse/log_level.h>
#include <synapse/common/logger_forward.h>

namespace synapse
{
namespace common
{

// Formats messages and hands them to the process-wide SimpleLogger.
//
// Messages are prefixed with the name of the subsystem that emitted
// them, if any, and the emitting thread's ID.
class Logger
{
    // Prepended to every message, empty when we have no subsystem.
    std::string mPrefix;

    // Hand a fully formatted message to SimpleLogger.
    void emit(LogLevel level,
              const char* filename,
              unsigned int line,
              const std::string& message) const;

public:
    explicit Logger(const char* subsystemName = nullptr);

    Logger(const Logger& other) = delete;

    virtual ~Logger() = default;

    Logger& operator=(const Logger& rhs) = delete;

    // Log an error and return an exception describing it.
    std::runtime_error error(const char* filename,
                             unsigned int line,
                             const char* format,
                             ...) const;

    // Log a preformatted message.
    void log(LogLevel level,
             const char* filename,
             unsigned int line,
             const std::string& message) const;

    // Log a printf-style message.
    void log(LogLevel level,
             const char* filename,
             unsigned int line,
             const char* format,
             ...) const;

    void logv(LogLevel level,
              const char* filename,
              unsigned int line,
              const char* format,
              std::va_list arguments) const;

    // Would a message at this level be discarded?
    virtual bool masked(LogLevel level) const;

    // What is prepended to this logger's messages?
    const std::string& prefix() const;
}; // Logger

// Logger used by infrastructure that belongs to no subsystem.
Logger& logger();

} // common
} // synapse
