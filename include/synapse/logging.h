/**
 * @file synapse/logging.h
 * @brief Process-wide logging
 *
 * (c) 2026 by the Synapse transfer engine authors
 *
 * This file is part of the Synapse transfer engine.
 *
 * The Synapse transfer engine is distributed in the hope that it will be
 * useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

/* Usage:
    SimpleLogger::setLogLevel(logDebug);

    LOG_debug << "Chunk " << index << " arrived";

   Messages go to whatever Logger was installed by
   SimpleLogger::setOutputClass(...). By default that's externalLogger().
*/

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <type_traits>

#include <synapse/log_level.h>

namespace synapse {

// Where SimpleLogger sends finished messages.
class Logger
{
public:
    virtual ~Logger() = default;

    virtual void log(const char *time, int loglevel, const char *source, const char *message) = 0;
};

// Builds a single message and emits it when destroyed.
class SimpleLogger
{
    static std::atomic<LogLevel> mCurrentLevel;

    static std::atomic<Logger*> mOutput;

    // Current time as HH:MM:SS (UTC).
    static std::string timestamp();

    LogLevel mLevel;

    std::ostringstream mMessage;

    // Where the message came from, as file:line.
    std::string mSource;

    std::string mTime;

public:
    SimpleLogger(LogLevel level, const char* filename, int line);

    SimpleLogger(const SimpleLogger& other) = delete;

    ~SimpleLogger();

    SimpleLogger& operator=(const SimpleLogger& rhs) = delete;

    template<typename T>
    SimpleLogger& operator<<(const T& value)
    {
        if constexpr (std::is_pointer_v<T>)
        {
            if (!value)
            {
                mMessage << "(NULL)";

                return *this;
            }
        }

        mMessage << value;

        return *this;
    }

    template<typename T>
    SimpleLogger& operator<<(const std::shared_ptr<T>& pointer)
    {
        if (pointer)
            mMessage << *pointer;
        else
            mMessage << "<empty shared ptr>";

        return *this;
    }

    static const char* toStr(LogLevel level);

    static void setOutputClass(Logger* output);

    // Messages more verbose than level are discarded.
    static void setLogLevel(LogLevel level);

    static LogLevel getLogLevel()
    {
        return mCurrentLevel.load();
    }

    // Emit a message that was formatted elsewhere.
    static void postLog(LogLevel level, const char* message, const char* filename, int line);
};

// Strip any directories from a source file's path.
constexpr const char* log_file_leafname(const char* path)
{
    auto leaf = path;

    for (; *path; ++path)
    {
        if (*path == '/' || *path == '\\')
            leaf = path + 1;
    }

    return leaf;
}

// Lets the LOG_* macros below discard the logger's result.
struct LoggerVoidify
{
    void operator&(SimpleLogger&) {}
};

#define SYNAPSE_LOG(level) \
    ::synapse::SimpleLogger::getLogLevel() < (level) ? (void)0 : \
        ::synapse::LoggerVoidify() & ::synapse::SimpleLogger((level), ::synapse::log_file_leafname(__FILE__), __LINE__)

#define LOG_verbose SYNAPSE_LOG(::synapse::logVerbose)
#define LOG_debug SYNAPSE_LOG(::synapse::logDebug)
#define LOG_info SYNAPSE_LOG(::synapse::logInfo)
#define LOG_warn SYNAPSE_LOG(::synapse::logWarning)
#define LOG_err SYNAPSE_LOG(::synapse::logError)
#define LOG_fatal SYNAPSE_LOG(::synapse::logFatal)

// Fans messages out to any number of registered callbacks.
class ExternalLogger : public Logger
{
public:
    using LogCallback =
        std::function<void(const char *time, int loglevel, const char *source, const char *message)>;

    ExternalLogger();

    void addLogger(void* id, LogCallback callback);

    void removeLogger(void* id);

    // Echo messages to standard output?
    void setLogToConsole(bool enable);

    void log(const char *time, int loglevel, const char *source, const char *message) override;

private:
    std::map<void*, LogCallback> mCallbacks;

    std::atomic<bool> mConsole;

    // Set while we're dispatching so callbacks that log don't recurse.
    bool mLogging;

    std::recursive_mutex mLock;
};

// The output class installed by default.
ExternalLogger& externalLogger();

} // namespace
