#include <sstream>
#include <thread>

#include <synapse/common/logger.h>
#include <synapse/common/utility.h>
#include <synapse/logging.h>

namespace synapse
{
namespace common
{

void Logger::emit(LogLevel level,
                  const char* filename,
                  unsigned int line,
                  const std::string& message) const
{
    std::ostringstream ostream;

    ostream << mPrefix
            << std::this_thread::get_id()
            << ": "
            << message;

    SimpleLogger::postLog(level,
                          ostream.str().c_str(),
                          filename,
                          static_cast<int>(line));
}

Logger::Logger(const char* subsystemName)
  : mPrefix()
{
    if (subsystemName)
        mPrefix = std::string(subsystemName) + ": ";
}

std::runtime_error Logger::error(const char* filename,
                                 unsigned int line,
                                 const char* format,
                                 ...) const
{
    std::va_list arguments;

    va_start(arguments, format);

    auto message = formatv(arguments, format);

    va_end(arguments);

    // Errors are emitted regardless of the subsystem's level.
    if (SimpleLogger::getLogLevel() >= logError)
        emit(logError, filename, line, message);

    return std::runtime_error(message);
}

void Logger::log(LogLevel level,
                 const char* filename,
                 unsigned int line,
                 const std::string& message) const
{
    if (!masked(level))
        emit(level, filename, line, message);
}

void Logger::log(LogLevel level,
                 const char* filename,
                 unsigned int line,
                 const char* format,
                 ...) const
{
    std::va_list arguments;

    va_start(arguments, format);

    logv(level, filename, line, format, arguments);

    va_end(arguments);
}

void Logger::logv(LogLevel level,
                  const char* filename,
                  unsigned int line,
                  const char* format,
                  std::va_list arguments) const
{
    // Don't bother formatting what nobody will see.
    if (!masked(level))
        emit(level, filename, line, formatv(arguments, format));
}

bool Logger::masked(LogLevel level) const
{
    return SimpleLogger::getLogLevel() < level;
}

const std::string& Logger::prefix() const
{
    return mPrefix;
}

Logger& logger()
{
    static Logger logger;

    return logger;
}

} // common
} // synapse
