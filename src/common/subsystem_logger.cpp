#include <synapse/common/subsystem_logger.h>

namespace synapse
{
namespace common
{

SubsystemLogger::SubsystemLogger(const char* name, LogLevel level)
  : Logger(name)
  , mLogLevel(level)
{
}

void SubsystemLogger::logLevel(LogLevel level)
{
    mLogLevel.store(level);
}

LogLevel SubsystemLogger::logLevel() const
{
    return mLogLevel.load();
}

bool SubsystemLogger::masked(LogLevel level) const
{
    return level > mLogLevel.load() || Logger::masked(level);
}

} // common
} // synapse
