#pragma once

#include <string>

#include <synapse/log_level_forward.h>

namespace synapse
{

// Levels from least to most verbose.
#define SYNAPSE_LOG_LEVELS(expander) \
    expander(Fatal) \
    expander(Error) \
    expander(Warning) \
    expander(Info) \
    expander(Debug) \
    expander(Verbose)

enum LogLevel : int
{
#define SYNAPSE_LOG_LEVEL_ENUMERANT(name) log ## name,
    SYNAPSE_LOG_LEVELS(SYNAPSE_LOG_LEVEL_ENUMERANT)
#undef SYNAPSE_LOG_LEVEL_ENUMERANT
    // Most verbose level there is.
    logMax = logVerbose
}; // LogLevel

// Case insensitive. Unknown names yield logInfo.
LogLevel toLogLevel(const std::string& level);

// Yields the level's name, such as "Debug".
const char* toString(LogLevel level);

} // synapse
