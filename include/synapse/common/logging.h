#pragma once

#include <string>

#include <synapse/common/logger.h>
#include <synapse/logging.h>

// Arguments are only evaluated when the message will be emitted.
#define SYNAPSE_LOG_AT(logger, level, ...) do \
{ \
    if (!(logger).masked((level))) \
        (logger).log((level), \
                     ::synapse::log_file_leafname(__FILE__), \
                     __LINE__, \
                     __VA_ARGS__); \
} \
while (0)

#define LogVerbose1(logger, message) \
  SYNAPSE_LOG_AT((logger), ::synapse::logVerbose, std::string(message))

#define LogVerboseF(logger, format, ...) \
  SYNAPSE_LOG_AT((logger), ::synapse::logVerbose, (format), __VA_ARGS__)

#define LogDebug1(logger, message) \
  SYNAPSE_LOG_AT((logger), ::synapse::logDebug, std::string(message))

#define LogDebugF(logger, format, ...) \
  SYNAPSE_LOG_AT((logger), ::synapse::logDebug, (format), __VA_ARGS__)

#define LogInfo1(logger, message) \
  SYNAPSE_LOG_AT((logger), ::synapse::logInfo, std::string(message))

#define LogInfoF(logger, format, ...) \
  SYNAPSE_LOG_AT((logger), ::synapse::logInfo, (format), __VA_ARGS__)

#define LogWarning1(logger, message) \
  SYNAPSE_LOG_AT((logger), ::synapse::logWarning, std::string(message))

#define LogWarningF(logger, format, ...) \
  SYNAPSE_LOG_AT((logger), ::synapse::logWarning, (format), __VA_ARGS__)

// Log an error and yield an exception the caller can throw.
#define LogError1(logger, message) \
  (logger).error(::synapse::log_file_leafname(__FILE__), __LINE__, "%s", (message))

#define LogErrorF(logger, format, ...) \
  (logger).error(::synapse::log_file_leafname(__FILE__), __LINE__, (format), __VA_ARGS__)
