#pragma once

#include <synapse/common/logging.h>
#include <synapse/transfer/logger.h>

#define TXVerbose1(message) LogVerbose1(::synapse::transfer::logger(), (message))
#define TXVerboseF(format, ...) LogVerboseF(::synapse::transfer::logger(), (format), __VA_ARGS__)

#define TXDebug1(message) LogDebug1(::synapse::transfer::logger(), (message))
#define TXDebugF(format, ...) LogDebugF(::synapse::transfer::logger(), (format), __VA_ARGS__)

#define TXInfo1(message) LogInfo1(::synapse::transfer::logger(), (message))
#define TXInfoF(format, ...) LogInfoF(::synapse::transfer::logger(), (format), __VA_ARGS__)

#define TXWarning1(message) LogWarning1(::synapse::transfer::logger(), (message))
#define TXWarningF(format, ...) LogWarningF(::synapse::transfer::logger(), (format), __VA_ARGS__)

// These yield an exception, they don't throw it.
#define TXError1(message) LogError1(::synapse::transfer::logger(), (message))
#define TXErrorF(format, ...) LogErrorF(::synapse::transfer::logger(), (format), __VA_ARGS__)
