/**
 * @file logging.cpp
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

#include "synapse/logging.h"

#include <ctime>
#include <iostream>

namespace synapse {

ExternalLogger& externalLogger()
{
    static ExternalLogger logger;

    return logger;
}

std::atomic<LogLevel> SimpleLogger::mCurrentLevel{logInfo};

std::atomic<Logger*> SimpleLogger::mOutput{&externalLogger()};

std::string SimpleLogger::timestamp()
{
    char buffer[16];
    std::time_t now = std::time(nullptr);
    std::tm utc{};

    gmtime_r(&now, &utc);

    if (!std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &utc))
        return std::string();

    return buffer;
}

SimpleLogger::SimpleLogger(LogLevel level, const char* filename, int line)
  : mLevel(level)
  , mMessage()
  , mSource()
  , mTime()
{
    if (!mOutput.load())
        return;

    mTime = timestamp();
    mSource = filename;

    if (line >= 0)
        mSource += ":" + std::to_string(line);
}

SimpleLogger::~SimpleLogger()
{
    auto output = mOutput.load();

    if (!output)
        return;

    // Source goes last so that messages stay column aligned.
    if (!mSource.empty())
        mMessage << " [" << mSource << "]";

    output->log(mTime.c_str(), mLevel, mSource.c_str(), mMessage.str().c_str());
}

const char* SimpleLogger::toStr(LogLevel level)
{
    switch (level)
    {
    case logFatal:
        return "FATAL";
    case logError:
        return "err";
    case logWarning:
        return "warn";
    case logInfo:
        return "info";
    case logDebug:
        return "debug";
    case logVerbose:
        return "verbose";
    }

    return "";
}

void SimpleLogger::setOutputClass(Logger* output)
{
    mOutput.store(output);
}

void SimpleLogger::setLogLevel(LogLevel level)
{
    mCurrentLevel.store(level);
}

void SimpleLogger::postLog(LogLevel level, const char* message, const char* filename, int line)
{
    if (getLogLevel() < level)
        return;

    SimpleLogger logger(level, filename ? filename : "", line);

    if (message)
        logger << message;
}

ExternalLogger::ExternalLogger()
  : mCallbacks()
  , mConsole(false)
  , mLogging(false)
  , mLock()
{
}

void ExternalLogger::addLogger(void* id, LogCallback callback)
{
    std::lock_guard<std::recursive_mutex> guard(mLock);

    mCallbacks[id] = std::move(callback);
}

void ExternalLogger::removeLogger(void* id)
{
    std::lock_guard<std::recursive_mutex> guard(mLock);

    mCallbacks.erase(id);
}

void ExternalLogger::setLogToConsole(bool enable)
{
    mConsole.store(enable);
}

void ExternalLogger::log(const char *time, int loglevel, const char *source, const char *message)
{
    time = time ? time : "";
    source = source ? source : "";
    message = message ? message : "";

    std::lock_guard<std::recursive_mutex> guard(mLock);

    if (mLogging)
        return;

    mLogging = true;

    for (auto& callback : mCallbacks)
        callback.second(time, loglevel, source, message);

    if (mConsole.load())
        std::cout << "[" << time << "]["
                  << SimpleLogger::toStr(static_cast<LogLevel>(loglevel))
                  << "] " << message << std::endl;

    mLogging = false;
}

} // namespace
