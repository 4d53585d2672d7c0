#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

#include <synapse/common/utility.h>
#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

TransferError::TransferError()
  : mResult(TRANSFER_FATAL)
  , mStatus(0)
  , mMessage()
  , mRetryAfter()
{
}

TransferError::TransferError(TransferResult result,
                             std::string message,
                             int status,
                             std::optional<std::chrono::seconds> retryAfter)
  : mResult(result)
  , mStatus(status)
  , mMessage(std::move(message))
  , mRetryAfter(retryAfter)
{
}

bool TransferError::operator==(const TransferError& rhs) const
{
    return mResult == rhs.mResult
           && mStatus == rhs.mStatus;
}

bool TransferError::operator!=(const TransferError& rhs) const
{
    return !(*this == rhs);
}

const std::string& TransferError::message() const
{
    return mMessage;
}

TransferResult TransferError::result() const
{
    return mResult;
}

std::optional<std::chrono::seconds> TransferError::retryAfter() const
{
    return mRetryAfter;
}

int TransferError::status() const
{
    return mStatus;
}

std::string TransferError::toString() const
{
    auto name = transfer::toString(mResult);

    if (mStatus)
        return common::format("%s (HTTP %d): %s", name, mStatus, mMessage.c_str());

    return common::format("%s: %s", name, mMessage.c_str());
}

TransferResult resultFromStatus(int status)
{
    if (status >= 200 && status < 300)
        return TRANSFER_SUCCESS;

    if (status == 429 || (status >= 500 && status < 600))
        return TRANSFER_TRANSIENT;

    if (status == 403 || status == 410)
        return TRANSFER_AUTHORIZATION_EXPIRED;

    return TRANSFER_FATAL;
}

TransferError errorFromStatus(int status,
                              const std::string& message,
                              std::optional<std::chrono::seconds> retryAfter)
{
    auto result = resultFromStatus(status);

    // Callers only hand us failures.
    if (result == TRANSFER_SUCCESS)
        result = TRANSFER_FATAL;

    // Only rate limiting carries a meaningful hint.
    if (status != 429)
        retryAfter.reset();

    return TransferError(result, message, status, retryAfter);
}

TransferError errorFromTransport(const std::string& message, bool transient)
{
    if (transient || transientMessage(message))
        return TransferError(TRANSFER_TRANSIENT, message);

    return TransferError(TRANSFER_FATAL, message);
}

bool transientMessage(const std::string& message)
{
    static const char* phrases[] = {
        "connection reset by peer",
        "couldn't connect to host",
        "proxy error",
        "slow down",
        "slowdown",
        "timed out",
        "timeout",
        "try again",
        "unknown ssl protocol error"
    }; // phrases

    std::string lowered(message);

    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    for (auto* phrase : phrases)
    {
        if (lowered.find(phrase) != std::string::npos)
            return true;
    }

    return false;
}

std::optional<std::chrono::seconds> parseRetryAfter(const std::string& value)
{
    auto i = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c);
    });

    if (i == value.end() || !std::isdigit(static_cast<unsigned char>(*i)))
        return std::nullopt;

    char* end = nullptr;

    errno = 0;

    auto seconds = std::strtoll(&*i, &end, 10);

    // Absurd hints are clamped rather than trusted.
    if (errno == ERANGE || seconds > kMaximumRetryAfter.count())
        seconds = kMaximumRetryAfter.count();

    // HTTP dates aren't supported.
    while (end && *end && std::isspace(static_cast<unsigned char>(*end)))
        ++end;

    if (!end || *end)
        return std::nullopt;

    return std::chrono::seconds(seconds);
}

} // transfer
} // synapse
