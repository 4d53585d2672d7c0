#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <synapse/common/expected.h>
#include <synapse/transfer/transfer_error_forward.h>
#include <synapse/transfer/transfer_result.h>

namespace synapse
{
namespace transfer
{

// Describes why a transfer operation failed.
class TransferError
{
    // What kind of failure is this?
    TransferResult mResult;

    // The HTTP status that caused the failure, zero if there was none.
    int mStatus;

    // Human readable detail.
    std::string mMessage;

    // How long the server asked us to wait before trying again.
    std::optional<std::chrono::seconds> mRetryAfter;

public:
    TransferError();

    TransferError(TransferResult result,
                  std::string message,
                  int status = 0,
                  std::optional<std::chrono::seconds> retryAfter = std::nullopt);

    bool operator==(const TransferError& rhs) const;

    bool operator!=(const TransferError& rhs) const;

    const std::string& message() const;

    TransferResult result() const;

    std::optional<std::chrono::seconds> retryAfter() const;

    int status() const;

    // Renders the error as "KIND (HTTP 503): message".
    std::string toString() const;
}; // TransferError

// Map an HTTP status onto a result kind.
//
// 2xx is success, 429 and 5xx are transient, 403 and 410 mean the signed
// URL is no longer usable and anything else is fatal.
TransferResult resultFromStatus(int status);

// Build an error describing an unexpected HTTP response.
TransferError errorFromStatus(int status,
                              const std::string& message,
                              std::optional<std::chrono::seconds> retryAfter = std::nullopt);

// Build an error describing a failure below HTTP.
//
// Timeouts, resets and the like are transient, everything else is fatal.
TransferError errorFromTransport(const std::string& message, bool transient);

// Does this transport error message describe a condition worth retrying?
bool transientMessage(const std::string& message);

// Longest back off a server may ask of us.
constexpr std::chrono::seconds kMaximumRetryAfter(24 * 60 * 60);

// Parse an integral Retry-After header.
//
// Hints longer than kMaximumRetryAfter are clamped.
std::optional<std::chrono::seconds> parseRetryAfter(const std::string& value);

} // transfer
} // synapse
