#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <utility>

#include <synapse/common/cancel_token.h>
#include <synapse/transfer/transfer_error.h>

namespace synapse
{
namespace transfer
{

enum RetryClassification : unsigned int
{
    // The operation may succeed if attempted again.
    RC_RETRYABLE,
    // Trying again is pointless.
    RC_FATAL
}; // RetryClassification

struct RetryOptions
{
    // How many times will an operation be attempted before we give up?
    std::size_t mMaximumAttempts = 7u;

    // How long do we wait before the first retry?
    std::chrono::milliseconds mInitialDelay{1000};

    // No delay will ever exceed this.
    std::chrono::milliseconds mMaximumDelay{30000};

    // How quickly do delays grow between attempts?
    double mDelayFactor = 2.0;
}; // RetryOptions

// Tracks the progress of a single operation through its retries.
struct RetryState
{
    // How many attempts have been made so far?
    std::size_t mAttempts = 0u;

    // How was the most recent failure classified?
    std::optional<RetryClassification> mLastClassification;

    // How long did we wait before the current attempt?
    std::chrono::milliseconds mLastDelay{0};

    // When may the next attempt begin?
    std::chrono::steady_clock::time_point mNextEligible{};
}; // RetryState

class RetryPolicy
{
    // Decide what to do after an attempt has failed.
    //
    // Sleeps and returns nothing if the operation should be tried again,
    // otherwise returns the error the operation should conclude with.
    std::optional<TransferError> failed(RetryState& state,
                                        const TransferError& error,
                                        const common::CancelToken& cancel,
                                        const char* what) const;

    // Serializes access to mGenerator.
    mutable std::mutex mLock;

    // Source of jitter.
    mutable std::mt19937_64 mGenerator;

    RetryOptions mOptions;

public:
    explicit RetryPolicy(const RetryOptions& options = RetryOptions());

    // Should an operation that failed with error be tried again?
    RetryClassification classify(const TransferError& error) const;

    // How long should we wait before the given attempt?
    //
    // Attempt numbers start at one for the first retry.
    std::chrono::milliseconds nextDelay(std::size_t attempt) const;

    // As above but honors any hint provided by the server.
    std::chrono::milliseconds nextDelay(std::size_t attempt,
                                        const TransferError& error) const;

    const RetryOptions& options() const;

    // Drive operation until it succeeds, fails fatally, exhausts its
    // attempts or is cancelled.
    //
    // Operation is invoked as operation(state) and must return a
    // TransferErrorOr<T>.
    template<typename Operation>
    auto run(Operation&& operation,
             const common::CancelToken& cancel,
             const char* what) const
      -> decltype(operation(std::declval<RetryState&>()))
    {
        RetryState state;

        while (true)
        {
            // Don't start work that nobody wants anymore.
            if (cancel.triggered())
                return common::unexpected(TransferError(TRANSFER_CANCELLED,
                                                        std::string(what) + " was cancelled"));

            ++state.mAttempts;

            auto result = operation(state);

            if (result)
                return result;

            auto conclusion = failed(state, result.error(), cancel, what);

            if (conclusion)
                return common::unexpected(std::move(*conclusion));
        }
    }
}; // RetryPolicy

} // transfer
} // synapse
