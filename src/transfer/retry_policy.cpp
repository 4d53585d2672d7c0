#include <algorithm>
#include <cmath>

#include <synapse/transfer/logging.h>
#include <synapse/transfer/retry_policy.h>

namespace synapse
{
namespace transfer
{

RetryPolicy::RetryPolicy(const RetryOptions& options)
  : mLock()
  , mGenerator(std::random_device()())
  , mOptions(options)
{
    if (!mOptions.mMaximumAttempts)
        mOptions.mMaximumAttempts = 1;

    if (mOptions.mDelayFactor < 1.0)
        mOptions.mDelayFactor = 1.0;

    if (mOptions.mMaximumDelay < mOptions.mInitialDelay)
        mOptions.mMaximumDelay = mOptions.mInitialDelay;
}

RetryClassification RetryPolicy::classify(const TransferError& error) const
{
    switch (error.result())
    {
    case TRANSFER_TRANSIENT:
        return RC_RETRYABLE;
    default:
        return RC_FATAL;
    }
}

std::chrono::milliseconds RetryPolicy::nextDelay(std::size_t attempt) const
{
    using std::chrono::milliseconds;

    attempt = std::max<std::size_t>(attempt, 1u);

    auto initial = static_cast<double>(mOptions.mInitialDelay.count());
    auto maximum = static_cast<double>(mOptions.mMaximumDelay.count());

    // Compute the undisturbed delay for this attempt.
    auto step = initial * std::pow(mOptions.mDelayFactor,
                                   static_cast<double>(attempt - 1));

    step = std::min(step, maximum);

    // Jitter can't exceed the distance to the next step so delays never shrink.
    auto spread = step * std::min(0.5, mOptions.mDelayFactor - 1.0);
    auto jitter = 0.0;

    if (spread > 0.0)
    {
        std::uniform_real_distribution<double> distribution(0.0, spread);
        std::lock_guard<std::mutex> guard(mLock);

        jitter = distribution(mGenerator);
    }

    auto delay = std::min(step + jitter, maximum);

    return milliseconds(static_cast<milliseconds::rep>(delay));
}

std::chrono::milliseconds RetryPolicy::nextDelay(std::size_t attempt,
                                                 const TransferError& error) const
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    auto computed = nextDelay(attempt);

    // The server knows best how long it wants us to back off.
    if (error.status() == 429 && error.retryAfter())
    {
        using std::chrono::seconds;

        // Compare in seconds so a huge hint can't overflow the conversion.
        auto hinted = *error.retryAfter();

        if (hinted > duration_cast<seconds>(mOptions.mMaximumDelay))
            return mOptions.mMaximumDelay;

        if (hinted < seconds(0))
            return computed;

        return std::min(duration_cast<milliseconds>(hinted), mOptions.mMaximumDelay);
    }

    return computed;
}

const RetryOptions& RetryPolicy::options() const
{
    return mOptions;
}

std::optional<TransferError> RetryPolicy::failed(RetryState& state,
                                                 const TransferError& error,
                                                 const common::CancelToken& cancel,
                                                 const char* what) const
{
    auto classification = classify(error);

    state.mLastClassification = classification;

    // Nothing we can do about this.
    if (classification == RC_FATAL)
    {
        TXDebugF("%s failed on attempt %zu: %s",
                 what,
                 state.mAttempts,
                 error.toString().c_str());

        return error;
    }

    // Out of attempts.
    if (state.mAttempts >= mOptions.mMaximumAttempts)
    {
        TXWarningF("%s failed after %zu attempts: %s",
                   what,
                   state.mAttempts,
                   error.toString().c_str());

        return TransferError(TRANSFER_RETRIES_EXHAUSTED,
                             error.message(),
                             error.status());
    }

    auto delay = nextDelay(state.mAttempts, error);

    state.mLastDelay = delay;
    state.mNextEligible = std::chrono::steady_clock::now() + delay;

    TXDebugF("%s failed on attempt %zu, retrying in %lld ms: %s",
             what,
             state.mAttempts,
             static_cast<long long>(delay.count()),
             error.toString().c_str());

    // Sleep until the next attempt unless we're cancelled.
    if (cancel.waitFor(delay))
        return TransferError(TRANSFER_CANCELLED,
                             std::string(what) + " was cancelled");

    return std::nullopt;
}

} // transfer
} // synapse
