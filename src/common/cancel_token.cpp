#include <atomic>
#include <condition_variable>
#include <mutex>

#include <synapse/common/cancel_token.h>

namespace synapse
{
namespace common
{

class CancelToken::State
{
public:
    // Signalled when the token is triggered.
    std::condition_variable mCV;

    // Serializes access to mCV.
    std::mutex mLock;

    // Has the token been triggered?
    std::atomic<bool> mTriggered{false};
}; // State

CancelToken::CancelToken()
  : mState(std::make_shared<State>())
{
}

CancelToken::~CancelToken() = default;

void CancelToken::trigger()
{
    // Acquire lock so a waiter can't miss the notification.
    std::lock_guard<std::mutex> guard(mState->mLock);

    mState->mTriggered = true;

    mState->mCV.notify_all();
}

bool CancelToken::triggered() const noexcept
{
    return mState->mTriggered.load();
}

bool CancelToken::waitFor(std::chrono::milliseconds duration) const
{
    std::unique_lock<std::mutex> lock(mState->mLock);

    return mState->mCV.wait_for(lock, duration, [&]() {
        return mState->mTriggered.load();
    });
}

} // common
} // synapse
