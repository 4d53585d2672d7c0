#pragma once

#include <chrono>
#include <memory>

namespace synapse
{
namespace common
{

// A cooperative cancellation flag shared by everyone holding a copy.
//
// Work that may take a while checks triggered() at its checkpoints and
// sleeps through waitFor(...) so that cancellation cuts the sleep short.
class CancelToken
{
    class State;

    std::shared_ptr<State> mState;

public:
    CancelToken();

    CancelToken(const CancelToken& other) = default;

    CancelToken(CancelToken&& other) = default;

    ~CancelToken();

    CancelToken& operator=(const CancelToken& rhs) = default;

    CancelToken& operator=(CancelToken&& rhs) = default;

    // Request cancellation and wake anyone waiting on this token.
    void trigger();

    // Has cancellation been requested?
    bool triggered() const noexcept;

    // Sleep for up to duration.
    //
    // Returns true if the sleep was cut short by cancellation.
    bool waitFor(std::chrono::milliseconds duration) const;
}; // CancelToken

} // common
} // synapse
