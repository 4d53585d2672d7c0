#pragma once

#include <type_traits>
#include <utility>

namespace synapse
{
namespace common
{

// Executes a user-provided function when destroyed.
template<typename Destructor>
class ScopedDestructor
{
    Destructor mDestructor;

public:
    ScopedDestructor(Destructor destructor)
      : mDestructor(std::move(destructor))
    {
    }

    ScopedDestructor(const ScopedDestructor& other) = delete;

    ~ScopedDestructor()
    {
        mDestructor();
    }

    ScopedDestructor& operator=(const ScopedDestructor& rhs) = delete;
}; // ScopedDestructor

// Returns an object that executes function when destroyed.
template<typename Function, typename = std::enable_if_t<std::is_invocable_v<Function>>>
auto makeScopedDestructor(Function function)
{
    return ScopedDestructor<Function>(std::move(function));
}

} // common
} // synapse
