#pragma once

#include <type_traits>
#include <utility>

#include <synapse/common/unexpected_forward.h>

namespace synapse
{
namespace common
{

// Marks a value as an error when constructing an Expected.
template<typename E>
class Unexpected
{
    E mError;

public:
    explicit Unexpected(E error)
      : mError(std::move(error))
    {
    }

    E& value() &
    {
        return mError;
    }

    E&& value() &&
    {
        return std::move(mError);
    }

    const E& value() const&
    {
        return mError;
    }
}; // Unexpected<E>

template<typename E>
Unexpected<std::decay_t<E>> unexpected(E&& error)
{
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

} // common
} // synapse
