#pragma once

#include <cassert>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <variant>

#include <synapse/common/expected_forward.h>
#include <synapse/common/unexpected.h>

namespace synapse
{
namespace common
{

// Holds either a value of type T or an error of type E.
//
// Errors are introduced by way of unexpected(...) so that E and T may
// be the same type.
template<typename E, typename T>
class Expected
{
    // Where each alternative lives in mState.
    static constexpr std::size_t ErrorIndex = 0u;
    static constexpr std::size_t ValueIndex = 1u;

    // Is U something we can build a T from?
    template<typename U>
    static constexpr bool IsValueV =
        !std::is_same_v<std::decay_t<U>, Expected>
        && std::is_constructible_v<T, U>;

    std::variant<E, T> mState;

public:
    Expected()
      : mState(std::in_place_index<ErrorIndex>)
    {
    }

    template<typename F>
    Expected(Unexpected<F> error)
      : mState(std::in_place_index<ErrorIndex>, std::move(error).value())
    {
    }

    template<typename U, typename = std::enable_if_t<IsValueV<U>>>
    Expected(U&& value)
      : mState(std::in_place_index<ValueIndex>, std::forward<U>(value))
    {
    }

    Expected(const Expected& other) = default;

    Expected(Expected&& other) = default;

    Expected& operator=(const Expected& rhs) = default;

    Expected& operator=(Expected&& rhs) = default;

    operator bool() const
    {
        return hasValue();
    }

    bool operator!() const
    {
        return hasError();
    }

    template<typename F>
    bool operator==(const Unexpected<F>& rhs) const
    {
        return hasError() && error() == rhs.value();
    }

    template<typename U, typename = std::enable_if_t<IsValueV<U>>>
    bool operator==(const U& rhs) const
    {
        return hasValue() && value() == rhs;
    }

    T& operator*() &
    {
        return value();
    }

    T&& operator*() &&
    {
        return std::move(*this).value();
    }

    const T& operator*() const&
    {
        return value();
    }

    T* operator->()
    {
        return &value();
    }

    const T* operator->() const
    {
        return &value();
    }

    E& error() &
    {
        assert(hasError());

        return std::get<ErrorIndex>(mState);
    }

    E&& error() &&
    {
        assert(hasError());

        return std::get<ErrorIndex>(std::move(mState));
    }

    const E& error() const&
    {
        assert(hasError());

        return std::get<ErrorIndex>(mState);
    }

    // Our error if we have one, otherwise fallback.
    E errorOr(E fallback) const
    {
        return hasError() ? error() : std::move(fallback);
    }

    bool hasError() const
    {
        return mState.index() == ErrorIndex;
    }

    bool hasValue() const
    {
        return mState.index() == ValueIndex;
    }

    void swap(Expected& other)
    {
        mState.swap(other.mState);
    }

    T& value() &
    {
        assert(hasValue());

        return std::get<ValueIndex>(mState);
    }

    T&& value() &&
    {
        assert(hasValue());

        return std::get<ValueIndex>(std::move(mState));
    }

    const T& value() const&
    {
        assert(hasValue());

        return std::get<ValueIndex>(mState);
    }

    // Our value if we have one, otherwise fallback.
    T valueOr(T fallback) const&
    {
        return hasValue() ? value() : std::move(fallback);
    }

    T valueOr(T fallback) &&
    {
        return hasValue() ? std::move(*this).value() : std::move(fallback);
    }
}; // Expected<E, T>

} // common
} // synapse
