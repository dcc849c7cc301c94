#pragma once
///@file

#include <type_traits>
#include <utility>

namespace diskxfer {

/**
 * Run a function at the end of a scope, unless `cancel()` was called
 * first. The function must not throw while an exception is in flight.
 */
template<typename Fn>
class [[nodiscard("Finally values must be used")]] Finally
{
    Fn fun;
    bool armed = true;

public:
    Finally(Fn fun)
        : fun(std::move(fun))
    {
    }

    Finally(const Finally &) = delete;

    Finally(Finally && other) noexcept(std::is_nothrow_move_constructible_v<Fn>)
        : fun(std::move(other.fun))
        , armed(other.armed)
    {
        other.armed = false;
    }

    ~Finally() noexcept(false)
    {
        if (armed)
            fun();
    }

    void cancel()
    {
        armed = false;
    }
};

} // namespace diskxfer
