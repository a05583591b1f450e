#pragma once

/**
 * retry.hpp - Retry combinators for syscall-like actions
 *
 * An action is any callable taking no arguments and returning Result<T>.
 * Two kinds of failure are recoverable:
 *
 *   EINTR   retried immediately, no delay, no attempt bound
 *   EAGAIN  retried after a wait step that blocks (or suspends) until progress
 *           is possible
 *
 * Everything else is returned to the caller untouched.
 */

#include <algorithm>
#include <initializer_list>
#include <ranges>
#include <type_traits>
#include <utility>

#include "zcio/result.hpp"
#include "zcio/task.hpp"

namespace zcio
{

namespace detail
{
template <typename Codes>
bool MatchesAny(const std::error_code& ec, const Codes& codes)
{
    return std::ranges::any_of(codes, [&](const int code) { return IsErrno(ec, code); });
}
}  // namespace detail

/// @brief Invokes action until it succeeds or fails with an errno outside codes.
/// @param action Callable returning Result<T>; invoked again on every recoverable failure
/// @param codes Recoverable errno values (any range of int)
/// @return The first success, or the first non-recoverable failure
///
/// @code
///   auto n = RetryWhileErrno([&] { return Tee(in, out, 4096); }, {EINTR});
/// @endcode
template <typename Action, std::ranges::input_range Codes>
auto RetryWhileErrno(Action&& action, const Codes& codes) -> std::invoke_result_t<Action&>
{
    while (true)
    {
        auto result = action();
        if (result.has_value() || !detail::MatchesAny(result.error(), codes))
        {
            return result;
        }
    }
}

template <typename Action>
auto RetryWhileErrno(Action&& action, std::initializer_list<int> codes) -> std::invoke_result_t<Action&>
{
    return RetryWhileErrno(std::forward<Action>(action), std::ranges::subrange(codes.begin(), codes.end()));
}

/// @brief Runs action; on EAGAIN calls wait() and runs it again, as often as needed.
/// @param wait Callable returning Result<>; blocks until progress is possible.
///             A failing wait is returned to the caller.
/// @param action Callable returning Result<T>
///
/// Only EAGAIN starts another wait/retry cycle. EINTR is not handled here: wrap
/// the action in RetryWhileErrno for that.
template <typename Wait, typename Action>
auto RunAndRetryWhileEwouldblock(Wait&& wait, Action&& action) -> std::invoke_result_t<Action&>
{
    using R = std::invoke_result_t<Action&>;

    if (auto result = action(); result.has_value() || !IsErrno(result.error(), kWouldBlock))
    {
        return result;
    }

    auto wait_and_do = [&]() -> R {
        if (auto waited = wait(); !waited)
        {
            return std::unexpected(waited.error());
        }
        return action();
    };

    return RetryWhileErrno(wait_and_do, {kWouldBlock});
}

/// @brief Coroutine form of RunAndRetryWhileEwouldblock.
/// @param wait Callable returning an awaitable that yields Result<> (e.g. a readiness poll)
/// @param action Callable returning Result<T>, run on the scheduler thread
///
/// The caller is suspended once per would-block cycle; it is never resumed
/// until the wait step completes.
template <typename Wait, typename Action>
auto AsyncRunAndRetryWhileEwouldblock(Wait wait, Action action) -> Task<std::invoke_result_t<Action&>>
{
    auto result = action();
    while (!result.has_value() && IsErrno(result.error(), kWouldBlock))
    {
        if (auto waited = co_await wait(); !waited)
        {
            co_return std::unexpected(waited.error());
        }
        result = action();
    }
    co_return result;
}

}  // namespace zcio
