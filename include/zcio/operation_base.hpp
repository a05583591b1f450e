#pragma once

#include <coroutine>
#include <cstdint>
#include <exception>
#include <print>

namespace zcio
{
class IoContext;

/**
 * State of one in-flight io_uring submission (poll, timeout).
 *
 * Linked into the IoContext pending list on submission and unlinked when its
 * completion is reaped. The state lives in the awaiting coroutine frame, so a
 * frame destroyed while still linked would leave the kernel pointing at freed
 * memory: that case terminates the process instead.
 *
 * Movable only while not tracked (before await_suspend).
 */
struct OperationState
{
    IoContext* ctx = nullptr;
    int32_t res = 0;
    std::coroutine_handle<> handle;

    OperationState* next = nullptr;
    OperationState* prev = nullptr;
    bool tracked = false;

    OperationState() = default;

    OperationState(OperationState&& other) noexcept : ctx(other.ctx), res(other.res), handle(other.handle)
    {
        if (other.tracked)
        {
            std::println(stderr, "[zcio] FATAL: moved an OperationState that is pending in its IoContext");
            std::terminate();
        }
        other.ctx = nullptr;
        other.handle = nullptr;
    }

    OperationState& operator=(OperationState&&) = delete;
    OperationState(const OperationState&) = delete;
    OperationState& operator=(const OperationState&) = delete;

    ~OperationState()
    {
        if (tracked)
        {
            std::println(stderr,
                         "[zcio] FATAL: OperationState destroyed while its submission is pending.\n"
                         "[zcio]        A Task was destroyed while suspended on a readiness wait or timer.");
            std::terminate();
        }
    }
};
}  // namespace zcio
