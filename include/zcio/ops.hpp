#pragma once

#include <chrono>
#include <coroutine>

#include <poll.h>

#include "zcio/descriptor.hpp"
#include "zcio/io_context.hpp"

namespace zcio
{

struct PollOp : UringOp
{
    int fd;
    unsigned poll_mask;

    template <FileDescriptor F>
    PollOp(IoContext& ctx, const F& f, unsigned mask) : UringOp(&ctx), fd(GetRawFd(f)), poll_mask(mask)
    {
    }

    void PrepareSqe(io_uring_sqe* sqe) const { io_uring_prep_poll_add(sqe, fd, poll_mask); }
};

/// @brief Waits for events on a file descriptor (one-shot poll).
/// @return Awaitable yielding Result<size_t> with the triggered events mask
///
/// @code
///   auto result = co_await AsyncPoll(ctx, pipe_rd, POLLIN);
///   if (result && (*result & POLLIN)) {
///       // data (or a hangup) is pending
///   }
/// @endcode
template <FileDescriptor F>
PollOp AsyncPoll(IoContext& ctx, const F& f, unsigned poll_mask)
{
    return PollOp(ctx, f, poll_mask);
}

struct SleepOp : UringOp
{
    __kernel_timespec ts{};

    template <typename Rep, typename Period>
    SleepOp(IoContext& ctx, std::chrono::duration<Rep, Period> dur) : UringOp(&ctx)
    {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count();
        ts.tv_sec = ns / 1'000'000'000;
        ts.tv_nsec = ns % 1'000'000'000;
    }

    void PrepareSqe(io_uring_sqe* sqe) { io_uring_prep_timeout(sqe, &ts, 0, 0); }

    Result<void> await_resume()
    {
        if (res == -ETIME)
            return {};
        if (res < 0)
            return std::unexpected(MakeErrorCode(res));
        return {};
    }
};

/// @brief Suspends the coroutine for the specified duration without blocking the thread.
template <typename Rep, typename Period>
SleepOp AsyncSleep(IoContext& ctx, std::chrono::duration<Rep, Period> dur)
{
    return SleepOp(ctx, dur);
}

// -----------------------------------------------------------------------------
// Transfer readiness: fd_in readable AND fd_out writable
// -----------------------------------------------------------------------------

/**
 * Registers a POLLIN poll on fd_in and a POLLOUT poll on fd_out in a single
 * submission (linked, so the second is armed once the first fired) and
 * resumes the awaiting coroutine exactly once, after both are satisfied.
 *
 * The readable side is tracked separately so that cancellation reaches it and
 * its own error (e.g. EBADF) is reported instead of the ECANCELED the kernel
 * posts for the broken link.
 */
struct TransferReadyOp : UringOp
{
    int fd_in;
    int fd_out;
    OperationState readable;

    TransferReadyOp(IoContext& ctx, const int in, const int out) : UringOp(&ctx), fd_in(in), fd_out(out)
    {
        readable.ctx = &ctx;
    }

    TransferReadyOp(TransferReadyOp&&) = default;

    void await_suspend(std::coroutine_handle<> h)
    {
        handle = h;
        // The readable completion resumes nothing; only the writable one does.
        readable.handle = std::noop_coroutine();

        ctx->EnsureSqes(2);
        ctx->Track(&readable);
        ctx->Track(this);

        auto* sqe_in = ctx->GetSqe();
        io_uring_prep_poll_add(sqe_in, fd_in, POLLIN);
        sqe_in->flags |= IOSQE_IO_LINK;
        io_uring_sqe_set_data(sqe_in, &readable);

        auto* sqe_out = ctx->GetSqe();
        io_uring_prep_poll_add(sqe_out, fd_out, POLLOUT);
        io_uring_sqe_set_data(sqe_out, static_cast<OperationState*>(this));
    }

    Result<void> await_resume() const
    {
        if (readable.res < 0)
        {
            return std::unexpected(MakeErrorCode(readable.res));
        }
        if (res < 0)
        {
            return std::unexpected(MakeErrorCode(res));
        }
        return {};
    }
};

/// @brief Suspends until fd_in is readable and fd_out is writable.
/// @return Awaitable yielding Result<void>; hangup/error conditions count as ready.
template <FileDescriptor Fin, FileDescriptor Fout>
TransferReadyOp AsyncWaitTransferReady(IoContext& ctx, const Fin& fd_in, const Fout& fd_out)
{
    return TransferReadyOp(ctx, GetRawFd(fd_in), GetRawFd(fd_out));
}

}  // namespace zcio
