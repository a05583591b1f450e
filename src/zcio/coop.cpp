#include "zcio/coop.hpp"

#include <fcntl.h>
#include <poll.h>

#include "zcio/ops.hpp"
#include "zcio/retry.hpp"

namespace zcio
{

Result<> MakeNonBlocking(const int fd)
{
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1)
    {
        return LastError();
    }
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
    {
        return LastError();
    }
    return {};
}

Task<Result<size_t>> AsyncTee(IoContext& ctx, const int fd_in, const int fd_out, const size_t len,
                              const TransferFlags flags)
{
    return AsyncRunAndRetryWhileEwouldblock(
        [&ctx, fd_in, fd_out] { return AsyncWaitTransferReady(ctx, fd_in, fd_out); },
        [=] { return RetryWhileErrno([=] { return Tee(fd_in, fd_out, len, flags); }, {kInterrupted}); });
}

Task<Result<SpliceResult>> AsyncSplice(IoContext& ctx, const int fd_in, const std::optional<uint64_t> off_in,
                                       const int fd_out, const std::optional<uint64_t> off_out, const size_t len,
                                       const TransferFlags flags)
{
    return AsyncRunAndRetryWhileEwouldblock(
        [&ctx, fd_in, fd_out] { return AsyncWaitTransferReady(ctx, fd_in, fd_out); },
        [=] {
            return RetryWhileErrno([=] { return Splice(fd_in, off_in, fd_out, off_out, len, flags); },
                                   {kInterrupted});
        });
}

Result<> PollWaiter::operator()() const
{
    pollfd fds[2] = {
        {.fd = fd_in_, .events = POLLIN, .revents = 0},
        {.fd = fd_out_, .events = POLLOUT, .revents = 0},
    };
    int remaining = 2;

    while (remaining > 0)
    {
        if (::poll(fds, 2, -1) < 0)
        {
            return LastError();
        }

        for (auto& p : fds)
        {
            if (p.revents == 0)
            {
                continue;
            }
            if ((p.revents & POLLNVAL) != 0)
            {
                return ErrorFromErrno(EBADF);
            }
            // A negative fd is skipped by poll(2); this side is done.
            p.fd = -1;
            p.revents = 0;
            --remaining;
        }
    }
    return {};
}

Result<size_t> BlockingTee(const int fd_in, const int fd_out, const size_t len, const TransferFlags flags)
{
    return RunAndRetryWhileEwouldblock(PollWaiter{fd_in, fd_out}, [=] {
        return RetryWhileErrno([=] { return Tee(fd_in, fd_out, len, flags); }, {kInterrupted});
    });
}

Result<SpliceResult> BlockingSplice(const int fd_in, const std::optional<uint64_t> off_in, const int fd_out,
                                    const std::optional<uint64_t> off_out, const size_t len,
                                    const TransferFlags flags)
{
    return RunAndRetryWhileEwouldblock(PollWaiter{fd_in, fd_out}, [=] {
        return RetryWhileErrno([=] { return Splice(fd_in, off_in, fd_out, off_out, len, flags); }, {kInterrupted});
    });
}

}  // namespace zcio
