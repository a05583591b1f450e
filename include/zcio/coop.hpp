#pragma once

/**
 * coop.hpp - tee/splice that never block the scheduler thread
 *
 * Each call composes three layers:
 *   1. the raw binding (syscall.hpp), wrapped in RetryWhileErrno({EINTR}),
 *   2. a wait step: suspend until fd_in is readable and fd_out is writable,
 *   3. RunAndRetryWhileEwouldblock, so EAGAIN runs (2) then (1) again.
 *
 * Descriptors must be in non-blocking mode (MakeNonBlocking, or pass
 * SpliceFlag::NonBlock), otherwise the syscall blocks the whole thread instead
 * of reporting EAGAIN. A result of 0 bytes is end of input, not would-block.
 *
 * The caller keeps both descriptors open until the returned task finishes.
 */

#include <cstddef>
#include <cstdint>
#include <optional>

#include "zcio/descriptor.hpp"
#include "zcio/flags.hpp"
#include "zcio/io_context.hpp"
#include "zcio/result.hpp"
#include "zcio/syscall.hpp"
#include "zcio/task.hpp"

namespace zcio
{

/// @brief Sets O_NONBLOCK on fd, keeping its other status flags.
Result<> MakeNonBlocking(int fd);

template <FileDescriptor F>
Result<> MakeNonBlocking(const F& f)
{
    return MakeNonBlocking(GetRawFd(f));
}

/// @brief Scheduler-aware tee(2).
/// @return Task yielding bytes duplicated (0 = input drained and closed) or the first fatal error
///
/// @code
///   auto n = co_await AsyncTee(ctx, stdin_pipe, stdout_pipe, 64 * 1024);
///   if (!n) co_return std::unexpected(n.error());
///   if (*n == 0) co_return {};  // EOF
/// @endcode
Task<Result<size_t>> AsyncTee(IoContext& ctx, int fd_in, int fd_out, size_t len, TransferFlags flags = {});

/// @brief Scheduler-aware splice(2).
///
/// Supplied offsets are passed unchanged to every attempt: a would-block
/// attempt moves nothing, so the retry starts from the same position.
Task<Result<SpliceResult>> AsyncSplice(IoContext& ctx, int fd_in, std::optional<uint64_t> off_in, int fd_out,
                                       std::optional<uint64_t> off_out, size_t len, TransferFlags flags = {});

template <FileDescriptor Fin, FileDescriptor Fout>
Task<Result<size_t>> AsyncTee(IoContext& ctx, const Fin& fd_in, const Fout& fd_out, size_t len,
                              TransferFlags flags = {})
{
    return AsyncTee(ctx, GetRawFd(fd_in), GetRawFd(fd_out), len, flags);
}

template <FileDescriptor Fin, FileDescriptor Fout>
Task<Result<SpliceResult>> AsyncSplice(IoContext& ctx, const Fin& fd_in, std::optional<uint64_t> off_in,
                                       const Fout& fd_out, std::optional<uint64_t> off_out, size_t len,
                                       TransferFlags flags = {})
{
    return AsyncSplice(ctx, GetRawFd(fd_in), off_in, GetRawFd(fd_out), off_out, len, flags);
}

// -----------------------------------------------------------------------------
// Blocking-thread variants
// -----------------------------------------------------------------------------

/**
 * Wait step for threads without a scheduler: poll(2) until fd_in is readable
 * and fd_out is writable. Hangup and error conditions count as ready so that
 * the next attempt reports them. EINTR from poll is returned, not retried.
 */
class PollWaiter
{
public:
    PollWaiter(const int fd_in, const int fd_out) : fd_in_(fd_in), fd_out_(fd_out) {}

    Result<> operator()() const;

private:
    int fd_in_;
    int fd_out_;
};

Result<size_t> BlockingTee(int fd_in, int fd_out, size_t len, TransferFlags flags = {});

Result<SpliceResult> BlockingSplice(int fd_in, std::optional<uint64_t> off_in, int fd_out,
                                    std::optional<uint64_t> off_out, size_t len, TransferFlags flags = {});

}  // namespace zcio
