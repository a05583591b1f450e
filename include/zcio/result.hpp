#pragma once
////////////////////////////////////////////////////////////////////////////////
// Standardized Error Handling
//
// Every fallible call returns std::expected<T, std::error_code>.
// Use Result<size_t> or Result<> (defaults to void).
////////////////////////////////////////////////////////////////////////////////

#include <cerrno>
#include <expected>
#include <system_error>

namespace zcio
{
template <typename T = void>
using Result = std::expected<T, std::error_code>;

inline std::unexpected<std::error_code> ErrorFromErrno(int err)
{
    return std::unexpected(std::error_code(err, std::system_category()));
}

/// Accepts a positive errno or a negated kernel result (io_uring CQE style).
inline std::error_code MakeErrorCode(int err)
{
    return std::error_code{err > 0 ? err : -err, std::system_category()};
}

/// Snapshot of errno right after a failed libc call.
inline std::unexpected<std::error_code> LastError()
{
    return ErrorFromErrno(errno);
}

inline bool IsErrno(const std::error_code& ec, int err) noexcept
{
    return ec.category() == std::system_category() && ec.value() == err;
}

/// Recoverable by immediate reissue: the call was interrupted by a signal.
constexpr int kInterrupted = EINTR;

/// Recoverable by waiting for readiness. EWOULDBLOCK == EAGAIN on Linux.
constexpr int kWouldBlock = EAGAIN;

}  // namespace zcio
