#pragma once

/**
 * pipe.hpp - Pipe buffer capacity control
 *
 * A pipe's kernel buffer bounds how many bytes a single tee/splice can move
 * before the writer sees EAGAIN. Unprivileged processes may grow it up to the
 * system-wide ceiling published in /proc/sys/fs/pipe-max-size; processes with
 * CAP_SYS_RESOURCE may go beyond it. See F_GETPIPE_SZ/F_SETPIPE_SZ in fcntl(2).
 */

#include <cstddef>
#include <string_view>

#include "zcio/descriptor.hpp"
#include "zcio/result.hpp"

namespace zcio
{

inline constexpr std::string_view kPipeMaxSizePath = "/proc/sys/fs/pipe-max-size";

/// @brief Reads the system-wide pipe capacity ceiling (a decimal integer file).
/// @return The ceiling in bytes; the open/read errno if the file is unreadable,
///         std::errc::invalid_argument if it does not hold a single number.
Result<size_t> ReadPipeMaxSize(std::string_view path = kPipeMaxSizePath);

/// @brief Current capacity of the pipe referred to by fd.
Result<size_t> GetPipeCapacity(int fd);

/// @brief Requests a new capacity for the pipe referred to by fd.
/// @return The capacity the kernel applied (rounded up to a power-of-two number of pages)
///
/// Fails with EPERM when size exceeds ReadPipeMaxSize() and the caller is not
/// privileged, and with EBUSY when size is below the bytes currently buffered.
Result<size_t> SetPipeCapacity(int fd, size_t size);

template <FileDescriptor F>
Result<size_t> GetPipeCapacity(const F& f)
{
    return GetPipeCapacity(GetRawFd(f));
}

template <FileDescriptor F>
Result<size_t> SetPipeCapacity(const F& f, size_t size)
{
    return SetPipeCapacity(GetRawFd(f), size);
}

/// @brief Bytes currently buffered in the pipe (FIONREAD).
Result<size_t> PipeBytesPending(int fd);

}  // namespace zcio
