#pragma once

/**
 * syscall.hpp - Direct bindings to tee(2) and splice(2)
 *
 * No retry and no interpretation: a raw return of -1 becomes the errno held
 * at that moment, every other value (zero included) is a success. Callers that
 * want EINTR/EAGAIN handling use the retry engine (retry.hpp) or the
 * cooperative adapter (coop.hpp) instead.
 */

#include <cstddef>
#include <cstdint>
#include <optional>

#include "zcio/descriptor.hpp"
#include "zcio/flags.hpp"
#include "zcio/result.hpp"

namespace zcio
{

struct SpliceResult
{
    size_t bytes = 0;
    // Post-call offsets, only for the sides the caller supplied one for.
    std::optional<uint64_t> off_in;
    std::optional<uint64_t> off_out;
};

/// @brief Duplicates up to len bytes from pipe fd_in to pipe fd_out without consuming them.
/// @return Bytes duplicated; 0 means the input pipe has no writers left and is empty.
Result<size_t> Tee(int fd_in, int fd_out, size_t len, TransferFlags flags = {});

/// @brief Moves up to len bytes from fd_in to fd_out; one side must be a pipe.
/// @param off_in Offset into fd_in, or nullopt to use (and advance) its file position.
///               Must be nullopt when fd_in is a pipe.
/// @param off_out Same as off_in for fd_out.
/// @return Bytes moved plus the updated offsets that were supplied.
Result<SpliceResult> Splice(int fd_in, std::optional<uint64_t> off_in, int fd_out, std::optional<uint64_t> off_out,
                            size_t len, TransferFlags flags = {});

template <FileDescriptor Fin, FileDescriptor Fout>
Result<size_t> Tee(const Fin& fd_in, const Fout& fd_out, size_t len, TransferFlags flags = {})
{
    return Tee(GetRawFd(fd_in), GetRawFd(fd_out), len, flags);
}

template <FileDescriptor Fin, FileDescriptor Fout>
Result<SpliceResult> Splice(const Fin& fd_in, std::optional<uint64_t> off_in, const Fout& fd_out,
                            std::optional<uint64_t> off_out, size_t len, TransferFlags flags = {})
{
    return Splice(GetRawFd(fd_in), off_in, GetRawFd(fd_out), off_out, len, flags);
}

}  // namespace zcio
