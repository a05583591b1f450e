#include "zcio/syscall.hpp"

#include <fcntl.h>

namespace zcio
{

Result<size_t> Tee(const int fd_in, const int fd_out, const size_t len, const TransferFlags flags)
{
    const ssize_t n = ::tee(fd_in, fd_out, len, flags.Bits());
    if (n == -1)
    {
        return LastError();
    }
    return static_cast<size_t>(n);
}

Result<SpliceResult> Splice(const int fd_in, const std::optional<uint64_t> off_in, const int fd_out,
                            const std::optional<uint64_t> off_out, const size_t len, const TransferFlags flags)
{
    // The kernel reads and updates these in place
    loff_t in_pos = off_in ? static_cast<loff_t>(*off_in) : 0;
    loff_t out_pos = off_out ? static_cast<loff_t>(*off_out) : 0;

    const ssize_t n = ::splice(fd_in, off_in ? &in_pos : nullptr, fd_out, off_out ? &out_pos : nullptr, len,
                               flags.Bits());
    if (n == -1)
    {
        return LastError();
    }

    SpliceResult result{.bytes = static_cast<size_t>(n)};
    if (off_in)
    {
        result.off_in = static_cast<uint64_t>(in_pos);
    }
    if (off_out)
    {
        result.off_out = static_cast<uint64_t>(out_pos);
    }
    return result;
}

}  // namespace zcio
