#include "zcio/pipe.hpp"

#include <charconv>
#include <climits>
#include <string>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "zcio/retry.hpp"

namespace zcio
{

namespace
{
bool IsBlank(const char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string_view Trim(std::string_view s)
{
    while (!s.empty() && IsBlank(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && IsBlank(s.back()))
        s.remove_suffix(1);
    return s;
}
}  // namespace

Result<size_t> ReadPipeMaxSize(const std::string_view path)
{
    const std::string p{path};
    UniqueFd fd{::open(p.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd.Valid())
    {
        return LastError();
    }

    // The file holds one number; anything that does not fit is malformed.
    char buf[64];
    size_t used = 0;
    while (used < sizeof(buf))
    {
        auto n = RetryWhileErrno(
            [&]() -> Result<size_t> {
                const ssize_t r = ::read(fd.Get(), buf + used, sizeof(buf) - used);
                if (r < 0)
                {
                    return LastError();
                }
                return static_cast<size_t>(r);
            },
            {kInterrupted});
        if (!n)
        {
            return std::unexpected(n.error());
        }
        if (*n == 0)
        {
            break;
        }
        used += *n;
    }
    if (used == sizeof(buf))
    {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    const auto text = Trim(std::string_view{buf, used});
    size_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return value;
}

Result<size_t> GetPipeCapacity(const int fd)
{
    const int size = ::fcntl(fd, F_GETPIPE_SZ);
    if (size == -1)
    {
        return LastError();
    }
    return static_cast<size_t>(size);
}

Result<size_t> SetPipeCapacity(const int fd, const size_t size)
{
    if (size > static_cast<size_t>(INT_MAX))
    {
        return ErrorFromErrno(EINVAL);
    }

    const int applied = ::fcntl(fd, F_SETPIPE_SZ, static_cast<int>(size));
    if (applied == -1)
    {
        return LastError();
    }
    return static_cast<size_t>(applied);
}

Result<size_t> PipeBytesPending(const int fd)
{
    int pending = 0;
    if (::ioctl(fd, FIONREAD, &pending) == -1)
    {
        return LastError();
    }
    return static_cast<size_t>(pending);
}

}  // namespace zcio
