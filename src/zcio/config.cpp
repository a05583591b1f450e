#include "zcio/config.hpp"

#include <format>
#include <stdexcept>

#include <unistd.h>

#include "zcio/pipe.hpp"

namespace zcio
{

void TeeConfig::Validate() const
{
    if (chunk_size == 0)
    {
        throw std::invalid_argument("chunk_size must be greater than zero");
    }

    if (pipe_size == 0 || ::geteuid() == 0)
    {
        return;
    }

    // Without a readable ceiling the kernel has the last word in SetPipeCapacity.
    if (const auto ceiling = ReadPipeMaxSize(); ceiling && pipe_size > *ceiling)
    {
        throw std::invalid_argument(
            std::format("pipe_size {} exceeds {} ({}) for an unprivileged process", pipe_size, kPipeMaxSizePath,
                        *ceiling));
    }
}

Result<alog::Level> ParseLogLevel(const std::string_view name)
{
    using enum alog::Level;

    if (name == "debug")
        return Debug;
    if (name == "info")
        return Info;
    if (name == "warn")
        return Warn;
    if (name == "error")
        return Error;
    if (name == "fatal")
        return Fatal;
    if (name == "off")
        return Disabled;
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
}

}  // namespace zcio
