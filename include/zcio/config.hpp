#pragma once

#include <cstddef>
#include <string_view>

#include "zcio/logger.hpp"
#include "zcio/result.hpp"

namespace zcio
{

struct TeeConfig
{
    // Capacity requested for every pipe the tool owns; 0 keeps the kernel default.
    size_t pipe_size = 0;

    // Bytes requested per tee/splice call
    size_t chunk_size = 64 * 1024;

    // Write after the existing content of the output file instead of truncating it
    bool append = false;

    alog::Level log_level = alog::Level::Warn;

    /// Throws std::invalid_argument on an unusable combination.
    void Validate() const;
};

/// Accepts debug, info, warn, error, fatal and off (case-sensitive).
Result<alog::Level> ParseLogLevel(std::string_view name);

}  // namespace zcio
