// examples/zcio/ztee.cpp
// tee(1) without copying through user space.
//
//   producer | ztee [--append] [--pipe_size=N] FILE | consumer
//
// stdin must be a pipe. Every chunk available on stdin is duplicated to
// stdout with tee(2) (through a pooled pipe when stdout is not a pipe), then
// the same bytes are moved into FILE with splice(2).

#include <print>
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <gflags/gflags.h>

#include "zcio/config.hpp"
#include "zcio/coop.hpp"
#include "zcio/io_context.hpp"
#include "zcio/logger.hpp"
#include "zcio/pipe.hpp"
#include "zcio/pipe_pool.hpp"

DEFINE_uint64(pipe_size, 0, "Capacity for stdin/stdout pipes in bytes (0 = kernel default)");
DEFINE_uint64(chunk_size, 64 * 1024, "Bytes requested per tee call");
DEFINE_bool(append, false, "Append to FILE instead of truncating it");
DEFINE_string(log_level, "warn", "debug, info, warn, error, fatal or off");

namespace
{

bool IsPipe(const int fd)
{
    struct stat st{};
    return ::fstat(fd, &st) == 0 && S_ISFIFO(st.st_mode);
}

// Moves exactly len bytes from a pipe into out, looping on short splices.
zcio::Task<zcio::Result<>> SpliceAll(zcio::IoContext& ctx, const int pipe_rd, const int out, size_t len)
{
    while (len > 0)
    {
        auto moved = co_await zcio::AsyncSplice(ctx, pipe_rd, std::nullopt, out, std::nullopt, len,
                                                zcio::SpliceFlag::Move);
        if (!moved)
        {
            co_return std::unexpected(moved.error());
        }
        if (moved->bytes == 0)
        {
            co_return std::unexpected(std::make_error_code(std::errc::broken_pipe));
        }
        len -= moved->bytes;
    }
    co_return zcio::Result<>{};
}

zcio::Task<zcio::Result<uint64_t>> Run(zcio::IoContext& ctx, const zcio::TeeConfig& cfg, const int file_fd)
{
    constexpr int kIn = STDIN_FILENO;
    constexpr int kOut = STDOUT_FILENO;

    // stdout that is not a pipe gets its copy through an intermediate pipe,
    // as large as stdin's so a tee of everything buffered fits.
    zcio::PipePool pool(1, zcio::GetPipeCapacity(kIn).value_or(cfg.pipe_size));
    std::optional<zcio::PipePool::Guard> relay;
    if (!IsPipe(kOut))
    {
        auto guard = pool.AcquireGuarded();
        if (!guard)
        {
            co_return std::unexpected(guard.error());
        }
        relay.emplace(std::move(*guard));
        zcio::alog::info("stdout is not a pipe, relaying through an intermediate pipe");
    }
    const int tee_out = relay ? relay->get().write_end.Get() : kOut;

    uint64_t total = 0;
    while (true)
    {
        auto n = co_await zcio::AsyncTee(ctx, kIn, tee_out, cfg.chunk_size);
        if (!n)
        {
            co_return std::unexpected(n.error());
        }
        if (*n == 0)
        {
            break;
        }

        if (relay)
        {
            if (auto r = co_await SpliceAll(ctx, relay->get().read_end.Get(), kOut, *n); !r)
            {
                co_return std::unexpected(r.error());
            }
        }

        // Consume exactly what was duplicated; the next tee starts after it.
        if (auto r = co_await SpliceAll(ctx, kIn, file_fd, *n); !r)
        {
            co_return std::unexpected(r.error());
        }

        total += *n;
        zcio::alog::debug("chunk of {} bytes, {} so far", *n, total);
    }
    co_return total;
}

}  // namespace

int main(int argc, char** argv)
{
    gflags::SetUsageMessage("ztee [flags] FILE  (stdin must be a pipe)");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    if (argc != 2)
    {
        std::println(stderr, "usage: {} [flags] FILE", argv[0]);
        return 1;
    }

    zcio::TeeConfig cfg;
    cfg.pipe_size = FLAGS_pipe_size;
    cfg.chunk_size = FLAGS_chunk_size;
    cfg.append = FLAGS_append;

    const auto level = zcio::ParseLogLevel(FLAGS_log_level);
    if (!level)
    {
        std::println(stderr, "unknown --log_level '{}'", FLAGS_log_level);
        return 1;
    }
    cfg.log_level = *level;

    try
    {
        cfg.Validate();
    }
    catch (const std::invalid_argument& e)
    {
        std::println(stderr, "invalid configuration: {}", e.what());
        return 1;
    }

    zcio::alog::g_level = cfg.log_level;
    zcio::alog::Session log_session;

    if (!IsPipe(STDIN_FILENO))
    {
        zcio::alog::error("stdin is not a pipe");
        return 1;
    }

    for (const int fd : {STDIN_FILENO, STDOUT_FILENO})
    {
        if (!IsPipe(fd))
        {
            continue;
        }
        if (auto r = zcio::MakeNonBlocking(fd); !r)
        {
            zcio::alog::error("fd {}: cannot set O_NONBLOCK: {}", fd, r.error().message());
            return 1;
        }
        if (cfg.pipe_size > 0)
        {
            if (auto r = zcio::SetPipeCapacity(fd, cfg.pipe_size); !r)
            {
                zcio::alog::warn("fd {}: pipe capacity {} not applied: {}", fd, cfg.pipe_size, r.error().message());
            }
        }
    }

    // splice(2) rejects O_APPEND targets, so appending means seeking to the end.
    const int mode = O_WRONLY | O_CREAT | O_CLOEXEC | (cfg.append ? 0 : O_TRUNC);
    zcio::UniqueFd file{::open(argv[1], mode, 0644)};
    if (!file.Valid() || (cfg.append && ::lseek(file.Get(), 0, SEEK_END) < 0))
    {
        zcio::alog::error("{}: {}", argv[1], std::error_code(errno, std::system_category()).message());
        return 1;
    }

    zcio::IoContext ctx;
    auto task = Run(ctx, cfg, file.Get());
    ctx.RunUntilDone(task);

    auto result = task.Result();
    if (!result)
    {
        zcio::alog::error("transfer failed: {}", result.error().message());
        return 1;
    }
    zcio::alog::info("{} bytes written to {}", *result, argv[1]);
    return 0;
}
