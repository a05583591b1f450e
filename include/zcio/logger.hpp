#pragma once

/**
 * logger.hpp - Asynchronous logger
 *
 * Producers format into a fixed-size record and push it onto a per-thread
 * single-producer ring; one background thread, woken through an eventfd,
 * drains every ring to the output descriptor. Logging never blocks the caller:
 * a full ring (or a process with more threads than slots) drops the record and
 * counts it in dropped_count().
 *
 * Records are only written while the logger is started; start() once at
 * process startup, stop() flushes and joins.
 */

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <format>
#include <source_location>
#include <system_error>
#include <thread>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include <sys/eventfd.h>
#include <sys/syscall.h>

#ifndef ZCIO_LOG_BUILD_LEVEL
#define ZCIO_LOG_BUILD_LEVEL 0
#endif

namespace zcio::alog
{

enum class Level : uint8_t
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Fatal = 4,
    Disabled = 5
};

inline std::atomic<Level> g_level{Level::Info};
inline std::atomic<bool> g_colors{true};

constexpr Level kBuildMinLevel = static_cast<Level>(ZCIO_LOG_BUILD_LEVEL);

constexpr size_t kMaxThreads = 16;   // producer threads with a ring
constexpr size_t kQueueSize = 256;   // records per ring (power of 2)
constexpr size_t kMsgMax = 512;      // bytes per record (incl '\n')

namespace detail
{

struct LevelConfig
{
    const char* label;
    const char* color;
};

constexpr LevelConfig kCfg[] = {
    {"DBG", "\033[36m"},
    {"INF", "\033[32m"},
    {"WRN", "\033[33m"},
    {"ERR", "\033[31m"},
    {"FTL", "\033[35m"},
};
constexpr const char* kReset = "\033[0m";

inline const char* Basename(const char* path)
{
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

struct Record
{
    uint16_t len;
    uint8_t level;
    char msg[kMsgMax];
};

class Ring
{
public:
    static constexpr size_t kMask = kQueueSize - 1;
    static_assert((kQueueSize & kMask) == 0, "kQueueSize must be a power of 2");

    bool TryPush(const Record& r) noexcept
    {
        const uint32_t h = head_.load(std::memory_order_relaxed);
        if (h - tail_.load(std::memory_order_acquire) == kQueueSize)
        {
            return false;
        }
        buf_[h & kMask] = r;
        head_.store(h + 1, std::memory_order_release);
        return true;
    }

    bool TryPop(Record& out) noexcept
    {
        const uint32_t t = tail_.load(std::memory_order_relaxed);
        if (t == head_.load(std::memory_order_acquire))
        {
            return false;
        }
        out = buf_[t & kMask];
        tail_.store(t + 1, std::memory_order_release);
        return true;
    }

private:
    std::atomic<uint32_t> head_{0};
    std::atomic<uint32_t> tail_{0};
    Record buf_[kQueueSize];
};

struct Slot
{
    std::atomic<bool> active{false};
    Ring ring;
};

inline Slot g_slots[kMaxThreads];
inline std::atomic<uint32_t> g_next_slot{0};

inline int g_wake_fd = -1;
inline std::atomic<bool> g_running{false};
inline std::jthread g_thread;
inline std::atomic<uint64_t> g_dropped{0};

constexpr uint32_t kNoSlot = UINT32_MAX;

inline uint32_t ThisThreadSlot()
{
    static thread_local uint32_t slot = [] {
        const uint32_t i = g_next_slot.fetch_add(1, std::memory_order_relaxed);
        if (i >= kMaxThreads)
        {
            return kNoSlot;
        }
        g_slots[i].active.store(true, std::memory_order_release);
        return i;
    }();
    return slot;
}

inline void Wake() noexcept
{
    const int fd = g_wake_fd;
    if (fd < 0)
    {
        return;
    }
    const uint64_t one = 1;
    // EAGAIN means a wake is already pending
    [[maybe_unused]] auto n = ::write(fd, &one, sizeof(one));
}

inline void DrainTo(const int out_fd)
{
    Record r{};
    for (auto& slot : g_slots)
    {
        if (!slot.active.load(std::memory_order_acquire))
        {
            continue;
        }
        while (slot.ring.TryPop(r))
        {
            [[maybe_unused]] auto n = ::write(out_fd, r.msg, r.len);
        }
    }
}

inline void Loop(const int out_fd)
{
    while (g_running.load(std::memory_order_acquire))
    {
        // The eventfd is non-blocking; sleep in poll until a producer wakes us.
        pollfd pfd{.fd = g_wake_fd, .events = POLLIN, .revents = 0};
        if (::poll(&pfd, 1, -1) < 0)
        {
            continue;
        }
        uint64_t n = 0;
        [[maybe_unused]] auto r = ::read(g_wake_fd, &n, sizeof(n));
        DrainTo(out_fd);
    }
    DrainTo(out_fd);
}

template <typename... Args>
void Format(Record& r, const Level lvl, const std::source_location loc, std::format_string<Args...> fmt,
            Args&&... args) noexcept
{
    r.level = static_cast<uint8_t>(lvl);

    const bool colors = g_colors.load(std::memory_order_relaxed);
    const auto& cfg = kCfg[static_cast<int>(lvl)];
    const auto tid = static_cast<uint32_t>(::syscall(SYS_gettid));
    const auto ms = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());

    char* p = r.msg;
    char* end = r.msg + kMsgMax - 1;  // room for '\n'

    p = std::format_to_n(p, end - p, "{}[{}] [{:%T}] [{}] {}:{} | ", colors ? cfg.color : "", cfg.label, ms, tid,
                         Basename(loc.file_name()), loc.line())
            .out;
    if (p < end)
    {
        p = std::format_to_n(p, end - p, fmt, std::forward<Args>(args)...).out;
    }
    if (colors && p < end)
    {
        p = std::format_to_n(p, end - p, "{}", kReset).out;
    }
    p = std::min(p, end);
    *p++ = '\n';
    r.len = static_cast<uint16_t>(p - r.msg);
}

}  // namespace detail

// ---- lifecycle ----

/// Starts the drain thread. out_fd defaults to stderr. Idempotent.
inline void start(const int out_fd = STDERR_FILENO)
{
    bool expected = false;
    if (!detail::g_running.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        return;
    }

    const int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0)
    {
        detail::g_running.store(false, std::memory_order_release);
        throw std::system_error(errno, std::system_category(), "eventfd");
    }
    detail::g_wake_fd = fd;
    detail::g_thread = std::jthread([out_fd] { detail::Loop(out_fd); });
}

/// Flushes pending records and joins the drain thread.
inline void stop()
{
    if (!detail::g_running.exchange(false, std::memory_order_acq_rel))
    {
        return;
    }
    detail::Wake();
    if (detail::g_thread.joinable())
    {
        detail::g_thread.join();
    }
    if (detail::g_wake_fd >= 0)
    {
        ::close(detail::g_wake_fd);
    }
    detail::g_wake_fd = -1;
}

/// start() on construction, stop() on destruction.
class Session
{
public:
    explicit Session(const int out_fd = STDERR_FILENO) { start(out_fd); }
    ~Session() { stop(); }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
};

inline uint64_t dropped_count()
{
    return detail::g_dropped.load(std::memory_order_relaxed);
}

// ---- logging API ----

template <Level L, typename... Args>
void log(const std::source_location loc, std::format_string<Args...> fmt, Args&&... args)
{
    if constexpr (kBuildMinLevel <= L)
    {
        if (g_level.load(std::memory_order_relaxed) > L || !detail::g_running.load(std::memory_order_relaxed))
        {
            return;
        }

        const uint32_t slot = detail::ThisThreadSlot();
        if (slot == detail::kNoSlot)
        {
            detail::g_dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        detail::Record r{};
        detail::Format(r, L, loc, fmt, std::forward<Args>(args)...);

        if (!detail::g_slots[slot].ring.TryPush(r))
        {
            detail::g_dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        detail::Wake();
    }
}

// The location is captured by a defaulted parameter of a wrapper struct so the
// format arguments can stay a plain pack.
template <typename... Args>
struct debug
{
    debug(std::format_string<Args...> f, Args&&... a, std::source_location loc = std::source_location::current())
    {
        log<Level::Debug>(loc, f, std::forward<Args>(a)...);
    }
};
template <typename... Args>
debug(std::format_string<Args...>, Args&&...) -> debug<Args...>;

template <typename... Args>
struct info
{
    info(std::format_string<Args...> f, Args&&... a, std::source_location loc = std::source_location::current())
    {
        log<Level::Info>(loc, f, std::forward<Args>(a)...);
    }
};
template <typename... Args>
info(std::format_string<Args...>, Args&&...) -> info<Args...>;

template <typename... Args>
struct warn
{
    warn(std::format_string<Args...> f, Args&&... a, std::source_location loc = std::source_location::current())
    {
        log<Level::Warn>(loc, f, std::forward<Args>(a)...);
    }
};
template <typename... Args>
warn(std::format_string<Args...>, Args&&...) -> warn<Args...>;

template <typename... Args>
struct error
{
    error(std::format_string<Args...> f, Args&&... a, std::source_location loc = std::source_location::current())
    {
        log<Level::Error>(loc, f, std::forward<Args>(a)...);
    }
};
template <typename... Args>
error(std::format_string<Args...>, Args&&...) -> error<Args...>;

template <typename... Args>
struct fatal
{
    fatal(std::format_string<Args...> f, Args&&... a, std::source_location loc = std::source_location::current())
    {
        log<Level::Fatal>(loc, f, std::forward<Args>(a)...);
    }
};
template <typename... Args>
fatal(std::format_string<Args...>, Args&&...) -> fatal<Args...>;

}  // namespace zcio::alog
