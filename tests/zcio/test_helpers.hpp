#pragma once
// tests/zcio/test_helpers.hpp
// Common test utilities for zcio tests

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "zcio/descriptor.hpp"
#include "zcio/io_context.hpp"
#include "zcio/ops.hpp"
#include "zcio/task.hpp"

namespace zcio::test {

// -----------------------------------------------------------------------------
// Pipes
// -----------------------------------------------------------------------------

/// Creates a pipe or fails the current test
inline Pipe MustPipe(int flags = O_CLOEXEC) {
    auto p = MakePipe(flags);
    EXPECT_TRUE(p.has_value()) << "pipe2: " << p.error().message();
    return p ? std::move(*p) : Pipe{};
}

inline Pipe MustNonBlockingPipe() {
    return MustPipe(O_NONBLOCK | O_CLOEXEC);
}

/// Writes all of data to fd (fd may be non-blocking if data fits)
inline bool WriteAll(int fd, std::string_view data) {
    while (!data.empty()) {
        const ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

/// Reads whatever is available (non-blocking fd) up to max bytes
inline std::string ReadAvailable(int fd, size_t max = 1 << 20) {
    std::string out;
    char buf[4096];
    while (out.size() < max) {
        const ssize_t n = ::read(fd, buf, std::min(sizeof(buf), max - out.size()));
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

/// Fills a non-blocking pipe until write() reports EAGAIN; returns bytes written
inline size_t FillPipe(int write_fd) {
    std::string block(4096, 'f');
    size_t total = 0;
    while (true) {
        const ssize_t n = ::write(write_fd, block.data(), block.size());
        if (n < 0) break;
        total += static_cast<size_t>(n);
    }
    return total;
}

// -----------------------------------------------------------------------------
// Files
// -----------------------------------------------------------------------------

/// Creates a temporary file (unlinked, so it disappears on close)
inline UniqueFd MakeTempFile() {
    char path[] = "/tmp/zcio_testXXXXXX";
    int fd = ::mkstemp(path);
    if (fd >= 0) {
        ::unlink(path);
    }
    return UniqueFd{fd};
}

/// Creates a temporary file with initial content, position rewound to 0
inline UniqueFd MakeTempFileWithContent(std::string_view content) {
    auto fd = MakeTempFile();
    if (fd.Valid() && !content.empty()) {
        WriteAll(fd.Get(), content);
        ::lseek(fd.Get(), 0, SEEK_SET);
    }
    return fd;
}

/// Reads len bytes of a file at offset without moving its position
inline std::string PreadString(int fd, size_t len, off_t offset) {
    std::string out(len, '\0');
    const ssize_t n = ::pread(fd, out.data(), len, offset);
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

// -----------------------------------------------------------------------------
// Scheduler helpers
// -----------------------------------------------------------------------------

/// Drives ctx in short sleeps until done() holds or the timeout expires.
/// Tasks under test are started by the caller (once) before this runs.
template <typename Pred>
bool RunUntil(IoContext& ctx, Pred&& done, std::chrono::milliseconds timeout) {
    auto driver = [&]() -> Task<> {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!done() && std::chrono::steady_clock::now() < deadline) {
            co_await AsyncSleep(ctx, std::chrono::milliseconds{2});
        }
    };
    auto d = driver();
    ctx.RunUntilDone(d);
    return done();
}

/// Starts t and drives ctx until it finishes; returns false on timeout.
template <typename T>
bool StartAndRun(IoContext& ctx, Task<T>& t, std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
    t.Start();
    return RunUntil(ctx, [&] { return t.Done(); }, timeout);
}

}  // namespace zcio::test
