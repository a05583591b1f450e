#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include "zcio/result.hpp"

namespace zcio
{

// -----------------------------------------------------------------------------
// Concepts & Helpers
// -----------------------------------------------------------------------------

// Matches int exactly, or any type with a .Get() -> int method (like UniqueFd).
// bool, size_t and friends are rejected rather than converted.
template <typename T>
concept FileDescriptor = std::same_as<std::remove_cvref_t<T>, int> || requires(const T& t) {
    { t.Get() } -> std::same_as<int>;
};

// Helper to extract the raw fd
template <FileDescriptor F>
constexpr int GetRawFd(const F& fd)
{
    if constexpr (std::same_as<std::remove_cvref_t<F>, int>)
    {
        return static_cast<int>(fd);
    }
    else
    {
        return fd.Get();
    }
}

// -----------------------------------------------------------------------------
// UniqueFd - owning descriptor
// -----------------------------------------------------------------------------

class UniqueFd
{
public:
    UniqueFd() = default;
    explicit UniqueFd(const int fd) : fd_(fd) {}
    ~UniqueFd() { Close(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept
    {
        if (this != &other)
        {
            Close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] int Get() const { return fd_; }
    [[nodiscard]] int Release() { return std::exchange(fd_, -1); }
    [[nodiscard]] bool Valid() const { return fd_ >= 0; }

    void Close()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

// -----------------------------------------------------------------------------
// Pipe - owning (read end, write end) pair
// -----------------------------------------------------------------------------

struct Pipe
{
    UniqueFd read_end;
    UniqueFd write_end;

    [[nodiscard]] bool Valid() const { return read_end.Valid() && write_end.Valid(); }

    void Close()
    {
        read_end.Close();
        write_end.Close();
    }
};

/// Creates a pipe with pipe2(2). Pass O_NONBLOCK | O_CLOEXEC for scheduler use.
inline Result<Pipe> MakePipe(const int flags = O_CLOEXEC)
{
    int fds[2];
    if (::pipe2(fds, flags) < 0)
    {
        return LastError();
    }
    return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

}  // namespace zcio
