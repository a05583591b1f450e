#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "zcio/descriptor.hpp"
#include "zcio/result.hpp"

namespace zcio
{

/**
 * A pool of non-blocking pipes used as intermediate buffers for splice.
 *
 * Pipes are created lazily and reused to avoid a pipe2()/close() pair per
 * transfer. When a capacity is configured every new pipe is grown to it
 * before being handed out; pipes returned while still holding data are
 * closed rather than pooled, so an acquired pipe always starts empty.
 */
class PipePool
{
public:
    explicit PipePool(size_t max_size = 4, size_t capacity = 0) : max_size_(max_size), capacity_(capacity)
    {
        pool_.reserve(max_size);
    }

    PipePool(const PipePool&) = delete;
    PipePool& operator=(const PipePool&) = delete;
    PipePool(PipePool&&) = default;
    PipePool& operator=(PipePool&&) = default;

    /// Pops a pooled pipe or creates one. Fails only if pipe2() fails.
    Result<Pipe> Acquire();

    /// Returns a pipe for reuse; closes it if the pool is full or it is not empty.
    void Release(Pipe p);

    [[nodiscard]] size_t Idle() const { return pool_.size(); }
    [[nodiscard]] size_t Capacity() const { return capacity_; }

    /**
     * RAII guard for automatic pipe release.
     */
    class Guard
    {
    public:
        Guard(PipePool& pool, Pipe p) : pool_(&pool), pipe_(std::move(p)) {}
        ~Guard()
        {
            if (pool_)
                pool_->Release(std::move(pipe_));
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& o) noexcept : pool_(std::exchange(o.pool_, nullptr)), pipe_(std::move(o.pipe_)) {}
        Guard& operator=(Guard&&) = delete;

        Pipe& get() { return pipe_; }
        const Pipe& get() const { return pipe_; }

    private:
        PipePool* pool_;
        Pipe pipe_;
    };

    Result<Guard> AcquireGuarded();

private:
    std::vector<Pipe> pool_;
    size_t max_size_;
    size_t capacity_;
};

}  // namespace zcio
