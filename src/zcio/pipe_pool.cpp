#include "zcio/pipe_pool.hpp"

#include <fcntl.h>

#include "zcio/logger.hpp"
#include "zcio/pipe.hpp"

namespace zcio
{

Result<Pipe> PipePool::Acquire()
{
    if (!pool_.empty())
    {
        Pipe p = std::move(pool_.back());
        pool_.pop_back();
        return p;
    }

    auto p = MakePipe(O_NONBLOCK | O_CLOEXEC);
    if (!p)
    {
        return std::unexpected(p.error());
    }

    if (capacity_ > 0)
    {
        // Both ends share one buffer; sizing either is enough.
        if (auto applied = SetPipeCapacity(p->write_end, capacity_); !applied)
        {
            alog::warn("pipe capacity {} not applied: {}", capacity_, applied.error().message());
        }
    }
    return p;
}

void PipePool::Release(Pipe p)
{
    if (!p.Valid())
        return;

    if (pool_.size() >= max_size_)
        return;  // p closes on scope exit

    // Leftover bytes would leak into the next transfer
    if (auto pending = PipeBytesPending(p.read_end.Get()); !pending || *pending > 0)
        return;

    pool_.push_back(std::move(p));
}

Result<PipePool::Guard> PipePool::AcquireGuarded()
{
    auto p = Acquire();
    if (!p)
        return std::unexpected(p.error());
    return Guard(*this, std::move(*p));
}

}  // namespace zcio
