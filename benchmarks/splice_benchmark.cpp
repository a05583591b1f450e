// benchmarks/splice_benchmark.cpp
// Throughput of file -> pipe -> /dev/null splicing for several pipe capacities.

#include <benchmark/benchmark.h>

#include <array>
#include <cstdlib>

#include <fcntl.h>
#include <unistd.h>

#include "zcio/coop.hpp"
#include "zcio/pipe.hpp"
#include "zcio/syscall.hpp"

namespace
{

constexpr size_t kFileSize = 16 * 1024 * 1024;

zcio::UniqueFd MakeSourceFile()
{
    char path[] = "/tmp/zcio_benchXXXXXX";
    zcio::UniqueFd fd{::mkstemp(path)};
    if (!fd.Valid())
    {
        return fd;
    }
    ::unlink(path);

    std::array<char, 64 * 1024> block;
    block.fill('z');
    for (size_t written = 0; written < kFileSize; written += block.size())
    {
        if (::write(fd.Get(), block.data(), block.size()) != static_cast<ssize_t>(block.size()))
        {
            return zcio::UniqueFd{};
        }
    }
    return fd;
}

void BM_SpliceThroughPipe(benchmark::State& state)
{
    const auto capacity = static_cast<size_t>(state.range(0));

    auto source = MakeSourceFile();
    zcio::UniqueFd sink{::open("/dev/null", O_WRONLY | O_CLOEXEC)};
    auto pipe = zcio::MakePipe(O_CLOEXEC);
    if (!source.Valid() || !sink.Valid() || !pipe)
    {
        state.SkipWithError("setup failed");
        return;
    }

    auto applied = zcio::SetPipeCapacity(pipe->write_end, capacity);
    if (!applied)
    {
        state.SkipWithError("pipe capacity not permitted");
        return;
    }

    for (auto _ : state)
    {
        uint64_t offset = 0;
        while (offset < kFileSize)
        {
            auto in = zcio::Splice(source.Get(), offset, pipe->write_end.Get(), std::nullopt, *applied,
                                   zcio::SpliceFlag::Move);
            if (!in || in->bytes == 0)
            {
                state.SkipWithError("splice into pipe failed");
                return;
            }
            offset = *in->off_in;

            size_t left = in->bytes;
            while (left > 0)
            {
                auto out = zcio::BlockingSplice(pipe->read_end.Get(), std::nullopt, sink.Get(), std::nullopt, left,
                                                zcio::SpliceFlag::Move);
                if (!out || out->bytes == 0)
                {
                    state.SkipWithError("splice out of pipe failed");
                    return;
                }
                left -= out->bytes;
            }
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(kFileSize));
    state.counters["pipe_capacity"] = static_cast<double>(*applied);
}

BENCHMARK(BM_SpliceThroughPipe)->Arg(64 * 1024)->Arg(256 * 1024)->Arg(1024 * 1024);

}  // namespace

BENCHMARK_MAIN();
