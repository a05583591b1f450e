// tests/zcio/syscall_tests.cpp
// Tests for the raw tee/splice bindings on real pipes and files

#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include "zcio/coop.hpp"
#include "zcio/syscall.hpp"
#include "test_helpers.hpp"

using namespace zcio;
using namespace zcio::test;

class SyscallTest : public ::testing::Test {
protected:
    Pipe a = MustNonBlockingPipe();
    Pipe b = MustNonBlockingPipe();
    Pipe c = MustNonBlockingPipe();
};

// -----------------------------------------------------------------------------
// Tee
// -----------------------------------------------------------------------------

TEST_F(SyscallTest, TeeDuplicatesWithoutConsuming) {
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "0123456789"));

    auto n = Tee(a.read_end, b.write_end, 10);
    ASSERT_TRUE(n.has_value()) << n.error().message();
    EXPECT_EQ(*n, 10u);

    EXPECT_EQ(ReadAvailable(b.read_end.Get()), "0123456789");
    EXPECT_EQ(ReadAvailable(a.read_end.Get()), "0123456789");
}

TEST_F(SyscallTest, TeeThenSpliceScenario) {
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "abcdefghij"));

    auto teed = Tee(a.read_end, b.write_end, 10);
    ASSERT_TRUE(teed.has_value());
    EXPECT_EQ(*teed, 10u);

    // Source still holds its 10 bytes: splice moves them on
    auto moved = Splice(a.read_end, std::nullopt, c.write_end, std::nullopt, 10);
    ASSERT_TRUE(moved.has_value()) << moved.error().message();
    EXPECT_EQ(moved->bytes, 10u);
    EXPECT_FALSE(moved->off_in.has_value());
    EXPECT_FALSE(moved->off_out.has_value());

    EXPECT_EQ(ReadAvailable(c.read_end.Get()), "abcdefghij");
    EXPECT_EQ(ReadAvailable(b.read_end.Get()), "abcdefghij");

    // splice consumed the source
    char ch;
    EXPECT_EQ(::read(a.read_end.Get(), &ch, 1), -1);
    EXPECT_EQ(errno, EAGAIN);
}

TEST_F(SyscallTest, TeeLimitsToRequestedLength) {
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "0123456789"));

    auto n = Tee(a.read_end, b.write_end, 4);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 4u);
    EXPECT_EQ(ReadAvailable(b.read_end.Get()), "0123");
}

TEST_F(SyscallTest, ZeroLengthMovesNothing) {
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "payload"));

    auto t = Tee(a.read_end, b.write_end, 0);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, 0u);

    auto s = Splice(a.read_end, std::nullopt, b.write_end, std::nullopt, 0);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->bytes, 0u);

    EXPECT_EQ(ReadAvailable(b.read_end.Get()), "");
    EXPECT_EQ(ReadAvailable(a.read_end.Get()), "payload");
}

TEST_F(SyscallTest, TeeOnEmptyNonBlockingPipeWouldBlock) {
    auto n = Tee(a.read_end, b.write_end, 10);
    ASSERT_FALSE(n.has_value());
    EXPECT_TRUE(IsErrno(n.error(), EAGAIN));
}

TEST_F(SyscallTest, TeeIntoFullPipeWouldBlock) {
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "data"));
    ASSERT_GT(FillPipe(b.write_end.Get()), 0u);

    auto n = Tee(a.read_end, b.write_end, 4);
    ASSERT_FALSE(n.has_value());
    EXPECT_TRUE(IsErrno(n.error(), EAGAIN));
}

TEST_F(SyscallTest, NonBlockFlagOnBlockingPipes) {
    auto x = MustPipe();
    auto y = MustPipe();

    auto n = Tee(x.read_end, y.write_end, 10, SpliceFlag::NonBlock);
    ASSERT_FALSE(n.has_value());
    EXPECT_TRUE(IsErrno(n.error(), EAGAIN));
}

TEST_F(SyscallTest, MakeNonBlockingTurnsHangIntoWouldBlock) {
    auto x = MustPipe();
    auto y = MustPipe();
    ASSERT_TRUE(MakeNonBlocking(x.read_end).has_value());
    ASSERT_TRUE(MakeNonBlocking(y.write_end).has_value());

    EXPECT_NE(::fcntl(x.read_end.Get(), F_GETFL) & O_NONBLOCK, 0);

    auto s = Splice(x.read_end, std::nullopt, y.write_end, std::nullopt, 10);
    ASSERT_FALSE(s.has_value());
    EXPECT_TRUE(IsErrno(s.error(), EAGAIN));
}

TEST_F(SyscallTest, EndOfInputReturnsZero) {
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "xy"));
    a.write_end.Close();

    auto first = Splice(a.read_end, std::nullopt, b.write_end, std::nullopt, 64);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->bytes, 2u);

    auto eof = Splice(a.read_end, std::nullopt, b.write_end, std::nullopt, 64);
    ASSERT_TRUE(eof.has_value());
    EXPECT_EQ(eof->bytes, 0u);

    auto tee_eof = Tee(a.read_end, c.write_end, 64);
    ASSERT_TRUE(tee_eof.has_value());
    EXPECT_EQ(*tee_eof, 0u);
}

// -----------------------------------------------------------------------------
// Fatal errors pass through with their errno
// -----------------------------------------------------------------------------

TEST_F(SyscallTest, BadDescriptorIsReported) {
    auto n = Tee(-1, b.write_end.Get(), 10);
    ASSERT_FALSE(n.has_value());
    EXPECT_TRUE(IsErrno(n.error(), EBADF));
    EXPECT_FALSE(n.error().message().empty());

    auto s = Splice(a.read_end.Get(), std::nullopt, 12345, std::nullopt, 10);
    ASSERT_FALSE(s.has_value());
    EXPECT_TRUE(IsErrno(s.error(), EBADF));
}

TEST_F(SyscallTest, TeeBetweenNonPipesIsInvalid) {
    auto f1 = MakeTempFileWithContent("abc");
    auto f2 = MakeTempFile();

    auto n = Tee(f1, f2, 3);
    ASSERT_FALSE(n.has_value());
    EXPECT_TRUE(IsErrno(n.error(), EINVAL));
}

TEST_F(SyscallTest, TeeSamePipeIsInvalid) {
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "abc"));
    auto n = Tee(a.read_end, a.write_end, 3);
    ASSERT_FALSE(n.has_value());
    EXPECT_TRUE(IsErrno(n.error(), EINVAL));
}

TEST_F(SyscallTest, SpliceToClosedReaderIsBrokenPipe) {
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "abc"));
    b.read_end.Close();

    // SIGPIPE would terminate the test binary
    std::signal(SIGPIPE, SIG_IGN);
    auto s = Splice(a.read_end, std::nullopt, b.write_end, std::nullopt, 3);
    ASSERT_FALSE(s.has_value());
    EXPECT_TRUE(IsErrno(s.error(), EPIPE));
}

TEST_F(SyscallTest, OffsetOnPipeSideIsRejected) {
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "abc"));
    auto s = Splice(a.read_end, uint64_t{0}, b.write_end, std::nullopt, 3);
    ASSERT_FALSE(s.has_value());
    EXPECT_TRUE(IsErrno(s.error(), ESPIPE));
}

// -----------------------------------------------------------------------------
// Offsets on regular files
// -----------------------------------------------------------------------------

TEST_F(SyscallTest, SpliceFromFileAtOffsetReportsNewOffset) {
    auto file = MakeTempFileWithContent("0123456789");
    ASSERT_TRUE(file.Valid());

    auto s = Splice(file, uint64_t{3}, a.write_end, std::nullopt, 4);
    ASSERT_TRUE(s.has_value()) << s.error().message();
    EXPECT_EQ(s->bytes, 4u);
    ASSERT_TRUE(s->off_in.has_value());
    EXPECT_EQ(*s->off_in, 7u);
    EXPECT_FALSE(s->off_out.has_value());
    EXPECT_EQ(ReadAvailable(a.read_end.Get()), "3456");

    // The explicit offset leaves the file position alone
    EXPECT_EQ(::lseek(file.Get(), 0, SEEK_CUR), 0);
}

TEST_F(SyscallTest, SpliceFromFileWithoutOffsetAdvancesPosition) {
    auto file = MakeTempFileWithContent("0123456789");
    ASSERT_TRUE(file.Valid());

    auto s = Splice(file, std::nullopt, a.write_end, std::nullopt, 6);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->bytes, 6u);
    EXPECT_FALSE(s->off_in.has_value());
    EXPECT_EQ(::lseek(file.Get(), 0, SEEK_CUR), 6);
}

TEST_F(SyscallTest, SpliceIntoFileAtOffset) {
    auto file = MakeTempFileWithContent("----------");
    ASSERT_TRUE(file.Valid());
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "XYZ"));

    auto s = Splice(a.read_end, std::nullopt, file, uint64_t{5}, 3);
    ASSERT_TRUE(s.has_value()) << s.error().message();
    EXPECT_EQ(s->bytes, 3u);
    ASSERT_TRUE(s->off_out.has_value());
    EXPECT_EQ(*s->off_out, 8u);
    EXPECT_EQ(PreadString(file.Get(), 10, 0), "-----XYZ--");
}

TEST_F(SyscallTest, SpliceFromFilePastEndIsEof) {
    auto file = MakeTempFileWithContent("abc");
    auto s = Splice(file, uint64_t{100}, a.write_end, std::nullopt, 10);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->bytes, 0u);
    EXPECT_EQ(*s->off_in, 100u);
}

// -----------------------------------------------------------------------------
// Descriptor resolution
// -----------------------------------------------------------------------------

namespace {
struct WrappedFd {
    int fd;
    int Get() const { return fd; }
};
struct WideFd {
    long fd;
    long Get() const { return fd; }
};
}  // namespace

static_assert(FileDescriptor<int>);
static_assert(FileDescriptor<const int&>);
static_assert(FileDescriptor<UniqueFd>);
static_assert(FileDescriptor<WrappedFd>);
static_assert(!FileDescriptor<bool>);
static_assert(!FileDescriptor<double>);
static_assert(!FileDescriptor<size_t>);
static_assert(!FileDescriptor<long>);
static_assert(!FileDescriptor<WideFd>);

TEST(FileDescriptorTest, ResolvesIntAndAccessor) {
    EXPECT_EQ(GetRawFd(7), 7);
    EXPECT_EQ(GetRawFd(WrappedFd{9}), 9);

    UniqueFd owned{::dup(STDERR_FILENO)};
    ASSERT_TRUE(owned.Valid());
    EXPECT_EQ(GetRawFd(owned), owned.Get());
}

TEST_F(SyscallTest, AccessorObjectsReachTheKernel) {
    ASSERT_TRUE(WriteAll(a.write_end.Get(), "wrap"));

    auto r = Tee(WrappedFd{a.read_end.Get()}, WrappedFd{b.write_end.Get()}, 16);
    ASSERT_TRUE(r.has_value()) << r.error().message();
    EXPECT_EQ(*r, 4u);
}

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
