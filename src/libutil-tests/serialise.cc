#include <gtest/gtest.h>

#include "diskxfer/util/serialise.hh"

#include <sys/socket.h>
#include <unistd.h>

namespace diskxfer {

/* ----------------------------------------------------------------------------
 * StringSource / StringSink
 * --------------------------------------------------------------------------*/

TEST(StringSource, readsExactLengths)
{
    std::string data = "0123456789";
    StringSource source(data);

    char buf[4];
    source(buf, 4);
    ASSERT_EQ(std::string_view(buf, 4), "0123");
    source.skip(2);
    source(buf, 4);
    ASSERT_EQ(std::string_view(buf, 4), "6789");
    ASSERT_THROW(source(buf, 1), EndOfFile);
}

TEST(StringSource, drain)
{
    std::string data = "everything";
    StringSource source(data);
    ASSERT_EQ(source.drain(), "everything");
}

TEST(StringSink, appends)
{
    StringSink sink;
    sink("abc");
    sink("");
    sink("def");
    ASSERT_EQ(sink.s, "abcdef");
}

/* ----------------------------------------------------------------------------
 * BufferedSink
 * --------------------------------------------------------------------------*/

struct RecordingSink : BufferedSink
{
    std::vector<std::string> writes;

    RecordingSink(size_t bufSize)
        : BufferedSink(bufSize)
    {
    }

    void writeUnbuffered(std::string_view data) override
    {
        writes.emplace_back(data);
    }
};

TEST(BufferedSink, coalescesSmallWrites)
{
    RecordingSink sink(8);
    sink("ab");
    sink("cd");
    ASSERT_TRUE(sink.writes.empty());
    sink.flush();
    ASSERT_EQ(sink.writes, std::vector<std::string>{"abcd"});
}

TEST(BufferedSink, largeWritesBypassTheBuffer)
{
    RecordingSink sink(4);
    sink("a");
    sink("bcdefgh");
    ASSERT_EQ(sink.writes, (std::vector<std::string>{"a", "bcdefgh"}));
}

TEST(BufferedSink, zeroSizeBufferWritesThrough)
{
    RecordingSink sink(0);
    sink("x");
    sink("yz");
    ASSERT_EQ(sink.writes, (std::vector<std::string>{"x", "yz"}));
}

/* ----------------------------------------------------------------------------
 * FdSink / FdSource
 * --------------------------------------------------------------------------*/

TEST(FdSource, readsAcrossBufferBoundaries)
{
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
    AutoCloseFD a(fds[0]), b(fds[1]);

    {
        FdSink sink(b.get(), 3);
        sink("hello ");
        sink("world");
        sink.flush();
        ASSERT_EQ(sink.written, 11u);
    }
    b.close();

    FdSource source(a.get(), 4);
    std::string line(11, 0);
    source(line.data(), line.size());
    ASSERT_EQ(line, "hello world");
    ASSERT_EQ(source.bytesRead, 11u);

    char c;
    ASSERT_THROW(source(&c, 1), EndOfFile);
    ASSERT_FALSE(source.good());
}

TEST(FdSource, skipOnAPipe)
{
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    AutoCloseFD readSide(fds[0]), writeSide(fds[1]);
    writeFull(writeSide.get(), "0123456789");
    writeSide.close();

    FdSource source(readSide.get());
    source.skip(7);
    ASSERT_EQ(source.drain(), "789");
}

TEST(BufferedSource, readLine)
{
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    AutoCloseFD readSide(fds[0]), writeSide(fds[1]);
    writeFull(writeSide.get(), "HTTP/1.1 200 OK\r\nlast");
    writeSide.close();

    FdSource source(readSide.get());
    ASSERT_EQ(source.readLine(), "HTTP/1.1 200 OK");
    ASSERT_EQ(source.readLine(true), "last");
}

} // namespace diskxfer
