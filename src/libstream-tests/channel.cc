#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "diskxfer/stream/channel.hh"
#include "diskxfer/util/url.hh"
#include "diskxfer/util/tests/capturing-logger.hh"

#include "test-util.hh"

#include <fcntl.h>

namespace diskxfer {

using ::testing::HasSubstr;

TEST(FdChannel, writesAreBufferedUntilFlushed)
{
    auto [ours, theirs] = socketPair();
    FdChannel channel(std::move(theirs), ChannelOptions{.bufferSize = 1024});

    channel("abc");
    ASSERT_EQ(channel.bytesWritten(), 0u);
    channel.flush();
    ASSERT_EQ(channel.bytesWritten(), 3u);

    char buf[3];
    readFull(ours.get(), buf, sizeof(buf));
    ASSERT_EQ(std::string_view(buf, sizeof(buf)), "abc");
}

TEST(FdChannel, unbufferedWritesGoStraightThrough)
{
    auto [ours, theirs] = socketPair();
    FdChannel channel(std::move(theirs), ChannelOptions{.unbuffered = true});

    channel("abc");
    ASSERT_EQ(channel.bytesWritten(), 3u);
}

TEST(FdChannel, readsExactly)
{
    auto [ours, theirs] = socketPair();
    FdChannel channel(std::move(theirs), {});

    writeFull(ours.get(), "0123456789");
    ours.close();

    char buf[4];
    channel(buf, sizeof(buf));
    ASSERT_EQ(std::string_view(buf, sizeof(buf)), "0123");
    ASSERT_EQ(channel.drain(), "456789");
    ASSERT_THROW(channel(buf, 1), EndOfFile);
}

TEST(FdChannel, skipOutputSendsZerosOnStreams)
{
    auto [ours, theirs] = socketPair();
    {
        FdChannel channel(std::move(theirs), {});
        channel("x");
        channel.skipOutput(100 * 1024);
        channel("y");
        channel.close();
    }
    ASSERT_EQ(drainFD(ours.get()), "x" + std::string(100 * 1024, 0) + "y");
}

TEST(FdChannel, closeReleasesTheDescriptorOnce)
{
    auto [ours, theirs] = socketPair();
    FdChannel channel(std::move(theirs), {});
    auto fd = channel.get();

    ASSERT_FALSE(channel.isClosed());
    ASSERT_TRUE(channel.good());
    channel.close();
    ASSERT_TRUE(channel.isClosed());
    ASSERT_FALSE(channel.good());
    ASSERT_EQ(fcntl(fd, F_GETFD), -1);

    ASSERT_THROW(channel.close(), Error);
}

TEST(FdChannel, destructorFlushes)
{
    auto [ours, theirs] = socketPair();
    {
        FdChannel channel(std::move(theirs), {});
        channel("pending");
    }
    ASSERT_EQ(drainFD(ours.get()), "pending");
}

TEST(FdChannel, borrowedDescriptorStaysOpen)
{
    auto [ours, theirs] = socketPair();
    {
        FdChannel channel(theirs.get(), {});
        channel("x");
        channel.close();
    }
    ASSERT_NE(fcntl(theirs.get(), F_GETFD), -1);
}

/**
 * A channel whose transport fails when it is released.
 */
class FailingCloseChannel : public MemoryChannel
{
protected:
    void doClose() override
    {
        throw TransportError("disk full");
    }

public:
    ~FailingCloseChannel()
    {
        closeSilently();
    }
};

TEST(closeOnError, keepsTheCloseErrorQuiet)
{
    LoggerCapture capture;
    FailingCloseChannel channel;

    closeOnError(channel);

    ASSERT_TRUE(channel.isClosed());
    ASSERT_EQ(capture->messages.size(), 1u);
    ASSERT_THAT(capture->messages.front(), HasSubstr("disk full"));
}

TEST(closeOnError, alreadyClosed)
{
    LoggerCapture capture;
    MemoryChannel channel;
    channel.close();

    closeOnError(channel);

    ASSERT_TRUE(capture->messages.empty());
}

TEST(Channel, closeReportsFailures)
{
    FailingCloseChannel channel;
    ASSERT_THROW(channel.close(), TransportError);
    ASSERT_TRUE(channel.isClosed());
}

TEST(openDestinationFile, createsWithoutTruncating)
{
    TempFile file;
    writeFull(file.fd.get(), "existing");

    {
        auto fd = openDestinationFile(file.path, false);
        pwriteFull(fd.get(), "E", 0);
    }
    ASSERT_EQ(readFile(file.path), "Existing");

    auto fresh = file.path + ".new";
    {
        auto fd = openDestinationFile(fresh, true);
        ASSERT_TRUE(fd);
    }
    ASSERT_EQ(readFile(fresh), "");
    unlink(fresh.c_str());
}

TEST(openDestinationFile, missingDirectory)
{
    ASSERT_THROW(openDestinationFile("/nonexistent/dir/disk.img", false), SysError);
}

TEST(FdChannel, skipAtTheEndExtendsAFile)
{
    TempFile file;

    {
        FdChannel channel(openDestinationFile(file.path, false), {.seekable = true});
        channel("abc");
        channel.skipOutput(5);
        channel.close();
    }

    ASSERT_EQ(readFile(file.path), std::string("abc") + std::string(5, '\0'));
}

TEST(FdChannel, flushExtendsAFileToo)
{
    TempFile file;
    FdChannel channel(openDestinationFile(file.path, false), {.seekable = true});
    channel.skipOutput(4);
    channel.flush();
    ASSERT_EQ(readFile(file.path).size(), 4u);
    channel.close();
}

TEST(CurlChannel, connectionRefused)
{
    ASSERT_THROW(
        CurlChannel channel(parseURL("http://127.0.0.1:1/upload"), {.connectTimeout = 5}), TransportError);
}

} // namespace diskxfer
