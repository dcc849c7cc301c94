#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "diskxfer/stream/chunked.hh"
#include "diskxfer/util/tests/capturing-logger.hh"

#include "test-util.hh"

namespace diskxfer {

using ::testing::Contains;

static std::string header(uint64_t offset, uint32_t length)
{
    auto bytes = ChunkHeader{.offset = offset, .length = length}.marshal();
    return std::string((const char *) bytes.data(), bytes.size());
}

static const std::string endMarker(ChunkHeader::size, 0);

static Stream smallStream()
{
    return Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(2), dataRun(filled(1, 'b'))});
}

TEST(ChunkHeader, isLittleEndian)
{
    auto bytes = ChunkHeader{.offset = 0x0102030405060708, .length = 0x0a0b0c0d}.marshal();
    ChunkHeader::Bytes expected{0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01, 0x0d, 0x0c, 0x0b, 0x0a};
    ASSERT_EQ(bytes, expected);
    ASSERT_EQ(ChunkHeader::unmarshal(bytes), (ChunkHeader{.offset = 0x0102030405060708, .length = 0x0a0b0c0d}));
}

TEST(ChunkHeader, endMarker)
{
    ASSERT_TRUE(ChunkHeader{}.isLast());
    ASSERT_FALSE((ChunkHeader{.offset = 0, .length = 1}).isLast());
    ASSERT_EQ(header(0, 0), endMarker);
}

TEST(serialiseChunked, framesEveryRunOfData)
{
    MemoryChannel channel;
    ProgressRecorder progress;

    auto work = serialiseChunked(channel, smallStream(), {.preZeroed = false}, progress.make());

    ASSERT_EQ(work, 2048u);
    ASSERT_EQ(
        channel.written,
        header(0, 512) + filled(1, 'a') + header(512, 1024) + filled(2, 0) + header(1536, 512) + filled(1, 'b')
            + endMarker);
    ASSERT_EQ(progress.calls.back(), 2048u);
    ASSERT_TRUE(progress.nonDecreasing());
}

TEST(serialiseChunked, leavesOutEmptyRunsOnPreZeroedDestinations)
{
    MemoryChannel channel;

    auto work = serialiseChunked(channel, smallStream(), {.preZeroed = true}, {});

    ASSERT_EQ(work, 1024u);
    ASSERT_EQ(channel.written, header(0, 512) + filled(1, 'a') + header(1536, 512) + filled(1, 'b') + endMarker);
    ASSERT_TRUE(channel.skips.empty());
}

TEST(serialiseChunked, emptyStreamIsJustTheEndMarker)
{
    MemoryChannel channel;
    ProgressRecorder progress;

    serialiseChunked(channel, Stream::fromElements({}), {}, progress.make());

    ASSERT_EQ(channel.written, endMarker);
    ASSERT_EQ(progress.calls, std::vector<uint64_t>{0});
}

TEST(decodeChunked, writesChunksAtTheirOffsets)
{
    /* Out of order, with a gap in between. */
    MemoryChannel channel(header(4096, 3) + "xyz" + header(0, 2) + "ab" + endMarker);
    TempFile destination;

    decodeChunked(channel, destination.fd.get(), {});

    auto contents = readFile(destination.path);
    ASSERT_EQ(contents.size(), 4099u);
    ASSERT_EQ(contents.substr(0, 2), "ab");
    ASSERT_EQ(contents.substr(2, 4094), std::string(4094, 0));
    ASSERT_EQ(contents.substr(4096), "xyz");
}

TEST(decodeChunked, stopsAtTheEndMarker)
{
    MemoryChannel channel(header(0, 1) + "a" + endMarker + "trailing garbage");
    TempFile destination;

    LoggerCapture capture;
    decodeChunked(channel, destination.fd.get(), {});

    ASSERT_EQ(readFile(destination.path), "a");
    ASSERT_THAT(capture->messages, Contains("Received last chunk."));
}

TEST(decodeChunked, roundTrip)
{
    MemoryChannel sender;
    serialiseChunked(sender, smallStream(), {.preZeroed = true}, {});

    MemoryChannel receiver(sender.written);
    TempFile destination;
    decodeChunked(receiver, destination.fd.get(), {});

    ASSERT_EQ(readFile(destination.path), filled(1, 'a') + filled(2, 0) + filled(1, 'b'));
}

TEST(decodeChunked, largeChunksArriveWhole)
{
    std::string payload(5 * 1024 * 1024 + 3, 'z');
    MemoryChannel channel(header(0, payload.size()) + payload + endMarker);
    TempFile destination;

    decodeChunked(channel, destination.fd.get(), {});

    ASSERT_EQ(readFile(destination.path), payload);
}

TEST(decodeChunked, shortReads)
{
    TricklingChannel channel(header(1024, 700) + std::string(700, 'p') + header(0, 3) + "abc" + endMarker, 5);
    TempFile destination;

    decodeChunked(channel, destination.fd.get(), {});

    auto contents = readFile(destination.path);
    ASSERT_EQ(contents.size(), 1724u);
    ASSERT_EQ(contents.substr(0, 3), "abc");
    ASSERT_EQ(contents.substr(1024), std::string(700, 'p'));
    ASSERT_GT(channel.reads.size(), 140u);
    ASSERT_LE(*std::max_element(channel.reads.begin(), channel.reads.end()), 5u);
}

TEST(decodeChunked, shortReadsInTheMiddleOfAHeader)
{
    TricklingChannel channel(header(0, 2) + "ab" + endMarker, 1);
    TempFile destination;
    decodeChunked(channel, destination.fd.get(), {});
    ASSERT_EQ(readFile(destination.path), "ab");
}

TEST(decodeChunked, missingEndMarker)
{
    MemoryChannel channel(header(0, 2) + "ab");
    TempFile destination;
    ASSERT_THROW(decodeChunked(channel, destination.fd.get(), {}), FramingError);
}

TEST(decodeChunked, truncatedHeader)
{
    MemoryChannel channel(header(0, 2).substr(0, 5));
    TempFile destination;
    ASSERT_THROW(decodeChunked(channel, destination.fd.get(), {}), FramingError);
}

TEST(decodeChunked, truncatedBody)
{
    MemoryChannel channel(header(0, 10) + "abc");
    TempFile destination;
    ASSERT_THROW(decodeChunked(channel, destination.fd.get(), {}), FramingError);
}

} // namespace diskxfer
