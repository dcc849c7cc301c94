#include <gtest/gtest.h>

#include "diskxfer/stream/human.hh"
#include "diskxfer/util/tests/capturing-logger.hh"

#include "test-util.hh"

namespace diskxfer {

TEST(serialiseHuman, describesTheStream)
{
    auto reader = std::make_shared<StringSectorReader>(filled(8, 'x'));
    auto stream = Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(9), {CopyRun{reader, 4, 2}}});

    MemoryChannel channel;
    LoggerCapture capture;

    auto work = serialiseHuman(channel, stream, {}, {});

    ASSERT_FALSE(work);
    ASSERT_TRUE(channel.written.empty());
    ASSERT_EQ(
        capture->stdoutLines,
        (Strings{
            "# stream summary:",
            "# size of the final artifact: 6144",
            "# size of metadata blocks:    512",
            "# size of empty space:        4608",
            "# size of referenced blocks:  1024",
            "# offset : contents",
            " 0: 1 sectors of data",
            " 1: 9 empty sectors",
            "10: 2 sectors copied from <memory> at sector 4",
            "# end of stream",
        }));
}

TEST(serialiseHuman, doesNotReadCopyRuns)
{
    struct ExplodingReader : SectorReader
    {
        std::string name() const override
        {
            return "exploding";
        }

        std::string readSectors(uint64_t, uint64_t) override
        {
            throw Error("should not be read");
        }
    };

    auto stream = Stream::fromElements({{CopyRun{std::make_shared<ExplodingReader>(), 0, 4}}});
    MemoryChannel channel;
    LoggerCapture capture;

    serialiseHuman(channel, stream, {}, {});

    ASSERT_EQ(capture->stdoutLines.size(), 8u);
}

TEST(serialiseHuman, progressEndsOnTheTotal)
{
    auto stream = Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(3)});
    MemoryChannel channel;
    LoggerCapture capture;

    ProgressRecorder zeroed;
    serialiseHuman(channel, stream, {.preZeroed = true}, zeroed.make());
    ASSERT_EQ(zeroed.total, 512u);
    ASSERT_EQ(zeroed.calls.back(), 512u);
    ASSERT_TRUE(zeroed.nonDecreasing());

    ProgressRecorder plain;
    serialiseHuman(channel, stream, {.preZeroed = false}, plain.make());
    ASSERT_EQ(plain.total, 2048u);
    ASSERT_EQ(plain.calls.back(), 2048u);
}

} // namespace diskxfer
