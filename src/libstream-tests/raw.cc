#include <gtest/gtest.h>

#include "diskxfer/stream/raw.hh"
#include "diskxfer/util/terminal.hh"

#include "test-util.hh"

namespace diskxfer {

/* Data, two empty sectors, data. */
static Stream smallStream()
{
    return Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(2), dataRun(filled(1, 'b'))});
}

TEST(serialiseRaw, writesZerosForEmptyRuns)
{
    MemoryChannel channel;
    ProgressRecorder progress;

    auto work = serialiseRaw(channel, smallStream(), {.preZeroed = false}, progress.make());

    ASSERT_EQ(work, 2048u);
    ASSERT_EQ(channel.written, filled(1, 'a') + filled(2, 0) + filled(1, 'b'));
    ASSERT_TRUE(channel.skips.empty());
    ASSERT_EQ(progress.total, 2048u);
    ASSERT_EQ(progress.calls.back(), 2048u);
    ASSERT_TRUE(progress.nonDecreasing());
}

TEST(serialiseRaw, skipsEmptyRunsOnPreZeroedDestinations)
{
    MemoryChannel channel;
    ProgressRecorder progress;

    auto work = serialiseRaw(channel, smallStream(), {.preZeroed = true}, progress.make());

    ASSERT_EQ(work, 1024u);
    ASSERT_EQ(channel.written, filled(1, 'a') + filled(1, 'b'));
    ASSERT_EQ(channel.skips, std::vector<uint64_t>{1024});
    ASSERT_EQ(progress.calls.back(), 1024u);
    ASSERT_TRUE(progress.nonDecreasing());
}

TEST(serialiseRaw, copiesFromTheSource)
{
    auto reader = std::make_shared<StringSectorReader>(filled(1, 'x') + filled(1, 'y'));
    MemoryChannel channel;

    serialiseRaw(channel, Stream::fromElements({{CopyRun{reader, 1, 1}}}), {}, {});

    ASSERT_EQ(channel.written, filled(1, 'y'));
}

TEST(serialiseRaw, emptyStreamStillFinishesProgress)
{
    MemoryChannel channel;
    ProgressRecorder progress;

    auto work = serialiseRaw(channel, Stream::fromElements({}), {}, progress.make());

    ASSERT_EQ(work, 0u);
    ASSERT_EQ(progress.calls, std::vector<uint64_t>{0});
    ASSERT_TRUE(channel.written.empty());
}

TEST(serialiseRaw, flushesAtTheEnd)
{
    MemoryChannel channel;
    serialiseRaw(channel, smallStream(), {}, {});
    ASSERT_GE(channel.flushes, 1u);
}

TEST(decodeRaw, writesEverythingFromOffsetZero)
{
    auto payload = filled(3, 'q') + filled(1, 'r');
    MemoryChannel channel(payload);
    TempFile destination;

    decodeRaw(channel, destination.fd.get(), {});

    ASSERT_EQ(readFile(destination.path), payload);
}

TEST(decodeRaw, shortReads)
{
    auto payload = filled(2, 'q') + "tail";
    TricklingChannel channel(payload, 3);
    TempFile destination;

    decodeRaw(channel, destination.fd.get(), {});

    ASSERT_EQ(readFile(destination.path), payload);
    ASSERT_GE(channel.reads.size(), payload.size() / 3);
}

TEST(decodeRaw, roundTrip)
{
    auto stream = smallStream();

    MemoryChannel sender;
    serialiseRaw(sender, stream, {}, {});

    MemoryChannel receiver(sender.written);
    TempFile destination;
    decodeRaw(receiver, destination.fd.get(), {});

    ASSERT_EQ(readFile(destination.path), filled(1, 'a') + filled(2, 0) + filled(1, 'b'));
}

TEST(unexpectedElement, namesTheElementAndOffset)
{
    try {
        unexpectedElement(emptyRun(3), 4096);
        FAIL() << "expected a FramingError";
    } catch (FramingError & e) {
        ASSERT_EQ(filterANSIEscapes(e.message(), true), "unexpected stream element at byte 4096: 3 empty sectors");
    }
}

} // namespace diskxfer
