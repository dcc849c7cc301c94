#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "diskxfer/stream/tar-stream.hh"
#include "diskxfer/util/tarfile.hh"
#include "diskxfer/util/terminal.hh"

#include "test-util.hh"

#include <archive_entry.h>

namespace diskxfer {

using ::testing::HasSubstr;

constexpr uint64_t MiB = 1024 * 1024;

/**
 * Keeps every member in memory.
 */
struct RecordingEntrySink : TarEntrySink
{
    struct Entry
    {
        std::string name;
        uint64_t size;
        std::string data;
        bool ended = false;
    };

    std::vector<Entry> entries;

    void beginEntry(const std::string & name, uint64_t size) override
    {
        if (!entries.empty())
            ASSERT_TRUE(entries.back().ended);
        entries.push_back({name, size, "", false});
    }

    void data(std::string_view data) override
    {
        ASSERT_FALSE(entries.empty());
        entries.back().data.append(data);
    }

    void endEntry() override
    {
        ASSERT_FALSE(entries.empty());
        entries.back().ended = true;
    }

    std::vector<std::string> names() const
    {
        std::vector<std::string> res;
        for (auto & e : entries)
            res.push_back(e.name);
        return res;
    }
};

static std::string sha1(std::string_view s)
{
    return hashString(HashAlgorithm::SHA1, s).to_string(Base::Base16);
}

TEST(tarChunkName, padsTheCounter)
{
    ASSERT_EQ(tarChunkName("disk", 3), "disk00000003");
    ASSERT_EQ(tarChunkName("", 12345678), "12345678");
}

TEST(TarArchiver, dataIsSplitIntoChunksWithChecksums)
{
    RecordingEntrySink out;
    std::string data(MiB + MiB / 2, 'd');

    TarArchiverState state("disk", data.size());
    state = feedData(std::move(state), data, out);
    state = finishTar(std::move(state));

    ASSERT_EQ(
        out.names(),
        (std::vector<std::string>{"disk00000000", "disk00000000.checksum", "disk00000001", "disk00000001.checksum"}));

    ASSERT_EQ(out.entries[0].size, MiB);
    ASSERT_EQ(out.entries[0].data.size(), MiB);
    ASSERT_EQ(out.entries[2].size, MiB / 2);

    ASSERT_EQ(out.entries[1].size, 40u);
    ASSERT_EQ(out.entries[1].data, sha1(out.entries[0].data));
    ASSERT_EQ(out.entries[3].data, sha1(out.entries[2].data));

    for (auto & e : out.entries) {
        ASSERT_TRUE(e.ended);
        ASSERT_EQ(e.data.size(), e.size);
    }

    ASSERT_FALSE(state.midChunk());
    ASSERT_EQ(state.nextCounter, 2u);
    ASSERT_EQ(state.position, data.size());
}

TEST(TarArchiver, chunksCanBeFedInPieces)
{
    RecordingEntrySink out;
    TarArchiverState state("p", MiB);

    state = feedData(std::move(state), std::string(100, 'x'), out);
    ASSERT_TRUE(state.midChunk());
    ASSERT_EQ(state.bytesRemaining, MiB - 100);

    state = feedData(std::move(state), std::string(MiB - 100, 'y'), out);
    ASSERT_FALSE(state.midChunk());

    ASSERT_EQ(out.entries.size(), 2u);
    ASSERT_EQ(out.entries[1].data, sha1(std::string(100, 'x') + std::string(MiB - 100, 'y')));
}

TEST(TarArchiver, wholeEmptyChunksAreElidedExceptFirstAndLast)
{
    RecordingEntrySink out;

    TarArchiverState state("disk", 4 * MiB);
    state = feedEmpty(std::move(state), 4 * MiB, out);
    state = finishTar(std::move(state));

    ASSERT_EQ(
        out.names(),
        (std::vector<std::string>{"disk00000000", "disk00000000.checksum", "disk00000003", "disk00000003.checksum"}));
    ASSERT_EQ(out.entries[0].data, std::string(MiB, 0));
    ASSERT_EQ(out.entries[2].data, std::string(MiB, 0));
    ASSERT_EQ(state.nextCounter, 4u);
}

TEST(TarArchiver, emptyRunCompletesAnOpenChunk)
{
    RecordingEntrySink out;

    TarArchiverState state("disk", 2 * MiB);
    state = feedData(std::move(state), filled(1, 'a'), out);
    state = feedEmpty(std::move(state), 2 * MiB - sectorSize, out);
    state = finishTar(std::move(state));

    ASSERT_EQ(out.entries.size(), 4u);
    ASSERT_EQ(out.entries[0].data, filled(1, 'a') + std::string(MiB - sectorSize, 0));
    ASSERT_EQ(out.entries[1].data, sha1(out.entries[0].data));
    /* The last chunk is written even though it is empty. */
    ASSERT_EQ(out.entries[2].name, "disk00000001");
}

TEST(TarArchiver, checksumCountMatchesChunkCount)
{
    RecordingEntrySink out;

    TarArchiverState state("c", 10 * MiB + 1024);
    state = feedData(std::move(state), filled(1, 'a'), out);
    state = feedEmpty(std::move(state), 5 * MiB, out);
    state = feedData(std::move(state), filled(1, 'b'), out);
    state = feedEmpty(std::move(state), 5 * MiB, out);
    state = finishTar(std::move(state));

    size_t chunks = 0, checksums = 0;
    for (size_t i = 0; i < out.entries.size(); ++i) {
        if (hasSuffix(out.entries[i].name, tarChecksumSuffix)) {
            checksums++;
            ASSERT_EQ(out.entries[i].name, out.entries[i - 1].name + ".checksum");
            ASSERT_EQ(out.entries[i].data, sha1(out.entries[i - 1].data));
        } else
            chunks++;
    }
    ASSERT_EQ(chunks, checksums);
    ASSERT_LT(chunks, 11u);
}

TEST(TarArchiver, finishingMidChunkFails)
{
    RecordingEntrySink out;
    TarArchiverState state("disk", MiB);
    state = feedData(std::move(state), filled(1, 'a'), out);
    ASSERT_THROW((void) finishTar(std::move(state)), FramingError);
}

TEST(TarArchiver, finishingEarlyFails)
{
    RecordingEntrySink out;
    TarArchiverState state("disk", 2 * MiB);
    state = feedData(std::move(state), std::string(MiB, 'a'), out);
    ASSERT_THROW((void) finishTar(std::move(state)), FramingError);
}

TEST(TarArchiver, dataPastTheEndFails)
{
    RecordingEntrySink out;
    TarArchiverState state("disk", sectorSize);
    ASSERT_THROW((void) feedData(std::move(state), filled(2, 'a'), out), FramingError);
}

/* One sector of data, three empty MiB, one sector of data. */
static Stream sparseStream()
{
    return Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(3 * MiB / sectorSize), dataRun(filled(1, 'b'))});
}

static std::vector<std::string> memberNames(const std::string & archive)
{
    StringSource source(archive);
    TarArchive reader(source);
    std::vector<std::string> names;
    while (auto entry = reader.nextEntry())
        names.push_back(archive_entry_pathname(entry));
    return names;
}

TEST(serialiseTar, writesAnArchive)
{
    MemoryChannel channel;
    ProgressRecorder progress;

    auto work = serialiseTar(channel, sparseStream(), {.tarFilenamePrefix = "disk"}, progress.make());

    ASSERT_EQ(work, 1024u);
    ASSERT_EQ(progress.calls.back(), 1024u);
    ASSERT_TRUE(progress.nonDecreasing());

    ASSERT_EQ(channel.written.size() % 512, 0u);
    ASSERT_EQ(
        memberNames(channel.written),
        (std::vector<std::string>{"disk00000000", "disk00000000.checksum", "disk00000003", "disk00000003.checksum"}));
}

TEST(decodeTar, roundTrip)
{
    MemoryChannel sender;
    serialiseTar(sender, sparseStream(), {.tarFilenamePrefix = "disk"}, {});

    MemoryChannel receiver(sender.written);
    TempFile destination;
    decodeTar(receiver, destination.fd.get(), {.expectedPrefix = "disk"});

    auto contents = readFile(destination.path);
    ASSERT_EQ(contents.size(), 3 * MiB + 1024);
    ASSERT_EQ(contents, filled(1, 'a') + std::string(3 * MiB, 0) + filled(1, 'b'));
}

TEST(decodeTar, shortReads)
{
    auto image = filled(1, 'a') + filled(2, 0) + filled(1, 'b');

    MemoryChannel sender;
    serialiseTar(
        sender,
        Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(2), dataRun(filled(1, 'b'))}),
        {.tarFilenamePrefix = "disk"},
        {});

    TricklingChannel receiver(sender.written, 7);
    TempFile destination;
    decodeTar(receiver, destination.fd.get(), {.expectedPrefix = "disk"});

    ASSERT_EQ(readFile(destination.path), image);
    ASSERT_LE(*std::max_element(receiver.reads.begin(), receiver.reads.end()), 7u);
}

TEST(decodeTar, prefixMismatch)
{
    MemoryChannel sender;
    serialiseTar(sender, sparseStream(), {.tarFilenamePrefix = "disk"}, {});

    MemoryChannel receiver(sender.written);
    TempFile destination;
    try {
        decodeTar(receiver, destination.fd.get(), {.expectedPrefix = "image"});
        FAIL() << "expected a FramingError";
    } catch (FramingError & e) {
        ASSERT_THAT(
            filterANSIEscapes(e.message(), true), HasSubstr("expected filename prefix 'image', got 'disk00000000'"));
    }
}

class HandmadeArchiveTest : public ::testing::Test
{
protected:
    StringSink archive;
    TarArchiveWriter writer{archive};
    TempFile destination;

    void add(const std::string & name, std::string_view data)
    {
        writer.beginEntry(name, data.size());
        writer.writeData(data);
        writer.finishEntry();
    }

    void decode(const DecodeParams & params)
    {
        writer.close();
        MemoryChannel channel(archive.s);
        decodeTar(channel, destination.fd.get(), params);
    }
};

TEST_F(HandmadeArchiveTest, wrongChecksum)
{
    add("disk00000000", "abc");
    add("disk00000000.checksum", std::string(40, '0'));
    ASSERT_THROW(decode({}), FramingError);
}

TEST_F(HandmadeArchiveTest, wrongChecksumIgnoredWhenNotVerifying)
{
    add("disk00000000", "abc");
    add("disk00000000.checksum", std::string(40, '0'));
    decode({.verifyChecksums = false});
    ASSERT_EQ(readFile(destination.path), "abc");
}

TEST_F(HandmadeArchiveTest, checksumThatIsNotADigest)
{
    add("disk00000000", "abc");
    add("disk00000000.checksum", "not a digest\n");
    try {
        decode({});
        FAIL() << "expected a framing error";
    } catch (FramingError & e) {
        ASSERT_THAT(filterANSIEscapes(e.message(), true), HasSubstr("does not hold a SHA-1 digest"));
    }
}

TEST_F(HandmadeArchiveTest, uppercaseChecksumIsAccepted)
{
    add("disk00000000", "abc");
    add("disk00000000.checksum", "A9993E364706816ABA3E25717850C26C9CD0D89D\n");
    decode({});
    ASSERT_EQ(readFile(destination.path), "abc");
}

TEST_F(HandmadeArchiveTest, missingChecksum)
{
    add("disk00000000", "abc");
    add("disk00000001", "def");
    ASSERT_THROW(decode({}), FramingError);
}

TEST_F(HandmadeArchiveTest, missingFinalChecksum)
{
    add("disk00000000", "abc");
    ASSERT_THROW(decode({}), FramingError);
}

TEST_F(HandmadeArchiveTest, checksumForTheWrongChunk)
{
    add("disk00000000", "abc");
    add("disk00000001.checksum", sha1("abc"));
    ASSERT_THROW(decode({}), FramingError);
}

TEST_F(HandmadeArchiveTest, chunksGoToTheirCounterOffset)
{
    add("disk00000002", "xyz");
    add("disk00000002.checksum", sha1("xyz"));
    decode({});

    auto contents = readFile(destination.path);
    ASSERT_EQ(contents.size(), 2 * MiB + 3);
    ASSERT_EQ(contents.substr(2 * MiB), "xyz");
}

TEST_F(HandmadeArchiveTest, memberWithoutCounter)
{
    add("README", "hello");
    ASSERT_THROW(decode({}), FramingError);
}

TEST_F(HandmadeArchiveTest, oversizedChunk)
{
    add("disk00000000", std::string(MiB + 1, 'x'));
    ASSERT_THROW(decode({}), FramingError);
}

} // namespace diskxfer
