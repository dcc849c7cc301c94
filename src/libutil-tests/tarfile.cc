#include <gtest/gtest.h>

#include "diskxfer/util/serialise.hh"
#include "diskxfer/util/tarfile.hh"

#include <archive_entry.h>

namespace diskxfer {

static std::string readMember(TarArchive & archive)
{
    std::string body;
    char buf[100];
    while (auto n = archive.readData(buf, sizeof(buf)))
        body.append(buf, n);
    return body;
}

TEST(TarArchiveWriter, writesUstarHeaders)
{
    StringSink sink;
    {
        TarArchiveWriter writer(sink);
        writer.beginEntry("disk00000000", 5, 0644, 1700000000);
        writer.writeData("hello");
        writer.finishEntry();
        writer.close();
    }

    /* Header, one padded body block and the two end-of-archive
       blocks. */
    ASSERT_EQ(sink.s.size(), 4u * 512);
    ASSERT_EQ(sink.s.substr(0, 12), "disk00000000");
    ASSERT_EQ(sink.s.substr(257, 5), "ustar");
    ASSERT_EQ(sink.s.substr(512, 5), "hello");
    ASSERT_EQ(sink.s.substr(517, 512 - 5), std::string(512 - 5, 0));
}

TEST(TarArchiveWriter, bodiesAreStreamedToTheSink)
{
    StringSink sink;
    TarArchiveWriter writer(sink);
    writer.beginEntry("a", 1024);
    auto afterHeader = sink.s.size();
    writer.writeData(std::string(1024, 'x'));
    ASSERT_EQ(afterHeader, 512u);
    ASSERT_EQ(sink.s.size(), 512u + 1024);
    writer.finishEntry();
    writer.close();
}

TEST(TarArchive, readsWhatWasWritten)
{
    StringSink sink;
    {
        TarArchiveWriter writer(sink);
        writer.beginEntry("disk00000000", 3);
        writer.writeData("abc");
        writer.finishEntry();
        writer.beginEntry("disk00000000.checksum", 40);
        writer.writeData("a9993e364706816aba3e25717850c26c9cd0d89d");
        writer.finishEntry();
        writer.close();
    }

    StringSource source(sink.s);
    TarArchive archive(source);

    auto entry = archive.nextEntry();
    ASSERT_NE(entry, nullptr);
    ASSERT_STREQ(archive_entry_pathname(entry), "disk00000000");
    ASSERT_EQ(archive_entry_size(entry), 3);
    ASSERT_EQ(archive_entry_perm(entry), 0644u);
    ASSERT_EQ(archive_entry_uid(entry), 0);
    ASSERT_EQ(readMember(archive), "abc");

    entry = archive.nextEntry();
    ASSERT_NE(entry, nullptr);
    ASSERT_STREQ(archive_entry_pathname(entry), "disk00000000.checksum");
    ASSERT_EQ(readMember(archive), "a9993e364706816aba3e25717850c26c9cd0d89d");

    ASSERT_EQ(archive.nextEntry(), nullptr);
    archive.close();
}

TEST(TarArchive, garbageIsASerialisationError)
{
    std::string garbage(1024, 'g');
    StringSource source(garbage);
    TarArchive archive(source);
    ASSERT_THROW(archive.nextEntry(), SerialisationError);
}

TEST(TarArchiveWriter, shortBodyIsZeroPadded)
{
    StringSink sink;
    TarArchiveWriter writer(sink);
    writer.beginEntry("a", 10);
    writer.writeData("abc");
    /* The rest of the declared size is filled with zeros. */
    writer.finishEntry();
    writer.close();

    StringSource source(sink.s);
    TarArchive archive(source);
    ASSERT_NE(archive.nextEntry(), nullptr);
    ASSERT_EQ(readMember(archive), std::string("abc") + std::string(7, 0));
}

} // namespace diskxfer
