#include <gtest/gtest.h>

#include "diskxfer/stream/normalise.hh"
#include "diskxfer/stream/raw-input.hh"

#include "test-util.hh"

namespace diskxfer {

class RawInputTest : public ::testing::Test
{
protected:
    TempFile image;

    static constexpr uint64_t imageSize = 2 * 1024 * 1024;

    /* Data at the start and in the middle, holes elsewhere. */
    void makeSparseImage()
    {
        pwriteFull(image.fd.get(), std::string(4096, 'a'), 0);
        pwriteFull(image.fd.get(), std::string(4096, 'b'), imageSize / 2);
        ASSERT_EQ(ftruncate(image.fd.get(), imageSize), 0);
    }
};

TEST_F(RawInputTest, extentsCoverTheWholeFile)
{
    makeSparseImage();

    auto extents = listExtents(image.fd.get(), imageSize);
    ASSERT_FALSE(extents.empty());

    uint64_t pos = 0;
    for (auto & e : extents) {
        ASSERT_EQ(e.offset, pos);
        pos += e.length;
    }
    ASSERT_EQ(pos, imageSize);

    ASSERT_TRUE(extents.front().data);
}

TEST_F(RawInputTest, adjacentExtentsAlternate)
{
    makeSparseImage();

    auto extents = listExtents(image.fd.get(), imageSize);
    for (size_t i = 1; i < extents.size(); ++i)
        ASSERT_NE(extents[i - 1].data, extents[i].data);
}

TEST_F(RawInputTest, emptyFileHasNoExtents)
{
    ASSERT_TRUE(listExtents(image.fd.get(), 0).empty());
}

TEST_F(RawInputTest, streamReproducesTheImage)
{
    makeSparseImage();

    auto stream = rawImageStream(image.path);
    ASSERT_EQ(stream.size.total, imageSize);
    ASSERT_EQ(stream.size.metadata, 0u);
    ASSERT_EQ(stream.size.empty + stream.size.copy, imageSize);
    checkStream(stream);

    std::string contents;
    forEachElement(normalise(stream, false), [&](const StreamElement & e) {
        contents += std::get<DataSectors>(e.raw).data;
    });
    ASSERT_EQ(contents, readFile(image.path));
}

TEST_F(RawInputTest, copyRunsReferToTheImage)
{
    makeSparseImage();

    forEachElement(rawImageStream(image.path), [&](const StreamElement & e) {
        if (auto c = std::get_if<CopyRun>(&e.raw))
            ASSERT_EQ(c->source->name(), image.path);
    });
}

TEST_F(RawInputTest, sizeMustBeWholeSectors)
{
    writeFull(image.fd.get(), "odd");
    ASSERT_THROW(RawImage{image.path}, FramingError);
}

TEST_F(RawInputTest, missingImage)
{
    ASSERT_THROW(rawImageStream("/nonexistent/disk.img"), SysError);
}

TEST_F(RawInputTest, readSectors)
{
    pwriteFull(image.fd.get(), filled(1, 'x') + filled(1, 'y'), 0);
    RawImage raw(image.path);
    ASSERT_EQ(raw.size, 1024u);
    ASSERT_EQ(raw.readSectors(1, 1), filled(1, 'y'));
    ASSERT_THROW(raw.readSectors(1, 2), EndOfFile);
}

TEST(makeStream, unknownFormat)
{
    ASSERT_THROW(makeStream("/dev/null", "qcow2", "raw"), UsageError);
    ASSERT_THROW(makeStream("/dev/null", "raw", "qcow2"), UsageError);
}

TEST(makeStream, conversionsAreNotImplemented)
{
    ASSERT_THROW(makeStream("/dev/null", "vhd", "raw"), UnsupportedError);
    ASSERT_THROW(makeStream("/dev/null", "raw", "hybrid"), UnsupportedError);
}

} // namespace diskxfer
