#include <gtest/gtest.h>

#include "diskxfer/stream/element.hh"

#include "test-util.hh"

namespace diskxfer {

TEST(StreamElement, sectors)
{
    ASSERT_EQ(dataRun(filled(2, 'a')).sectors(), 2u);
    ASSERT_EQ(emptyRun(7).sectors(), 7u);
    ASSERT_EQ((StreamElement{CopyRun{nullptr, 10, 3}}).sectors(), 3u);
    ASSERT_EQ(emptyRun(7).size(), 7u * 512);
}

TEST(StreamElement, to_string)
{
    auto reader = std::make_shared<StringSectorReader>(filled(4, 'x'));
    ASSERT_EQ(dataRun(filled(2, 'a')).to_string(), "2 sectors of data");
    ASSERT_EQ(emptyRun(5).to_string(), "5 empty sectors");
    ASSERT_EQ((StreamElement{CopyRun{reader, 1, 3}}).to_string(), "3 sectors copied from <memory> at sector 1");
}

TEST(SizeSummary, summarise)
{
    auto reader = std::make_shared<StringSectorReader>(filled(1, 'x'));
    auto size = summarise({dataRun(filled(2, 'a')), emptyRun(3), {CopyRun{reader, 0, 1}}});

    ASSERT_EQ(size, (SizeSummary{.total = 3072, .metadata = 1024, .empty = 1536, .copy = 512}));
    ASSERT_EQ(size.total, size.metadata + size.empty + size.copy);
}

TEST(SizeSummary, workDependsOnPreZeroing)
{
    SizeSummary size{.total = 3072, .metadata = 1024, .empty = 1536, .copy = 512};
    ASSERT_EQ(size.work(false), 3072u);
    ASSERT_EQ(size.work(true), 1536u);
}

TEST(Stream, canBeTraversedMoreThanOnce)
{
    auto stream = Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(2)});

    for (int i = 0; i < 2; ++i) {
        std::vector<StreamElement> seen;
        forEachElement(stream, [&](const StreamElement & e) { seen.push_back(e); });
        ASSERT_EQ(seen, (std::vector<StreamElement>{dataRun(filled(1, 'a')), emptyRun(2)}));
    }
}

TEST(Stream, emptyStream)
{
    auto stream = Stream::fromElements({});
    ASSERT_EQ(stream.size, SizeSummary{});
    ASSERT_FALSE(stream.open()->next());
    checkStream(stream);
}

TEST(Stream, checkStreamAcceptsConsistentStreams)
{
    checkStream(Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(2)}));
}

TEST(Stream, checkStreamRejectsWrongTotal)
{
    auto stream = Stream::fromElements({dataRun(filled(1, 'a'))});
    stream.size.total = 1024;
    ASSERT_THROW(checkStream(stream), FramingError);
}

TEST(Stream, checkStreamRejectsPartialSectors)
{
    auto stream = Stream::fromElements({dataRun("not a sector")});
    ASSERT_THROW(checkStream(stream), FramingError);
}

} // namespace diskxfer
