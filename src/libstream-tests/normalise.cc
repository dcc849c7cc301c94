#include <gtest/gtest.h>

#include "diskxfer/stream/normalise.hh"

#include "test-util.hh"

namespace diskxfer {

static std::vector<StreamElement> collect(const Stream & stream)
{
    std::vector<StreamElement> res;
    forEachElement(stream, [&](const StreamElement & e) { res.push_back(e); });
    return res;
}

static std::string concatData(const Stream & stream)
{
    std::string res;
    forEachElement(stream, [&](const StreamElement & e) {
        auto d = std::get_if<DataSectors>(&e.raw);
        ASSERT_NE(d, nullptr);
        res += d->data;
    });
    return res;
}

TEST(expandEmpty, replacesEmptyRunsWithZeros)
{
    auto stream = Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(2), dataRun(filled(1, 'b'))});
    auto expanded = expandEmpty(stream);

    ASSERT_EQ(expanded.size, stream.size);
    ASSERT_EQ(
        collect(expanded),
        (std::vector<StreamElement>{dataRun(filled(1, 'a')), dataRun(filled(2, 0)), dataRun(filled(1, 'b'))}));
}

TEST(expandEmpty, splitsLongRuns)
{
    auto stream = Stream::fromElements({emptyRun(maxExpandSectors * 2 + 1)});
    auto elements = collect(expandEmpty(stream));

    ASSERT_EQ(elements.size(), 3u);
    ASSERT_EQ(elements[0].sectors(), maxExpandSectors);
    ASSERT_EQ(elements[1].sectors(), maxExpandSectors);
    ASSERT_EQ(elements[2].sectors(), 1u);
}

TEST(expandEmpty, dropsZeroLengthRuns)
{
    auto stream = Stream::fromElements({emptyRun(0), dataRun(filled(1, 'a'))});
    ASSERT_EQ(collect(expandEmpty(stream)), (std::vector<StreamElement>{dataRun(filled(1, 'a'))}));
}

TEST(expandCopy, readsFromTheSource)
{
    auto image = filled(1, 'a') + filled(1, 'b') + filled(1, 'c');
    auto reader = std::make_shared<StringSectorReader>(image);

    auto stream = Stream::fromElements({{CopyRun{reader, 1, 2}}, emptyRun(1)});
    auto expanded = expandCopy(stream);

    ASSERT_EQ(expanded.size, stream.size);
    ASSERT_EQ(
        collect(expanded), (std::vector<StreamElement>{dataRun(filled(1, 'b') + filled(1, 'c')), emptyRun(1)}));
}

TEST(expandCopy, splitsLongRunsAndAdvancesTheSourceSector)
{
    std::string image;
    for (uint64_t i = 0; i < maxExpandSectors + 2; ++i)
        image += filled(1, 'a' + i % 26);
    auto reader = std::make_shared<StringSectorReader>(image);

    auto stream = Stream::fromElements({{CopyRun{reader, 1, maxExpandSectors + 1}}});
    ASSERT_EQ(concatData(expandCopy(stream)), image.substr(sectorSize));
}

TEST(expandCopy, shortReadIsAnError)
{
    auto reader = std::make_shared<StringSectorReader>(filled(1, 'a'));
    auto stream = Stream::fromElements({{CopyRun{reader, 0, 2}}});
    ASSERT_THROW(collect(expandCopy(stream)), FramingError);
}

TEST(normalise, leavesOnlyDataUnlessPreZeroed)
{
    auto reader = std::make_shared<StringSectorReader>(filled(2, 'c'));
    auto stream = Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(1), {CopyRun{reader, 0, 2}}});

    ASSERT_EQ(concatData(normalise(stream, false)), filled(1, 'a') + filled(1, 0) + filled(2, 'c'));

    ASSERT_EQ(
        collect(normalise(stream, true)),
        (std::vector<StreamElement>{dataRun(filled(1, 'a')), emptyRun(1), dataRun(filled(2, 'c'))}));
}

TEST(normalise, isLazy)
{
    struct CountingReader : StringSectorReader
    {
        unsigned int reads = 0;

        using StringSectorReader::StringSectorReader;

        std::string readSectors(uint64_t sector, uint64_t count) override
        {
            reads++;
            return StringSectorReader::readSectors(sector, count);
        }
    };

    auto reader = std::make_shared<CountingReader>(filled(1, 'a'));
    auto stream = normalise(Stream::fromElements({{CopyRun{reader, 0, 1}}}), false);
    ASSERT_EQ(reader->reads, 0u);

    auto source = stream.open();
    ASSERT_TRUE(source->next());
    ASSERT_EQ(reader->reads, 1u);
}

} // namespace diskxfer
