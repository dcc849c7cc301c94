#include "diskxfer/stream/element.hh"
#include "diskxfer/util/util.hh"

namespace diskxfer {

uint64_t StreamElement::sectors() const
{
    return std::visit(
        overloaded{
            [](const DataSectors & d) -> uint64_t { return d.data.size() / sectorSize; },
            [](const EmptyRun & e) -> uint64_t { return e.sectors; },
            [](const CopyRun & c) -> uint64_t { return c.sectors; },
        },
        raw);
}

std::string StreamElement::to_string() const
{
    return std::visit(
        overloaded{
            [](const DataSectors & d) { return fmt("%d sectors of data", d.data.size() / sectorSize); },
            [](const EmptyRun & e) { return fmt("%d empty sectors", e.sectors); },
            [](const CopyRun & c) {
                return fmt(
                    "%d sectors copied from %s at sector %d",
                    c.sectors,
                    c.source ? c.source->name() : "<nowhere>",
                    c.sourceSector);
            },
        },
        raw);
}

namespace {

struct VectorElementSource : ElementSource
{
    std::shared_ptr<const std::vector<StreamElement>> elements;
    size_t pos = 0;

    VectorElementSource(std::shared_ptr<const std::vector<StreamElement>> elements)
        : elements(std::move(elements))
    {
    }

    std::optional<StreamElement> next() override
    {
        if (pos == elements->size())
            return std::nullopt;
        return (*elements)[pos++];
    }
};

} // namespace

SizeSummary summarise(const std::vector<StreamElement> & elements)
{
    SizeSummary size;
    for (auto & e : elements) {
        auto bytes = e.size();
        size.total += bytes;
        std::visit(
            overloaded{
                [&](const DataSectors &) { size.metadata += bytes; },
                [&](const EmptyRun &) { size.empty += bytes; },
                [&](const CopyRun &) { size.copy += bytes; },
            },
            e.raw);
    }
    return size;
}

Stream Stream::fromElements(std::vector<StreamElement> elements)
{
    auto size = summarise(elements);
    auto shared = std::make_shared<const std::vector<StreamElement>>(std::move(elements));
    return Stream{
        .size = size,
        .opener = [shared]() -> std::unique_ptr<ElementSource> {
            return std::make_unique<VectorElementSource>(shared);
        },
    };
}

void forEachElement(const Stream & stream, std::function<void(const StreamElement &)> fun)
{
    auto source = stream.open();
    while (auto e = source->next())
        fun(*e);
}

void checkStream(const Stream & stream)
{
    uint64_t covered = 0;
    forEachElement(stream, [&](const StreamElement & e) {
        if (auto d = std::get_if<DataSectors>(&e.raw); d && d->data.size() % sectorSize)
            throw FramingError(
                "element at byte %d carries %d bytes, which is not a whole number of sectors",
                covered,
                d->data.size());
        covered += e.size();
    });
    if (covered != stream.size.total)
        throw FramingError("stream elements cover %d bytes, but the stream declares %d", covered, stream.size.total);
}

} // namespace diskxfer
