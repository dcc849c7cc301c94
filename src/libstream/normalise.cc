#include "diskxfer/stream/normalise.hh"
#include "diskxfer/util/logging.hh"

#include <algorithm>
#include <type_traits>

namespace diskxfer {

namespace {

/**
 * Wraps another traversal and rewrites elements of one kind into a
 * series of `DataSectors`, at most `maxExpandSectors` long each.
 */
template<typename Run>
struct ExpandingSource : ElementSource
{
    std::unique_ptr<ElementSource> inner;

    /* Remainder of the run currently being expanded. */
    std::optional<Run> current;

    ExpandingSource(std::unique_ptr<ElementSource> inner)
        : inner(std::move(inner))
    {
    }

    std::optional<StreamElement> next() override
    {
        while (!current) {
            auto e = inner->next();
            if (!e)
                return std::nullopt;
            auto run = std::get_if<Run>(&e->raw);
            if (!run)
                return e;
            if (run->sectors == 0)
                continue;
            current = *run;
        }

        auto n = std::min(current->sectors, maxExpandSectors);
        auto piece = materialise(*current, n);
        if constexpr (std::is_same_v<Run, CopyRun>)
            current->sourceSector += n;
        current->sectors -= n;
        if (current->sectors == 0)
            current.reset();
        return StreamElement{DataSectors{std::move(piece)}};
    }

    static std::string materialise(const EmptyRun &, uint64_t sectors)
    {
        return std::string(sectors * sectorSize, '\0');
    }

    static std::string materialise(const CopyRun & run, uint64_t sectors)
    {
        if (!run.source)
            throw FramingError("copy run of %d sectors has no source to copy from", run.sectors);
        vomit("reading %d sectors from '%s' at sector %d", sectors, run.source->name(), run.sourceSector);
        auto data = run.source->readSectors(run.sourceSector, sectors);
        if (data.size() != sectors * sectorSize)
            throw FramingError(
                "reading %d sectors from '%s' returned %d bytes", sectors, run.source->name(), data.size());
        return data;
    }
};

template<typename Run>
Stream expand(const Stream & stream)
{
    auto opener = stream.opener;
    return Stream{
        .size = stream.size,
        .opener = [opener]() -> std::unique_ptr<ElementSource> {
            return std::make_unique<ExpandingSource<Run>>(opener());
        },
    };
}

} // namespace

Stream expandEmpty(const Stream & stream)
{
    return expand<EmptyRun>(stream);
}

Stream expandCopy(const Stream & stream)
{
    return expand<CopyRun>(stream);
}

Stream normalise(const Stream & stream, bool preZeroed)
{
    return expandCopy(preZeroed ? stream : expandEmpty(stream));
}

} // namespace diskxfer
