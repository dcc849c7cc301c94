#pragma once
///@file

#include "diskxfer/util/types.hh"
#include "diskxfer/util/error.hh"

#include <functional>
#include <memory>
#include <optional>
#include <variant>

namespace diskxfer {

constexpr uint64_t sectorSize = 512;

/**
 * Somewhere the bytes of a `CopyRun` can be fetched from, typically
 * the source image file.
 */
struct SectorReader
{
    virtual ~SectorReader() {}

    /**
     * Human-readable name for diagnostics.
     */
    virtual std::string name() const = 0;

    /**
     * Read `count` sectors starting at sector `sector`.
     */
    virtual std::string readSectors(uint64_t sector, uint64_t count) = 0;
};

/**
 * Literal data. The payload length is a multiple of `sectorSize`.
 */
struct DataSectors
{
    std::string data;

    bool operator==(const DataSectors &) const = default;
};

/**
 * Sectors that are logically zero.
 */
struct EmptyRun
{
    uint64_t sectors;

    bool operator==(const EmptyRun &) const = default;
};

/**
 * Sectors whose contents live in `source` starting at `sourceSector`.
 */
struct CopyRun
{
    std::shared_ptr<SectorReader> source;
    uint64_t sourceSector;
    uint64_t sectors;

    bool operator==(const CopyRun &) const = default;
};

/**
 * One contiguous run of virtual-disk sectors.
 */
struct StreamElement
{
    typedef std::variant<DataSectors, EmptyRun, CopyRun> Raw;

    Raw raw;

    bool operator==(const StreamElement &) const = default;

    /**
     * Number of sectors this element covers.
     */
    uint64_t sectors() const;

    /**
     * Number of bytes this element covers.
     */
    uint64_t size() const
    {
        return sectors() * sectorSize;
    }

    std::string to_string() const;
};

/**
 * Precomputed byte accounting for a `Stream`. Literal data produced by
 * the reader counts as metadata, so that
 * `total == metadata + empty + copy`.
 */
struct SizeSummary
{
    uint64_t total = 0;
    uint64_t metadata = 0;
    uint64_t empty = 0;
    uint64_t copy = 0;

    bool operator==(const SizeSummary &) const = default;

    /**
     * The bytes that need actual I/O. Empty space only counts when
     * the destination is not known to be zero already.
     */
    uint64_t work(bool preZeroed) const
    {
        return metadata + copy + (preZeroed ? 0 : empty);
    }
};

/**
 * A one-pass traversal over the elements of a stream.
 */
struct ElementSource
{
    virtual ~ElementSource() {}

    /**
     * The next element, or `std::nullopt` once the stream is over.
     */
    virtual std::optional<StreamElement> next() = 0;
};

/**
 * An ordered, gap-free sequence of elements together with its size
 * summary. A stream is never modified once built; `open()` starts a
 * fresh traversal each time it is called, so the same stream can be
 * sent more than once.
 */
struct Stream
{
    typedef std::function<std::unique_ptr<ElementSource>()> Opener;

    SizeSummary size;

    Opener opener;

    std::unique_ptr<ElementSource> open() const
    {
        return opener();
    }

    /**
     * A stream over an in-memory list of elements, with the summary
     * computed from them.
     */
    static Stream fromElements(std::vector<StreamElement> elements);
};

/**
 * Compute the size summary of a list of elements.
 */
SizeSummary summarise(const std::vector<StreamElement> & elements);

/**
 * Call `fun` for each element of a fresh traversal of `stream`.
 */
void forEachElement(const Stream & stream, std::function<void(const StreamElement &)> fun);

/**
 * Check that the elements of `stream` cover exactly `size.total`
 * bytes and that every payload is a whole number of sectors.
 */
void checkStream(const Stream & stream);

} // namespace diskxfer
