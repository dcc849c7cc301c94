#pragma once
///@file

#include "diskxfer/stream/element.hh"
#include "diskxfer/util/file-descriptor.hh"

namespace diskxfer {

/**
 * A raw disk image opened for reading.
 */
struct RawImage : SectorReader
{
    Path path;
    AutoCloseFD fd;
    uint64_t size;

    RawImage(const Path & path);

    std::string name() const override
    {
        return path;
    }

    std::string readSectors(uint64_t sector, uint64_t count) override;
};

/**
 * A contiguous run of a file that is either allocated or a hole.
 */
struct Extent
{
    uint64_t offset;
    uint64_t length;
    bool data;

    bool operator==(const Extent &) const = default;
};

/**
 * List the allocated and unallocated extents of an open file of the
 * given size, using `SEEK_DATA`/`SEEK_HOLE`. A file system without
 * hole support reports the whole file as one data extent.
 */
std::vector<Extent> listExtents(Descriptor fd, uint64_t size);

/**
 * Turn a raw image into a stream: allocated extents become `CopyRun`s
 * reading from the image, holes become `EmptyRun`s.
 */
Stream rawImageStream(const Path & path);

/**
 * Build the stream for a source of the given format, in the shape
 * required by the destination format.
 */
Stream makeStream(const Path & source, std::string_view sourceFormat, std::string_view destinationFormat);

} // namespace diskxfer
