#pragma once
///@file

#include "diskxfer/util/serialise.hh"

#include <archive.h>

#include <ctime>
#include <vector>

namespace diskxfer {

/**
 * A ustar archive read incrementally from a `Source`.
 */
struct TarArchive
{
    struct archive * archive;
    Source * source;
    std::vector<unsigned char> buffer;

    void check(int err, const std::string & reason = "failed to read archive (%s)");

    explicit TarArchive(Source & source);

    TarArchive(const TarArchive &) = delete;
    TarArchive & operator=(const TarArchive &) = delete;

    /**
     * The header of the next member, or `nullptr` at the end of the
     * archive.
     */
    struct archive_entry * nextEntry();

    /**
     * Read up to `len` bytes of the current member's body. Returns 0
     * at the end of the body.
     */
    size_t readData(char * data, size_t len);

    void close();

    ~TarArchive();
};

/**
 * A ustar archive written incrementally to a `Sink`. Nothing is
 * buffered: every header, body slice and padding block is passed on
 * as soon as it is produced.
 */
struct TarArchiveWriter
{
    struct archive * archive;
    Sink * sink;

    void check(int err, const std::string & reason = "failed to write archive (%s)");

    explicit TarArchiveWriter(Sink & sink);

    TarArchiveWriter(const TarArchiveWriter &) = delete;
    TarArchiveWriter & operator=(const TarArchiveWriter &) = delete;

    /**
     * Write the header of a regular file member owned by uid/gid 0.
     */
    void beginEntry(const std::string & name, uint64_t size, mode_t perm = 0644, time_t mtime = time(nullptr));

    void writeData(std::string_view data);

    /**
     * Pad the current member's body to the block boundary.
     */
    void finishEntry();

    /**
     * Write the end-of-archive blocks.
     */
    void close();

    ~TarArchiveWriter();
};

} // namespace diskxfer
