#pragma once
///@file

#include "diskxfer/stream/protocol.hh"
#include "diskxfer/util/hash.hh"

#include <memory>

namespace diskxfer {

struct Channel;
struct TarArchiveWriter;

/**
 * Size of the slice of the virtual disk that goes into one archive
 * member. The last member may be shorter.
 */
constexpr uint64_t tarChunkSize = 1024 * 1024;

/**
 * Number of digits in the chunk counter part of member names.
 */
constexpr size_t tarCounterDigits = 8;

constexpr std::string_view tarChecksumSuffix = ".checksum";

/**
 * `<prefix><counter padded to 8 digits>`
 */
std::string tarChunkName(std::string_view prefix, uint64_t counter);

/**
 * Where the archiver puts its members.
 */
struct TarEntrySink
{
    virtual ~TarEntrySink() {}

    virtual void beginEntry(const std::string & name, uint64_t size) = 0;

    virtual void data(std::string_view data) = 0;

    /**
     * The body of the current member is complete.
     */
    virtual void endEntry() = 0;
};

/**
 * Puts members into a ustar archive.
 */
class TarWriterEntrySink : public TarEntrySink
{
    TarArchiveWriter & writer;

public:

    explicit TarWriterEntrySink(TarArchiveWriter & writer)
        : writer(writer)
    {
    }

    void beginEntry(const std::string & name, uint64_t size) override;
    void data(std::string_view data) override;
    void endEntry() override;
};

/**
 * Where the archiver is in the virtual disk. Between chunks,
 * `entryName` is empty; in the middle of a chunk it names the open
 * member, `bytesRemaining` of its body are still to come and
 * `checksum` covers what has been written of it.
 */
struct TarArchiverState
{
    std::string prefix;

    std::unique_ptr<HashSink> checksum;

    uint64_t bytesRemaining = 0;

    /**
     * Counter of the next chunk to open or elide.
     */
    uint64_t nextCounter = 0;

    std::optional<std::string> entryName;

    /**
     * Bytes of the virtual disk consumed so far, elided chunks
     * included.
     */
    uint64_t position = 0;

    uint64_t totalSize = 0;

    TarArchiverState(std::string prefix, uint64_t totalSize)
        : prefix(std::move(prefix))
        , totalSize(totalSize)
    {
    }

    bool midChunk() const
    {
        return entryName.has_value();
    }
};

/**
 * Archive `data`, opening and closing chunks as their boundaries are
 * crossed.
 */
[[nodiscard]] TarArchiverState feedData(TarArchiverState state, std::string_view data, TarEntrySink & out);

/**
 * Archive `len` zero bytes. Whole chunks that are neither the first
 * nor the last of the disk are skipped without emitting anything.
 */
[[nodiscard]] TarArchiverState feedEmpty(TarArchiverState state, uint64_t len, TarEntrySink & out);

/**
 * Check that the whole disk has been archived.
 */
[[nodiscard]] TarArchiverState finishTar(TarArchiverState state);

/**
 * Send `stream` as a ustar archive of checksummed chunks.
 */
std::optional<uint64_t>
serialiseTar(Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress);

/**
 * Write the chunks of an archive made by `serialiseTar()` to their
 * offsets in `destination`.
 */
void decodeTar(Channel & channel, Descriptor destination, const DecodeParams & params);

} // namespace diskxfer
