#include "diskxfer/stream/tar-stream.hh"
#include "diskxfer/stream/channel.hh"
#include "diskxfer/stream/normalise.hh"
#include "diskxfer/stream/raw.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/strings.hh"
#include "diskxfer/util/tarfile.hh"
#include "diskxfer/util/util.hh"

#include <archive_entry.h>

#include <algorithm>

namespace diskxfer {

std::string tarChunkName(std::string_view prefix, uint64_t counter)
{
    return fmt("%s%08d", prefix, counter);
}

void TarWriterEntrySink::beginEntry(const std::string & name, uint64_t size)
{
    writer.beginEntry(name, size);
}

void TarWriterEntrySink::data(std::string_view data)
{
    writer.writeData(data);
}

void TarWriterEntrySink::endEntry()
{
    writer.finishEntry();
}

static TarArchiverState openChunk(TarArchiverState state, TarEntrySink & out)
{
    if (state.position >= state.totalSize)
        throw FramingError("stream continues past its declared size of %d bytes", state.totalSize);

    auto name = tarChunkName(state.prefix, state.nextCounter);
    auto size = std::min(tarChunkSize, state.totalSize - state.position);

    out.beginEntry(name, size);

    state.checksum = std::make_unique<HashSink>(HashAlgorithm::SHA1);
    state.bytesRemaining = size;
    state.entryName = std::move(name);
    state.nextCounter++;
    return state;
}

static TarArchiverState closeChunk(TarArchiverState state, TarEntrySink & out)
{
    out.endEntry();

    auto hash = state.checksum->finish().first.to_string(Base::Base16);
    out.beginEntry(*state.entryName + std::string(tarChecksumSuffix), hash.size());
    out.data(hash);
    out.endEntry();

    state.checksum.reset();
    state.entryName.reset();
    return state;
}

TarArchiverState feedData(TarArchiverState state, std::string_view data, TarEntrySink & out)
{
    while (!data.empty()) {
        if (!state.midChunk())
            state = openChunk(std::move(state), out);

        auto n = std::min<uint64_t>(state.bytesRemaining, data.size());
        auto piece = data.substr(0, n);
        out.data(piece);
        (*state.checksum)(piece);

        state.bytesRemaining -= n;
        state.position += n;
        data.remove_prefix(n);

        if (!state.bytesRemaining)
            state = closeChunk(std::move(state), out);
    }
    return state;
}

static TarArchiverState feedZeros(TarArchiverState state, uint64_t len, TarEntrySink & out)
{
    static const std::string zeros(64 * 1024, 0);
    while (len) {
        auto n = std::min<uint64_t>(len, zeros.size());
        state = feedData(std::move(state), std::string_view(zeros).substr(0, n), out);
        len -= n;
    }
    return state;
}

TarArchiverState feedEmpty(TarArchiverState state, uint64_t len, TarEntrySink & out)
{
    while (len) {
        if (state.midChunk()) {
            /* The rest of an open chunk is written out so its checksum
               covers the whole body. */
            auto n = std::min(len, state.bytesRemaining);
            state = feedZeros(std::move(state), n, out);
            len -= n;
        } else if (len >= tarChunkSize && state.position > 0 && state.totalSize - state.position > tarChunkSize) {
            vomit("eliding empty chunk %d", state.nextCounter);
            state.nextCounter++;
            state.position += tarChunkSize;
            len -= tarChunkSize;
        } else {
            auto n = std::min(len, tarChunkSize);
            state = feedZeros(std::move(state), n, out);
            len -= n;
        }
    }
    return state;
}

TarArchiverState finishTar(TarArchiverState state)
{
    if (state.midChunk())
        throw FramingError(
            "stream ended in the middle of '%s' (%d bytes missing)", *state.entryName, state.bytesRemaining);
    if (state.position != state.totalSize)
        throw FramingError("stream covers %d bytes, expected %d", state.position, state.totalSize);
    return state;
}

std::optional<uint64_t>
serialiseTar(Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress)
{
    /* Headers and the zeros of partly empty chunks are not counted. */
    ProgressReporter p(progress, stream.size.metadata + stream.size.copy);

    TarArchiveWriter writer(channel);
    TarWriterEntrySink out(writer);

    TarArchiverState state(params.tarFilenamePrefix, stream.size.total);

    auto source = expandCopy(stream).open();

    uint64_t workDone = 0;
    while (auto e = source->next()) {
        std::visit(
            overloaded{
                [&](const DataSectors & d) {
                    state = feedData(std::move(state), d.data, out);
                    workDone += d.data.size();
                },
                [&](const EmptyRun & r) { state = feedEmpty(std::move(state), r.sectors * sectorSize, out); },
                [&](const CopyRun &) { unexpectedElement(*e, state.position); },
            },
            e->raw);
        p(workDone);
    }

    state = finishTar(std::move(state));
    writer.close();
    channel.flush();
    p.finish();

    debug("archived %d chunks of %d bytes", state.nextCounter, tarChunkSize);

    return p.totalWork();
}

namespace {

/**
 * A member name taken apart: the chunk counter and whether it is the
 * checksum of that chunk.
 */
struct TarMemberName
{
    uint64_t counter;
    bool isChecksum;
};

TarMemberName parseMemberName(std::string_view name, const DecodeParams & params)
{
    if (params.expectedPrefix && !hasPrefix(name, *params.expectedPrefix))
        throw FramingError("expected filename prefix '%s', got '%s'", *params.expectedPrefix, name);

    auto base = name;
    bool isChecksum = hasSuffix(base, tarChecksumSuffix);
    if (isChecksum)
        base.remove_suffix(tarChecksumSuffix.size());

    auto counter = base.size() >= tarCounterDigits
                       ? string2Int<uint64_t>(base.substr(base.size() - tarCounterDigits))
                       : std::nullopt;
    if (!counter)
        throw FramingError("archive member '%s' is not a numbered chunk", name);

    return {*counter, isChecksum};
}

/**
 * The chunk whose checksum member is due next.
 */
struct PendingChunk
{
    std::string name;
    Hash hash;
};

Hash parseChecksumMember(std::string_view name, std::string_view contents)
{
    try {
        return Hash::parseBase16(trim(contents), HashAlgorithm::SHA1);
    } catch (Error & e) {
        throw FramingError("checksum member '%s' does not hold a SHA-1 digest: %s", name, e.message());
    }
}

} // namespace

void decodeTar(Channel & channel, Descriptor destination, const DecodeParams & params)
{
    TarArchive archive(channel);

    auto buffer = std::make_unique<char[]>(decodeBufferSize);
    std::optional<PendingChunk> pending;
    uint64_t chunks = 0;

    while (auto entry = archive.nextEntry()) {
        std::string name = archive_entry_pathname(entry);
        auto size = (uint64_t) archive_entry_size(entry);
        auto member = parseMemberName(name, params);

        if (member.isChecksum) {
            std::string expected;
            while (true) {
                auto n = archive.readData(buffer.get(), decodeBufferSize);
                if (!n)
                    break;
                expected.append(buffer.get(), n);
            }
            if (!params.verifyChecksums)
                continue;
            auto chunkName = name.substr(0, name.size() - tarChecksumSuffix.size());
            if (!pending || pending->name != chunkName)
                throw FramingError("checksum member '%s' does not follow its chunk", name);
            if (parseChecksumMember(name, expected) != pending->hash)
                throw FramingError(
                    "checksum mismatch in '%s': archive says '%s', data hashes to '%s'",
                    chunkName,
                    trim(expected),
                    pending->hash.to_string(Base::Base16));
            pending.reset();
            continue;
        }

        if (params.verifyChecksums && pending)
            throw FramingError("missing checksum for '%s'", pending->name);

        if (size > tarChunkSize)
            throw FramingError("chunk '%s' has %d bytes, more than the chunk size %d", name, size, tarChunkSize);

        auto offset = member.counter * tarChunkSize;
        debug("chunk '%s': %d bytes at offset %d", name, size, offset);

        HashSink hashSink(HashAlgorithm::SHA1);
        uint64_t received = 0;
        while (true) {
            auto n = archive.readData(buffer.get(), decodeBufferSize);
            if (!n)
                break;
            std::string_view piece(buffer.get(), n);
            pwriteFull(destination, piece, offset + received);
            if (params.verifyChecksums)
                hashSink(piece);
            received += n;
        }
        if (received != size)
            throw FramingError("chunk '%s' is truncated: %d of %d bytes", name, received, size);

        if (params.verifyChecksums)
            pending = PendingChunk{name, hashSink.finish().first};

        chunks++;
    }

    if (params.verifyChecksums && pending)
        throw FramingError("missing checksum for '%s'", pending->name);

    archive.close();

    debug("received %d chunks", chunks);
}

} // namespace diskxfer
