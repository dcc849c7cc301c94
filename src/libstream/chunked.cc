#include "diskxfer/stream/chunked.hh"
#include "diskxfer/stream/channel.hh"
#include "diskxfer/stream/normalise.hh"
#include "diskxfer/stream/raw.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/util.hh"

#include <limits>
#include <memory>

namespace diskxfer {

ChunkHeader::Bytes ChunkHeader::marshal() const
{
    Bytes bytes;
    writeLittleEndian<uint64_t>(bytes.data(), offset);
    writeLittleEndian<uint32_t>(bytes.data() + 8, length);
    return bytes;
}

ChunkHeader ChunkHeader::unmarshal(const Bytes & bytes)
{
    return ChunkHeader{
        .offset = readLittleEndian<uint64_t>(bytes.data()),
        .length = readLittleEndian<uint32_t>(bytes.data() + 8),
    };
}

static void writeChunk(Channel & channel, uint64_t offset, std::string_view data)
{
    if (data.size() > std::numeric_limits<uint32_t>::max())
        throw FramingError("run of %d bytes at offset %d does not fit in a chunk", data.size(), offset);
    auto header = ChunkHeader{.offset = offset, .length = (uint32_t) data.size()}.marshal();
    channel({(const char *) header.data(), header.size()});
    channel(data);
}

std::optional<uint64_t>
serialiseChunked(Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress)
{
    ProgressReporter p(progress, stream.size.work(params.preZeroed));

    auto source = normalise(stream, params.preZeroed).open();

    uint64_t offset = 0, workDone = 0;
    while (auto e = source->next()) {
        if (auto d = std::get_if<DataSectors>(&e->raw)) {
            /* A zero-length chunk would read as the end of the stream. */
            if (!d->data.empty())
                writeChunk(channel, offset, d->data);
            workDone += d->data.size();
        } else if (!std::holds_alternative<EmptyRun>(e->raw) || !params.preZeroed)
            unexpectedElement(*e, offset);
        offset += e->size();
        p(workDone);
    }
    p.finish();

    auto last = ChunkHeader{}.marshal();
    channel({(const char *) last.data(), last.size()});
    channel.flush();

    return p.totalWork();
}

void decodeChunked(Channel & channel, Descriptor destination, const DecodeParams & params)
{
    auto buffer = std::make_unique<char[]>(decodeBufferSize);
    uint64_t chunks = 0, received = 0;

    while (true) {
        ChunkHeader::Bytes bytes;
        try {
            channel((char *) bytes.data(), bytes.size());
        } catch (EndOfFile &) {
            throw FramingError("stream ended after %d chunks without an end-of-stream header", chunks);
        }
        auto header = ChunkHeader::unmarshal(bytes);

        if (header.isLast()) {
            printInfo("Received last chunk.");
            break;
        }

        debug("chunk %d: %d bytes at offset %d", chunks, header.length, header.offset);

        uint64_t offset = header.offset;
        uint64_t remaining = header.length;
        while (remaining) {
            auto n = std::min<uint64_t>(remaining, decodeBufferSize);
            try {
                channel(buffer.get(), n);
            } catch (EndOfFile &) {
                throw FramingError(
                    "stream ended in the middle of the chunk at offset %d (%d bytes missing)", header.offset, remaining);
            }
            pwriteFull(destination, {buffer.get(), (size_t) n}, offset);
            offset += n;
            remaining -= n;
        }

        chunks++;
        received += header.length;
    }

    debug("received %d chunks, %d bytes", chunks, received);
}

} // namespace diskxfer
