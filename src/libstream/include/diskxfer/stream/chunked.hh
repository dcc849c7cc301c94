#pragma once
///@file

#include "diskxfer/stream/protocol.hh"

#include <array>

namespace diskxfer {

struct Channel;

/**
 * The header in front of every chunk: the byte offset into the virtual
 * disk and the payload length, both little-endian. A header with
 * length 0 ends the stream.
 */
struct ChunkHeader
{
    uint64_t offset = 0;
    uint32_t length = 0;

    static constexpr size_t size = 12;

    typedef std::array<unsigned char, size> Bytes;

    Bytes marshal() const;

    static ChunkHeader unmarshal(const Bytes & bytes);

    bool isLast() const
    {
        return length == 0;
    }

    bool operator==(const ChunkHeader &) const = default;
};

/**
 * Send every run of data as a header followed by its payload, then the
 * end-of-stream header.
 */
std::optional<uint64_t>
serialiseChunked(Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress);

/**
 * Write each received chunk at its offset in `destination`, until the
 * end-of-stream header.
 */
void decodeChunked(Channel & channel, Descriptor destination, const DecodeParams & params);

} // namespace diskxfer
