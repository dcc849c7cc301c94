#pragma once
///@file

#include "diskxfer/stream/protocol.hh"

namespace diskxfer {

struct Channel;

/**
 * Write the image bytes as they are. Empty runs left in the stream
 * (pre-zeroed destinations only) become `skipOutput()` calls.
 */
std::optional<uint64_t>
serialiseRaw(Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress);

/**
 * Copy everything that arrives on `channel` to `destination`, starting
 * at offset 0, until the sender closes the connection.
 */
void decodeRaw(Channel & channel, Descriptor destination, const DecodeParams & params);

/**
 * Size of the buffer decoders read into.
 */
constexpr size_t decodeBufferSize = 2 * 1024 * 1024;

/**
 * Fail if a stream that should have been normalised for a destination
 * that is not pre-zeroed still contains `element`.
 */
[[noreturn]] void unexpectedElement(const StreamElement & element, uint64_t offset);

} // namespace diskxfer
