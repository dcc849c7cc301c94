#pragma once
///@file

#include "diskxfer/stream/protocol.hh"

namespace diskxfer {

struct Channel;

/**
 * Describe `stream` on standard output, one line per element, without
 * normalising it. Nothing is sent over `channel`.
 */
std::optional<uint64_t>
serialiseHuman(Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress);

} // namespace diskxfer
