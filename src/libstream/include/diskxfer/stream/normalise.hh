#pragma once
///@file

#include "diskxfer/stream/element.hh"

namespace diskxfer {

/**
 * Largest payload, in sectors, that the normalisers materialise into a
 * single `DataSectors` element. Longer runs are split.
 */
constexpr uint64_t maxExpandSectors = 4096;

/**
 * Replace every `EmptyRun` by zero-filled `DataSectors` of the same
 * length. Only valid to skip when the destination is pre-zeroed.
 */
Stream expandEmpty(const Stream & stream);

/**
 * Replace every `CopyRun` by `DataSectors` holding the bytes read from
 * its source.
 */
Stream expandCopy(const Stream & stream);

/**
 * Condition `stream` for a serialiser that needs literal bytes: expand
 * empty runs unless the destination is pre-zeroed, then expand copies.
 */
Stream normalise(const Stream & stream, bool preZeroed);

} // namespace diskxfer
