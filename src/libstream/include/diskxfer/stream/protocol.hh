#pragma once
///@file

#include "diskxfer/stream/element.hh"
#include "diskxfer/util/file-descriptor.hh"

#include <functional>
#include <optional>
#include <span>

namespace diskxfer {

struct Channel;
struct Endpoint;

/**
 * The wire encodings a stream can be sent in.
 */
enum struct Protocol {
    /** The image bytes, nothing else. */
    Raw,
    /** `{offset, length}` headers in front of every run of data. */
    Chunked,
    /** A Network Block Device client session. */
    Nbd,
    /** A ustar archive of fixed-size chunks with SHA-1 checksums. */
    Tar,
    /** A listing of the elements, for debugging. */
    Human,
};

/**
 * Parse a protocol name. `none` is accepted for `raw`.
 */
Protocol parseProtocol(std::string_view s);

std::string_view showProtocol(Protocol protocol);

std::ostream & operator<<(std::ostream & os, Protocol protocol);

/**
 * Called with the amount of work done so far.
 */
typedef std::function<void(uint64_t workDone)> Progress;

/**
 * Called once per transfer with the total amount of work; returns the
 * callback for reporting progress towards it.
 */
typedef std::function<Progress(uint64_t totalWork)> MakeProgress;

/**
 * Wraps a `Progress` so that it only ever sees a non-decreasing
 * sequence of values no greater than the total, and always ends on
 * the total.
 */
class ProgressReporter
{
    Progress progress;
    uint64_t total;
    uint64_t last = 0;

public:

    ProgressReporter(const MakeProgress & makeProgress, uint64_t total);

    uint64_t totalWork() const
    {
        return total;
    }

    void operator()(uint64_t workDone);

    /**
     * Report the total.
     */
    void finish();
};

struct SerialiseParams
{
    /**
     * All bytes not written are known to be zero already.
     */
    bool preZeroed = false;

    /**
     * Name prefix for the members of tar streams.
     */
    std::string tarFilenamePrefix;
};

struct DecodeParams
{
    /**
     * If set, every tar member name must start with this.
     */
    std::optional<std::string> expectedPrefix;

    /**
     * Check each tar chunk against its checksum member.
     */
    bool verifyChecksums = true;
};

/**
 * Write `stream` to `channel`. Returns the amount of work done, or
 * `std::nullopt` if the encoding doesn't transfer the data.
 */
typedef std::optional<uint64_t> (*Serialiser)(
    Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress);

/**
 * Reconstruct a raw image in `destination` from what arrives on
 * `channel`.
 */
typedef void (*Decoder)(Channel & channel, Descriptor destination, const DecodeParams & params);

struct ProtocolInfo
{
    Protocol protocol;
    std::string_view name;
    Serialiser serialise;

    /**
     * `nullptr` if there is no receiving side for this protocol.
     */
    Decoder decode;

    /**
     * Whether an endpoint of this kind can carry the protocol.
     */
    bool (*carriedBy)(const Endpoint & endpoint);
};

/**
 * Every protocol, in order of preference.
 */
std::span<const ProtocolInfo> allProtocols();

const ProtocolInfo & protocolInfo(Protocol protocol);

/**
 * The protocols `endpoint` can carry, most preferred first.
 */
std::vector<Protocol> supportedProtocols(const Endpoint & endpoint);

/**
 * Use `requested` if given, otherwise the first supported protocol.
 * Fails if the result is not in `supported`.
 */
Protocol chooseProtocol(std::optional<Protocol> requested, const std::vector<Protocol> & supported);

} // namespace diskxfer
