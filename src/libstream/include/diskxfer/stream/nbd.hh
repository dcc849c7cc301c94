#pragma once
///@file

#include "diskxfer/stream/protocol.hh"

namespace diskxfer {

struct Channel;

namespace nbd {

constexpr uint64_t initMagic = 0x4e42444d41474943; // "NBDMAGIC"
constexpr uint64_t optMagic = 0x49484156454F5054; // "IHAVEOPT"
constexpr uint64_t oldstyleMagic = 0x00420281861253;

constexpr uint32_t requestMagic = 0x25609513;
constexpr uint32_t simpleReplyMagic = 0x67446698;

constexpr uint32_t optExportName = 1;

/* Handshake flags sent by the server, and the client's answer. */
constexpr uint16_t flagFixedNewstyle = 1 << 0;
constexpr uint16_t flagNoZeroes = 1 << 1;

/* Transmission flags. */
constexpr uint16_t flagHasFlags = 1 << 0;
constexpr uint16_t flagReadOnly = 1 << 1;
constexpr uint16_t flagSendFlush = 1 << 2;

enum struct Command : uint16_t {
    Read = 0,
    Write = 1,
    Disconnect = 2,
    Flush = 3,
};

/**
 * Largest payload sent in a single write request.
 */
constexpr size_t maxWriteSize = 2 * 1024 * 1024;

} // namespace nbd

/**
 * What the server told us about the export.
 */
struct NbdExport
{
    uint64_t size = 0;
    uint16_t flags = 0;
};

/**
 * The client end of an NBD session on a channel. Construction performs
 * the handshake.
 */
class NbdClient
{
    Channel & channel;
    NbdExport export_;
    uint64_t nextHandle = 1;

    void handshake();

    void request(nbd::Command command, uint64_t offset, std::string_view data);

    void waitForReply(nbd::Command command, uint64_t handle);

public:

    explicit NbdClient(Channel & channel);

    const NbdExport & exportInfo() const
    {
        return export_;
    }

    /**
     * Write `data` at byte `offset` of the export, waiting for the
     * server to acknowledge each request.
     */
    void write(uint64_t offset, std::string_view data);

    /**
     * Ask the server to commit written data, if it supports that.
     */
    void flush();

    /**
     * End the session. No reply is expected.
     */
    void disconnect();
};

/**
 * Write the data elements of `stream` to an NBD server. Empty runs on
 * a pre-zeroed destination are not sent.
 */
std::optional<uint64_t>
serialiseNbd(Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress);

} // namespace diskxfer
