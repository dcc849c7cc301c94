#include "diskxfer/stream/nbd.hh"
#include "diskxfer/stream/channel.hh"
#include "diskxfer/stream/normalise.hh"
#include "diskxfer/stream/raw.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/util.hh"

#include <array>

namespace diskxfer {

using namespace nbd;

template<typename T>
static T readBE(Channel & channel)
{
    std::array<unsigned char, sizeof(T)> buf;
    channel((char *) buf.data(), buf.size());
    return readBigEndian<T>(buf.data());
}

template<typename T>
static void putBE(std::string & out, T x)
{
    std::array<unsigned char, sizeof(T)> buf;
    writeBigEndian<T>(buf.data(), x);
    out.append((const char *) buf.data(), buf.size());
}

NbdClient::NbdClient(Channel & channel)
    : channel(channel)
{
    try {
        handshake();
    } catch (EndOfFile &) {
        throw FramingError("NBD server closed the connection during the handshake");
    }
}

void NbdClient::handshake()
{
    auto magic = readBE<uint64_t>(channel);
    if (magic != initMagic)
        throw FramingError("expected NBD magic 0x%016x, got 0x%016x", initMagic, magic);

    auto style = readBE<uint64_t>(channel);

    if (style == oldstyleMagic) {
        export_.size = readBE<uint64_t>(channel);
        export_.flags = (uint16_t) readBE<uint32_t>(channel);
        channel.skip(124);
        debug("oldstyle NBD handshake, export size %d", export_.size);
        return;
    }

    if (style != optMagic)
        throw FramingError("unexpected NBD handshake style 0x%016x", style);

    auto serverFlags = readBE<uint16_t>(channel);
    if (!(serverFlags & flagFixedNewstyle))
        throw FramingError("NBD server does not support the fixed newstyle handshake");

    uint32_t clientFlags = flagFixedNewstyle | (serverFlags & flagNoZeroes);

    std::string out;
    putBE<uint32_t>(out, clientFlags);
    putBE<uint64_t>(out, optMagic);
    putBE<uint32_t>(out, optExportName);
    putBE<uint32_t>(out, 0); // export name ""
    channel(out);
    channel.flush();

    export_.size = readBE<uint64_t>(channel);
    export_.flags = readBE<uint16_t>(channel);
    if (!(clientFlags & flagNoZeroes))
        channel.skip(124);

    debug("newstyle NBD handshake, export size %d, flags 0x%x", export_.size, export_.flags);

    if ((export_.flags & flagHasFlags) && (export_.flags & flagReadOnly))
        throw TransportError("the NBD export is read-only");
}

void NbdClient::request(Command command, uint64_t offset, std::string_view data)
{
    std::string out;
    putBE<uint32_t>(out, requestMagic);
    putBE<uint16_t>(out, 0);
    putBE<uint16_t>(out, (uint16_t) command);
    putBE<uint64_t>(out, nextHandle);
    putBE<uint64_t>(out, offset);
    putBE<uint32_t>(out, (uint32_t) data.size());
    channel(out);
    channel(data);
    channel.flush();
}

void NbdClient::waitForReply(Command command, uint64_t handle)
{
    try {
        auto magic = readBE<uint32_t>(channel);
        if (magic != simpleReplyMagic)
            throw FramingError("unexpected NBD reply magic 0x%08x", magic);
        auto error = readBE<uint32_t>(channel);
        auto replyHandle = readBE<uint64_t>(channel);
        if (replyHandle != handle)
            throw FramingError("NBD reply is for request %d, expected %d", replyHandle, handle);
        if (error)
            throw TransportError("NBD server failed request %d (command %d) with error %d", handle, (int) command, error);
    } catch (EndOfFile &) {
        throw FramingError("NBD server closed the connection before answering request %d", handle);
    }
}

void NbdClient::write(uint64_t offset, std::string_view data)
{
    if (offset + data.size() > export_.size)
        throw FramingError(
            "write of %d bytes at offset %d goes beyond the end of the %d-byte NBD export",
            data.size(), offset, export_.size);

    while (!data.empty()) {
        auto piece = data.substr(0, maxWriteSize);
        auto handle = nextHandle;
        request(Command::Write, offset, piece);
        nextHandle++;
        waitForReply(Command::Write, handle);
        offset += piece.size();
        data.remove_prefix(piece.size());
    }
}

void NbdClient::flush()
{
    if (!(export_.flags & flagSendFlush))
        return;
    auto handle = nextHandle;
    request(Command::Flush, 0, {});
    nextHandle++;
    waitForReply(Command::Flush, handle);
}

void NbdClient::disconnect()
{
    request(Command::Disconnect, 0, {});
    nextHandle++;
}

std::optional<uint64_t>
serialiseNbd(Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress)
{
    NbdClient client(channel);

    if (client.exportInfo().size < stream.size.total)
        throw FramingError(
            "the NBD export has %d bytes, but the stream needs %d", client.exportInfo().size, stream.size.total);

    ProgressReporter p(progress, stream.size.work(params.preZeroed));

    auto source = normalise(stream, params.preZeroed).open();

    uint64_t offset = 0, workDone = 0;
    while (auto e = source->next()) {
        if (auto d = std::get_if<DataSectors>(&e->raw)) {
            client.write(offset, d->data);
            workDone += d->data.size();
        } else if (!std::holds_alternative<EmptyRun>(e->raw) || !params.preZeroed)
            unexpectedElement(*e, offset);
        offset += e->size();
        p(workDone);
    }

    client.flush();
    client.disconnect();
    p.finish();

    return p.totalWork();
}

} // namespace diskxfer
