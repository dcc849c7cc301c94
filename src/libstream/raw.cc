#include "diskxfer/stream/raw.hh"
#include "diskxfer/stream/channel.hh"
#include "diskxfer/stream/normalise.hh"
#include "diskxfer/util/logging.hh"

#include <memory>

namespace diskxfer {

void unexpectedElement(const StreamElement & element, uint64_t offset)
{
    throw FramingError("unexpected stream element at byte %d: %s", offset, element.to_string());
}

std::optional<uint64_t>
serialiseRaw(Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress)
{
    ProgressReporter p(progress, stream.size.work(params.preZeroed));

    auto source = normalise(stream, params.preZeroed).open();

    uint64_t offset = 0, workDone = 0;
    while (auto e = source->next()) {
        if (auto d = std::get_if<DataSectors>(&e->raw)) {
            channel(d->data);
            workDone += d->data.size();
        } else if (std::holds_alternative<EmptyRun>(e->raw) && params.preZeroed)
            channel.skipOutput(e->size());
        else
            unexpectedElement(*e, offset);
        offset += e->size();
        p(workDone);
    }

    channel.flush();
    p.finish();

    return p.totalWork();
}

void decodeRaw(Channel & channel, Descriptor destination, const DecodeParams & params)
{
    auto buffer = std::make_unique<char[]>(decodeBufferSize);
    uint64_t offset = 0;

    while (true) {
        size_t n;
        try {
            n = channel.read(buffer.get(), decodeBufferSize);
        } catch (EndOfFile &) {
            break;
        }
        pwriteFull(destination, {buffer.get(), n}, offset);
        offset += n;
    }

    debug("received %d bytes", offset);
}

} // namespace diskxfer
