#include "diskxfer/stream/human.hh"
#include "diskxfer/util/logging.hh"

#include <algorithm>

namespace diskxfer {

std::optional<uint64_t>
serialiseHuman(Channel & channel, const Stream & stream, const SerialiseParams & params, const MakeProgress & progress)
{
    auto & size = stream.size;

    ProgressReporter p(progress, size.work(params.preZeroed));

    logger->writeToStdout("# stream summary:");
    logger->writeToStdout(fmt("# size of the final artifact: %d", size.total));
    logger->writeToStdout(fmt("# size of metadata blocks:    %d", size.metadata));
    logger->writeToStdout(fmt("# size of empty space:        %d", size.empty));
    logger->writeToStdout(fmt("# size of referenced blocks:  %d", size.copy));
    logger->writeToStdout("# offset : contents");

    /* Pad sector numbers to the width of the largest one. */
    auto width = std::to_string(size.total / sectorSize).size();

    uint64_t sector = 0, workDone = 0;
    forEachElement(stream, [&](const StreamElement & e) {
        auto offset = std::to_string(sector);
        offset.insert(0, width - std::min(width, offset.size()), ' ');
        logger->writeToStdout(fmt("%s: %s", offset, e.to_string()));
        sector += e.sectors();
        if (!std::holds_alternative<EmptyRun>(e.raw) || !params.preZeroed)
            workDone += e.size();
        p(workDone);
    });

    logger->writeToStdout("# end of stream");
    p.finish();

    return std::nullopt;
}

} // namespace diskxfer
