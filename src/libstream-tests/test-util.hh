#pragma once
///@file

#include "diskxfer/stream/channel.hh"
#include "diskxfer/stream/element.hh"
#include "diskxfer/stream/protocol.hh"
#include "diskxfer/util/file-descriptor.hh"

#include <algorithm>
#include <cstdlib>
#include <utility>

#include <sys/socket.h>
#include <unistd.h>

namespace diskxfer {

/**
 * A channel that records what is written to it and reads from a fixed
 * string.
 */
class MemoryChannel : public Channel
{
    std::string input;
    StringSource source;

public:
    std::string written;

    /**
     * Byte counts passed to `skipOutput()`. Skipped bytes are not
     * appended to `written`.
     */
    std::vector<uint64_t> skips;

    unsigned int flushes = 0;

    explicit MemoryChannel(std::string input = "")
        : input(std::move(input))
        , source(std::string_view(this->input))
    {
    }

    ~MemoryChannel()
    {
        closeSilently();
    }

    using Channel::operator();

    void operator()(std::string_view data) override
    {
        written.append(data);
    }

    size_t read(char * data, size_t len) override
    {
        return source.read(data, len);
    }

    void skipOutput(uint64_t len) override
    {
        skips.push_back(len);
    }

    void flush() override
    {
        flushes++;
    }

protected:
    void doClose() override {}
};

/**
 * A `MemoryChannel` that hands out at most `maxRead` bytes per read,
 * like a socket that delivers data in small segments.
 */
class TricklingChannel : public MemoryChannel
{
    size_t maxRead;

public:
    std::vector<size_t> reads;

    TricklingChannel(std::string input, size_t maxRead)
        : MemoryChannel(std::move(input))
        , maxRead(maxRead)
    {
    }

    size_t read(char * data, size_t len) override
    {
        auto n = MemoryChannel::read(data, std::min(len, maxRead));
        reads.push_back(n);
        return n;
    }
};

/**
 * An in-memory disk image for copy runs.
 */
struct StringSectorReader : SectorReader
{
    std::string image;

    explicit StringSectorReader(std::string image)
        : image(std::move(image))
    {
    }

    std::string name() const override
    {
        return "<memory>";
    }

    std::string readSectors(uint64_t sector, uint64_t count) override
    {
        return image.substr(sector * sectorSize, count * sectorSize);
    }
};

/**
 * A file under /tmp that is removed again when the test is over.
 */
struct TempFile
{
    Path path;
    AutoCloseFD fd;

    TempFile()
    {
        char tmpl[] = "/tmp/diskxfer-test-XXXXXX";
        fd = mkstemp(tmpl);
        if (!fd)
            throw SysError("creating temporary file");
        path = tmpl;
    }

    ~TempFile()
    {
        unlink(path.c_str());
    }
};

/**
 * Records the total announced by a serialiser and every progress
 * value it reports.
 */
struct ProgressRecorder
{
    std::optional<uint64_t> total;
    std::vector<uint64_t> calls;

    MakeProgress make()
    {
        return [this](uint64_t totalWork) -> Progress {
            total = totalWork;
            return [this](uint64_t done) { calls.push_back(done); };
        };
    }

    bool nonDecreasing() const
    {
        return std::is_sorted(calls.begin(), calls.end());
    }
};

inline std::pair<AutoCloseFD, AutoCloseFD> socketPair()
{
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1)
        throw SysError("creating socket pair");
    return {AutoCloseFD{fds[0]}, AutoCloseFD{fds[1]}};
}

/**
 * `n` sectors filled with `c`.
 */
inline std::string filled(uint64_t n, char c)
{
    return std::string(n * sectorSize, c);
}

inline StreamElement dataRun(std::string bytes)
{
    return {DataSectors{std::move(bytes)}};
}

inline StreamElement emptyRun(uint64_t sectors)
{
    return {EmptyRun{sectors}};
}

} // namespace diskxfer
