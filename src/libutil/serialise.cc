#include "diskxfer/util/serialise.hh"
#include "diskxfer/util/util.hh"

#include <algorithm>
#include <array>
#include <cerrno>
#include <memory>

#include <unistd.h>

namespace diskxfer {

void BufferedSink::operator()(std::string_view data)
{
    /* Anything that would not fit goes out directly, after what is
       already queued. */
    if (bufPos + data.size() >= bufSize) {
        flush();
        writeUnbuffered(data);
        return;
    }

    if (!buffer)
        buffer = std::make_unique<char[]>(bufSize);
    std::copy(data.begin(), data.end(), buffer.get() + bufPos);
    bufPos += data.size();
}

void BufferedSink::flush()
{
    if (!bufPos)
        return;
    std::string_view pending(buffer.get(), bufPos);
    bufPos = 0;
    writeUnbuffered(pending);
}

FdSink::~FdSink()
{
    try {
        flush();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void FdSink::writeUnbuffered(std::string_view data)
{
    written += data.size();
    try {
        writeFull(fd, data);
    } catch (SysError & e) {
        _good = false;
        throw;
    }
}

bool FdSink::good()
{
    return _good;
}

void Source::operator()(char * data, size_t len)
{
    for (size_t done = 0; done < len;)
        done += read(data + done, len - done);
}

void Source::drainInto(Sink & sink)
{
    std::array<char, 8192> buf;
    try {
        while (true)
            sink({buf.data(), read(buf.data(), buf.size())});
    } catch (EndOfFile &) {
        /* Drained. */
    }
}

std::string Source::drain()
{
    StringSink s;
    drainInto(s);
    return std::move(s.s);
}

void Source::skip(size_t len)
{
    std::array<char, 8192> buf;
    while (len)
        len -= read(buf.data(), std::min(len, buf.size()));
}

size_t BufferedSource::read(char * data, size_t len)
{
    if (bufPosOut == bufPosIn) {
        if (!buffer)
            buffer = std::make_unique<char[]>(bufSize);
        bufPosOut = 0;
        bufPosIn = readUnbuffered(buffer.get(), bufSize);
    }

    auto n = std::min(len, bufPosIn - bufPosOut);
    std::copy_n(buffer.get() + bufPosOut, n, data);
    bufPosOut += n;
    return n;
}

std::string BufferedSource::readLine(bool eofOk)
{
    std::string line;
    while (true) {
        char c;
        try {
            (*this)(&c, 1);
        } catch (EndOfFile &) {
            if (eofOk)
                return line;
            throw;
        }
        if (c == '\n') {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }
        line += c;
    }
}

size_t FdSource::readUnbuffered(char * data, size_t len)
{
    while (true) {
        auto n = ::read(fd, data, len);
        if (n > 0) {
            bytesRead += n;
            return n;
        }
        if (n == -1 && errno == EINTR)
            continue;
        _good = false;
        if (n == 0)
            throw EndOfFile("unexpected end of file on descriptor %d", fd);
        throw SysError("reading from descriptor %d", fd);
    }
}

bool FdSource::good()
{
    return _good;
}

void StringSink::operator()(std::string_view data)
{
    s.append(data);
}

size_t StringSource::read(char * data, size_t len)
{
    if (pos == s.size())
        throw EndOfFile("end of string reached");
    size_t n = s.copy(data, len, pos);
    pos += n;
    return n;
}

void StringSource::skip(size_t len)
{
    const size_t remain = s.size() - pos;
    if (len > remain) {
        pos = s.size();
        throw EndOfFile("end of string reached");
    }
    pos += len;
}

} // namespace diskxfer
