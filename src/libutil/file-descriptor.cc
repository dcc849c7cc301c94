#include "diskxfer/util/file-descriptor.hh"
#include "diskxfer/util/serialise.hh"
#include "diskxfer/util/util.hh"

#include <array>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

namespace diskxfer {

namespace {

// Descriptors handed to us by a parent process may be non-blocking.
void pollFD(int fd, int events)
{
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    int ret = poll(&pfd, 1, -1);
    if (ret == -1) {
        throw SysError("poll on file descriptor failed");
    }
}

} // namespace

std::string readFile(const Path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%1%'", path);
    return drainFD(fd.get());
}

void readFull(int fd, char * buf, size_t count)
{
    while (count) {
        ssize_t res = read(fd, buf, count);
        if (res == -1) {
            switch (errno) {
            case EINTR:
                continue;
            case EAGAIN:
                pollFD(fd, POLLIN);
                continue;
            }
            throw SysError("reading from file");
        }
        if (res == 0)
            throw EndOfFile("unexpected end-of-file");
        count -= res;
        buf += res;
    }
}

void writeFull(int fd, std::string_view s)
{
    while (!s.empty()) {
        ssize_t res = write(fd, s.data(), s.size());
        if (res == -1) {
            switch (errno) {
            case EINTR:
                continue;
            case EAGAIN:
                pollFD(fd, POLLOUT);
                continue;
            }
            throw SysError("writing to file");
        }
        if (res > 0)
            s.remove_prefix(res);
    }
}

void pwriteFull(int fd, std::string_view s, uint64_t offset)
{
    while (!s.empty()) {
        ssize_t res = pwrite(fd, s.data(), s.size(), offset);
        if (res == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("writing %d bytes at offset %d", s.size(), offset);
        }
        s.remove_prefix(res);
        offset += res;
    }
}

void preadFull(int fd, char * buf, size_t count, uint64_t offset)
{
    while (count) {
        ssize_t res = pread(fd, buf, count, offset);
        if (res == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("reading %d bytes at offset %d", count, offset);
        }
        if (res == 0)
            throw EndOfFile("unexpected end-of-file at offset %d", offset);
        count -= res;
        buf += res;
        offset += res;
    }
}

std::string drainFD(Descriptor fd)
{
    StringSink sink;
    std::array<char, 64 * 1024> buf;
    while (1) {
        ssize_t rd = read(fd, buf.data(), buf.size());
        if (rd == -1) {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN) {
                pollFD(fd, POLLIN);
                continue;
            }
            throw SysError("reading from file");
        } else if (rd == 0)
            break;
        else
            sink({buf.data(), (size_t) rd});
    }
    return std::move(sink.s);
}

//////////////////////////////////////////////////////////////////////

AutoCloseFD::AutoCloseFD()
    : fd{INVALID_DESCRIPTOR}
{
}

AutoCloseFD::AutoCloseFD(Descriptor fd)
    : fd{fd}
{
}

AutoCloseFD::AutoCloseFD(AutoCloseFD && that) noexcept
    : fd{that.fd}
{
    that.fd = INVALID_DESCRIPTOR;
}

AutoCloseFD & AutoCloseFD::operator=(AutoCloseFD && that)
{
    close();
    fd = that.fd;
    that.fd = INVALID_DESCRIPTOR;
    return *this;
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

Descriptor AutoCloseFD::get() const
{
    return fd;
}

void AutoCloseFD::close()
{
    if (fd != INVALID_DESCRIPTOR) {
        auto old = fd;
        /* The descriptor is gone even if close() fails, so never retry. */
        fd = INVALID_DESCRIPTOR;
        if (::close(old) == -1)
            throw SysError("closing file descriptor %1%", old);
    }
}

void AutoCloseFD::fsync() const
{
    if (fd != INVALID_DESCRIPTOR) {
        if (::fsync(fd) == -1)
            throw SysError("fsync file descriptor %1%", fd);
    }
}

AutoCloseFD::operator bool() const
{
    return fd != INVALID_DESCRIPTOR;
}

Descriptor AutoCloseFD::release()
{
    Descriptor oldFD = fd;
    fd = INVALID_DESCRIPTOR;
    return oldFD;
}

} // namespace diskxfer
