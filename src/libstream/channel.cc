#include "diskxfer/stream/channel.hh"
#include "diskxfer/util/finally.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/util.hh"

#include <algorithm>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

namespace diskxfer {

void Channel::close()
{
    if (closed)
        throw Error("channel is already closed");
    closed = true;
    doClose();
}

void Channel::closeSilently()
{
    if (closed)
        return;
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor(lvlDebug);
    }
}

void closeOnError(Channel & channel)
{
    if (channel.isClosed())
        return;
    try {
        channel.close();
    } catch (Error & e) {
        e.addTrace("while closing the channel after an earlier error");
        logWarning(e.info());
    }
}

static void writeZeros(Sink & sink, uint64_t len)
{
    static const std::string zeros(64 * 1024, '\0');
    while (len) {
        auto n = std::min<uint64_t>(len, zeros.size());
        sink({zeros.data(), n});
        len -= n;
    }
}

//////////////////////////////////////////////////////////////////////

FdChannel::FdChannel(AutoCloseFD && fd, const ChannelOptions & options)
    : owned(std::move(fd))
    , fd(owned.get())
    , options(options)
    , sink(this->fd, options.unbuffered ? 0 : options.bufferSize)
    , source(this->fd)
{
}

FdChannel::FdChannel(Descriptor fd, const ChannelOptions & options)
    : fd(fd)
    , options(options)
    , sink(fd, options.unbuffered ? 0 : options.bufferSize)
    , source(fd)
{
}

FdChannel::~FdChannel()
{
    closeSilently();
}

void FdChannel::operator()(std::string_view data)
{
    sink(data);
}

size_t FdChannel::read(char * data, size_t len)
{
    return source.read(data, len);
}

void FdChannel::skipOutput(uint64_t len)
{
    if (!len)
        return;
    if (options.seekable) {
        sink.flush();
        if (lseek(fd, len, SEEK_CUR) == -1)
            throw SysError("seeking %d bytes forward in the destination", len);
        return;
    }
    writeZeros(sink, len);
}

void FdChannel::flush()
{
    sink.flush();
    if (options.seekable)
        extendToPosition();
}

void FdChannel::extendToPosition()
{
    auto pos = lseek(fd, 0, SEEK_CUR);
    if (pos == -1)
        throw SysError("getting the position in the destination");

    struct stat st;
    if (fstat(fd, &st) == -1)
        throw SysError("getting the size of the destination");

    if (S_ISREG(st.st_mode) && st.st_size < pos && ftruncate(fd, pos) == -1)
        throw SysError("extending the destination to %d bytes", pos);
}

void FdChannel::doClose()
{
    try {
        flush();
    } catch (...) {
        /* Drop what could not be written, but still let go of the
           descriptor. */
        sink.bufPos = 0;
        if (owned)
            ::close(owned.release());
        throw;
    }
    if (owned)
        owned.close();
}

//////////////////////////////////////////////////////////////////////

CurlChannel::CurlChannel(const ParsedURL & url, const ChannelOptions & options)
    : writer(*this, options.unbuffered ? 0 : options.bufferSize)
    , reader(*this)
{
    static std::once_flag globalInit;
    std::call_once(globalInit, curl_global_init, CURL_GLOBAL_ALL);

    if (!url.authority || url.authority->host.empty())
        throw UsageError("URL '%s' has no host", url.to_string());

    /* curl only needs to know where to connect to. */
    auto authority = *url.authority;
    authority.user.reset();
    authority.password.reset();
    auto target = url.scheme + "://" + authority.to_string() + "/";

    req = curl_easy_init();
    if (!req)
        throw TransportError("unable to initialise curl");

    /* The destructor does not run if we throw from here on. */
    Finally freeHandle([&]() {
        curl_easy_cleanup(req);
        req = nullptr;
    });

    curl_easy_setopt(req, CURLOPT_URL, target.c_str());
    curl_easy_setopt(req, CURLOPT_CONNECT_ONLY, 1L);
    curl_easy_setopt(req, CURLOPT_NOSIGNAL, 1);
    if (!options.verifyTls) {
        curl_easy_setopt(req, CURLOPT_SSL_VERIFYPEER, 0);
        curl_easy_setopt(req, CURLOPT_SSL_VERIFYHOST, 0);
    }
    if (options.connectTimeout)
        curl_easy_setopt(req, CURLOPT_CONNECTTIMEOUT, (long) options.connectTimeout);

    debug("connecting to '%s'", target);

    auto code = curl_easy_perform(req);
    if (code != CURLE_OK)
        throw TransportError("unable to connect to '%s' (curl error: %s)", target, curl_easy_strerror(code));

    code = curl_easy_getinfo(req, CURLINFO_ACTIVESOCKET, &sock);
    if (code != CURLE_OK || sock == CURL_SOCKET_BAD)
        throw TransportError("unable to get the socket of the connection to '%s'", target);

    freeHandle.cancel();
}

CurlChannel::~CurlChannel()
{
    closeSilently();
    if (req)
        curl_easy_cleanup(req);
}

void CurlChannel::wait(bool forWrite)
{
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = forWrite ? POLLOUT : POLLIN;
    pfd.revents = 0;
    while (poll(&pfd, 1, -1) == -1)
        if (errno != EINTR)
            throw SysError("waiting for the connection");
}

void CurlChannel::send(std::string_view data)
{
    while (!data.empty()) {
        size_t n = 0;
        auto code = curl_easy_send(req, data.data(), data.size(), &n);
        if (code == CURLE_AGAIN) {
            wait(true);
            continue;
        }
        if (code != CURLE_OK)
            throw TransportError("sending to the server failed (curl error: %s)", curl_easy_strerror(code));
        data.remove_prefix(n);
    }
}

size_t CurlChannel::recv(char * data, size_t len)
{
    while (true) {
        size_t n = 0;
        auto code = curl_easy_recv(req, data, len, &n);
        if (code == CURLE_AGAIN) {
            wait(false);
            continue;
        }
        if (code != CURLE_OK)
            throw TransportError("receiving from the server failed (curl error: %s)", curl_easy_strerror(code));
        if (n == 0)
            throw EndOfFile("connection closed by the server");
        return n;
    }
}

void CurlChannel::operator()(std::string_view data)
{
    writer(data);
}

size_t CurlChannel::read(char * data, size_t len)
{
    return reader.read(data, len);
}

void CurlChannel::skipOutput(uint64_t len)
{
    writeZeros(writer, len);
}

void CurlChannel::doClose()
{
    Finally cleanup([&]() {
        curl_easy_cleanup(req);
        req = nullptr;
    });
    try {
        writer.flush();
    } catch (...) {
        writer.bufPos = 0;
        throw;
    }
}

//////////////////////////////////////////////////////////////////////

AutoCloseFD openDestinationFile(const Path & path, bool unbuffered)
{
    AutoCloseFD fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC | (unbuffered ? O_DSYNC : 0), 0644);
    if (!fd)
        throw SysError("opening destination file '%1%'", path);
    return fd;
}

} // namespace diskxfer
