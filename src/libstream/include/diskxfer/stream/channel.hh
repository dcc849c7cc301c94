#pragma once
///@file

#include "diskxfer/util/serialise.hh"
#include "diskxfer/util/url.hh"

#include <curl/curl.h>

namespace diskxfer {

/**
 * An open, exclusively owned byte transport. Writing goes through the
 * `Sink` interface, reading through the `Source` interface.
 */
struct Channel : Sink, Source
{
    using Sink::operator();
    using Source::operator();

    virtual ~Channel() {}

    /**
     * Move the write position `len` bytes forward without writing
     * anything the reader should rely on. Seekable transports seek;
     * others send zeros.
     */
    virtual void skipOutput(uint64_t len) = 0;

    /**
     * Push out everything written so far.
     */
    virtual void flush() = 0;

    bool good() override
    {
        return !closed;
    }

    /**
     * Flush pending output and release the transport. A channel can
     * only be closed once.
     */
    void close();

    bool isClosed() const
    {
        return closed;
    }

protected:

    virtual void doClose() = 0;

    /**
     * To be called from the destructor of concrete channels: release
     * the transport if nobody closed it, without throwing.
     */
    void closeSilently();

private:

    bool closed = false;
};

/**
 * Close a channel after another failure, logging and ignoring any
 * error from the close itself so that the original error stands.
 */
void closeOnError(Channel & channel);

/**
 * How a channel does its I/O.
 */
struct ChannelOptions
{
    /**
     * Don't coalesce writes in user space; files are also opened with
     * `O_DSYNC`.
     */
    bool unbuffered = false;

    size_t bufferSize = 1024 * 1024;

    /**
     * Whether `skipOutput` may use `lseek`.
     */
    bool seekable = false;

    /**
     * Check the peer certificate of TLS connections.
     */
    bool verifyTls = true;

    /**
     * Seconds to wait for a connection, 0 for the default.
     */
    unsigned long connectTimeout = 0;
};

/**
 * A channel on a file descriptor: a file, a pipe or a socket.
 */
class FdChannel : public Channel
{
    AutoCloseFD owned;
    Descriptor fd;
    ChannelOptions options;
    FdSink sink;
    FdSource source;

public:

    /**
     * Take ownership of `fd`.
     */
    FdChannel(AutoCloseFD && fd, const ChannelOptions & options);

    /**
     * Use `fd` without taking ownership, e.g. standard output.
     */
    FdChannel(Descriptor fd, const ChannelOptions & options);

    ~FdChannel();

    Descriptor get() const
    {
        return fd;
    }

    using Channel::operator();

    void operator()(std::string_view data) override;

    size_t read(char * data, size_t len) override;

    void skipOutput(uint64_t len) override;

    /**
     * Push out buffered bytes. On a seekable descriptor the file is
     * also extended to the write position, so that a skip at the end
     * still counts towards its size.
     */
    void flush() override;

    /**
     * Bytes handed to the descriptor so far.
     */
    uint64_t bytesWritten() const
    {
        return sink.written;
    }

protected:

    void doClose() override;

private:

    void extendToPosition();
};

/**
 * A channel on a connection made by libcurl, so that TLS works the
 * same way as plain TCP. Only the connection is set up by curl; the
 * bytes on it are up to the caller.
 */
class CurlChannel : public Channel
{
    CURL * req = nullptr;
    curl_socket_t sock = CURL_SOCKET_BAD;

    struct Writer : BufferedSink
    {
        CurlChannel & channel;

        Writer(CurlChannel & channel, size_t bufSize)
            : BufferedSink(bufSize)
            , channel(channel)
        {
        }

        void writeUnbuffered(std::string_view data) override
        {
            channel.send(data);
        }
    };

    struct Reader : BufferedSource
    {
        CurlChannel & channel;

        Reader(CurlChannel & channel)
            : channel(channel)
        {
        }

        size_t readUnbuffered(char * data, size_t len) override
        {
            return channel.recv(data, len);
        }
    };

    Writer writer;
    Reader reader;

    /**
     * Block until the socket is readable or writable.
     */
    void wait(bool forWrite);

    void send(std::string_view data);

    size_t recv(char * data, size_t len);

public:

    /**
     * Connect to the host and port of `url` (`http` or `https`).
     */
    CurlChannel(const ParsedURL & url, const ChannelOptions & options);

    ~CurlChannel();

    using Channel::operator();

    void operator()(std::string_view data) override;

    size_t read(char * data, size_t len) override;

    void skipOutput(uint64_t len) override;

    void flush() override
    {
        writer.flush();
    }

protected:

    void doClose() override;
};

/**
 * Open a file as the destination of a transfer, creating it if
 * needed. The file is never truncated.
 */
AutoCloseFD openDestinationFile(const Path & path, bool unbuffered);

} // namespace diskxfer
