#pragma once
///@file

#include "diskxfer/stream/channel.hh"
#include "diskxfer/stream/protocol.hh"
#include "diskxfer/util/url.hh"

#include <memory>
#include <variant>

namespace diskxfer {

/**
 * Where a stream goes to, or comes from. Parsing an endpoint has no
 * side effects; `openEndpoint()` turns it into a channel.
 */
struct Endpoint
{
    /** `stdout:` */
    struct Stdout
    {
        bool operator==(const Stdout &) const = default;
    };

    /** `null:` */
    struct Null
    {
        bool operator==(const Null &) const = default;
    };

    /** `fd://N`, a descriptor inherited from the parent. */
    struct FileDescriptor
    {
        Descriptor fd;
        bool operator==(const FileDescriptor &) const = default;
    };

    /** `tcp://host:port` */
    struct TcpSocket
    {
        std::string host;
        uint16_t port;
        bool operator==(const TcpSocket &) const = default;
    };

    /** `unix:///path` */
    struct UnixSocket
    {
        Path path;
        bool operator==(const UnixSocket &) const = default;
    };

    /** `file:///path` */
    struct File
    {
        Path path;
        bool operator==(const File &) const = default;
    };

    /** `http://...` or `https://...` */
    struct Http
    {
        ParsedURL url;

        bool tls() const
        {
            return url.scheme == "https";
        }

        bool operator==(const Http &) const = default;
    };

    typedef std::variant<Stdout, Null, FileDescriptor, TcpSocket, UnixSocket, File, Http> Raw;

    Raw raw;

    bool operator==(const Endpoint &) const = default;

    std::string to_string() const;
};

/**
 * Parse a destination or source specifier.
 */
Endpoint parseEndpoint(std::string_view spec);

/**
 * A channel together with the protocols it can carry, most preferred
 * first.
 */
struct OpenedEndpoint
{
    std::unique_ptr<Channel> channel;
    std::vector<Protocol> protocols;
};

struct HttpRequestOptions
{
    std::string userAgent;
};

/**
 * Connect to `endpoint`. For HTTP endpoints this also sends the
 * request and narrows the protocols down to what the server accepted.
 */
OpenedEndpoint
openEndpoint(const Endpoint & endpoint, const ChannelOptions & options, const HttpRequestOptions & httpOptions = {});

/**
 * Connect a stream socket to a TCP or Unix socket endpoint.
 */
AutoCloseFD connectSocket(const Endpoint & endpoint);

/**
 * Bind to a TCP or Unix socket endpoint, listen and accept exactly one
 * connection.
 */
AutoCloseFD acceptOnce(const Endpoint & endpoint);

} // namespace diskxfer
