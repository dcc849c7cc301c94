#include "diskxfer/stream/endpoint.hh"
#include "diskxfer/stream/http.hh"
#include "diskxfer/util/finally.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/unix-domain-socket.hh"
#include "diskxfer/util/util.hh"

#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace diskxfer {

std::string Endpoint::to_string() const
{
    return std::visit(
        overloaded{
            [](const Stdout &) -> std::string { return "stdout:"; },
            [](const Null &) -> std::string { return "null:"; },
            [](const FileDescriptor & f) { return fmt("fd://%d", f.fd); },
            [](const TcpSocket & t) {
                return t.host.find(':') != std::string::npos ? fmt("tcp://[%s]:%d", t.host, t.port)
                                                             : fmt("tcp://%s:%d", t.host, t.port);
            },
            [](const UnixSocket & u) { return "unix://" + u.path; },
            [](const File & f) { return "file://" + f.path; },
            [](const Http & h) { return h.url.to_string(); },
        },
        raw);
}

/**
 * The path of `scheme://a/b` or `scheme:///a/b`; a relative path may be
 * written with the first component in the authority position.
 */
static Path pathOf(const ParsedURL & url)
{
    if (url.authority && !url.authority->host.empty())
        return url.authority->host + url.path;
    return url.path;
}

Endpoint parseEndpoint(std::string_view spec)
{
    if (spec == "stdout:")
        return {Endpoint::Stdout{}};
    if (spec == "null:")
        return {Endpoint::Null{}};

    auto url = parseURL(spec);

    if (url.scheme == "fd") {
        auto s = pathOf(url);
        if (hasPrefix(s, "/"))
            s = s.substr(1);
        auto fd = string2Int<Descriptor>(s);
        if (!fd || *fd < 0)
            throw UsageError("'%s' does not name a file descriptor", spec);
        return {Endpoint::FileDescriptor{*fd}};
    }

    if (url.scheme == "tcp") {
        if (!url.authority || url.authority->host.empty())
            throw UsageError("please supply a host in the URI '%s'", spec);
        if (!url.authority->port)
            throw UsageError("please supply a port in the URI '%s'", spec);
        return {Endpoint::TcpSocket{url.authority->host, *url.authority->port}};
    }

    if (url.scheme == "unix" || url.scheme == "file") {
        auto path = pathOf(url);
        if (path.empty())
            throw UsageError("please supply a path in the URI '%s'", spec);
        if (url.scheme == "unix")
            return {Endpoint::UnixSocket{path}};
        return {Endpoint::File{path}};
    }

    if (url.scheme == "http" || url.scheme == "https") {
        if (!url.authority || url.authority->host.empty())
            throw UsageError("please supply a host in the URI '%s'", spec);
        return {Endpoint::Http{url}};
    }

    throw UsageError("unknown URI scheme '%s' in '%s'", url.scheme, spec);
}

static AutoCloseFD tcpSocket(const Endpoint::TcpSocket & addr, bool listening)
{
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = listening ? AI_PASSIVE : 0;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo * result;
    if (auto s = getaddrinfo(addr.host.c_str(), fmt("%d", addr.port).c_str(), &hints, &result))
        throw TransportError("address lookup of '%s' failed: %s", addr.host, gai_strerror(s));

    Finally cleanup([&]() { freeaddrinfo(result); });

    std::string err = "no addresses";

    for (auto rp = result; rp; rp = rp->ai_next) {
        AutoCloseFD fd = socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
        if (!fd) {
            err = strerror(errno);
            continue;
        }

        if (listening) {
            int one = 1;
            setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
            if (::bind(fd.get(), rp->ai_addr, rp->ai_addrlen) == -1) {
                err = strerror(errno);
                continue;
            }
        } else if (::connect(fd.get(), rp->ai_addr, rp->ai_addrlen) == -1) {
            err = strerror(errno);
            continue;
        }

        return fd;
    }

    throw TransportError(
        "could not %s '%s' port %d: %s", listening ? "bind to" : "connect to", addr.host, addr.port, err);
}

AutoCloseFD connectSocket(const Endpoint & endpoint)
{
    if (auto tcp = std::get_if<Endpoint::TcpSocket>(&endpoint.raw))
        return tcpSocket(*tcp, false);
    if (auto u = std::get_if<Endpoint::UnixSocket>(&endpoint.raw)) {
        auto fd = createUnixDomainSocket();
        connect(fd.get(), u->path);
        return fd;
    }
    throw UnsupportedError("cannot connect a socket to '%s'", endpoint.to_string());
}

AutoCloseFD acceptOnce(const Endpoint & endpoint)
{
    AutoCloseFD listener;
    if (auto tcp = std::get_if<Endpoint::TcpSocket>(&endpoint.raw))
        listener = tcpSocket(*tcp, true);
    else if (auto u = std::get_if<Endpoint::UnixSocket>(&endpoint.raw)) {
        listener = createUnixDomainSocket();
        bind(listener.get(), u->path);
    } else
        throw UnsupportedError("serving from source '%s' is not implemented", endpoint.to_string());

    if (listen(listener.get(), 1) == -1)
        throw SysError("cannot listen on '%s'", endpoint.to_string());

    printInfo("waiting for a connection on '%s'", endpoint.to_string());

    AutoCloseFD remote;
    do {
        remote = accept4(listener.get(), nullptr, nullptr, SOCK_CLOEXEC);
    } while (!remote && errno == EINTR);
    if (!remote)
        throw SysError("accepting connection on '%s'", endpoint.to_string());

    return remote;
}

OpenedEndpoint
openEndpoint(const Endpoint & endpoint, const ChannelOptions & options, const HttpRequestOptions & httpOptions)
{
    auto protocols = supportedProtocols(endpoint);

    auto channel = std::visit(
        overloaded{
            [&](const Endpoint::Stdout &) -> std::unique_ptr<Channel> {
                return std::make_unique<FdChannel>(getStandardOutput(), options);
            },
            [&](const Endpoint::Null &) -> std::unique_ptr<Channel> {
                AutoCloseFD fd = open("/dev/null", O_RDWR | O_CLOEXEC);
                if (!fd)
                    throw SysError("opening '/dev/null'");
                return std::make_unique<FdChannel>(std::move(fd), options);
            },
            [&](const Endpoint::FileDescriptor & f) -> std::unique_ptr<Channel> {
                if (fcntl(f.fd, F_GETFD) == -1)
                    throw SysError("file descriptor %d is not usable", f.fd);
                return std::make_unique<FdChannel>(AutoCloseFD{f.fd}, options);
            },
            [&](const Endpoint::TcpSocket &) -> std::unique_ptr<Channel> {
                return std::make_unique<FdChannel>(connectSocket(endpoint), options);
            },
            [&](const Endpoint::UnixSocket &) -> std::unique_ptr<Channel> {
                return std::make_unique<FdChannel>(connectSocket(endpoint), options);
            },
            [&](const Endpoint::File & f) -> std::unique_ptr<Channel> {
                auto fileOptions = options;
                fileOptions.seekable = true;
                return std::make_unique<FdChannel>(openDestinationFile(f.path, options.unbuffered), fileOptions);
            },
            [&](const Endpoint::Http & h) -> std::unique_ptr<Channel> {
                return std::make_unique<CurlChannel>(h.url, options);
            },
        },
        endpoint.raw);

    if (auto h = std::get_if<Endpoint::Http>(&endpoint.raw)) {
        try {
            protocols = negotiateUpload(*channel, h->url, httpOptions.userAgent);
        } catch (Error & e) {
            closeOnError(*channel);
            e.addTrace("while negotiating an upload to '%s'", h->url.to_string());
            throw;
        }
    }

    return {std::move(channel), std::move(protocols)};
}

} // namespace diskxfer
