#include "diskxfer/stream/protocol.hh"
#include "diskxfer/stream/chunked.hh"
#include "diskxfer/stream/endpoint.hh"
#include "diskxfer/stream/human.hh"
#include "diskxfer/stream/nbd.hh"
#include "diskxfer/stream/raw.hh"
#include "diskxfer/stream/tar-stream.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/strings.hh"
#include "diskxfer/util/util.hh"

#include <algorithm>
#include <array>

namespace diskxfer {

namespace {

/* Which endpoint kinds carry which protocols. HTTP endpoints are
   narrowed further by what the server answers. */

bool isLocalOutput(const Endpoint & endpoint)
{
    return std::holds_alternative<Endpoint::Stdout>(endpoint.raw) || std::holds_alternative<Endpoint::Null>(endpoint.raw)
           || std::holds_alternative<Endpoint::File>(endpoint.raw);
}

bool isConnection(const Endpoint & endpoint)
{
    return std::holds_alternative<Endpoint::FileDescriptor>(endpoint.raw)
           || std::holds_alternative<Endpoint::TcpSocket>(endpoint.raw)
           || std::holds_alternative<Endpoint::UnixSocket>(endpoint.raw);
}

bool isHttp(const Endpoint & endpoint)
{
    return std::holds_alternative<Endpoint::Http>(endpoint.raw);
}

bool carriesAnyStream(const Endpoint & endpoint)
{
    return isLocalOutput(endpoint) || isConnection(endpoint);
}

bool carriesFraming(const Endpoint & endpoint)
{
    return isConnection(endpoint) || isHttp(endpoint);
}

const std::array<ProtocolInfo, 5> protocolTable{{
    {Protocol::Nbd, "nbd", serialiseNbd, nullptr, carriesFraming},
    {Protocol::Raw, "raw", serialiseRaw, decodeRaw, carriesAnyStream},
    {Protocol::Chunked, "chunked", serialiseChunked, decodeChunked, carriesFraming},
    {Protocol::Human, "human", serialiseHuman, nullptr, carriesAnyStream},
    {Protocol::Tar, "tar", serialiseTar, decodeTar, carriesAnyStream},
}};

} // namespace

std::span<const ProtocolInfo> allProtocols()
{
    return protocolTable;
}

const ProtocolInfo & protocolInfo(Protocol protocol)
{
    for (auto & info : protocolTable)
        if (info.protocol == protocol)
            return info;
    unreachable();
}

Protocol parseProtocol(std::string_view s)
{
    if (s == "none")
        return Protocol::Raw;
    for (auto & info : protocolTable)
        if (info.name == s)
            return info.protocol;
    StringSet names;
    for (auto & info : protocolTable)
        names.insert(std::string(info.name));
    throw UsageError("unknown protocol '%s'; known protocols are: %s", s, concatStringsSep(", ", names));
}

std::string_view showProtocol(Protocol protocol)
{
    return protocolInfo(protocol).name;
}

std::ostream & operator<<(std::ostream & os, Protocol protocol)
{
    return os << showProtocol(protocol);
}

std::vector<Protocol> supportedProtocols(const Endpoint & endpoint)
{
    std::vector<Protocol> res;
    for (auto & info : protocolTable)
        if (info.carriedBy(endpoint))
            res.push_back(info.protocol);
    return res;
}

Protocol chooseProtocol(std::optional<Protocol> requested, const std::vector<Protocol> & supported)
{
    if (supported.empty())
        throw UnsupportedError("this destination supports no protocols");

    auto protocol = requested ? *requested : supported.front();
    if (!requested)
        printInfo("Using protocol: %s", showProtocol(protocol));

    if (std::find(supported.begin(), supported.end(), protocol) == supported.end()) {
        Strings names;
        for (auto p : supported)
            names.push_back(std::string(showProtocol(p)));
        throw UnsupportedError("this destination only supports protocols: [ %s ]", concatStringsSep("; ", names));
    }

    return protocol;
}

ProgressReporter::ProgressReporter(const MakeProgress & makeProgress, uint64_t total)
    : progress(makeProgress ? makeProgress(total) : Progress{})
    , total(total)
{
}

void ProgressReporter::operator()(uint64_t workDone)
{
    workDone = std::min(std::max(workDone, last), total);
    last = workDone;
    if (progress)
        progress(workDone);
}

void ProgressReporter::finish()
{
    last = total;
    if (progress)
        progress(total);
}

} // namespace diskxfer
