#pragma once
///@file

#include "diskxfer/stream/protocol.hh"
#include "diskxfer/util/serialise.hh"
#include "diskxfer/util/url.hh"

namespace diskxfer {

/**
 * The server answered the upload request with a non-success status.
 * The message is the server's reason phrase.
 */
class RemoteRejection : public TransportError
{
public:
    unsigned int status;
    std::string reason;

    RemoteRejection(unsigned int status, const std::string & reason)
        : TransportError(HintFmt(reason))
        , status(status)
        , reason(reason)
    {
    }
};

struct HttpResponse
{
    unsigned int status = 0;
    std::string reason;
    Headers headers;

    /**
     * The value of the first header called `name`, compared without
     * regard to case.
     */
    std::optional<std::string> header(std::string_view name) const;

    bool success() const
    {
        return status >= 200 && status < 300;
    }
};

/**
 * The `PUT` request that opens an upload to `url`. Credentials in the
 * URL become a Basic `Authorization` header.
 */
std::string makePutRequest(const ParsedURL & url, const std::string & userAgent);

/**
 * Read a response status line and header block, up to and including
 * the empty line. The body, if any, is left in `source`.
 */
HttpResponse readResponse(Source & source);

/**
 * The protocols a successful response allows: the block protocol if
 * the server asks for `transfer-encoding: nbd`, chunked otherwise.
 * Unsuccessful responses throw `RemoteRejection`.
 */
std::vector<Protocol> protocolsForResponse(const HttpResponse & response);

/**
 * Send the upload request over `channel` and work out which protocols
 * the server accepts.
 */
std::vector<Protocol>
negotiateUpload(Channel & channel, const ParsedURL & url, const std::string & userAgent);

} // namespace diskxfer
