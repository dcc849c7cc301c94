#include "diskxfer/util/url.hh"
#include "diskxfer/util/util.hh"

#include <cstring>
#include <sstream>

#include <boost/url.hpp>

namespace diskxfer {

std::string percentEncode(std::string_view s, std::string_view keep)
{
    std::string res;
    for (auto & c : s)
        // unreserved + keep
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || strchr("-._~", c)
            || keep.find(c) != std::string::npos)
            res += c;
        else
            res += fmt("%%%02X", c & 0xFF);
    return res;
}

ParsedURL parseURL(std::string_view url)
{
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed)
        throw BadURL("'%s' is not a valid URL: %s", url, parsed.error().message());

    std::optional<ParsedURL::Authority> authority;
    if (parsed->has_authority()) {
        std::optional<uint16_t> port;
        if (parsed->has_port() && parsed->port() != "") {
            auto n = string2Int<uint16_t>(parsed->port());
            if (!n || *n == 0)
                throw BadURL("port '%s' in URL '%s' is invalid", parsed->port(), url);
            port = *n;
        }
        authority = ParsedURL::Authority{
            .host = parsed->host_address(),
            .user = parsed->has_userinfo() ? parsed->user() : std::optional<std::string>{},
            .password = parsed->has_password() ? parsed->password() : std::optional<std::string>{},
            .port = port,
        };
    }

    return ParsedURL{
        .scheme = toLower(std::string(parsed->scheme())),
        .authority = std::move(authority),
        .path = parsed->path(),
        .query = parsed->has_query() ? std::string(parsed->encoded_query()) : std::optional<std::string>{},
    };
}

std::string ParsedURL::Authority::to_string() const
{
    std::ostringstream os;
    if (user) {
        os << percentEncode(*user);
        if (password)
            os << ":" << percentEncode(*password);
        os << "@";
    }
    if (host.find(':') != host.npos)
        os << "[" << host << "]";
    else
        os << percentEncode(host);
    if (port)
        os << ":" << *port;
    return os.str();
}

std::string ParsedURL::requestTarget() const
{
    auto res = path.empty() ? "/" : percentEncode(path, "/:@!$&'()*+,;=");
    if (query)
        res += "?" + *query;
    return res;
}

std::string ParsedURL::to_string() const
{
    return scheme + ":" + (authority ? "//" + authority->to_string() : "") + percentEncode(path, "/:@!$&'()*+,;=")
           + (query ? "?" + *query : "");
}

std::ostream & operator<<(std::ostream & os, const ParsedURL & url)
{
    os << url.to_string();
    return os;
}

} // namespace diskxfer
