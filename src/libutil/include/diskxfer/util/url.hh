#pragma once
///@file

#include "diskxfer/util/error.hh"
#include "diskxfer/util/types.hh"

#include <optional>

namespace diskxfer {

/**
 * Represents a parsed RFC3986 URL.
 *
 * @note The host, user, password and path are percent decoded; the
 * query is kept encoded.
 */
struct ParsedURL
{
    /**
     * User information, hostname and an optional port number.
     */
    struct Authority
    {
        /**
         * IPv6 enclosing brackets are already stripped.
         */
        std::string host;

        std::optional<std::string> user;

        std::optional<std::string> password;

        /** Port subcomponent (if specified). Default value is determined by the scheme. */
        std::optional<uint16_t> port;

        bool operator==(const Authority &) const = default;

        std::string to_string() const;
    };

    std::string scheme;

    /**
     * Present iff the URL has `//` after the scheme. An empty host
     * (as in `file:///x`) is not the same as no authority.
     */
    std::optional<Authority> authority;

    std::string path;

    std::optional<std::string> query;

    bool operator==(const ParsedURL &) const = default;

    /**
     * The request target for an HTTP request line: the re-encoded
     * path (or `/`) followed by the query, if any.
     */
    std::string requestTarget() const;

    std::string to_string() const;
};

MakeError(BadURL, UsageError);

/**
 * Parse a URL. Schemes are lower-cased.
 */
ParsedURL parseURL(std::string_view url);

/**
 * Percent-encode everything except unreserved characters and those
 * in `keep`.
 */
std::string percentEncode(std::string_view s, std::string_view keep = "");

std::ostream & operator<<(std::ostream & os, const ParsedURL & url);

} // namespace diskxfer
