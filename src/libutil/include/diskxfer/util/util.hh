#pragma once
///@file

#include "diskxfer/util/types.hh"
#include "diskxfer/util/error.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/strings.hh"

#include <cctype>
#include <limits>
#include <optional>

#include <boost/lexical_cast.hpp>

namespace diskxfer {

MakeError(FormatError, Error);

/**
 * Remove trailing whitespace from a string.
 */
std::string chomp(std::string_view s);

/**
 * Remove whitespace from the start and end of a string.
 */
std::string trim(std::string_view s, std::string_view whitespace = " \n\r\t");

/**
 * Parse a string into an integer.
 */
template<class N>
std::optional<N> string2Int(const std::string_view s)
{
    if (s.substr(0, 1) == "-" && !std::numeric_limits<N>::is_signed)
        return std::nullopt;
    try {
        return boost::lexical_cast<N>(s.data(), s.size());
    } catch (const boost::bad_lexical_cast &) {
        return std::nullopt;
    }
}

/**
 * Like string2Int(), but support an optional suffix 'K', 'M', 'G' or
 * 'T' denoting a binary unit prefix.
 */
template<class N>
N string2IntWithUnitPrefix(std::string_view s)
{
    uint64_t multiplier = 1;
    if (!s.empty()) {
        char u = std::toupper(*s.rbegin());
        if (std::isalpha(u)) {
            if (u == 'K')
                multiplier = 1ULL << 10;
            else if (u == 'M')
                multiplier = 1ULL << 20;
            else if (u == 'G')
                multiplier = 1ULL << 30;
            else if (u == 'T')
                multiplier = 1ULL << 40;
            else
                throw UsageError("invalid unit specifier '%1%'", u);
            s.remove_suffix(1);
        }
    }
    if (auto n = string2Int<N>(s))
        return *n * multiplier;
    throw UsageError("'%s' is not an integer", s);
}

/**
 * Pretty-print a byte value, e.g. 12433615056 is rendered as `11.6
 * GiB`. If `align` is set, the number will be right-justified by
 * padding with spaces on the left.
 */
std::string renderSize(uint64_t value, bool align = false);

/**
 * Render a number of seconds as `h:mm:ss`.
 */
std::string renderDuration(uint64_t seconds);

/**
 * Convert a little-endian integer to host order.
 */
template<typename T>
T readLittleEndian(const unsigned char * p)
{
    T x = 0;
    for (size_t i = 0; i < sizeof(x); ++i, ++p) {
        x |= ((T) *p) << (i * 8);
    }
    return x;
}

/**
 * Convert a big-endian (network order) integer to host order.
 */
template<typename T>
T readBigEndian(const unsigned char * p)
{
    T x = 0;
    for (size_t i = 0; i < sizeof(x); ++i, ++p) {
        x = (x << 8) | (T) *p;
    }
    return x;
}

/**
 * Store an integer in little-endian order.
 */
template<typename T>
void writeLittleEndian(unsigned char * p, T x)
{
    for (size_t i = 0; i < sizeof(x); ++i, ++p)
        *p = (unsigned char) (x >> (i * 8));
}

/**
 * Store an integer in big-endian (network) order.
 */
template<typename T>
void writeBigEndian(unsigned char * p, T x)
{
    for (size_t i = 0; i < sizeof(x); ++i, ++p)
        *p = (unsigned char) (x >> ((sizeof(x) - 1 - i) * 8));
}

/**
 * For `std::visit`.
 */
template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/**
 * @return true iff `s` starts with `prefix`.
 */
bool hasPrefix(std::string_view s, std::string_view prefix);

/**
 * @return true iff `s` ends in `suffix`.
 */
bool hasSuffix(std::string_view s, std::string_view suffix);

/**
 * Convert a string to lower case.
 */
std::string toLower(std::string s);

/**
 * Exception handling in destructors: print an error message, then
 * ignore the exception.
 */
void ignoreExceptionInDestructor(Verbosity lvl = lvlError);

/**
 * Remove common leading whitespace from the lines in the string
 * 's'. For example, if every line is indented by at least 3 spaces,
 * then we remove 3 spaces from the start of every line.
 */
std::string stripIndentation(std::string_view s);

} // namespace diskxfer
