#include "diskxfer/util/base-n.hh"
#include "diskxfer/util/util.hh"

#include <algorithm>
#include <cstddef>

namespace diskxfer {

static std::optional<uint8_t> hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    c = std::tolower(c);
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return std::nullopt;
}

std::string base16::encode(std::span<const std::byte> b)
{
    static constexpr std::string_view digits = "0123456789abcdef";
    std::string res(encodedLength(b.size()), '0');
    auto out = res.begin();
    for (auto byte : b) {
        *out++ = digits[std::to_integer<uint8_t>(byte) >> 4];
        *out++ = digits[std::to_integer<uint8_t>(byte) & 0xf];
    }
    return res;
}

std::string base16::decode(std::string_view s)
{
    if (s.size() % 2)
        throw FormatError("hexadecimal string '%s' has an odd number of digits", s);

    std::string res;
    res.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        auto hi = hexValue(s[i]), lo = hexValue(s[i + 1]);
        if (!hi || !lo)
            throw FormatError("'%s' is not a hexadecimal string", s);
        res.push_back((char) (*hi << 4 | *lo));
    }
    return res;
}

std::string base64::encode(std::span<const std::byte> b)
{
    static constexpr std::string_view alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string res;
    res.reserve((b.size() + 2) / 3 * 4);

    /* Each group of three bytes becomes four digits; a short final
       group is padded with '='. */
    for (size_t i = 0; i < b.size(); i += 3) {
        auto n = std::min<size_t>(3, b.size() - i);
        uint32_t group = 0;
        for (size_t j = 0; j < 3; j++)
            group = group << 8 | (j < n ? std::to_integer<uint8_t>(b[i + j]) : 0);
        for (size_t j = 0; j < 4; j++)
            res.push_back(j <= n ? alphabet[group >> (18 - 6 * j) & 0x3f] : '=');
    }

    return res;
}

} // namespace diskxfer
