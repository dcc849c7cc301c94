#pragma once
///@file

#include <span>
#include <string>
#include <string_view>

namespace diskxfer {

/**
 * Text renderings of binary data: digests in `.checksum` members and
 * HTTP credentials.
 */
enum struct Base : int {
    /// RFC 4648 base-64 with `=` padding.
    Base64,
    /// Lowercase hexadecimal.
    Base16,
};

namespace base16 {

[[nodiscard]] constexpr inline size_t encodedLength(size_t origSize)
{
    return origSize * 2;
}

std::string encode(std::span<const std::byte> b);

/**
 * Decode hexadecimal of either case. Throws `FormatError` on odd
 * lengths and non-hex digits.
 */
std::string decode(std::string_view s);

} // namespace base16

namespace base64 {

std::string encode(std::span<const std::byte> b);

} // namespace base64

} // namespace diskxfer
