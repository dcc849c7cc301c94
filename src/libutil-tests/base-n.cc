#include <gtest/gtest.h>

#include "diskxfer/util/base-n.hh"
#include "diskxfer/util/error.hh"

namespace diskxfer {

static const std::span<const std::byte> stringToByteSpan(const std::string_view s)
{
    return {(const std::byte *) s.data(), s.size()};
}

/* ----------------------------------------------------------------------------
 * base64::encode
 * --------------------------------------------------------------------------*/

TEST(base64Encode, emptyString)
{
    ASSERT_EQ(base64::encode(stringToByteSpan("")), "");
}

TEST(base64Encode, encodesAString)
{
    ASSERT_EQ(base64::encode(stringToByteSpan("quod erat demonstrandum")), "cXVvZCBlcmF0IGRlbW9uc3RyYW5kdW0=");
}

TEST(base64Encode, encodesBasicAuthCredentials)
{
    ASSERT_EQ(base64::encode(stringToByteSpan("Aladdin:open sesame")), "QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
}

TEST(base64Encode, padsShortFinalGroups)
{
    ASSERT_EQ(base64::encode(stringToByteSpan("a")), "YQ==");
    ASSERT_EQ(base64::encode(stringToByteSpan("ab")), "YWI=");
    ASSERT_EQ(base64::encode(stringToByteSpan("abc")), "YWJj");
}

TEST(base64Encode, highBytes)
{
    ASSERT_EQ(base64::encode(stringToByteSpan("\xff\xfe\xfd")), "//79");
}

/* ----------------------------------------------------------------------------
 * base16
 * --------------------------------------------------------------------------*/

TEST(base16Encode, encodesLowercase)
{
    ASSERT_EQ(base16::encode(stringToByteSpan("\x01\xab\xff")), "01abff");
}

TEST(base16Decode, decodesEitherCase)
{
    ASSERT_EQ(base16::decode("01ABff"), "\x01\xab\xff");
}

TEST(base16Decode, rejectsOddLength)
{
    ASSERT_THROW(base16::decode("abc"), Error);
}

TEST(base16Decode, rejectsNonHexDigits)
{
    ASSERT_THROW(base16::decode("zz"), Error);
}

} // namespace diskxfer
