#include <gtest/gtest.h>

#include "diskxfer/util/hash.hh"

namespace diskxfer {

/* ----------------------------------------------------------------------------
 * hashString
 * --------------------------------------------------------------------------*/

TEST(hashString, testKnownSHA1Hashes1)
{
    // values taken from: https://tools.ietf.org/html/rfc3174
    auto s = "abc";
    auto hash = hashString(HashAlgorithm::SHA1, s);
    ASSERT_EQ(hash.to_string(Base::Base16), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(hashString, testKnownSHA1Hashes2)
{
    // values taken from: https://tools.ietf.org/html/rfc3174
    auto s = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    auto hash = hashString(HashAlgorithm::SHA1, s);
    ASSERT_EQ(hash.to_string(Base::Base16), "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

TEST(hashString, sha1OfAZeroMebibyte)
{
    std::string zeros(1024 * 1024, 0);
    ASSERT_EQ(
        hashString(HashAlgorithm::SHA1, zeros).to_string(Base::Base16), "3b71f43ff30f4b15b5cd85dd9e95ebc7e84eb5a3");
}

TEST(hashString, base64Rendering)
{
    auto hash = hashString(HashAlgorithm::SHA1, "abc");
    ASSERT_EQ(hash.to_string(Base::Base64), "qZk+NkcGgWq6PiVxeFDCbJzQ2J0=");
}

/* ----------------------------------------------------------------------------
 * HashSink
 * --------------------------------------------------------------------------*/

TEST(HashSink, matchesHashStringAcrossWrites)
{
    HashSink sink(HashAlgorithm::SHA1);
    sink("abcdbcdecdefdefgefghfghighijhijk");
    sink("ijkljklmklmnlmnomnopnopq");
    auto [hash, size] = sink.finish();
    ASSERT_EQ(size, 56u);
    ASSERT_EQ(hash, hashString(HashAlgorithm::SHA1, "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"));
}

TEST(HashSink, resetStartsAFreshDigest)
{
    HashSink sink(HashAlgorithm::SHA1);
    sink("something else");
    sink.reset();
    sink("abc");
    auto [hash, size] = sink.finish();
    ASSERT_EQ(size, 3u);
    ASSERT_EQ(hash.to_string(Base::Base16), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

/* ----------------------------------------------------------------------------
 * parsing
 * --------------------------------------------------------------------------*/

TEST(Hash, parseBase16RoundTrips)
{
    auto hash = Hash::parseBase16("a9993e364706816aba3e25717850c26c9cd0d89d", HashAlgorithm::SHA1);
    ASSERT_EQ(hash, hashString(HashAlgorithm::SHA1, "abc"));
}

TEST(Hash, parseBase16AcceptsUppercase)
{
    auto hash = Hash::parseBase16("A9993E364706816ABA3E25717850C26C9CD0D89D", HashAlgorithm::SHA1);
    ASSERT_EQ(hash.to_string(Base::Base16), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(Hash, parseBase16RejectsWrongLength)
{
    ASSERT_THROW(Hash::parseBase16("a9993e36", HashAlgorithm::SHA1), BadHash);
}

} // namespace diskxfer
