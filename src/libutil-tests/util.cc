#include "diskxfer/util/util.hh"
#include "diskxfer/util/types.hh"

#include <limits.h>
#include <gtest/gtest.h>

#include <numeric>

namespace diskxfer {

/* ----------------------------------------------------------------------------
 * hasPrefix / hasSuffix
 * --------------------------------------------------------------------------*/

TEST(hasPrefix, emptyStringHasNoPrefix)
{
    ASSERT_FALSE(hasPrefix("", "foo"));
}

TEST(hasPrefix, emptyStringIsAlwaysPrefix)
{
    ASSERT_TRUE(hasPrefix("foo", ""));
    ASSERT_TRUE(hasPrefix("jshjkfhsadf", ""));
}

TEST(hasPrefix, trivialCase)
{
    ASSERT_TRUE(hasPrefix("disk00000001", "disk"));
}

TEST(hasSuffix, emptyStringHasNoSuffix)
{
    ASSERT_FALSE(hasSuffix("", "foo"));
}

TEST(hasSuffix, trivialCase)
{
    ASSERT_TRUE(hasSuffix("disk00000001.checksum", ".checksum"));
    ASSERT_FALSE(hasSuffix("disk00000001", ".checksum"));
}

/* ----------------------------------------------------------------------------
 * toLower / trim / chomp
 * --------------------------------------------------------------------------*/

TEST(toLower, emptyString)
{
    ASSERT_EQ(toLower(""), "");
}

TEST(toLower, headerName)
{
    ASSERT_EQ(toLower("Transfer-Encoding"), "transfer-encoding");
}

TEST(trim, bothEnds)
{
    ASSERT_EQ(trim("  \tnbd\r\n"), "nbd");
    ASSERT_EQ(trim("   "), "");
    ASSERT_EQ(trim("x"), "x");
}

TEST(chomp, trailingWhitespaceOnly)
{
    ASSERT_EQ(chomp("  value \n"), "  value");
}

/* ----------------------------------------------------------------------------
 * string2Int
 * --------------------------------------------------------------------------*/

TEST(string2Int, parsesNumbers)
{
    ASSERT_EQ(string2Int<int>("42"), 42);
    ASSERT_EQ(string2Int<uint64_t>("00000017"), 17u);
    ASSERT_EQ(string2Int<int>("-3"), -3);
}

TEST(string2Int, rejectsGarbage)
{
    ASSERT_EQ(string2Int<int>(""), std::nullopt);
    ASSERT_EQ(string2Int<int>("12a"), std::nullopt);
    ASSERT_EQ(string2Int<unsigned int>("-1"), std::nullopt);
    ASSERT_EQ(string2Int<uint16_t>("70000"), std::nullopt);
}

TEST(string2IntWithUnitPrefix, units)
{
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("2K"), 2048u);
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("1m"), 1024u * 1024);
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("1G"), 1ULL << 30);
    ASSERT_THROW(string2IntWithUnitPrefix<uint64_t>("1Q"), UsageError);
}

/* ----------------------------------------------------------------------------
 * renderSize / renderDuration
 * --------------------------------------------------------------------------*/

TEST(renderSize, misc)
{
    ASSERT_EQ(renderSize(0, true), "   0.0 KiB");
    ASSERT_EQ(renderSize(100, true), "   0.1 KiB");
    ASSERT_EQ(renderSize(100), "0.1 KiB");
    ASSERT_EQ(renderSize(972, true), "   0.9 KiB");
    ASSERT_EQ(renderSize(973, true), "   1.0 KiB");
    ASSERT_EQ(renderSize(1024, true), "   1.0 KiB");
    ASSERT_EQ(renderSize(1024 * 1024, true), "1024.0 KiB");
    ASSERT_EQ(renderSize(1100 * 1024, true), "   1.1 MiB");
    ASSERT_EQ(renderSize(2ULL * 1024 * 1024 * 1024, true), "   2.0 GiB");
}

TEST(renderDuration, hoursMinutesSeconds)
{
    ASSERT_EQ(renderDuration(0), "0:00:00");
    ASSERT_EQ(renderDuration(59), "0:00:59");
    ASSERT_EQ(renderDuration(3723), "1:02:03");
    ASSERT_EQ(renderDuration(100 * 3600), "100:00:00");
}

/* ----------------------------------------------------------------------------
 * endianness helpers
 * --------------------------------------------------------------------------*/

TEST(readLittleEndian, roundTripsWithWrite)
{
    unsigned char buf[8];
    writeLittleEndian<uint64_t>(buf, 0x0102030405060708ULL);
    ASSERT_EQ(buf[0], 0x08);
    ASSERT_EQ(buf[7], 0x01);
    ASSERT_EQ(readLittleEndian<uint64_t>(buf), 0x0102030405060708ULL);
}

TEST(readBigEndian, networkOrder)
{
    unsigned char buf[4];
    writeBigEndian<uint32_t>(buf, 0x25609513);
    ASSERT_EQ(buf[0], 0x25);
    ASSERT_EQ(buf[3], 0x13);
    ASSERT_EQ(readBigEndian<uint32_t>(buf), 0x25609513u);
}

/* ----------------------------------------------------------------------------
 * stripIndentation
 * --------------------------------------------------------------------------*/

TEST(stripIndentation, removesCommonIndent)
{
    ASSERT_EQ(stripIndentation("\n      first\n        second\n    "), "\nfirst\n  second\n\n");
}

} // namespace diskxfer
