#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "diskxfer/util/strings.hh"

namespace diskxfer {

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, empty)
{
    Strings strings;

    ASSERT_EQ(concatStringsSep(",", strings), "");
}

TEST(concatStringsSep, justOne)
{
    Strings strings;
    strings.push_back("this");

    ASSERT_EQ(concatStringsSep(",", strings), "this");
}

TEST(concatStringsSep, protocolList)
{
    Strings strings{"nbd", "raw", "chunked"};

    ASSERT_EQ(concatStringsSep("; ", strings), "nbd; raw; chunked");
}

TEST(concatStringsSep, set)
{
    StringSet strings{"tar", "human", "chunked"};

    ASSERT_EQ(concatStringsSep(", ", strings), "chunked, human, tar");
}

/* ----------------------------------------------------------------------------
 * tokenizeString
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, empty)
{
    ASSERT_EQ(tokenizeString<Strings>(""), Strings{});
}

TEST(tokenizeString, oneSep)
{
    ASSERT_EQ(tokenizeString<Strings>(" "), Strings{});
}

TEST(tokenizeString, configLine)
{
    ASSERT_EQ(
        tokenizeString<Strings>("buffer-size =\t 4M\n"), (Strings{"buffer-size", "=", "4M"}));
}

TEST(tokenizeString, customSeparators)
{
    ASSERT_EQ(tokenizeString<Strings>("a::b:c", ":"), (Strings{"a", "b", "c"}));
}

} // namespace diskxfer
