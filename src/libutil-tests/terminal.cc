#include <gtest/gtest.h>

#include "diskxfer/util/ansicolor.hh"
#include "diskxfer/util/terminal.hh"

namespace diskxfer {

TEST(filterANSIEscapes, keepsColoursByDefault)
{
    auto s = ANSI_RED "error:" ANSI_NORMAL " disk full";
    ASSERT_EQ(filterANSIEscapes(s), s);
}

TEST(filterANSIEscapes, stripsColoursWhenAsked)
{
    ASSERT_EQ(filterANSIEscapes(ANSI_MAGENTA "disk.img" ANSI_NORMAL " is 2 MiB", true), "disk.img is 2 MiB");
}

TEST(filterANSIEscapes, dropsCursorMovementAlways)
{
    ASSERT_EQ(filterANSIEscapes("\e[2K\rcopied 50%\e[1A"), "copied 50%");
}

TEST(filterANSIEscapes, dropsBells)
{
    ASSERT_EQ(filterANSIEscapes("done\a"), "done");
}

TEST(filterANSIEscapes, truncatedEscapeAtTheEnd)
{
    ASSERT_EQ(filterANSIEscapes("text\e[3", true), "text");
}

} // namespace diskxfer
