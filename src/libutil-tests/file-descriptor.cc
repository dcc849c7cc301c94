#include <gtest/gtest.h>

#include "diskxfer/util/file-descriptor.hh"
#include "diskxfer/util/serialise.hh"

#include <cstdlib>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace diskxfer {

class FileDescriptorTest : public ::testing::Test
{
protected:
    std::string path;
    AutoCloseFD fd;

    void SetUp() override
    {
        char tmpl[] = "/tmp/diskxfer-fd-XXXXXX";
        fd = mkstemp(tmpl);
        ASSERT_TRUE(fd);
        path = tmpl;
    }

    void TearDown() override
    {
        unlink(path.c_str());
    }
};

TEST_F(FileDescriptorTest, writeFullThenReadFile)
{
    writeFull(fd.get(), "hello, disk");
    ASSERT_EQ(readFile(path), "hello, disk");
}

TEST_F(FileDescriptorTest, pwriteFullLeavesAHole)
{
    pwriteFull(fd.get(), "tail", 4096);
    auto contents = readFile(path);
    ASSERT_EQ(contents.size(), 4100u);
    ASSERT_EQ(contents.substr(0, 4096), std::string(4096, 0));
    ASSERT_EQ(contents.substr(4096), "tail");
}

TEST_F(FileDescriptorTest, pwriteFullDoesNotMoveTheFileOffset)
{
    pwriteFull(fd.get(), "abc", 100);
    ASSERT_EQ(lseek(fd.get(), 0, SEEK_CUR), 0);
}

TEST_F(FileDescriptorTest, preadFullReadsAtOffset)
{
    writeFull(fd.get(), "0123456789");
    char buf[4];
    preadFull(fd.get(), buf, sizeof(buf), 3);
    ASSERT_EQ(std::string_view(buf, sizeof(buf)), "3456");
}

TEST_F(FileDescriptorTest, preadFullPastTheEndIsEndOfFile)
{
    writeFull(fd.get(), "short");
    char buf[10];
    ASSERT_THROW(preadFull(fd.get(), buf, sizeof(buf), 0), EndOfFile);
}

TEST_F(FileDescriptorTest, fsyncSucceedsOnAFile)
{
    writeFull(fd.get(), "data");
    ASSERT_NO_THROW(fd.fsync());
}

TEST(AutoCloseFD, releaseKeepsTheDescriptorOpen)
{
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    Descriptor raw;
    {
        AutoCloseFD readSide(fds[0]);
        raw = readSide.release();
        ASSERT_FALSE(readSide);
    }
    ASSERT_NE(fcntl(raw, F_GETFD), -1);
    close(raw);
    close(fds[1]);
}

TEST(AutoCloseFD, destructorCloses)
{
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    {
        AutoCloseFD readSide(fds[0]);
    }
    ASSERT_EQ(fcntl(fds[0], F_GETFD), -1);
    close(fds[1]);
}

TEST(readFull, shortReadIsEndOfFile)
{
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
    AutoCloseFD a(fds[0]), b(fds[1]);

    writeFull(b.get(), "abc");
    b.close();

    char buf[8];
    ASSERT_THROW(readFull(a.get(), buf, sizeof(buf)), EndOfFile);
}

TEST(drainFD, readsEverything)
{
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    AutoCloseFD readSide(fds[0]), writeSide(fds[1]);
    writeFull(writeSide.get(), "all of it");
    writeSide.close();
    ASSERT_EQ(drainFD(readSide.get()), "all of it");
}

} // namespace diskxfer
