#include <gtest/gtest.h>

#include "diskxfer/util/serialise.hh"
#include "diskxfer/util/unix-domain-socket.hh"

#include <cstdlib>
#include <sys/socket.h>
#include <unistd.h>

namespace diskxfer {

class UnixDomainSocketTest : public ::testing::Test
{
protected:
    std::string dir;
    std::string path;

    void SetUp() override
    {
        char tmpl[] = "/tmp/diskxfer-uds-XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir = tmpl;
        path = dir + "/socket";
    }

    void TearDown() override
    {
        unlink(path.c_str());
        rmdir(dir.c_str());
    }
};

TEST_F(UnixDomainSocketTest, connectToListeningSocket)
{
    auto listener = createUnixDomainSocket(path, 0600, 1);

    auto client = createUnixDomainSocket();
    connect(client.get(), path);

    AutoCloseFD server = accept(listener.get(), nullptr, nullptr);
    ASSERT_TRUE(server);

    writeFull(client.get(), "ping");
    char buf[4];
    readFull(server.get(), buf, sizeof(buf));
    ASSERT_EQ(std::string_view(buf, sizeof(buf)), "ping");
}

TEST_F(UnixDomainSocketTest, bindReplacesStaleSocketFile)
{
    {
        auto first = createUnixDomainSocket(path, 0600, 1);
    }
    ASSERT_NO_THROW(createUnixDomainSocket(path, 0600, 1));
}

TEST_F(UnixDomainSocketTest, connectWithoutListenerFails)
{
    auto client = createUnixDomainSocket();
    ASSERT_THROW(connect(client.get(), path), SysError);
}

TEST(UnixDomainSocket, pathTooLong)
{
    auto fd = createUnixDomainSocket();
    ASSERT_THROW(bind(fd.get(), "/tmp/" + std::string(200, 'x')), Error);
}

} // namespace diskxfer
