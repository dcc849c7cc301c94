#include <gtest/gtest.h>

#include "diskxfer/stream/nbd.hh"
#include "diskxfer/util/util.hh"

#include "test-util.hh"

#include <array>
#include <thread>

namespace diskxfer {

/**
 * The server end of an NBD session, backed by a string.
 */
struct FakeNbdServer
{
    AutoCloseFD fd;
    bool oldstyle = false;
    bool offerNoZeroes = true;
    uint16_t transmissionFlags = nbd::flagHasFlags | nbd::flagSendFlush;
    uint32_t failWith = 0;

    std::string disk;
    std::vector<nbd::Command> commands;
    std::exception_ptr error;

    FakeNbdServer(AutoCloseFD && fd, uint64_t size)
        : fd(std::move(fd))
        , disk(size, 0)
    {
    }

    template<typename T>
    T get()
    {
        std::array<unsigned char, sizeof(T)> buf;
        readFull(fd.get(), (char *) buf.data(), buf.size());
        return readBigEndian<T>(buf.data());
    }

    template<typename T>
    void put(T x)
    {
        std::array<unsigned char, sizeof(T)> buf;
        writeBigEndian<T>(buf.data(), x);
        writeFull(fd.get(), {(const char *) buf.data(), buf.size()});
    }

    void handshake()
    {
        put<uint64_t>(nbd::initMagic);

        if (oldstyle) {
            put<uint64_t>(nbd::oldstyleMagic);
            put<uint64_t>(disk.size());
            put<uint32_t>(transmissionFlags);
            writeFull(fd.get(), std::string(124, 0));
            return;
        }

        put<uint64_t>(nbd::optMagic);
        put<uint16_t>(nbd::flagFixedNewstyle | (offerNoZeroes ? nbd::flagNoZeroes : 0));

        auto clientFlags = get<uint32_t>();
        if (get<uint64_t>() != nbd::optMagic)
            throw Error("bad option magic");
        if (get<uint32_t>() != nbd::optExportName)
            throw Error("expected NBD_OPT_EXPORT_NAME");
        std::string name(get<uint32_t>(), 0);
        readFull(fd.get(), name.data(), name.size());

        put<uint64_t>(disk.size());
        put<uint16_t>(transmissionFlags);
        if (!(clientFlags & nbd::flagNoZeroes))
            writeFull(fd.get(), std::string(124, 0));
    }

    void serve()
    {
        handshake();

        while (true) {
            if (get<uint32_t>() != nbd::requestMagic)
                throw Error("bad request magic");
            get<uint16_t>();
            auto command = (nbd::Command) get<uint16_t>();
            auto handle = get<uint64_t>();
            auto offset = get<uint64_t>();
            auto length = get<uint32_t>();

            commands.push_back(command);

            if (command == nbd::Command::Disconnect)
                return;

            if (command == nbd::Command::Write) {
                std::string data(length, 0);
                readFull(fd.get(), data.data(), data.size());
                disk.replace(offset, length, data);
            }

            put<uint32_t>(nbd::simpleReplyMagic);
            put<uint32_t>(failWith);
            put<uint64_t>(handle);
        }
    }

    void run()
    {
        try {
            serve();
        } catch (Error &) {
            error = std::current_exception();
        }
    }
};

class NbdTest : public ::testing::Test
{
protected:
    std::optional<FakeNbdServer> server;
    std::unique_ptr<FdChannel> channel;
    std::thread thread;

    void start(uint64_t size, std::function<void(FakeNbdServer &)> configure = {})
    {
        auto [client, remote] = socketPair();
        server.emplace(std::move(remote), size);
        if (configure)
            configure(*server);
        channel = std::make_unique<FdChannel>(std::move(client), ChannelOptions{});
        thread = std::thread([this]() { server->run(); });
    }

    /**
     * Hang up and wait for the server to notice.
     */
    void stop()
    {
        channel.reset();
        if (thread.joinable())
            thread.join();
    }

    void TearDown() override
    {
        stop();
    }

    void assertServerSucceeded()
    {
        stop();
        if (server->error)
            std::rethrow_exception(server->error);
    }
};

static Stream smallStream()
{
    return Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(2), dataRun(filled(1, 'b'))});
}

TEST_F(NbdTest, writesEveryRunOfData)
{
    start(4096);
    ProgressRecorder progress;

    auto work = serialiseNbd(*channel, smallStream(), {.preZeroed = false}, progress.make());
    assertServerSucceeded();

    ASSERT_EQ(work, 2048u);
    ASSERT_EQ(server->disk, filled(1, 'a') + filled(2, 0) + filled(1, 'b') + filled(4, 0));
    ASSERT_EQ(
        server->commands,
        (std::vector<nbd::Command>{
            nbd::Command::Write,
            nbd::Command::Write,
            nbd::Command::Write,
            nbd::Command::Flush,
            nbd::Command::Disconnect}));
    ASSERT_EQ(progress.calls.back(), 2048u);
    ASSERT_TRUE(progress.nonDecreasing());
}

TEST_F(NbdTest, skipsEmptyRunsOnPreZeroedDestinations)
{
    start(2048, [](FakeNbdServer & s) { s.disk = std::string(2048, 'z'); });

    auto work = serialiseNbd(*channel, smallStream(), {.preZeroed = true}, {});
    assertServerSucceeded();

    ASSERT_EQ(work, 1024u);
    /* What was already there between the two runs is left alone. */
    ASSERT_EQ(server->disk, filled(1, 'a') + filled(2, 'z') + filled(1, 'b'));
}

TEST_F(NbdTest, largeRunsAreSplit)
{
    uint64_t size = nbd::maxWriteSize * 2 + 1024;
    start(size);

    auto work = serialiseNbd(*channel, Stream::fromElements({dataRun(filled(size / sectorSize, 'q'))}), {}, {});
    assertServerSucceeded();

    ASSERT_EQ(work, size);
    ASSERT_EQ(server->disk, std::string(size, 'q'));
    ASSERT_EQ(std::count(server->commands.begin(), server->commands.end(), nbd::Command::Write), 3);
}

TEST_F(NbdTest, oldstyleHandshake)
{
    start(1024, [](FakeNbdServer & s) { s.oldstyle = true; });

    NbdClient client(*channel);
    ASSERT_EQ(client.exportInfo().size, 1024u);

    client.write(512, filled(1, 'o'));
    client.flush();
    client.disconnect();
    assertServerSucceeded();

    ASSERT_EQ(server->disk, filled(1, 0) + filled(1, 'o'));
}

TEST_F(NbdTest, zeroPaddedHandshake)
{
    start(1024, [](FakeNbdServer & s) { s.offerNoZeroes = false; });

    NbdClient client(*channel);
    ASSERT_EQ(client.exportInfo().size, 1024u);
    client.write(0, filled(2, 'p'));
    client.disconnect();
    assertServerSucceeded();

    ASSERT_EQ(server->disk, filled(2, 'p'));
}

TEST_F(NbdTest, noFlushUnlessTheServerAsks)
{
    start(1024, [](FakeNbdServer & s) { s.transmissionFlags = nbd::flagHasFlags; });

    serialiseNbd(*channel, Stream::fromElements({dataRun(filled(2, 'n'))}), {}, {});
    assertServerSucceeded();

    ASSERT_EQ(server->commands, (std::vector<nbd::Command>{nbd::Command::Write, nbd::Command::Disconnect}));
}

TEST_F(NbdTest, exportTooSmall)
{
    start(512);
    ASSERT_THROW(serialiseNbd(*channel, smallStream(), {}, {}), FramingError);
}

TEST_F(NbdTest, writeBeyondTheExport)
{
    start(1024);
    NbdClient client(*channel);
    ASSERT_THROW(client.write(1024, filled(1, 'x')), FramingError);
}

TEST_F(NbdTest, readOnlyExport)
{
    start(1024, [](FakeNbdServer & s) { s.transmissionFlags = nbd::flagHasFlags | nbd::flagReadOnly; });
    ASSERT_THROW(NbdClient{*channel}, TransportError);
}

TEST_F(NbdTest, serverError)
{
    start(1024, [](FakeNbdServer & s) { s.failWith = 5; });
    NbdClient client(*channel);
    ASSERT_THROW(client.write(0, filled(1, 'x')), TransportError);
}

TEST(NbdClient, notAnNbdServer)
{
    MemoryChannel channel("HTTP/1.1 400 Bad Request\r\n\r\n");
    ASSERT_THROW(NbdClient{channel}, FramingError);
}

TEST(NbdClient, hangupDuringHandshake)
{
    std::string greeting(8, 0);
    writeBigEndian<uint64_t>((unsigned char *) greeting.data(), nbd::initMagic);
    MemoryChannel channel(greeting);
    ASSERT_THROW(NbdClient{channel}, FramingError);
}

} // namespace diskxfer
