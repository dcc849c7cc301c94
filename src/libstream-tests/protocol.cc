#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "diskxfer/stream/endpoint.hh"
#include "diskxfer/stream/protocol.hh"
#include "diskxfer/util/terminal.hh"
#include "diskxfer/util/tests/capturing-logger.hh"

#include "test-util.hh"

#include <sstream>

namespace diskxfer {

using ::testing::Contains;

TEST(parseProtocol, names)
{
    ASSERT_EQ(parseProtocol("raw"), Protocol::Raw);
    ASSERT_EQ(parseProtocol("none"), Protocol::Raw);
    ASSERT_EQ(parseProtocol("chunked"), Protocol::Chunked);
    ASSERT_EQ(parseProtocol("nbd"), Protocol::Nbd);
    ASSERT_EQ(parseProtocol("tar"), Protocol::Tar);
    ASSERT_EQ(parseProtocol("human"), Protocol::Human);
    ASSERT_THROW(parseProtocol("gzip"), UsageError);
    ASSERT_THROW(parseProtocol("Raw"), UsageError);
}

TEST(showProtocol, roundTrips)
{
    for (auto & info : allProtocols()) {
        ASSERT_EQ(showProtocol(info.protocol), info.name);
        ASSERT_EQ(parseProtocol(info.name), info.protocol);
    }

    std::ostringstream os;
    os << Protocol::Chunked;
    ASSERT_EQ(os.str(), "chunked");
}

TEST(allProtocols, decoders)
{
    std::vector<Protocol> decodable;
    for (auto & info : allProtocols()) {
        ASSERT_NE(info.serialise, nullptr);
        if (info.decode)
            decodable.push_back(info.protocol);
    }
    ASSERT_EQ(decodable, (std::vector<Protocol>{Protocol::Raw, Protocol::Chunked, Protocol::Tar}));
}

TEST(supportedProtocols, byEndpointKind)
{
    std::vector<Protocol> local{Protocol::Raw, Protocol::Human, Protocol::Tar};
    std::vector<Protocol> connection{Protocol::Nbd, Protocol::Raw, Protocol::Chunked, Protocol::Human, Protocol::Tar};

    ASSERT_EQ(supportedProtocols(parseEndpoint("stdout:")), local);
    ASSERT_EQ(supportedProtocols(parseEndpoint("null:")), local);
    ASSERT_EQ(supportedProtocols(parseEndpoint("file:///tmp/x")), local);
    ASSERT_EQ(supportedProtocols(parseEndpoint("fd://3")), connection);
    ASSERT_EQ(supportedProtocols(parseEndpoint("tcp://localhost:10809")), connection);
    ASSERT_EQ(supportedProtocols(parseEndpoint("unix:///tmp/x.sock")), connection);
    ASSERT_EQ(
        supportedProtocols(parseEndpoint("http://example.org/")), (std::vector<Protocol>{Protocol::Nbd, Protocol::Chunked}));
}

TEST(chooseProtocol, defaultsToTheFirst)
{
    LoggerCapture capture;
    ASSERT_EQ(chooseProtocol(std::nullopt, {Protocol::Raw, Protocol::Human}), Protocol::Raw);
    ASSERT_THAT(capture->messages, Contains("Using protocol: raw"));
}

TEST(chooseProtocol, requested)
{
    LoggerCapture capture;
    ASSERT_EQ(chooseProtocol(Protocol::Tar, {Protocol::Raw, Protocol::Tar}), Protocol::Tar);
    ASSERT_TRUE(capture->messages.empty());
}

TEST(chooseProtocol, requestedButUnsupported)
{
    try {
        chooseProtocol(Protocol::Chunked, {Protocol::Raw, Protocol::Human, Protocol::Tar});
        FAIL() << "expected an UnsupportedError";
    } catch (UnsupportedError & e) {
        ASSERT_EQ(
            filterANSIEscapes(e.message(), true), "this destination only supports protocols: [ raw; human; tar ]");
    }
}

TEST(chooseProtocol, nothingSupported)
{
    ASSERT_THROW(chooseProtocol(std::nullopt, {}), UnsupportedError);
}

TEST(ProgressReporter, isMonotonicAndEndsOnTheTotal)
{
    ProgressRecorder recorder;
    ProgressReporter p(recorder.make(), 100);

    ASSERT_EQ(recorder.total, 100u);
    ASSERT_EQ(p.totalWork(), 100u);

    p(10);
    p(5);
    p(150);
    p.finish();

    ASSERT_EQ(recorder.calls, (std::vector<uint64_t>{10, 10, 100, 100}));
}

TEST(ProgressReporter, zeroWork)
{
    ProgressRecorder recorder;
    ProgressReporter p(recorder.make(), 0);
    p(0);
    p.finish();
    ASSERT_EQ(recorder.calls, (std::vector<uint64_t>{0, 0}));
}

TEST(ProgressReporter, withoutCallback)
{
    ProgressReporter p({}, 10);
    p(3);
    p.finish();
}

} // namespace diskxfer
