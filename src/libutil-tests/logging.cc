#include "diskxfer/util/logging.hh"
#include "diskxfer/util/tests/capturing-logger.hh"
#include "diskxfer/util/file-descriptor.hh"
#include "diskxfer/util/serialise.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace diskxfer {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(logging, messagesAboveTheVerbosityAreDropped)
{
    LoggerCapture capture(lvlInfo);

    printInfo("Using protocol: %s", "tar");
    debug("not shown");

    ASSERT_THAT(capture->messages, ElementsAre("Using protocol: tar"));
}

TEST(logging, debugShownWhenVerbose)
{
    LoggerCapture capture(lvlDebug);

    debug("chunk %d: %d bytes", 3, 512);

    ASSERT_THAT(capture->messages, ElementsAre("chunk 3: 512 bytes"));
}

TEST(logging, writeToStdoutIsSeparateFromMessages)
{
    LoggerCapture capture;

    logger->cout("# offset : %s", "contents");

    ASSERT_TRUE(capture->messages.empty());
    ASSERT_THAT(capture->stdoutLines, ElementsAre("# offset : contents"));
}

TEST(logging, logErrorCarriesTheMessage)
{
    LoggerCapture capture;

    FramingError e("stream ended after %d chunks", 7);
    logError(e.info());

    ASSERT_EQ(capture->messages.size(), 1u);
    ASSERT_THAT(capture->messages.front(), HasSubstr("stream ended after"));
}

TEST(logging, activityProgressReachesTheLogger)
{
    LoggerCapture capture;

    {
        Activity act(*logger, lvlInfo, actTransfer, "sending");
        act.progress(10, 100);
        act.progress(100, 100);
    }

    ASSERT_EQ(capture->progress.size(), 2u);
    ASSERT_EQ(capture->progress[0].done, 10u);
    ASSERT_EQ(capture->progress[1].done, 100u);
    ASSERT_EQ(capture->progress[1].expected, 100u);
}

/* ----------------------------------------------------------------------------
 * Error
 * --------------------------------------------------------------------------*/

TEST(Error, tracesAreKept)
{
    TransportError e("connection reset");
    e.addTrace("while sending to '%s'", "tcp://host:1");

    ASSERT_EQ(e.info().traces.size(), 1u);
    ASSERT_THAT(e.info().traces.front().hint.str(), HasSubstr("while sending to"));
}

TEST(Error, hierarchy)
{
    ASSERT_THROW(throw EndOfFile("short read"), TransportError);
    ASSERT_THROW(throw SerialisationError("bad archive"), FramingError);
    ASSERT_THROW(throw UsageError("bad flag"), Error);
}

TEST(Error, sysErrorCarriesErrno)
{
    errno = ENOENT;
    SysError e("opening '%s'", "/nonexistent");
    ASSERT_EQ(e.errNo, ENOENT);
    ASSERT_THAT(e.message(), HasSubstr("No such file or directory"));
}

} // namespace diskxfer
