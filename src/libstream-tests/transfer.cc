#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "diskxfer/stream/chunked.hh"
#include "diskxfer/stream/tar-stream.hh"
#include "diskxfer/stream/transfer.hh"
#include "diskxfer/util/tests/capturing-logger.hh"

#include "test-util.hh"

#include <cstdlib>

#include <fcntl.h>

namespace diskxfer {

using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::StartsWith;

TEST(renderRate, units)
{
    ASSERT_EQ(renderRate(0), "0.0 B");
    ASSERT_EQ(renderRate(1024), "1024.0 B");
    ASSERT_EQ(renderRate(1536), "1.5 KiB");
    ASSERT_EQ(renderRate(3.0 * 1024 * 1024), "3.0 MiB");
    ASSERT_EQ(renderRate(5.0 * 1024 * 1024 * 1024 * 1024 * 1024), "5120.0 TiB");
}

TEST(transferStatistics, lines)
{
    SizeSummary size{.total = 4096, .metadata = 0, .empty = 3072, .copy = 1024};
    ASSERT_EQ(
        transferStatistics(size, 1024, 2),
        (Strings{
            "Time taken: 0:00:02",
            "Physical data rate: 512.0 B/sec",
            "Speedup: 4.0",
            "Virtual data rate: 2.0 KiB/sec",
        }));
}

TEST(TransferSettings, userAgent)
{
    TransferSettings settings;
    ASSERT_EQ(settings.userAgent(), "diskxfer/" + diskxferVersion);

    settings.set("user-agent-suffix", "ci-runner");
    ASSERT_EQ(settings.userAgent(), "diskxfer/" + diskxferVersion + " ci-runner");
}

TEST(TransferSettings, channelOptions)
{
    TransferSettings settings;
    settings.set("unbuffered", "true");
    settings.set("buffer-size", "4096");
    settings.set("verify-https", "false");
    settings.set("connect-timeout", "9");

    auto options = settings.channelOptions();
    ASSERT_TRUE(options.unbuffered);
    ASSERT_EQ(options.bufferSize, 4096u);
    ASSERT_FALSE(options.verifyTls);
    ASSERT_EQ(options.connectTimeout, 9u);
    ASSERT_FALSE(options.seekable);
}

TEST(loadConfFile, fileThenEnvironment)
{
    char tmpl[] = "/tmp/diskxfer-conf-XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    Path dir = tmpl;
    auto confFile = dir + "/diskxfer.conf";

    {
        AutoCloseFD fd = open(confFile.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        ASSERT_TRUE(fd);
        writeFull(fd.get(), "buffer-size = 4096\nconnect-timeout = 3\n");
    }

    setenv("DISKXFER_CONF_DIR", dir.c_str(), 1);
    setenv("DISKXFER_CONFIG", "connect-timeout = 7", 1);

    TransferSettings settings;
    loadConfFile(settings);

    unsetenv("DISKXFER_CONF_DIR");
    unsetenv("DISKXFER_CONFIG");
    unlink(confFile.c_str());
    rmdir(dir.c_str());

    ASSERT_EQ(settings.bufferSize.get(), 4096u);
    ASSERT_EQ(settings.connectTimeout.get(), 7u);
}

TEST(loadConfFile, missingFileIsFine)
{
    setenv("DISKXFER_CONF_DIR", "/nonexistent", 1);
    TransferSettings settings;
    loadConfFile(settings);
    unsetenv("DISKXFER_CONF_DIR");
    ASSERT_EQ(settings.bufferSize.get(), 1024u * 1024);
}

static Stream smallStream()
{
    return Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(2), dataRun(filled(1, 'b'))});
}

TEST(streamToDestination, defaultProtocolForFiles)
{
    TempFile file;
    LoggerCapture capture;

    auto result = streamToDestination(smallStream(), {.destination = "file://" + file.path});

    ASSERT_EQ(result.protocol, Protocol::Raw);
    ASSERT_EQ(result.work, 2048u);
    ASSERT_GE(result.seconds, 0);
    ASSERT_EQ(readFile(file.path), filled(1, 'a') + filled(2, 0) + filled(1, 'b'));
    ASSERT_THAT(capture->messages, Contains("Using protocol: raw"));
}

TEST(streamToDestination, preZeroedFileIsSparse)
{
    TempFile file;

    auto result = streamToDestination(
        smallStream(), {.destination = "file://" + file.path, .protocol = Protocol::Raw, .preZeroed = true});

    ASSERT_EQ(result.work, 1024u);
    auto contents = readFile(file.path);
    ASSERT_EQ(contents, filled(1, 'a') + filled(2, 0) + filled(1, 'b'));
}

TEST(streamToDestination, preZeroedFileCoversATrailingEmptyRun)
{
    TempFile file;

    auto result = streamToDestination(
        Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(2)}),
        {.destination = "file://" + file.path, .protocol = Protocol::Raw, .preZeroed = true});

    ASSERT_EQ(result.work, 512u);
    ASSERT_EQ(readFile(file.path), filled(1, 'a') + filled(2, 0));
}

TEST(streamToDestination, preZeroedFileKeepsALongerExistingImage)
{
    TempFile file;
    writeFull(file.fd.get(), filled(8, 'x'));

    streamToDestination(
        Stream::fromElements({dataRun(filled(1, 'a')), emptyRun(2)}),
        {.destination = "file://" + file.path, .protocol = Protocol::Raw, .preZeroed = true});

    ASSERT_EQ(readFile(file.path), filled(1, 'a') + filled(7, 'x'));
}

TEST(streamToDestination, progress)
{
    ProgressRecorder progress;
    streamToDestination(smallStream(), {.destination = "null:", .protocol = Protocol::Tar, .progress = progress.make()});
    ASSERT_EQ(progress.total, 1024u);
    ASSERT_EQ(progress.calls.back(), 1024u);
}

TEST(streamToDestination, human)
{
    LoggerCapture capture;

    auto result = streamToDestination(smallStream(), {.destination = "null:", .protocol = Protocol::Human});

    ASSERT_EQ(result.protocol, Protocol::Human);
    ASSERT_FALSE(result.work);
    ASSERT_THAT(capture->stdoutLines, Contains("# end of stream"));
}

TEST(streamToDestination, unsupportedProtocol)
{
    TempFile file;
    try {
        streamToDestination(smallStream(), {.destination = "file://" + file.path, .protocol = Protocol::Chunked});
        FAIL() << "expected an UnsupportedError";
    } catch (UnsupportedError & e) {
        ASSERT_FALSE(e.info().traces.empty());
        ASSERT_THAT(e.info().traces.front().hint.str(), HasSubstr("while sending to"));
    }
    /* Nothing was sent. */
    ASSERT_EQ(readFile(file.path), "");
}

TEST(streamToDestination, badDestination)
{
    ASSERT_THROW(streamToDestination(smallStream(), {.destination = "gopher://x"}), UsageError);
}

TEST(streamToDestination, verboseStatistics)
{
    LoggerCapture capture(lvlTalkative);

    streamToDestination(smallStream(), {.destination = "null:", .protocol = Protocol::Raw});

    ASSERT_THAT(capture->stdoutLines, Contains(StartsWith("Speedup: ")));
    ASSERT_THAT(capture->stdoutLines, Contains(StartsWith("Time taken: ")));
}

/**
 * A file holding `contents`, opened again for reading so that `serve`
 * can own the descriptor.
 */
static Descriptor sourceFd(TempFile & file, std::string_view contents)
{
    writeFull(file.fd.get(), contents);
    auto fd = open(file.path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
        throw SysError("reopening '%s'", file.path);
    return fd;
}

TEST(serve, chunked)
{
    MemoryChannel encoded;
    serialiseChunked(encoded, smallStream(), {.preZeroed = true}, {});

    TempFile source, destination;
    serve({
        .sourceProtocol = Protocol::Chunked,
        .sourceFd = sourceFd(source, encoded.written),
        .destination = "file://" + destination.path,
    });

    ASSERT_EQ(readFile(destination.path), filled(1, 'a') + filled(2, 0) + filled(1, 'b'));
}

TEST(serve, tar)
{
    MemoryChannel encoded;
    serialiseTar(encoded, smallStream(), {.tarFilenamePrefix = "vm-"}, {});

    TempFile source, destination;
    serve({
        .sourceProtocol = Protocol::Tar,
        .sourceFd = sourceFd(source, encoded.written),
        .destination = "file://" + destination.path,
        .expectedPrefix = "vm-",
    });

    ASSERT_EQ(readFile(destination.path), filled(1, 'a') + filled(2, 0) + filled(1, 'b'));
}

TEST(serve, raw)
{
    TempFile source, destination;
    serve({
        .sourceProtocol = Protocol::Raw,
        .sourceFd = sourceFd(source, "raw bytes"),
        .destination = "file://" + destination.path,
    });
    ASSERT_EQ(readFile(destination.path), "raw bytes");
}

TEST(serve, decodeErrorsNameTheDestination)
{
    TempFile source, destination;
    try {
        serve({
            .sourceProtocol = Protocol::Chunked,
            .sourceFd = sourceFd(source, "short"),
            .destination = "file://" + destination.path,
        });
        FAIL() << "expected a FramingError";
    } catch (FramingError & e) {
        ASSERT_FALSE(e.info().traces.empty());
        ASSERT_THAT(e.info().traces.front().hint.str(), HasSubstr("while receiving a chunked stream"));
    }
}

TEST(serve, validation)
{
    TempFile destination;
    auto dest = "file://" + destination.path;

    ASSERT_THROW(serve({.sourceFd = 0, .destination = dest}), UsageError);
    ASSERT_THROW(serve({.sourceProtocol = Protocol::Nbd, .sourceFd = 0, .destination = dest}), UsageError);
    ASSERT_THROW(serve({.sourceProtocol = Protocol::Human, .sourceFd = 0, .destination = dest}), UsageError);
    ASSERT_THROW(
        serve({.sourceProtocol = Protocol::Raw, .sourceFd = 0, .destination = dest, .destinationFormat = "vhd"}),
        UsageError);
    ASSERT_THROW(serve({.sourceProtocol = Protocol::Raw, .destination = dest}), UsageError);
    ASSERT_THROW(serve({.sourceProtocol = Protocol::Raw, .sourceFd = 0, .destination = "null:"}), UnsupportedError);
}

} // namespace diskxfer
