#include "diskxfer/stream/transfer.hh"
#include "diskxfer/util/config-global.hh"
#include "diskxfer/util/environment-variables.hh"
#include "diskxfer/util/file-descriptor.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/util.hh"

#include <array>
#include <chrono>

namespace diskxfer {

#ifndef DISKXFER_VERSION
#  define DISKXFER_VERSION "unknown"
#endif

const std::string diskxferVersion = DISKXFER_VERSION;

TransferSettings transferSettings;

static GlobalConfig::Register rTransferSettings(&transferSettings);

ChannelOptions TransferSettings::channelOptions() const
{
    return ChannelOptions{
        .unbuffered = unbuffered,
        .bufferSize = bufferSize,
        .verifyTls = verifyTls,
        .connectTimeout = connectTimeout,
    };
}

std::string TransferSettings::userAgent() const
{
    auto s = "diskxfer/" + diskxferVersion;
    if (userAgentSuffix.get() != "")
        s += " " + userAgentSuffix.get();
    return s;
}

void loadConfFile(AbstractConfig & config)
{
    auto confDir = getEnv("DISKXFER_CONF_DIR").value_or("/etc/diskxfer");
    auto path = confDir + "/diskxfer.conf";

    try {
        config.applyConfig(readFile(path), path);
    } catch (SysError &) {
        debug("not reading '%s'", path);
    }

    if (auto env = getEnvNonEmpty("DISKXFER_CONFIG"))
        config.applyConfig(*env, "DISKXFER_CONFIG");
}

TransferResult streamToDestination(const Stream & stream, const StreamOptions & options)
{
    auto endpoint = parseEndpoint(options.destination);

    auto opened = openEndpoint(
        endpoint, transferSettings.channelOptions(), HttpRequestOptions{.userAgent = transferSettings.userAgent()});
    auto & channel = *opened.channel;

    TransferResult result;

    try {
        result.protocol = chooseProtocol(options.protocol, opened.protocols);

        SerialiseParams params{
            .preZeroed = options.preZeroed,
            .tarFilenamePrefix = options.tarFilenamePrefix,
        };

        auto start = std::chrono::steady_clock::now();
        result.work = protocolInfo(result.protocol).serialise(channel, stream, params, options.progress);
        channel.close();
        result.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    } catch (Error & e) {
        closeOnError(channel);
        e.addTrace("while sending to '%s'", endpoint.to_string());
        throw;
    }

    if (result.work && *result.work && verbosity > lvlInfo)
        for (auto & line : transferStatistics(stream.size, *result.work, result.seconds))
            logger->writeToStdout(line);

    return result;
}

std::string renderRate(double n)
{
    static const std::array<std::string_view, 5> units{"B", "KiB", "MiB", "GiB", "TiB"};
    size_t i = 0;
    while (i + 1 < units.size() && n > 1024.0) {
        n /= 1024.0;
        i++;
    }
    return fmt("%.1f %s", n, units[i]);
}

Strings transferStatistics(const SizeSummary & size, uint64_t work, double seconds)
{
    /* Transfers that finish within the clock's resolution. */
    if (seconds <= 0)
        seconds = 1e-9;

    auto physicalRate = (double) work / seconds;
    auto speedup = (double) size.total / (double) work;

    return {
        fmt("Time taken: %s", renderDuration((uint64_t) seconds)),
        fmt("Physical data rate: %s/sec", renderRate(physicalRate)),
        fmt("Speedup: %.1f", speedup),
        fmt("Virtual data rate: %s/sec", renderRate(physicalRate * speedup)),
    };
}

static std::unique_ptr<Channel> openServeSource(const ServeOptions & options, const ChannelOptions & channelOptions)
{
    if (options.sourceFd)
        return std::make_unique<FdChannel>(AutoCloseFD{*options.sourceFd}, channelOptions);

    if (!options.source)
        throw UsageError("either a source or a source file descriptor is required");

    auto endpoint = parseEndpoint(*options.source);

    if (auto f = std::get_if<Endpoint::FileDescriptor>(&endpoint.raw))
        return std::make_unique<FdChannel>(AutoCloseFD{f->fd}, channelOptions);

    return std::make_unique<FdChannel>(acceptOnce(endpoint), channelOptions);
}

void serve(const ServeOptions & options)
{
    if (!options.sourceProtocol)
        throw UsageError("a source protocol is required");

    if (options.destinationFormat != "raw")
        throw UsageError("'%s' is not a supported destination format", options.destinationFormat);

    auto & info = protocolInfo(*options.sourceProtocol);
    if (!info.decode)
        throw UsageError("'%s' is not a supported source protocol", info.name);

    auto destination = parseEndpoint(options.destination);
    auto file = std::get_if<Endpoint::File>(&destination.raw);
    if (!file)
        throw UnsupportedError("writing to destination '%s' is not implemented", options.destination);

    auto channelOptions = transferSettings.channelOptions();

    auto destinationFd = openDestinationFile(file->path, channelOptions.unbuffered);

    auto source = openServeSource(options, channelOptions);

    DecodeParams params{
        .expectedPrefix = options.expectedPrefix,
        .verifyChecksums = transferSettings.tarVerifyChecksums,
    };

    try {
        info.decode(*source, destinationFd.get(), params);
        source->close();
    } catch (Error & e) {
        closeOnError(*source);
        e.addTrace("while receiving a %s stream into '%s'", info.name, file->path);
        throw;
    }

    try {
        destinationFd.fsync();
    } catch (SysError &) {
        throw TransportError("fsync failed");
    }

    destinationFd.close();
}

} // namespace diskxfer
