#pragma once
///@file

#include "diskxfer/stream/endpoint.hh"
#include "diskxfer/stream/protocol.hh"
#include "diskxfer/util/configuration.hh"

namespace diskxfer {

extern const std::string diskxferVersion;

struct TransferSettings : Config
{
    Setting<bool> unbuffered{
        this,
        false,
        "unbuffered",
        R"(
          Whether to bypass write coalescing. Destination files are
          opened with `O_DSYNC` and every write goes straight to the
          descriptor.
        )"};

    Setting<uint64_t> bufferSize{
        this,
        1024 * 1024,
        "buffer-size",
        R"(
          The number of bytes collected before a channel hands them to
          the operating system or the TLS layer.
        )"};

    Setting<unsigned int> connectTimeout{
        this,
        0,
        "connect-timeout",
        R"(
          The timeout (in seconds) for establishing HTTP connections. 0
          uses the default of libcurl.
        )"};

    Setting<bool> verifyTls{
        this,
        true,
        "verify-tls",
        R"(
          Whether to check the certificate and host name of `https`
          destinations.
        )",
        {"verify-https"}};

    Setting<bool> tarVerifyChecksums{
        this,
        true,
        "tar-verify-checksums",
        R"(
          Whether `serve` checks each chunk of a tar stream against the
          SHA-1 in the checksum member that follows it.
        )"};

    Setting<std::string> userAgentSuffix{
        this,
        "",
        "user-agent-suffix",
        "String appended to the user agent in HTTP requests."};

    ChannelOptions channelOptions() const;

    std::string userAgent() const;
};

extern TransferSettings transferSettings;

/**
 * Apply `$DISKXFER_CONF_DIR/diskxfer.conf` (default
 * `/etc/diskxfer/diskxfer.conf`) and then the contents of the
 * `DISKXFER_CONFIG` environment variable to `config`.
 */
void loadConfFile(AbstractConfig & config);

struct StreamOptions
{
    std::string destination = "stdout:";

    std::optional<Protocol> protocol;

    bool preZeroed = false;

    std::string tarFilenamePrefix;

    MakeProgress progress;
};

/**
 * What `streamToDestination()` did.
 */
struct TransferResult
{
    Protocol protocol;

    /**
     * As returned by the serialiser.
     */
    std::optional<uint64_t> work;

    /**
     * Wall-clock seconds spent serialising.
     */
    double seconds = 0;
};

/**
 * Send `stream` to the destination named in `options`: open it, pick a
 * protocol both sides support, serialise and close.
 */
TransferResult streamToDestination(const Stream & stream, const StreamOptions & options);

/**
 * `n` with a binary unit, e.g. `1.5 MiB`.
 */
std::string renderRate(double n);

/**
 * The lines printed after a verbose transfer.
 */
Strings transferStatistics(const SizeSummary & size, uint64_t work, double seconds);

struct ServeOptions
{
    std::optional<Protocol> sourceProtocol;

    /**
     * An endpoint to accept a single connection on, or `fd://N`.
     */
    std::optional<std::string> source;

    std::optional<Descriptor> sourceFd;

    std::string destination;

    std::string destinationFormat = "raw";

    std::optional<std::string> expectedPrefix;
};

/**
 * Receive one stream and reconstruct the raw image in the destination
 * file.
 */
void serve(const ServeOptions & options);

} // namespace diskxfer
