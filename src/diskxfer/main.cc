#include "shared.hh"
#include "diskxfer/stream/raw-input.hh"
#include "diskxfer/stream/transfer.hh"
#include "diskxfer/util/config-global.hh"
#include "diskxfer/util/exit.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/util.hh"

#include <iostream>

using namespace diskxfer;

static const std::string usage = R"(Usage: diskxfer COMMAND [OPTIONS]

Commands:
  stream       send a disk image to a destination
  serve        receive one stream and write it to a raw image file
  show-config  print the current settings

Options for 'stream':
  --source PATH                 the image to send
  --source-format FORMAT        raw (default), vhd or hybrid
  --destination-format FORMAT   raw (default) or vhd
  --destination SPEC            stdout: (default), null:, fd://N,
                                tcp://HOST:PORT, unix:///PATH,
                                file:///PATH, http(s)://[USER:PASS@]HOST/PATH
  --destination-protocol P      raw (or none), chunked, nbd, tar, human
  --prezeroed                   the destination already reads as zeros
  --tar-filename-prefix P       prefix of the names of tar members
  --progress                    print progress to standard error

Options for 'serve':
  --source-protocol P           raw, chunked or tar
  --source SPEC                 fd://N, tcp://HOST:PORT or unix:///PATH
  --source-fd N                 an inherited descriptor to read from
  --destination file:///PATH    the raw image to write
  --destination-format FORMAT   raw
  --tar-filename-prefix P       every tar member must start with this

Common options:
  -v, --verbose                 log more; repeat for even more
  --quiet                       log less
  --option NAME VALUE           set a configuration setting
  --help                        show this help
  --version                     show the version
)";

static void showHelp()
{
    std::cout << usage;
    throw Exit();
}

/**
 * Report progress through a logger activity, which prints whole
 * percentages when `show-progress` is set.
 */
static MakeProgress activityProgress(const std::string & what)
{
    return [what](uint64_t total) -> Progress {
        auto act = std::make_shared<Activity>(*logger, lvlTalkative, actTransfer, what);
        return [act, total](uint64_t done) { act->progress(done, total); };
    };
}

static void mainStream(const std::string & programName, Strings args)
{
    std::optional<Path> source;
    std::string sourceFormat = "raw";
    std::string destinationFormat = "raw";
    StreamOptions options;

    parseCmdLine(programName, std::move(args), [&](Strings::iterator & arg, const Strings::iterator & end) {
        if (*arg == "--help")
            showHelp();
        else if (*arg == "--source")
            source = getArg(*arg, arg, end);
        else if (*arg == "--source-format")
            sourceFormat = getArg(*arg, arg, end);
        else if (*arg == "--destination-format")
            destinationFormat = getArg(*arg, arg, end);
        else if (*arg == "--destination")
            options.destination = getArg(*arg, arg, end);
        else if (*arg == "--destination-protocol")
            options.protocol = parseProtocol(getArg(*arg, arg, end));
        else if (*arg == "--prezeroed")
            options.preZeroed = true;
        else if (*arg == "--tar-filename-prefix")
            options.tarFilenamePrefix = getArg(*arg, arg, end);
        else if (*arg == "--progress")
            loggerSettings.showProgress = true;
        else
            return false;
        return true;
    });

    if (!source)
        throw UsageError("'--source' is required");

    if (loggerSettings.showProgress)
        options.progress = activityProgress(fmt("sending '%s'", *source));

    auto stream = makeStream(*source, sourceFormat, destinationFormat);

    streamToDestination(stream, options);
}

static void mainServe(const std::string & programName, Strings args)
{
    ServeOptions options;

    parseCmdLine(programName, std::move(args), [&](Strings::iterator & arg, const Strings::iterator & end) {
        if (*arg == "--help")
            showHelp();
        else if (*arg == "--source-protocol")
            options.sourceProtocol = parseProtocol(getArg(*arg, arg, end));
        else if (*arg == "--source")
            options.source = getArg(*arg, arg, end);
        else if (*arg == "--source-fd") {
            auto s = getArg(*arg, arg, end);
            auto fd = string2Int<Descriptor>(s);
            if (!fd || *fd < 0)
                throw UsageError("'--source-fd' requires a file descriptor, not '%s'", s);
            options.sourceFd = *fd;
        } else if (*arg == "--destination")
            options.destination = getArg(*arg, arg, end);
        else if (*arg == "--destination-format")
            options.destinationFormat = getArg(*arg, arg, end);
        else if (*arg == "--tar-filename-prefix")
            options.expectedPrefix = getArg(*arg, arg, end);
        else
            return false;
        return true;
    });

    if (options.destination.empty())
        throw UsageError("'--destination' is required");

    serve(options);
}

static void mainShowConfig(const std::string & programName, Strings args)
{
    parseCmdLine(programName, std::move(args), [&](Strings::iterator & arg, const Strings::iterator & end) {
        if (*arg == "--help")
            showHelp();
        else
            return false;
        return true;
    });

    logger->writeToStdout(chomp(globalConfig.toKeyValue()));
}

int main(int argc, char ** argv)
{
    std::string programName = "diskxfer";

    return handleExceptions(programName, [&]() {
        initDiskxfer();

        Strings args;
        for (int i = 1; i < argc; ++i)
            args.push_back(argv[i]);

        if (args.empty())
            throw UsageError("no command given");

        auto command = args.front();
        args.pop_front();

        if (command == "stream")
            mainStream(programName, std::move(args));
        else if (command == "serve")
            mainServe(programName, std::move(args));
        else if (command == "show-config")
            mainShowConfig(programName, std::move(args));
        else if (command == "--help")
            showHelp();
        else if (command == "--version")
            printVersion(programName);
        else
            throw UsageError("unknown command '%s'", command);
    });
}
