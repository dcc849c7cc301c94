#include "shared.hh"
#include "diskxfer/stream/transfer.hh"
#include "diskxfer/util/ansicolor.hh"
#include "diskxfer/util/config-global.hh"
#include "diskxfer/util/environment-variables.hh"
#include "diskxfer/util/exit.hh"
#include "diskxfer/util/logging.hh"

#include <iostream>

#include <signal.h>

namespace diskxfer {

void initDiskxfer()
{
    logger = makeSimpleLogger();

    /* A peer that hangs up should surface as a write error. */
    signal(SIGPIPE, SIG_IGN);

    loadConfFile(globalConfig);
    globalConfig.warnUnknownSettings();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    ErrorInfo::programName = programName;

    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        fun();
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1% --help' for more information.", programName);
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc & e) {
        printError(error + "out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(error + e.what());
        return 1;
    }

    return 0;
}

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

bool parseCommonArg(const std::string & programName, Strings::iterator & i, const Strings::iterator & end)
{
    if (*i == "--verbose" || *i == "-v")
        verbosity = verbosity < lvlVomit ? (Verbosity) (verbosity + 1) : lvlVomit;
    else if (*i == "--quiet")
        verbosity = verbosity > lvlError ? (Verbosity) (verbosity - 1) : lvlError;
    else if (*i == "--option") {
        auto name = getArg(*i, i, end);
        auto value = getArg(*i, i, end);
        if (!globalConfig.set(name, value))
            warn("unknown setting '%s'", name);
    } else if (*i == "--version") {
        printVersion(programName);
        throw Exit();
    } else
        return false;
    return true;
}

void parseCmdLine(
    const std::string & programName,
    Strings args,
    std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg)
{
    for (auto i = args.begin(); i != args.end(); ++i) {
        /* -vvv */
        if (i->size() > 2 && (*i)[0] == '-' && (*i)[1] == 'v' && i->find_first_not_of('v', 1) == std::string::npos) {
            for (size_t n = 1; n < i->size(); ++n)
                verbosity = verbosity < lvlVomit ? (Verbosity) (verbosity + 1) : lvlVomit;
            continue;
        }
        if (parseCommonArg(programName, i, args.end()))
            continue;
        if (!parseArg(i, args.end()))
            throw UsageError("unexpected argument '%1%'", *i);
    }
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% %2%", programName, diskxferVersion) << std::endl;
    if (verbosity > lvlInfo)
        std::cout << "System configuration file: "
                  << getEnv("DISKXFER_CONF_DIR").value_or("/etc/diskxfer") + "/diskxfer.conf" << "\n";
}

} // namespace diskxfer
