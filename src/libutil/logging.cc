#include "diskxfer/util/logging.hh"
#include "diskxfer/util/file-descriptor.hh"
#include "diskxfer/util/terminal.hh"
#include "diskxfer/util/util.hh"

#include <atomic>
#include <sstream>

namespace diskxfer {

LoggerSettings loggerSettings;

static thread_local ActivityId curActivity = 0;

ActivityId getCurActivity()
{
    return curActivity;
}

std::unique_ptr<Logger> logger = makeSimpleLogger();

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

void Logger::writeToStdout(std::string_view s)
{
    Descriptor standard_out = getStandardOutput();
    writeFull(standard_out, s);
    writeFull(standard_out, "\n");
}

class SimpleLogger : public Logger
{
public:

    bool tty;

    struct Progress
    {
        std::string what;
        uint64_t lastPercent = 0;
    };

    std::map<ActivityId, Progress> activities;

    SimpleLogger()
    {
        tty = isTTY();
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        writeToStderr(filterANSIEscapes(s, !tty) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei, loggerSettings.showTrace.get());

        log(ei.level, oss.str());
    }

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override
    {
        if (lvl <= verbosity && !s.empty())
            log(lvl, s + "...");
        activities.emplace(act, Progress{.what = s});
    }

    void stopActivity(ActivityId act) override
    {
        activities.erase(act);
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        if (type != resProgress || !loggerSettings.showProgress || fields.size() < 2)
            return;

        auto i = activities.find(act);
        if (i == activities.end())
            return;

        auto done = fields[0].i;
        auto expected = fields[1].i;
        uint64_t percent = expected ? done * 100 / expected : 100;
        if (percent > i->second.lastPercent || (done == expected && i->second.lastPercent == 0)) {
            i->second.lastPercent = percent;
            writeToStderr(fmt("%s: %d%% (%s of %s)\n", i->second.what, percent, renderSize(done), renderSize(expected)));
        }
    }
};

Verbosity verbosity = lvlInfo;

void writeToStderr(std::string_view s)
{
    try {
        writeFull(getStandardError(), s);
    } catch (SysError & e) {
        /* Ignore failing writes to stderr.  We need to ignore write
           errors to ensure that cleanup code that logs to stderr runs
           to completion if the other side of stderr has been closed
           unexpectedly. */
    }
}

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

std::atomic<uint64_t> nextId{0};

Activity::Activity(
    Logger & logger,
    Verbosity lvl,
    ActivityType type,
    const std::string & s,
    const Logger::Fields & fields,
    ActivityId parent)
    : logger(logger)
    , id(nextId++ + (((uint64_t) getpid()) << 32))
{
    logger.startActivity(id, lvl, type, s, fields, parent);
}

Activity::~Activity()
{
    try {
        logger.stopActivity(id);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

} // namespace diskxfer
