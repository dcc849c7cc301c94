#pragma once
///@file

#include "diskxfer/util/logging.hh"

#include <memory>
#include <utility>
#include <vector>

namespace diskxfer {

/**
 * A logger that records what it is given instead of printing it.
 */
class CapturingLogger : public Logger
{
public:
    Strings messages;
    Strings stdoutLines;

    struct ProgressEvent
    {
        uint64_t done;
        uint64_t expected;
    };

    std::vector<ProgressEvent> progress;

    void log(Verbosity lvl, std::string_view s) override
    {
        messages.emplace_back(s);
    }

    void logEI(const ErrorInfo & ei) override
    {
        messages.push_back(ei.msg.str());
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        if (type == resProgress && fields.size() >= 2)
            progress.push_back({fields[0].i, fields[1].i});
    }

    void writeToStdout(std::string_view s) override
    {
        stdoutLines.emplace_back(s);
    }
};

/**
 * Install a `CapturingLogger` for the lifetime of this object.
 */
class LoggerCapture
{
    std::unique_ptr<Logger> saved;
    Verbosity savedVerbosity;

public:
    CapturingLogger * captured;

    LoggerCapture(Verbosity level = lvlInfo)
        : savedVerbosity(verbosity)
    {
        auto l = std::make_unique<CapturingLogger>();
        captured = l.get();
        saved = std::exchange(logger, std::move(l));
        verbosity = level;
    }

    ~LoggerCapture()
    {
        logger = std::move(saved);
        verbosity = savedVerbosity;
    }

    CapturingLogger * operator->()
    {
        return captured;
    }
};

} // namespace diskxfer
