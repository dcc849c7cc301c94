#include "diskxfer/util/error.hh"
#include "diskxfer/util/logging.hh"
#include "diskxfer/util/terminal.hh"
#include "diskxfer/util/util.hh"

#include <iostream>
#include <sstream>

namespace diskxfer {

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace{.hint = hint});
    what_.reset();
}

// c++ std::exception descendants must have a 'const char* what()' function.
// This stringifies the error and caches it for use by what(), or similarly by msg().
const std::string & BaseError::calcWhat() const
{
    if (what_.has_value())
        return *what_;
    else {
        std::ostringstream oss;
        showErrorInfo(oss, err, loggerSettings.showTrace);
        what_ = oss.str();
        return *what_;
    }
}

std::optional<std::string> ErrorInfo::programName = std::nullopt;

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    std::string prefix;
    switch (einfo.level) {
    case lvlError:
        prefix = ANSI_RED "error";
        break;
    case lvlNotice:
        prefix = ANSI_RED "note";
        break;
    case lvlWarn:
        prefix = ANSI_WARNING "warning";
        break;
    case lvlInfo:
        prefix = ANSI_GREEN "info";
        break;
    case lvlTalkative:
        prefix = ANSI_GREEN "talk";
        break;
    case lvlChatty:
        prefix = ANSI_GREEN "chat";
        break;
    case lvlVomit:
        prefix = ANSI_GREEN "vomit";
        break;
    case lvlDebug:
        prefix = ANSI_WARNING "debug";
        break;
    }

    prefix += ":" ANSI_NORMAL " ";

    std::ostringstream oss;

    /* Traces are collected innermost last. Without --show-trace only
       the outermost few are printed. */
    size_t count = 0;
    bool truncated = false;
    for (const auto & trace : einfo.traces) {
        if (trace.hint.str().empty())
            continue;
        if (!showTrace && count >= 3) {
            truncated = true;
            break;
        }
        oss << "\n" << "… " << trace.hint.str() << "\n";
        count++;
    }

    if (truncated)
        oss << "\n" << ANSI_WARNING "(trace truncated; use '--option show-trace true' to show all of it)" ANSI_NORMAL
            << "\n";

    if (count)
        oss << "\n" << prefix;

    oss << einfo.msg << "\n";

    out << prefix << chomp(oss.str());

    return out;
}

void panic(std::string_view msg)
{
    writeToStderr(ANSI_RED "HALT: " ANSI_NORMAL);
    writeToStderr(msg);
    writeToStderr("\n");
    std::terminate();
}

void unreachable(std::source_location loc)
{
    panic(fmt("unexpected condition reached at %s:%d in %s", loc.file_name(), loc.line(), loc.function_name()));
}

} // namespace diskxfer
