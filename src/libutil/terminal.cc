#include "diskxfer/util/terminal.hh"
#include "diskxfer/util/environment-variables.hh"

#include <unistd.h>

namespace diskxfer {

bool isTTY()
{
    static const bool tty = [] {
        if (!isatty(STDERR_FILENO) || getEnv("NO_COLOR"))
            return false;
        auto term = getEnv("TERM");
        return term && *term != "dumb";
    }();
    return tty;
}

/**
 * Length of the escape sequence at the start of `s`, which begins
 * with ESC. Control sequences are ESC '[' parameters intermediates
 * final; anything else is ESC plus at most one byte.
 */
static size_t escapeLength(std::string_view s)
{
    size_t n = 1;
    if (n < s.size() && s[n] == '[') {
        n++;
        while (n < s.size() && s[n] >= 0x20 && s[n] <= 0x3f)
            n++;
        if (n < s.size() && s[n] >= 0x40 && s[n] <= 0x7e)
            n++;
    } else if (n < s.size() && s[n] >= 0x40 && s[n] <= 0x5f)
        n++;
    return n;
}

std::string filterANSIEscapes(std::string_view s, bool filterAll)
{
    std::string res;
    res.reserve(s.size());

    while (!s.empty()) {
        auto next = s.find_first_of("\e\r\a");
        res.append(s.substr(0, next));
        if (next == s.npos)
            break;
        s.remove_prefix(next);

        if (s[0] != '\e') {
            s.remove_prefix(1);
            continue;
        }

        auto escape = s.substr(0, escapeLength(s));
        bool isColour = escape.size() > 2 && escape[1] == '[' && escape.back() == 'm';
        if (isColour && !filterAll)
            res.append(escape);
        s.remove_prefix(escape.size());
    }

    return res;
}

} // namespace diskxfer
