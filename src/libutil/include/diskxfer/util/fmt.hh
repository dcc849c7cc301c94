#pragma once
///@file

#include <boost/format.hpp>
#include <string>

#include "diskxfer/util/ansicolor.hh"

namespace diskxfer {

/**
 * `formatHelper(f, a, b)` is `f % a % b`.
 */
template<class F>
inline void formatHelper(F & f)
{
}

template<class F, typename T, typename... Args>
inline void formatHelper(F & f, const T & x, const Args &... args)
{
    formatHelper(f % x, args...);
}

/**
 * A wrong number of arguments is tolerated, so that a bad message
 * never hides the error it was meant to report.
 */
inline void setExceptions(boost::format & f)
{
    f.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * Format with `boost::format` syntax (`%s`, `%d`, `%1%`). A single
 * argument is returned as is, so a stray `%` in a path or device name
 * cannot be taken for a placeholder.
 */
inline std::string fmt(const std::string & s)
{
    return s;
}

inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

inline std::string fmt(const char * s)
{
    return s;
}

template<typename... Args>
inline std::string fmt(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    formatHelper(f, args...);
    return f.str();
}

/**
 * Highlights an interpolated value in an error or log message.
 */
template<class T>
struct Magenta
{
    Magenta(const T & s)
        : value(s)
    {
    }

    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Magenta<T> & y)
{
    return out << ANSI_WARNING << y.value << ANSI_NORMAL;
}

/**
 * Opts a value out of highlighting.
 */
template<class T>
struct Uncolored
{
    Uncolored(const T & s)
        : value(s)
    {
    }

    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Uncolored<T> & y)
{
    return out << ANSI_NORMAL << y.value;
}

/**
 * The message of an error: a `boost::format` whose arguments are
 * highlighted unless wrapped in `Uncolored`. The terminal logger
 * strips the colours when standard error is not a terminal.
 */
class HintFmt
{
    boost::format fmt;

public:
    /**
     * A message without placeholders.
     */
    HintFmt(const std::string & literal)
        : HintFmt("%s", Uncolored(literal))
    {
    }

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
        : HintFmt(boost::format(format), args...)
    {
    }

    template<typename... Args>
    HintFmt(boost::format && f, const Args &... args)
        : fmt(std::move(f))
    {
        setExceptions(fmt);
        formatHelper(*this, args...);
    }

    HintFmt(const HintFmt &) = default;
    HintFmt & operator=(const HintFmt &) = default;

    template<class T>
    HintFmt & operator%(const T & value)
    {
        fmt % Magenta(value);
        return *this;
    }

    template<class T>
    HintFmt & operator%(const Uncolored<T> & value)
    {
        fmt % value.value;
        return *this;
    }

    std::string str() const
    {
        return fmt.str();
    }
};

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

} // namespace diskxfer
