#pragma once
///@file

#include <string>
#include <string_view>

namespace diskxfer {

/**
 * Determine whether ANSI escape sequences are appropriate for the
 * present output: standard error is a terminal, `TERM` is not "dumb"
 * and `NO_COLOR` is not set.
 */
bool isTTY();

/**
 * Drop ANSI escape sequences, carriage returns and bells from a log
 * line. Colour sequences are kept unless `filterAll` is set.
 */
std::string filterANSIEscapes(std::string_view s, bool filterAll = false);

} // namespace diskxfer
