#pragma once
///@file

#include "diskxfer/util/types.hh"

#include <functional>

namespace diskxfer {

/**
 * Set up logging and load the configuration files.
 */
void initDiskxfer();

/**
 * Run `fun`, turning exceptions into an error message and an exit
 * status.
 */
int handleExceptions(const std::string & programName, std::function<void()> fun);

/**
 * The argument of option `opt`, which `i` points to. Advances `i`.
 */
std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end);

/**
 * Handle the options every command accepts. Returns false if `*i` is
 * not one of them.
 */
bool parseCommonArg(const std::string & programName, Strings::iterator & i, const Strings::iterator & end);

/**
 * Parse `args`, handing each argument to `parseArg` unless it is a
 * common option. `parseArg` advances the iterator past any option
 * argument it consumes and returns false for unknown arguments.
 */
void parseCmdLine(
    const std::string & programName,
    Strings args,
    std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg);

void printVersion(const std::string & programName);

} // namespace diskxfer
