#pragma once
/**
 * @file
 *
 * Utilities for working with the current process's environment
 * variables.
 */

#include <optional>

#include "diskxfer/util/types.hh"

namespace diskxfer {

/**
 * @return an environment variable.
 */
std::optional<std::string> getEnv(const std::string & key);

/**
 * Like `getEnv`, but using `std::nullopt` for the empty string.
 */
std::optional<std::string> getEnvNonEmpty(const std::string & key);

} // namespace diskxfer
