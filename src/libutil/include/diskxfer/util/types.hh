#pragma once
///@file

#include <cstdint>
#include <list>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace diskxfer {

typedef std::list<std::string> Strings;
typedef std::set<std::string> StringSet;
typedef std::map<std::string, std::string> StringMap;

/**
 * Paths are just strings.
 */
typedef std::string Path;
typedef std::string_view PathView;

/**
 * HTTP header name/value pairs, in the order they were received.
 */
typedef std::vector<std::pair<std::string, std::string>> Headers;

} // namespace diskxfer
