#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled. Commands containing a slash are
// returned as they are if they exist.
// The cache is shared between threads. Once a command is found it is served
// from the cache even if the file is later removed.
// Throws std::runtime_error if PATH is not set.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
