#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// file named cmd in the directories listed in PATH, or an empty string. A cmd
// containing a '/' is returned unchanged if it names an executable file.
// Throws if PATH is not set.
// Successful lookups are cached, unless explicitly disabled; a cached entry is
// dropped when the file it points to is no longer executable.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
