#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Commands that contain a path
// separator are returned unchanged if they name an executable file. Returns an
// empty string if the command cannot be found. Throws if PATH is not set and
// a lookup is needed.
std::string which(const std::string& cmd);

}  // namespace util

#endif
