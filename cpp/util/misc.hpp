#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/main.h>
#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

std::string join(const std::vector<std::string>& pieces,
                 const std::string& delim);

// Replaces every invalid UTF-8 sequence with U+FFFD.
std::string toValidUtf8(const std::string& s);

// Callbacks for kj::MainBuilder options.
std::function<kj::MainBuilder::Validity()> setBool(bool& var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string& var);
// Also sets `given` to true, so that an empty value can be told apart from a
// missing option.
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string& var, bool& given);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(
    int64_t& var, int64_t min, int64_t max);

}  // namespace util
#endif
