#include "util/which.hpp"
#include <unistd.h>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace util {

std::string which(const std::string& cmd) {
  if (cmd.empty()) return "";
  if (cmd.find('/') != std::string::npos) {
    return access(cmd.c_str(), X_OK) == 0 ? cmd : "";
  }
  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");

  for (const std::string& dir : split(path, ':')) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (access(fullpath.c_str(), X_OK) == 0) return fullpath;
  }
  return "";
}

}  // namespace util
