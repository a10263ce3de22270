#include "sandbox/workspace.hpp"

#include <kj/debug.h>
#include <cstring>

#include "util/file.hpp"

namespace sandbox {

namespace {
const constexpr char* kWorkspacePrefix = "exec";
}  // namespace

Workspace::Workspace(const std::string& directory,
                     const std::string& extension, const std::string& code)
    : path_(util::File::CreateUnique(directory, kWorkspacePrefix, extension,
                                     code)) {}

void Workspace::Release() {
  if (released_) return;
  released_ = true;
  int err = util::File::TryRemove(path_);
  if (err != 0) {
    KJ_LOG(WARNING, "Failed to remove workspace", path_.c_str(),
           strerror(err));
  }
}

}  // namespace sandbox
