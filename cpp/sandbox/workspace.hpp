#ifndef SANDBOX_WORKSPACE_HPP
#define SANDBOX_WORKSPACE_HPP

#include <string>

#include <kj/common.h>

namespace sandbox {

// The file holding the source text of one execution. The constructor writes
// the file under a name unique to this execution, and throws
// std::system_error if it cannot be written completely. The file is removed
// by Release or, at the latest, on destruction. Removal failures are logged
// and never thrown.
class Workspace {
 public:
  Workspace(const std::string& directory, const std::string& extension,
            const std::string& code);
  ~Workspace() { Release(); }
  KJ_DISALLOW_COPY(Workspace);

  const std::string& Path() const { return path_; }

  // Removes the file. Only the first call has an effect.
  void Release();

 private:
  std::string path_;
  bool released_ = false;
};

}  // namespace sandbox

#endif
