#ifndef SANDBOX_MAIN_HPP
#define SANDBOX_MAIN_HPP
#include <string>

#include <kj/main.h>

namespace sandbox {

// Runs one file the way the server runs a request and prints the result.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::MainBuilder::Validity SetFile(kj::StringPtr file);

  kj::ProcessContext& context;
  std::string source_file;
};
}  // namespace sandbox
#endif
