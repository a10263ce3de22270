#ifndef SANDBOX_RESTRICTIONS_HPP
#define SANDBOX_RESTRICTIONS_HPP

#include <string>
#include <vector>

namespace sandbox {

// The built-in interpreter operations that every sandboxed run disables. The
// set is fixed when the object is built from the startup configuration and
// can never be influenced by request data. The interpreter receives it as a
// single argument, "<flag>=<name><separator><name>...", and is trusted to
// refuse to execute the named built-ins.
class CapabilityRestrictions {
 public:
  static const constexpr char* kDefaultFlag = "--الدوال-المستبعدة";
  static const constexpr char* kDefaultSeparator = "،";

  // Input, environment, prompt, file and directory operations.
  static const std::vector<std::string>& DefaultBuiltins();

  // Throws if a name is empty or contains the separator, or if the flag or
  // the separator are empty.
  explicit CapabilityRestrictions(
      std::vector<std::string> builtins = DefaultBuiltins(),
      std::string flag = kDefaultFlag,
      std::string separator = kDefaultSeparator);

  const std::vector<std::string>& Builtins() const { return builtins_; }

  // Returns the argument to pass to the interpreter, or an empty string if
  // nothing is disabled.
  std::string ToArgument() const;

 private:
  std::vector<std::string> builtins_;
  std::string flag_;
  std::string separator_;
};

}  // namespace sandbox

#endif
