#include "sandbox/restrictions.hpp"

#include <kj/debug.h>

#include "util/misc.hpp"

namespace sandbox {

const std::vector<std::string>& CapabilityRestrictions::DefaultBuiltins() {
  static const std::vector<std::string> builtins = {
      "المدخلات", "البيئة",   "أدخل",  "أنشئ", "أنشئ_مجلد", "إفتح",
      "إقرأ",     "إقرأ_مجلد", "إكتب", "إنقل", "إحذف",      "إحذف_مجلد",
  };
  return builtins;
}

CapabilityRestrictions::CapabilityRestrictions(std::vector<std::string> builtins,
                                               std::string flag,
                                               std::string separator)
    : builtins_(std::move(builtins)),
      flag_(std::move(flag)),
      separator_(std::move(separator)) {
  KJ_REQUIRE(!flag_.empty(), "the disabled built-ins flag cannot be empty");
  KJ_REQUIRE(!separator_.empty(), "the separator cannot be empty");
  for (const std::string& name : builtins_) {
    KJ_REQUIRE(!name.empty(), "empty built-in name");
    KJ_REQUIRE(name.find(separator_) == std::string::npos,
               "built-in name contains the separator", name.c_str(),
               separator_.c_str());
  }
}

std::string CapabilityRestrictions::ToArgument() const {
  if (builtins_.empty()) return "";
  return flag_ + "=" + util::join(builtins_, separator_);
}

}  // namespace sandbox
