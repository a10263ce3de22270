#include "util/misc.hpp"

#include <cerrno>
#include <cstdlib>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string join(const std::vector<std::string>& pieces,
                 const std::string& delim) {
  std::string out;
  for (size_t i = 0; i < pieces.size(); i++) {
    if (i) out += delim;
    out += pieces[i];
  }
  return out;
}

std::string toValidUtf8(const std::string& s) {
  static const constexpr char* kReplacement = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(s.size());
  const auto* data = reinterpret_cast<const unsigned char*>(s.data());  // NOLINT
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = data[i];
    size_t len = 0;
    uint32_t min = 0;
    if (c < 0x80) {
      out += static_cast<char>(c);
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      min = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      min = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      min = 0x10000;
    }
    bool valid = len != 0 && i + len <= s.size();
    uint32_t cp = len ? c & (0x7F >> len) : 0;
    for (size_t j = 1; valid && j < len; j++) {
      if ((data[i + j] & 0xC0) != 0x80) {
        valid = false;
      } else {
        cp = (cp << 6) | (data[i + j] & 0x3F);
      }
    }
    // Overlong encodings, surrogates and out of range code points.
    if (valid && (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)))
      valid = false;
    if (!valid) {
      out += kReplacement;
      i++;
      continue;
    }
    out.append(s, i, len);
    i += len;
  }
  return out;
}

std::function<kj::MainBuilder::Validity()> setBool(bool& var) {
  return [&var]() -> kj::MainBuilder::Validity {
    var = true;
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string& var) {
  return [&var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    var = p.cStr();
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string& var, bool& given) {
  return [&var, &given](kj::StringPtr p) -> kj::MainBuilder::Validity {
    var = p.cStr();
    given = true;
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(
    int64_t& var, int64_t min, int64_t max) {
  return [&var, min, max](kj::StringPtr p) -> kj::MainBuilder::Validity {
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(p.cStr(), &end, 10);  // NOLINT
    if (p.size() == 0 || *end != '\0' || errno == ERANGE) {
      return kj::str("not an integer: ", p);
    }
    if (value < min || value > max) {
      return kj::str(p, " is out of range [", min, ", ", max, "]");
    }
    var = value;
    return true;
  };
}

}  // namespace util
