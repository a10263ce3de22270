#include "server/static_files.hpp"

#include <kj/encoding.h>

#include "util/file.hpp"

namespace server {

namespace {
const constexpr char* kIndex = "index.html";

struct ContentType {
  const char* extension;
  const char* type;
};

const ContentType kContentTypes[] = {
    {".html", "text/html; charset=utf-8"},
    {".htm", "text/html; charset=utf-8"},
    {".js", "text/javascript; charset=utf-8"},
    {".mjs", "text/javascript; charset=utf-8"},
    {".css", "text/css; charset=utf-8"},
    {".json", "application/json"},
    {".svg", "image/svg+xml"},
    {".png", "image/png"},
    {".ico", "image/x-icon"},
    {".wasm", "application/wasm"},
    {".txt", "text/plain; charset=utf-8"},
    {".woff2", "font/woff2"},
};

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}  // namespace

kj::Maybe<std::string> ResolveStaticPath(const std::string& root,
                                         kj::StringPtr url) {
  std::string path(url.begin(), url.size());
  path = path.substr(0, path.find_first_of("?#"));
  if (path.empty() || path[0] != '/') return nullptr;

  std::string result = root;
  bool directory = true;
  size_t pos = 1;
  while (pos <= path.size()) {
    size_t next = path.find('/', pos);
    if (next == std::string::npos) next = path.size();
    std::string raw = path.substr(pos, next - pos);
    pos = next + 1;
    directory = raw.empty();
    if (raw.empty()) continue;
    auto decoded =
        kj::decodeUriComponent(kj::StringPtr(raw.c_str(), raw.size()));
    if (decoded.hadErrors) return nullptr;
    std::string segment(decoded.begin(), decoded.size());
    if (segment == "." || segment == ".." ||
        segment.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
      return nullptr;
    }
    result = util::File::JoinPath(result, segment);
  }
  if (directory) result = util::File::JoinPath(result, kIndex);
  return result;
}

const char* ContentTypeFor(const std::string& path) {
  for (const ContentType& type : kContentTypes) {
    if (EndsWith(path, type.extension)) return type.type;
  }
  return "application/octet-stream";
}

}  // namespace server
