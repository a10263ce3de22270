#ifndef SERVER_STATIC_FILES_HPP
#define SERVER_STATIC_FILES_HPP

#include <string>

#include <kj/common.h>
#include <kj/string.h>

namespace server {

// Maps the path of a request URL (query and fragment are ignored) to a file
// under root. "/" and paths ending in "/" map to index.html. Returns nothing
// if the path is malformed or tries to leave root.
kj::Maybe<std::string> ResolveStaticPath(const std::string& root,
                                         kj::StringPtr url);

// Content type to serve a file with, chosen by its extension.
const char* ContentTypeFor(const std::string& path);

}  // namespace server

#endif
