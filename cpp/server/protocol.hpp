#ifndef SERVER_PROTOCOL_HPP
#define SERVER_PROTOCOL_HPP

#include <string>

#include <capnp/compat/json.capnp.h>
#include <kj/string.h>

#include "sandbox/sandbox.hpp"

namespace server {

// True iff value is an object with exactly one member, named "code".
bool IsValidShape(capnp::JsonValue::Reader value);

// Parses the body of an execution request. Returns the source text, or
// nothing if the body is not JSON, does not have the expected shape or the
// code is not a string.
kj::Maybe<std::string> ParseExecuteRequest(kj::StringPtr body);

// Encodes the public part of a result as
// {"exitCode":<int or null>,"stdout":"...","stderr":"..."}.
kj::String EncodeResult(const sandbox::ExecutionResult& result);

}  // namespace server

#endif
