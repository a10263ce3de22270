#include "server/protocol.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

namespace server {

namespace {
const constexpr char* kCodeKey = "code";

capnp::Text::Reader AsText(const std::string& s) {
  return capnp::Text::Reader(s.c_str(), s.size());
}
}  // namespace

bool IsValidShape(capnp::JsonValue::Reader value) {
  if (value.which() != capnp::JsonValue::OBJECT) return false;
  auto fields = value.getObject();
  return fields.size() == 1 && fields[0].getName() == kCodeKey;
}

kj::Maybe<std::string> ParseExecuteRequest(kj::StringPtr body) {
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();
  auto error =
      kj::runCatchingExceptions([&]() { codec.decodeRaw(body, root); });
  KJ_IF_MAYBE(exception, error) {
    KJ_LOG(INFO, "Malformed request body", exception->getDescription());
    return nullptr;
  }
  auto value = root.asReader();
  if (!IsValidShape(value)) return nullptr;
  auto code = value.getObject()[0].getValue();
  if (code.which() != capnp::JsonValue::STRING) return nullptr;
  auto text = code.getString();
  return std::string(text.begin(), text.size());
}

kj::String EncodeResult(const sandbox::ExecutionResult& result) {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();
  auto fields = root.initObject(3);

  fields[0].setName("exitCode");
  auto exit_code = fields[0].initValue();
  KJ_IF_MAYBE(code, result.exit_code) { exit_code.setNumber(*code); }
  else {
    exit_code.setNull();
  }

  fields[1].setName("stdout");
  fields[1].initValue().setString(AsText(result.stdout_data));
  fields[2].setName("stderr");
  fields[2].initValue().setString(AsText(result.stderr_data));

  capnp::JsonCodec codec;
  return codec.encodeRaw(root.asReader());
}

}  // namespace server
