#include "value.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include "internal/util/errors.hpp"

namespace sitestore::kv {

Value MakeNull() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

Value MakeString(std::string s) {
  Value v;
  v.set_string_value(std::move(s));
  return v;
}

Value MakeNumber(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value MakeBool(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

Value MakeObject(std::initializer_list<std::pair<std::string, Value>> fields) {
  Value v;
  auto* object = v.mutable_struct_value()->mutable_fields();
  for (const auto& [name, field] : fields) {
    (*object)[name] = field;
  }
  return v;
}

const Value* FindField(const Value& object, const std::string& name) {
  if (object.kind_case() != Value::kStructValue) return nullptr;
  const auto& fields = object.struct_value().fields();
  auto        it     = fields.find(name);
  if (it == fields.end()) return nullptr;
  return &it->second;
}

std::optional<std::string> GetString(const Value& object, const std::string& name) {
  const auto* field = FindField(object, name);
  if (!field || field->kind_case() != Value::kStringValue) return std::nullopt;
  return field->string_value();
}

std::optional<double> GetNumber(const Value& object, const std::string& name) {
  const auto* field = FindField(object, name);
  if (!field || field->kind_case() != Value::kNumberValue) return std::nullopt;
  return field->number_value();
}

bool Equals(const Value& a, const Value& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

std::string ToJson(const Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw util::BackendError("encode value: " + status.ToString());
  }
  return json;
}

Value FromJson(const std::string& json) {
  Value value;
  auto  status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw util::BackendError("decode stored value: " + status.ToString());
  }
  return value;
}

} // namespace sitestore::kv
