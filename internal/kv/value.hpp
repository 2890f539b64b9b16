#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

#include <google/protobuf/struct.pb.h>

namespace sitestore::kv {

/*
  Stored value: JSON-equivalent tagged union
  (null | number | string | bool | object | list, recursively).

  Values cross the storage edge as JSON text.
*/
using Value = google::protobuf::Value;

Value MakeNull();
Value MakeString(std::string s);
Value MakeNumber(double n);
Value MakeBool(bool b);
Value MakeObject(std::initializer_list<std::pair<std::string, Value>> fields);

// Field access on object values; nullopt when the value is not an object,
// the field is missing, or it holds another kind.
const Value*               FindField(const Value& object, const std::string& name);
std::optional<std::string> GetString(const Value& object, const std::string& name);
std::optional<double>      GetNumber(const Value& object, const std::string& name);

bool Equals(const Value& a, const Value& b);

// Both throw util::BackendError; a stored value that does not decode is backend corruption.
std::string ToJson(const Value& value);
Value       FromJson(const std::string& json);

} // namespace sitestore::kv
