/* Copyright 2024 The flowexpr Authors. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "include/flowexpr/utils/value.h"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>

#include "absl/strings/str_cat.h"
#include "nlohmann/json.hpp"

namespace flowexpr {
namespace {

using Json = ::nlohmann::ordered_json;

// Documents nested deeper than this are rejected rather than converted.
constexpr int kMaxJsonDepth = 512;

Json ToJson(const Value& value) {
  switch (value.type()) {
    case Value::Type::kNull:
      return Json();
    case Value::Type::kBool:
      return Json(value.as_bool());
    case Value::Type::kInt:
      return Json(value.as_int());
    case Value::Type::kDouble:
      return Json(value.as_double());
    case Value::Type::kString:
      return Json(value.as_string());
    case Value::Type::kList: {
      Json out = Json::array();
      for (const auto& item : value.as_list()) {
        out.push_back(ToJson(item));
      }
      return out;
    }
    case Value::Type::kMap: {
      Json out = Json::object();
      for (const auto& entry : value.as_map()) {
        out[entry.first] = ToJson(entry.second);
      }
      return out;
    }
  }
  return Json();
}

std::string DumpScalar(const Json& json) {
  return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

// Single line with ", " and ": " separators.
void AppendCompact(const Json& json, std::string* out) {
  if (json.is_array()) {
    out->push_back('[');
    bool first = true;
    for (const auto& item : json) {
      if (!first) out->append(", ");
      first = false;
      AppendCompact(item, out);
    }
    out->push_back(']');
    return;
  }
  if (json.is_object()) {
    out->push_back('{');
    bool first = true;
    for (const auto& item : json.items()) {
      if (!first) out->append(", ");
      first = false;
      out->append(DumpScalar(Json(item.key())));
      out->append(": ");
      AppendCompact(item.value(), out);
    }
    out->push_back('}');
    return;
  }
  out->append(DumpScalar(json));
}

absl::StatusOr<Value> FromJson(const Json& json, int depth) {
  if (depth > kMaxJsonDepth) {
    return absl::InvalidArgumentError(
        "Invalid JSON: document is nested too deeply");
  }
  switch (json.type()) {
    case Json::value_t::boolean:
      return Value(json.get<bool>());
    case Json::value_t::number_integer:
      return Value(json.get<int64_t>());
    case Json::value_t::number_unsigned: {
      uint64_t number = json.get<uint64_t>();
      if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Value(static_cast<double>(number));
      }
      return Value(static_cast<int64_t>(number));
    }
    case Json::value_t::number_float:
      return Value(json.get<double>());
    case Json::value_t::string:
      return Value(json.get<std::string>());
    case Json::value_t::array: {
      Value::List list;
      list.reserve(json.size());
      for (const auto& item : json) {
        auto converted = FromJson(item, depth + 1);
        if (!converted.ok()) {
          return converted.status();
        }
        list.push_back(*std::move(converted));
      }
      return Value(std::move(list));
    }
    case Json::value_t::object: {
      Value::Map map;
      map.reserve(json.size());
      for (const auto& item : json.items()) {
        auto converted = FromJson(item.value(), depth + 1);
        if (!converted.ok()) {
          return converted.status();
        }
        map.emplace_back(item.key(), *std::move(converted));
      }
      return Value(std::move(map));
    }
    default:
      break;
  }
  return Value();
}

}  // namespace

absl::string_view Value::type_name() const {
  switch (type()) {
    case Type::kNull:
      return "NoneType";
    case Type::kBool:
      return "bool";
    case Type::kInt:
      return "int";
    case Type::kDouble:
      return "float";
    case Type::kString:
      return "str";
    case Type::kList:
      return "list";
    case Type::kMap:
      return "dict";
  }
  return "unknown";
}

double Value::as_double() const {
  if (is_int()) {
    return static_cast<double>(as_int());
  }
  return absl::get<double>(data_);
}

const Value* Value::Find(absl::string_view key) const {
  if (!is_map()) {
    return nullptr;
  }
  for (const auto& entry : as_map()) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

void Value::Set(absl::string_view key, Value value) {
  if (is_null()) {
    data_ = Map();
  }
  Map& map = mutable_map();
  for (auto& entry : map) {
    if (entry.first == key) {
      entry.second = std::move(value);
      return;
    }
  }
  map.emplace_back(std::string(key), std::move(value));
}

bool Value::truthy() const {
  switch (type()) {
    case Type::kNull:
      return false;
    case Type::kBool:
      return as_bool();
    case Type::kInt:
      return as_int() != 0;
    case Type::kDouble:
      return as_double() != 0.0;
    case Type::kString:
      return !as_string().empty();
    case Type::kList:
      return !as_list().empty();
    case Type::kMap:
      return !as_map().empty();
  }
  return false;
}

bool Value::operator==(const Value& other) const {
  // Bools compare as the ints 0 and 1.
  if ((is_numeric() || is_bool()) && (other.is_numeric() || other.is_bool())) {
    if (is_bool() && other.is_bool()) {
      return as_bool() == other.as_bool();
    }
    auto as_integer = [](const Value& v) {
      return v.is_bool() ? static_cast<int64_t>(v.as_bool()) : v.as_int();
    };
    auto as_number = [](const Value& v) {
      return v.is_bool() ? (v.as_bool() ? 1.0 : 0.0) : v.as_double();
    };
    if (!is_double() && !other.is_double()) {
      return as_integer(*this) == as_integer(other);
    }
    return as_number(*this) == as_number(other);
  }
  if (type() != other.type()) {
    return false;
  }
  switch (type()) {
    case Type::kNull:
      return true;
    case Type::kBool:
      return as_bool() == other.as_bool();
    case Type::kString:
      return as_string() == other.as_string();
    case Type::kList:
      return as_list() == other.as_list();
    case Type::kMap: {
      if (as_map().size() != other.as_map().size()) {
        return false;
      }
      for (const auto& entry : as_map()) {
        const Value* found = other.Find(entry.first);
        if (found == nullptr || !(*found == entry.second)) {
          return false;
        }
      }
      return true;
    }
    default:
      break;
  }
  return false;
}

std::string FormatDouble(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value > 0 ? "inf" : "-inf";
  }
  char buffer[32];
  for (int precision = 15; precision <= 17; ++precision) {
    snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
    if (std::strtod(buffer, nullptr) == value) {
      break;
    }
  }
  std::string result(buffer);
  if (result.find_first_of(".e") == std::string::npos) {
    result.append(".0");
  }
  return result;
}

std::string ToString(const Value& value) {
  switch (value.type()) {
    case Value::Type::kNull:
      return "None";
    case Value::Type::kBool:
      return value.as_bool() ? "True" : "False";
    case Value::Type::kInt:
      return absl::StrCat(value.as_int());
    case Value::Type::kDouble:
      return FormatDouble(value.as_double());
    case Value::Type::kString:
      return value.as_string();
    case Value::Type::kList:
    case Value::Type::kMap:
      return ValueToJson(value);
  }
  return "";
}

std::string Repr(const Value& value) {
  if (value.is_string()) {
    return absl::StrCat("'", value.as_string(), "'");
  }
  return ToString(value);
}

std::string ValueToJson(const Value& value, bool pretty) {
  const Json json = ToJson(value);
  if (pretty) {
    return json.dump(2, ' ', false, Json::error_handler_t::replace);
  }
  std::string out;
  AppendCompact(json, &out);
  return out;
}

absl::StatusOr<Value> ValueFromJson(absl::string_view json) {
  // Parse without exceptions; a malformed document comes back discarded.
  const Json parsed = Json::parse(json.begin(), json.end(), nullptr, false);
  if (parsed.is_discarded()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid JSON: cannot parse '", json.substr(0, 64), "'"));
  }
  return FromJson(parsed, 0);
}

}  // namespace flowexpr
