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

#ifndef FLOWEXPR_UTILS_VALUE_H
#define FLOWEXPR_UTILS_VALUE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/variant.h"

namespace flowexpr {

// Dynamically typed JSON-like value. Operands, literals, function arguments
// and results are all Values.
class Value {
 public:
  enum class Type { kNull, kBool, kInt, kDouble, kString, kList, kMap };

  using List = std::vector<Value>;
  // Insertion ordered. Keys are unique.
  using Map = std::vector<std::pair<std::string, Value>>;

  Value() {}
  Value(std::nullptr_t) {}
  Value(bool value) : data_(value) {}
  Value(int value) : data_(static_cast<int64_t>(value)) {}
  Value(int64_t value) : data_(value) {}
  Value(double value) : data_(value) {}
  Value(const char* value) : data_(std::string(value)) {}
  Value(std::string value) : data_(std::move(value)) {}
  Value(absl::string_view value) : data_(std::string(value)) {}
  Value(List value) : data_(std::move(value)) {}
  Value(Map value) : data_(std::move(value)) {}

  Type type() const { return static_cast<Type>(data_.index()); }

  // Python flavoured names used in user facing messages.
  absl::string_view type_name() const;

  bool is_null() const { return type() == Type::kNull; }
  bool is_bool() const { return type() == Type::kBool; }
  bool is_int() const { return type() == Type::kInt; }
  bool is_double() const { return type() == Type::kDouble; }
  bool is_numeric() const { return is_int() || is_double(); }
  bool is_string() const { return type() == Type::kString; }
  bool is_list() const { return type() == Type::kList; }
  bool is_map() const { return type() == Type::kMap; }

  bool as_bool() const { return absl::get<bool>(data_); }
  int64_t as_int() const { return absl::get<int64_t>(data_); }
  // Valid for both numeric types.
  double as_double() const;
  const std::string& as_string() const { return absl::get<std::string>(data_); }
  const List& as_list() const { return absl::get<List>(data_); }
  const Map& as_map() const { return absl::get<Map>(data_); }
  List& mutable_list() { return absl::get<List>(data_); }
  Map& mutable_map() { return absl::get<Map>(data_); }

  // Map lookup. Returns nullptr when this is not a map or the key is absent.
  const Value* Find(absl::string_view key) const;

  // Replaces an existing key or appends a new one. Turns a null into a map.
  void Set(absl::string_view key, Value value);

  bool truthy() const;

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  absl::variant<absl::monostate, bool, int64_t, double, std::string, List,
                Map>
      data_;
};

// String form used by str() casts and inline template substitution.
std::string ToString(const Value& value);

// Like ToString, but strings are quoted. Used in diagnostics.
std::string Repr(const Value& value);

// Compact (or indented) JSON. Map keys keep insertion order. Non-finite
// doubles are written as null and invalid UTF-8 is replaced.
std::string ValueToJson(const Value& value, bool pretty = false);

// Parses JSON text keeping object key order. Integer literals become exact
// ints (unsigned ones past the int range become floats) and literals with a
// fraction or exponent become floats.
absl::StatusOr<Value> ValueFromJson(absl::string_view json);

// Double formatting with the shortest representation that round-trips,
// always showing a fractional part for finite integral values.
std::string FormatDouble(double value);

}  // namespace flowexpr

#endif  // FLOWEXPR_UTILS_VALUE_H
