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

#include "src/flowexpr/functions/args.h"

#include "absl/strings/str_cat.h"
#include "include/flowexpr/utils/status.h"

namespace flowexpr {
namespace functions {

absl::Status ArgTypeError(absl::string_view function, size_t index,
                          absl::string_view expected, const Value& got) {
  return EvaluationError(absl::StrCat(function, "() argument ", index + 1,
                                      " must be ", expected, ", got '",
                                      got.type_name(), "'"));
}

absl::StatusOr<std::string> StringArg(const Args& args, size_t index,
                                      absl::string_view function) {
  const Value& arg = args[index];
  if (!arg.is_string()) {
    return ArgTypeError(function, index, "str", arg);
  }
  return arg.as_string();
}

absl::StatusOr<int64_t> IntArg(const Args& args, size_t index,
                               absl::string_view function) {
  const Value& arg = args[index];
  if (arg.is_bool()) {
    return arg.as_bool() ? 1 : 0;
  }
  if (!arg.is_int()) {
    return ArgTypeError(function, index, "int", arg);
  }
  return arg.as_int();
}

absl::StatusOr<double> NumberArg(const Args& args, size_t index,
                                 absl::string_view function) {
  const Value& arg = args[index];
  if (arg.is_bool()) {
    return arg.as_bool() ? 1.0 : 0.0;
  }
  if (!arg.is_numeric()) {
    return ArgTypeError(function, index, "a number", arg);
  }
  return arg.as_double();
}

absl::StatusOr<const Value::List*> ListArg(const Args& args, size_t index,
                                           absl::string_view function) {
  const Value& arg = args[index];
  if (!arg.is_list()) {
    return ArgTypeError(function, index, "list", arg);
  }
  return &arg.as_list();
}

absl::StatusOr<const Value::Map*> MapArg(const Args& args, size_t index,
                                         absl::string_view function) {
  const Value& arg = args[index];
  if (!arg.is_map()) {
    return ArgTypeError(function, index, "dict", arg);
  }
  return &arg.as_map();
}

const Value& OptionalArg(const Args& args, size_t index,
                         const Value& fallback) {
  return index < args.size() ? args[index] : fallback;
}

}  // namespace functions
}  // namespace flowexpr
