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

#pragma once

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "src/flowexpr/functions/registry.h"

namespace flowexpr {
namespace functions {

// Typed access to positional arguments. A mismatch is an evaluation error
// such as "split() argument 1 must be str, got 'int'". Indices are zero
// based; messages count from one.
absl::Status ArgTypeError(absl::string_view function, size_t index,
                          absl::string_view expected, const Value& got);

absl::StatusOr<std::string> StringArg(const Args& args, size_t index,
                                      absl::string_view function);
// Accepts ints and bools.
absl::StatusOr<int64_t> IntArg(const Args& args, size_t index,
                               absl::string_view function);
// Accepts ints, floats and bools.
absl::StatusOr<double> NumberArg(const Args& args, size_t index,
                                 absl::string_view function);
absl::StatusOr<const Value::List*> ListArg(const Args& args, size_t index,
                                           absl::string_view function);
absl::StatusOr<const Value::Map*> MapArg(const Args& args, size_t index,
                                         absl::string_view function);

// Argument at `index`, or `fallback` when it was not passed.
const Value& OptionalArg(const Args& args, size_t index,
                         const Value& fallback);

}  // namespace functions
}  // namespace flowexpr
