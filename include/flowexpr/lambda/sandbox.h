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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "include/flowexpr/utils/value.h"

namespace flowexpr {
namespace lambda {

// A lambda that passed every build-time check.
class CompiledLambda {
 public:
  virtual ~CompiledLambda() {}

  virtual size_t arity() const = 0;

  // Runtime failures are ScriptExecutionError statuses.
  virtual absl::StatusOr<Value> Call(const std::vector<Value>& args) const = 0;
};

// Turns "lambda x: ..." source text into something callable. Rejections
// (not a lambda, syntax errors, denied or unknown names) are ParseError
// statuses.
class LambdaSandbox {
 public:
  virtual ~LambdaSandbox() {}

  virtual absl::StatusOr<std::unique_ptr<CompiledLambda>> Compile(
      absl::string_view source) const = 0;
};

struct SandboxOptions {
  // Names exempt from the denylist.
  std::vector<std::string> allowed_names;
  // Evaluation steps one call may take before it is aborted.
  uint32_t max_steps = 100000;
};

// Interpreter for a small, side effect free subset of Python lambda syntax.
// Bodies may use literals, parameters, arithmetic, comparisons, boolean
// logic, conditional expressions, subscripts, list and dict displays, the
// builtins len str int float bool abs min max sum sorted round jsonpath and
// the methods upper lower strip startswith endswith get keys values items
// split replace. Nothing else is reachable.
std::unique_ptr<LambdaSandbox> NewRestrictedSandbox(SandboxOptions options);

// Process wide sandbox with default options.
const LambdaSandbox& DefaultSandbox();

}  // namespace lambda
}  // namespace flowexpr
