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

#ifndef FLOWEXPR_FUNCTIONS_REGISTRY_H
#define FLOWEXPR_FUNCTIONS_REGISTRY_H

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "include/flowexpr/lambda/sandbox.h"
#include "include/flowexpr/utils/value.h"

namespace flowexpr {
namespace functions {

using Args = std::vector<Value>;

struct CallContext {
  // Sandbox for the lambda based functions. nullptr selects
  // lambda::DefaultSandbox().
  const lambda::LambdaSandbox* sandbox = nullptr;

  const lambda::LambdaSandbox& lambdas() const;
};

using Function = absl::StatusOr<Value> (*)(const Args& args,
                                           const CallContext& context);

struct FunctionSpec {
  std::string name;
  Function fn;
  size_t min_args;
  // Ignored when variadic.
  size_t max_args;
  bool variadic;
};

// Name to implementation table. The process wide instance returned by Get()
// is filled once and never modified afterwards, so concurrent lookups need
// no locking.
class Registry {
 public:
  Registry() {}

  // Registry holding every builtin.
  static const Registry& Get();

  // Fails with AlreadyExists on a duplicate name.
  absl::Status Register(FunctionSpec spec);

  const FunctionSpec* Find(absl::string_view name) const;

  // Sorted.
  std::vector<std::string> Names() const;

  // Checks the arity and calls the function.
  absl::StatusOr<Value> Call(absl::string_view name, const Args& args,
                             const CallContext& context = CallContext()) const;

  // Broadcast call. Scalar arguments are repeated and list arguments are
  // zipped, stopping at the shortest list; the function is called once per
  // position. Without any list argument the single result is still wrapped
  // in a list.
  absl::StatusOr<Value> CallMapped(
      absl::string_view name, const Args& args,
      const CallContext& context = CallContext()) const;

 private:
  absl::flat_hash_map<std::string, FunctionSpec> functions_;
};

// Evaluation error when `count` arguments do not fit `spec`.
absl::Status CheckArity(const FunctionSpec& spec, size_t count);

// Registration of the builtin groups.
absl::Status RegisterStringFunctions(Registry& registry);
absl::Status RegisterCollectionFunctions(Registry& registry);
absl::Status RegisterMathFunctions(Registry& registry);
absl::Status RegisterTransformFunctions(Registry& registry);
absl::Status RegisterEncodingFunctions(Registry& registry);
absl::Status RegisterDatetimeFunctions(Registry& registry);
absl::Status RegisterNetworkFunctions(Registry& registry);

}  // namespace functions
}  // namespace flowexpr

#endif  // FLOWEXPR_FUNCTIONS_REGISTRY_H
