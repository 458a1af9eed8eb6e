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

#include "src/flowexpr/functions/registry.h"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "include/flowexpr/utils/status.h"
#include "src/flowexpr/utils/logger.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace functions {
namespace {

absl::Status RegisterBuiltins(Registry& registry) {
  FLOWEXPR_RETURN_IF_ERROR(RegisterStringFunctions(registry));
  FLOWEXPR_RETURN_IF_ERROR(RegisterCollectionFunctions(registry));
  FLOWEXPR_RETURN_IF_ERROR(RegisterMathFunctions(registry));
  FLOWEXPR_RETURN_IF_ERROR(RegisterTransformFunctions(registry));
  FLOWEXPR_RETURN_IF_ERROR(RegisterEncodingFunctions(registry));
  FLOWEXPR_RETURN_IF_ERROR(RegisterDatetimeFunctions(registry));
  FLOWEXPR_RETURN_IF_ERROR(RegisterNetworkFunctions(registry));
  return absl::OkStatus();
}

absl::Status UnknownFunction(absl::string_view name) {
  return EvaluationError(absl::StrCat("Unknown function '", name, "'"));
}

}  // namespace

const lambda::LambdaSandbox& CallContext::lambdas() const {
  return sandbox != nullptr ? *sandbox : lambda::DefaultSandbox();
}

const Registry& Registry::Get() {
  static const Registry* registry = [] {
    auto* builtins = new Registry();
    auto status = RegisterBuiltins(*builtins);
    if (!status.ok()) {
      FLOWEXPR_ERROR("Failed to register builtin functions: %s",
                     status.ToString().c_str());
    }
    return builtins;
  }();
  return *registry;
}

absl::Status Registry::Register(FunctionSpec spec) {
  std::string name = spec.name;
  if (!functions_.emplace(name, std::move(spec)).second) {
    return absl::AlreadyExistsError(
        absl::StrCat("Function '", name, "' is already registered"));
  }
  return absl::OkStatus();
}

const FunctionSpec* Registry::Find(absl::string_view name) const {
  auto it = functions_.find(name);
  return it == functions_.end() ? nullptr : &it->second;
}

std::vector<std::string> Registry::Names() const {
  std::vector<std::string> names;
  names.reserve(functions_.size());
  for (const auto& entry : functions_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

absl::StatusOr<Value> Registry::Call(absl::string_view name, const Args& args,
                                     const CallContext& context) const {
  const FunctionSpec* spec = Find(name);
  if (spec == nullptr) {
    return UnknownFunction(name);
  }
  FLOWEXPR_RETURN_IF_ERROR(CheckArity(*spec, args.size()));
  return spec->fn(args, context);
}

absl::StatusOr<Value> Registry::CallMapped(absl::string_view name,
                                           const Args& args,
                                           const CallContext& context) const {
  const FunctionSpec* spec = Find(name);
  if (spec == nullptr) {
    return UnknownFunction(name);
  }
  FLOWEXPR_RETURN_IF_ERROR(CheckArity(*spec, args.size()));

  bool any_list = false;
  size_t rows = 0;
  for (const auto& arg : args) {
    if (arg.is_list()) {
      rows = any_list ? std::min(rows, arg.as_list().size())
                      : arg.as_list().size();
      any_list = true;
    }
  }
  if (!any_list) {
    FLOWEXPR_ASSIGN_OR_RETURN(Value result, spec->fn(args, context));
    return Value(Value::List{std::move(result)});
  }

  Value::List results;
  results.reserve(rows);
  Args row(args.size());
  for (size_t i = 0; i < rows; ++i) {
    for (size_t j = 0; j < args.size(); ++j) {
      row[j] = args[j].is_list() ? args[j].as_list()[i] : args[j];
    }
    FLOWEXPR_ASSIGN_OR_RETURN(Value result, spec->fn(row, context));
    results.push_back(std::move(result));
  }
  return Value(std::move(results));
}

absl::Status CheckArity(const FunctionSpec& spec, size_t count) {
  if (count < spec.min_args) {
    return EvaluationError(absl::StrCat(
        "Function '", spec.name, "' expects at least ", spec.min_args,
        " argument(s), got ", count));
  }
  if (!spec.variadic && count > spec.max_args) {
    return EvaluationError(absl::StrCat("Function '", spec.name,
                                        "' expects at most ", spec.max_args,
                                        " argument(s), got ", count));
  }
  return absl::OkStatus();
}

}  // namespace functions
}  // namespace flowexpr
