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

// Functions taking a "lambda x: ..." string, compiled by the sandbox of the
// call context.

#include <algorithm>
#include <memory>

#include "src/flowexpr/functions/args.h"
#include "src/flowexpr/functions/operators.h"
#include "src/flowexpr/functions/registry.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace functions {
namespace {

using Lambda = std::unique_ptr<lambda::CompiledLambda>;

absl::StatusOr<Lambda> CompileArg(const Args& args, size_t index,
                                  absl::string_view function,
                                  const CallContext& context) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string source,
                            StringArg(args, index, function));
  return context.lambdas().Compile(source);
}

// The optional lambda at `index`, or nullptr when absent.
absl::StatusOr<Lambda> OptionalLambda(const Args& args, size_t index,
                                      absl::string_view function,
                                      const CallContext& context) {
  if (index >= args.size() || args[index].is_null()) {
    return Lambda();
  }
  return CompileArg(args, index, function, context);
}

absl::StatusOr<Value> KeyOf(const Lambda& fn, const Value& item) {
  if (!fn) {
    return item;
  }
  return fn->Call({item});
}

absl::StatusOr<Value> Apply(const Args& args, const CallContext& context) {
  FLOWEXPR_ASSIGN_OR_RETURN(Lambda fn, CompileArg(args, 1, "apply", context));
  if (!args[0].is_list()) {
    return fn->Call({args[0]});
  }
  Value::List out;
  for (const auto& item : args[0].as_list()) {
    FLOWEXPR_ASSIGN_OR_RETURN(Value result, fn->Call({item}));
    out.push_back(std::move(result));
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> Map(const Args& args, const CallContext& context) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items, ListArg(args, 0, "map"));
  FLOWEXPR_ASSIGN_OR_RETURN(Lambda fn, CompileArg(args, 1, "map", context));
  Value::List out;
  for (const auto& item : *items) {
    FLOWEXPR_ASSIGN_OR_RETURN(Value result, fn->Call({item}));
    out.push_back(std::move(result));
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> Filter(const Args& args, const CallContext& context) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items,
                            ListArg(args, 0, "filter"));
  FLOWEXPR_ASSIGN_OR_RETURN(Lambda fn, CompileArg(args, 1, "filter", context));
  Value::List out;
  for (const auto& item : *items) {
    FLOWEXPR_ASSIGN_OR_RETURN(Value keep, fn->Call({item}));
    if (keep.truthy()) {
      out.push_back(item);
    }
  }
  return Value(std::move(out));
}

// intersect(items, collection, lambda=None): items, without duplicates, whose
// key is in collection.
absl::StatusOr<Value> Intersect(const Args& args, const CallContext& context) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items,
                            ListArg(args, 0, "intersect"));
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* collection,
                            ListArg(args, 1, "intersect"));
  FLOWEXPR_ASSIGN_OR_RETURN(Lambda fn,
                            OptionalLambda(args, 2, "intersect", context));
  Value::List out;
  for (const auto& item : *items) {
    FLOWEXPR_ASSIGN_OR_RETURN(Value key, KeyOf(fn, item));
    if (std::find(collection->begin(), collection->end(), key) ==
        collection->end()) {
      continue;
    }
    if (std::find(out.begin(), out.end(), item) == out.end()) {
      out.push_back(item);
    }
  }
  return Value(std::move(out));
}

// deduplicate(items, lambda=None): first item per key.
absl::StatusOr<Value> Deduplicate(const Args& args,
                                  const CallContext& context) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items,
                            ListArg(args, 0, "deduplicate"));
  FLOWEXPR_ASSIGN_OR_RETURN(Lambda fn,
                            OptionalLambda(args, 1, "deduplicate", context));
  Value::List seen;
  Value::List out;
  for (const auto& item : *items) {
    FLOWEXPR_ASSIGN_OR_RETURN(Value key, KeyOf(fn, item));
    if (std::find(seen.begin(), seen.end(), key) != seen.end()) {
      continue;
    }
    seen.push_back(std::move(key));
    out.push_back(item);
  }
  return Value(std::move(out));
}

absl::StatusOr<bool> KeyIn(const Args& args, absl::string_view function,
                           const CallContext& context) {
  FLOWEXPR_ASSIGN_OR_RETURN(Lambda fn,
                            OptionalLambda(args, 2, function, context));
  FLOWEXPR_ASSIGN_OR_RETURN(Value key, KeyOf(fn, args[0]));
  return Contains(args[1], key);
}

absl::StatusOr<Value> IsIn(const Args& args, const CallContext& context) {
  FLOWEXPR_ASSIGN_OR_RETURN(bool found, KeyIn(args, "is_in", context));
  return Value(found);
}

absl::StatusOr<Value> NotIn(const Args& args, const CallContext& context) {
  FLOWEXPR_ASSIGN_OR_RETURN(bool found, KeyIn(args, "not_in", context));
  return Value(!found);
}

}  // namespace

absl::Status RegisterTransformFunctions(Registry& registry) {
  const FunctionSpec specs[] = {
      {"apply", &Apply, 2, 2, false},
      {"map", &Map, 2, 2, false},
      {"filter", &Filter, 2, 2, false},
      {"intersect", &Intersect, 2, 3, false},
      {"deduplicate", &Deduplicate, 1, 2, false},
      {"is_in", &IsIn, 2, 3, false},
      {"not_in", &NotIn, 2, 3, false},
  };
  for (const auto& spec : specs) {
    FLOWEXPR_RETURN_IF_ERROR(registry.Register(spec));
  }
  return absl::OkStatus();
}

}  // namespace functions
}  // namespace flowexpr
