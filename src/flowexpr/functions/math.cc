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

#include <cmath>

#include "absl/strings/str_cat.h"
#include "include/flowexpr/utils/status.h"
#include "src/flowexpr/functions/args.h"
#include "src/flowexpr/functions/operators.h"
#include "src/flowexpr/functions/registry.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace functions {
namespace {

template <const char* kOperator>
absl::StatusOr<Value> Arithmetic(const Args& args, const CallContext&) {
  return ApplyBinary(kOperator, args[0], args[1]);
}

constexpr char kAdd[] = "+";
constexpr char kSub[] = "-";
constexpr char kMul[] = "*";
constexpr char kDiv[] = "/";
constexpr char kMod[] = "%";
constexpr char kPow[] = "**";

// sum(items, start=0)
absl::StatusOr<Value> Sum(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items, ListArg(args, 0, "sum"));
  Value total = OptionalArg(args, 1, Value(0));
  for (const auto& item : *items) {
    FLOWEXPR_ASSIGN_OR_RETURN(total, ApplyBinary("+", total, item));
  }
  return total;
}

// Either one list argument or several values.
absl::StatusOr<Value> Extreme(const Args& args, absl::string_view function,
                              bool want_max) {
  const Value::List* candidates = &args;
  if (args.size() == 1) {
    FLOWEXPR_ASSIGN_OR_RETURN(candidates, ListArg(args, 0, function));
  }
  if (candidates->empty()) {
    return EvaluationError(
        absl::StrCat(function, "() arg is an empty sequence"));
  }
  const Value* best = &(*candidates)[0];
  for (size_t i = 1; i < candidates->size(); ++i) {
    const Value& candidate = (*candidates)[i];
    FLOWEXPR_ASSIGN_OR_RETURN(int order, Compare(candidate, *best));
    if (want_max ? order > 0 : order < 0) {
      best = &candidate;
    }
  }
  return *best;
}

absl::StatusOr<Value> Min(const Args& args, const CallContext&) {
  return Extreme(args, "min", false);
}

absl::StatusOr<Value> Max(const Args& args, const CallContext&) {
  return Extreme(args, "max", true);
}

absl::StatusOr<Value> Abs(const Args& args, const CallContext&) {
  const Value& value = args[0];
  if (value.is_double()) {
    return Value(std::fabs(value.as_double()));
  }
  FLOWEXPR_ASSIGN_OR_RETURN(int64_t number, IntArg(args, 0, "abs"));
  if (number < 0) {
    return ApplyUnary("-", Value(number));
  }
  return Value(number);
}

// Half to even. Without digits the result is an int.
absl::StatusOr<Value> Round(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(double number, NumberArg(args, 0, "round"));
  if (args.size() < 2 || args[1].is_null()) {
    if (!std::isfinite(number)) {
      return EvaluationError(absl::StrCat("round() cannot convert ",
                                          FormatDouble(number),
                                          " to integer"));
    }
    if (args[0].is_int()) {
      return args[0];
    }
    return Cast(Value(std::nearbyint(number)), "int");
  }
  FLOWEXPR_ASSIGN_OR_RETURN(int64_t digits, IntArg(args, 1, "round"));
  if (args[0].is_int() && digits >= 0) {
    return args[0];
  }
  double scale = std::pow(10.0, static_cast<double>(digits));
  return Value(std::nearbyint(number * scale) / scale);
}

}  // namespace

absl::Status RegisterMathFunctions(Registry& registry) {
  const FunctionSpec specs[] = {
      {"add", &Arithmetic<kAdd>, 2, 2, false},
      {"sub", &Arithmetic<kSub>, 2, 2, false},
      {"mul", &Arithmetic<kMul>, 2, 2, false},
      {"div", &Arithmetic<kDiv>, 2, 2, false},
      {"mod", &Arithmetic<kMod>, 2, 2, false},
      {"pow", &Arithmetic<kPow>, 2, 2, false},
      {"sum", &Sum, 1, 2, false},
      {"min", &Min, 1, 1, true},
      {"max", &Max, 1, 1, true},
      {"abs", &Abs, 1, 1, false},
      {"round", &Round, 1, 2, false},
  };
  for (const auto& spec : specs) {
    FLOWEXPR_RETURN_IF_ERROR(registry.Register(spec));
  }
  return absl::OkStatus();
}

}  // namespace functions
}  // namespace flowexpr
