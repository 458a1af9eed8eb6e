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

#include "src/flowexpr/functions/operators.h"

#include <cmath>
#include <limits>
#include <string>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "include/flowexpr/utils/status.h"

namespace flowexpr {
namespace functions {
namespace {

bool IsNumberLike(const Value& value) {
  return value.is_numeric() || value.is_bool();
}

bool IsIntLike(const Value& value) { return value.is_int() || value.is_bool(); }

int64_t IntOf(const Value& value) {
  return value.is_bool() ? (value.as_bool() ? 1 : 0) : value.as_int();
}

double DoubleOf(const Value& value) {
  return value.is_bool() ? static_cast<double>(IntOf(value))
                         : value.as_double();
}

bool IsNan(const Value& value) {
  return value.is_double() && std::isnan(value.as_double());
}

absl::Status OperatorError(absl::string_view op, const Value& lhs,
                           const Value& rhs, absl::string_view reason) {
  return EvaluationError(absl::StrCat("Error applying operator '", op,
                                      "' to ", Repr(lhs), " and ", Repr(rhs),
                                      ": ", reason));
}

std::string Unsupported(absl::string_view op, const Value& lhs,
                        const Value& rhs) {
  return absl::StrCat("unsupported operand type(s) for ", op, ": '",
                      lhs.type_name(), "' and '", rhs.type_name(), "'");
}

Value Repeat(const Value& sequence, int64_t times) {
  if (sequence.is_string()) {
    std::string out;
    for (int64_t i = 0; i < times; ++i) {
      out.append(sequence.as_string());
    }
    return Value(std::move(out));
  }
  Value::List out;
  for (int64_t i = 0; i < times; ++i) {
    out.insert(out.end(), sequence.as_list().begin(),
               sequence.as_list().end());
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> Add(const Value& lhs, const Value& rhs) {
  if (IsIntLike(lhs) && IsIntLike(rhs)) {
    int64_t out;
    if (!__builtin_add_overflow(IntOf(lhs), IntOf(rhs), &out)) {
      return Value(out);
    }
    return Value(DoubleOf(lhs) + DoubleOf(rhs));
  }
  if (IsNumberLike(lhs) && IsNumberLike(rhs)) {
    return Value(DoubleOf(lhs) + DoubleOf(rhs));
  }
  if (lhs.is_string() && rhs.is_string()) {
    return Value(absl::StrCat(lhs.as_string(), rhs.as_string()));
  }
  if (lhs.is_list() && rhs.is_list()) {
    Value::List out = lhs.as_list();
    out.insert(out.end(), rhs.as_list().begin(), rhs.as_list().end());
    return Value(std::move(out));
  }
  return OperatorError("+", lhs, rhs, Unsupported("+", lhs, rhs));
}

absl::StatusOr<Value> Subtract(const Value& lhs, const Value& rhs) {
  if (IsIntLike(lhs) && IsIntLike(rhs)) {
    int64_t out;
    if (!__builtin_sub_overflow(IntOf(lhs), IntOf(rhs), &out)) {
      return Value(out);
    }
    return Value(DoubleOf(lhs) - DoubleOf(rhs));
  }
  if (IsNumberLike(lhs) && IsNumberLike(rhs)) {
    return Value(DoubleOf(lhs) - DoubleOf(rhs));
  }
  return OperatorError("-", lhs, rhs, Unsupported("-", lhs, rhs));
}

absl::StatusOr<Value> Multiply(const Value& lhs, const Value& rhs) {
  if (IsIntLike(lhs) && IsIntLike(rhs)) {
    int64_t out;
    if (!__builtin_mul_overflow(IntOf(lhs), IntOf(rhs), &out)) {
      return Value(out);
    }
    return Value(DoubleOf(lhs) * DoubleOf(rhs));
  }
  if (IsNumberLike(lhs) && IsNumberLike(rhs)) {
    return Value(DoubleOf(lhs) * DoubleOf(rhs));
  }
  if ((lhs.is_string() || lhs.is_list()) && IsIntLike(rhs)) {
    return Repeat(lhs, IntOf(rhs));
  }
  if (IsIntLike(lhs) && (rhs.is_string() || rhs.is_list())) {
    return Repeat(rhs, IntOf(lhs));
  }
  return OperatorError("*", lhs, rhs, Unsupported("*", lhs, rhs));
}

absl::StatusOr<Value> Divide(const Value& lhs, const Value& rhs) {
  if (!IsNumberLike(lhs) || !IsNumberLike(rhs)) {
    return OperatorError("/", lhs, rhs, Unsupported("/", lhs, rhs));
  }
  if (DoubleOf(rhs) == 0) {
    return OperatorError("/", lhs, rhs, "division by zero");
  }
  return Value(DoubleOf(lhs) / DoubleOf(rhs));
}

absl::StatusOr<Value> FloorDivide(const Value& lhs, const Value& rhs) {
  if (!IsNumberLike(lhs) || !IsNumberLike(rhs)) {
    return OperatorError("//", lhs, rhs, Unsupported("//", lhs, rhs));
  }
  if (DoubleOf(rhs) == 0) {
    return OperatorError("//", lhs, rhs, "integer division or modulo by zero");
  }
  if (IsIntLike(lhs) && IsIntLike(rhs)) {
    int64_t a = IntOf(lhs);
    int64_t b = IntOf(rhs);
    if (a == std::numeric_limits<int64_t>::min() && b == -1) {
      return Value(-static_cast<double>(a));
    }
    int64_t quotient = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
      --quotient;
    }
    return Value(quotient);
  }
  return Value(std::floor(DoubleOf(lhs) / DoubleOf(rhs)));
}

absl::StatusOr<Value> Modulo(const Value& lhs, const Value& rhs) {
  if (!IsNumberLike(lhs) || !IsNumberLike(rhs)) {
    return OperatorError("%", lhs, rhs, Unsupported("%", lhs, rhs));
  }
  if (DoubleOf(rhs) == 0) {
    return OperatorError("%", lhs, rhs, "integer division or modulo by zero");
  }
  if (IsIntLike(lhs) && IsIntLike(rhs)) {
    int64_t a = IntOf(lhs);
    int64_t b = IntOf(rhs);
    if (b == -1) {
      return Value(0);
    }
    int64_t remainder = a % b;
    if (remainder != 0 && ((remainder < 0) != (b < 0))) {
      remainder += b;
    }
    return Value(remainder);
  }
  double b = DoubleOf(rhs);
  double remainder = std::fmod(DoubleOf(lhs), b);
  if (remainder != 0 && ((remainder < 0) != (b < 0))) {
    remainder += b;
  }
  return Value(remainder);
}

absl::StatusOr<Value> Power(const Value& lhs, const Value& rhs) {
  if (!IsNumberLike(lhs) || !IsNumberLike(rhs)) {
    return OperatorError("**", lhs, rhs, Unsupported("**", lhs, rhs));
  }
  if (IsIntLike(lhs) && IsIntLike(rhs) && IntOf(rhs) >= 0) {
    int64_t base = IntOf(lhs);
    int64_t exponent = IntOf(rhs);
    int64_t result = 1;
    bool overflow = false;
    while (exponent > 0 && !overflow) {
      if (exponent & 1) {
        overflow = __builtin_mul_overflow(result, base, &result);
      }
      exponent >>= 1;
      if (exponent > 0 && !overflow) {
        overflow = __builtin_mul_overflow(base, base, &base);
      }
    }
    if (!overflow) {
      return Value(result);
    }
  }
  if (DoubleOf(lhs) == 0 && DoubleOf(rhs) < 0) {
    return OperatorError("**", lhs, rhs,
                         "0.0 cannot be raised to a negative power");
  }
  return Value(std::pow(DoubleOf(lhs), DoubleOf(rhs)));
}

absl::StatusOr<Value> Ordering(absl::string_view op, const Value& lhs,
                               const Value& rhs) {
  if (IsNan(lhs) || IsNan(rhs)) {
    return Value(false);
  }
  auto order = Compare(lhs, rhs);
  if (!order.ok()) {
    return OperatorError(op, lhs, rhs, order.status().message());
  }
  if (op == "<") return Value(*order < 0);
  if (op == "<=") return Value(*order <= 0);
  if (op == ">") return Value(*order > 0);
  return Value(*order >= 0);
}

// Values have no identity of their own: scalars with the same type and value
// are identical, containers never are.
bool Identical(const Value& lhs, const Value& rhs) {
  if (lhs.type() != rhs.type() || lhs.is_list() || lhs.is_map()) {
    return false;
  }
  return lhs == rhs;
}

}  // namespace

absl::StatusOr<Value> ApplyBinary(absl::string_view op, const Value& lhs,
                                  const Value& rhs) {
  if (op == "||") return lhs.truthy() ? lhs : rhs;
  if (op == "&&") return lhs.truthy() ? rhs : lhs;
  if (op == "==") return Value(lhs == rhs);
  if (op == "!=") return Value(lhs != rhs);
  if (op == "<" || op == "<=" || op == ">" || op == ">=") {
    return Ordering(op, lhs, rhs);
  }
  if (op == "+") return Add(lhs, rhs);
  if (op == "-") return Subtract(lhs, rhs);
  if (op == "*") return Multiply(lhs, rhs);
  if (op == "/") return Divide(lhs, rhs);
  if (op == "//") return FloorDivide(lhs, rhs);
  if (op == "%") return Modulo(lhs, rhs);
  if (op == "**") return Power(lhs, rhs);
  if (op == "in" || op == "not in") {
    auto found = Contains(rhs, lhs);
    if (!found.ok()) {
      return OperatorError(op, lhs, rhs, found.status().message());
    }
    return Value(op == "in" ? *found : !*found);
  }
  if (op == "is") return Value(Identical(lhs, rhs));
  if (op == "is not") return Value(!Identical(lhs, rhs));
  return EvaluationError(absl::StrCat("Unknown operator '", op, "'"));
}

absl::StatusOr<Value> ApplyUnary(absl::string_view op, const Value& operand) {
  if (op == "!" || op == "not") {
    return Value(!operand.truthy());
  }
  if (op == "-" || op == "+") {
    if (IsIntLike(operand)) {
      int64_t value = IntOf(operand);
      if (op == "+") return Value(value);
      if (value == std::numeric_limits<int64_t>::min()) {
        return Value(-static_cast<double>(value));
      }
      return Value(-value);
    }
    if (operand.is_double()) {
      return Value(op == "-" ? -operand.as_double() : operand.as_double());
    }
    return EvaluationError(absl::StrCat("Error applying operator '", op,
                                        "' to ", Repr(operand),
                                        ": bad operand type for unary ", op,
                                        ": '", operand.type_name(), "'"));
  }
  return EvaluationError(absl::StrCat("Unknown operator '", op, "'"));
}

absl::StatusOr<bool> Contains(const Value& container, const Value& item) {
  switch (container.type()) {
    case Value::Type::kList:
      for (const auto& element : container.as_list()) {
        if (element == item) {
          return true;
        }
      }
      return false;
    case Value::Type::kMap:
      return item.is_string() && container.Find(item.as_string()) != nullptr;
    case Value::Type::kString:
      if (!item.is_string()) {
        return EvaluationError(
            absl::StrCat("'in <string>' requires string as left operand, not ",
                         item.type_name()));
      }
      return absl::StrContains(container.as_string(), item.as_string());
    default:
      return EvaluationError(absl::StrCat("argument of type '",
                                          container.type_name(),
                                          "' is not iterable"));
  }
}

absl::StatusOr<int> Compare(const Value& lhs, const Value& rhs) {
  if (IsIntLike(lhs) && IsIntLike(rhs)) {
    int64_t a = IntOf(lhs);
    int64_t b = IntOf(rhs);
    return a < b ? -1 : (a > b ? 1 : 0);
  }
  if (IsNumberLike(lhs) && IsNumberLike(rhs)) {
    double a = DoubleOf(lhs);
    double b = DoubleOf(rhs);
    return a < b ? -1 : (a > b ? 1 : 0);
  }
  if (lhs.is_string() && rhs.is_string()) {
    int order = lhs.as_string().compare(rhs.as_string());
    return order < 0 ? -1 : (order > 0 ? 1 : 0);
  }
  if (lhs.is_list() && rhs.is_list()) {
    const auto& a = lhs.as_list();
    const auto& b = rhs.as_list();
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
      if (a[i] == b[i]) {
        continue;
      }
      return Compare(a[i], b[i]);
    }
    return a.size() < b.size() ? -1 : (a.size() > b.size() ? 1 : 0);
  }
  return EvaluationError(absl::StrCat("ordering not supported between '",
                                      lhs.type_name(), "' and '",
                                      rhs.type_name(), "'"));
}

absl::StatusOr<Value> Cast(const Value& value, absl::string_view type_name) {
  if (type_name == "int") {
    if (IsIntLike(value)) {
      return Value(IntOf(value));
    }
    if (value.is_double()) {
      double truncated = std::trunc(value.as_double());
      if (!std::isfinite(truncated) || truncated >= 9.2233720368547758e18 ||
          truncated < -9.2233720368547758e18) {
        return EvaluationError(absl::StrCat("cannot convert float ",
                                            FormatDouble(value.as_double()),
                                            " to integer"));
      }
      return Value(static_cast<int64_t>(truncated));
    }
    if (value.is_string()) {
      int64_t parsed;
      if (!absl::SimpleAtoi(value.as_string(), &parsed)) {
        return EvaluationError(
            absl::StrCat("invalid literal for int() with base 10: ",
                         Repr(value)));
      }
      return Value(parsed);
    }
    return EvaluationError(absl::StrCat(
        "int() argument must be a string or a real number, not '",
        value.type_name(), "'"));
  }
  if (type_name == "float") {
    if (IsNumberLike(value)) {
      return Value(DoubleOf(value));
    }
    if (value.is_string()) {
      double parsed;
      if (!absl::SimpleAtod(value.as_string(), &parsed)) {
        return EvaluationError(absl::StrCat(
            "could not convert string to float: ", Repr(value)));
      }
      return Value(parsed);
    }
    return EvaluationError(absl::StrCat(
        "float() argument must be a string or a real number, not '",
        value.type_name(), "'"));
  }
  if (type_name == "str") {
    return Value(ToString(value));
  }
  if (type_name == "bool") {
    if (value.is_string()) {
      std::string lowered = absl::AsciiStrToLower(value.as_string());
      return Value(lowered == "true" || lowered == "1");
    }
    return Value(value.truthy());
  }
  return EvaluationError(
      absl::StrCat("Unknown type '", type_name, "' for cast operation."));
}

}  // namespace functions
}  // namespace flowexpr
