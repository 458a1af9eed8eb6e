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

#ifndef FLOWEXPR_FUNCTIONS_OPERATORS_H
#define FLOWEXPR_FUNCTIONS_OPERATORS_H

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "include/flowexpr/utils/value.h"

namespace flowexpr {
namespace functions {

// Binary operators of the expression language plus "//" and "**":
//   || && == != < <= > >= + - * / // % ** in, "not in", is, "is not"
// Arithmetic follows Python: bools count as ints, int op int stays int
// except for "/", "%" takes the sign of the divisor. "+" concatenates
// strings and lists, "*" repeats them. "&&" and "||" return one of their
// operands.
//
// Failures are evaluation errors naming the operator and both operands.
absl::StatusOr<Value> ApplyBinary(absl::string_view op, const Value& lhs,
                                  const Value& rhs);

// "!" (or "not"), "-" and "+".
absl::StatusOr<Value> ApplyUnary(absl::string_view op, const Value& operand);

// Membership as for the "in" operator: element of a list, key of a dict or
// substring of a string.
absl::StatusOr<bool> Contains(const Value& container, const Value& item);

// Three way ordering of numbers, strings and lists. Other combinations are
// an error.
absl::StatusOr<int> Compare(const Value& lhs, const Value& rhs);

// Coerces to int, float, str or bool. Strings cast to bool are true only
// when they read "true" or "1", ignoring case.
absl::StatusOr<Value> Cast(const Value& value, absl::string_view type_name);

}  // namespace functions
}  // namespace flowexpr

#endif  // FLOWEXPR_FUNCTIONS_OPERATORS_H
