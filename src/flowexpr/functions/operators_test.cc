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

#include <cstdint>
#include <limits>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "include/flowexpr/utils/status.h"

using ::testing::HasSubstr;

namespace flowexpr {
namespace functions {
namespace {

Value Apply(absl::string_view op, const Value& lhs, const Value& rhs) {
  auto result = ApplyBinary(op, lhs, rhs);
  EXPECT_TRUE(result.ok()) << op << ": " << result.status();
  return result.ok() ? *result : Value();
}

TEST(OperatorsTest, IntegerArithmeticStaysIntegral) {
  EXPECT_TRUE(Apply("+", Value(2), Value(3)).is_int());
  EXPECT_EQ(Value(5), Apply("+", Value(2), Value(3)));
  EXPECT_EQ(Value(-1), Apply("-", Value(2), Value(3)));
  EXPECT_EQ(Value(6), Apply("*", Value(2), Value(3)));
  EXPECT_EQ(Value(8), Apply("**", Value(2), Value(3)));
  EXPECT_TRUE(Apply("/", Value(6), Value(3)).is_double());
  EXPECT_EQ(Value(2.0), Apply("/", Value(6), Value(3)));
}

TEST(OperatorsTest, FloorDivisionAndModuloFollowTheDivisor) {
  EXPECT_EQ(Value(-4), Apply("//", Value(-7), Value(2)));
  EXPECT_EQ(Value(1), Apply("%", Value(-7), Value(2)));
  EXPECT_EQ(Value(-1), Apply("%", Value(7), Value(-2)));
  EXPECT_EQ(Value(1.5), Apply("%", Value(7.5), Value(2)));
}

TEST(OperatorsTest, BoolsCountAsInts) {
  EXPECT_EQ(Value(2), Apply("+", Value(true), Value(true)));
  EXPECT_EQ(Value(true), Apply("<", Value(false), Value(1)));
  EXPECT_TRUE(Apply("==", Value(true), Value(1)).as_bool());
  EXPECT_TRUE(Apply("==", Value(0.0), Value(false)).as_bool());
  EXPECT_TRUE(Apply("in", Value(1), Value(Value::List{true})).as_bool());
  EXPECT_FALSE(Apply("is", Value(true), Value(1)).as_bool());
}

TEST(OperatorsTest, OverflowPromotesToFloat) {
  Value big(std::numeric_limits<int64_t>::max());
  Value sum = Apply("+", big, Value(1));
  EXPECT_TRUE(sum.is_double());
  EXPECT_TRUE(Apply("**", Value(10), Value(30)).is_double());
}

TEST(OperatorsTest, SequenceOperators) {
  EXPECT_EQ(Value("abcd"), Apply("+", Value("ab"), Value("cd")));
  EXPECT_EQ(Value("abab"), Apply("*", Value("ab"), Value(2)));
  EXPECT_EQ(Value(Value::List{1, 2, 3}),
            Apply("+", Value(Value::List{1}), Value(Value::List{2, 3})));
}

TEST(OperatorsTest, LogicalOperatorsReturnOperands) {
  EXPECT_EQ(Value("x"), Apply("||", Value(""), Value("x")));
  EXPECT_EQ(Value(0), Apply("&&", Value(0), Value("x")));
  EXPECT_EQ(Value("x"), Apply("&&", Value(1), Value("x")));
}

TEST(OperatorsTest, Membership) {
  EXPECT_EQ(Value(true), Apply("in", Value(2), Value(Value::List{1, 2})));
  EXPECT_EQ(Value(true), Apply("in", Value("a"), Value(Value::Map{{"a", 1}})));
  EXPECT_EQ(Value(true), Apply("in", Value("ell"), Value("hello")));
  EXPECT_EQ(Value(true), Apply("not in", Value(3), Value(Value::List{1, 2})));

  auto result = ApplyBinary("in", Value(1), Value(5));
  ASSERT_FALSE(result.ok());
  EXPECT_THAT(result.status().message(),
              HasSubstr("argument of type 'int' is not iterable"));
}

TEST(OperatorsTest, Identity) {
  EXPECT_EQ(Value(true), Apply("is", Value(), Value()));
  EXPECT_EQ(Value(false), Apply("is", Value(1), Value(1.0)));
  EXPECT_EQ(Value(false),
            Apply("is", Value(Value::List{}), Value(Value::List{})));
  EXPECT_EQ(Value(true), Apply("is not", Value(1), Value("1")));
}

TEST(OperatorsTest, ErrorsNameOperatorAndOperands) {
  auto result = ApplyBinary("+", Value(1), Value("a"));
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(IsEvaluationError(result.status()));
  EXPECT_THAT(result.status().message(),
              HasSubstr("Error applying operator '+' to 1 and 'a'"));

  EXPECT_FALSE(ApplyBinary("/", Value(1), Value(0)).ok());
  EXPECT_FALSE(ApplyBinary("//", Value(1), Value(0)).ok());
  EXPECT_FALSE(ApplyBinary("%", Value(1), Value(0)).ok());
  EXPECT_FALSE(ApplyBinary("<", Value(1), Value("a")).ok());
}

TEST(OperatorsTest, Unary) {
  EXPECT_EQ(Value(true), *ApplyUnary("!", Value(0)));
  EXPECT_EQ(Value(-3), *ApplyUnary("-", Value(3)));
  EXPECT_EQ(Value(-1.5), *ApplyUnary("-", Value(1.5)));
  EXPECT_FALSE(ApplyUnary("-", Value("a")).ok());
}

TEST(OperatorsTest, CompareOrdersLists) {
  EXPECT_EQ(-1, *Compare(Value(Value::List{1, 2}), Value(Value::List{1, 3})));
  EXPECT_EQ(1, *Compare(Value(Value::List{1, 2}), Value(Value::List{1})));
  EXPECT_EQ(0, *Compare(Value(1), Value(1.0)));
  EXPECT_EQ(-1, *Compare(Value("a"), Value("b")));
}

TEST(CastTest, Conversions) {
  EXPECT_EQ(Value(42), *Cast(Value("42"), "int"));
  EXPECT_EQ(Value(3), *Cast(Value(3.9), "int"));
  EXPECT_EQ(Value(2.5), *Cast(Value("2.5"), "float"));
  EXPECT_EQ(Value("1.0"), *Cast(Value(1.0), "str"));
  EXPECT_EQ(Value(true), *Cast(Value("TRUE"), "bool"));
  EXPECT_EQ(Value(true), *Cast(Value("1"), "bool"));
  EXPECT_EQ(Value(false), *Cast(Value("yes"), "bool"));
  EXPECT_EQ(Value(true), *Cast(Value(Value::List{0}), "bool"));
}

TEST(CastTest, Failures) {
  EXPECT_FALSE(Cast(Value("4x"), "int").ok());
  EXPECT_FALSE(Cast(Value(Value::List{}), "float").ok());
  auto result = Cast(Value(1), "datetime");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ("Unknown type 'datetime' for cast operation.",
            result.status().message());
}

}  // namespace
}  // namespace functions
}  // namespace flowexpr
