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

#include "include/flowexpr/utils/status.h"

#include "gtest/gtest.h"

namespace flowexpr {
namespace {

TEST(StatusTest, ParseErrorCarriesPosition) {
  auto status = ParseError("Unexpected token '->'", 1, 31,
                           "UnexpectedToken: '->'", "a -> str -> int");
  EXPECT_EQ(absl::StatusCode::kInvalidArgument, status.code());
  EXPECT_TRUE(IsParseError(status));
  EXPECT_FALSE(IsEvaluationError(status));

  auto detail = GetErrorDetail(status);
  ASSERT_TRUE(detail);
  EXPECT_EQ(1, detail->line());
  EXPECT_EQ(31, detail->column());
  EXPECT_EQ("a -> str -> int", detail->expression());
  EXPECT_EQ("UnexpectedToken: '->'", detail->raw_error());
}

TEST(StatusTest, KindsAreDistinguishable) {
  EXPECT_TRUE(IsEvaluationError(EvaluationError("boom")));
  EXPECT_TRUE(IsScriptExecutionError(ScriptExecutionError("division by zero")));
  EXPECT_FALSE(IsScriptExecutionError(EvaluationError("boom")));
  EXPECT_FALSE(IsParseError(absl::InternalError("plain")));
  EXPECT_FALSE(GetErrorDetail(absl::OkStatus()));
}

TEST(StatusTest, WithContextKeepsKind) {
  auto wrapped = WithContext(ScriptExecutionError("division by zero"),
                             "[evaluator] ");
  EXPECT_TRUE(IsScriptExecutionError(wrapped));
  EXPECT_EQ("[evaluator] division by zero", wrapped.message());

  auto plain = WithContext(absl::InternalError("oops"), "ctx: ");
  EXPECT_TRUE(IsEvaluationError(plain));
  EXPECT_EQ("ctx: oops", plain.message());
}

}  // namespace
}  // namespace flowexpr
