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

#include "include/flowexpr/lambda/sandbox.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "include/flowexpr/utils/status.h"

using ::testing::HasSubstr;

namespace flowexpr {
namespace lambda {
namespace {

class SandboxTest : public ::testing::Test {
 protected:
  Value Run(const std::string& source, std::vector<Value> args) {
    auto fn = DefaultSandbox().Compile(source);
    EXPECT_TRUE(fn.ok()) << source << ": " << fn.status();
    if (!fn.ok()) {
      return Value();
    }
    auto result = (*fn)->Call(args);
    EXPECT_TRUE(result.ok()) << source << ": " << result.status();
    return result.ok() ? *result : Value();
  }

  absl::Status CompileFails(const std::string& source) {
    auto fn = DefaultSandbox().Compile(source);
    EXPECT_FALSE(fn.ok()) << source;
    if (fn.ok()) {
      return absl::OkStatus();
    }
    EXPECT_TRUE(IsParseError(fn.status())) << fn.status();
    return fn.status();
  }

  absl::Status CallFails(const std::string& source, std::vector<Value> args) {
    auto fn = DefaultSandbox().Compile(source);
    EXPECT_TRUE(fn.ok()) << fn.status();
    if (!fn.ok()) {
      return fn.status();
    }
    auto result = (*fn)->Call(args);
    EXPECT_FALSE(result.ok()) << source;
    if (result.ok()) {
      return absl::OkStatus();
    }
    EXPECT_TRUE(IsScriptExecutionError(result.status())) << result.status();
    return result.status();
  }
};

TEST_F(SandboxTest, Arithmetic) {
  EXPECT_EQ(Value(3), Run("lambda x: x + 1", {Value(2)}));
  EXPECT_EQ(Value(8), Run("lambda x: x ** 3", {Value(2)}));
  EXPECT_EQ(Value(-4), Run("lambda x: -x ** 2", {Value(2)}));
  EXPECT_EQ(Value(3), Run("lambda x: x // 2", {Value(7)}));
  EXPECT_EQ(Value(3.5), Run("lambda x: x / 2", {Value(7)}));
  EXPECT_EQ(Value(1), Run("lambda x: x % 3", {Value(7)}));
  EXPECT_EQ(Value(14), Run("lambda x, y: x * y", {Value(7), Value(2)}));
}

TEST_F(SandboxTest, ComparisonsChain) {
  EXPECT_EQ(Value(true), Run("lambda x: 1 < x <= 3", {Value(3)}));
  EXPECT_EQ(Value(false), Run("lambda x: 1 < x <= 3", {Value(4)}));
  EXPECT_EQ(Value(true), Run("lambda x: x is None", {Value()}));
  EXPECT_EQ(Value(true), Run("lambda x: 'a' not in x", {Value("bcd")}));
  EXPECT_EQ(Value(true), Run("lambda x: x != 2", {Value(3)}));
}

TEST_F(SandboxTest, BooleanOperatorsReturnOperands) {
  EXPECT_EQ(Value("fallback"),
            Run("lambda x: x or 'fallback'", {Value("")}));
  EXPECT_EQ(Value(0), Run("lambda x: x and 5", {Value(0)}));
  EXPECT_EQ(Value(true), Run("lambda x: not x", {Value(Value::List())}));
}

TEST_F(SandboxTest, ConditionalIsLazy) {
  // The untaken branch would raise a KeyError.
  Value::Map empty;
  EXPECT_EQ(Value("none"),
            Run("lambda d: d['k'] if 'k' in d else 'none'", {Value(empty)}));
}

TEST_F(SandboxTest, SubscriptsAndSlices) {
  Value items(Value::List{Value(1), Value(2), Value(3), Value(4)});
  EXPECT_EQ(Value(4), Run("lambda x: x[-1]", {items}));
  EXPECT_EQ(Value(Value::List{Value(2), Value(3)}),
            Run("lambda x: x[1:3]", {items}));
  EXPECT_EQ(Value("ab"), Run("lambda s: s[:2]", {Value("abc")}));

  Value::Map record;
  record.emplace_back("name", Value("alice"));
  EXPECT_EQ(Value("alice"), Run("lambda r: r['name']", {Value(record)}));
}

TEST_F(SandboxTest, Displays) {
  Value::Map expected;
  expected.emplace_back("a", Value(1));
  expected.emplace_back("b", Value(Value::List{Value(2), Value(3)}));
  EXPECT_EQ(Value(expected), Run("lambda x: {'a': x, 'b': [2, 3]}", {Value(1)}));
  EXPECT_EQ(Value(Value::List{Value(1), Value(2)}),
            Run("lambda x: (x, x + 1)", {Value(1)}));
}

TEST_F(SandboxTest, Builtins) {
  Value items(Value::List{Value(3), Value(1), Value(2)});
  EXPECT_EQ(Value(3), Run("lambda x: len(x)", {items}));
  EXPECT_EQ(Value(2), Run("lambda s: len(s)", {Value("\xc3\xa9t")}));
  EXPECT_EQ(Value(Value::List{Value(1), Value(2), Value(3)}),
            Run("lambda x: sorted(x)", {items}));
  EXPECT_EQ(Value(6), Run("lambda x: sum(x)", {items}));
  EXPECT_EQ(Value(3), Run("lambda x: max(x)", {items}));
  EXPECT_EQ(Value(1), Run("lambda x: min(x)", {items}));
  EXPECT_EQ(Value(5), Run("lambda x: abs(x)", {Value(-5)}));
  EXPECT_EQ(Value("12"), Run("lambda x: str(x)", {Value(12)}));
  EXPECT_EQ(Value(12), Run("lambda x: int(x)", {Value("12")}));
  EXPECT_EQ(Value(true), Run("lambda x: bool(x)", {Value("no")}));
  EXPECT_EQ(Value(true), Run("lambda x: any(x)", {items}));
  EXPECT_EQ(Value(2), Run("lambda x: round(x)", {Value(2.5)}));
}

TEST_F(SandboxTest, JsonPathBuiltin) {
  Value::Map inner;
  inner.emplace_back("b", Value(7));
  Value::Map outer;
  outer.emplace_back("a", Value(inner));
  EXPECT_EQ(Value(7), Run("lambda x: jsonpath('$.a.b', x)", {Value(outer)}));
  EXPECT_EQ(Value(), Run("lambda x: jsonpath('$.missing', x)", {Value(outer)}));
}

TEST_F(SandboxTest, Methods) {
  EXPECT_EQ(Value("ABC"), Run("lambda s: s.upper()", {Value("abc")}));
  EXPECT_EQ(Value("abc"), Run("lambda s: s.strip().lower()", {Value(" ABC ")}));
  EXPECT_EQ(Value(true), Run("lambda s: s.startswith('ab')", {Value("abc")}));
  EXPECT_EQ(Value(Value::List{Value("a"), Value("b")}),
            Run("lambda s: s.split(',')", {Value("a,b")}));
  EXPECT_EQ(Value("a-b"), Run("lambda s: s.replace(',', '-')", {Value("a,b")}));

  Value::Map record;
  record.emplace_back("k", Value(1));
  EXPECT_EQ(Value(1), Run("lambda d: d.get('k')", {Value(record)}));
  EXPECT_EQ(Value(0), Run("lambda d: d.get('x', 0)", {Value(record)}));
  EXPECT_EQ(Value(Value::List{Value("k")}),
            Run("lambda d: d.keys()", {Value(record)}));
  EXPECT_EQ(Value(Value::List{Value(Value::List{Value("k"), Value(1)})}),
            Run("lambda d: d.items()", {Value(record)}));
}

TEST_F(SandboxTest, RejectsNonLambdas) {
  EXPECT_THAT(CompileFails("x + 1").message(),
              HasSubstr("Expression must be a lambda function"));
  CompileFails("lambda x: x +");
  CompileFails("lambda x: x = 1");
  CompileFails("lambda x: lambda y: y");
  CompileFails("lambda x, x: x");
}

TEST_F(SandboxTest, RejectsRestrictedNames) {
  EXPECT_THAT(CompileFails("lambda x: eval(x)").message(),
              HasSubstr("usage of 'eval' is not allowed"));
  EXPECT_THAT(CompileFails("lambda x: os").message(),
              HasSubstr("'os'"));
  EXPECT_THAT(CompileFails("lambda x: x.__class__").message(),
              HasSubstr("dunder"));
  EXPECT_THAT(CompileFails("lambda x: open_file(x)").message(),
              HasSubstr("name 'open_file' is not defined"));
  EXPECT_THAT(CompileFails("lambda x: x.pop()").message(),
              HasSubstr("attribute 'pop' is not allowed"));
  CompileFails("lambda x: x.upper");
  CompileFails(absl::StrCat("lambda x: '", std::string(1000, 'a'), "'"));
}

TEST_F(SandboxTest, AllowedNamesBypassDenylist) {
  SandboxOptions options;
  options.allowed_names.push_back("os");
  auto sandbox = NewRestrictedSandbox(options);
  auto fn = sandbox->Compile("lambda os: os + 1");
  ASSERT_TRUE(fn.ok()) << fn.status();
  EXPECT_EQ(1u, (*fn)->arity());
  auto result = (*fn)->Call({Value(1)});
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(Value(2), *result);
}

TEST_F(SandboxTest, RuntimeFailuresAreScriptErrors) {
  EXPECT_THAT(CallFails("lambda d: d['missing']", {Value(Value::Map())})
                  .message(),
              HasSubstr("KeyError: 'missing'"));
  EXPECT_THAT(CallFails("lambda x: x[5]", {Value(Value::List())}).message(),
              HasSubstr("IndexError"));
  CallFails("lambda x: x + 1", {Value("a")});
  CallFails("lambda x: x.upper()", {Value(1)});
  EXPECT_THAT(CallFails("lambda x: x", {Value(1), Value(2)}).message(),
              HasSubstr("takes 1 positional argument(s) but 2 were given"));
}

TEST_F(SandboxTest, StepBudget) {
  SandboxOptions options;
  options.max_steps = 10;
  auto sandbox = NewRestrictedSandbox(options);
  auto fn = sandbox->Compile("lambda x: sorted(x)");
  ASSERT_TRUE(fn.ok());
  Value::List many(100, Value(1));
  auto result = (*fn)->Call({Value(many)});
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(IsScriptExecutionError(result.status()));
  EXPECT_THAT(result.status().message(), HasSubstr("evaluation steps"));
}

TEST_F(SandboxTest, CompiledLambdaIsReusable) {
  auto fn = DefaultSandbox().Compile("lambda x: x * 2");
  ASSERT_TRUE(fn.ok());
  for (int i = 0; i < 3; ++i) {
    auto result = (*fn)->Call({Value(i)});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(Value(i * 2), *result);
  }
}

}  // namespace
}  // namespace lambda
}  // namespace flowexpr
