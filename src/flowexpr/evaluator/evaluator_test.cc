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

#include "include/flowexpr/evaluator/evaluator.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "include/flowexpr/parser/parser.h"
#include "include/flowexpr/utils/status.h"

using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace flowexpr {
namespace evaluator {
namespace {

class EvaluatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto operand = ValueFromJson(R"({
      "ACTIONS": {
        "webhook": {"result": 1, "result_typename": "int"},
        "list_action": {"result": [{"id": 1}, {"id": 2}, {"id": 3}]}
      },
      "INPUTS": {"arg1": 1, "arg2": 2, "names": ["a", "b"],
                 "nested": {"k": "v"}, "order": {"b": 1, "a": 2}},
      "SECRETS": {"my_secret": {"KEY": "s3cr3t"}},
      "ENV": {"environment": "prod"},
      "VARS": {"config": {"region": "us-east-1"}},
      "var": {"x": 10, "item": {"name": "alice"}},
      "TRIGGER": {"event": "push", "count": 3},
      "inputs": {"threshold": 5},
      "steps": {"first": {"result": "done"}}
    })");
    ASSERT_TRUE(operand.ok()) << operand.status();
    operand_ = *operand;
  }

  Value Eval(const std::string& text, bool strict = true) {
    EvaluatorOptions options;
    options.strict = strict;
    auto result = EvaluateExpression(text, operand_, options);
    EXPECT_TRUE(result.ok()) << text << ": " << result.status();
    return result.ok() ? *result : Value();
  }

  absl::Status EvalFails(const std::string& text, bool strict = true) {
    EvaluatorOptions options;
    options.strict = strict;
    auto result = EvaluateExpression(text, operand_, options);
    EXPECT_FALSE(result.ok()) << text << " = " << Repr(*result);
    return result.ok() ? absl::OkStatus() : result.status();
  }

  Value operand_;
};

TEST_F(EvaluatorTest, Literals) {
  EXPECT_EQ(Value("x"), Eval("'x'"));
  EXPECT_EQ(Value("x"), Eval("\"x\""));
  EXPECT_EQ(Value(true), Eval("True"));
  EXPECT_EQ(Value(false), Eval("False"));
  EXPECT_EQ(Value(), Eval("None"));
  EXPECT_EQ(Value(42), Eval("42"));
  EXPECT_TRUE(Eval("42").is_int());
  EXPECT_EQ(Value(3.25), Eval("3.25"));
  EXPECT_TRUE(Eval("1.0").is_double());
}

TEST_F(EvaluatorTest, Contexts) {
  EXPECT_EQ(Value(1), Eval("ACTIONS.webhook.result"));
  EXPECT_EQ(Value("s3cr3t"), Eval("SECRETS.my_secret.KEY"));
  EXPECT_EQ(Value("b"), Eval("INPUTS.names[1]"));
  EXPECT_EQ(Value("v"), Eval("INPUTS.nested['k']"));
  EXPECT_EQ(Value("prod"), Eval("ENV.environment"));
  EXPECT_EQ(Value("us-east-1"), Eval("VARS.config.region"));
  EXPECT_EQ(Value(10), Eval("var.x"));
  EXPECT_EQ(Value("push"), Eval("TRIGGER.event"));
  EXPECT_EQ(Value(5), Eval("inputs.threshold"));
  EXPECT_EQ(Value("done"), Eval("steps.first.result"));
  EXPECT_EQ(Value(Value::List{1, 2, 3}),
            Eval("ACTIONS.list_action.result[*].id"));
}

TEST_F(EvaluatorTest, BareTriggerIsTheWholeSlice) {
  Value trigger = Eval("TRIGGER");
  ASSERT_TRUE(trigger.is_map());
  EXPECT_EQ(Value(3), *trigger.Find("count"));

  Value empty{Value::Map()};
  auto result = EvaluateExpression("TRIGGER", empty, EvaluatorOptions());
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result->is_null());
}

TEST_F(EvaluatorTest, StrictAndLenientResolution) {
  absl::Status status = EvalFails("ACTIONS.missing.result");
  EXPECT_TRUE(IsEvaluationError(status));
  EXPECT_THAT(status.message(),
              HasSubstr("Couldn't resolve expression "
                        "'ACTIONS.missing.result' in the context"));

  EXPECT_EQ(Value(), Eval("ACTIONS.missing.result", false));
  // Missing context slices behave like empty ones.
  Value empty{Value::Map()};
  EvaluatorOptions lenient;
  for (int i = 0; i < 2; ++i) {
    auto result = EvaluateExpression("ENV.anything", empty, lenient);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->is_null());
  }
}

TEST_F(EvaluatorTest, VarsAllowOneKeySegment) {
  absl::Status status = EvalFails("VARS.config.region.extra");
  EXPECT_THAT(status.message(),
              HasSubstr("VARS expressions currently support at most one key "
                        "segment"));
  EXPECT_THAT(status.message(), HasSubstr("with 2 key segments"));
}

TEST_F(EvaluatorTest, TernaryOnlyEvaluatesTakenBranch) {
  EXPECT_EQ(Value("ok"), Eval("'ok' if True else ACTIONS.missing.result"));
  EXPECT_EQ(Value("ok"), Eval("ACTIONS.missing.result if False else 'ok'"));
  EXPECT_EQ(Value(1), Eval("1 if INPUTS.arg2 > INPUTS.arg1 else 2"));
  EvalFails("'ok' if ACTIONS.missing.result else 'no'");
}

TEST_F(EvaluatorTest, LogicalOperatorsEvaluateBothSides) {
  EXPECT_EQ(Value(2), Eval("INPUTS.arg1 && INPUTS.arg2"));
  EXPECT_EQ(Value("x"), Eval("None || 'x'"));
  EvalFails("True || ACTIONS.missing.result");
  EvalFails("False && ACTIONS.missing.result");
}

TEST_F(EvaluatorTest, Operators) {
  EXPECT_EQ(Value(3), Eval("INPUTS.arg1 + INPUTS.arg2"));
  EXPECT_EQ(Value(7), Eval("1 + 2 * 3"));
  EXPECT_EQ(Value(9), Eval("(1 + 2) * 3"));
  EXPECT_EQ(Value(true), Eval("'a' in INPUTS.names"));
  EXPECT_EQ(Value(true), Eval("'c' not in INPUTS.names"));
  EXPECT_EQ(Value(true), Eval("None is None"));
  EXPECT_EQ(Value(false), Eval("!True"));
  EXPECT_EQ(Value(-2), Eval("-INPUTS.arg2"));
}

TEST_F(EvaluatorTest, Displays) {
  EXPECT_EQ(Value(Value::List{1, 2, "a"}), Eval("[1, INPUTS.arg2, 'a']"));
  Value dict = Eval("{'a': 1, 'b': [INPUTS.arg1]}");
  ASSERT_TRUE(dict.is_map());
  EXPECT_EQ(Value(1), *dict.Find("a"));
  EXPECT_EQ(Value(Value::List{1}), *dict.Find("b"));
}

TEST_F(EvaluatorTest, Casts) {
  EXPECT_EQ(Value(1), Eval("int('1')"));
  EXPECT_EQ(Value("1"), Eval("ACTIONS.webhook.result -> str"));
  EXPECT_EQ(Value(true), Eval("bool('TRUE')"));
  EXPECT_EQ(Value(false), Eval("bool('yes')"));
  EXPECT_EQ(Value(2.0), Eval("float(INPUTS.arg2)"));
  EvalFails("int('abc')");
}

TEST_F(EvaluatorTest, DoubleTrailingCastDoesNotParse) {
  absl::Status status = EvalFails("ACTIONS.action_test.bar -> str -> int");
  EXPECT_TRUE(IsParseError(status));
}

TEST_F(EvaluatorTest, Functions) {
  EXPECT_EQ(Value(2), Eval("FN.add(INPUTS.arg1, ACTIONS.webhook.result)"));
  EXPECT_EQ(Value(Value::List{11, 12, 13}), Eval("FN.add.map([1, 2, 3], 10)"));
  EXPECT_EQ(Value(Value::List{"a,b", "c"}),
            Eval("FN.join.map([['a', 'b'], ['c']], [',', ';', '|'])"));
  EXPECT_EQ(Value("ALICE"), Eval("FN.uppercase(var.item.name)"));
  EXPECT_EQ(Value(Value::List{2, 4}),
            Eval("FN.filter([1, 2, 3, 4], 'lambda x: x % 2 == 0')"));

  absl::Status status = EvalFails("FN.does_not_exist(1)");
  EXPECT_THAT(status.message(), HasSubstr("Unknown function 'does_not_exist'"));
}

TEST_F(EvaluatorTest, Indexers) {
  EXPECT_EQ(Value(2), Eval("ACTIONS.list_action.result[1]['id']"));
  EXPECT_EQ(Value("b"), Eval("INPUTS.names[-1]"));
  EXPECT_EQ(Value("I"), Eval("FN.uppercase('hi')[1] -> str"))
      << "indexing happens before the trailing cast";
  EXPECT_THAT(EvalFails("INPUTS.nested['nope']").message(),
              HasSubstr("Key 'nope' not found for mapping access"));
  EXPECT_THAT(EvalFails("INPUTS.names['a']").message(),
              HasSubstr("Sequence indices must be integers, got 'str'"));
  EXPECT_THAT(EvalFails("INPUTS.names[5 + 0]").message(),
              HasSubstr("Sequence index 5 out of range"));
  EXPECT_THAT(EvalFails("INPUTS.arg1[0 + 0]").message(),
              HasSubstr("Object of type 'int' is not indexable"));
}

TEST_F(EvaluatorTest, FailuresShowTheTree) {
  absl::Status status = EvalFails("FN.add(1, 'a')");
  EXPECT_TRUE(IsEvaluationError(status));
  EXPECT_THAT(std::string(status.message()),
              StartsWith("[evaluator] Evaluation failed at node:\n```\n"));
  EXPECT_THAT(status.message(), HasSubstr("Reason: "));
  EXPECT_THAT(status.message(), HasSubstr("function"));
}

TEST_F(EvaluatorTest, LambdaFailuresKeepTheirKind) {
  absl::Status status = EvalFails("FN.map([1, 0], 'lambda x: 1 // x')");
  EXPECT_TRUE(IsScriptExecutionError(status)) << status;
}

TEST_F(EvaluatorTest, OverlyDeepExpressionsAreRejected) {
  std::string text = "1";
  for (int i = 0; i < 30000; ++i) {
    text += "+1";
  }
  EXPECT_TRUE(IsParseError(EvalFails(text)));

  text = "1";
  for (int i = 0; i < 100; ++i) {
    text += "+1";
  }
  EXPECT_EQ(Value(101), Eval(text));
}

TEST_F(EvaluatorTest, Iterators) {
  auto root = parser::Parse("for var.item in INPUTS.names");
  ASSERT_TRUE(root.ok()) << root.status();
  ExprEvaluator evaluator(operand_, EvaluatorOptions());
  auto iterable = evaluator.EvaluateIterable(**root);
  ASSERT_TRUE(iterable.ok()) << iterable.status();
  EXPECT_EQ(".item", iterable->iterator);
  EXPECT_EQ(Value::List({Value("a"), Value("b")}), iterable->collection);

  // Mappings iterate over their keys in document order, strings over their
  // characters.
  auto keys = parser::Parse("for var.k in INPUTS.order");
  ASSERT_TRUE(keys.ok()) << keys.status();
  iterable = evaluator.EvaluateIterable(**keys);
  ASSERT_TRUE(iterable.ok()) << iterable.status();
  EXPECT_EQ(Value::List({Value("b"), Value("a")}), iterable->collection);

  auto nested = parser::Parse("for var.k in INPUTS.nested");
  ASSERT_TRUE(nested.ok()) << nested.status();
  iterable = evaluator.EvaluateIterable(**nested);
  ASSERT_TRUE(iterable.ok()) << iterable.status();
  EXPECT_EQ(Value::List({Value("k")}), iterable->collection);

  auto chars = parser::Parse("for var.c in 'h\xc3\xa9!'");
  ASSERT_TRUE(chars.ok()) << chars.status();
  iterable = evaluator.EvaluateIterable(**chars);
  ASSERT_TRUE(iterable.ok()) << iterable.status();
  EXPECT_EQ(Value::List({Value("h"), Value("\xc3\xa9"), Value("!")}),
            iterable->collection);

  // Iterators do not reduce to a single value.
  EXPECT_FALSE(evaluator.Evaluate(**root).ok());

  auto scalar = parser::Parse("for var.item in INPUTS.arg1");
  ASSERT_TRUE(scalar.ok());
  auto failed = evaluator.EvaluateIterable(**scalar);
  ASSERT_FALSE(failed.ok());
  EXPECT_THAT(failed.status().message(),
              HasSubstr("Invalid iterator collection: 1. Must be an "
                        "iterable."));

  auto plain = parser::Parse("INPUTS.names");
  ASSERT_TRUE(plain.ok());
  EXPECT_FALSE(evaluator.EvaluateIterable(**plain).ok());
}

}  // namespace
}  // namespace evaluator
}  // namespace flowexpr
