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

#include "include/flowexpr/parser/parser.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "include/flowexpr/utils/status.h"
#include "src/flowexpr/parser/lexer.h"

using ::testing::HasSubstr;

namespace flowexpr {
namespace parser {
namespace {

class ParserTest : public ::testing::Test {
 protected:
  const Node& ParseOk(const std::string& text) {
    auto tree = Parse(text);
    EXPECT_TRUE(tree.ok()) << text << ": " << tree.status();
    if (!tree.ok()) {
      tree_.reset(new Node(NodeKind::kRoot, ""));
      tree_->children.emplace_back(new Node(NodeKind::kLiteral, ""));
    } else {
      tree_ = std::move(tree).value();
    }
    EXPECT_EQ(NodeKind::kRoot, tree_->kind);
    return tree_->child(0);
  }

  absl::Status ParseFails(const std::string& text) {
    auto tree = Parse(text);
    EXPECT_FALSE(tree.ok()) << text;
    if (tree.ok()) {
      return absl::OkStatus();
    }
    EXPECT_TRUE(IsParseError(tree.status())) << tree.status();
    return tree.status();
  }

  std::unique_ptr<Node> tree_;
};

TEST(LexerTest, SplitsTokens) {
  auto tokens = Tokenize("FN.add.map(INPUTS.x, 'a\\'b') -> int");
  ASSERT_TRUE(tokens.ok());
  std::vector<std::string> texts;
  for (const auto& token : *tokens) {
    texts.push_back(token.text);
  }
  EXPECT_THAT(texts,
              ::testing::ElementsAre("FN", ".", "add", ".", "map", "(",
                                     "INPUTS", ".", "x", ",", "'a\\'b'", ")",
                                     "->", "int", ""));
  EXPECT_EQ("a'b", (*tokens)[10].str);
  EXPECT_EQ(TokenType::kEnd, tokens->back().type);
}

TEST(LexerTest, NumbersAreIntUnlessDotted) {
  auto tokens = Tokenize("5 5.0 5000");
  ASSERT_TRUE(tokens.ok());
  EXPECT_EQ(TokenType::kInteger, (*tokens)[0].type);
  EXPECT_EQ(TokenType::kFloat, (*tokens)[1].type);
  EXPECT_EQ(TokenType::kInteger, (*tokens)[2].type);
}

TEST(LexerTest, TracksLinesAndColumns) {
  auto tokens = Tokenize("1 +\n  2");
  ASSERT_TRUE(tokens.ok());
  EXPECT_EQ(2, (*tokens)[2].line);
  EXPECT_EQ(3, (*tokens)[2].column);
}

TEST_F(ParserTest, ContextPaths) {
  const Node& actions = ParseOk("ACTIONS.webhook.result[0]['a.b'][*]");
  EXPECT_EQ(NodeKind::kActions, actions.kind);
  EXPECT_EQ(".webhook.result[0]['a.b'][*]", actions.path());
  ASSERT_EQ(5u, actions.path_size());
  const Node& path = actions.child(0);
  EXPECT_EQ(SegmentKind::kAttribute, path.child(0).segment);
  EXPECT_EQ(Value("webhook"), path.child(0).value);
  EXPECT_EQ(SegmentKind::kIndex, path.child(2).segment);
  EXPECT_EQ(Value(0), path.child(2).value);
  EXPECT_EQ(SegmentKind::kQuotedKey, path.child(3).segment);
  EXPECT_EQ(Value("a.b"), path.child(3).value);
  EXPECT_EQ(SegmentKind::kWildcard, path.child(4).segment);

  EXPECT_EQ(NodeKind::kInputs, ParseOk("INPUTS.arg1").kind);
  EXPECT_EQ(NodeKind::kEnv, ParseOk("ENV.item").kind);
  EXPECT_EQ(NodeKind::kVars, ParseOk("VARS.api.url").kind);
  EXPECT_EQ(NodeKind::kLocalVars, ParseOk("var.x").kind);
  EXPECT_EQ(NodeKind::kTemplateActionInputs, ParseOk("inputs.name").kind);
  EXPECT_EQ(NodeKind::kTemplateActionSteps, ParseOk("steps.a.result").kind);
  EXPECT_EQ(NodeKind::kSecrets, ParseOk("SECRETS.my_secret.KEY").kind);
}

TEST_F(ParserTest, BareTrigger) {
  const Node& trigger = ParseOk("TRIGGER");
  EXPECT_EQ(NodeKind::kTrigger, trigger.kind);
  EXPECT_EQ("", trigger.path());
  EXPECT_EQ(".data", ParseOk("TRIGGER.data").path());
}

TEST_F(ParserTest, Literals) {
  EXPECT_EQ(Value("hello"), ParseOk("'hello'").value);
  EXPECT_EQ(Value("hello"), ParseOk("\"hello\"").value);
  EXPECT_EQ(Value(true), ParseOk("True").value);
  EXPECT_EQ(Value(false), ParseOk("False").value);
  EXPECT_TRUE(ParseOk("None").value.is_null());
  EXPECT_TRUE(ParseOk("5").value.is_int());
  EXPECT_TRUE(ParseOk("5.0").value.is_double());
  EXPECT_EQ(Value("500"), ParseOk("'500'").value);
}

TEST_F(ParserTest, FunctionCalls) {
  const Node& fn = ParseOk("FN.add(1, INPUTS.x)");
  EXPECT_EQ(NodeKind::kFunction, fn.kind);
  EXPECT_EQ("add", fn.text);
  ASSERT_EQ(NodeKind::kArgList, fn.child(0).kind);
  EXPECT_EQ(2u, fn.child(0).children.size());

  const Node& mapped = ParseOk("FN.add.map([1, 2, 3], 10)");
  EXPECT_EQ("add.map", mapped.text);

  const Node& empty = ParseOk("FN.now()");
  EXPECT_TRUE(empty.child(0).children.empty());
}

TEST_F(ParserTest, TernaryChildrenOrder) {
  const Node& ternary = ParseOk("'ok' if True else ACTIONS.missing.result");
  ASSERT_EQ(NodeKind::kTernary, ternary.kind);
  ASSERT_EQ(3u, ternary.children.size());
  EXPECT_EQ(Value("ok"), ternary.child(0).value);
  EXPECT_EQ(Value(true), ternary.child(1).value);
  EXPECT_EQ(NodeKind::kActions, ternary.child(2).kind);
}

TEST_F(ParserTest, OperatorPrecedence) {
  const Node& sum = ParseOk("1 + 2 * 3");
  ASSERT_EQ(NodeKind::kBinaryOp, sum.kind);
  EXPECT_EQ("+", sum.text);
  EXPECT_EQ("*", sum.child(1).text);

  const Node& logic = ParseOk("1 < 2 && 3 > 4 || !True");
  EXPECT_EQ("||", logic.text);
  EXPECT_EQ("&&", logic.child(0).text);
  EXPECT_EQ(NodeKind::kUnaryOp, logic.child(1).kind);

  EXPECT_EQ("not in", ParseOk("'a' not in INPUTS.items").text);
  EXPECT_EQ("is not", ParseOk("INPUTS.x is not None").text);
  EXPECT_EQ("in", ParseOk("'a' in ['a']").text);

  const Node& negative = ParseOk("-5");
  EXPECT_EQ(NodeKind::kUnaryOp, negative.kind);
  EXPECT_EQ("-", negative.text);
}

TEST_F(ParserTest, Casts) {
  const Node& trailing = ParseOk("ACTIONS.action_test.bar -> str");
  EXPECT_EQ(NodeKind::kTrailingTypecast, trailing.kind);
  EXPECT_EQ("str", trailing.text);

  const Node& cast = ParseOk("bool(1)");
  EXPECT_EQ(NodeKind::kTypecast, cast.kind);
  EXPECT_EQ("bool", cast.text);
}

TEST_F(ParserTest, Collections) {
  const Node& list = ParseOk("[1, 'two', [3]]");
  EXPECT_EQ(NodeKind::kList, list.kind);
  EXPECT_EQ(3u, list.children.size());

  const Node& dict = ParseOk("{'a': 1, 'b': INPUTS.x}");
  EXPECT_EQ(NodeKind::kDict, dict.kind);
  ASSERT_EQ(2u, dict.children.size());
  EXPECT_EQ(NodeKind::kKvPair, dict.child(0).kind);

  EXPECT_TRUE(ParseOk("[]").children.empty());
  EXPECT_TRUE(ParseOk("{}").children.empty());
}

TEST_F(ParserTest, PostfixIndexers) {
  const Node& indexed = ParseOk("FN.split('a,b', ',')[0]");
  EXPECT_EQ(NodeKind::kIndexer, indexed.kind);
  EXPECT_EQ(NodeKind::kFunction, indexed.child(0).kind);

  // A dynamic index is not part of the path.
  const Node& dynamic = ParseOk("INPUTS.list[INPUTS.i]");
  EXPECT_EQ(NodeKind::kIndexer, dynamic.kind);
  EXPECT_EQ(".list", dynamic.child(0).path());

  const Node& negative = ParseOk("INPUTS.list[-1]");
  EXPECT_EQ(NodeKind::kIndexer, negative.kind);
}

TEST_F(ParserTest, Iterator) {
  const Node& iterator = ParseOk("for var.item in INPUTS.list");
  ASSERT_EQ(NodeKind::kIterator, iterator.kind);
  EXPECT_EQ(NodeKind::kLocalVarsAssignment, iterator.child(0).kind);
  EXPECT_EQ(".item", iterator.child(0).path());
  EXPECT_EQ(NodeKind::kInputs, iterator.child(1).kind);

  auto status = ParseFails("for item.x in INPUTS.list");
  EXPECT_THAT(std::string(status.message()),
              HasSubstr("Please use `var.your.variable`"));
}

TEST_F(ParserTest, WhitespaceAroundExpression) {
  EXPECT_EQ(NodeKind::kActions, ParseOk("       ACTIONS.action_test.baz    ").kind);
  EXPECT_EQ(NodeKind::kFunction, ParseOk("  FN.is_null(None)   ").kind);
}

TEST_F(ParserTest, DoubleTrailingCastFails) {
  auto status = ParseFails("ACTIONS.action_test.bar -> str -> int");
  EXPECT_THAT(std::string(status.message()),
              HasSubstr("Unexpected token '->' at line 1, column 32"));
  auto detail = GetErrorDetail(status);
  ASSERT_TRUE(detail);
  EXPECT_EQ(1, detail->line());
  EXPECT_EQ(32, detail->column());
  EXPECT_EQ("ACTIONS.action_test.bar -> str -> int", detail->expression());
  EXPECT_THAT(detail->raw_error(), HasSubstr("Expected one of"));
}

TEST_F(ParserTest, ErrorKinds) {
  EXPECT_THAT(std::string(ParseFails("ACTIONS.a @ 1").message()),
              HasSubstr("Unexpected character '@'"));
  EXPECT_THAT(std::string(ParseFails("FN.add(1, ").message()),
              HasSubstr("Unexpected end of expression"));
  EXPECT_THAT(std::string(ParseFails("'unterminated").message()),
              HasSubstr("Unexpected end of expression"));
  EXPECT_THAT(std::string(ParseFails("1 2").message()),
              HasSubstr("Unexpected token '2'"));
  EXPECT_THAT(std::string(ParseFails("unknown.path").message()),
              HasSubstr("Unexpected token 'unknown'"));
  ParseFails("ACTIONS");
  ParseFails("ACTIONS. foo");
  ParseFails("FN . add(1)");
  ParseFails("1 < 2 < 3");
  ParseFails("x -> unknown_type");
}

TEST_F(ParserTest, TreeHeightIsBounded) {
  std::string sum = "1";
  std::string product = "2";
  std::string indexed = "INPUTS.list";
  for (int i = 0; i < 30000; ++i) {
    sum += "+1";
    product += "*2";
    indexed += "[0]";
  }
  const std::string expressions[] = {
      sum,
      product,
      indexed,
      std::string(30000, '-') + "1",
      std::string(30000, '!') + "True",
      std::string(30000, '(') + "1" + std::string(30000, ')'),
  };
  for (const auto& text : expressions) {
    EXPECT_THAT(std::string(ParseFails(text).message()),
                HasSubstr("nested too deeply"));
  }

  // Moderate chains still parse.
  std::string short_sum = "1";
  for (int i = 0; i < 50; ++i) {
    short_sum += " + 1";
  }
  EXPECT_EQ(NodeKind::kBinaryOp, ParseOk(short_sum).kind);
  EXPECT_EQ(NodeKind::kUnaryOp, ParseOk("- - - 1").kind);
}

TEST_F(ParserTest, SecretNeedsTwoSegments) {
  for (const char* text :
       {"SECRETS.KEY", "SECRETS.a.b.c", "SECRETS.a[0]"}) {
    auto status = ParseFails(text);
    EXPECT_THAT(std::string(status.message()),
                HasSubstr("SECRETS.my_secret.KEY"))
        << text;
  }
}

TEST_F(ParserTest, PrettyPrintsTree) {
  const Node& node = ParseOk("FN.add(INPUTS.x, 1)");
  EXPECT_EQ(
      "function\tadd\n"
      "  arg_list\n"
      "    inputs\tINPUTS\n"
      "      jsonpath\t.x\n"
      "    literal\t1\n",
      node.Pretty());
}

}  // namespace
}  // namespace parser
}  // namespace flowexpr
