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

#include <cstdlib>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "include/flowexpr/utils/status.h"
#include "src/flowexpr/parser/lexer.h"
#include "src/flowexpr/utils/logger.h"

namespace flowexpr {
namespace parser {

const char kActions[] = "ACTIONS";
const char kSecrets[] = "SECRETS";
const char kInputs[] = "INPUTS";
const char kEnv[] = "ENV";
const char kVars[] = "VARS";
const char kLocalVars[] = "var";
const char kTrigger[] = "TRIGGER";
const char kTemplateActionInputs[] = "inputs";
const char kTemplateActionSteps[] = "steps";
const char kFn[] = "FN";

namespace {

constexpr int kMaxDepth = 200;

const absl::flat_hash_map<std::string, NodeKind>& ContextKeywords() {
  static const auto* keywords = new absl::flat_hash_map<std::string, NodeKind>{
      {kActions, NodeKind::kActions},
      {kSecrets, NodeKind::kSecrets},
      {kInputs, NodeKind::kInputs},
      {kEnv, NodeKind::kEnv},
      {kVars, NodeKind::kVars},
      {kLocalVars, NodeKind::kLocalVars},
      {kTrigger, NodeKind::kTrigger},
      {kTemplateActionInputs, NodeKind::kTemplateActionInputs},
      {kTemplateActionSteps, NodeKind::kTemplateActionSteps},
  };
  return *keywords;
}

bool IsTypeName(const Token& token) {
  return token.type == TokenType::kName &&
         (token.text == "int" || token.text == "float" ||
          token.text == "str" || token.text == "bool");
}

class Parser {
 public:
  Parser(absl::string_view text, std::vector<Token> tokens)
      : text_(text), tokens_(std::move(tokens)) {}

  absl::StatusOr<std::unique_ptr<Node>> ParseRoot() {
    auto root = MakeNode(NodeKind::kRoot, "", Peek());
    std::unique_ptr<Node> body;
    if (Peek().IsName("for")) {
      body = ParseIterator();
    } else {
      body = ParseExpression();
      if (body && Peek().IsSymbol("->")) {
        const Token& arrow = Next();
        if (!IsTypeName(Peek())) {
          return Unexpected(Peek(), "a type name (int, float, str, bool)");
        }
        auto cast = MakeNode(NodeKind::kTrailingTypecast, Next().text, arrow);
        cast->children.push_back(std::move(body));
        body = std::move(cast);
      }
    }
    if (!body) {
      return status_;
    }
    if (Peek().type != TokenType::kEnd) {
      return Unexpected(Peek(), "end of expression");
    }
    root->children.push_back(std::move(body));
    return std::move(root);
  }

 private:
  const Token& Peek(size_t ahead = 0) const {
    size_t index = pos_ + ahead;
    if (index >= tokens_.size()) {
      index = tokens_.size() - 1;
    }
    return tokens_[index];
  }

  const Token& Next() {
    const Token& token = Peek();
    if (pos_ < tokens_.size() - 1) {
      ++pos_;
    }
    return token;
  }

  std::unique_ptr<Node> MakeNode(NodeKind kind, std::string text,
                                 const Token& at) {
    std::unique_ptr<Node> node(new Node(kind, std::move(text)));
    node->line = at.line;
    node->column = at.column;
    return node;
  }

  // Records the first failure. Always returns nullptr so callers can
  // propagate with `return Fail(...)`.
  std::nullptr_t Fail(absl::Status status) {
    if (status_.ok()) {
      status_ = std::move(status);
    }
    return nullptr;
  }

  absl::Status Unexpected(const Token& token, absl::string_view expected) {
    if (!status_.ok()) {
      return status_;
    }
    std::string message;
    std::string raw;
    if (token.type == TokenType::kEnd) {
      message = absl::StrCat("Unexpected end of expression at line ",
                             token.line, ", column ", token.column,
                             ". Expected ", expected, ".");
      raw = absl::StrCat("Unexpected token Token('$END', '') at line ",
                         token.line, ", column ", token.column,
                         ". Expected one of: ", expected);
    } else {
      message = absl::StrCat("Unexpected token ", Describe(token), " at line ",
                             token.line, ", column ", token.column,
                             ". Expected ", expected, ".");
      raw = absl::StrCat("Unexpected token Token('", token.text, "') at line ",
                         token.line, ", column ", token.column,
                         ". Expected one of: ", expected);
    }
    status_ = ParseError(message, token.line, token.column, raw, text_);
    return status_;
  }

  std::nullptr_t FailUnexpected(const Token& token,
                                absl::string_view expected) {
    Unexpected(token, expected);
    return nullptr;
  }

  bool Expect(absl::string_view symbol) {
    if (!Peek().IsSymbol(symbol)) {
      Unexpected(Peek(), absl::StrCat("'", symbol, "'"));
      return false;
    }
    Next();
    return true;
  }

  // for var.x in <expression>
  std::unique_ptr<Node> ParseIterator() {
    const Token& for_token = Next();
    const Token& var_token = Peek();
    if (var_token.type != TokenType::kName) {
      return FailUnexpected(var_token, "an iterator variable");
    }
    Next();
    auto path = ParsePath(var_token);
    if (!path) {
      return nullptr;
    }
    if (var_token.text != kLocalVars || path->children.empty()) {
      return Fail(ParseError(
          absl::StrCat("Invalid iterator variable '", var_token.text,
                       path->text, "'. Please use `var.your.variable`"),
          var_token.line, var_token.column,
          absl::StrCat("Iterator variable must start with '", kLocalVars,
                       ".'"),
          text_));
    }
    auto assignment =
        MakeNode(NodeKind::kLocalVarsAssignment, kLocalVars, var_token);
    assignment->children.push_back(std::move(path));

    if (!Peek().IsName("in")) {
      return FailUnexpected(Peek(), "'in'");
    }
    Next();
    auto collection = ParseExpression();
    if (!collection) {
      return nullptr;
    }
    auto iterator = MakeNode(NodeKind::kIterator, "", for_token);
    iterator->children.push_back(std::move(assignment));
    iterator->children.push_back(std::move(collection));
    return iterator;
  }

  // Counts one more level of tree height. Nesting, unary operators and
  // every operator folded into a left-deep chain each add a level; the walks
  // over the finished tree are recursive, so its height stays bounded.
  bool Descend() {
    if (++depth_ > kMaxDepth) {
      Fail(ParseError("Expression is nested too deeply", Peek().line,
                      Peek().column, "Maximum nesting depth exceeded", text_));
      return false;
    }
    return true;
  }

  // expression := or_expr ("if" or_expr "else" expression)?
  std::unique_ptr<Node> ParseExpression() {
    if (!Descend()) {
      return nullptr;
    }
    auto value = ParseOr();
    if (value && Peek().IsName("if")) {
      const Token& if_token = Next();
      auto condition = ParseOr();
      if (!condition) {
        return nullptr;
      }
      if (!Peek().IsName("else")) {
        return FailUnexpected(Peek(), "'else'");
      }
      Next();
      auto otherwise = ParseExpression();
      if (!otherwise) {
        return nullptr;
      }
      auto ternary = MakeNode(NodeKind::kTernary, "", if_token);
      ternary->line = value->line;
      ternary->column = value->column;
      ternary->children.push_back(std::move(value));
      ternary->children.push_back(std::move(condition));
      ternary->children.push_back(std::move(otherwise));
      value = std::move(ternary);
    }
    --depth_;
    return value;
  }

  std::unique_ptr<Node> Binary(const Token& op, std::unique_ptr<Node> lhs,
                               std::unique_ptr<Node> rhs,
                               std::string op_text) {
    auto node = MakeNode(NodeKind::kBinaryOp, std::move(op_text), op);
    node->line = lhs->line;
    node->column = lhs->column;
    node->children.push_back(std::move(lhs));
    node->children.push_back(std::move(rhs));
    return node;
  }

  std::unique_ptr<Node> ParseOr() {
    int folded = 0;
    auto lhs = ParseAnd();
    while (lhs && Peek().IsSymbol("||")) {
      if (!Descend()) {
        return nullptr;
      }
      ++folded;
      const Token& op = Next();
      auto rhs = ParseAnd();
      if (!rhs) {
        return nullptr;
      }
      lhs = Binary(op, std::move(lhs), std::move(rhs), op.text);
    }
    depth_ -= folded;
    return lhs;
  }

  std::unique_ptr<Node> ParseAnd() {
    int folded = 0;
    auto lhs = ParseNot();
    while (lhs && Peek().IsSymbol("&&")) {
      if (!Descend()) {
        return nullptr;
      }
      ++folded;
      const Token& op = Next();
      auto rhs = ParseNot();
      if (!rhs) {
        return nullptr;
      }
      lhs = Binary(op, std::move(lhs), std::move(rhs), op.text);
    }
    depth_ -= folded;
    return lhs;
  }

  std::unique_ptr<Node> ParseNot() {
    if (Peek().IsSymbol("!") || Peek().IsName("not")) {
      if (!Descend()) {
        return nullptr;
      }
      const Token& op = Next();
      auto operand = ParseNot();
      if (!operand) {
        return nullptr;
      }
      --depth_;
      auto node = MakeNode(NodeKind::kUnaryOp, "!", op);
      node->children.push_back(std::move(operand));
      return node;
    }
    return ParseComparison();
  }

  // Returns the operator at the cursor and how many tokens it spans, or an
  // empty string when there is none.
  std::string ComparisonOperator(size_t* width) const {
    const Token& token = Peek();
    *width = 1;
    if (token.type == TokenType::kSymbol) {
      if (token.text == "==" || token.text == "!=" || token.text == "<" ||
          token.text == "<=" || token.text == ">" || token.text == ">=") {
        return token.text;
      }
      return "";
    }
    if (token.IsName("in")) {
      return "in";
    }
    if (token.IsName("not") && Peek(1).IsName("in")) {
      *width = 2;
      return "not in";
    }
    if (token.IsName("is")) {
      if (Peek(1).IsName("not")) {
        *width = 2;
        return "is not";
      }
      return "is";
    }
    return "";
  }

  std::unique_ptr<Node> ParseComparison() {
    auto lhs = ParseSum();
    if (!lhs) {
      return nullptr;
    }
    size_t width = 0;
    std::string op_text = ComparisonOperator(&width);
    if (op_text.empty()) {
      return lhs;
    }
    const Token& op = Peek();
    for (size_t i = 0; i < width; ++i) {
      Next();
    }
    auto rhs = ParseSum();
    if (!rhs) {
      return nullptr;
    }
    return Binary(op, std::move(lhs), std::move(rhs), op_text);
  }

  std::unique_ptr<Node> ParseSum() {
    int folded = 0;
    auto lhs = ParseTerm();
    while (lhs && (Peek().IsSymbol("+") || Peek().IsSymbol("-"))) {
      if (!Descend()) {
        return nullptr;
      }
      ++folded;
      const Token& op = Next();
      auto rhs = ParseTerm();
      if (!rhs) {
        return nullptr;
      }
      lhs = Binary(op, std::move(lhs), std::move(rhs), op.text);
    }
    depth_ -= folded;
    return lhs;
  }

  std::unique_ptr<Node> ParseTerm() {
    int folded = 0;
    auto lhs = ParseFactor();
    while (lhs && (Peek().IsSymbol("*") || Peek().IsSymbol("/") ||
                   Peek().IsSymbol("%"))) {
      if (!Descend()) {
        return nullptr;
      }
      ++folded;
      const Token& op = Next();
      auto rhs = ParseFactor();
      if (!rhs) {
        return nullptr;
      }
      lhs = Binary(op, std::move(lhs), std::move(rhs), op.text);
    }
    depth_ -= folded;
    return lhs;
  }

  std::unique_ptr<Node> ParseFactor() {
    if (Peek().IsSymbol("-") || Peek().IsSymbol("+")) {
      if (!Descend()) {
        return nullptr;
      }
      const Token& op = Next();
      auto operand = ParseFactor();
      if (!operand) {
        return nullptr;
      }
      --depth_;
      auto node = MakeNode(NodeKind::kUnaryOp, op.text, op);
      node->children.push_back(std::move(operand));
      return node;
    }
    return ParsePrimary();
  }

  // primary := base ("[" expression "]")*
  std::unique_ptr<Node> ParsePrimary() {
    int folded = 0;
    auto base = ParseBase();
    while (base && Peek().IsSymbol("[")) {
      if (!Descend()) {
        return nullptr;
      }
      ++folded;
      const Token& open = Next();
      auto index = ParseExpression();
      if (!index || !Expect("]")) {
        return nullptr;
      }
      auto indexer = MakeNode(NodeKind::kIndexer, "", open);
      indexer->line = base->line;
      indexer->column = base->column;
      indexer->children.push_back(std::move(base));
      indexer->children.push_back(std::move(index));
      base = std::move(indexer);
    }
    depth_ -= folded;
    return base;
  }

  std::unique_ptr<Node> ParseBase() {
    const Token& token = Peek();
    switch (token.type) {
      case TokenType::kString: {
        auto node = MakeNode(NodeKind::kLiteral, token.text, token);
        node->value = Value(token.str);
        Next();
        return node;
      }
      case TokenType::kInteger: {
        auto node = MakeNode(NodeKind::kLiteral, token.text, token);
        int64_t number = 0;
        if (absl::SimpleAtoi(token.text, &number)) {
          node->value = Value(number);
        } else {
          // Out of int64 range.
          node->value = Value(std::strtod(token.text.c_str(), nullptr));
        }
        Next();
        return node;
      }
      case TokenType::kFloat: {
        auto node = MakeNode(NodeKind::kLiteral, token.text, token);
        node->value = Value(std::strtod(token.text.c_str(), nullptr));
        Next();
        return node;
      }
      case TokenType::kSymbol:
        if (token.text == "(") {
          Next();
          auto inner = ParseExpression();
          if (!inner || !Expect(")")) {
            return nullptr;
          }
          auto node = MakeNode(NodeKind::kExpression, "", token);
          node->children.push_back(std::move(inner));
          return node;
        }
        if (token.text == "[") {
          return ParseList();
        }
        if (token.text == "{") {
          return ParseDict();
        }
        return FailUnexpected(token, "an expression");
      case TokenType::kName:
        return ParseName();
      case TokenType::kEnd:
        break;
    }
    return FailUnexpected(token, "an expression");
  }

  std::unique_ptr<Node> ParseName() {
    const Token& token = Peek();
    if (token.text == "True" || token.text == "False") {
      auto node = MakeNode(NodeKind::kLiteral, token.text, token);
      node->value = Value(token.text == "True");
      Next();
      return node;
    }
    if (token.text == "None") {
      auto node = MakeNode(NodeKind::kLiteral, token.text, token);
      Next();
      return node;
    }
    if (IsTypeName(token) && Peek(1).IsSymbol("(")) {
      Next();
      Next();
      auto inner = ParseExpression();
      if (!inner || !Expect(")")) {
        return nullptr;
      }
      auto node = MakeNode(NodeKind::kTypecast, token.text, token);
      node->children.push_back(std::move(inner));
      return node;
    }
    if (token.text == kFn) {
      return ParseFunction();
    }
    auto it = ContextKeywords().find(token.text);
    if (it == ContextKeywords().end()) {
      return FailUnexpected(token, "an expression");
    }
    return ParseContext(it->second);
  }

  std::unique_ptr<Node> ParseContext(NodeKind kind) {
    const Token& keyword = Next();
    auto path = ParsePath(keyword);
    if (!path) {
      return nullptr;
    }
    if (path->children.empty() && kind != NodeKind::kTrigger) {
      return FailUnexpected(Peek(), absl::StrCat("a path after ", keyword.text,
                                                 ", e.g. ", keyword.text,
                                                 ".my_key"));
    }
    if (kind == NodeKind::kSecrets) {
      bool valid = path->children.size() == 2;
      for (const auto& segment : path->children) {
        valid = valid && segment->segment == SegmentKind::kAttribute;
      }
      if (!valid) {
        std::string reference = absl::StrCat(kSecrets, path->text);
        return Fail(ParseError(
            absl::StrCat("Invalid secret reference '", reference,
                         "'. Secrets must be referenced with exactly two "
                         "segments in the format SECRETS.my_secret.KEY"),
            keyword.line, keyword.column,
            absl::StrCat("Expected SECRETS.<name>.<key>, got ", reference),
            text_));
      }
    }
    auto node = MakeNode(kind, keyword.text, keyword);
    if (!path->children.empty()) {
      node->children.push_back(std::move(path));
    }
    return node;
  }

  // Consumes path segments glued to the preceding token. Bracket segments
  // are only part of the path when they hold an integer, '*' or a quoted
  // key; anything else is left for a postfix indexer.
  std::unique_ptr<Node> ParsePath(const Token& after) {
    auto path = MakeNode(NodeKind::kJsonPath, "", Peek());
    size_t last_end = after.end;
    while (Peek().begin == last_end) {
      const Token& token = Peek();
      std::unique_ptr<Node> segment;
      if (token.IsSymbol(".")) {
        const Token& name = Peek(1);
        if (name.type != TokenType::kName || name.begin != token.end) {
          return FailUnexpected(name, "an attribute name");
        }
        segment = MakeNode(NodeKind::kJsonPathSegment,
                           absl::StrCat(".", name.text), token);
        segment->segment = SegmentKind::kAttribute;
        segment->value = Value(name.text);
        Next();
        Next();
      } else if (token.IsSymbol("[") && Peek(2).IsSymbol("]")) {
        const Token& inner = Peek(1);
        if (inner.type == TokenType::kInteger) {
          int64_t index = 0;
          if (!absl::SimpleAtoi(inner.text, &index)) {
            return FailUnexpected(inner, "a list index");
          }
          segment = MakeNode(NodeKind::kJsonPathSegment,
                             absl::StrCat("[", inner.text, "]"), token);
          segment->segment = SegmentKind::kIndex;
          segment->value = Value(index);
        } else if (inner.IsSymbol("*")) {
          segment = MakeNode(NodeKind::kJsonPathSegment, "[*]", token);
          segment->segment = SegmentKind::kWildcard;
        } else if (inner.type == TokenType::kString) {
          segment = MakeNode(NodeKind::kJsonPathSegment,
                             absl::StrCat("[", inner.text, "]"), token);
          segment->segment = SegmentKind::kQuotedKey;
          segment->value = Value(inner.str);
        } else {
          break;
        }
        Next();
        Next();
        Next();
      } else {
        break;
      }
      absl::StrAppend(&path->text, segment->text);
      path->children.push_back(std::move(segment));
      last_end = tokens_[pos_ - 1].end;
    }
    return path;
  }

  // FN.name(args) or FN.name.map(args)
  std::unique_ptr<Node> ParseFunction() {
    const Token& fn = Next();
    const Token& dot = Peek();
    const Token& name = Peek(1);
    if (!dot.IsSymbol(".") || dot.begin != fn.end) {
      return FailUnexpected(dot, "'.' followed by a function name");
    }
    if (name.type != TokenType::kName || name.begin != dot.end) {
      return FailUnexpected(name, "a function name");
    }
    Next();
    Next();
    std::string fn_name = name.text;
    if (Peek().IsSymbol(".") && Peek(1).IsName("map") &&
        Peek().begin == name.end) {
      Next();
      Next();
      absl::StrAppend(&fn_name, ".map");
    }
    if (!Expect("(")) {
      return nullptr;
    }
    auto args = MakeNode(NodeKind::kArgList, "", Peek());
    if (!Peek().IsSymbol(")")) {
      while (true) {
        auto arg = ParseExpression();
        if (!arg) {
          return nullptr;
        }
        args->children.push_back(std::move(arg));
        if (!Peek().IsSymbol(",")) {
          break;
        }
        Next();
      }
    }
    if (!Expect(")")) {
      return nullptr;
    }
    auto node = MakeNode(NodeKind::kFunction, fn_name, fn);
    node->children.push_back(std::move(args));
    return node;
  }

  std::unique_ptr<Node> ParseList() {
    const Token& open = Next();
    auto list = MakeNode(NodeKind::kList, "", open);
    if (!Peek().IsSymbol("]")) {
      while (true) {
        auto item = ParseExpression();
        if (!item) {
          return nullptr;
        }
        list->children.push_back(std::move(item));
        if (!Peek().IsSymbol(",")) {
          break;
        }
        Next();
      }
    }
    if (!Expect("]")) {
      return nullptr;
    }
    return list;
  }

  std::unique_ptr<Node> ParseDict() {
    const Token& open = Next();
    auto dict = MakeNode(NodeKind::kDict, "", open);
    if (!Peek().IsSymbol("}")) {
      while (true) {
        const Token& start = Peek();
        auto key = ParseExpression();
        if (!key || !Expect(":")) {
          return nullptr;
        }
        auto value = ParseExpression();
        if (!value) {
          return nullptr;
        }
        auto pair = MakeNode(NodeKind::kKvPair, "", start);
        pair->children.push_back(std::move(key));
        pair->children.push_back(std::move(value));
        dict->children.push_back(std::move(pair));
        if (!Peek().IsSymbol(",")) {
          break;
        }
        Next();
      }
    }
    if (!Expect("}")) {
      return nullptr;
    }
    return dict;
  }

  absl::string_view text_;
  std::vector<Token> tokens_;
  size_t pos_ = 0;
  int depth_ = 0;
  absl::Status status_;
};

}  // namespace

absl::StatusOr<std::unique_ptr<Node>> Parse(absl::string_view text) {
  auto tokens = Tokenize(text);
  if (!tokens.ok()) {
    return tokens.status();
  }
  Parser parser(text, std::move(tokens).value());
  auto tree = parser.ParseRoot();
  if (!tree.ok()) {
    FLOWEXPR_DEBUG("Failed to parse expression: %s",
                   std::string(tree.status().message()).c_str());
  }
  return tree;
}

}  // namespace parser
}  // namespace flowexpr
