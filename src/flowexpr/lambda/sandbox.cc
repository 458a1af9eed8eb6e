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

#include <algorithm>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "include/flowexpr/utils/status.h"
#include "src/flowexpr/functions/operators.h"
#include "src/flowexpr/functions/registry.h"
#include "src/flowexpr/jsonpath/jsonpath.h"
#include "src/flowexpr/parser/lexer.h"
#include "src/flowexpr/utils/logger.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace lambda {
namespace {

constexpr size_t kMaxSourceLength = 1000;

const absl::flat_hash_set<std::string>& DeniedNames() {
  static const auto* names = new absl::flat_hash_set<std::string>{
      "eval",    "exec",    "import", "from",    "os",         "sys",
      "locals",  "globals", "open",   "compile", "getattr",    "setattr",
      "delattr", "vars",    "input",  "chr",     "breakpoint", "ord",
  };
  return *names;
}

const absl::flat_hash_set<std::string>& Keywords() {
  static const auto* names = new absl::flat_hash_set<std::string>{
      "lambda", "if", "else", "and", "or",    "not",
      "in",     "is", "True", "False", "None",
  };
  return *names;
}

const absl::flat_hash_set<std::string>& Builtins() {
  static const auto* names = new absl::flat_hash_set<std::string>{
      "len",   "str",  "int",    "float",  "bool", "abs",
      "min",   "max",  "sum",    "sorted", "round", "jsonpath",
      "list",  "all",  "any",    "reversed",
  };
  return *names;
}

const absl::flat_hash_set<std::string>& Methods() {
  static const auto* names = new absl::flat_hash_set<std::string>{
      "upper", "lower", "strip", "startswith", "endswith", "get",
      "keys",  "values", "items", "split",     "replace",
  };
  return *names;
}

struct Node {
  enum class Kind {
    kLiteral,
    kParam,
    kUnary,
    kBinary,
    kAnd,
    kOr,
    kCompare,
    kConditional,
    kSubscript,
    kSlice,
    kCall,
    kMethod,
    kList,
    kDict,
  };

  explicit Node(Kind k) : kind(k) {}

  Kind kind;
  Value literal;
  // Operator, builtin or method name.
  std::string name;
  size_t index = 0;
  // Comparison chain, one operator between each pair of children.
  std::vector<std::string> ops;
  // kSlice uses nullptr for an omitted bound. kDict alternates keys and
  // values.
  std::vector<std::unique_ptr<Node>> children;
};

using NodePtr = std::unique_ptr<Node>;

NodePtr MakeNode(Node::Kind kind, std::string name = "") {
  NodePtr node(new Node(kind));
  node->name = std::move(name);
  return node;
}

bool IsDunder(absl::string_view name) { return absl::StrContains(name, "__"); }

// Recursive descent over the lexer's tokens. Follows Python precedence:
// conditional, or, and, not, comparisons, + -, * / // %, unary, **,
// subscripts and calls.
class LambdaParser {
 public:
  LambdaParser(absl::string_view source, std::vector<parser::Token> tokens,
               const SandboxOptions& options)
      : source_(source), tokens_(std::move(tokens)), options_(options) {}

  absl::Status Parse(std::vector<std::string>* params, NodePtr* body) {
    if (!Peek().IsName("lambda")) {
      return Error(Peek(), "Expression must be a lambda function");
    }
    ++pos_;
    while (!Peek().IsSymbol(":")) {
      const parser::Token& token = Peek();
      if (token.type != parser::TokenType::kName || Keywords().contains(token.text)) {
        return Error(token, absl::StrCat("Invalid lambda parameter ",
                                         parser::Describe(token)));
      }
      FLOWEXPR_RETURN_IF_ERROR(CheckName(token));
      if (std::find(params->begin(), params->end(), token.text) !=
          params->end()) {
        return Error(token, absl::StrCat("Duplicate lambda parameter '",
                                         token.text, "'"));
      }
      params->push_back(token.text);
      ++pos_;
      if (!Accept(",") && !Peek().IsSymbol(":")) {
        return Unexpected(Peek());
      }
    }
    ++pos_;
    params_ = params;
    FLOWEXPR_ASSIGN_OR_RETURN(*body, ParseTest());
    if (Peek().type != parser::TokenType::kEnd) {
      return Unexpected(Peek());
    }
    return absl::OkStatus();
  }

 private:
  const parser::Token& Peek(size_t ahead = 0) const {
    return tokens_[std::min(pos_ + ahead, tokens_.size() - 1)];
  }

  bool Accept(absl::string_view symbol) {
    if (Peek().IsSymbol(symbol)) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool AcceptKeyword(absl::string_view keyword) {
    if (Peek().IsName(keyword)) {
      ++pos_;
      return true;
    }
    return false;
  }

  // "**" and "//" arrive as two adjacent single character symbols.
  bool AcceptDouble(absl::string_view symbol) {
    if (Peek().IsSymbol(symbol) && Peek(1).IsSymbol(symbol) &&
        Peek(1).begin == Peek().end) {
      pos_ += 2;
      return true;
    }
    return false;
  }

  absl::Status Expect(absl::string_view symbol) {
    if (!Accept(symbol)) {
      return Unexpected(Peek());
    }
    return absl::OkStatus();
  }

  absl::Status Error(const parser::Token& token, absl::string_view message) {
    return ParseError(absl::StrCat("Invalid lambda: ", message), token.line,
                      token.column, message, source_);
  }

  absl::Status Unexpected(const parser::Token& token) {
    return Error(token, absl::StrCat("unexpected ", parser::Describe(token),
                                     " at column ", token.column));
  }

  bool Allowed(const std::string& name) const {
    return std::find(options_.allowed_names.begin(),
                     options_.allowed_names.end(),
                     name) != options_.allowed_names.end();
  }

  absl::Status CheckName(const parser::Token& token) {
    if (Allowed(token.text)) {
      return absl::OkStatus();
    }
    if (DeniedNames().contains(token.text)) {
      return Error(token,
                   absl::StrCat("usage of '", token.text, "' is not allowed"));
    }
    if (IsDunder(token.text)) {
      return Error(token, absl::StrCat("dunder names are not allowed: '",
                                       token.text, "'"));
    }
    return absl::OkStatus();
  }

  absl::StatusOr<NodePtr> ParseTest() {
    if (Peek().IsName("lambda")) {
      return Error(Peek(), "nested lambdas are not supported");
    }
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr then_branch, ParseOr());
    if (!AcceptKeyword("if")) {
      return then_branch;
    }
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr condition, ParseOr());
    if (!AcceptKeyword("else")) {
      return Unexpected(Peek());
    }
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr else_branch, ParseTest());
    NodePtr node = MakeNode(Node::Kind::kConditional);
    node->children.push_back(std::move(condition));
    node->children.push_back(std::move(then_branch));
    node->children.push_back(std::move(else_branch));
    return node;
  }

  absl::StatusOr<NodePtr> ParseOr() {
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr lhs, ParseAnd());
    while (AcceptKeyword("or")) {
      FLOWEXPR_ASSIGN_OR_RETURN(NodePtr rhs, ParseAnd());
      NodePtr node = MakeNode(Node::Kind::kOr);
      node->children.push_back(std::move(lhs));
      node->children.push_back(std::move(rhs));
      lhs = std::move(node);
    }
    return lhs;
  }

  absl::StatusOr<NodePtr> ParseAnd() {
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr lhs, ParseNot());
    while (AcceptKeyword("and")) {
      FLOWEXPR_ASSIGN_OR_RETURN(NodePtr rhs, ParseNot());
      NodePtr node = MakeNode(Node::Kind::kAnd);
      node->children.push_back(std::move(lhs));
      node->children.push_back(std::move(rhs));
      lhs = std::move(node);
    }
    return lhs;
  }

  absl::StatusOr<NodePtr> ParseNot() {
    if (!AcceptKeyword("not")) {
      return ParseComparison();
    }
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr operand, ParseNot());
    NodePtr node = MakeNode(Node::Kind::kUnary, "not");
    node->children.push_back(std::move(operand));
    return node;
  }

  // Empty when the next tokens are not a comparison operator.
  std::string AcceptComparison() {
    for (absl::string_view op : {"==", "!=", "<=", ">=", "<", ">"}) {
      if (Accept(op)) {
        return std::string(op);
      }
    }
    if (AcceptKeyword("in")) {
      return "in";
    }
    if (Peek().IsName("not") && Peek(1).IsName("in")) {
      pos_ += 2;
      return "not in";
    }
    if (AcceptKeyword("is")) {
      return AcceptKeyword("not") ? "is not" : "is";
    }
    return "";
  }

  absl::StatusOr<NodePtr> ParseComparison() {
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr first, ParseArith());
    std::string op = AcceptComparison();
    if (op.empty()) {
      return first;
    }
    NodePtr node = MakeNode(Node::Kind::kCompare);
    node->children.push_back(std::move(first));
    while (!op.empty()) {
      FLOWEXPR_ASSIGN_OR_RETURN(NodePtr next, ParseArith());
      node->ops.push_back(op);
      node->children.push_back(std::move(next));
      op = AcceptComparison();
    }
    return node;
  }

  NodePtr Binary(std::string op, NodePtr lhs, NodePtr rhs) {
    NodePtr node = MakeNode(Node::Kind::kBinary, std::move(op));
    node->children.push_back(std::move(lhs));
    node->children.push_back(std::move(rhs));
    return node;
  }

  absl::StatusOr<NodePtr> ParseArith() {
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr lhs, ParseTerm());
    while (true) {
      std::string op;
      if (Accept("+")) {
        op = "+";
      } else if (Accept("-")) {
        op = "-";
      } else {
        return lhs;
      }
      FLOWEXPR_ASSIGN_OR_RETURN(NodePtr rhs, ParseTerm());
      lhs = Binary(op, std::move(lhs), std::move(rhs));
    }
  }

  absl::StatusOr<NodePtr> ParseTerm() {
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr lhs, ParseFactor());
    while (true) {
      std::string op;
      if (AcceptDouble("/")) {
        op = "//";
      } else if (Accept("*")) {
        op = "*";
      } else if (Accept("/")) {
        op = "/";
      } else if (Accept("%")) {
        op = "%";
      } else {
        return lhs;
      }
      FLOWEXPR_ASSIGN_OR_RETURN(NodePtr rhs, ParseFactor());
      lhs = Binary(op, std::move(lhs), std::move(rhs));
    }
  }

  absl::StatusOr<NodePtr> ParseFactor() {
    std::string op;
    if (Accept("-")) {
      op = "-";
    } else if (Accept("+")) {
      op = "+";
    } else {
      return ParsePower();
    }
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr operand, ParseFactor());
    NodePtr node = MakeNode(Node::Kind::kUnary, op);
    node->children.push_back(std::move(operand));
    return node;
  }

  // Right associative, and binds tighter than a unary minus on its left.
  absl::StatusOr<NodePtr> ParsePower() {
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr base, ParsePostfix());
    if (!AcceptDouble("*")) {
      return base;
    }
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr exponent, ParseFactor());
    return Binary("**", std::move(base), std::move(exponent));
  }

  absl::StatusOr<std::vector<NodePtr>> ParseArguments(
      absl::string_view close) {
    std::vector<NodePtr> args;
    while (!Accept(close)) {
      FLOWEXPR_ASSIGN_OR_RETURN(NodePtr arg, ParseTest());
      args.push_back(std::move(arg));
      if (!Accept(",") && !Peek().IsSymbol(close)) {
        return Unexpected(Peek());
      }
    }
    return args;
  }

  absl::StatusOr<NodePtr> ParseSubscript(NodePtr target) {
    NodePtr start;
    if (!Peek().IsSymbol(":")) {
      FLOWEXPR_ASSIGN_OR_RETURN(start, ParseTest());
      if (Accept("]")) {
        NodePtr node = MakeNode(Node::Kind::kSubscript);
        node->children.push_back(std::move(target));
        node->children.push_back(std::move(start));
        return node;
      }
    }
    FLOWEXPR_RETURN_IF_ERROR(Expect(":"));
    NodePtr stop;
    if (!Peek().IsSymbol("]")) {
      FLOWEXPR_ASSIGN_OR_RETURN(stop, ParseTest());
    }
    FLOWEXPR_RETURN_IF_ERROR(Expect("]"));
    NodePtr node = MakeNode(Node::Kind::kSlice);
    node->children.push_back(std::move(target));
    node->children.push_back(std::move(start));
    node->children.push_back(std::move(stop));
    return node;
  }

  absl::StatusOr<NodePtr> ParsePostfix() {
    FLOWEXPR_ASSIGN_OR_RETURN(NodePtr node, ParseAtom());
    while (true) {
      if (Accept("[")) {
        FLOWEXPR_ASSIGN_OR_RETURN(node, ParseSubscript(std::move(node)));
      } else if (Accept(".")) {
        const parser::Token& attribute = Peek();
        if (attribute.type != parser::TokenType::kName) {
          return Unexpected(attribute);
        }
        FLOWEXPR_RETURN_IF_ERROR(CheckName(attribute));
        if (!Methods().contains(attribute.text)) {
          return Error(attribute, absl::StrCat("attribute '", attribute.text,
                                               "' is not allowed"));
        }
        std::string method = attribute.text;
        ++pos_;
        if (!Accept("(")) {
          return Error(Peek(), absl::StrCat("method '", method,
                                            "' must be called"));
        }
        FLOWEXPR_ASSIGN_OR_RETURN(std::vector<NodePtr> args,
                                  ParseArguments(")"));
        NodePtr call = MakeNode(Node::Kind::kMethod, method);
        call->children.push_back(std::move(node));
        for (auto& arg : args) {
          call->children.push_back(std::move(arg));
        }
        node = std::move(call);
      } else if (Peek().IsSymbol("(")) {
        return Error(Peek(), "only builtins and methods can be called");
      } else {
        return node;
      }
    }
  }

  absl::StatusOr<NodePtr> ParseName() {
    const parser::Token& token = Peek();
    FLOWEXPR_RETURN_IF_ERROR(CheckName(token));
    NodePtr node;
    if (token.text == "True" || token.text == "False") {
      node = MakeNode(Node::Kind::kLiteral);
      node->literal = Value(token.text == "True");
    } else if (token.text == "None") {
      node = MakeNode(Node::Kind::kLiteral);
    } else if (Keywords().contains(token.text)) {
      return Unexpected(token);
    } else {
      auto param = std::find(params_->begin(), params_->end(), token.text);
      if (param != params_->end()) {
        node = MakeNode(Node::Kind::kParam, token.text);
        node->index = param - params_->begin();
      } else if (Builtins().contains(token.text)) {
        std::string builtin = token.text;
        ++pos_;
        if (!Accept("(")) {
          return Error(Peek(), absl::StrCat("builtin '", builtin,
                                            "' must be called"));
        }
        FLOWEXPR_ASSIGN_OR_RETURN(std::vector<NodePtr> args,
                                  ParseArguments(")"));
        node = MakeNode(Node::Kind::kCall, builtin);
        node->children = std::move(args);
        return node;
      } else {
        return Error(token,
                     absl::StrCat("name '", token.text, "' is not defined"));
      }
    }
    ++pos_;
    return node;
  }

  absl::StatusOr<NodePtr> ParseAtom() {
    const parser::Token& token = Peek();
    NodePtr node;
    switch (token.type) {
      case parser::TokenType::kName:
        return ParseName();
      case parser::TokenType::kInteger: {
        node = MakeNode(Node::Kind::kLiteral);
        int64_t number;
        if (!absl::SimpleAtoi(token.text, &number)) {
          return Error(token, absl::StrCat("integer literal ", token.text,
                                           " is too large"));
        }
        node->literal = Value(number);
        break;
      }
      case parser::TokenType::kFloat: {
        node = MakeNode(Node::Kind::kLiteral);
        double number;
        if (!absl::SimpleAtod(token.text, &number)) {
          return Unexpected(token);
        }
        node->literal = Value(number);
        break;
      }
      case parser::TokenType::kString:
        node = MakeNode(Node::Kind::kLiteral);
        node->literal = Value(token.str);
        break;
      case parser::TokenType::kSymbol:
        if (Accept("(")) {
          FLOWEXPR_ASSIGN_OR_RETURN(NodePtr inner, ParseTest());
          if (Accept(")")) {
            return inner;
          }
          // A tuple display evaluates to a list.
          FLOWEXPR_RETURN_IF_ERROR(Expect(","));
          FLOWEXPR_ASSIGN_OR_RETURN(std::vector<NodePtr> rest,
                                    ParseArguments(")"));
          node = MakeNode(Node::Kind::kList);
          node->children.push_back(std::move(inner));
          for (auto& item : rest) {
            node->children.push_back(std::move(item));
          }
          return node;
        }
        if (Accept("[")) {
          node = MakeNode(Node::Kind::kList);
          FLOWEXPR_ASSIGN_OR_RETURN(node->children, ParseArguments("]"));
          return node;
        }
        if (Accept("{")) {
          return ParseDict();
        }
        return Unexpected(token);
      case parser::TokenType::kEnd:
        return Error(token, "unexpected end of lambda");
    }
    ++pos_;
    return node;
  }

  absl::StatusOr<NodePtr> ParseDict() {
    NodePtr node = MakeNode(Node::Kind::kDict);
    while (!Accept("}")) {
      FLOWEXPR_ASSIGN_OR_RETURN(NodePtr key, ParseTest());
      FLOWEXPR_RETURN_IF_ERROR(Expect(":"));
      FLOWEXPR_ASSIGN_OR_RETURN(NodePtr value, ParseTest());
      node->children.push_back(std::move(key));
      node->children.push_back(std::move(value));
      if (!Accept(",") && !Peek().IsSymbol("}")) {
        return Unexpected(Peek());
      }
    }
    return node;
  }

  absl::string_view source_;
  std::vector<parser::Token> tokens_;
  const SandboxOptions& options_;
  const std::vector<std::string>* params_ = nullptr;
  size_t pos_ = 0;
};

absl::Status TypeError(absl::string_view message) {
  return ScriptExecutionError(absl::StrCat("TypeError: ", message));
}

absl::Status ExpectArgs(absl::string_view name, const std::vector<Value>& args,
                        size_t min, size_t max) {
  if (args.size() < min || args.size() > max) {
    std::string expected =
        min == max ? absl::StrCat(min) : absl::StrCat(min, " to ", max);
    return TypeError(absl::StrCat(name, "() takes ", expected,
                                  " argument(s) (", args.size(), " given)"));
  }
  return absl::OkStatus();
}

int64_t CodePoints(const std::string& text) {
  int64_t count = 0;
  for (char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

// Negative indices count from the end. Returns false when out of range.
bool NormalizeIndex(int64_t size, int64_t* index) {
  if (*index < 0) {
    *index += size;
  }
  return *index >= 0 && *index < size;
}

int64_t ClampBound(const Value& bound, int64_t size, int64_t fallback) {
  if (bound.is_null()) {
    return fallback;
  }
  int64_t index = bound.as_int();
  if (index < 0) {
    index = std::max<int64_t>(index + size, 0);
  }
  return std::min(index, size);
}

// Evaluates one call. Not shared between threads.
class Interpreter {
 public:
  Interpreter(const std::vector<Value>& args, uint32_t max_steps)
      : args_(args), max_steps_(max_steps) {}

  absl::StatusOr<Value> Eval(const Node& node) {
    FLOWEXPR_RETURN_IF_ERROR(Charge(1));
    switch (node.kind) {
      case Node::Kind::kLiteral:
        return node.literal;
      case Node::Kind::kParam:
        return args_[node.index];
      case Node::Kind::kUnary: {
        FLOWEXPR_ASSIGN_OR_RETURN(Value operand, Eval(*node.children[0]));
        if (node.name == "not") {
          return Value(!operand.truthy());
        }
        return functions::ApplyUnary(node.name, operand);
      }
      case Node::Kind::kBinary: {
        FLOWEXPR_ASSIGN_OR_RETURN(Value lhs, Eval(*node.children[0]));
        FLOWEXPR_ASSIGN_OR_RETURN(Value rhs, Eval(*node.children[1]));
        return functions::ApplyBinary(node.name, lhs, rhs);
      }
      case Node::Kind::kAnd: {
        FLOWEXPR_ASSIGN_OR_RETURN(Value lhs, Eval(*node.children[0]));
        if (!lhs.truthy()) {
          return lhs;
        }
        return Eval(*node.children[1]);
      }
      case Node::Kind::kOr: {
        FLOWEXPR_ASSIGN_OR_RETURN(Value lhs, Eval(*node.children[0]));
        if (lhs.truthy()) {
          return lhs;
        }
        return Eval(*node.children[1]);
      }
      case Node::Kind::kCompare:
        return EvalCompare(node);
      case Node::Kind::kConditional: {
        FLOWEXPR_ASSIGN_OR_RETURN(Value condition, Eval(*node.children[0]));
        return Eval(*node.children[condition.truthy() ? 1 : 2]);
      }
      case Node::Kind::kSubscript: {
        FLOWEXPR_ASSIGN_OR_RETURN(Value target, Eval(*node.children[0]));
        FLOWEXPR_ASSIGN_OR_RETURN(Value key, Eval(*node.children[1]));
        return Subscript(target, key);
      }
      case Node::Kind::kSlice:
        return EvalSlice(node);
      case Node::Kind::kCall: {
        FLOWEXPR_ASSIGN_OR_RETURN(std::vector<Value> args,
                                  EvalAll(node, 0));
        return CallBuiltin(node.name, args);
      }
      case Node::Kind::kMethod: {
        FLOWEXPR_ASSIGN_OR_RETURN(Value receiver, Eval(*node.children[0]));
        FLOWEXPR_ASSIGN_OR_RETURN(std::vector<Value> args, EvalAll(node, 1));
        return CallMethod(node.name, receiver, args);
      }
      case Node::Kind::kList: {
        FLOWEXPR_ASSIGN_OR_RETURN(std::vector<Value> items, EvalAll(node, 0));
        return Value(std::move(items));
      }
      case Node::Kind::kDict:
        return EvalDict(node);
    }
    return ScriptExecutionError("Unsupported lambda expression");
  }

 private:
  absl::Status Charge(size_t steps) {
    steps_ += steps;
    if (steps_ > max_steps_) {
      return ScriptExecutionError(absl::StrCat(
          "Lambda exceeded the limit of ", max_steps_, " evaluation steps"));
    }
    return absl::OkStatus();
  }

  absl::StatusOr<std::vector<Value>> EvalAll(const Node& node, size_t first) {
    std::vector<Value> values;
    for (size_t i = first; i < node.children.size(); ++i) {
      FLOWEXPR_ASSIGN_OR_RETURN(Value value, Eval(*node.children[i]));
      values.push_back(std::move(value));
    }
    return values;
  }

  absl::StatusOr<Value> EvalCompare(const Node& node) {
    FLOWEXPR_ASSIGN_OR_RETURN(Value lhs, Eval(*node.children[0]));
    for (size_t i = 0; i < node.ops.size(); ++i) {
      FLOWEXPR_ASSIGN_OR_RETURN(Value rhs, Eval(*node.children[i + 1]));
      FLOWEXPR_ASSIGN_OR_RETURN(Value holds,
                                functions::ApplyBinary(node.ops[i], lhs, rhs));
      if (!holds.truthy()) {
        return Value(false);
      }
      lhs = std::move(rhs);
    }
    return Value(true);
  }

  absl::StatusOr<Value> EvalDict(const Node& node) {
    Value out{Value::Map()};
    for (size_t i = 0; i + 1 < node.children.size(); i += 2) {
      FLOWEXPR_ASSIGN_OR_RETURN(Value key, Eval(*node.children[i]));
      FLOWEXPR_ASSIGN_OR_RETURN(Value value, Eval(*node.children[i + 1]));
      if (!key.is_string()) {
        return TypeError(
            absl::StrCat("dict keys must be str, not '", key.type_name(), "'"));
      }
      out.Set(key.as_string(), std::move(value));
    }
    return out;
  }

  absl::StatusOr<Value> Subscript(const Value& target, const Value& key) {
    if (target.is_map()) {
      if (!key.is_string()) {
        return ScriptExecutionError(absl::StrCat("KeyError: ", Repr(key)));
      }
      const Value* found = target.Find(key.as_string());
      if (found == nullptr) {
        return ScriptExecutionError(absl::StrCat("KeyError: ", Repr(key)));
      }
      return *found;
    }
    if (target.is_list() || target.is_string()) {
      if (!key.is_int() && !key.is_bool()) {
        return TypeError(absl::StrCat(target.type_name(),
                                      " indices must be integers, not '",
                                      key.type_name(), "'"));
      }
      int64_t index = key.is_bool() ? key.as_bool() : key.as_int();
      int64_t size = target.is_list()
                         ? static_cast<int64_t>(target.as_list().size())
                         : static_cast<int64_t>(target.as_string().size());
      if (!NormalizeIndex(size, &index)) {
        return ScriptExecutionError(absl::StrCat(
            "IndexError: ", target.type_name(), " index out of range"));
      }
      if (target.is_list()) {
        return target.as_list()[index];
      }
      return Value(target.as_string().substr(index, 1));
    }
    return TypeError(absl::StrCat("'", target.type_name(),
                                  "' object is not subscriptable"));
  }

  absl::StatusOr<Value> EvalSlice(const Node& node) {
    FLOWEXPR_ASSIGN_OR_RETURN(Value target, Eval(*node.children[0]));
    Value bounds[2];
    for (int i = 0; i < 2; ++i) {
      const NodePtr& child = node.children[i + 1];
      if (child == nullptr) {
        continue;
      }
      FLOWEXPR_ASSIGN_OR_RETURN(bounds[i], Eval(*child));
      if (!bounds[i].is_null() && !bounds[i].is_int()) {
        return TypeError("slice indices must be integers or None");
      }
    }
    if (target.is_list()) {
      const Value::List& items = target.as_list();
      int64_t size = items.size();
      int64_t start = ClampBound(bounds[0], size, 0);
      int64_t stop = ClampBound(bounds[1], size, size);
      if (stop <= start) {
        return Value(Value::List());
      }
      return Value(Value::List(items.begin() + start, items.begin() + stop));
    }
    if (target.is_string()) {
      const std::string& text = target.as_string();
      int64_t size = text.size();
      int64_t start = ClampBound(bounds[0], size, 0);
      int64_t stop = ClampBound(bounds[1], size, size);
      return Value(stop <= start ? std::string()
                                 : text.substr(start, stop - start));
    }
    return TypeError(absl::StrCat("'", target.type_name(),
                                  "' object is not subscriptable"));
  }

  // Elements of a list, the keys of a dict or the characters of a string.
  absl::StatusOr<Value::List> Iterate(absl::string_view function,
                                      const Value& value) {
    Value::List items;
    if (value.is_list()) {
      items = value.as_list();
    } else if (value.is_map()) {
      for (const auto& entry : value.as_map()) {
        items.push_back(Value(entry.first));
      }
    } else if (value.is_string()) {
      for (char c : value.as_string()) {
        items.push_back(Value(std::string(1, c)));
      }
    } else {
      return TypeError(absl::StrCat(function, "() argument '",
                                    value.type_name(),
                                    "' object is not iterable"));
    }
    FLOWEXPR_RETURN_IF_ERROR(Charge(items.size()));
    return items;
  }

  absl::StatusOr<Value> Sorted(const Value& value) {
    FLOWEXPR_ASSIGN_OR_RETURN(Value::List items, Iterate("sorted", value));
    absl::Status status;
    std::stable_sort(items.begin(), items.end(),
                     [&status](const Value& lhs, const Value& rhs) {
                       if (!status.ok()) {
                         return false;
                       }
                       auto order = functions::Compare(lhs, rhs);
                       if (!order.ok()) {
                         status = order.status();
                         return false;
                       }
                       return *order < 0;
                     });
    FLOWEXPR_RETURN_IF_ERROR(status);
    return Value(std::move(items));
  }

  absl::StatusOr<Value> CallBuiltin(const std::string& name,
                                    const std::vector<Value>& args) {
    if (name == "len") {
      FLOWEXPR_RETURN_IF_ERROR(ExpectArgs(name, args, 1, 1));
      const Value& value = args[0];
      if (value.is_string()) {
        return Value(CodePoints(value.as_string()));
      }
      if (value.is_list()) {
        return Value(static_cast<int64_t>(value.as_list().size()));
      }
      if (value.is_map()) {
        return Value(static_cast<int64_t>(value.as_map().size()));
      }
      return TypeError(absl::StrCat("object of type '", value.type_name(),
                                    "' has no len()"));
    }
    if (name == "str" || name == "int" || name == "float") {
      FLOWEXPR_RETURN_IF_ERROR(ExpectArgs(name, args, 1, 1));
      return functions::Cast(args[0], name);
    }
    if (name == "bool") {
      FLOWEXPR_RETURN_IF_ERROR(ExpectArgs(name, args, 1, 1));
      return Value(args[0].truthy());
    }
    if (name == "abs" || name == "min" || name == "max" || name == "sum" ||
        name == "round") {
      if (args.size() == 1 && args[0].is_list()) {
        FLOWEXPR_RETURN_IF_ERROR(Charge(args[0].as_list().size()));
      }
      return functions::Registry::Get().Call(name, args);
    }
    if (name == "sorted") {
      FLOWEXPR_RETURN_IF_ERROR(ExpectArgs(name, args, 1, 1));
      return Sorted(args[0]);
    }
    if (name == "list") {
      FLOWEXPR_RETURN_IF_ERROR(ExpectArgs(name, args, 0, 1));
      if (args.empty()) {
        return Value(Value::List());
      }
      FLOWEXPR_ASSIGN_OR_RETURN(Value::List items, Iterate(name, args[0]));
      return Value(std::move(items));
    }
    if (name == "reversed") {
      FLOWEXPR_RETURN_IF_ERROR(ExpectArgs(name, args, 1, 1));
      FLOWEXPR_ASSIGN_OR_RETURN(Value::List items, Iterate(name, args[0]));
      std::reverse(items.begin(), items.end());
      return Value(std::move(items));
    }
    if (name == "all" || name == "any") {
      FLOWEXPR_RETURN_IF_ERROR(ExpectArgs(name, args, 1, 1));
      FLOWEXPR_ASSIGN_OR_RETURN(Value::List items, Iterate(name, args[0]));
      bool want = name == "any";
      for (const auto& item : items) {
        if (item.truthy() == want) {
          return Value(want);
        }
      }
      return Value(!want);
    }
    if (name == "jsonpath") {
      FLOWEXPR_RETURN_IF_ERROR(ExpectArgs(name, args, 2, 2));
      if (!args[0].is_string()) {
        return TypeError("jsonpath() expression must be str");
      }
      return jsonpath::Resolve(args[0].as_string(), args[1], false);
    }
    return ScriptExecutionError(
        absl::StrCat("NameError: name '", name, "' is not defined"));
  }

  absl::StatusOr<Value> CallMethod(const std::string& name,
                                   const Value& receiver,
                                   const std::vector<Value>& args) {
    if (receiver.is_map()) {
      const Value::Map& map = receiver.as_map();
      if (name == "get") {
        FLOWEXPR_RETURN_IF_ERROR(ExpectArgs(name, args, 1, 2));
        const Value* found =
            args[0].is_string() ? receiver.Find(args[0].as_string()) : nullptr;
        if (found != nullptr) {
          return *found;
        }
        return args.size() == 2 ? args[1] : Value();
      }
      if (name == "keys" || name == "values" || name == "items") {
        FLOWEXPR_RETURN_IF_ERROR(ExpectArgs(name, args, 0, 0));
        FLOWEXPR_RETURN_IF_ERROR(Charge(map.size()));
        Value::List out;
        for (const auto& entry : map) {
          if (name == "keys") {
            out.push_back(Value(entry.first));
          } else if (name == "values") {
            out.push_back(entry.second);
          } else {
            out.push_back(Value(Value::List{Value(entry.first), entry.second}));
          }
        }
        return Value(std::move(out));
      }
    } else if (receiver.is_string()) {
      static const auto* aliases = new std::vector<std::pair<std::string, std::string>>{
          {"upper", "uppercase"},     {"lower", "lowercase"},
          {"strip", "strip"},         {"startswith", "startswith"},
          {"endswith", "endswith"},   {"split", "split"},
          {"replace", "replace"},
      };
      for (const auto& alias : *aliases) {
        if (alias.first != name) {
          continue;
        }
        std::vector<Value> call_args;
        call_args.reserve(args.size() + 1);
        call_args.push_back(receiver);
        call_args.insert(call_args.end(), args.begin(), args.end());
        return functions::Registry::Get().Call(alias.second, call_args);
      }
    }
    return ScriptExecutionError(
        absl::StrCat("AttributeError: '", receiver.type_name(),
                     "' object has no attribute '", name, "'"));
  }

  const std::vector<Value>& args_;
  uint32_t max_steps_;
  uint64_t steps_ = 0;
};

absl::Status AsScriptError(const absl::Status& status) {
  if (IsScriptExecutionError(status)) {
    return status;
  }
  return ScriptExecutionError(status.message());
}

class RestrictedLambda : public CompiledLambda {
 public:
  RestrictedLambda(std::string source, std::vector<std::string> params,
                   NodePtr body, uint32_t max_steps)
      : source_(std::move(source)),
        params_(std::move(params)),
        body_(std::move(body)),
        max_steps_(max_steps) {}

  size_t arity() const override { return params_.size(); }

  absl::StatusOr<Value> Call(const std::vector<Value>& args) const override {
    if (args.size() != params_.size()) {
      return TypeError(absl::StrCat("<lambda>() takes ", params_.size(),
                                    " positional argument(s) but ",
                                    args.size(), " were given"));
    }
    Interpreter interpreter(args, max_steps_);
    auto result = interpreter.Eval(*body_);
    if (!result.ok()) {
      FLOWEXPR_DEBUG("Lambda '%s' failed: %s", source_.c_str(),
                     result.status().ToString().c_str());
      return AsScriptError(result.status());
    }
    return result;
  }

 private:
  const std::string source_;
  const std::vector<std::string> params_;
  const NodePtr body_;
  const uint32_t max_steps_;
};

class RestrictedSandbox : public LambdaSandbox {
 public:
  explicit RestrictedSandbox(SandboxOptions options)
      : options_(std::move(options)) {}

  absl::StatusOr<std::unique_ptr<CompiledLambda>> Compile(
      absl::string_view source) const override {
    source = absl::StripAsciiWhitespace(source);
    if (source.size() > kMaxSourceLength) {
      return ParseError(
          absl::StrCat("Invalid lambda: expression too long (max ",
                       kMaxSourceLength, " characters)"),
          1, 1, "expression too long", source);
    }
    FLOWEXPR_ASSIGN_OR_RETURN(std::vector<parser::Token> tokens,
                              parser::Tokenize(source));
    LambdaParser parser(source, std::move(tokens), options_);
    std::vector<std::string> params;
    NodePtr body;
    FLOWEXPR_RETURN_IF_ERROR(parser.Parse(&params, &body));
    FLOWEXPR_TRACE("Compiled lambda '%s' with %zu parameter(s)",
                   std::string(source).c_str(), params.size());
    return std::unique_ptr<CompiledLambda>(
        new RestrictedLambda(std::string(source), std::move(params),
                             std::move(body), options_.max_steps));
  }

 private:
  const SandboxOptions options_;
};

}  // namespace

std::unique_ptr<LambdaSandbox> NewRestrictedSandbox(SandboxOptions options) {
  return std::unique_ptr<LambdaSandbox>(
      new RestrictedSandbox(std::move(options)));
}

const LambdaSandbox& DefaultSandbox() {
  static const LambdaSandbox* sandbox =
      new RestrictedSandbox(SandboxOptions());
  return *sandbox;
}

}  // namespace lambda
}  // namespace flowexpr
