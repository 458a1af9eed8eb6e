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
#include <utility>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "include/flowexpr/parser/parser.h"
#include "include/flowexpr/utils/status.h"
#include "src/flowexpr/functions/operators.h"
#include "src/flowexpr/functions/registry.h"
#include "src/flowexpr/jsonpath/jsonpath.h"
#include "src/flowexpr/utils/logger.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace evaluator {
namespace {

constexpr absl::string_view kMapSuffix = ".map";

// Splits UTF-8 text into code points.
std::vector<std::string> CodePoints(const std::string& text) {
  std::vector<std::string> out;
  for (size_t i = 0; i < text.size();) {
    unsigned char lead = static_cast<unsigned char>(text[i]);
    size_t width = lead < 0x80 ? 1 : lead < 0xE0 ? 2 : lead < 0xF0 ? 3 : 4;
    out.push_back(text.substr(i, width));
    i += width;
  }
  return out;
}

absl::StatusOr<Value> ApplyIndex(const Value& value, const Value& index) {
  if (value.is_map()) {
    if (!index.is_string()) {
      return EvaluationError(absl::StrCat("Invalid key type '",
                                          index.type_name(),
                                          "' for mapping access"));
    }
    const Value* found = value.Find(index.as_string());
    if (found == nullptr) {
      return EvaluationError(absl::StrCat("Key ", Repr(index),
                                          " not found for mapping access"));
    }
    return *found;
  }
  if (value.is_list() || value.is_string()) {
    if (!index.is_int()) {
      return EvaluationError(
          absl::StrCat("Sequence indices must be integers, got '",
                        index.type_name(), "'"));
    }
    std::vector<std::string> chars;
    int64_t size;
    if (value.is_list()) {
      size = static_cast<int64_t>(value.as_list().size());
    } else {
      chars = CodePoints(value.as_string());
      size = static_cast<int64_t>(chars.size());
    }
    int64_t position = index.as_int();
    if (position < 0) {
      position += size;
    }
    if (position < 0 || position >= size) {
      return EvaluationError(
          absl::StrCat("Sequence index ", index.as_int(), " out of range"));
    }
    if (value.is_list()) {
      return value.as_list()[position];
    }
    return Value(chars[position]);
  }
  return EvaluationError(absl::StrCat("Object of type '", value.type_name(),
                                      "' is not indexable"));
}

}  // namespace

ExprEvaluator::ExprEvaluator(const Value& operand, EvaluatorOptions options)
    : operand_(operand), options_(options) {}

absl::Status ExprEvaluator::Failed(const parser::Node& root,
                                   const absl::Status& status) {
  std::string pretty = root.Pretty();
  FLOWEXPR_ERROR("Evaluation failed at node %s (line %d, column %d): %s",
                 std::string(parser::NodeKindName(
                                  failed_ != nullptr ? failed_->kind
                                                     : root.kind))
                     .c_str(),
                 failed_ != nullptr ? failed_->line : root.line,
                 failed_ != nullptr ? failed_->column : root.column,
                 std::string(status.message()).c_str());
  return WithContext(status,
                     absl::StrCat("[evaluator] Evaluation failed at node:\n```\n",
                                  pretty, "\n```\nReason: "));
}

absl::StatusOr<Value> ExprEvaluator::Evaluate(const parser::Node& root) {
  failed_ = nullptr;
  const parser::Node* expression = &root;
  if (root.kind == parser::NodeKind::kRoot && !root.children.empty()) {
    expression = &root.child(0);
  }
  if (expression->kind == parser::NodeKind::kIterator) {
    return EvaluationError(
        "Iterator expressions can only be evaluated as iterables");
  }
  auto result = Visit(root);
  if (!result.ok()) {
    return Failed(root, result.status());
  }
  return result;
}

absl::StatusOr<IterableExpr> ExprEvaluator::EvaluateIterable(
    const parser::Node& root) {
  failed_ = nullptr;
  const parser::Node* iterator = &root;
  if (root.kind == parser::NodeKind::kRoot && !root.children.empty()) {
    iterator = &root.child(0);
  }
  if (iterator->kind != parser::NodeKind::kIterator) {
    return EvaluationError(absl::StrCat(
        "Expected an iterator expression, got ",
        parser::NodeKindName(iterator->kind)));
  }
  const parser::Node& assignment = iterator->child(0);
  FLOWEXPR_TRACE("Visiting iterator over %s%s", assignment.text.c_str(),
                 assignment.path().c_str());
  auto collection = Visit(iterator->child(1));
  if (!collection.ok()) {
    return Failed(root, collection.status());
  }
  IterableExpr out;
  out.iterator = assignment.path();
  switch (collection->type()) {
    case Value::Type::kList:
      out.collection = std::move(collection->mutable_list());
      break;
    case Value::Type::kMap:
      // Mappings iterate over their keys.
      for (const auto& entry : collection->as_map()) {
        out.collection.push_back(Value(entry.first));
      }
      break;
    case Value::Type::kString:
      for (auto& character : CodePoints(collection->as_string())) {
        out.collection.push_back(Value(std::move(character)));
      }
      break;
    default:
      failed_ = iterator;
      return Failed(root, EvaluationError(absl::StrCat(
                              "Invalid iterator collection: ",
                              Repr(*collection), ". Must be an iterable.")));
  }
  return out;
}

absl::StatusOr<Value> ExprEvaluator::VisitChildren(const parser::Node& node,
                                                   Value::List* out) {
  out->reserve(node.children.size());
  for (const auto& child : node.children) {
    FLOWEXPR_ASSIGN_OR_RETURN(Value value, Visit(*child));
    out->push_back(std::move(value));
  }
  return Value();
}

absl::StatusOr<Value> ExprEvaluator::Visit(const parser::Node& node) {
  FLOWEXPR_TRACE("Visiting %s '%s'",
                 std::string(parser::NodeKindName(node.kind)).c_str(),
                 node.text.c_str());
  absl::StatusOr<Value> result;
  switch (node.kind) {
    case parser::NodeKind::kRoot:
    case parser::NodeKind::kExpression:
      result = Visit(node.child(0));
      break;
    case parser::NodeKind::kTrailingTypecast:
    case parser::NodeKind::kTypecast: {
      auto inner = Visit(node.child(0));
      if (!inner.ok()) {
        return inner;
      }
      result = functions::Cast(*inner, node.text);
      break;
    }
    case parser::NodeKind::kLiteral:
      return node.value;
    case parser::NodeKind::kTernary: {
      auto condition = Visit(node.child(1));
      if (!condition.ok()) {
        return condition;
      }
      // Only the taken branch is evaluated.
      return Visit(condition->truthy() ? node.child(0) : node.child(2));
    }
    case parser::NodeKind::kBinaryOp: {
      auto lhs = Visit(node.child(0));
      if (!lhs.ok()) {
        return lhs;
      }
      auto rhs = Visit(node.child(1));
      if (!rhs.ok()) {
        return rhs;
      }
      result = functions::ApplyBinary(node.text, *lhs, *rhs);
      break;
    }
    case parser::NodeKind::kUnaryOp: {
      auto operand = Visit(node.child(0));
      if (!operand.ok()) {
        return operand;
      }
      result = functions::ApplyUnary(node.text, *operand);
      break;
    }
    case parser::NodeKind::kList:
    case parser::NodeKind::kArgList: {
      Value::List items;
      auto status = VisitChildren(node, &items);
      if (!status.ok()) {
        return status;
      }
      return Value(std::move(items));
    }
    case parser::NodeKind::kDict: {
      Value out{Value::Map()};
      for (const auto& pair : node.children) {
        auto key = Visit(pair->child(0));
        if (!key.ok()) {
          return key;
        }
        auto value = Visit(pair->child(1));
        if (!value.ok()) {
          return value;
        }
        if (!key->is_string()) {
          failed_ = pair.get();
          return EvaluationError(absl::StrCat(
              "Dictionary keys must be strings, got '", key->type_name(),
              "'"));
        }
        out.Set(key->as_string(), std::move(*value));
      }
      return out;
    }
    case parser::NodeKind::kFunction:
      result = VisitFunction(node);
      break;
    case parser::NodeKind::kIndexer:
      result = VisitIndexer(node);
      break;
    case parser::NodeKind::kIterator:
      result = EvaluationError(
          "Iterator expressions are only valid at the top level");
      break;
    case parser::NodeKind::kActions:
    case parser::NodeKind::kSecrets:
    case parser::NodeKind::kInputs:
    case parser::NodeKind::kEnv:
    case parser::NodeKind::kVars:
    case parser::NodeKind::kLocalVars:
    case parser::NodeKind::kTrigger:
    case parser::NodeKind::kTemplateActionInputs:
    case parser::NodeKind::kTemplateActionSteps:
      result = VisitContext(node);
      break;
    default:
      result = EvaluationError(absl::StrCat(
          "Unexpected node ", parser::NodeKindName(node.kind)));
      break;
  }
  if (!result.ok() && failed_ == nullptr) {
    failed_ = &node;
  }
  return result;
}

absl::StatusOr<Value> ExprEvaluator::VisitContext(const parser::Node& node) {
  const std::string& path = node.path();
  if (node.kind == parser::NodeKind::kVars) {
    std::vector<absl::string_view> parts =
        absl::StrSplit(absl::StripPrefix(path, "."), '.', absl::SkipEmpty());
    if (parts.size() > kMaxVarsKeySegments + 1) {
      return EvaluationError(absl::StrCat(
          "VARS expressions currently support at most one key segment "
          "(`VARS.<name>.<key>`). Got VARS.",
          absl::StrJoin(parts, "."), " with ", parts.size() - 1,
          " key segments after the variable name."));
    }
  }
  const Value* slice = operand_.Find(node.text);
  if (path.empty()) {
    // Bare TRIGGER.
    if (slice != nullptr) {
      return *slice;
    }
    if (options_.strict) {
      return EvaluationError(absl::StrCat("Couldn't resolve expression '",
                                          node.text, "' in the context"));
    }
    return Value();
  }
  static const Value* const kEmpty = new Value(Value::Map());
  return jsonpath::Resolve(path, slice != nullptr ? *slice : *kEmpty,
                           options_.strict, node.text);
}

absl::StatusOr<Value> ExprEvaluator::VisitFunction(const parser::Node& node) {
  absl::string_view name = node.text;
  bool mapped = absl::ConsumeSuffix(&name, kMapSuffix);
  Value::List args;
  if (!node.children.empty()) {
    FLOWEXPR_RETURN_IF_ERROR(VisitChildren(node.child(0), &args).status());
  }
  FLOWEXPR_TRACE("Calling %s%s with %zu argument(s)",
                 std::string(name).c_str(), mapped ? " (mapped)" : "",
                 args.size());
  functions::CallContext context;
  context.sandbox = options_.sandbox;
  const auto& registry = functions::Registry::Get();
  if (mapped) {
    return registry.CallMapped(name, args, context);
  }
  return registry.Call(name, args, context);
}

absl::StatusOr<Value> ExprEvaluator::VisitIndexer(const parser::Node& node) {
  FLOWEXPR_ASSIGN_OR_RETURN(Value base, Visit(node.child(0)));
  FLOWEXPR_ASSIGN_OR_RETURN(Value index, Visit(node.child(1)));
  return ApplyIndex(base, index);
}

absl::StatusOr<Value> EvaluateExpression(absl::string_view text,
                                         const Value& operand,
                                         const EvaluatorOptions& options) {
  FLOWEXPR_ASSIGN_OR_RETURN(auto root, parser::Parse(text));
  ExprEvaluator evaluator(operand, options);
  return evaluator.Evaluate(*root);
}

}  // namespace evaluator
}  // namespace flowexpr
