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

#ifndef FLOWEXPR_PARSER_PARSE_TREE_H
#define FLOWEXPR_PARSER_PARSE_TREE_H

#include <memory>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "include/flowexpr/utils/value.h"

namespace flowexpr {
namespace parser {

enum class NodeKind {
  kRoot,
  kTrailingTypecast,
  kIterator,
  // Parenthesized sub-expression.
  kExpression,
  // Contexts. Each holds one kJsonPath child, except a bare TRIGGER.
  kActions,
  kSecrets,
  kInputs,
  kEnv,
  kVars,
  kLocalVars,
  kLocalVarsAssignment,
  kTrigger,
  kTemplateActionInputs,
  kTemplateActionSteps,
  kLiteral,
  kTypecast,
  kTernary,
  kBinaryOp,
  kUnaryOp,
  kList,
  kDict,
  kKvPair,
  kFunction,
  kArgList,
  kIndexer,
  kJsonPath,
  kJsonPathSegment,
};

absl::string_view NodeKindName(NodeKind kind);

// The shape of a path segment. Stored in Node::segment.
enum class SegmentKind { kNone, kAttribute, kIndex, kWildcard, kQuotedKey };

// Immutable parse tree node.
//
// Children by kind:
//   kRoot              [expression]
//   kTrailingTypecast  [expression]          text: type name
//   kIterator          [kLocalVarsAssignment, collection]
//   kExpression        [expression]
//   contexts           [kJsonPath]           text: context keyword
//   kLocalVarsAssignment [kJsonPath]         text: "var"
//   kLiteral           []                    value: literal
//   kTypecast          [expression]          text: type name
//   kTernary           [true branch, condition, false branch]
//   kBinaryOp          [lhs, rhs]            text: operator
//   kUnaryOp           [operand]             text: operator
//   kList              [items...]
//   kDict              [kKvPair...]
//   kKvPair            [key, value]
//   kFunction          [kArgList]            text: name, maybe with ".map"
//   kArgList           [args...]
//   kIndexer           [base, index]
//   kJsonPath          [kJsonPathSegment...] text: ".a[0]['b']"
//   kJsonPathSegment   []                    text: raw segment, value: key
//                                            or index
struct Node {
  NodeKind kind;
  std::string text;
  Value value;
  SegmentKind segment = SegmentKind::kNone;
  std::vector<std::unique_ptr<Node>> children;
  // 1-based position of the first token of the node.
  int line = 1;
  int column = 1;

  Node(NodeKind kind, std::string text) : kind(kind), text(std::move(text)) {}

  const Node& child(size_t i) const { return *children[i]; }

  // Context nodes only. The path text, or empty for a bare TRIGGER.
  const std::string& path() const;
  // Context nodes only. Number of path segments.
  size_t path_size() const;

  // Indented rendering of the subtree, one node per line.
  std::string Pretty() const;
};

bool IsContextKind(NodeKind kind);

}  // namespace parser
}  // namespace flowexpr

#endif  // FLOWEXPR_PARSER_PARSE_TREE_H
