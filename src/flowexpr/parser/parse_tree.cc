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

#include "include/flowexpr/parser/parse_tree.h"

#include "absl/strings/str_cat.h"

namespace flowexpr {
namespace parser {
namespace {

const std::string kEmptyPath;

void AppendPretty(const Node& node, int depth, std::string* out) {
  out->append(depth * 2, ' ');
  absl::StrAppend(out, NodeKindName(node.kind));
  if (node.kind == NodeKind::kLiteral) {
    absl::StrAppend(out, "\t", Repr(node.value));
  } else if (!node.text.empty()) {
    absl::StrAppend(out, "\t", node.text);
  }
  out->push_back('\n');
  if (node.kind == NodeKind::kJsonPath) {
    return;
  }
  for (const auto& child : node.children) {
    AppendPretty(*child, depth + 1, out);
  }
}

}  // namespace

absl::string_view NodeKindName(NodeKind kind) {
  switch (kind) {
    case NodeKind::kRoot:
      return "root";
    case NodeKind::kTrailingTypecast:
      return "trailing_typecast_expression";
    case NodeKind::kIterator:
      return "iterator";
    case NodeKind::kExpression:
      return "expression";
    case NodeKind::kActions:
      return "actions";
    case NodeKind::kSecrets:
      return "secrets";
    case NodeKind::kInputs:
      return "inputs";
    case NodeKind::kEnv:
      return "env";
    case NodeKind::kVars:
      return "vars";
    case NodeKind::kLocalVars:
      return "local_vars";
    case NodeKind::kLocalVarsAssignment:
      return "local_vars_assignment";
    case NodeKind::kTrigger:
      return "trigger";
    case NodeKind::kTemplateActionInputs:
      return "template_action_inputs";
    case NodeKind::kTemplateActionSteps:
      return "template_action_steps";
    case NodeKind::kLiteral:
      return "literal";
    case NodeKind::kTypecast:
      return "typecast";
    case NodeKind::kTernary:
      return "ternary";
    case NodeKind::kBinaryOp:
      return "binary_op";
    case NodeKind::kUnaryOp:
      return "unary_op";
    case NodeKind::kList:
      return "list";
    case NodeKind::kDict:
      return "dict";
    case NodeKind::kKvPair:
      return "kvpair";
    case NodeKind::kFunction:
      return "function";
    case NodeKind::kArgList:
      return "arg_list";
    case NodeKind::kIndexer:
      return "indexer";
    case NodeKind::kJsonPath:
      return "jsonpath";
    case NodeKind::kJsonPathSegment:
      return "jsonpath_segment";
  }
  return "unknown";
}

bool IsContextKind(NodeKind kind) {
  switch (kind) {
    case NodeKind::kActions:
    case NodeKind::kSecrets:
    case NodeKind::kInputs:
    case NodeKind::kEnv:
    case NodeKind::kVars:
    case NodeKind::kLocalVars:
    case NodeKind::kTrigger:
    case NodeKind::kTemplateActionInputs:
    case NodeKind::kTemplateActionSteps:
      return true;
    default:
      return false;
  }
}

const std::string& Node::path() const {
  if (children.empty() || children[0]->kind != NodeKind::kJsonPath) {
    return kEmptyPath;
  }
  return children[0]->text;
}

size_t Node::path_size() const {
  if (children.empty() || children[0]->kind != NodeKind::kJsonPath) {
    return 0;
  }
  return children[0]->children.size();
}

std::string Node::Pretty() const {
  std::string out;
  AppendPretty(*this, 0, &out);
  return out;
}

}  // namespace parser
}  // namespace flowexpr
