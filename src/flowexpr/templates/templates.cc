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

#include "include/flowexpr/templates/templates.h"

#include <algorithm>
#include <functional>
#include <set>
#include <utility>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "include/flowexpr/parser/parser.h"
#include "include/flowexpr/utils/status.h"
#include "re2/re2.h"
#include "src/flowexpr/utils/logger.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace templates {

const char kTemplatePattern[] = R"(\$\{\{\s*((?:[^$]|\$[^{])+?)\s*\}\})";
const char kOAuthSecretSuffix[] = "_oauth";

namespace {

const RE2& TemplateRegex() {
  static const RE2* regex = new RE2(kTemplatePattern);
  return *regex;
}

std::string ChildLocation(const std::string& parent, absl::string_view key) {
  if (parent.empty()) {
    return std::string(key);
  }
  return absl::StrCat(parent, ".", key);
}

void Scan(const Value& value, const std::string& location,
          std::vector<FoundExpression>* out) {
  switch (value.type()) {
    case Value::Type::kString:
      for (auto& match : FindTemplates(value.as_string())) {
        out->push_back({location, std::move(match.expression)});
      }
      break;
    case Value::Type::kList: {
      const auto& items = value.as_list();
      for (size_t i = 0; i < items.size(); ++i) {
        Scan(items[i], absl::StrCat(location, "[", i, "]"), out);
      }
      break;
    }
    case Value::Type::kMap:
      for (const auto& entry : value.as_map()) {
        std::string child = ChildLocation(location, entry.first);
        for (auto& match : FindTemplates(entry.first)) {
          out->push_back({child, std::move(match.expression)});
        }
        Scan(entry.second, child, out);
      }
      break;
    default:
      break;
  }
}

absl::StatusOr<Value> EvalString(const std::string& text, const Value& operand,
                                 const evaluator::EvaluatorOptions& options) {
  std::vector<TemplateMatch> matches = FindTemplates(text);
  if (matches.empty()) {
    return Value(text);
  }
  if (IsFullTemplate(text)) {
    FLOWEXPR_DEBUG("Evaluating full template: %s",
                   matches[0].expression.c_str());
    return evaluator::EvaluateExpression(matches[0].expression, operand,
                                         options);
  }
  std::string out;
  size_t last = 0;
  for (const auto& match : matches) {
    FLOWEXPR_DEBUG("Substituting inline template: %s",
                   match.expression.c_str());
    FLOWEXPR_ASSIGN_OR_RETURN(
        Value value,
        evaluator::EvaluateExpression(match.expression, operand, options));
    absl::StrAppend(&out, absl::string_view(text).substr(last, match.begin - last),
                    ToString(value));
    last = match.end;
  }
  out.append(text, last, std::string::npos);
  return Value(std::move(out));
}

absl::StatusOr<Value> Eval(const Value& value, const Value& operand,
                           const evaluator::EvaluatorOptions& options) {
  switch (value.type()) {
    case Value::Type::kString:
      return EvalString(value.as_string(), operand, options);
    case Value::Type::kList: {
      Value::List out;
      out.reserve(value.as_list().size());
      for (const auto& item : value.as_list()) {
        FLOWEXPR_ASSIGN_OR_RETURN(Value evaluated, Eval(item, operand, options));
        out.push_back(std::move(evaluated));
      }
      return Value(std::move(out));
    }
    case Value::Type::kMap: {
      Value out{Value::Map()};
      for (const auto& entry : value.as_map()) {
        FLOWEXPR_ASSIGN_OR_RETURN(Value key,
                                  EvalString(entry.first, operand, options));
        FLOWEXPR_ASSIGN_OR_RETURN(Value evaluated,
                                  Eval(entry.second, operand, options));
        out.Set(key.is_string() ? key.as_string() : ToString(key),
                std::move(evaluated));
      }
      return out;
    }
    default:
      return value;
  }
}

void Walk(const parser::Node& node,
          const std::function<void(const parser::Node&)>& visit) {
  visit(node);
  for (const auto& child : node.children) {
    Walk(*child, visit);
  }
}

// Parses every template of `document` and passes each tree to `visit`.
absl::Status ForEachTree(
    const Value& document,
    const std::function<void(const parser::Node&)>& visit) {
  for (const auto& found : ScanDocument(document)) {
    auto root = parser::Parse(found.expression);
    if (!root.ok()) {
      return root.status();
    }
    Walk(**root, visit);
  }
  return absl::OkStatus();
}

}  // namespace

std::vector<TemplateMatch> FindTemplates(absl::string_view text) {
  std::vector<TemplateMatch> out;
  re2::StringPiece input(text.data(), text.size());
  re2::StringPiece groups[2];
  size_t position = 0;
  while (position < text.size() &&
         TemplateRegex().Match(input, position, text.size(), RE2::UNANCHORED,
                               groups, 2)) {
    TemplateMatch match;
    match.begin = groups[0].data() - text.data();
    match.end = match.begin + groups[0].size();
    match.expression = std::string(absl::StripAsciiWhitespace(
        absl::string_view(groups[1].data(), groups[1].size())));
    position = match.end;
    out.push_back(std::move(match));
  }
  return out;
}

bool IsFullTemplate(absl::string_view text) {
  return RE2::FullMatch(re2::StringPiece(text.data(), text.size()),
                        TemplateRegex());
}

std::vector<FoundExpression> ScanDocument(const Value& document) {
  std::vector<FoundExpression> out;
  Scan(document, "", &out);
  return out;
}

std::vector<std::string> ExtractExpressions(const Value& document) {
  std::vector<std::string> out;
  for (auto& found : ScanDocument(document)) {
    out.push_back(std::move(found.expression));
  }
  return out;
}

absl::StatusOr<Value> EvalTemplatedObject(
    const Value& document, const Value& operand,
    const evaluator::EvaluatorOptions& options) {
  return Eval(document, operand, options);
}

absl::StatusOr<ExtractedSecretPaths> ExtractTemplatedSecrets(
    const Value& document) {
  std::set<std::string> secrets;
  std::set<std::string> oauth_secrets;
  FLOWEXPR_RETURN_IF_ERROR(
      ForEachTree(document, [&](const parser::Node& node) {
        if (node.kind != parser::NodeKind::kSecrets || node.path_size() != 2) {
          return;
        }
        const parser::Node& path = node.child(0);
        const std::string name = ToString(path.child(0).value);
        std::string reference =
            absl::StrCat(name, ".", ToString(path.child(1).value));
        if (absl::EndsWith(name, kOAuthSecretSuffix)) {
          oauth_secrets.insert(std::move(reference));
        } else {
          secrets.insert(std::move(reference));
        }
      }));
  ExtractedSecretPaths out;
  out.secrets.assign(secrets.begin(), secrets.end());
  out.oauth_secrets.assign(oauth_secrets.begin(), oauth_secrets.end());
  return out;
}

absl::StatusOr<std::map<std::string, std::vector<std::string>>>
ExtractExpressionContexts(const Value& document) {
  std::map<std::string, std::set<std::string>> contexts;
  FLOWEXPR_RETURN_IF_ERROR(
      ForEachTree(document, [&](const parser::Node& node) {
        if (node.kind == parser::NodeKind::kFunction) {
          absl::string_view name = node.text;
          absl::ConsumeSuffix(&name, ".map");
          contexts[parser::kFn].insert(std::string(name));
          return;
        }
        if (!parser::IsContextKind(node.kind) &&
            node.kind != parser::NodeKind::kLocalVarsAssignment) {
          return;
        }
        auto& names = contexts[node.text];
        if (node.path_size() > 0) {
          names.insert(ToString(node.child(0).child(0).value));
        }
      }));
  std::map<std::string, std::vector<std::string>> out;
  for (const auto& entry : contexts) {
    out[entry.first].assign(entry.second.begin(), entry.second.end());
  }
  return out;
}

}  // namespace templates
}  // namespace flowexpr
