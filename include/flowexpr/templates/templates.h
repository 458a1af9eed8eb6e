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

#pragma once

#include <map>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "include/flowexpr/evaluator/evaluator.h"
#include "include/flowexpr/utils/value.h"

namespace flowexpr {
namespace templates {

// "${{ <expression> }}". The match is lazy and a "${" inside the braces
// ends it, so templates never nest.
extern const char kTemplatePattern[];

// Secrets whose name carries this suffix hold OAuth tokens.
extern const char kOAuthSecretSuffix[];

struct TemplateMatch {
  // Byte range of the whole "${{ ... }}" within the scanned string.
  size_t begin;
  size_t end;
  // The expression without the markers and surrounding whitespace.
  std::string expression;
};

// Every template in `text`, left to right.
std::vector<TemplateMatch> FindTemplates(absl::string_view text);

// True when `text` is exactly one template with nothing around it.
bool IsFullTemplate(absl::string_view text);

struct FoundExpression {
  // Where the template sits, e.g. "args.headers[0]". Empty for a top level
  // string.
  std::string location;
  std::string expression;
};

// Walks strings, list items, map keys and map values.
std::vector<FoundExpression> ScanDocument(const Value& document);

// Expression texts of every template in `document`, in document order.
std::vector<std::string> ExtractExpressions(const Value& document);

// Returns `document` with every template replaced by its value. A string
// that is a full template becomes the value itself, keeping its type. Any
// other string with templates stays a string, each template being replaced
// by the string form of its value. Map keys that evaluate to a non-string
// are stringified.
absl::StatusOr<Value> EvalTemplatedObject(
    const Value& document, const Value& operand,
    const evaluator::EvaluatorOptions& options);

struct ExtractedSecretPaths {
  // "<secret_name>.<KEY>", sorted and unique.
  std::vector<std::string> secrets;
  // Same form, for secrets named "<provider>_oauth".
  std::vector<std::string> oauth_secrets;
};

// Secret references of every template in `document`, without evaluating
// anything. References spelled inside string literals are not references.
// Fails on the first template that does not parse.
absl::StatusOr<ExtractedSecretPaths> ExtractTemplatedSecrets(
    const Value& document);

// For every context keyword used in `document` (ACTIONS, SECRETS, FN, ...)
// the sorted names referenced under it: action refs, secret names, function
// names, input keys and so on.
absl::StatusOr<std::map<std::string, std::vector<std::string>>>
ExtractExpressionContexts(const Value& document);

}  // namespace templates
}  // namespace flowexpr
