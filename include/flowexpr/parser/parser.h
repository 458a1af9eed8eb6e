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

#ifndef FLOWEXPR_PARSER_PARSER_H
#define FLOWEXPR_PARSER_PARSER_H

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "include/flowexpr/parser/parse_tree.h"

namespace flowexpr {
namespace parser {

// Context keywords.
extern const char kActions[];
extern const char kSecrets[];
extern const char kInputs[];
extern const char kEnv[];
extern const char kVars[];
extern const char kLocalVars[];
extern const char kTrigger[];
extern const char kTemplateActionInputs[];
extern const char kTemplateActionSteps[];
extern const char kFn[];

// Parses one expression (the text between "${{" and "}}") into a tree
// rooted at a kRoot node. The grammar is LL(1) and parsing is linear in the
// length of the input.
//
// Failures are ParseError statuses. The message names the unexpected
// character, token or end of input with its line and column; the attached
// ErrorDetail also carries the raw error and the expression. No partial
// tree is returned.
absl::StatusOr<std::unique_ptr<Node>> Parse(absl::string_view text);

}  // namespace parser
}  // namespace flowexpr

#endif  // FLOWEXPR_PARSER_PARSER_H
