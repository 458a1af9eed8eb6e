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

#ifndef FLOWEXPR_EVALUATOR_EVALUATOR_H
#define FLOWEXPR_EVALUATOR_EVALUATOR_H

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "include/flowexpr/lambda/sandbox.h"
#include "include/flowexpr/parser/parse_tree.h"
#include "include/flowexpr/utils/value.h"

namespace flowexpr {
namespace evaluator {

// Workspace variables may be addressed as VARS.<name> or VARS.<name>.<key>.
constexpr size_t kMaxVarsKeySegments = 1;

struct EvaluatorOptions {
  // Fail on context paths without a match instead of yielding null.
  bool strict = false;
  // Sandbox for lambda arguments of FN calls. nullptr selects
  // lambda::DefaultSandbox(). Not owned.
  const lambda::LambdaSandbox* sandbox = nullptr;
};

// Result of a "for var.x in <collection>" expression.
struct IterableExpr {
  // Path of the loop variable below "var", e.g. ".x".
  std::string iterator;
  Value::List collection;
};

// Reduces parse trees to values against an operand.
//
// The operand is a map keyed by context: ACTIONS, SECRETS, INPUTS, ENV,
// VARS, var, TRIGGER and, inside template actions, inputs and steps. It is
// only read, so one operand can back any number of concurrent evaluators.
//
// Failures are reported with the rendered tree and the reason, keeping the
// kind of the underlying error.
class ExprEvaluator {
 public:
  ExprEvaluator(const Value& operand, EvaluatorOptions options);

  // Evaluates a tree returned by parser::Parse. Iterator expressions are
  // rejected; use EvaluateIterable for those.
  absl::StatusOr<Value> Evaluate(const parser::Node& root);

  // Evaluates a tree whose expression is "for var.x in <collection>". The
  // collection must evaluate to a list.
  absl::StatusOr<IterableExpr> EvaluateIterable(const parser::Node& root);

 private:
  absl::StatusOr<Value> Visit(const parser::Node& node);
  absl::StatusOr<Value> VisitContext(const parser::Node& node);
  absl::StatusOr<Value> VisitFunction(const parser::Node& node);
  absl::StatusOr<Value> VisitIndexer(const parser::Node& node);
  absl::StatusOr<Value> VisitChildren(const parser::Node& node,
                                      Value::List* out);
  absl::Status Failed(const parser::Node& root, const absl::Status& status);

  const Value& operand_;
  EvaluatorOptions options_;
  // Innermost node that failed during the current evaluation.
  const parser::Node* failed_ = nullptr;
};

// Parses and evaluates one expression.
absl::StatusOr<Value> EvaluateExpression(absl::string_view text,
                                         const Value& operand,
                                         const EvaluatorOptions& options);

}  // namespace evaluator
}  // namespace flowexpr

#endif  // FLOWEXPR_EVALUATOR_EVALUATOR_H
