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

#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "include/flowexpr/parser/parse_tree.h"
#include "include/flowexpr/utils/value.h"
#include "src/flowexpr/utils/task_group.h"

namespace flowexpr {
namespace validator {

enum class ExprType {
  kAction,
  kSecret,
  kFunction,
  kInput,
  kEnv,
  kLocalVars,
  kVars,
  kLiteral,
  kTypecast,
  kIterator,
  kTernary,
  kTrigger,
  kTemplateActionInput,
  kTemplateActionStep,
  kGeneric,
};

absl::string_view ExprTypeName(ExprType type);

enum class ValidationStatus { kSuccess, kError };

struct ValidationResult {
  ValidationStatus status = ValidationStatus::kError;
  std::string message;
  ExprType expression_type = ExprType::kGeneric;
  // The action, secret, function or input the finding is about.
  absl::optional<std::string> ref;
  // Location of the template within its document, e.g. "args.url".
  absl::optional<std::string> loc;
  absl::optional<Value> detail;
};

// One stored secret. Only key names are exposed; values never reach the
// validator.
struct SecretRecord {
  std::vector<std::string> keys;
};

// Both collaborators are called concurrently from several threads and must
// be thread safe.
class SecretStore {
 public:
  virtual ~SecretStore() {}
  // Every secret called `name` in `environment`. An unknown secret yields an
  // empty list; a failed status means the store could not be asked.
  virtual absl::StatusOr<std::vector<SecretRecord>> Lookup(
      const std::string& name, const std::string& environment) = 0;
};

class OAuthProviderRegistry {
 public:
  virtual ~OAuthProviderRegistry() {}
  // Whether an integration for the provider and grant type is configured.
  virtual absl::StatusOr<bool> Exists(const std::string& provider_id,
                                      const std::string& grant_type) = 0;
};

// Grant types implied by OAuth token names.
extern const char kAuthorizationCodeGrant[];
extern const char kClientCredentialsGrant[];

struct Collaborators {
  // Not owned. Secret references are reported as unverifiable when unset.
  SecretStore* secrets = nullptr;
  OAuthProviderRegistry* oauth = nullptr;
};

struct ValidatorOptions {
  // Environment passed to SecretStore::Lookup.
  std::string environment = "default";
};

// Static facts the expressions are checked against.
struct ExprValidationContext {
  absl::flat_hash_set<std::string> action_refs;
  // Inputs of the workflow; INPUTS paths must resolve against it.
  Value inputs_context;
  // Template actions only: the step refs and the declared input names.
  absl::flat_hash_set<std::string> template_steps;
  absl::flat_hash_set<std::string> template_expects;
};

// Walks parse trees and collects findings instead of failing. Secret and
// OAuth checks are queued during the walk and run concurrently when
// Results() is called; a failing collaborator only affects its own check.
class BaseExprValidator {
 public:
  BaseExprValidator(const ExprValidationContext& context,
                    Collaborators collaborators, ValidatorOptions options);
  virtual ~BaseExprValidator();

  BaseExprValidator(const BaseExprValidator&) = delete;
  BaseExprValidator& operator=(const BaseExprValidator&) = delete;

  // Checks one tree returned by parser::Parse. `loc` tags the findings.
  void Visit(const parser::Node& root, absl::string_view loc = "");

  // Records a finding that did not come from a tree walk, such as a parse
  // error.
  void Add(ValidationResult result);

  // Runs the queued checks and returns every finding so far. Findings of
  // queued checks follow the findings of the walks, in no particular order.
  std::vector<ValidationResult> Results();

 protected:
  virtual void VisitActions(const parser::Node& node) = 0;
  virtual void VisitInputs(const parser::Node& node) = 0;
  virtual void VisitEnv(const parser::Node& node) = 0;
  virtual void VisitTrigger(const parser::Node& node) = 0;
  virtual void VisitLocalVars(const parser::Node& node) = 0;
  virtual void VisitTemplateInputs(const parser::Node& node) = 0;
  virtual void VisitTemplateSteps(const parser::Node& node) = 0;

  void VisitSecrets(const parser::Node& node);
  void VisitVars(const parser::Node& node);
  void VisitFunction(const parser::Node& node);
  void VisitCast(const parser::Node& node);

  void Error(ExprType type, std::string message,
             absl::optional<std::string> ref = absl::nullopt);
  // Error for a context that cannot be used by this validator.
  void Unsupported(const parser::Node& node, ExprType type,
                   absl::string_view where);
  // Checks that `property` is "result" or "result_typename", used for
  // ACTIONS and steps references.
  void CheckResultAccessor(const parser::Node& node, ExprType type,
                           absl::string_view ref);

  const ExprValidationContext& context_;

 private:
  void Walk(const parser::Node& node);
  void QueueSecretCheck(const std::string& name, const std::string& key);
  void QueueOAuthCheck(const std::string& name, const std::string& key);
  void AddFromTask(ValidationResult result);

  Collaborators collaborators_;
  ValidatorOptions options_;
  std::string loc_;
  std::vector<ValidationResult> results_;
  // References already queued, so each is looked up once.
  absl::flat_hash_set<std::string> queued_;

  absl::Mutex mutex_;
  std::vector<ValidationResult> task_results_ ABSL_GUARDED_BY(mutex_);
  utils::TaskGroup tasks_;
};

// Validator for expressions in workflow actions.
class ExprValidator : public BaseExprValidator {
 public:
  using BaseExprValidator::BaseExprValidator;

 protected:
  void VisitActions(const parser::Node& node) override;
  void VisitInputs(const parser::Node& node) override;
  void VisitEnv(const parser::Node& node) override;
  void VisitTrigger(const parser::Node& node) override;
  void VisitLocalVars(const parser::Node& node) override;
  void VisitTemplateInputs(const parser::Node& node) override;
  void VisitTemplateSteps(const parser::Node& node) override;
};

// Validator for the bodies of template actions, which may only use their
// own inputs and steps besides secrets, variables and functions.
class TemplateActionExprValidator : public BaseExprValidator {
 public:
  using BaseExprValidator::BaseExprValidator;

 protected:
  void VisitActions(const parser::Node& node) override;
  void VisitInputs(const parser::Node& node) override;
  void VisitEnv(const parser::Node& node) override;
  void VisitTrigger(const parser::Node& node) override;
  void VisitLocalVars(const parser::Node& node) override;
  void VisitTemplateInputs(const parser::Node& node) override;
  void VisitTemplateSteps(const parser::Node& node) override;
};

// Scans `document` for templates and validates every expression, with the
// template action rules when `template_action` is set. Templates that do
// not parse are reported as findings.
std::vector<ValidationResult> ValidateTemplates(
    const Value& document, const ExprValidationContext& context,
    Collaborators collaborators, const ValidatorOptions& options,
    bool template_action = false);

}  // namespace validator
}  // namespace flowexpr
