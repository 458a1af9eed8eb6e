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

#include "include/flowexpr/validator/validator.h"

#include <algorithm>
#include <memory>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/strip.h"
#include "include/flowexpr/parser/parser.h"
#include "include/flowexpr/templates/templates.h"
#include "include/flowexpr/utils/status.h"
#include "src/flowexpr/functions/operators.h"
#include "src/flowexpr/functions/registry.h"
#include "src/flowexpr/jsonpath/jsonpath.h"
#include "src/flowexpr/utils/logger.h"

namespace flowexpr {
namespace validator {

const char kAuthorizationCodeGrant[] = "authorization_code";
const char kClientCredentialsGrant[] = "client_credentials";

namespace {

constexpr size_t kMaxVarsSegments = 2;

// Full reference text of a context node, e.g. "ACTIONS.a.result".
std::string Reference(const parser::Node& node) {
  return absl::StrCat(node.text, node.path());
}

// Key or index of the i-th path segment as text.
std::string Segment(const parser::Node& node, size_t i) {
  return ToString(node.child(0).child(i).value);
}

std::string SortedNames(const absl::flat_hash_set<std::string>& names) {
  std::vector<std::string> sorted(names.begin(), names.end());
  std::sort(sorted.begin(), sorted.end());
  return absl::StrJoin(sorted, ", ");
}

}  // namespace

absl::string_view ExprTypeName(ExprType type) {
  switch (type) {
    case ExprType::kAction:
      return "action";
    case ExprType::kSecret:
      return "secret";
    case ExprType::kFunction:
      return "function";
    case ExprType::kInput:
      return "input";
    case ExprType::kEnv:
      return "env";
    case ExprType::kLocalVars:
      return "local_vars";
    case ExprType::kVars:
      return "vars";
    case ExprType::kLiteral:
      return "literal";
    case ExprType::kTypecast:
      return "typecast";
    case ExprType::kIterator:
      return "iterator";
    case ExprType::kTernary:
      return "ternary";
    case ExprType::kTrigger:
      return "trigger";
    case ExprType::kTemplateActionInput:
      return "template_action_input";
    case ExprType::kTemplateActionStep:
      return "template_action_step";
    case ExprType::kGeneric:
      return "generic";
  }
  return "generic";
}

BaseExprValidator::BaseExprValidator(const ExprValidationContext& context,
                                     Collaborators collaborators,
                                     ValidatorOptions options)
    : context_(context),
      collaborators_(collaborators),
      options_(std::move(options)) {}

BaseExprValidator::~BaseExprValidator() { tasks_.Wait(); }

void BaseExprValidator::Visit(const parser::Node& root, absl::string_view loc) {
  loc_ = std::string(loc);
  Walk(root);
}

void BaseExprValidator::Add(ValidationResult result) {
  results_.push_back(std::move(result));
}

std::vector<ValidationResult> BaseExprValidator::Results() {
  tasks_.Wait();
  std::vector<ValidationResult> out = results_;
  absl::MutexLock lock(&mutex_);
  out.insert(out.end(), task_results_.begin(), task_results_.end());
  return out;
}

void BaseExprValidator::AddFromTask(ValidationResult result) {
  absl::MutexLock lock(&mutex_);
  task_results_.push_back(std::move(result));
}

void BaseExprValidator::Error(ExprType type, std::string message,
                              absl::optional<std::string> ref) {
  ValidationResult result;
  result.status = ValidationStatus::kError;
  result.message = std::move(message);
  result.expression_type = type;
  result.ref = std::move(ref);
  if (!loc_.empty()) {
    result.loc = loc_;
  }
  results_.push_back(std::move(result));
}

void BaseExprValidator::Unsupported(const parser::Node& node, ExprType type,
                                    absl::string_view where) {
  Error(type,
        absl::StrCat(node.text, " expressions are not supported in ", where,
                     ", got '", Reference(node), "'"));
}

void BaseExprValidator::Walk(const parser::Node& node) {
  switch (node.kind) {
    case parser::NodeKind::kActions:
      VisitActions(node);
      return;
    case parser::NodeKind::kSecrets:
      VisitSecrets(node);
      return;
    case parser::NodeKind::kInputs:
      VisitInputs(node);
      return;
    case parser::NodeKind::kEnv:
      VisitEnv(node);
      return;
    case parser::NodeKind::kVars:
      VisitVars(node);
      return;
    case parser::NodeKind::kLocalVars:
      VisitLocalVars(node);
      return;
    case parser::NodeKind::kTrigger:
      VisitTrigger(node);
      return;
    case parser::NodeKind::kTemplateActionInputs:
      VisitTemplateInputs(node);
      return;
    case parser::NodeKind::kTemplateActionSteps:
      VisitTemplateSteps(node);
      return;
    case parser::NodeKind::kFunction:
      VisitFunction(node);
      return;
    case parser::NodeKind::kIterator:
      // The loop variable is an assignment, only the collection is read.
      Walk(node.child(1));
      return;
    case parser::NodeKind::kTypecast:
    case parser::NodeKind::kTrailingTypecast:
      VisitCast(node);
      break;
    default:
      break;
  }
  for (const auto& child : node.children) {
    Walk(*child);
  }
}

void BaseExprValidator::VisitSecrets(const parser::Node& node) {
  if (node.path_size() != 2) {
    Error(ExprType::kSecret,
          absl::StrCat("Invalid secret reference '", Reference(node),
                       "'. Secrets must be referenced with exactly two "
                       "segments in the format SECRETS.my_secret.KEY"));
    return;
  }
  std::string name = Segment(node, 0);
  std::string key = Segment(node, 1);
  if (absl::EndsWith(name, templates::kOAuthSecretSuffix)) {
    QueueOAuthCheck(name, key);
  } else {
    QueueSecretCheck(name, key);
  }
}

void BaseExprValidator::QueueSecretCheck(const std::string& name,
                                         const std::string& key) {
  if (!queued_.insert(absl::StrCat(name, ".", key)).second) {
    return;
  }
  if (collaborators_.secrets == nullptr) {
    Error(ExprType::kSecret,
          absl::StrCat("Could not validate secret '", name,
                       "': no secret store is available"),
          name);
    return;
  }
  SecretStore* store = collaborators_.secrets;
  std::string environment = options_.environment;
  std::string loc = loc_;
  tasks_.Spawn([this, store, name, key, environment, loc] {
    ValidationResult result;
    result.expression_type = ExprType::kSecret;
    result.ref = name;
    if (!loc.empty()) {
      result.loc = loc;
    }
    std::string secret = absl::StrCat("'", name, "' (env: '", environment, "')");
    auto records = store->Lookup(name, environment);
    if (!records.ok()) {
      FLOWEXPR_WARN("Secret lookup for %s failed: %s", secret.c_str(),
                    records.status().ToString().c_str());
      result.message = absl::StrCat("Could not validate secret ", secret,
                                    ": ", records.status().message());
    } else if (records->empty()) {
      result.message = absl::StrCat("Secret ", secret,
                                    " is missing in the secrets manager.");
    } else if (records->size() > 1) {
      result.message = absl::StrCat(
          "Multiple secrets found when searching for secret ", secret, ".");
    } else {
      const auto& keys = records->front().keys;
      if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
        result.message = absl::StrCat("Secret '", name,
                                      "' is missing required keys: ", key);
      } else {
        result.status = ValidationStatus::kSuccess;
        result.message =
            absl::StrCat("Secret '", name, "' has key '", key, "'");
      }
    }
    AddFromTask(std::move(result));
  });
}

void BaseExprValidator::QueueOAuthCheck(const std::string& name,
                                        const std::string& key) {
  std::string provider(
      absl::StripSuffix(name, templates::kOAuthSecretSuffix));
  std::string prefix = absl::AsciiStrToUpper(provider);
  std::string grant_type;
  if (key == absl::StrCat(prefix, "_USER_TOKEN")) {
    grant_type = kAuthorizationCodeGrant;
  } else if (key == absl::StrCat(prefix, "_SERVICE_TOKEN")) {
    grant_type = kClientCredentialsGrant;
  } else {
    Error(ExprType::kSecret,
          absl::StrCat("Invalid OAuth token '", key, "' for secret '", name,
                       "'. Expected ", prefix, "_USER_TOKEN or ", prefix,
                       "_SERVICE_TOKEN"),
          name);
    return;
  }
  if (!queued_.insert(absl::StrCat("oauth::", provider, "::", grant_type))
           .second) {
    return;
  }
  std::string integration =
      absl::StrCat("'", provider, "' (grant_type: ", grant_type, ")");
  if (collaborators_.oauth == nullptr) {
    Error(ExprType::kSecret,
          absl::StrCat("Could not validate OAuth integration ", integration,
                       ": no OAuth provider registry is available"),
          name);
    return;
  }
  OAuthProviderRegistry* registry = collaborators_.oauth;
  std::string loc = loc_;
  tasks_.Spawn([this, registry, name, provider, grant_type, integration, loc] {
    ValidationResult result;
    result.expression_type = ExprType::kSecret;
    result.ref = name;
    if (!loc.empty()) {
      result.loc = loc;
    }
    auto exists = registry->Exists(provider, grant_type);
    if (!exists.ok()) {
      FLOWEXPR_WARN("OAuth lookup for %s failed: %s", integration.c_str(),
                    exists.status().ToString().c_str());
      result.message = absl::StrCat("Could not validate OAuth integration ",
                                    integration, ": ",
                                    exists.status().message());
    } else if (!*exists) {
      result.message = absl::StrCat("Required OAuth integration ",
                                    integration, " is not configured");
    } else {
      result.status = ValidationStatus::kSuccess;
      result.message =
          absl::StrCat("OAuth integration ", integration, " is configured");
    }
    AddFromTask(std::move(result));
  });
}

void BaseExprValidator::VisitVars(const parser::Node& node) {
  if (node.path_size() > kMaxVarsSegments) {
    Error(ExprType::kVars,
          absl::StrCat("VARS expressions currently support at most one key "
                       "segment (`VARS.<name>.<key>`). Got '",
                       Reference(node), "'"),
          Segment(node, 0));
  }
}

void BaseExprValidator::VisitFunction(const parser::Node& node) {
  absl::string_view name = node.text;
  absl::ConsumeSuffix(&name, ".map");
  size_t count = node.children.empty() ? 0 : node.child(0).children.size();
  const functions::FunctionSpec* spec =
      functions::Registry::Get().Find(name);
  if (spec == nullptr) {
    Error(ExprType::kFunction,
          absl::StrCat("Unknown function name '", name, "'"),
          std::string(name));
  } else if (count < spec->min_args) {
    Error(ExprType::kFunction,
          absl::StrCat("Too few positional arguments for function '", name,
                       "'. Expected at least ", spec->min_args, ", got ",
                       count),
          std::string(name));
  } else if (!spec->variadic && count > spec->max_args) {
    Error(ExprType::kFunction,
          absl::StrCat("Too many positional arguments for function '", name,
                       "'. Expected at most ", spec->max_args, ", got ",
                       count),
          std::string(name));
  }
  for (const auto& child : node.children) {
    Walk(*child);
  }
}

// Only a literal operand can be refuted statically.
void BaseExprValidator::VisitCast(const parser::Node& node) {
  const parser::Node& inner = node.child(0);
  if (inner.kind != parser::NodeKind::kLiteral) {
    return;
  }
  auto cast = functions::Cast(inner.value, node.text);
  if (!cast.ok()) {
    Error(ExprType::kTypecast,
          absl::StrCat("Cannot convert ", Repr(inner.value), " to '",
                       node.text, "': ", cast.status().message()));
  }
}

void BaseExprValidator::CheckResultAccessor(const parser::Node& node,
                                            ExprType type,
                                            absl::string_view ref) {
  std::string example = absl::StrCat(node.text, ".", ref, ".result");
  if (node.path_size() < 2) {
    Error(type,
          absl::StrCat("Missing property in '", Reference(node),
                       "'. Use 'result' or 'result_typename', e.g. ",
                       example),
          std::string(ref));
    return;
  }
  const parser::Node& property = node.child(0).child(1);
  if (property.segment == parser::SegmentKind::kAttribute &&
      (property.value == Value("result") ||
       property.value == Value("result_typename"))) {
    return;
  }
  Error(type,
        absl::StrCat("Invalid property '", ToString(property.value), "' in '",
                     Reference(node),
                     "'. Use 'result' or 'result_typename', optionally "
                     "followed by [n] or [*], e.g. ",
                     example),
        std::string(ref));
}

void ExprValidator::VisitActions(const parser::Node& node) {
  std::string ref = Segment(node, 0);
  if (!context_.action_refs.contains(ref)) {
    Error(ExprType::kAction,
          absl::StrCat("Invalid action reference '", ref, "' in '",
                       Reference(node),
                       "'. No action with this ref exists in the workflow, "
                       "e.g. ACTIONS.my_action.result"),
          ref);
    return;
  }
  CheckResultAccessor(node, ExprType::kAction, ref);
}

void ExprValidator::VisitInputs(const parser::Node& node) {
  static const Value* const kEmpty = new Value(Value::Map());
  const Value& inputs = context_.inputs_context.is_null()
                            ? *kEmpty
                            : context_.inputs_context;
  auto resolved = jsonpath::Resolve(node.path(), inputs, true, node.text);
  if (!resolved.ok()) {
    Error(ExprType::kInput, std::string(resolved.status().message()),
          Segment(node, 0));
  }
}

void ExprValidator::VisitEnv(const parser::Node&) {}

void ExprValidator::VisitTrigger(const parser::Node&) {}

void ExprValidator::VisitLocalVars(const parser::Node&) {}

void ExprValidator::VisitTemplateInputs(const parser::Node& node) {
  Unsupported(node, ExprType::kTemplateActionInput, "workflow actions");
}

void ExprValidator::VisitTemplateSteps(const parser::Node& node) {
  Unsupported(node, ExprType::kTemplateActionStep, "workflow actions");
}

void TemplateActionExprValidator::VisitActions(const parser::Node& node) {
  Unsupported(node, ExprType::kAction, "template actions");
}

void TemplateActionExprValidator::VisitInputs(const parser::Node& node) {
  Unsupported(node, ExprType::kInput, "template actions");
}

void TemplateActionExprValidator::VisitEnv(const parser::Node& node) {
  Unsupported(node, ExprType::kEnv, "template actions");
}

void TemplateActionExprValidator::VisitTrigger(const parser::Node& node) {
  Unsupported(node, ExprType::kTrigger, "template actions");
}

void TemplateActionExprValidator::VisitLocalVars(const parser::Node& node) {
  Unsupported(node, ExprType::kLocalVars, "template actions");
}

void TemplateActionExprValidator::VisitTemplateInputs(
    const parser::Node& node) {
  std::string name = Segment(node, 0);
  if (!context_.template_expects.contains(name)) {
    Error(ExprType::kTemplateActionInput,
          absl::StrCat("Invalid input '", name, "' in '", Reference(node),
                       "'. The template action expects: ",
                       SortedNames(context_.template_expects)),
          name);
  }
}

void TemplateActionExprValidator::VisitTemplateSteps(
    const parser::Node& node) {
  std::string ref = Segment(node, 0);
  if (!context_.template_steps.contains(ref)) {
    Error(ExprType::kTemplateActionStep,
          absl::StrCat("Invalid step reference '", ref, "' in '",
                       Reference(node), "'. The template action has steps: ",
                       SortedNames(context_.template_steps)),
          ref);
    return;
  }
  CheckResultAccessor(node, ExprType::kTemplateActionStep, ref);
}

std::vector<ValidationResult> ValidateTemplates(
    const Value& document, const ExprValidationContext& context,
    Collaborators collaborators, const ValidatorOptions& options,
    bool template_action) {
  std::unique_ptr<BaseExprValidator> validator;
  if (template_action) {
    validator.reset(
        new TemplateActionExprValidator(context, collaborators, options));
  } else {
    validator.reset(new ExprValidator(context, collaborators, options));
  }
  for (const auto& found : templates::ScanDocument(document)) {
    auto root = parser::Parse(found.expression);
    if (root.ok()) {
      validator->Visit(**root, found.location);
      continue;
    }
    ValidationResult result;
    result.message = std::string(root.status().message());
    result.expression_type = ExprType::kGeneric;
    if (!found.location.empty()) {
      result.loc = found.location;
    }
    auto detail = GetErrorDetail(root.status());
    if (detail.has_value()) {
      result.detail = Value(Value::Map{
          {"expression", Value(detail->expression())},
          {"line", Value(static_cast<int64_t>(detail->line()))},
          {"column", Value(static_cast<int64_t>(detail->column()))},
      });
    }
    validator->Add(std::move(result));
  }
  return validator->Results();
}

}  // namespace validator
}  // namespace flowexpr
