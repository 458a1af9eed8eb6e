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

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "include/flowexpr/parser/parser.h"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

namespace flowexpr {
namespace validator {
namespace {

class MockSecretStore : public SecretStore {
 public:
  MOCK_METHOD(absl::StatusOr<std::vector<SecretRecord>>, Lookup,
              (const std::string& name, const std::string& environment),
              (override));
};

class MockOAuthProviderRegistry : public OAuthProviderRegistry {
 public:
  MOCK_METHOD(absl::StatusOr<bool>, Exists,
              (const std::string& provider_id, const std::string& grant_type),
              (override));
};

std::vector<SecretRecord> Records(
    std::vector<std::vector<std::string>> keys) {
  std::vector<SecretRecord> out;
  for (auto& k : keys) {
    SecretRecord record;
    record.keys = std::move(k);
    out.push_back(std::move(record));
  }
  return out;
}

std::vector<ValidationResult> Errors(const std::vector<ValidationResult>& all) {
  std::vector<ValidationResult> out;
  for (const auto& result : all) {
    if (result.status == ValidationStatus::kError) {
      out.push_back(result);
    }
  }
  return out;
}

class ValidatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    context_.action_refs = {"webhook", "fetch"};
    auto inputs = ValueFromJson(R"({"url": "https://x", "ids": [1, 2]})");
    ASSERT_TRUE(inputs.ok());
    context_.inputs_context = *inputs;
    context_.template_steps = {"call_api"};
    context_.template_expects = {"channel", "text"};
    collaborators_.secrets = &secrets_;
    collaborators_.oauth = &oauth_;
  }

  std::vector<ValidationResult> Validate(const std::string& expression,
                                         bool template_action = false) {
    auto root = parser::Parse(expression);
    EXPECT_TRUE(root.ok()) << expression << ": " << root.status();
    if (!root.ok()) {
      return {};
    }
    std::unique_ptr<BaseExprValidator> validator;
    if (template_action) {
      validator.reset(new TemplateActionExprValidator(context_, collaborators_,
                                                      options_));
    } else {
      validator.reset(new ExprValidator(context_, collaborators_, options_));
    }
    validator->Visit(**root, "args.value");
    return validator->Results();
  }

  // Expects exactly one error and returns it.
  ValidationResult OneError(const std::string& expression,
                            bool template_action = false) {
    auto errors = Errors(Validate(expression, template_action));
    EXPECT_EQ(1u, errors.size()) << expression;
    return errors.empty() ? ValidationResult() : errors[0];
  }

  ExprValidationContext context_;
  ValidatorOptions options_;
  Collaborators collaborators_;
  ::testing::StrictMock<MockSecretStore> secrets_;
  ::testing::StrictMock<MockOAuthProviderRegistry> oauth_;
};

TEST_F(ValidatorTest, ValidExpressionsHaveNoErrors) {
  EXPECT_TRUE(Validate("ACTIONS.webhook.result").empty());
  EXPECT_TRUE(Validate("ACTIONS.fetch.result_typename").empty());
  EXPECT_TRUE(Validate("ACTIONS.fetch.result[0].id").empty());
  EXPECT_TRUE(Validate("ACTIONS.fetch.result[*]").empty());
  EXPECT_TRUE(Validate("INPUTS.url").empty());
  EXPECT_TRUE(Validate("INPUTS.ids[1]").empty());
  EXPECT_TRUE(Validate("FN.add(1, 2) -> str").empty());
  EXPECT_TRUE(Validate("ENV.region || TRIGGER.x || var.y").empty());
  EXPECT_TRUE(Validate("for var.id in INPUTS.ids").empty());
  EXPECT_TRUE(Validate("VARS.config.region").empty());
}

TEST_F(ValidatorTest, UnknownActionRef) {
  ValidationResult error = OneError("ACTIONS.missing.result");
  EXPECT_EQ(ExprType::kAction, error.expression_type);
  EXPECT_EQ("missing", error.ref.value_or(""));
  EXPECT_EQ("args.value", error.loc.value_or(""));
  EXPECT_THAT(error.message, HasSubstr("Invalid action reference 'missing'"));
}

TEST_F(ValidatorTest, BadResultAccessor) {
  ValidationResult error = OneError("ACTIONS.webhook.output");
  EXPECT_EQ(ExprType::kAction, error.expression_type);
  EXPECT_THAT(error.message, HasSubstr("Invalid property 'output'"));
  EXPECT_THAT(error.message, HasSubstr("ACTIONS.webhook.result"));

  EXPECT_THAT(OneError("ACTIONS.webhook").message,
              HasSubstr("Missing property"));
}

TEST_F(ValidatorTest, InputsResolveAgainstTheInputsContext) {
  ValidationResult error = OneError("INPUTS.nope");
  EXPECT_EQ(ExprType::kInput, error.expression_type);
  EXPECT_THAT(error.message, HasSubstr("INPUTS.nope"));
}

TEST_F(ValidatorTest, MissingSecret) {
  EXPECT_CALL(secrets_, Lookup("xxxxxxxxxxxxxxxxxxxxx", "default"))
      .WillOnce(Return(std::vector<SecretRecord>()));
  auto results = Validate("SECRETS.xxxxxxxxxxxxxxxxxxxxx.WORLD");
  ASSERT_EQ(1u, results.size());
  EXPECT_EQ(ValidationStatus::kError, results[0].status);
  EXPECT_EQ(ExprType::kSecret, results[0].expression_type);
  EXPECT_THAT(results[0].message, HasSubstr("xxxxxxxxxxxxxxxxxxxxx"));
  EXPECT_THAT(results[0].message, HasSubstr("missing in the secrets manager"));
}

TEST_F(ValidatorTest, SecretKeys) {
  options_.environment = "staging";
  EXPECT_CALL(secrets_, Lookup("api", "staging"))
      .Times(1)
      .WillRepeatedly(Return(Records({{"KEY", "OTHER"}})));
  // Each reference is looked up once.
  auto results = Validate("FN.concat(SECRETS.api.KEY, SECRETS.api.KEY)");
  ASSERT_EQ(1u, results.size());
  EXPECT_EQ(ValidationStatus::kSuccess, results[0].status);

  EXPECT_CALL(secrets_, Lookup("api", "staging"))
      .WillOnce(Return(Records({{"KEY"}})));
  ValidationResult error = OneError("SECRETS.api.NOPE");
  EXPECT_THAT(error.message, HasSubstr("is missing required keys: NOPE"));

  EXPECT_CALL(secrets_, Lookup("api", "staging"))
      .WillOnce(Return(Records({{"KEY"}, {"KEY"}})));
  EXPECT_THAT(OneError("SECRETS.api.KEY").message,
              HasSubstr("Multiple secrets found"));
}

TEST_F(ValidatorTest, CollaboratorFailuresAreIsolated) {
  EXPECT_CALL(secrets_, Lookup("down", _))
      .WillOnce(Return(absl::UnavailableError("connection refused")));
  EXPECT_CALL(secrets_, Lookup("up", _))
      .WillOnce(Return(Records({{"KEY"}})));
  auto results = Validate("FN.concat(SECRETS.down.KEY, SECRETS.up.KEY)");
  ASSERT_EQ(2u, results.size());
  auto errors = Errors(results);
  ASSERT_EQ(1u, errors.size());
  EXPECT_THAT(errors[0].message, HasSubstr("Could not validate secret 'down'"));
  EXPECT_THAT(errors[0].message, HasSubstr("connection refused"));
}

TEST_F(ValidatorTest, OAuthSecrets) {
  EXPECT_CALL(oauth_, Exists("slack", kAuthorizationCodeGrant))
      .WillOnce(Return(true));
  auto results = Validate("SECRETS.slack_oauth.SLACK_USER_TOKEN");
  ASSERT_EQ(1u, results.size());
  EXPECT_EQ(ValidationStatus::kSuccess, results[0].status);

  EXPECT_CALL(oauth_, Exists("microsoft_teams", kClientCredentialsGrant))
      .WillOnce(Return(false));
  EXPECT_THAT(
      OneError("SECRETS.microsoft_teams_oauth.MICROSOFT_TEAMS_SERVICE_TOKEN")
          .message,
      HasSubstr("Required OAuth integration 'microsoft_teams' (grant_type: "
                "client_credentials) is not configured"));

  EXPECT_CALL(oauth_, Exists("github", _))
      .WillOnce(Return(absl::DeadlineExceededError("timeout")));
  EXPECT_THAT(OneError("SECRETS.github_oauth.GITHUB_USER_TOKEN").message,
              HasSubstr("Could not validate OAuth integration 'github'"));
}

TEST_F(ValidatorTest, MalformedOAuthTokenIsRejectedWithoutLookup) {
  ValidationResult error = OneError("SECRETS.slack_oauth.SLACK_TOKEN");
  EXPECT_EQ(ExprType::kSecret, error.expression_type);
  EXPECT_THAT(error.message,
              HasSubstr("Expected SLACK_USER_TOKEN or SLACK_SERVICE_TOKEN"));
}

TEST_F(ValidatorTest, FunctionNamesAndArity) {
  ValidationResult error = OneError("FN.nonexistent(1)");
  EXPECT_EQ(ExprType::kFunction, error.expression_type);
  EXPECT_THAT(error.message, HasSubstr("Unknown function name 'nonexistent'"));

  EXPECT_THAT(OneError("FN.now(1)").message,
              HasSubstr("Expected at most 0, got 1"));
  EXPECT_THAT(OneError("FN.add(1)").message,
              HasSubstr("Expected at least 2, got 1"));
  EXPECT_THAT(OneError("FN.add.map([1], 2, 3)").message,
              HasSubstr("Too many positional arguments for function 'add'"));
  EXPECT_TRUE(Validate("FN.concat('a', 'b', 'c', 'd')").empty());
  // Arguments are validated too.
  EXPECT_THAT(OneError("FN.length(ACTIONS.missing.result)").message,
              HasSubstr("missing"));
}

TEST_F(ValidatorTest, LiteralCasts) {
  ValidationResult error = OneError("int('abc')");
  EXPECT_EQ(ExprType::kTypecast, error.expression_type);
  EXPECT_THAT(OneError("'abc' -> float").message, HasSubstr("Cannot convert"));
  EXPECT_TRUE(Validate("int('12')").empty());
  EXPECT_TRUE(Validate("int(INPUTS.url)").empty());
}

TEST_F(ValidatorTest, VarsDepth) {
  EXPECT_EQ(ExprType::kVars, OneError("VARS.a.b.c").expression_type);
}

TEST_F(ValidatorTest, TemplateContextsAreRejectedInWorkflows) {
  EXPECT_EQ(ExprType::kTemplateActionInput,
            OneError("inputs.channel").expression_type);
  EXPECT_EQ(ExprType::kTemplateActionStep,
            OneError("steps.call_api.result").expression_type);
}

TEST_F(ValidatorTest, TemplateActions) {
  EXPECT_TRUE(Validate("inputs.channel", true).empty());
  EXPECT_TRUE(Validate("steps.call_api.result[0]", true).empty());
  EXPECT_TRUE(Validate("FN.uppercase(inputs.text)", true).empty());

  ValidationResult error = OneError("inputs.other", true);
  EXPECT_EQ(ExprType::kTemplateActionInput, error.expression_type);
  EXPECT_THAT(error.message, HasSubstr("expects: channel, text"));

  EXPECT_THAT(OneError("steps.nope.result", true).message,
              HasSubstr("Invalid step reference 'nope'"));
  EXPECT_THAT(OneError("steps.call_api.data", true).message,
              HasSubstr("Invalid property 'data'"));
}

TEST_F(ValidatorTest, TemplateActionsAreContextFree) {
  struct Case {
    const char* expression;
    ExprType type;
  };
  const Case cases[] = {
      {"ACTIONS.webhook.result", ExprType::kAction},
      {"INPUTS.url", ExprType::kInput},
      {"ENV.region", ExprType::kEnv},
      {"TRIGGER.data", ExprType::kTrigger},
      {"var.item", ExprType::kLocalVars},
  };
  for (const auto& c : cases) {
    ValidationResult error = OneError(c.expression, true);
    EXPECT_EQ(c.type, error.expression_type) << c.expression;
    EXPECT_THAT(error.message, HasSubstr("not supported in template actions"));
  }
}

TEST_F(ValidatorTest, ValidateTemplatesScansDocuments) {
  EXPECT_CALL(secrets_, Lookup("api", "default"))
      .WillOnce(Return(Records({{"KEY"}})));
  auto document = ValueFromJson(R"({
    "url": "${{ INPUTS.url }}/${{ ACTIONS.missing.result }}",
    "headers": {"auth": "Bearer ${{ SECRETS.api.KEY }}"},
    "broken": ["${{ FN.add(1, }}"],
    "plain": 1
  })");
  ASSERT_TRUE(document.ok());
  auto results = ValidateTemplates(*document, context_, collaborators_,
                                   options_);
  auto errors = Errors(results);
  ASSERT_EQ(2u, errors.size());
  EXPECT_EQ(ExprType::kAction, errors[0].expression_type);
  EXPECT_EQ("url", errors[0].loc.value_or(""));
  EXPECT_EQ(ExprType::kGeneric, errors[1].expression_type);
  EXPECT_EQ("broken[0]", errors[1].loc.value_or(""));
  ASSERT_TRUE(errors[1].detail.has_value());
  EXPECT_NE(nullptr, errors[1].detail->Find("column"));
  EXPECT_EQ(3u, results.size());
}

TEST_F(ValidatorTest, MissingCollaboratorsAreReported) {
  collaborators_.secrets = nullptr;
  ValidationResult error = OneError("SECRETS.api.KEY");
  EXPECT_THAT(error.message, HasSubstr("no secret store is available"));
}

TEST(ExprTypeTest, Names) {
  EXPECT_EQ("action", ExprTypeName(ExprType::kAction));
  EXPECT_EQ("template_action_step",
            ExprTypeName(ExprType::kTemplateActionStep));
}

}  // namespace
}  // namespace validator
}  // namespace flowexpr
