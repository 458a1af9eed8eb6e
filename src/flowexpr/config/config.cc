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

#include "include/flowexpr/config/config.h"

#include <cstdint>
#include <memory>
#include <string>

#include "absl/strings/str_cat.h"
#include "google/protobuf/util/json_util.h"
#include "include/flowexpr/utils/status.h"

using google::protobuf::util::JsonParseOptions;
using google::protobuf::util::JsonStringToMessage;

namespace flowexpr {
namespace config {
namespace {

constexpr bool kDefaultStrict = true;
constexpr char kDefaultEnvironment[] = "default";
constexpr uint32_t kDefaultMaxSteps = 100000;

}  // namespace

absl::Status ParseEngineConfig(absl::string_view json, EngineConfig* config) {
  JsonParseOptions json_options;
  json_options.ignore_unknown_fields = true;
  const auto status =
      JsonStringToMessage(std::string(json), config, json_options);
  if (!status.ok()) {
    FLOWEXPR_WARN("Cannot parse engine configuration: %s",
                  status.ToString().c_str());
    return ConfigError(
        absl::StrCat("Cannot parse engine configuration: ", status.ToString()));
  }
  if (config->lambda().has_max_steps() &&
      config->lambda().max_steps().value() == 0) {
    return ConfigError("lambda.max_steps must be positive");
  }
  ApplyDefaults(config);
  return absl::OkStatus();
}

void ApplyDefaults(EngineConfig* config) {
  if (!config->has_strict()) {
    config->mutable_strict()->set_value(kDefaultStrict);
  }
  if (config->environment().empty()) {
    config->set_environment(kDefaultEnvironment);
  }
  if (!config->lambda().has_max_steps()) {
    config->mutable_lambda()->mutable_max_steps()->set_value(kDefaultMaxSteps);
  }
}

utils::Logger::Level ToLoggerLevel(LogLevel level) {
  switch (level) {
    case LogLevel::TRACE:
      return utils::Logger::Level::TRACE_;
    case LogLevel::DEBUG:
      return utils::Logger::Level::DEBUG_;
    case LogLevel::WARN:
      return utils::Logger::Level::WARN_;
    case LogLevel::ERROR:
      return utils::Logger::Level::ERROR_;
    default:
      return utils::Logger::Level::INFO_;
  }
}

void InstallLogger(const EngineConfig& config) {
  utils::setLogger(std::unique_ptr<utils::Logger>(
      new utils::ThresholdLogger(ToLoggerLevel(config.log_level()))));
}

lambda::SandboxOptions MakeSandboxOptions(const EngineConfig& config) {
  lambda::SandboxOptions options;
  options.allowed_names.assign(config.lambda().allowed_names().begin(),
                               config.lambda().allowed_names().end());
  options.max_steps = config.lambda().has_max_steps()
                          ? config.lambda().max_steps().value()
                          : kDefaultMaxSteps;
  return options;
}

evaluator::EvaluatorOptions MakeEvaluatorOptions(
    const EngineConfig& config, const lambda::LambdaSandbox* sandbox) {
  evaluator::EvaluatorOptions options;
  options.strict =
      config.has_strict() ? config.strict().value() : kDefaultStrict;
  options.sandbox = sandbox;
  return options;
}

validator::ValidatorOptions MakeValidatorOptions(const EngineConfig& config) {
  validator::ValidatorOptions options;
  if (!config.environment().empty()) {
    options.environment = config.environment();
  }
  return options;
}

}  // namespace config
}  // namespace flowexpr
