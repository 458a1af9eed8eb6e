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

#ifndef FLOWEXPR_CONFIG_CONFIG_H
#define FLOWEXPR_CONFIG_CONFIG_H

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "include/flowexpr/evaluator/evaluator.h"
#include "include/flowexpr/lambda/sandbox.h"
#include "include/flowexpr/validator/validator.h"
#include "proto/flowexpr/config.pb.h"
#include "src/flowexpr/utils/logger.h"

namespace flowexpr {
namespace config {

// Parses a JSON engine configuration into `config`. Unknown fields are
// ignored and defaults are applied. Malformed input is a ConfigError.
absl::Status ParseEngineConfig(absl::string_view json, EngineConfig* config);

// Fills every unset field with its default.
void ApplyDefaults(EngineConfig* config);

utils::Logger::Level ToLoggerLevel(LogLevel level);

// Makes a ThresholdLogger at the configured level the active logger.
void InstallLogger(const EngineConfig& config);

lambda::SandboxOptions MakeSandboxOptions(const EngineConfig& config);

// `sandbox` is not owned and must outlive every evaluation using the
// returned options.
evaluator::EvaluatorOptions MakeEvaluatorOptions(
    const EngineConfig& config, const lambda::LambdaSandbox* sandbox);

validator::ValidatorOptions MakeValidatorOptions(const EngineConfig& config);

}  // namespace config
}  // namespace flowexpr

#endif  // FLOWEXPR_CONFIG_CONFIG_H
