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

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "proto/flowexpr/error_detail.pb.h"

namespace flowexpr {

// Type URL under which an ErrorDetail is attached to a failed status.
extern const char kErrorDetailTypeUrl[];

// Expression text does not conform to the grammar, or a lambda was rejected
// when it was compiled.
absl::Status ParseError(absl::string_view message, int line, int column,
                        absl::string_view raw_error,
                        absl::string_view expression);

// A parse tree could not be reduced to a value.
absl::Status EvaluationError(absl::string_view message,
                             absl::string_view detail_json = "");

// A syntactically valid lambda failed on a particular input.
absl::Status ScriptExecutionError(absl::string_view message);

absl::Status ConfigError(absl::string_view message);

absl::optional<ErrorDetail> GetErrorDetail(const absl::Status& status);

bool IsParseError(const absl::Status& status);
bool IsEvaluationError(const absl::Status& status);
bool IsScriptExecutionError(const absl::Status& status);

// Returns a status of the same code and detail with `prefix` in front of
// the message. Statuses without detail become evaluation errors.
absl::Status WithContext(const absl::Status& status, absl::string_view prefix);

}  // namespace flowexpr
