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

#include "include/flowexpr/utils/status.h"

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace flowexpr {

const char kErrorDetailTypeUrl[] = "type.flowexpr.io/flowexpr.ErrorDetail";

namespace {

absl::Status MakeStatus(absl::StatusCode code, absl::string_view message,
                        const ErrorDetail& detail) {
  absl::Status status(code, message);
  status.SetPayload(kErrorDetailTypeUrl,
                    absl::Cord(detail.SerializeAsString()));
  return status;
}

bool HasKind(const absl::Status& status, ErrorDetail::Kind kind) {
  auto detail = GetErrorDetail(status);
  return detail && detail->kind() == kind;
}

}  // namespace

absl::Status ParseError(absl::string_view message, int line, int column,
                        absl::string_view raw_error,
                        absl::string_view expression) {
  ErrorDetail detail;
  detail.set_kind(ErrorDetail::PARSE);
  detail.set_message(std::string(message));
  detail.set_line(line);
  detail.set_column(column);
  detail.set_raw_error(std::string(raw_error));
  detail.set_expression(std::string(expression));
  return MakeStatus(absl::StatusCode::kInvalidArgument, message, detail);
}

absl::Status EvaluationError(absl::string_view message,
                             absl::string_view detail_json) {
  ErrorDetail detail;
  detail.set_kind(ErrorDetail::EVALUATION);
  detail.set_message(std::string(message));
  detail.set_detail_json(std::string(detail_json));
  return MakeStatus(absl::StatusCode::kFailedPrecondition, message, detail);
}

absl::Status ScriptExecutionError(absl::string_view message) {
  ErrorDetail detail;
  detail.set_kind(ErrorDetail::SCRIPT_EXECUTION);
  detail.set_message(std::string(message));
  return MakeStatus(absl::StatusCode::kAborted, message, detail);
}

absl::Status ConfigError(absl::string_view message) {
  ErrorDetail detail;
  detail.set_kind(ErrorDetail::CONFIG);
  detail.set_message(std::string(message));
  return MakeStatus(absl::StatusCode::kInvalidArgument, message, detail);
}

absl::optional<ErrorDetail> GetErrorDetail(const absl::Status& status) {
  auto payload = status.GetPayload(kErrorDetailTypeUrl);
  if (!payload) {
    return absl::nullopt;
  }
  ErrorDetail detail;
  if (!detail.ParseFromString(std::string(*payload))) {
    return absl::nullopt;
  }
  return detail;
}

bool IsParseError(const absl::Status& status) {
  return HasKind(status, ErrorDetail::PARSE);
}

bool IsEvaluationError(const absl::Status& status) {
  return HasKind(status, ErrorDetail::EVALUATION);
}

bool IsScriptExecutionError(const absl::Status& status) {
  return HasKind(status, ErrorDetail::SCRIPT_EXECUTION);
}

absl::Status WithContext(const absl::Status& status,
                         absl::string_view prefix) {
  if (status.ok()) {
    return status;
  }
  auto detail = GetErrorDetail(status);
  if (!detail) {
    return EvaluationError(absl::StrCat(prefix, status.message()));
  }
  return MakeStatus(status.code(), absl::StrCat(prefix, status.message()),
                    *detail);
}

}  // namespace flowexpr
