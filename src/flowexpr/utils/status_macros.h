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

#include <utility>

#include "absl/status/status.h"

#define FLOWEXPR_RETURN_IF_ERROR(expr)                   \
  do {                                                   \
    const ::absl::Status flowexpr_status_ = (expr);      \
    if (!flowexpr_status_.ok()) return flowexpr_status_; \
  } while (0)

// FLOWEXPR_ASSIGN_OR_RETURN(auto value, MaybeValue());
// Declares or assigns `lhs` from an absl::StatusOr, returning the status
// from the enclosing function when it is not ok.
#define FLOWEXPR_ASSIGN_OR_RETURN(lhs, rexpr)                           \
  FLOWEXPR_STATUS_MACROS_ASSIGN_OR_RETURN_(                             \
      FLOWEXPR_STATUS_MACROS_CONCAT_(flowexpr_status_or_, __LINE__), lhs, \
      rexpr)

#define FLOWEXPR_STATUS_MACROS_ASSIGN_OR_RETURN_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                             \
  if (!statusor.ok()) {                                                \
    return statusor.status();                                          \
  }                                                                    \
  lhs = std::move(statusor).value()

#define FLOWEXPR_STATUS_MACROS_CONCAT_INNER_(x, y) x##y
#define FLOWEXPR_STATUS_MACROS_CONCAT_(x, y) \
  FLOWEXPR_STATUS_MACROS_CONCAT_INNER_(x, y)
