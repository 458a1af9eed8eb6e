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

#ifndef FLOWEXPR_JSONPATH_JSONPATH_H
#define FLOWEXPR_JSONPATH_JSONPATH_H

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "include/flowexpr/utils/value.h"

namespace flowexpr {
namespace jsonpath {

struct Step;

// A compiled path. Supported syntax:
//
//   $ or a leading name       root, e.g. "$.a" or "ACTIONS.a"
//   .name  ['name'] ["name"]  child by key, quoting allows '.' and other
//                             reserved characters in keys
//   [n]  [-n]                 list index
//   [*]  .*                   all children
//   ..name  ..*               recursive descent
//   [a,b]  ['a','b']          unions of indices or keys
//   [start:end:step]          list slice
//   [?(@.field OP literal)]   filter on list items, OP in == != < <= > >=,
//   [?field OP literal]       several terms may be joined with &&; a bare
//   [?field]                  field tests for presence
//   .sub(/regex/, 'repl')     regex replacement on string matches
class Path {
 public:
  Path(std::string text, std::vector<std::shared_ptr<Step>> steps);
  ~Path();

  const std::string& text() const { return text_; }

  // True when the text contains an explicit "[*]" marker.
  bool has_wildcard_marker() const;

  // All matches in document order.
  std::vector<Value> Find(const Value& root) const;

 private:
  std::string text_;
  std::vector<std::shared_ptr<Step>> steps_;
};

absl::StatusOr<Path> Compile(absl::string_view expression);

// Evaluates `expression` against `operand`.
//
// More than one match, or an expression containing "[*]", yields a list.
// Exactly one match yields the bare value. No match yields an evaluation
// error in strict mode and null otherwise. `context` is prepended to the
// expression in messages, e.g. "ACTIONS".
absl::StatusOr<Value> Resolve(absl::string_view expression,
                              const Value& operand, bool strict,
                              absl::string_view context = "");

}  // namespace jsonpath
}  // namespace flowexpr

#endif  // FLOWEXPR_JSONPATH_JSONPATH_H
