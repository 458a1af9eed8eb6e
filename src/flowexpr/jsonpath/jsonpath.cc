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

#include "src/flowexpr/jsonpath/jsonpath.h"

#include <algorithm>
#include <cstdlib>
#include <deque>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"
#include "include/flowexpr/utils/status.h"
#include "re2/re2.h"
#include "src/flowexpr/utils/logger.h"

namespace flowexpr {
namespace jsonpath {

struct FilterTerm {
  // Keys below the candidate item. Empty means the item itself.
  std::vector<std::string> field;
  // Empty for a presence test.
  std::string op;
  Value literal;
};

struct Step {
  enum class Kind {
    kField,
    kWildcard,
    kDescendantField,
    kDescendantWildcard,
    kIndices,
    kKeys,
    kSlice,
    kFilter,
    kSub,
  };

  explicit Step(Kind kind) : kind(kind) {}

  Kind kind;
  std::string name;
  std::vector<int64_t> indices;
  std::vector<std::string> keys;
  absl::optional<int64_t> start;
  absl::optional<int64_t> end;
  absl::optional<int64_t> step;
  std::vector<FilterTerm> terms;
  std::shared_ptr<RE2> regex;
  std::string replacement;
};

namespace {

bool IsNameChar(char c) {
  return absl::ascii_isalnum(c) || c == '_' || c == '-';
}

class Compiler {
 public:
  explicit Compiler(absl::string_view text) : text_(text) {}

  absl::Status Run(std::vector<std::shared_ptr<Step>>* steps) {
    if (text_.empty()) {
      return Error("empty expression");
    }
    if (Peek() == '$') {
      ++pos_;
    } else if (IsNameChar(Peek())) {
      auto step = std::make_shared<Step>(Step::Kind::kField);
      step->name = ReadName();
      steps->push_back(step);
    } else if (Peek() != '[' && Peek() != '.') {
      return Error("expected '$', a name, '.' or '['");
    }

    while (pos_ < text_.size()) {
      absl::Status status;
      if (Consume("..")) {
        status = ParseDescendant(steps);
      } else if (Consume(".")) {
        status = ParseDot(steps);
      } else if (Consume("[")) {
        status = ParseBracket(steps);
      } else {
        status = Error("unexpected character");
      }
      if (!status.ok()) {
        return status;
      }
    }
    return absl::OkStatus();
  }

 private:
  char Peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  bool Consume(absl::string_view token) {
    if (text_.substr(pos_, token.size()) == token) {
      pos_ += token.size();
      return true;
    }
    return false;
  }

  void SkipWhitespace() {
    while (pos_ < text_.size() && absl::ascii_isspace(text_[pos_])) {
      ++pos_;
    }
  }

  absl::Status Expect(absl::string_view token) {
    SkipWhitespace();
    if (!Consume(token)) {
      return Error(absl::StrCat("expected '", token, "'"));
    }
    return absl::OkStatus();
  }

  absl::Status Error(absl::string_view why) const {
    return absl::InvalidArgumentError(
        absl::StrCat(why, " at position ", pos_));
  }

  std::string ReadName() {
    size_t start = pos_;
    while (pos_ < text_.size() && IsNameChar(text_[pos_])) {
      ++pos_;
    }
    return std::string(text_.substr(start, pos_ - start));
  }

  absl::Status ReadQuoted(std::string* out) {
    char quote = Peek();
    if (quote != '\'' && quote != '"') {
      return Error("expected a quoted key");
    }
    ++pos_;
    while (pos_ < text_.size() && text_[pos_] != quote) {
      if (text_[pos_] == '\\' && pos_ + 1 < text_.size()) {
        ++pos_;
      }
      out->push_back(text_[pos_++]);
    }
    if (pos_ >= text_.size()) {
      return Error("unterminated quoted key");
    }
    ++pos_;
    return absl::OkStatus();
  }

  bool ReadInt(int64_t* out) {
    size_t start = pos_;
    if (Peek() == '-') {
      ++pos_;
    }
    while (pos_ < text_.size() && absl::ascii_isdigit(text_[pos_])) {
      ++pos_;
    }
    return absl::SimpleAtoi(text_.substr(start, pos_ - start), out);
  }

  absl::Status ParseDescendant(std::vector<std::shared_ptr<Step>>* steps) {
    if (Consume("*")) {
      steps->push_back(std::make_shared<Step>(Step::Kind::kDescendantWildcard));
      return absl::OkStatus();
    }
    if (!IsNameChar(Peek())) {
      return Error("expected a name after '..'");
    }
    auto step = std::make_shared<Step>(Step::Kind::kDescendantField);
    step->name = ReadName();
    steps->push_back(step);
    return absl::OkStatus();
  }

  absl::Status ParseDot(std::vector<std::shared_ptr<Step>>* steps) {
    if (Consume("*")) {
      steps->push_back(std::make_shared<Step>(Step::Kind::kWildcard));
      return absl::OkStatus();
    }
    if (Consume("sub(")) {
      return ParseSub(steps);
    }
    if (!IsNameChar(Peek())) {
      return Error("expected a name after '.'");
    }
    auto step = std::make_shared<Step>(Step::Kind::kField);
    step->name = ReadName();
    steps->push_back(step);
    return absl::OkStatus();
  }

  // sub(/regex/, 'replacement')
  absl::Status ParseSub(std::vector<std::shared_ptr<Step>>* steps) {
    SkipWhitespace();
    if (!Consume("/")) {
      return Error("expected '/' to open the pattern");
    }
    std::string pattern;
    while (pos_ < text_.size() && text_[pos_] != '/') {
      if (text_[pos_] == '\\' && pos_ + 1 < text_.size() &&
          text_[pos_ + 1] == '/') {
        ++pos_;
      }
      pattern.push_back(text_[pos_++]);
    }
    if (!Consume("/")) {
      return Error("unterminated pattern");
    }
    auto status = Expect(",");
    if (!status.ok()) {
      return status;
    }
    SkipWhitespace();
    auto step = std::make_shared<Step>(Step::Kind::kSub);
    status = ReadQuoted(&step->replacement);
    if (!status.ok()) {
      return status;
    }
    status = Expect(")");
    if (!status.ok()) {
      return status;
    }
    step->regex = std::make_shared<RE2>(pattern, RE2::Quiet);
    if (!step->regex->ok()) {
      return Error(absl::StrCat("invalid pattern: ", step->regex->error()));
    }
    steps->push_back(step);
    return absl::OkStatus();
  }

  absl::Status ParseBracket(std::vector<std::shared_ptr<Step>>* steps) {
    SkipWhitespace();
    if (Consume("*")) {
      steps->push_back(std::make_shared<Step>(Step::Kind::kWildcard));
      return Expect("]");
    }
    if (Consume("?")) {
      return ParseFilter(steps);
    }
    if (Peek() == '\'' || Peek() == '"') {
      auto step = std::make_shared<Step>(Step::Kind::kKeys);
      while (true) {
        std::string key;
        auto status = ReadQuoted(&key);
        if (!status.ok()) {
          return status;
        }
        step->keys.push_back(std::move(key));
        SkipWhitespace();
        if (!Consume(",")) {
          break;
        }
        SkipWhitespace();
      }
      steps->push_back(step);
      return Expect("]");
    }
    if (Peek() == '-' || Peek() == ':' || absl::ascii_isdigit(Peek())) {
      return ParseIndices(steps);
    }
    return Error("unsupported bracket selector");
  }

  absl::Status ParseIndices(std::vector<std::shared_ptr<Step>>* steps) {
    absl::optional<int64_t> first;
    int64_t number = 0;
    if (Peek() != ':') {
      if (!ReadInt(&number)) {
        return Error("expected an index");
      }
      first = number;
    }
    SkipWhitespace();
    if (Consume(":")) {
      auto step = std::make_shared<Step>(Step::Kind::kSlice);
      step->start = first;
      SkipWhitespace();
      if (Peek() != ':' && Peek() != ']') {
        if (!ReadInt(&number)) {
          return Error("expected a slice end");
        }
        step->end = number;
      }
      SkipWhitespace();
      if (Consume(":")) {
        SkipWhitespace();
        if (Peek() != ']') {
          if (!ReadInt(&number) || number == 0) {
            return Error("expected a non-zero slice step");
          }
          step->step = number;
        }
      }
      steps->push_back(step);
      return Expect("]");
    }
    auto step = std::make_shared<Step>(Step::Kind::kIndices);
    step->indices.push_back(*first);
    while (Consume(",")) {
      SkipWhitespace();
      if (!ReadInt(&number)) {
        return Error("expected an index");
      }
      step->indices.push_back(number);
      SkipWhitespace();
    }
    steps->push_back(step);
    return Expect("]");
  }

  absl::Status ParseLiteral(Value* out) {
    SkipWhitespace();
    if (Peek() == '\'' || Peek() == '"') {
      std::string text;
      auto status = ReadQuoted(&text);
      *out = Value(std::move(text));
      return status;
    }
    if (Peek() == '-' || absl::ascii_isdigit(Peek())) {
      size_t start = pos_;
      if (Peek() == '-') {
        ++pos_;
      }
      while (pos_ < text_.size() &&
             (absl::ascii_isdigit(text_[pos_]) || text_[pos_] == '.')) {
        ++pos_;
      }
      std::string number(text_.substr(start, pos_ - start));
      int64_t integer = 0;
      if (absl::SimpleAtoi(number, &integer)) {
        *out = Value(integer);
        return absl::OkStatus();
      }
      double real = 0;
      if (absl::SimpleAtod(number, &real)) {
        *out = Value(real);
        return absl::OkStatus();
      }
      return Error("invalid number");
    }
    std::string word = ReadName();
    if (word == "true" || word == "True") {
      *out = Value(true);
    } else if (word == "false" || word == "False") {
      *out = Value(false);
    } else if (word == "null" || word == "None") {
      *out = Value();
    } else {
      return Error("expected a literal");
    }
    return absl::OkStatus();
  }

  absl::Status ParseFilterTerm(FilterTerm* term) {
    SkipWhitespace();
    if (Consume("@")) {
      while (Consume(".")) {
        if (!IsNameChar(Peek())) {
          return Error("expected a field name");
        }
        term->field.push_back(ReadName());
      }
    } else if (IsNameChar(Peek())) {
      term->field.push_back(ReadName());
      while (Consume(".")) {
        if (!IsNameChar(Peek())) {
          return Error("expected a field name");
        }
        term->field.push_back(ReadName());
      }
    } else {
      return Error("expected '@' or a field name");
    }
    SkipWhitespace();
    for (absl::string_view op : {"==", "!=", "<=", ">=", "<", ">", "="}) {
      if (Consume(op)) {
        term->op = op == "=" ? "==" : std::string(op);
        return ParseLiteral(&term->literal);
      }
    }
    return absl::OkStatus();
  }

  absl::Status ParseFilter(std::vector<std::shared_ptr<Step>>* steps) {
    SkipWhitespace();
    bool parenthesized = Consume("(");
    auto step = std::make_shared<Step>(Step::Kind::kFilter);
    while (true) {
      FilterTerm term;
      auto status = ParseFilterTerm(&term);
      if (!status.ok()) {
        return status;
      }
      step->terms.push_back(std::move(term));
      SkipWhitespace();
      if (!Consume("&&") && !Consume("&")) {
        break;
      }
    }
    if (parenthesized) {
      auto status = Expect(")");
      if (!status.ok()) {
        return status;
      }
    }
    steps->push_back(step);
    return Expect("]");
  }

  absl::string_view text_;
  size_t pos_ = 0;
};

bool CompareWith(const Value& lhs, const std::string& op, const Value& rhs) {
  if (op == "==") {
    return lhs == rhs;
  }
  if (op == "!=") {
    return lhs != rhs;
  }
  int order = 0;
  if (lhs.is_numeric() && rhs.is_numeric()) {
    double a = lhs.as_double();
    double b = rhs.as_double();
    order = a < b ? -1 : (a > b ? 1 : 0);
  } else if (lhs.is_string() && rhs.is_string()) {
    order = lhs.as_string().compare(rhs.as_string());
  } else {
    return false;
  }
  if (op == "<") return order < 0;
  if (op == "<=") return order <= 0;
  if (op == ">") return order > 0;
  if (op == ">=") return order >= 0;
  return false;
}

bool MatchesFilter(const Value& item, const std::vector<FilterTerm>& terms) {
  for (const auto& term : terms) {
    const Value* field = &item;
    for (const auto& key : term.field) {
      field = field->Find(key);
      if (field == nullptr) {
        return false;
      }
    }
    if (!term.op.empty() && !CompareWith(*field, term.op, term.literal)) {
      return false;
    }
  }
  return true;
}

void CollectDescendants(const Value& value, const std::string* name,
                        std::vector<const Value*>* out) {
  if (value.is_map()) {
    if (name != nullptr) {
      const Value* found = value.Find(*name);
      if (found != nullptr) {
        out->push_back(found);
      }
    }
    for (const auto& entry : value.as_map()) {
      if (name == nullptr) {
        out->push_back(&entry.second);
      }
      CollectDescendants(entry.second, name, out);
    }
  } else if (value.is_list()) {
    for (const auto& item : value.as_list()) {
      if (name == nullptr) {
        out->push_back(&item);
      }
      CollectDescendants(item, name, out);
    }
  }
}

void ApplySlice(const Step& step, const Value::List& list,
                std::vector<const Value*>* out) {
  int64_t size = static_cast<int64_t>(list.size());
  int64_t stride = step.step.value_or(1);
  auto clamp = [size, stride](absl::optional<int64_t> bound,
                              int64_t fallback) {
    if (!bound) {
      return fallback;
    }
    int64_t value = *bound < 0 ? *bound + size : *bound;
    if (stride > 0) {
      return std::max<int64_t>(0, std::min(value, size));
    }
    return std::max<int64_t>(-1, std::min(value, size - 1));
  };
  if (stride > 0) {
    for (int64_t i = clamp(step.start, 0); i < clamp(step.end, size);
         i += stride) {
      out->push_back(&list[i]);
    }
  } else {
    for (int64_t i = clamp(step.start, size - 1); i > clamp(step.end, -1);
         i += stride) {
      out->push_back(&list[i]);
    }
  }
}

void ApplyStep(const Step& step, const Value& value,
               std::vector<const Value*>* out, std::deque<Value>* arena) {
  switch (step.kind) {
    case Step::Kind::kField: {
      const Value* found = value.Find(step.name);
      if (found != nullptr) {
        out->push_back(found);
      }
      return;
    }
    case Step::Kind::kWildcard:
      if (value.is_map()) {
        for (const auto& entry : value.as_map()) {
          out->push_back(&entry.second);
        }
      } else if (value.is_list()) {
        for (const auto& item : value.as_list()) {
          out->push_back(&item);
        }
      }
      return;
    case Step::Kind::kDescendantField:
      CollectDescendants(value, &step.name, out);
      return;
    case Step::Kind::kDescendantWildcard:
      CollectDescendants(value, nullptr, out);
      return;
    case Step::Kind::kIndices:
      if (value.is_list()) {
        int64_t size = static_cast<int64_t>(value.as_list().size());
        for (int64_t index : step.indices) {
          int64_t resolved = index < 0 ? index + size : index;
          if (resolved >= 0 && resolved < size) {
            out->push_back(&value.as_list()[resolved]);
          }
        }
      }
      return;
    case Step::Kind::kKeys:
      for (const auto& key : step.keys) {
        const Value* found = value.Find(key);
        if (found != nullptr) {
          out->push_back(found);
        }
      }
      return;
    case Step::Kind::kSlice:
      if (value.is_list()) {
        ApplySlice(step, value.as_list(), out);
      }
      return;
    case Step::Kind::kFilter:
      if (value.is_list()) {
        for (const auto& item : value.as_list()) {
          if (MatchesFilter(item, step.terms)) {
            out->push_back(&item);
          }
        }
      }
      return;
    case Step::Kind::kSub:
      if (value.is_string()) {
        std::string replaced = value.as_string();
        RE2::GlobalReplace(&replaced, *step.regex, step.replacement);
        arena->emplace_back(std::move(replaced));
        out->push_back(&arena->back());
      }
      return;
  }
}

std::string Qualified(absl::string_view context, absl::string_view expression) {
  if (context.empty()) {
    return std::string(expression);
  }
  if (absl::StartsWith(expression, ".") || absl::StartsWith(expression, "[")) {
    return absl::StrCat(context, expression);
  }
  return absl::StrCat(context, ".", expression);
}

}  // namespace

Path::Path(std::string text, std::vector<std::shared_ptr<Step>> steps)
    : text_(std::move(text)), steps_(std::move(steps)) {}

Path::~Path() {}

bool Path::has_wildcard_marker() const {
  return absl::StrContains(text_, "[*]");
}

std::vector<Value> Path::Find(const Value& root) const {
  std::deque<Value> arena;
  std::vector<const Value*> current{&root};
  for (const auto& step : steps_) {
    std::vector<const Value*> next;
    for (const Value* value : current) {
      ApplyStep(*step, *value, &next, &arena);
    }
    current.swap(next);
    if (current.empty()) {
      break;
    }
  }
  std::vector<Value> matches;
  matches.reserve(current.size());
  for (const Value* value : current) {
    matches.push_back(*value);
  }
  return matches;
}

absl::StatusOr<Path> Compile(absl::string_view expression) {
  std::vector<std::shared_ptr<Step>> steps;
  auto status = Compiler(expression).Run(&steps);
  if (!status.ok()) {
    return status;
  }
  return Path(std::string(expression), std::move(steps));
}

absl::StatusOr<Value> Resolve(absl::string_view expression,
                              const Value& operand, bool strict,
                              absl::string_view context) {
  std::string qualified = Qualified(context, expression);
  if (!operand.is_map() && !operand.is_list()) {
    return EvaluationError(
        absl::StrCat("Expected a mapping or list operand for jsonpath '",
                     qualified, "', got '", operand.type_name(), "'"));
  }
  auto path = Compile(expression);
  if (!path.ok()) {
    FLOWEXPR_DEBUG("Invalid jsonpath %s: %s", qualified.c_str(),
                   std::string(path.status().message()).c_str());
    return EvaluationError(absl::StrCat("Invalid jsonpath '", qualified, "'"));
  }
  std::vector<Value> matches = path->Find(operand);
  if (!matches.empty()) {
    if (matches.size() > 1 || path->has_wildcard_marker()) {
      return Value(Value::List(std::move(matches)));
    }
    return std::move(matches[0]);
  }
  // No match, wildcard or not.
  if (!strict) {
    return Value();
  }
  Value detail(Value::Map{{"expression", qualified}, {"operand", operand}});
  return EvaluationError(
      absl::StrCat("Couldn't resolve expression '", qualified,
                   "' in the context"),
      ValueToJson(detail));
}

}  // namespace jsonpath
}  // namespace flowexpr
