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

#include <algorithm>
#include <cstdint>
#include <string>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "include/flowexpr/utils/status.h"
#include "re2/re2.h"
#include "src/flowexpr/functions/args.h"
#include "src/flowexpr/functions/registry.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace functions {
namespace {

constexpr char kWhitespace[] = " \t\n\r\f\v";

absl::StatusOr<Value> Capitalize(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "capitalize"));
  absl::AsciiStrToLower(&text);
  if (!text.empty()) {
    text[0] = absl::ascii_toupper(text[0]);
  }
  return Value(std::move(text));
}

absl::StatusOr<Value> Titleize(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "titleize"));
  bool previous_cased = false;
  for (char& c : text) {
    if (absl::ascii_isalpha(c)) {
      c = previous_cased ? absl::ascii_tolower(c) : absl::ascii_toupper(c);
      previous_cased = true;
    } else {
      previous_cased = false;
    }
  }
  return Value(std::move(text));
}

absl::StatusOr<Value> Uppercase(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "uppercase"));
  return Value(absl::AsciiStrToUpper(text));
}

absl::StatusOr<Value> Lowercase(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "lowercase"));
  return Value(absl::AsciiStrToLower(text));
}

absl::StatusOr<Value> Concat(const Args& args, const CallContext&) {
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    FLOWEXPR_ASSIGN_OR_RETURN(std::string part, StringArg(args, i, "concat"));
    out.append(part);
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> Join(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items, ListArg(args, 0, "join"));
  FLOWEXPR_ASSIGN_OR_RETURN(std::string separator, StringArg(args, 1, "join"));
  std::vector<absl::string_view> parts;
  for (size_t i = 0; i < items->size(); ++i) {
    const Value& item = (*items)[i];
    if (!item.is_string()) {
      return EvaluationError(absl::StrCat("join() sequence item ", i,
                                          ": expected str instance, ",
                                          item.type_name(), " found"));
    }
    parts.push_back(item.as_string());
  }
  return Value(absl::StrJoin(parts, separator));
}

Value Affix(const Value& target, absl::string_view prefix,
            absl::string_view suffix) {
  if (target.is_list()) {
    Value::List out;
    for (const auto& item : target.as_list()) {
      out.emplace_back(absl::StrCat(prefix, ToString(item), suffix));
    }
    return Value(std::move(out));
  }
  return Value(absl::StrCat(prefix, ToString(target), suffix));
}

absl::StatusOr<Value> Prefix(const Args& args, const CallContext&) {
  return Affix(args[0], ToString(args[1]), "");
}

absl::StatusOr<Value> Suffix(const Args& args, const CallContext&) {
  return Affix(args[0], "", ToString(args[1]));
}

absl::StatusOr<Value> StartsWith(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "startswith"));
  FLOWEXPR_ASSIGN_OR_RETURN(std::string prefix,
                            StringArg(args, 1, "startswith"));
  return Value(absl::StartsWith(text, prefix));
}

absl::StatusOr<Value> EndsWith(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "endswith"));
  FLOWEXPR_ASSIGN_OR_RETURN(std::string suffix, StringArg(args, 1, "endswith"));
  return Value(absl::EndsWith(text, suffix));
}

absl::StatusOr<Value> Replace(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "replace"));
  FLOWEXPR_ASSIGN_OR_RETURN(std::string from, StringArg(args, 1, "replace"));
  FLOWEXPR_ASSIGN_OR_RETURN(std::string to, StringArg(args, 2, "replace"));
  if (from.empty()) {
    std::string out = to;
    for (char c : text) {
      out.push_back(c);
      out.append(to);
    }
    return Value(std::move(out));
  }
  return Value(absl::StrReplaceAll(text, {{from, to}}));
}

// x[start:start + length] with Python slice clamping.
absl::StatusOr<Value> Slice(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "slice"));
  FLOWEXPR_ASSIGN_OR_RETURN(int64_t start, IntArg(args, 1, "slice"));
  FLOWEXPR_ASSIGN_OR_RETURN(int64_t length, IntArg(args, 2, "slice"));
  int64_t size = static_cast<int64_t>(text.size());
  int64_t end = start + length;
  auto clamp = [size](int64_t index) {
    if (index < 0) {
      index += size;
    }
    return std::max<int64_t>(0, std::min(index, size));
  };
  int64_t from = clamp(start);
  int64_t to = clamp(end);
  if (to <= from) {
    return Value("");
  }
  return Value(text.substr(from, to - from));
}

absl::StatusOr<Value> Split(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "split"));
  const Value& separator = OptionalArg(args, 1, Value());
  std::vector<std::string> parts;
  if (separator.is_null()) {
    parts = absl::StrSplit(text, absl::ByAnyChar(kWhitespace),
                           absl::SkipEmpty());
  } else {
    FLOWEXPR_ASSIGN_OR_RETURN(std::string sep, StringArg(args, 1, "split"));
    if (sep.empty()) {
      return EvaluationError("split() empty separator");
    }
    parts = absl::StrSplit(text, sep);
  }
  Value::List out;
  for (auto& part : parts) {
    out.emplace_back(std::move(part));
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> Strip(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "strip"));
  std::string chars = kWhitespace;
  if (!OptionalArg(args, 1, Value()).is_null()) {
    FLOWEXPR_ASSIGN_OR_RETURN(chars, StringArg(args, 1, "strip"));
  }
  size_t begin = text.find_first_not_of(chars);
  if (begin == std::string::npos) {
    return Value("");
  }
  size_t end = text.find_last_not_of(chars);
  return Value(text.substr(begin, end - begin + 1));
}

// Positional str.format: "{}" and "{0}" fields, "{{" and "}}" escapes.
absl::StatusOr<Value> Format(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string pattern, StringArg(args, 0, "format"));
  std::string out;
  size_t next_auto = 0;
  bool automatic = false;
  bool manual = false;
  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == '}') {
      if (i + 1 < pattern.size() && pattern[i + 1] == '}') {
        out.push_back('}');
        ++i;
        continue;
      }
      return EvaluationError("Single '}' encountered in format string");
    }
    if (c != '{') {
      out.push_back(c);
      continue;
    }
    if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
      out.push_back('{');
      ++i;
      continue;
    }
    size_t close = pattern.find('}', i);
    if (close == std::string::npos) {
      return EvaluationError("Single '{' encountered in format string");
    }
    absl::string_view field(pattern.data() + i + 1, close - i - 1);
    size_t index = 0;
    if (field.empty()) {
      automatic = true;
      index = next_auto++;
    } else if (absl::SimpleAtoi(field, &index)) {
      manual = true;
    } else {
      return EvaluationError(absl::StrCat(
          "format() only supports positional fields, got '{", field, "}'"));
    }
    if (automatic && manual) {
      return EvaluationError(
          "cannot switch from automatic field numbering to manual field "
          "specification");
    }
    if (index + 1 >= args.size()) {
      return EvaluationError(absl::StrCat(
          "Replacement index ", index, " out of range for positional args"));
    }
    out.append(ToString(args[index + 1]));
    i = close;
  }
  return Value(std::move(out));
}

absl::StatusOr<std::unique_ptr<RE2>> CompileRegex(const std::string& pattern,
                                                  absl::string_view function) {
  auto regex = std::unique_ptr<RE2>(new RE2(pattern, RE2::Quiet));
  if (!regex->ok()) {
    return EvaluationError(absl::StrCat(function,
                                        "() invalid regular expression '",
                                        pattern, "': ", regex->error()));
  }
  return std::move(regex);
}

absl::StatusOr<Value> RegexExtract(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string pattern,
                            StringArg(args, 0, "regex_extract"));
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 1, "regex_extract"));
  FLOWEXPR_ASSIGN_OR_RETURN(auto regex, CompileRegex(pattern, "regex_extract"));
  re2::StringPiece match;
  if (!regex->Match(text, 0, text.size(), RE2::UNANCHORED, &match, 1)) {
    return Value();
  }
  return Value(std::string(match.data(), match.size()));
}

absl::StatusOr<bool> MatchesAtStart(const Args& args,
                                    absl::string_view function) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string pattern, StringArg(args, 0, function));
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 1, function));
  FLOWEXPR_ASSIGN_OR_RETURN(auto regex, CompileRegex(pattern, function));
  return regex->Match(text, 0, text.size(), RE2::ANCHOR_START, nullptr, 0);
}

absl::StatusOr<Value> RegexMatch(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(bool matched, MatchesAtStart(args, "regex_match"));
  return Value(matched);
}

absl::StatusOr<Value> RegexNotMatch(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(bool matched,
                            MatchesAtStart(args, "regex_not_match"));
  return Value(!matched);
}

void AppendUtf8(uint32_t code_point, std::string* out) {
  if (code_point == 0 || code_point > 0x10FFFF ||
      (code_point >= 0xD800 && code_point <= 0xDFFF)) {
    code_point = 0xFFFD;
  }
  if (code_point < 0x80) {
    out->push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

// Replaces character references. Unknown names are left as written.
std::string UnescapeHtml(absl::string_view text) {
  static const RE2* const kReference =
      new RE2("&(?:#([0-9]{1,7})|#[xX]([0-9a-fA-F]{1,6})|([a-zA-Z]+));?");
  std::string out;
  re2::StringPiece input(text.data(), text.size());
  re2::StringPiece groups[4];
  size_t pos = 0;
  while (kReference->Match(input, pos, input.size(), RE2::UNANCHORED, groups,
                           4)) {
    const size_t start = groups[0].data() - input.data();
    out.append(input.data() + pos, start - pos);
    pos = start + groups[0].size();
    uint32_t code_point = 0;
    if (!groups[1].empty()) {
      if (!absl::SimpleAtoi(
              absl::string_view(groups[1].data(), groups[1].size()),
              &code_point)) {
        code_point = 0;
      }
      AppendUtf8(code_point, &out);
    } else if (!groups[2].empty()) {
      if (!absl::SimpleHexAtoi(
              absl::string_view(groups[2].data(), groups[2].size()),
              &code_point)) {
        code_point = 0;
      }
      AppendUtf8(code_point, &out);
    } else {
      const std::string name(groups[3].data(), groups[3].size());
      if (name == "amp") {
        out.push_back('&');
      } else if (name == "lt") {
        out.push_back('<');
      } else if (name == "gt") {
        out.push_back('>');
      } else if (name == "quot") {
        out.push_back('"');
      } else if (name == "apos") {
        out.push_back('\'');
      } else if (name == "nbsp") {
        out.push_back(' ');
      } else {
        out.append(groups[0].data(), groups[0].size());
      }
    }
  }
  out.append(input.data() + pos, input.size() - pos);
  return out;
}

// Every run of character data between markup, stripped. Script and style
// bodies are data and are not unescaped; comments and declarations are
// dropped.
absl::StatusOr<Value> ExtractTextFromHtml(const Args& args,
                                          const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string html,
                            StringArg(args, 0, "extract_text_from_html"));
  static const RE2* const kMarkup = new RE2(
      "(?is)<(?:script|style)\\b[^>]*>(.*?)</(?:script|style)\\s*>"
      "|<!--.*?-->|<![^>]*>|<\\?[^>]*>|</?[a-z][^>]*>");
  Value::List out;
  auto emit = [&out](absl::string_view data, bool unescape) {
    if (data.empty()) {
      return;
    }
    std::string text = unescape ? UnescapeHtml(data) : std::string(data);
    out.push_back(Value(std::string(absl::StripAsciiWhitespace(text))));
  };

  re2::StringPiece input(html);
  re2::StringPiece groups[2];
  size_t pos = 0;
  while (pos < input.size() &&
         kMarkup->Match(input, pos, input.size(), RE2::UNANCHORED, groups, 2)) {
    const size_t start = groups[0].data() - input.data();
    emit(absl::string_view(input.data() + pos, start - pos), true);
    if (groups[1].data() != nullptr) {
      emit(absl::string_view(groups[1].data(), groups[1].size()), false);
    }
    pos = start + groups[0].size();
  }
  emit(absl::string_view(input.data() + pos, input.size() - pos), true);
  return Value(std::move(out));
}

}  // namespace

absl::Status RegisterStringFunctions(Registry& registry) {
  const FunctionSpec specs[] = {
      {"capitalize", &Capitalize, 1, 1, false},
      {"concat", &Concat, 0, 0, true},
      {"endswith", &EndsWith, 2, 2, false},
      {"extract_text_from_html", &ExtractTextFromHtml, 1, 1, false},
      {"format", &Format, 1, 1, true},
      {"join", &Join, 2, 2, false},
      {"lowercase", &Lowercase, 1, 1, false},
      {"prefix", &Prefix, 2, 2, false},
      {"replace", &Replace, 3, 3, false},
      {"slice", &Slice, 3, 3, false},
      {"split", &Split, 1, 2, false},
      {"startswith", &StartsWith, 2, 2, false},
      {"strip", &Strip, 1, 2, false},
      {"suffix", &Suffix, 2, 2, false},
      {"titleize", &Titleize, 1, 1, false},
      {"uppercase", &Uppercase, 1, 1, false},
      {"regex_extract", &RegexExtract, 2, 2, false},
      {"regex_match", &RegexMatch, 2, 2, false},
      {"regex_not_match", &RegexNotMatch, 2, 2, false},
  };
  for (const auto& spec : specs) {
    FLOWEXPR_RETURN_IF_ERROR(registry.Register(spec));
  }
  return absl::OkStatus();
}

}  // namespace functions
}  // namespace flowexpr
