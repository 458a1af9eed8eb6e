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

#include <cstdint>
#include <string>

#include "absl/random/random.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"
#include "include/flowexpr/utils/status.h"
#include "src/flowexpr/functions/args.h"
#include "src/flowexpr/functions/registry.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace functions {
namespace {

absl::StatusOr<Value> SerializeJson(const Args& args, const CallContext&) {
  return Value(ValueToJson(args[0]));
}

absl::StatusOr<Value> PrettifyJson(const Args& args, const CallContext&) {
  return Value(ValueToJson(args[0], true));
}

absl::StatusOr<Value> DeserializeJson(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text,
                            StringArg(args, 0, "deserialize_json"));
  auto value = ValueFromJson(text);
  if (!value.ok()) {
    return EvaluationError(absl::StrCat("deserialize_json() invalid JSON: ",
                                        value.status().message()));
  }
  return value;
}

// One document per non-blank line.
absl::StatusOr<Value> DeserializeNdjson(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text,
                            StringArg(args, 0, "deserialize_ndjson"));
  Value::List out;
  int line_number = 0;
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    ++line_number;
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) {
      continue;
    }
    auto value = ValueFromJson(line);
    if (!value.ok()) {
      return EvaluationError(
          absl::StrCat("deserialize_ndjson() invalid JSON on line ",
                       line_number, ": ", value.status().message()));
    }
    out.push_back(*std::move(value));
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> ToBase64(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "to_base64"));
  return Value(absl::Base64Escape(text));
}

// Padded, like the standard alphabet.
absl::StatusOr<Value> ToBase64Url(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text,
                            StringArg(args, 0, "to_base64url"));
  std::string encoded = absl::Base64Escape(text);
  for (char& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return Value(std::move(encoded));
}

absl::StatusOr<Value> FromBase64(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text,
                            StringArg(args, 0, "from_base64"));
  std::string decoded;
  if (!absl::Base64Unescape(text, &decoded)) {
    return EvaluationError(
        absl::StrCat("from_base64() invalid base64 input ", Repr(args[0])));
  }
  return Value(std::move(decoded));
}

absl::StatusOr<Value> FromBase64Url(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text,
                            StringArg(args, 0, "from_base64url"));
  std::string decoded;
  if (!absl::WebSafeBase64Unescape(text, &decoded)) {
    return EvaluationError(absl::StrCat(
        "from_base64url() invalid base64url input ", Repr(args[0])));
  }
  return Value(std::move(decoded));
}

bool IsUnreserved(char c) {
  return absl::ascii_isalnum(c) || c == '-' || c == '_' || c == '.' ||
         c == '~' || c == '/';
}

// Percent-encodes everything but unreserved characters and '/'.
absl::StatusOr<Value> UrlEncode(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "url_encode"));
  std::string out;
  for (char c : text) {
    if (IsUnreserved(c)) {
      out.push_back(c);
    } else {
      absl::StrAppendFormat(&out, "%%%02X", static_cast<unsigned char>(c));
    }
  }
  return Value(std::move(out));
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Malformed escapes are kept as they are.
absl::StatusOr<Value> UrlDecode(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, 0, "url_decode"));
  std::string out;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      int high = HexDigit(text[i + 1]);
      int low = HexDigit(text[i + 2]);
      if (high >= 0 && low >= 0) {
        out.push_back(static_cast<char>(high * 16 + low));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return Value(std::move(out));
}

// Random (version 4) UUID in the canonical 8-4-4-4-12 form.
absl::StatusOr<Value> Uuid4(const Args&, const CallContext&) {
  static absl::Mutex mu(absl::kConstInit);
  static absl::BitGen* gen = new absl::BitGen();
  uint64_t high;
  uint64_t low;
  {
    absl::MutexLock lock(&mu);
    high = absl::Uniform<uint64_t>(*gen);
    low = absl::Uniform<uint64_t>(*gen);
  }
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
  return Value(absl::StrFormat(
      "%08x-%04x-%04x-%04x-%012x", high >> 32, (high >> 16) & 0xFFFF,
      high & 0xFFFF, low >> 48, low & 0xFFFFFFFFFFFFULL));
}

}  // namespace

absl::Status RegisterEncodingFunctions(Registry& registry) {
  const FunctionSpec specs[] = {
      {"serialize_json", &SerializeJson, 1, 1, false},
      {"deserialize_json", &DeserializeJson, 1, 1, false},
      {"prettify_json", &PrettifyJson, 1, 1, false},
      {"deserialize_ndjson", &DeserializeNdjson, 1, 1, false},
      {"to_base64", &ToBase64, 1, 1, false},
      {"from_base64", &FromBase64, 1, 1, false},
      {"to_base64url", &ToBase64Url, 1, 1, false},
      {"from_base64url", &FromBase64Url, 1, 1, false},
      {"url_encode", &UrlEncode, 1, 1, false},
      {"url_decode", &UrlDecode, 1, 1, false},
      {"uuid4", &Uuid4, 0, 0, false},
  };
  for (const auto& spec : specs) {
    FLOWEXPR_RETURN_IF_ERROR(registry.Register(spec));
  }
  return absl::OkStatus();
}

}  // namespace functions
}  // namespace flowexpr
