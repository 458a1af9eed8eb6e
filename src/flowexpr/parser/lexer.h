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

#ifndef FLOWEXPR_PARSER_LEXER_H
#define FLOWEXPR_PARSER_LEXER_H

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace flowexpr {
namespace parser {

enum class TokenType {
  kEnd,
  kName,
  kInteger,
  kFloat,
  kString,
  // Operators and punctuation, the symbol itself is in Token::text.
  kSymbol,
};

struct Token {
  TokenType type;
  // Raw source text. For strings, the quoted form.
  std::string text;
  // Unescaped contents of a string literal.
  std::string str;
  size_t begin = 0;
  size_t end = 0;
  int line = 1;
  int column = 1;

  bool Is(TokenType t, absl::string_view s) const {
    return type == t && text == s;
  }
  bool IsSymbol(absl::string_view s) const { return Is(TokenType::kSymbol, s); }
  bool IsName(absl::string_view s) const { return Is(TokenType::kName, s); }
};

// Splits an expression into tokens, ending with a kEnd token. Fails with a
// ParseError status on characters that start no token and on unterminated
// string literals.
absl::StatusOr<std::vector<Token>> Tokenize(absl::string_view text);

// Human readable token description for error messages.
std::string Describe(const Token& token);

}  // namespace parser
}  // namespace flowexpr

#endif  // FLOWEXPR_PARSER_LEXER_H
