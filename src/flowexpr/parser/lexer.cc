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

#include "src/flowexpr/parser/lexer.h"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "include/flowexpr/utils/status.h"

namespace flowexpr {
namespace parser {
namespace {

// Longest symbols first so that "==" wins over "=".
constexpr absl::string_view kSymbols[] = {
    "->", "==", "!=", "<=", ">=", "&&", "||", "<", ">", "!", "+", "-",
    "*",  "/",  "%",  ".",  ",",  ":",  "(",  ")", "[", "]", "{", "}",
};

class Lexer {
 public:
  explicit Lexer(absl::string_view text) : text_(text) {}

  absl::StatusOr<std::vector<Token>> Run() {
    std::vector<Token> tokens;
    while (true) {
      SkipWhitespace();
      Token token;
      token.begin = pos_;
      token.line = line_;
      token.column = column();
      if (pos_ >= text_.size()) {
        token.type = TokenType::kEnd;
        token.end = pos_;
        tokens.push_back(std::move(token));
        return tokens;
      }
      char c = text_[pos_];
      if (absl::ascii_isalpha(c) || c == '_') {
        LexName(&token);
      } else if (absl::ascii_isdigit(c)) {
        LexNumber(&token);
      } else if (c == '\'' || c == '"') {
        auto status = LexString(&token);
        if (!status.ok()) {
          return status;
        }
      } else if (!LexSymbol(&token)) {
        std::string shown(1, c);
        return ParseError(
            absl::StrCat("Unexpected character '", shown, "' at line ", line_,
                         ", column ", column(), "."),
            line_, column(),
            absl::StrCat("No terminal matches '", shown,
                         "' in the current parser context, at line ", line_,
                         " col ", column()),
            text_);
      }
      token.end = pos_;
      tokens.push_back(std::move(token));
    }
  }

 private:
  int column() const { return static_cast<int>(pos_ - line_start_) + 1; }

  void Advance() {
    if (text_[pos_] == '\n') {
      ++line_;
      line_start_ = pos_ + 1;
    }
    ++pos_;
  }

  void SkipWhitespace() {
    while (pos_ < text_.size() && absl::ascii_isspace(text_[pos_])) {
      Advance();
    }
  }

  void LexName(Token* token) {
    size_t start = pos_;
    while (pos_ < text_.size() &&
           (absl::ascii_isalnum(text_[pos_]) || text_[pos_] == '_')) {
      ++pos_;
    }
    token->type = TokenType::kName;
    token->text = std::string(text_.substr(start, pos_ - start));
  }

  void LexNumber(Token* token) {
    size_t start = pos_;
    while (pos_ < text_.size() && absl::ascii_isdigit(text_[pos_])) {
      ++pos_;
    }
    token->type = TokenType::kInteger;
    if (pos_ + 1 < text_.size() && text_[pos_] == '.' &&
        absl::ascii_isdigit(text_[pos_ + 1])) {
      ++pos_;
      while (pos_ < text_.size() && absl::ascii_isdigit(text_[pos_])) {
        ++pos_;
      }
      token->type = TokenType::kFloat;
    }
    token->text = std::string(text_.substr(start, pos_ - start));
  }

  absl::Status LexString(Token* token) {
    size_t start = pos_;
    char quote = text_[pos_];
    Advance();
    std::string contents;
    while (pos_ < text_.size() && text_[pos_] != quote) {
      char c = text_[pos_];
      if (c == '\\' && pos_ + 1 < text_.size()) {
        Advance();
        char escaped = text_[pos_];
        switch (escaped) {
          case 'n':
            contents.push_back('\n');
            break;
          case 't':
            contents.push_back('\t');
            break;
          case 'r':
            contents.push_back('\r');
            break;
          case '\\':
          case '\'':
          case '"':
            contents.push_back(escaped);
            break;
          default:
            // Unknown escapes are kept verbatim, regex patterns rely on it.
            contents.push_back('\\');
            contents.push_back(escaped);
        }
        Advance();
        continue;
      }
      contents.push_back(c);
      Advance();
    }
    if (pos_ >= text_.size()) {
      return ParseError(
          absl::StrCat("Unexpected end of expression: unterminated string "
                       "literal starting at line ",
                       token->line, ", column ", token->column, "."),
          token->line, token->column,
          absl::StrCat("Unterminated string literal ",
                       text_.substr(start)),
          text_);
    }
    Advance();
    token->type = TokenType::kString;
    token->text = std::string(text_.substr(start, pos_ - start));
    token->str = std::move(contents);
    return absl::OkStatus();
  }

  bool LexSymbol(Token* token) {
    for (absl::string_view symbol : kSymbols) {
      if (text_.substr(pos_, symbol.size()) == symbol) {
        pos_ += symbol.size();
        token->type = TokenType::kSymbol;
        token->text = std::string(symbol);
        return true;
      }
    }
    return false;
  }

  absl::string_view text_;
  size_t pos_ = 0;
  size_t line_start_ = 0;
  int line_ = 1;
};

}  // namespace

absl::StatusOr<std::vector<Token>> Tokenize(absl::string_view text) {
  return Lexer(text).Run();
}

std::string Describe(const Token& token) {
  if (token.type == TokenType::kEnd) {
    return "end of expression";
  }
  return absl::StrCat("'", token.text, "'");
}

}  // namespace parser
}  // namespace flowexpr
