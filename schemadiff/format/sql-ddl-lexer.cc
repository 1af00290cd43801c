// Copyright (C) 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "schemadiff/format/sql-ddl-lexer.h"

#include <cctype>
#include <string>
#include <utility>
#include <vector>

#include "utils/base/statusor.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

bool IsWordStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         (static_cast<unsigned char>(c) & 0x80) != 0;
}

bool IsWordChar(char c) {
  return IsWordStart(c) || std::isdigit(static_cast<unsigned char>(c)) ||
         c == '$';
}

bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

}  // namespace

void SqlDdlLexer::SyntaxError(std::string error) {
  if (error_.empty()) {
    error_ = absl_ports::StrCat("line ", std::to_string(line_), ": ", error);
  }
  current_index_ = script_.size();
  current_char_ = '\0';
}

bool SqlDdlLexer::ConsumeWhitespace() {
  if (current_char_ == '\0' ||
      !std::isspace(static_cast<unsigned char>(current_char_))) {
    return false;
  }
  Advance();
  return true;
}

bool SqlDdlLexer::ConsumeComment() {
  if (current_char_ == '-' && PeekNext() == '-') {
    while (current_char_ != '\0' && current_char_ != '\n') {
      Advance();
    }
    return true;
  }
  if (current_char_ == '/' && PeekNext() == '*') {
    Advance(2);
    while (current_char_ != '\0' &&
           !(current_char_ == '*' && PeekNext() == '/')) {
      Advance();
    }
    if (current_char_ == '\0') {
      SyntaxError("missing terminating */ of a comment");
      return false;
    }
    Advance(2);
    return true;
  }
  return false;
}

bool SqlDdlLexer::ConsumeSingleChar() {
  TokenType type;
  switch (current_char_) {
    case ',':
      type = TokenType::COMMA;
      break;
    case ';':
      type = TokenType::SEMICOLON;
      break;
    case '.':
      if (IsDigit(PeekNext())) {
        return false;
      }
      type = TokenType::DOT;
      break;
    case '(':
      type = TokenType::LPAREN;
      break;
    case ')':
      type = TokenType::RPAREN;
      break;
    default:
      return false;
  }
  tokens_.push_back({std::string(1, current_char_), type, line_});
  Advance();
  return true;
}

bool SqlDdlLexer::ConsumeQuoted(char opening, char terminator,
                                TokenType type) {
  if (current_char_ != opening) {
    return false;
  }
  int start_line = line_;
  Advance();
  std::string text;
  while (true) {
    if (current_char_ == '\0') {
      SyntaxError(absl_ports::StrCat("missing terminating ",
                                     std::string(1, terminator),
                                     " character"));
      return false;
    }
    if (current_char_ == terminator) {
      if (PeekNext() != terminator) {
        break;
      }
      Advance();
    }
    text.push_back(current_char_);
    Advance();
  }
  Advance();
  tokens_.push_back({std::move(text), type, start_line});
  return true;
}

bool SqlDdlLexer::ConsumeNumber() {
  if (!IsDigit(current_char_) &&
      !(current_char_ == '.' && IsDigit(PeekNext()))) {
    return false;
  }
  std::string text;
  while (IsDigit(current_char_) || current_char_ == '.') {
    text.push_back(current_char_);
    Advance();
  }
  if ((current_char_ == 'e' || current_char_ == 'E') &&
      (IsDigit(PeekNext()) ||
       ((PeekNext() == '-' || PeekNext() == '+') && IsDigit(PeekNext(2))))) {
    text.push_back(current_char_);
    Advance();
    text.push_back(current_char_);
    Advance();
    while (IsDigit(current_char_)) {
      text.push_back(current_char_);
      Advance();
    }
  }
  tokens_.push_back({std::move(text), TokenType::NUMBER, line_});
  return true;
}

bool SqlDdlLexer::ConsumeWord() {
  if (!IsWordStart(current_char_)) {
    return false;
  }
  std::string text;
  while (current_char_ != '\0' && IsWordChar(current_char_)) {
    text.push_back(current_char_);
    Advance();
  }
  tokens_.push_back({std::move(text), TokenType::WORD, line_});
  return true;
}

libtextclassifier3::StatusOr<std::vector<SqlDdlLexer::LexerToken>>
SqlDdlLexer::ExtractTokens() {
  while (current_char_ != '\0') {
    if (ConsumeWhitespace() || ConsumeComment() || ConsumeSingleChar() ||
        ConsumeQuoted('\'', '\'', TokenType::STRING) ||
        ConsumeQuoted('"', '"', TokenType::IDENTIFIER) ||
        ConsumeQuoted('`', '`', TokenType::IDENTIFIER) ||
        ConsumeQuoted('[', ']', TokenType::IDENTIFIER) || ConsumeNumber() ||
        ConsumeWord()) {
      continue;
    }
    if (!error_.empty()) {
      break;
    }
    tokens_.push_back({std::string(1, current_char_), TokenType::SYMBOL, line_});
    Advance();
  }
  if (!error_.empty()) {
    return FormatSpecificError(absl_ports::StrCat("Syntax Error: ", error_));
  }
  return tokens_;
}

}  // namespace lib
}  // namespace schemadiff
