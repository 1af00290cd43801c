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

#ifndef SCHEMADIFF_FORMAT_SQL_DDL_LEXER_H_
#define SCHEMADIFF_FORMAT_SQL_DDL_LEXER_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "utils/base/statusor.h"

namespace schemadiff {
namespace lib {

class SqlDdlLexer {
 public:
  enum class TokenType {
    COMMA,       // ','
    SEMICOLON,   // ';'
    DOT,         // '.'
    LPAREN,      // '('
    RPAREN,      // ')'
    STRING,      // 'literal', quotes doubled inside
    IDENTIFIER,  // "quoted", `quoted` or [quoted] identifier
    NUMBER,      // 12, 3.5, 1e3
    WORD,        // Unquoted identifier or keyword
    SYMBOL,      // Any other single character, e.g. '=' or '-'
    // Whitespace, "-- comments" and "/* comments */" are skipped.
  };

  struct LexerToken {
    // For STRING and IDENTIFIER, the text between the quotes with doubled
    // quotes collapsed. For the others, the text as written.
    std::string text;

    TokenType type;

    // 1-based line of the first character.
    int line;
  };

  explicit SqlDdlLexer(std::string_view script) : script_(script) {
    Advance(0);
  }

  // Returns:
  //   A vector of LexerToken on success
  //   UNKNOWN (FormatSpecificError) on an unterminated literal or comment
  libtextclassifier3::StatusOr<std::vector<LexerToken>> ExtractTokens();

 private:
  // Advance to current_index_ + n.
  void Advance(uint32_t n = 1) {
    for (uint32_t i = 0; i < n && current_index_ < script_.size(); ++i) {
      if (script_[current_index_] == '\n') {
        ++line_;
      }
      ++current_index_;
    }
    current_char_ =
        current_index_ < script_.size() ? script_[current_index_] : '\0';
  }

  // Get the character at current_index_ + n.
  char PeekNext(uint32_t n = 1) const {
    if (current_index_ + n >= script_.size()) {
      return '\0';
    }
    return script_[current_index_ + n];
  }

  void SyntaxError(std::string error);

  // Try to match whitespace or a comment and skip it.
  bool ConsumeWhitespace();
  bool ConsumeComment();

  bool ConsumeSingleChar();

  // Try to match a literal closed by terminator. A doubled terminator stands
  // for itself.
  bool ConsumeQuoted(char opening, char terminator, TokenType type);

  bool ConsumeNumber();

  bool ConsumeWord();

  std::string_view script_;
  std::string error_;
  size_t current_index_ = 0;
  char current_char_ = '\0';
  int line_ = 1;
  std::vector<LexerToken> tokens_;
};

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_FORMAT_SQL_DDL_LEXER_H_
