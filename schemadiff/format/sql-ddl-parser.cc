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

#include "schemadiff/format/sql-ddl-parser.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/absl_ports/ascii_str_to_lower.h"
#include "schemadiff/absl_ports/status_macros.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/absl_ports/str_join.h"
#include "schemadiff/format/sql-ddl-lexer.h"
#include "schemadiff/util/logging.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

using TokenType = SqlDdlLexer::TokenType;

// Words that end a column type and start a column constraint.
constexpr std::string_view kColumnConstraintKeywords[] = {
    "constraint", "not",        "null",     "primary",   "unique",
    "default",    "check",      "references", "collate", "generated",
    "auto_increment", "autoincrement", "identity", "on", "comment"};

bool IsColumnConstraintKeyword(std::string_view word) {
  std::string lower = absl_ports::AsciiStrToLower(word);
  for (std::string_view keyword : kColumnConstraintKeywords) {
    if (keyword == lower) {
      return true;
    }
  }
  return false;
}

// Words that may follow the parameters of a type, as in
// "timestamp(3) with time zone" or "int(11) unsigned".
constexpr std::string_view kTypeSuffixWords[] = {
    "with", "without", "time", "zone", "unsigned", "zerofill", "varying"};

bool IsTypeSuffixWord(std::string_view word) {
  std::string lower = absl_ports::AsciiStrToLower(word);
  for (std::string_view suffix : kTypeSuffixWords) {
    if (suffix == lower) {
      return true;
    }
  }
  return false;
}

std::string TokenText(const SqlDdlLexer::LexerToken& token) {
  switch (token.type) {
    case TokenType::STRING: {
      std::string quoted = "'";
      for (char c : token.text) {
        quoted += c;
        if (c == '\'') {
          quoted += c;
        }
      }
      quoted += '\'';
      return quoted;
    }
    case TokenType::IDENTIFIER:
      return absl_ports::StrCat("\"", token.text, "\"");
    default:
      return token.text;
  }
}

bool IsWordLike(TokenType type) {
  return type == TokenType::WORD || type == TokenType::NUMBER ||
         type == TokenType::STRING || type == TokenType::IDENTIFIER;
}

}  // namespace

std::string CanonicalTypeName(std::string_view type) {
  static const auto* const kAliases =
      new std::unordered_map<std::string, std::string>{
          {"int", "integer"},
          {"int4", "integer"},
          {"int2", "smallint"},
          {"int8", "bigint"},
          {"bool", "boolean"},
          {"character varying", "varchar"},
          {"character", "char"},
          {"double precision", "double"},
          {"float", "double"},
          {"float8", "double"},
          {"float4", "real"},
          {"decimal", "numeric"},
          {"timestamp without time zone", "timestamp"},
          {"timestamp with time zone", "timestamptz"},
          {"time without time zone", "time"},
      };
  std::string lower = absl_ports::AsciiStrToLower(type);
  auto itr = kAliases->find(lower);
  return itr == kAliases->end() ? lower : itr->second;
}

bool SqlDdlParser::MatchKeyword(std::string_view keyword) const {
  return Match(TokenType::WORD) &&
         absl_ports::AsciiStrToUpper(current_token_->text) == keyword;
}

libtextclassifier3::Status SqlDdlParser::SyntaxError(
    std::string_view expected) const {
  if (AtEnd()) {
    return FormatSpecificError(absl_ports::StrCat(
        "Syntax Error: expected ", expected, " but the script ended"));
  }
  return FormatSpecificError(absl_ports::StrCat(
      "Syntax Error: expected ", expected, " at line ",
      std::to_string(current_token_->line), " near '",
      TokenText(*current_token_), "'"));
}

libtextclassifier3::Status SqlDdlParser::Consume(TokenType type) {
  if (!Match(type)) {
    switch (type) {
      case TokenType::LPAREN:
        return SyntaxError("'('");
      case TokenType::RPAREN:
        return SyntaxError("')'");
      case TokenType::COMMA:
        return SyntaxError("','");
      default:
        return SyntaxError("a token");
    }
  }
  ++current_token_;
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::Status SqlDdlParser::ConsumeKeyword(
    std::string_view keyword) {
  if (!MatchKeyword(keyword)) {
    return SyntaxError(keyword);
  }
  ++current_token_;
  return libtextclassifier3::Status::OK;
}

bool SqlDdlParser::TryConsumeKeyword(std::string_view keyword) {
  if (!MatchKeyword(keyword)) {
    return false;
  }
  ++current_token_;
  return true;
}

libtextclassifier3::StatusOr<std::string> SqlDdlParser::ConsumeName() {
  if (!MatchName()) {
    return SyntaxError("a name");
  }
  std::string name = current_token_->text;
  ++current_token_;
  return name;
}

libtextclassifier3::StatusOr<std::string> SqlDdlParser::ConsumeQualifiedName() {
  SCHEMADIFF_ASSIGN_OR_RETURN(std::string name, ConsumeName());
  while (Match(TokenType::DOT)) {
    ++current_token_;
    SCHEMADIFF_ASSIGN_OR_RETURN(std::string part, ConsumeName());
    absl_ports::StrAppend(&name, ".", part);
  }
  return name;
}

libtextclassifier3::StatusOr<std::vector<std::string>>
SqlDdlParser::ConsumeNameList() {
  SCHEMADIFF_RETURN_IF_ERROR(Consume(TokenType::LPAREN));
  std::vector<std::string> names;
  while (true) {
    SCHEMADIFF_ASSIGN_OR_RETURN(std::string name, ConsumeName());
    names.push_back(std::move(name));
    // Index options such as ASC or a prefix length.
    while (!AtEnd() && !Match(TokenType::COMMA) && !Match(TokenType::RPAREN)) {
      SkipToken();
    }
    if (Match(TokenType::COMMA)) {
      ++current_token_;
      continue;
    }
    SCHEMADIFF_RETURN_IF_ERROR(Consume(TokenType::RPAREN));
    return names;
  }
}

void SqlDdlParser::SkipToken() {
  if (!Match(TokenType::LPAREN)) {
    if (!AtEnd()) {
      ++current_token_;
    }
    return;
  }
  int depth = 0;
  do {
    if (Match(TokenType::LPAREN)) {
      ++depth;
    } else if (Match(TokenType::RPAREN)) {
      --depth;
    }
    ++current_token_;
  } while (!AtEnd() && depth > 0);
}

std::string SqlDdlParser::SkipClause() {
  std::string text;
  int depth = 0;
  TokenType previous = TokenType::SYMBOL;
  while (!AtEnd() && !Match(TokenType::SEMICOLON)) {
    if (depth == 0 &&
        (Match(TokenType::COMMA) || Match(TokenType::RPAREN))) {
      break;
    }
    if (Match(TokenType::LPAREN)) {
      ++depth;
    } else if (Match(TokenType::RPAREN)) {
      --depth;
    }
    if (!text.empty() && IsWordLike(previous) &&
        IsWordLike(current_token_->type)) {
      text += ' ';
    }
    text += TokenText(*current_token_);
    previous = current_token_->type;
    ++current_token_;
  }
  return text;
}

void SqlDdlParser::SkipStatement() {
  int depth = 0;
  while (!AtEnd()) {
    if (Match(TokenType::LPAREN)) {
      ++depth;
    } else if (Match(TokenType::RPAREN)) {
      --depth;
    } else if (Match(TokenType::SEMICOLON) && depth <= 0) {
      ++current_token_;
      return;
    }
    ++current_token_;
  }
}

libtextclassifier3::StatusOr<std::string> SqlDdlParser::ConsumeType() {
  if (!MatchName()) {
    return SyntaxError("a column type");
  }
  std::vector<std::string> words;
  words.push_back(current_token_->text);
  ++current_token_;
  std::string parameters;
  std::string suffix;
  while (!AtEnd()) {
    if (Match(TokenType::LPAREN) && parameters.empty()) {
      ++current_token_;
      std::vector<std::string> values;
      while (!AtEnd() && !Match(TokenType::RPAREN)) {
        if (!Match(TokenType::COMMA)) {
          values.push_back(absl_ports::AsciiStrToLower(current_token_->text));
        }
        ++current_token_;
      }
      SCHEMADIFF_RETURN_IF_ERROR(Consume(TokenType::RPAREN));
      parameters = absl_ports::StrCat("(", absl_ports::StrJoin(values, ","),
                                      ")");
      continue;
    }
    if (Match(TokenType::WORD) &&
        !IsColumnConstraintKeyword(current_token_->text) &&
        (parameters.empty() || IsTypeSuffixWord(current_token_->text))) {
      words.push_back(current_token_->text);
      ++current_token_;
      continue;
    }
    // PostgreSQL arrays lex as an empty bracketed identifier.
    if (Match(TokenType::IDENTIFIER) && current_token_->text.empty()) {
      suffix += "[]";
      ++current_token_;
      continue;
    }
    break;
  }
  return absl_ports::StrCat(CanonicalTypeName(absl_ports::StrJoin(words, " ")),
                            parameters, suffix);
}

libtextclassifier3::StatusOr<std::string> SqlDdlParser::ConsumeDefault() {
  if (AtEnd()) {
    return SyntaxError("a default value");
  }
  if (Match(TokenType::LPAREN)) {
    ++current_token_;
    std::string expression = SkipClause();
    SCHEMADIFF_RETURN_IF_ERROR(Consume(TokenType::RPAREN));
    return absl_ports::StrCat("(", expression, ")");
  }
  if (Match(TokenType::SYMBOL) &&
      (current_token_->text == "-" || current_token_->text == "+")) {
    std::string sign = current_token_->text;
    ++current_token_;
    if (!Match(TokenType::NUMBER)) {
      return SyntaxError("a number");
    }
    std::string number = absl_ports::StrCat(sign, current_token_->text);
    ++current_token_;
    return number;
  }
  if (Match(TokenType::STRING) || Match(TokenType::NUMBER)) {
    std::string value = TokenText(*current_token_);
    ++current_token_;
    return value;
  }
  if (Match(TokenType::WORD)) {
    std::string value = current_token_->text;
    ++current_token_;
    if (Match(TokenType::LPAREN)) {
      ++current_token_;
      std::string arguments = SkipClause();
      SCHEMADIFF_RETURN_IF_ERROR(Consume(TokenType::RPAREN));
      absl_ports::StrAppend(&value, "(", arguments, ")");
    }
    return value;
  }
  return SyntaxError("a default value");
}

libtextclassifier3::StatusOr<ColumnDefinition> SqlDdlParser::ConsumeColumn() {
  ColumnDefinition column;
  SCHEMADIFF_ASSIGN_OR_RETURN(column.name, ConsumeName());
  SCHEMADIFF_ASSIGN_OR_RETURN(column.type, ConsumeType());
  while (!AtEnd() && !Match(TokenType::COMMA) && !Match(TokenType::RPAREN) &&
         !Match(TokenType::SEMICOLON)) {
    if (TryConsumeKeyword("CONSTRAINT")) {
      SCHEMADIFF_RETURN_IF_ERROR(ConsumeName().status());
    } else if (TryConsumeKeyword("NOT")) {
      SCHEMADIFF_RETURN_IF_ERROR(ConsumeKeyword("NULL"));
      column.not_null = true;
    } else if (TryConsumeKeyword("NULL")) {
      column.not_null = false;
    } else if (TryConsumeKeyword("PRIMARY")) {
      SCHEMADIFF_RETURN_IF_ERROR(ConsumeKeyword("KEY"));
      column.primary_key = true;
    } else if (TryConsumeKeyword("UNIQUE")) {
      TryConsumeKeyword("KEY");
      column.unique = true;
    } else if (TryConsumeKeyword("DEFAULT")) {
      SCHEMADIFF_ASSIGN_OR_RETURN(column.default_value, ConsumeDefault());
      column.has_default = true;
    } else if (TryConsumeKeyword("REFERENCES")) {
      SCHEMADIFF_ASSIGN_OR_RETURN(std::string table, ConsumeQualifiedName());
      column.references = table;
      if (Match(TokenType::LPAREN)) {
        SCHEMADIFF_ASSIGN_OR_RETURN(std::vector<std::string> columns,
                                    ConsumeNameList());
        absl_ports::StrAppend(&column.references, "(",
                              absl_ports::StrJoin(columns, ","), ")");
      }
    } else {
      // CHECK (...), COLLATE, ON DELETE, AUTO_INCREMENT and the like.
      SCHEMADIFF_VLOG(1) << "Skipping '" << TokenText(*current_token_)
                         << "' in column " << column.name;
      SkipToken();
    }
  }
  return column;
}

libtextclassifier3::StatusOr<bool> SqlDdlParser::ConsumeTableConstraint(
    TableConstraints* constraints) {
  bool named = false;
  if (TryConsumeKeyword("CONSTRAINT")) {
    SCHEMADIFF_RETURN_IF_ERROR(ConsumeName().status());
    named = true;
  }
  if (TryConsumeKeyword("PRIMARY")) {
    SCHEMADIFF_RETURN_IF_ERROR(ConsumeKeyword("KEY"));
    SCHEMADIFF_ASSIGN_OR_RETURN(constraints->primary_key, ConsumeNameList());
    SkipClause();
    return true;
  }
  if (TryConsumeKeyword("UNIQUE")) {
    if (!TryConsumeKeyword("KEY")) {
      TryConsumeKeyword("INDEX");
    }
    if (MatchName()) {
      ++current_token_;
    }
    SCHEMADIFF_ASSIGN_OR_RETURN(std::vector<std::string> columns,
                                ConsumeNameList());
    constraints->unique.push_back(std::move(columns));
    SkipClause();
    return true;
  }
  if (MatchKeyword("FOREIGN") || MatchKeyword("CHECK") ||
      MatchKeyword("EXCLUDE") || named) {
    std::string skipped = SkipClause();
    SCHEMADIFF_VLOG(1) << "Skipping table constraint " << skipped;
    return true;
  }
  return false;
}

libtextclassifier3::Status SqlDdlParser::ConsumeCreateTable(
    std::vector<TableDefinition>* tables) {
  SCHEMADIFF_RETURN_IF_ERROR(ConsumeKeyword("TABLE"));
  if (TryConsumeKeyword("IF")) {
    SCHEMADIFF_RETURN_IF_ERROR(ConsumeKeyword("NOT"));
    SCHEMADIFF_RETURN_IF_ERROR(ConsumeKeyword("EXISTS"));
  }
  TableDefinition table;
  SCHEMADIFF_ASSIGN_OR_RETURN(table.name, ConsumeQualifiedName());
  if (MatchKeyword("AS")) {
    SCHEMADIFF_LOG(WARNING) << "Skipping CREATE TABLE " << table.name
                            << " AS query, its columns are unknown";
    SkipStatement();
    return libtextclassifier3::Status::OK;
  }
  SCHEMADIFF_RETURN_IF_ERROR(Consume(TokenType::LPAREN));

  TableConstraints constraints;
  std::unordered_map<std::string, size_t> column_index;
  while (true) {
    SCHEMADIFF_ASSIGN_OR_RETURN(bool is_constraint,
                                ConsumeTableConstraint(&constraints));
    if (!is_constraint) {
      SCHEMADIFF_ASSIGN_OR_RETURN(ColumnDefinition column, ConsumeColumn());
      if (!column_index.emplace(column.name, table.columns.size()).second) {
        return ParseError(absl_ports::StrCat("Column '", column.name,
                                             "' is declared twice in table '",
                                             table.name, "'"));
      }
      table.columns.push_back(std::move(column));
    }
    if (Match(TokenType::COMMA)) {
      ++current_token_;
      continue;
    }
    SCHEMADIFF_RETURN_IF_ERROR(Consume(TokenType::RPAREN));
    break;
  }
  // Table options such as ENGINE=InnoDB or WITHOUT ROWID.
  SkipStatement();

  auto find_column =
      [&](const std::string& name) -> libtextclassifier3::StatusOr<size_t> {
    auto itr = column_index.find(name);
    if (itr == column_index.end()) {
      return ParseError(absl_ports::StrCat("Constraint of table '", table.name,
                                           "' names unknown column '", name,
                                           "'"));
    }
    return itr->second;
  };
  for (const std::string& name : constraints.primary_key) {
    SCHEMADIFF_ASSIGN_OR_RETURN(size_t index, find_column(name));
    table.columns[index].primary_key = true;
  }
  for (const std::vector<std::string>& columns : constraints.unique) {
    if (columns.size() != 1) {
      SCHEMADIFF_VLOG(1) << "Ignoring composite unique constraint of "
                         << table.name;
      continue;
    }
    SCHEMADIFF_ASSIGN_OR_RETURN(size_t index, find_column(columns[0]));
    table.columns[index].unique = true;
  }
  tables->push_back(std::move(table));
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::StatusOr<std::vector<TableDefinition>>
SqlDdlParser::ConsumeScript() {
  std::vector<TableDefinition> tables;
  while (!AtEnd()) {
    if (Match(TokenType::SEMICOLON)) {
      ++current_token_;
      continue;
    }
    int line = current_token_->line;
    if (TryConsumeKeyword("CREATE")) {
      while (TryConsumeKeyword("TEMPORARY") || TryConsumeKeyword("TEMP") ||
             TryConsumeKeyword("UNLOGGED") || TryConsumeKeyword("GLOBAL") ||
             TryConsumeKeyword("LOCAL")) {
      }
      if (MatchKeyword("TABLE")) {
        SCHEMADIFF_RETURN_IF_ERROR(ConsumeCreateTable(&tables));
        continue;
      }
    }
    SCHEMADIFF_VLOG(1) << "Skipping statement at line " << line;
    SkipStatement();
  }
  return tables;
}

}  // namespace lib
}  // namespace schemadiff
