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

#ifndef SCHEMADIFF_FORMAT_SQL_DDL_PARSER_H_
#define SCHEMADIFF_FORMAT_SQL_DDL_PARSER_H_

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/format/sql-ddl-lexer.h"

namespace schemadiff {
namespace lib {

struct ColumnDefinition {
  std::string name;

  // Canonical lower case type with its parameters, e.g. "varchar(20)".
  std::string type;

  bool not_null = false;
  bool primary_key = false;
  bool unique = false;

  bool has_default = false;
  std::string default_value;

  // "table(column)" for foreign keys, empty otherwise.
  std::string references;
};

struct TableDefinition {
  std::string name;
  std::vector<ColumnDefinition> columns;
};

// Canonical name of a possibly multi-word SQL type, e.g.
// "character varying" -> "varchar", "int4" -> "integer".
std::string CanonicalTypeName(std::string_view type);

// Parses the CREATE TABLE statements of a DDL script. Other statements are
// skipped. Table level PRIMARY KEY and UNIQUE constraints are applied to
// the columns they name.
class SqlDdlParser {
 public:
  static SqlDdlParser Create(std::vector<SqlDdlLexer::LexerToken>&& tokens) {
    return SqlDdlParser(std::move(tokens));
  }

  // Returns:
  //   The tables in declaration order on success
  //   UNKNOWN (FormatSpecificError) for input that does not conform to the
  //     grammar
  //   INVALID_ARGUMENT (ParseError) if a table repeats a column or a table
  //     constraint names an unknown column
  libtextclassifier3::StatusOr<std::vector<TableDefinition>> ConsumeScript();

 private:
  explicit SqlDdlParser(std::vector<SqlDdlLexer::LexerToken>&& tokens)
      : tokens_(std::move(tokens)), current_token_(tokens_.begin()) {}

  bool AtEnd() const { return current_token_ == tokens_.end(); }

  bool Match(SqlDdlLexer::TokenType type) const {
    return !AtEnd() && current_token_->type == type;
  }

  // Case insensitive keyword match on an unquoted word.
  bool MatchKeyword(std::string_view keyword) const;

  bool MatchName() const {
    return Match(SqlDdlLexer::TokenType::WORD) ||
           Match(SqlDdlLexer::TokenType::IDENTIFIER);
  }

  libtextclassifier3::Status SyntaxError(std::string_view expected) const;

  libtextclassifier3::Status Consume(SqlDdlLexer::TokenType type);

  libtextclassifier3::Status ConsumeKeyword(std::string_view keyword);

  // Consumes keyword if present.
  bool TryConsumeKeyword(std::string_view keyword);

  libtextclassifier3::StatusOr<std::string> ConsumeName();

  // Possibly schema qualified name, e.g. "app.users".
  libtextclassifier3::StatusOr<std::string> ConsumeQualifiedName();

  libtextclassifier3::StatusOr<std::vector<std::string>> ConsumeNameList();

  // Skips tokens up to, not including, a ',' or ')' outside parentheses, or
  // a ';'. Returns the skipped text.
  std::string SkipClause();

  // Skips the rest of a statement including its ';'.
  void SkipStatement();

  // Constraints declared after the columns, applied once the table is read.
  struct TableConstraints {
    std::vector<std::string> primary_key;
    std::vector<std::vector<std::string>> unique;
  };

  // Appends the table to tables unless it is a CREATE TABLE ... AS query.
  libtextclassifier3::Status ConsumeCreateTable(
      std::vector<TableDefinition>* tables);

  // Returns true if the element was a table constraint.
  libtextclassifier3::StatusOr<bool> ConsumeTableConstraint(
      TableConstraints* constraints);

  // Skips one token, or a parenthesized group.
  void SkipToken();

  libtextclassifier3::StatusOr<ColumnDefinition> ConsumeColumn();

  libtextclassifier3::StatusOr<std::string> ConsumeType();

  libtextclassifier3::StatusOr<std::string> ConsumeDefault();

  std::vector<SqlDdlLexer::LexerToken> tokens_;
  std::vector<SqlDdlLexer::LexerToken>::const_iterator current_token_;
};

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_FORMAT_SQL_DDL_PARSER_H_
