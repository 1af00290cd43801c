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

#include "schemadiff/format/sql-adapter.h"

#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/absl_ports/status_macros.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/absl_ports/str_join.h"
#include "schemadiff/format/sql-ddl-lexer.h"
#include "schemadiff/format/sql-ddl-parser.h"
#include "schemadiff/model/schema-node-util.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/util/logging.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {
namespace sql_adapter {

namespace {

using Operation = MigrationInstructionProto::Operation;

// Tables sit at depth 1 and their columns at depth 2.
constexpr int kColumnDepth = 2;

void AddFlagConstraint(std::string_view name, ScalarNodeProto* scalar) {
  ConstraintProto* constraint = scalar->add_constraints();
  constraint->set_name(std::string(name));
}

SchemaNodeProto NormalizeColumn(const ColumnDefinition& column) {
  SchemaNodeProto node;
  ScalarNodeProto* scalar = node.mutable_scalar();
  scalar->set_primitive(column.type);
  if (column.primary_key) {
    AddFlagConstraint(schema_node_util::kPrimaryKey, scalar);
  }
  if (column.unique && !column.primary_key) {
    AddFlagConstraint(schema_node_util::kUnique, scalar);
  }
  NodeMetadataProto* metadata = node.mutable_metadata();
  metadata->set_format(SchemaFormat::SQL_DDL);
  auto& attributes = *metadata->mutable_attributes();
  bool nullable = !column.not_null && !column.primary_key;
  attributes[std::string(schema_node_util::kNullableAttribute)] =
      nullable ? "true" : "false";
  attributes[std::string(schema_node_util::kPrimaryKeyAttribute)] =
      column.primary_key ? "true" : "false";
  if (column.has_default) {
    ConstraintProto* constraint = scalar->add_constraints();
    constraint->set_name(std::string(schema_node_util::kDefault));
    constraint->set_string_value(column.default_value);
    attributes[std::string(schema_node_util::kDefaultAttribute)] =
        column.default_value;
  }
  if (!column.references.empty()) {
    attributes["references"] = column.references;
  }
  return node;
}

std::string ColumnDefinitionText(std::string_view name,
                                 const SchemaNodeProto& node, bool required) {
  std::string text = absl_ports::StrCat(
      name, " ",
      node.has_scalar() ? node.scalar().primitive()
                        : schema_node_util::NodeSignature(node));
  if (schema_node_util::GetAttribute(node,
                                     schema_node_util::kPrimaryKeyAttribute) ==
      "true") {
    absl_ports::StrAppend(&text, " PRIMARY KEY");
  } else if (required) {
    absl_ports::StrAppend(&text, " NOT NULL");
  }
  if (schema_node_util::HasAttribute(node,
                                     schema_node_util::kDefaultAttribute)) {
    absl_ports::StrAppend(
        &text, " DEFAULT ",
        schema_node_util::GetAttribute(node,
                                       schema_node_util::kDefaultAttribute));
  }
  return text;
}

std::string RenderCreateTable(std::string_view table,
                              const SchemaNodeProto& node) {
  std::vector<std::string> columns;
  if (node.has_object()) {
    for (const FieldProto& field : node.object().fields()) {
      columns.push_back(ColumnDefinitionText(
          field.name(), field.node(),
          schema_node_util::IsRequired(node.object(), field.name())));
    }
  }
  return absl_ports::StrCat("CREATE TABLE ", table, " (",
                            absl_ports::StrJoin(columns, ", "), ");");
}

std::string RenderConstraint(const MigrationInstructionProto& instruction,
                             const std::string& table,
                             const std::string& column) {
  const ChangeDetailsProto& details = instruction.change().details();
  const std::string& constraint = details.constraint();
  bool added = details.old_value().empty() && !details.new_value().empty();
  bool removed = !details.old_value().empty() && details.new_value().empty();
  std::string alter = absl_ports::StrCat("ALTER TABLE ", table, " ");
  if (constraint == schema_node_util::kDefault) {
    if (details.new_value().empty()) {
      return absl_ports::StrCat(alter, "ALTER COLUMN ", column,
                                " DROP DEFAULT;");
    }
    return absl_ports::StrCat(alter, "ALTER COLUMN ", column, " SET DEFAULT ",
                              details.new_value(), ";");
  }
  if (constraint == schema_node_util::kUnique) {
    std::string name = absl_ports::StrCat(table, "_", column, "_key");
    if (added) {
      return absl_ports::StrCat(alter, "ADD CONSTRAINT ", name, " UNIQUE (",
                                column, ");");
    }
    if (removed) {
      return absl_ports::StrCat(alter, "DROP CONSTRAINT ", name, ";");
    }
  }
  if (constraint == schema_node_util::kPrimaryKey) {
    if (added) {
      return absl_ports::StrCat(alter, "ADD PRIMARY KEY (", column, ");");
    }
    if (removed) {
      return absl_ports::StrCat(alter, "DROP CONSTRAINT ", table, "_pkey;");
    }
  }
  return absl_ports::StrCat("-- review ", table, ".", column, ": ",
                            instruction.change().description());
}

}  // namespace

libtextclassifier3::StatusOr<std::vector<TableDefinition>> ParseTables(
    std::string_view script) {
  SqlDdlLexer lexer(script);
  SCHEMADIFF_ASSIGN_OR_RETURN(std::vector<SqlDdlLexer::LexerToken> tokens,
                              lexer.ExtractTokens());
  SqlDdlParser parser = SqlDdlParser::Create(std::move(tokens));
  SCHEMADIFF_ASSIGN_OR_RETURN(std::vector<TableDefinition> tables,
                              parser.ConsumeScript());
  if (tables.empty()) {
    return ParseError("Script declares no CREATE TABLE statement");
  }
  std::unordered_set<std::string> names;
  for (const TableDefinition& table : tables) {
    if (!names.insert(table.name).second) {
      return ParseError(
          absl_ports::StrCat("Table '", table.name, "' is created twice"));
    }
  }
  return tables;
}

libtextclassifier3::Status CheckSyntax(std::string_view content) {
  return ParseTables(content).status();
}

libtextclassifier3::StatusOr<NormalizedSchemaProto> Normalize(
    std::string_view content, int max_depth) {
  if (max_depth < kColumnDepth) {
    return ParseError(absl_ports::StrCat(
        "SQL schemas nest ", std::to_string(kColumnDepth),
        " levels, max_depth is ", std::to_string(max_depth)));
  }
  SCHEMADIFF_ASSIGN_OR_RETURN(std::vector<TableDefinition> tables,
                              ParseTables(content));
  NormalizedSchemaProto schema;
  schema.set_format(SchemaFormat::SQL_DDL);
  SchemaNodeProto* root = schema.mutable_root();
  root->mutable_metadata()->set_format(SchemaFormat::SQL_DDL);
  ObjectNodeProto* root_object = root->mutable_object();
  for (const TableDefinition& table : tables) {
    FieldProto* table_field = root_object->add_fields();
    table_field->set_name(table.name);
    SchemaNodeProto* table_node = table_field->mutable_node();
    table_node->mutable_metadata()->set_format(SchemaFormat::SQL_DDL);
    ObjectNodeProto* columns = table_node->mutable_object();
    for (const ColumnDefinition& column : table.columns) {
      FieldProto* column_field = columns->add_fields();
      column_field->set_name(column.name);
      *column_field->mutable_node() = NormalizeColumn(column);
      if (column.not_null || column.primary_key) {
        columns->add_required(column.name);
      }
    }
    // Tables always exist once created.
    root_object->add_required(table.name);
  }
  SCHEMADIFF_VLOG(1) << "Normalized " << tables.size() << " tables";
  return schema;
}

std::string Render(const MigrationInstructionProto& instruction) {
  const ChangeDetailsProto& details = instruction.change().details();
  const std::string& member = instruction.member();
  if (instruction.container().empty()) {
    // Table level steps.
    switch (instruction.operation()) {
      case Operation::ADD_MEMBER:
        return RenderCreateTable(member, instruction.node());
      case Operation::DROP_MEMBER:
        return absl_ports::StrCat("DROP TABLE ", member, ";");
      case Operation::RENAME_MEMBER:
        return absl_ports::StrCat("ALTER TABLE ", member, " RENAME TO ",
                                  details.new_name(), ";");
      default:
        return absl_ports::StrCat("-- review table ", member, ": ",
                                  instruction.change().description());
    }
  }
  const std::string& table = instruction.container(0);
  std::string alter = absl_ports::StrCat("ALTER TABLE ", table, " ");
  switch (instruction.operation()) {
    case Operation::ADD_MEMBER:
      return absl_ports::StrCat(
          alter, "ADD COLUMN ",
          ColumnDefinitionText(member, instruction.node(),
                               instruction.required()),
          ";");
    case Operation::DROP_MEMBER:
      return absl_ports::StrCat(alter, "DROP COLUMN ", member, ";");
    case Operation::RENAME_MEMBER:
      return absl_ports::StrCat(alter, "RENAME COLUMN ", member, " TO ",
                                details.new_name(), ";");
    case Operation::CHANGE_TYPE:
      return absl_ports::StrCat(alter, "ALTER COLUMN ", member, " TYPE ",
                                details.new_type(), ";");
    case Operation::MAKE_REQUIRED:
      return absl_ports::StrCat(alter, "ALTER COLUMN ", member,
                                " SET NOT NULL;");
    case Operation::MAKE_OPTIONAL:
      return absl_ports::StrCat(alter, "ALTER COLUMN ", member,
                                " DROP NOT NULL;");
    case Operation::TIGHTEN_CONSTRAINT:
    case Operation::LOOSEN_CONSTRAINT:
    case Operation::REVIEW:
      if (!details.constraint().empty()) {
        return RenderConstraint(instruction, table, member);
      }
      break;
    case Operation::UNKNOWN:
      break;
  }
  return absl_ports::StrCat("-- review ", table, ".", member, ": ",
                            instruction.change().description());
}

}  // namespace sql_adapter
}  // namespace lib
}  // namespace schemadiff
