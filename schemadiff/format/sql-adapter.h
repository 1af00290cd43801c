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

#ifndef SCHEMADIFF_FORMAT_SQL_ADAPTER_H_
#define SCHEMADIFF_FORMAT_SQL_ADAPTER_H_

#include <string>
#include <string_view>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/format/sql-ddl-parser.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {
namespace sql_adapter {

// Returns:
//   The CREATE TABLE statements of script on success
//   UNKNOWN (FormatSpecificError) on a syntax error
//   INVALID_ARGUMENT (ParseError) if the script declares no table or repeats
//     a table or column
libtextclassifier3::StatusOr<std::vector<TableDefinition>> ParseTables(
    std::string_view script);

libtextclassifier3::Status CheckSyntax(std::string_view content);

// Normalizes each table into an object of its columns. A column is required
// when it is NOT NULL or part of the primary key.
libtextclassifier3::StatusOr<NormalizedSchemaProto> Normalize(
    std::string_view content, int max_depth);

// Renders a step as a PostgreSQL flavoured DDL statement, e.g.
// "ALTER TABLE users DROP COLUMN id;".
std::string Render(const MigrationInstructionProto& instruction);

}  // namespace sql_adapter
}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_FORMAT_SQL_ADAPTER_H_
