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

#include "schemadiff/format/format-registry.h"

#include <string>

#include "utils/base/statusor.h"
#include "schemadiff/absl_ports/ascii_str_to_lower.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/format/json-schema-adapter.h"
#include "schemadiff/format/openapi-adapter.h"
#include "schemadiff/format/protobuf-adapter.h"
#include "schemadiff/format/sql-adapter.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/rules/default-rule-tables.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

const FormatCapabilities kJsonSchemaCapabilities = {
    SchemaFormat::JSON_SCHEMA,
    "json_schema",
    "JSON",
    &json_schema_adapter::CheckSyntax,
    &json_schema_adapter::Normalize,
    &json_schema_adapter::Render,
    &JsonSchemaRuleTable,
};

const FormatCapabilities kOpenApiCapabilities = {
    SchemaFormat::OPENAPI,
    "openapi",
    "API",
    &openapi_adapter::CheckSyntax,
    &openapi_adapter::Normalize,
    &openapi_adapter::Render,
    &OpenApiRuleTable,
};

const FormatCapabilities kProtobufCapabilities = {
    SchemaFormat::PROTOBUF,
    "protobuf",
    "PROTO",
    &protobuf_adapter::CheckSyntax,
    &protobuf_adapter::Normalize,
    &protobuf_adapter::Render,
    &ProtobufRuleTable,
};

const FormatCapabilities kSqlCapabilities = {
    SchemaFormat::SQL_DDL,
    "sql_ddl",
    "SQL",
    &sql_adapter::CheckSyntax,
    &sql_adapter::Normalize,
    &sql_adapter::Render,
    &SqlRuleTable,
};

}  // namespace

libtextclassifier3::StatusOr<const FormatCapabilities*> LookupFormat(
    SchemaFormat::Code format) {
  switch (format) {
    case SchemaFormat::JSON_SCHEMA:
      return &kJsonSchemaCapabilities;
    case SchemaFormat::OPENAPI:
      return &kOpenApiCapabilities;
    case SchemaFormat::PROTOBUF:
      return &kProtobufCapabilities;
    case SchemaFormat::SQL_DDL:
      return &kSqlCapabilities;
    case SchemaFormat::UNKNOWN:
      break;
  }
  return InvalidFormatError(absl_ports::StrCat(
      "No adapter for schema format ", FormatName(format)));
}

std::string FormatName(SchemaFormat::Code format) {
  if (SchemaFormat::Code_IsValid(format)) {
    return absl_ports::AsciiStrToLower(SchemaFormat::Code_Name(format));
  }
  return absl_ports::StrCat("format#", std::to_string(static_cast<int>(format)));
}

}  // namespace lib
}  // namespace schemadiff
