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

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/testing/common-matchers.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

using ::testing::Eq;
using ::testing::NotNull;
using ::testing::StrEq;

TEST(FormatRegistryTest, EveryFormatHasAnAdapter) {
  for (SchemaFormat::Code format :
       {SchemaFormat::JSON_SCHEMA, SchemaFormat::OPENAPI,
        SchemaFormat::PROTOBUF, SchemaFormat::SQL_DDL}) {
    SCHEMADIFF_ASSERT_OK_AND_ASSIGN(const FormatCapabilities* capabilities,
                                    LookupFormat(format));
    EXPECT_THAT(capabilities->format, Eq(format));
    EXPECT_THAT(capabilities->check_syntax, NotNull());
    EXPECT_THAT(capabilities->normalize, NotNull());
    EXPECT_THAT(capabilities->render, NotNull());
    ASSERT_THAT(capabilities->default_rule_table, NotNull());
    EXPECT_THAT(capabilities->default_rule_table().format(), Eq(format));
    EXPECT_THAT(capabilities->name, StrEq(FormatName(format)));
  }
}

TEST(FormatRegistryTest, IssuePrefixes) {
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(const FormatCapabilities* json,
                                  LookupFormat(SchemaFormat::JSON_SCHEMA));
  EXPECT_THAT(json->issue_prefix, StrEq("JSON"));
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(const FormatCapabilities* openapi,
                                  LookupFormat(SchemaFormat::OPENAPI));
  EXPECT_THAT(openapi->issue_prefix, StrEq("API"));
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(const FormatCapabilities* protobuf,
                                  LookupFormat(SchemaFormat::PROTOBUF));
  EXPECT_THAT(protobuf->issue_prefix, StrEq("PROTO"));
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(const FormatCapabilities* sql,
                                  LookupFormat(SchemaFormat::SQL_DDL));
  EXPECT_THAT(sql->issue_prefix, StrEq("SQL"));
}

TEST(FormatRegistryTest, UnknownFormatIsInvalidFormat) {
  EXPECT_TRUE(IsInvalidFormatError(LookupFormat(SchemaFormat::UNKNOWN).status()));
  EXPECT_TRUE(IsInvalidFormatError(
      LookupFormat(static_cast<SchemaFormat::Code>(42)).status()));
}

TEST(FormatRegistryTest, FormatName) {
  EXPECT_THAT(FormatName(SchemaFormat::JSON_SCHEMA), Eq("json_schema"));
  EXPECT_THAT(FormatName(SchemaFormat::SQL_DDL), Eq("sql_ddl"));
  EXPECT_THAT(FormatName(SchemaFormat::UNKNOWN), Eq("unknown"));
  EXPECT_THAT(FormatName(static_cast<SchemaFormat::Code>(42)), Eq("format#42"));
}

}  // namespace

}  // namespace lib
}  // namespace schemadiff
