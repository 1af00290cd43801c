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

#include "schemadiff/rules/default-rule-tables.h"

#include <initializer_list>
#include <string>
#include <utility>

#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {

namespace {

struct RuleEntry {
  RuleCase::Code rule_case;
  Severity::Code severity;
  const char* remediation;
};

constexpr RuleEntry kBaseRules[] = {
    {RuleCase::ADDED_OPTIONAL, Severity::INFO, ""},
    {RuleCase::ADDED_REQUIRED, Severity::BREAKING,
     "Make the new member optional or give it a default so existing data "
     "stays valid."},
    {RuleCase::ADDED_REQUIRED_WITH_DEFAULT, Severity::WARNING,
     "Confirm every consumer applies the declared default to old data."},
    {RuleCase::ADDED_ALTERNATIVE, Severity::INFO,
     "Make sure consumers handle the new alternative."},
    {RuleCase::REMOVED, Severity::BREAKING,
     "Deprecate the member first and remove it in a later major version."},
    {RuleCase::REMOVED_DEPRECATED, Severity::WARNING,
     "Confirm no client still reads the deprecated member."},
    {RuleCase::REMOVED_NULLABLE, Severity::BREAKING,
     "Deprecate the member first and remove it in a later major version."},
    {RuleCase::REMOVED_PRIMARY_KEY, Severity::BREAKING,
     "Define a replacement key before removing the key member."},
    {RuleCase::REMOVED_ALTERNATIVE, Severity::BREAKING,
     "Keep accepting the alternative until no producer sends it."},
    {RuleCase::TYPE_WIDENED, Severity::WARNING,
     "Check that consumers accept the wider type."},
    {RuleCase::TYPE_NARROWED, Severity::BREAKING,
     "Keep the wider type or convert existing values first."},
    {RuleCase::TYPE_INCOMPATIBLE, Severity::BREAKING,
     "Add a new member with the new type and migrate data to it."},
    {RuleCase::TYPE_WIRE_MISMATCH, Severity::BREAKING,
     "Keep the encoding and add a new member for the new type."},
    {RuleCase::IDENTITY_REUSE, Severity::BREAKING,
     "Never reuse an identifier. Reserve it and allocate a new one."},
    {RuleCase::CONSTRAINT_TIGHTENED, Severity::BREAKING,
     "Validate existing data against the stricter constraint before rollout."},
    {RuleCase::CONSTRAINT_TIGHTENED_NEW_MEMBER, Severity::INFO, ""},
    {RuleCase::CONSTRAINT_LOOSENED, Severity::INFO,
     "Check that consumers accept the wider range of values."},
    {RuleCase::OPTIONAL_TO_REQUIRED, Severity::BREAKING,
     "Backfill the member in existing data before making it required."},
    {RuleCase::REQUIRED_TO_OPTIONAL, Severity::WARNING,
     "Make consumers handle the member being absent."},
    {RuleCase::RENAMED, Severity::WARNING,
     "Update clients to the new name."},
    {RuleCase::OTHER, Severity::WARNING, "Review the change manually."},
};

// Replaces the rule of the same case, keeping the table order.
void Override(RuleTableProto* table, const RuleEntry& entry) {
  for (RuleProto& rule : *table->mutable_rules()) {
    if (rule.rule_case() == entry.rule_case) {
      rule.set_severity(entry.severity);
      rule.set_remediation(entry.remediation);
      return;
    }
  }
  RuleProto* rule = table->add_rules();
  rule->set_rule_case(entry.rule_case);
  rule->set_severity(entry.severity);
  rule->set_remediation(entry.remediation);
}

void AddWidenings(
    RuleTableProto* table,
    std::initializer_list<std::pair<const char*, const char*>> widenings) {
  for (const auto& [from, to] : widenings) {
    TypeWideningProto* widening = table->add_widenings();
    widening->set_from(from);
    widening->set_to(to);
  }
}

}  // namespace

RuleTableProto BaseRuleTable() {
  RuleTableProto table;
  for (const RuleEntry& entry : kBaseRules) {
    RuleProto* rule = table.add_rules();
    rule->set_rule_case(entry.rule_case);
    rule->set_severity(entry.severity);
    rule->set_remediation(entry.remediation);
  }
  return table;
}

RuleTableProto JsonSchemaRuleTable() {
  RuleTableProto table = BaseRuleTable();
  table.set_format(SchemaFormat::JSON_SCHEMA);
  Override(&table, {RuleCase::ADDED_REQUIRED_WITH_DEFAULT, Severity::BREAKING,
                    "Validators do not apply defaults. Make the property "
                    "optional."});
  Override(&table, {RuleCase::RENAMED, Severity::WARNING,
                    "Update clients to the new property name."});
  AddWidenings(&table, {{"integer", "number"}});
  return table;
}

RuleTableProto OpenApiRuleTable() {
  RuleTableProto table = BaseRuleTable();
  table.set_format(SchemaFormat::OPENAPI);
  Override(&table, {RuleCase::ADDED_REQUIRED_WITH_DEFAULT, Severity::BREAKING,
                    "Existing clients do not send the value. Make it "
                    "optional."});
  Override(&table,
           {RuleCase::REMOVED, Severity::BREAKING,
            "Mark the operation or parameter deprecated and remove it in "
            "the next major API version."});
  AddWidenings(&table, {{"integer", "number"}});
  return table;
}

RuleTableProto ProtobufRuleTable() {
  RuleTableProto table = BaseRuleTable();
  table.set_format(SchemaFormat::PROTOBUF);
  Override(&table, {RuleCase::REMOVED, Severity::BREAKING,
                    "Reserve the field number and name instead of deleting "
                    "the field outright."});
  Override(&table, {RuleCase::TYPE_WIRE_MISMATCH, Severity::BREAKING,
                    "The wire type differs. Add a new field with a new "
                    "number instead."});
  Override(&table, {RuleCase::RENAMED, Severity::WARNING,
                    "The binary encoding is unchanged. Update JSON and text "
                    "format clients."});
  AddWidenings(&table, {{"int32", "int64"},
                        {"uint32", "uint64"},
                        {"sint32", "sint64"},
                        {"fixed32", "fixed64"},
                        {"sfixed32", "sfixed64"},
                        {"float", "double"}});
  return table;
}

RuleTableProto SqlRuleTable() {
  RuleTableProto table = BaseRuleTable();
  table.set_format(SchemaFormat::SQL_DDL);
  Override(&table, {RuleCase::REMOVED_NULLABLE, Severity::WARNING,
                    "Back up the column data before dropping it."});
  Override(&table, {RuleCase::ADDED_REQUIRED_WITH_DEFAULT, Severity::INFO,
                    ""});
  Override(&table, {RuleCase::REMOVED, Severity::BREAKING,
                    "Make the column nullable and stop writing it before "
                    "dropping it."});
  Override(&table, {RuleCase::TYPE_WIDENED, Severity::WARNING,
                    "Widening rewrites the table on some engines. Schedule "
                    "it off-peak."});
  AddWidenings(&table, {{"smallint", "integer"},
                        {"integer", "bigint"},
                        {"real", "double"},
                        {"numeric", "double"},
                        {"char", "varchar"},
                        {"varchar", "text"},
                        {"date", "timestamp"}});
  return table;
}

}  // namespace lib
}  // namespace schemadiff
