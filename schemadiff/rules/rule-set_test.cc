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

#include "schemadiff/rules/rule-set.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "schemadiff/model/schema-node-util.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/rules/default-rule-tables.h"
#include "schemadiff/testing/common-matchers.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::IsFalse;
using ::testing::Not;

ChangeProto MakeChange(ChangeKind::Code kind) {
  ChangeProto change;
  change.add_location("user");
  change.set_kind(kind);
  change.mutable_details()->set_member_kind(MemberKind::FIELD);
  return change;
}

void SetAttribute(google::protobuf::Map<std::string, std::string>* attributes,
                  std::string_view key, std::string_view value) {
  (*attributes)[std::string(key)] = std::string(value);
}

class RuleSetTest : public ::testing::Test {
 protected:
  std::unique_ptr<RuleSet> CreateRuleSet(SchemaFormat::Code format) {
    auto rule_set_or = RuleSet::Create(format);
    EXPECT_THAT(rule_set_or, IsOk());
    return std::move(rule_set_or).ValueOrDie();
  }
};

TEST_F(RuleSetTest, CreateRejectsUnknownFormat) {
  EXPECT_TRUE(IsInvalidFormatError(
      RuleSet::Create(SchemaFormat::UNKNOWN).status()));
}

TEST_F(RuleSetTest, DefaultTablesAreComplete) {
  for (SchemaFormat::Code format :
       {SchemaFormat::JSON_SCHEMA, SchemaFormat::OPENAPI,
        SchemaFormat::PROTOBUF, SchemaFormat::SQL_DDL}) {
    SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::unique_ptr<RuleSet> rule_set,
                                    RuleSet::Create(format));
    EXPECT_THAT(rule_set->format(), Eq(format));
    EXPECT_THAT(rule_set->compatibility_threshold(), Eq(70));
  }
}

TEST_F(RuleSetTest, CreateFromTableRejectsIncompleteTable) {
  RuleTableProto table = BaseRuleTable();
  table.mutable_rules()->RemoveLast();
  EXPECT_THAT(RuleSet::CreateFromTable(std::move(table)),
              StatusIs(libtextclassifier3::StatusCode::INVALID_ARGUMENT,
                       HasSubstr("OTHER")));
}

TEST_F(RuleSetTest, CreateFromTableRejectsRuleWithoutSeverity) {
  RuleTableProto table = BaseRuleTable();
  table.mutable_rules(0)->clear_severity();
  EXPECT_THAT(RuleSet::CreateFromTable(std::move(table)),
              StatusIs(libtextclassifier3::StatusCode::INVALID_ARGUMENT));
}

TEST_F(RuleSetTest, CreateRejectsOverridesForAnotherFormat) {
  RuleTableProto overrides;
  overrides.set_format(SchemaFormat::PROTOBUF);
  EXPECT_THAT(RuleSet::Create(SchemaFormat::SQL_DDL, &overrides),
              StatusIs(libtextclassifier3::StatusCode::INVALID_ARGUMENT));
}

TEST_F(RuleSetTest, CreateRejectsThresholdOutOfRange) {
  RuleTableProto overrides;
  overrides.set_compatibility_threshold(101);
  EXPECT_THAT(RuleSet::Create(SchemaFormat::SQL_DDL, &overrides),
              StatusIs(libtextclassifier3::StatusCode::INVALID_ARGUMENT));
}

TEST_F(RuleSetTest, OverridesReplaceRulesAndThreshold) {
  RuleTableProto overrides;
  RuleProto* rule = overrides.add_rules();
  rule->set_rule_case(RuleCase::RENAMED);
  rule->set_severity(Severity::BREAKING);
  rule->set_remediation("Renames are not allowed.");
  overrides.set_compatibility_threshold(90);
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<RuleSet> rule_set,
      RuleSet::Create(SchemaFormat::JSON_SCHEMA, &overrides));
  EXPECT_THAT(rule_set->compatibility_threshold(), Eq(90));

  ChangeProto change = MakeChange(ChangeKind::RENAMED);
  SCHEMADIFF_ASSERT_OK(rule_set->Classify(&change));
  EXPECT_THAT(change.severity(), Eq(Severity::BREAKING));
  EXPECT_THAT(rule_set->GetRemediation(change),
              IsOkAndHolds(Eq("Renames are not allowed.")));
}

TEST_F(RuleSetTest, OverrideWideningsAreAdded) {
  RuleTableProto overrides;
  TypeWideningProto* widening = overrides.add_widenings();
  widening->set_from("string");
  widening->set_to("any");
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<RuleSet> rule_set,
      RuleSet::Create(SchemaFormat::JSON_SCHEMA, &overrides));

  ChangeProto change = MakeChange(ChangeKind::TYPE_CHANGED);
  change.mutable_details()->set_old_type("string");
  change.mutable_details()->set_new_type("any");
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::TYPE_WIDENED)));
  // Defaults are kept.
  change.mutable_details()->set_old_type("integer");
  change.mutable_details()->set_new_type("number");
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::TYPE_WIDENED)));
}

TEST_F(RuleSetTest, DeriveCaseForAdditions) {
  std::unique_ptr<RuleSet> rule_set = CreateRuleSet(SchemaFormat::SQL_DDL);
  ChangeProto change = MakeChange(ChangeKind::ADDED);
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::ADDED_OPTIONAL)));

  change.mutable_details()->set_new_required(true);
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::ADDED_REQUIRED)));

  SetAttribute(change.mutable_details()->mutable_new_attributes(),
               schema_node_util::kDefaultAttribute, "0");
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::ADDED_REQUIRED_WITH_DEFAULT)));

  change.mutable_details()->set_member_kind(MemberKind::ALTERNATIVE);
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::ADDED_ALTERNATIVE)));
}

TEST_F(RuleSetTest, DeriveCaseForRemovals) {
  std::unique_ptr<RuleSet> rule_set = CreateRuleSet(SchemaFormat::SQL_DDL);
  ChangeProto change = MakeChange(ChangeKind::REMOVED);
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::REMOVED)));

  SetAttribute(change.mutable_details()->mutable_old_attributes(),
               schema_node_util::kNullableAttribute, "true");
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::REMOVED_NULLABLE)));

  change.mutable_details()->set_deprecated(true);
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::REMOVED_DEPRECATED)));

  // A key column stays breaking even when deprecated.
  SetAttribute(change.mutable_details()->mutable_old_attributes(),
               schema_node_util::kPrimaryKeyAttribute, "true");
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::REMOVED_PRIMARY_KEY)));

  ChangeProto alternative = MakeChange(ChangeKind::REMOVED);
  alternative.mutable_details()->set_member_kind(MemberKind::ALTERNATIVE);
  EXPECT_THAT(rule_set->DeriveCase(alternative),
              IsOkAndHolds(Eq(RuleCase::REMOVED_ALTERNATIVE)));
}

TEST_F(RuleSetTest, DeriveCaseForTypeChanges) {
  std::unique_ptr<RuleSet> rule_set = CreateRuleSet(SchemaFormat::PROTOBUF);
  ChangeProto change = MakeChange(ChangeKind::TYPE_CHANGED);
  ChangeDetailsProto* details = change.mutable_details();
  details->set_old_type("int32");
  details->set_new_type("int64");
  SetAttribute(details->mutable_old_attributes(),
               schema_node_util::kWireTypeAttribute, "varint");
  SetAttribute(details->mutable_new_attributes(),
               schema_node_util::kWireTypeAttribute, "varint");
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::TYPE_WIDENED)));

  details->set_old_type("int64");
  details->set_new_type("int32");
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::TYPE_NARROWED)));

  details->set_old_type("string");
  details->set_new_type("int32");
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::TYPE_INCOMPATIBLE)));

  details->set_old_type("fixed32");
  details->set_new_type("fixed64");
  SetAttribute(details->mutable_old_attributes(),
               schema_node_util::kWireTypeAttribute, "i32");
  SetAttribute(details->mutable_new_attributes(),
               schema_node_util::kWireTypeAttribute, "i64");
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::TYPE_WIRE_MISMATCH)));

  details->set_identity_name_changed(true);
  EXPECT_THAT(rule_set->DeriveCase(change),
              IsOkAndHolds(Eq(RuleCase::IDENTITY_REUSE)));
}

TEST_F(RuleSetTest, DeriveCaseForConstraintsAndRequiredness) {
  std::unique_ptr<RuleSet> rule_set = CreateRuleSet(SchemaFormat::JSON_SCHEMA);
  ChangeProto tightened = MakeChange(ChangeKind::CONSTRAINT_TIGHTENED);
  EXPECT_THAT(rule_set->DeriveCase(tightened),
              IsOkAndHolds(Eq(RuleCase::CONSTRAINT_TIGHTENED)));
  tightened.mutable_details()->set_on_new_member(true);
  EXPECT_THAT(rule_set->DeriveCase(tightened),
              IsOkAndHolds(Eq(RuleCase::CONSTRAINT_TIGHTENED_NEW_MEMBER)));

  EXPECT_THAT(
      rule_set->DeriveCase(MakeChange(ChangeKind::CONSTRAINT_LOOSENED)),
      IsOkAndHolds(Eq(RuleCase::CONSTRAINT_LOOSENED)));

  ChangeProto requiredness = MakeChange(ChangeKind::REQUIREDNESS_CHANGED);
  requiredness.mutable_details()->set_new_required(true);
  EXPECT_THAT(rule_set->DeriveCase(requiredness),
              IsOkAndHolds(Eq(RuleCase::OPTIONAL_TO_REQUIRED)));
  requiredness.mutable_details()->set_old_required(true);
  requiredness.mutable_details()->set_new_required(false);
  EXPECT_THAT(rule_set->DeriveCase(requiredness),
              IsOkAndHolds(Eq(RuleCase::REQUIRED_TO_OPTIONAL)));

  EXPECT_THAT(rule_set->DeriveCase(MakeChange(ChangeKind::RENAMED)),
              IsOkAndHolds(Eq(RuleCase::RENAMED)));
  EXPECT_THAT(rule_set->DeriveCase(MakeChange(ChangeKind::OTHER)),
              IsOkAndHolds(Eq(RuleCase::OTHER)));
}

TEST_F(RuleSetTest, DeriveCaseRejectsChangeWithoutKind) {
  std::unique_ptr<RuleSet> rule_set = CreateRuleSet(SchemaFormat::JSON_SCHEMA);
  EXPECT_THAT(rule_set->DeriveCase(MakeChange(ChangeKind::UNKNOWN)),
              StatusIs(libtextclassifier3::StatusCode::INVALID_ARGUMENT));
}

TEST_F(RuleSetTest, FormatOverridesOfTheBaseTable) {
  ChangeProto added = MakeChange(ChangeKind::ADDED);
  added.mutable_details()->set_new_required(true);
  SetAttribute(added.mutable_details()->mutable_new_attributes(),
               schema_node_util::kDefaultAttribute, "0");

  ChangeProto json_added = added;
  SCHEMADIFF_ASSERT_OK(
      CreateRuleSet(SchemaFormat::JSON_SCHEMA)->Classify(&json_added));
  EXPECT_THAT(json_added.severity(), Eq(Severity::BREAKING));

  ChangeProto sql_added = added;
  SCHEMADIFF_ASSERT_OK(CreateRuleSet(SchemaFormat::SQL_DDL)->Classify(&sql_added));
  EXPECT_THAT(sql_added.severity(), Eq(Severity::INFO));

  ChangeProto removed = MakeChange(ChangeKind::REMOVED);
  SetAttribute(removed.mutable_details()->mutable_old_attributes(),
               schema_node_util::kNullableAttribute, "true");
  SCHEMADIFF_ASSERT_OK(CreateRuleSet(SchemaFormat::SQL_DDL)->Classify(&removed));
  EXPECT_THAT(removed.severity(), Eq(Severity::WARNING));
  EXPECT_THAT(removed.is_breaking(), IsFalse());
}

TEST_F(RuleSetTest, ClassifyKeepsIsBreakingInLineWithSeverity) {
  std::unique_ptr<RuleSet> rule_set = CreateRuleSet(SchemaFormat::OPENAPI);
  for (ChangeKind::Code kind :
       {ChangeKind::ADDED, ChangeKind::REMOVED, ChangeKind::TYPE_CHANGED,
        ChangeKind::CONSTRAINT_TIGHTENED, ChangeKind::CONSTRAINT_LOOSENED,
        ChangeKind::REQUIREDNESS_CHANGED, ChangeKind::RENAMED,
        ChangeKind::OTHER}) {
    ChangeProto change = MakeChange(kind);
    SCHEMADIFF_ASSERT_OK(rule_set->Classify(&change));
    EXPECT_THAT(change.is_breaking(),
                Eq(change.severity() == Severity::BREAKING))
        << ChangeKind::Code_Name(kind);
  }
}

TEST_F(RuleSetTest, RemediationOfBreakingCases) {
  std::unique_ptr<RuleSet> rule_set = CreateRuleSet(SchemaFormat::PROTOBUF);
  ChangeProto change = MakeChange(ChangeKind::TYPE_CHANGED);
  change.mutable_details()->set_identity_name_changed(true);
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::string remediation,
                                  rule_set->GetRemediation(change));
  EXPECT_THAT(remediation, Not(IsEmpty()));

  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(const RuleProto* rule,
                                  rule_set->GetRule(RuleCase::IDENTITY_REUSE));
  EXPECT_THAT(rule->severity(), Eq(Severity::BREAKING));
  EXPECT_THAT(rule->remediation(), Eq(remediation));
}

}  // namespace

}  // namespace lib
}  // namespace schemadiff
