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

#include "schemadiff/diff/diff-engine.h"

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/schema-node-builder.h"
#include "schemadiff/testing/common-matchers.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::SizeIs;

using Location = std::vector<std::string>;

SchemaNodeProto UserObject() {
  return NodeBuilder::Object()
      .AddField("id", NodeBuilder::Scalar("integer").Build(),
                /*required=*/true)
      .AddField("name", NodeBuilder::Scalar("string").Build())
      .Build();
}

NormalizedSchemaProto JsonSchema(SchemaNodeProto root) {
  return MakeNormalizedSchema(FORMAT_JSON_SCHEMA, std::move(root));
}

TEST(DiffEngineTest, EqualSchemasHaveNoChanges) {
  DiffEngine engine;
  EXPECT_THAT(engine.Diff(JsonSchema(UserObject()), JsonSchema(UserObject())),
              IsOkAndHolds(IsEmpty()));
}

TEST(DiffEngineTest, AddedOptionalMember) {
  NormalizedSchemaProto old_schema = JsonSchema(UserObject());
  NormalizedSchemaProto new_schema = JsonSchema(
      NodeBuilder(UserObject())
          .AddField("age", NodeBuilder::Scalar("integer").Build())
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes, ElementsAre(EqualsChange(ChangeKind::ADDED,
                                                Location{"age"})));
  EXPECT_THAT(changes[0].description(),
              Eq("Optional member 'age' was added"));
  EXPECT_THAT(changes[0].details().new_required(), IsFalse());
  EXPECT_THAT(changes[0].details().new_type(), Eq("integer"));
  EXPECT_THAT(changes[0].details().member_kind(), Eq(MemberKind::FIELD));
  // Severity is left to the rule set.
  EXPECT_THAT(changes[0].has_severity(), IsFalse());
}

TEST(DiffEngineTest, RemovedMember) {
  NormalizedSchemaProto old_schema = JsonSchema(UserObject());
  NormalizedSchemaProto new_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("id", NodeBuilder::Scalar("integer").Build(),
                    /*required=*/true)
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes, ElementsAre(EqualsChange(ChangeKind::REMOVED,
                                                Location{"name"})));
  EXPECT_THAT(changes[0].description(), Eq("Member 'name' was removed"));
  EXPECT_THAT(changes[0].details().old_type(), Eq("string"));
}

TEST(DiffEngineTest, RequirednessChanged) {
  NormalizedSchemaProto old_schema = JsonSchema(UserObject());
  NormalizedSchemaProto new_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("id", NodeBuilder::Scalar("integer").Build(),
                    /*required=*/true)
          .AddField("name", NodeBuilder::Scalar("string").Build(),
                    /*required=*/true)
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes, ElementsAre(EqualsChange(
                           ChangeKind::REQUIREDNESS_CHANGED, Location{"name"})));
  EXPECT_THAT(changes[0].description(),
              Eq("Member 'name' changed from optional to required"));
  EXPECT_THAT(changes[0].details().old_required(), IsFalse());
  EXPECT_THAT(changes[0].details().new_required(), IsTrue());
}

TEST(DiffEngineTest, NestedTypeChange) {
  NormalizedSchemaProto old_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("address", NodeBuilder::Object()
                                   .AddField("zip", NodeBuilder::Scalar(
                                                        "integer").Build())
                                   .Build())
          .Build());
  NormalizedSchemaProto new_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("address", NodeBuilder::Object()
                                   .AddField("zip", NodeBuilder::Scalar(
                                                        "string").Build())
                                   .Build())
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes, ElementsAre(EqualsChange(ChangeKind::TYPE_CHANGED,
                                                Location{"address", "zip"})));
  EXPECT_THAT(changes[0].details().old_type(), Eq("integer"));
  EXPECT_THAT(changes[0].details().new_type(), Eq("string"));
}

TEST(DiffEngineTest, KindChangeIsReportedOnceWithoutDescending) {
  NormalizedSchemaProto old_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("tags", NodeBuilder::Scalar("string").Build())
          .Build());
  NormalizedSchemaProto new_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("tags",
                    NodeBuilder::Array(NodeBuilder::Scalar("string").Build())
                        .Build())
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes, ElementsAre(EqualsChange(ChangeKind::TYPE_CHANGED,
                                                Location{"tags"})));
  EXPECT_THAT(changes[0].details().new_type(), Eq("array<string>"));
}

TEST(DiffEngineTest, ArrayElementAndLengthChanges) {
  NormalizedSchemaProto old_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("ids",
                    NodeBuilder::Array(NodeBuilder::Scalar("integer").Build())
                        .SetArrayLength(1, 10)
                        .Build())
          .Build());
  NormalizedSchemaProto new_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("ids",
                    NodeBuilder::Array(NodeBuilder::Scalar("number").Build())
                        .SetArrayLength(0, 5)
                        .Build())
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  EXPECT_THAT(
      changes,
      ElementsAre(
          EqualsChange(ChangeKind::TYPE_CHANGED, Location{"ids", "[]"}),
          EqualsChange(ChangeKind::CONSTRAINT_LOOSENED,
                       Location{"ids", "@min_items"}),
          EqualsChange(ChangeKind::CONSTRAINT_TIGHTENED,
                       Location{"ids", "@max_items"})));
  EXPECT_THAT(changes[0].details().member_kind(), Eq(MemberKind::ELEMENT));
}

TEST(DiffEngineTest, ConstraintDirections) {
  NormalizedSchemaProto old_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("name", NodeBuilder::Scalar("string")
                                .AddConstraint("max_length", 20)
                                .AddConstraint("min_length", 1)
                                .Build())
          .AddField("count", NodeBuilder::Scalar("integer")
                                 .AddConstraint("minimum", 0)
                                 .Build())
          .Build());
  NormalizedSchemaProto new_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("name", NodeBuilder::Scalar("string")
                                .AddConstraint("max_length", 10)
                                .AddConstraint("min_length", 0)
                                .AddStringConstraint("pattern", "^[a-z]+$")
                                .Build())
          .AddField("count", NodeBuilder::Scalar("integer")
                                 .AddStringConstraint("default", "0")
                                 .Build())
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  // Constraints come out sorted by name.
  EXPECT_THAT(
      changes,
      ElementsAre(
          EqualsChange(ChangeKind::CONSTRAINT_TIGHTENED,
                       Location{"name", "@max_length"}),
          EqualsChange(ChangeKind::CONSTRAINT_LOOSENED,
                       Location{"name", "@min_length"}),
          EqualsChange(ChangeKind::CONSTRAINT_TIGHTENED,
                       Location{"name", "@pattern"}),
          EqualsChange(ChangeKind::CONSTRAINT_LOOSENED,
                       Location{"count", "@default"}),
          EqualsChange(ChangeKind::CONSTRAINT_LOOSENED,
                       Location{"count", "@minimum"})));
  EXPECT_THAT(changes[0].details().constraint(), Eq("max_length"));
  EXPECT_THAT(changes[0].details().old_value(), Eq("20"));
  EXPECT_THAT(changes[0].details().new_value(), Eq("10"));
  EXPECT_THAT(changes[0].description(),
              Eq("Constraint max_length on 'name' tightened from 20 to 10"));
}

TEST(DiffEngineTest, EnumValueSets) {
  auto schema_with_enum = [](std::initializer_list<std::string> values) {
    return JsonSchema(NodeBuilder::Object()
                          .AddField("color", NodeBuilder::Scalar("string")
                                                 .AddEnumConstraint(values)
                                                 .Build())
                          .Build());
  };
  DiffEngine engine;
  EXPECT_THAT(engine.Diff(schema_with_enum({"red", "green"}),
                          schema_with_enum({"green", "red"})),
              IsOkAndHolds(IsEmpty()));
  EXPECT_THAT(engine.Diff(schema_with_enum({"red", "green"}),
                          schema_with_enum({"red"})),
              IsOkAndHolds(ElementsAre(EqualsChange(
                  ChangeKind::CONSTRAINT_TIGHTENED,
                  Location{"color", "@enum"}))));
  EXPECT_THAT(engine.Diff(schema_with_enum({"red"}),
                          schema_with_enum({"red", "blue"})),
              IsOkAndHolds(ElementsAre(EqualsChange(
                  ChangeKind::CONSTRAINT_LOOSENED,
                  Location{"color", "@enum"}))));
  // Dropping any accepted value tightens.
  EXPECT_THAT(engine.Diff(schema_with_enum({"red", "green"}),
                          schema_with_enum({"red", "blue"})),
              IsOkAndHolds(ElementsAre(EqualsChange(
                  ChangeKind::CONSTRAINT_TIGHTENED,
                  Location{"color", "@enum"}))));
}

TEST(DiffEngineTest, IdentityKeyMatchDetectsRename) {
  NormalizedSchemaProto old_schema = MakeNormalizedSchema(
      FORMAT_PROTOBUF,
      NodeBuilder::Object()
          .AddField("user_name",
                    NodeBuilder::Scalar("string").SetIdentityKey("1").Build())
          .Build());
  NormalizedSchemaProto new_schema = MakeNormalizedSchema(
      FORMAT_PROTOBUF,
      NodeBuilder::Object()
          .AddField("display_name",
                    NodeBuilder::Scalar("string").SetIdentityKey("1").Build())
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes, ElementsAre(EqualsChange(ChangeKind::RENAMED,
                                                Location{"user_name"})));
  EXPECT_THAT(changes[0].details().old_name(), Eq("user_name"));
  EXPECT_THAT(changes[0].details().new_name(), Eq("display_name"));
  EXPECT_THAT(changes[0].details().identity_key(), Eq("1"));
}

TEST(DiffEngineTest, IdentityReuseUnderNewName) {
  NormalizedSchemaProto old_schema = MakeNormalizedSchema(
      FORMAT_PROTOBUF,
      NodeBuilder::Object()
          .AddField("name",
                    NodeBuilder::Scalar("string").SetIdentityKey("1").Build())
          .Build());
  NormalizedSchemaProto new_schema = MakeNormalizedSchema(
      FORMAT_PROTOBUF,
      NodeBuilder::Object()
          .AddField("id",
                    NodeBuilder::Scalar("int64").SetIdentityKey("1").Build())
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes,
              ElementsAre(EqualsChange(ChangeKind::RENAMED, Location{"name"}),
                          EqualsChange(ChangeKind::TYPE_CHANGED,
                                       Location{"id"})));
  EXPECT_THAT(changes[1].details().identity_name_changed(), IsTrue());
}

SchemaNodeProto RepeatedField(std::string_view primitive,
                              std::string_view number,
                              std::string_view wire_type) {
  return NodeBuilder::Array(NodeBuilder::Scalar(primitive).Build())
      .SetIdentityKey(number)
      .SetAttribute("field_number", number)
      .SetAttribute("wire_type", wire_type)
      .Build();
}

TEST(DiffEngineTest, ElementTypeChangeCarriesRepeatedMemberAttributes) {
  NormalizedSchemaProto old_schema = MakeNormalizedSchema(
      FORMAT_PROTOBUF,
      NodeBuilder::Object()
          .AddField("values", RepeatedField("fixed32", "1", "i32"))
          .Build());
  NormalizedSchemaProto new_schema = MakeNormalizedSchema(
      FORMAT_PROTOBUF,
      NodeBuilder::Object()
          .AddField("values", RepeatedField("fixed64", "1", "i64"))
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes, ElementsAre(EqualsChange(ChangeKind::TYPE_CHANGED,
                                                Location{"values", "[]"})));
  const ChangeDetailsProto& details = changes[0].details();
  EXPECT_THAT(details.member_kind(), Eq(MemberKind::ELEMENT));
  EXPECT_THAT(details.identity_key(), Eq("1"));
  EXPECT_THAT(details.old_attributes().at("wire_type"), Eq("i32"));
  EXPECT_THAT(details.new_attributes().at("wire_type"), Eq("i64"));
  EXPECT_THAT(details.identity_name_changed(), IsFalse());
}

TEST(DiffEngineTest, IdentityReuseOfRepeatedMember) {
  NormalizedSchemaProto old_schema = MakeNormalizedSchema(
      FORMAT_PROTOBUF,
      NodeBuilder::Object()
          .AddField("scores", RepeatedField("int32", "1", "varint"))
          .Build());
  NormalizedSchemaProto new_schema = MakeNormalizedSchema(
      FORMAT_PROTOBUF,
      NodeBuilder::Object()
          .AddField("ids", RepeatedField("int64", "1", "varint"))
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(
      changes,
      ElementsAre(EqualsChange(ChangeKind::RENAMED, Location{"scores"}),
                  EqualsChange(ChangeKind::TYPE_CHANGED,
                               Location{"ids", "[]"})));
  EXPECT_THAT(changes[1].details().identity_name_changed(), IsTrue());
}

TEST(DiffEngineTest, SameNameDifferentIdentityIsRemoveAndAdd) {
  NormalizedSchemaProto old_schema = MakeNormalizedSchema(
      FORMAT_PROTOBUF,
      NodeBuilder::Object()
          .AddField("email",
                    NodeBuilder::Scalar("string").SetIdentityKey("3").Build())
          .Build());
  NormalizedSchemaProto new_schema = MakeNormalizedSchema(
      FORMAT_PROTOBUF,
      NodeBuilder::Object()
          .AddField("email",
                    NodeBuilder::Scalar("string").SetIdentityKey("4").Build())
          .Build());

  DiffEngine engine;
  EXPECT_THAT(engine.Diff(old_schema, new_schema),
              IsOkAndHolds(ElementsAre(
                  EqualsChange(ChangeKind::REMOVED, Location{"email"}),
                  EqualsChange(ChangeKind::ADDED, Location{"email"}))));
}

TEST(DiffEngineTest, RemovedMemberCarriesMetadata) {
  NormalizedSchemaProto old_schema = MakeNormalizedSchema(
      FORMAT_SQL_DDL,
      NodeBuilder::Object()
          .AddField("legacy", NodeBuilder::Scalar("text")
                                  .SetDeprecated()
                                  .SetAttribute("nullable", "true")
                                  .Build())
          .Build());
  NormalizedSchemaProto new_schema =
      MakeNormalizedSchema(FORMAT_SQL_DDL, NodeBuilder::Object().Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes, SizeIs(1));
  EXPECT_THAT(changes[0].details().deprecated(), IsTrue());
  EXPECT_THAT(changes[0].details().old_attributes().at("nullable"),
              Eq("true"));
}

TEST(DiffEngineTest, UnionAlternatives) {
  NormalizedSchemaProto old_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("value", NodeBuilder::Union({
                                 NodeBuilder::Scalar("string").Build(),
                                 NodeBuilder::Scalar("null").Build(),
                             }).Build())
          .Build());
  NormalizedSchemaProto new_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("value", NodeBuilder::Union({
                                 NodeBuilder::Scalar("string").Build(),
                                 NodeBuilder::Scalar("integer").Build(),
                             }).Build())
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes,
              ElementsAre(EqualsChange(ChangeKind::REMOVED,
                                       Location{"value", "null"}),
                          EqualsChange(ChangeKind::ADDED,
                                       Location{"value", "integer"})));
  EXPECT_THAT(changes[0].details().member_kind(), Eq(MemberKind::ALTERNATIVE));
}

TEST(DiffEngineTest, ReferenceTargetChange) {
  NormalizedSchemaProto old_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("owner", NodeBuilder::Reference("User").Build())
          .Build());
  NormalizedSchemaProto new_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("owner", NodeBuilder::Reference("Account").Build())
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> changes,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(changes, ElementsAre(EqualsChange(ChangeKind::TYPE_CHANGED,
                                                Location{"owner"})));
  EXPECT_THAT(changes[0].details().old_type(), Eq("ref:User"));
  EXPECT_THAT(changes[0].details().new_type(), Eq("ref:Account"));
}

TEST(DiffEngineTest, DefinitionsAreComparedUnderTheirOwnSegment) {
  NormalizedSchemaProto old_schema = JsonSchema(UserObject());
  FieldProto* definition = old_schema.add_definitions();
  definition->set_name("Address");
  *definition->mutable_node() = NodeBuilder::Object().Build();
  NormalizedSchemaProto new_schema = JsonSchema(UserObject());

  DiffEngine engine;
  EXPECT_THAT(engine.Diff(old_schema, new_schema),
              IsOkAndHolds(ElementsAre(EqualsChange(
                  ChangeKind::REMOVED, Location{"$defs", "Address"}))));
}

TEST(DiffEngineTest, ChangesFollowTraversalOrder) {
  NormalizedSchemaProto old_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("a", NodeBuilder::Scalar("string").Build())
          .AddField("b", NodeBuilder::Scalar("string").Build())
          .Build());
  NormalizedSchemaProto new_schema = JsonSchema(
      NodeBuilder::Object()
          .AddField("z", NodeBuilder::Scalar("string").Build())
          .AddField("b", NodeBuilder::Scalar("integer").Build())
          .Build());

  DiffEngine engine;
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> first,
                                  engine.Diff(old_schema, new_schema));
  EXPECT_THAT(first,
              ElementsAre(EqualsChange(ChangeKind::REMOVED, Location{"a"}),
                          EqualsChange(ChangeKind::TYPE_CHANGED, Location{"b"}),
                          EqualsChange(ChangeKind::ADDED, Location{"z"})));
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(std::vector<ChangeProto> second,
                                  engine.Diff(old_schema, new_schema));
  ASSERT_THAT(second, SizeIs(first.size()));
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_THAT(second[i], portable_equals_proto::EqualsProto(first[i]));
  }
}

TEST(DiffEngineTest, DifferentFormatsFail) {
  DiffEngine engine;
  EXPECT_TRUE(IsComparisonError(
      engine
          .Diff(JsonSchema(UserObject()),
                MakeNormalizedSchema(FORMAT_OPENAPI, UserObject()))
          .status()));
}

TEST(DiffEngineTest, DifferentRootKindsFail) {
  DiffEngine engine;
  EXPECT_THAT(
      engine.Diff(JsonSchema(UserObject()),
                  JsonSchema(NodeBuilder::Scalar("string").Build())),
      StatusIs(libtextclassifier3::StatusCode::FAILED_PRECONDITION,
               HasSubstr("Root kinds differ")));
}

TEST(DiffEngineTest, DuplicateMembersFail) {
  NormalizedSchemaProto duplicate = JsonSchema(
      NodeBuilder::Object()
          .AddField("a", NodeBuilder::Scalar("string").Build())
          .AddField("a", NodeBuilder::Scalar("integer").Build())
          .Build());
  DiffEngine engine;
  EXPECT_TRUE(IsComparisonError(
      engine.Diff(JsonSchema(UserObject()), duplicate).status()));
}

TEST(DiffEngineTest, DepthLimit) {
  SchemaNodeProto node = NodeBuilder::Scalar("string").Build();
  for (int i = 0; i < 5; ++i) {
    node = NodeBuilder::Object().AddField("child", node).Build();
  }
  NormalizedSchemaProto schema = JsonSchema(node);

  EXPECT_THAT(DiffEngine(/*max_depth=*/10).Diff(schema, schema),
              IsOkAndHolds(IsEmpty()));
  EXPECT_THAT(DiffEngine(/*max_depth=*/3).Diff(schema, schema),
              StatusIs(libtextclassifier3::StatusCode::FAILED_PRECONDITION,
                       HasSubstr("maximum depth")));
}

TEST(DiffEngineTest, LocationToString) {
  ChangeProto change;
  EXPECT_THAT(LocationToString(change.location()), Eq("<root>"));
  change.add_location("users");
  change.add_location("name");
  EXPECT_THAT(LocationToString(change.location()), Eq("users/name"));
}

}  // namespace

}  // namespace lib
}  // namespace schemadiff
