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

#include "schemadiff/format/protobuf-adapter.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include <google/protobuf/descriptor.h>
#include "schemadiff/model/schema-node-util.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/testing/common-matchers.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

using ::google::protobuf::FieldDescriptor;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsTrue;
using ::testing::NotNull;
using ::testing::SizeIs;
using ::testing::StrEq;

constexpr int kMaxDepth = 64;

constexpr char kUserFile[] = R"pb(
  name: "user.proto"
  package: "acme"
  message_type {
    name: "User"
    field { name: "id" number: 1 label: LABEL_OPTIONAL type: TYPE_INT64 }
    field {
      name: "email"
      number: 3
      label: LABEL_REQUIRED
      type: TYPE_STRING
    }
    field {
      name: "tags"
      number: 4
      label: LABEL_REPEATED
      type: TYPE_STRING
    }
    field {
      name: "status"
      number: 5
      label: LABEL_OPTIONAL
      type: TYPE_ENUM
      type_name: ".acme.Status"
      default_value: "ACTIVE"
    }
    field {
      name: "address"
      number: 6
      label: LABEL_OPTIONAL
      type: TYPE_MESSAGE
      type_name: ".acme.User.Address"
      options { deprecated: true }
    }
    nested_type {
      name: "Address"
      field { name: "zip" number: 1 label: LABEL_OPTIONAL type: TYPE_STRING }
    }
  }
  enum_type {
    name: "Status"
    value { name: "UNKNOWN" number: 0 }
    value { name: "ACTIVE" number: 1 }
  }
)pb";

TEST(ProtobufAdapterTest, NormalizesMessagesAndEnums) {
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(
      NormalizedSchemaProto schema,
      protobuf_adapter::Normalize(kUserFile, kMaxDepth));
  EXPECT_THAT(schema.format(), Eq(SchemaFormat::PROTOBUF));
  const ObjectNodeProto& file = schema.root().object();
  ASSERT_THAT(file.fields(), SizeIs(2));
  EXPECT_THAT(file.fields(0).name(), Eq("User"));
  EXPECT_THAT(file.fields(1).name(), Eq("Status"));

  const ObjectNodeProto& user = file.fields(0).node().object();
  // Fields in declaration order, then nested types.
  ASSERT_THAT(user.fields(), SizeIs(6));
  EXPECT_THAT(user.fields(5).name(), Eq("Address"));
  EXPECT_THAT(user.required(), ElementsAre("email"));

  const SchemaNodeProto& id = user.fields(0).node();
  EXPECT_THAT(id.scalar().primitive(), Eq("int64"));
  EXPECT_THAT(id.metadata().identity_key(), Eq("1"));
  EXPECT_THAT(schema_node_util::GetAttribute(id, "wire_type"), Eq("varint"));
  EXPECT_THAT(schema_node_util::GetAttribute(id, "field_number"), Eq("1"));

  const SchemaNodeProto& tags = user.fields(2).node();
  EXPECT_THAT(schema_node_util::NodeSignature(tags), Eq("array<string>"));
  EXPECT_THAT(schema_node_util::GetAttribute(tags, "wire_type"), Eq("len"));

  const SchemaNodeProto& status = user.fields(3).node();
  EXPECT_THAT(status.reference().target(), Eq("acme.Status"));
  EXPECT_THAT(schema_node_util::GetAttribute(status, "default"), Eq("ACTIVE"));

  const SchemaNodeProto& address = user.fields(4).node();
  EXPECT_THAT(address.reference().target(), Eq("acme.User.Address"));
  EXPECT_THAT(address.metadata().deprecated(), IsTrue());

  const SchemaNodeProto& status_enum = file.fields(1).node();
  EXPECT_THAT(status_enum.scalar().primitive(), Eq("enum"));
  EXPECT_THAT(status_enum.scalar().constraints(0).enum_values(),
              ElementsAre("UNKNOWN=0", "ACTIVE=1"));
}

TEST(ProtobufAdapterTest, MapFieldsAreScalarSignatures) {
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(NormalizedSchemaProto schema,
                                  protobuf_adapter::Normalize(R"pb(
    message_type {
      name: "Index"
      field {
        name: "by_name"
        number: 1
        label: LABEL_REPEATED
        type: TYPE_MESSAGE
        type_name: ".Index.ByNameEntry"
      }
      nested_type {
        name: "ByNameEntry"
        field { name: "key" number: 1 label: LABEL_OPTIONAL type: TYPE_STRING }
        field { name: "value" number: 2 label: LABEL_OPTIONAL type: TYPE_INT32 }
        options { map_entry: true }
      }
    }
  )pb",
                                                              kMaxDepth));
  const ObjectNodeProto& index = schema.root().object().fields(0).node().object();
  // The synthesized entry message is not a member.
  ASSERT_THAT(index.fields(), SizeIs(1));
  EXPECT_THAT(index.fields(0).node().scalar().primitive(),
              Eq("map<string,int32>"));
}

TEST(ProtobufAdapterTest, TextFormatErrors) {
  libtextclassifier3::Status status =
      protobuf_adapter::CheckSyntax("message_type { name: ");
  EXPECT_TRUE(IsFormatSpecificError(status));
  EXPECT_THAT(status.error_message(),
              HasSubstr("Invalid FileDescriptorProto text"));
  EXPECT_TRUE(IsFormatSpecificError(
      protobuf_adapter::CheckSyntax("no_such_field: 1")));
  SCHEMADIFF_EXPECT_OK(protobuf_adapter::CheckSyntax(kUserFile));
}

TEST(ProtobufAdapterTest, DescriptorPoolErrors) {
  // Two fields with the same number.
  EXPECT_THAT(protobuf_adapter::Normalize(R"pb(
    message_type {
      name: "User"
      field { name: "a" number: 1 label: LABEL_OPTIONAL type: TYPE_INT32 }
      field { name: "b" number: 1 label: LABEL_OPTIONAL type: TYPE_INT32 }
    }
  )pb",
                                          kMaxDepth),
              StatusIs(libtextclassifier3::StatusCode::UNKNOWN,
                       HasSubstr("Invalid descriptor")));
}

TEST(ProtobufAdapterTest, DepthLimit) {
  constexpr char kNested[] = R"pb(
    message_type {
      name: "A"
      nested_type {
        name: "B"
        nested_type { name: "C" }
      }
    }
  )pb";
  SCHEMADIFF_EXPECT_OK(protobuf_adapter::Normalize(kNested, 3).status());
  EXPECT_TRUE(
      IsParseError(protobuf_adapter::Normalize(kNested, 2).status()));
}

TEST(ProtobufAdapterTest, WireTypeName) {
  EXPECT_THAT(protobuf_adapter::WireTypeName(FieldDescriptor::TYPE_SINT64),
              StrEq("varint"));
  EXPECT_THAT(protobuf_adapter::WireTypeName(FieldDescriptor::TYPE_FIXED32),
              StrEq("i32"));
  EXPECT_THAT(protobuf_adapter::WireTypeName(FieldDescriptor::TYPE_DOUBLE),
              StrEq("i64"));
  EXPECT_THAT(protobuf_adapter::WireTypeName(FieldDescriptor::TYPE_BYTES),
              StrEq("len"));
}

TEST(ProtobufAdapterTest, Render) {
  using Operation = MigrationInstructionProto::Operation;

  MigrationInstructionProto add;
  add.set_operation(Operation::ADD_MEMBER);
  add.add_container("User");
  add.set_member("id");
  add.mutable_node()->mutable_scalar()->set_primitive("int64");
  (*add.mutable_node()->mutable_metadata()->mutable_attributes())
      ["field_number"] = "2";
  EXPECT_THAT(protobuf_adapter::Render(add),
              Eq("User: add field optional int64 id = 2;"));

  MigrationInstructionProto drop;
  drop.set_operation(Operation::DROP_MEMBER);
  drop.add_container("User");
  drop.set_member("email");
  (*drop.mutable_change()->mutable_details()->mutable_old_attributes())
      ["field_number"] = "3";
  EXPECT_THAT(protobuf_adapter::Render(drop),
              Eq("User: remove field email and reserve 3, \"email\""));

  MigrationInstructionProto drop_message;
  drop_message.set_operation(Operation::DROP_MEMBER);
  drop_message.set_member("Legacy");
  EXPECT_THAT(protobuf_adapter::Render(drop_message),
              Eq("file: remove Legacy"));

  MigrationInstructionProto rename;
  rename.set_operation(Operation::RENAME_MEMBER);
  rename.add_container("User");
  rename.set_member("name");
  rename.mutable_change()->mutable_details()->set_new_name("full_name");
  rename.mutable_change()->mutable_details()->set_identity_key("1");
  EXPECT_THAT(protobuf_adapter::Render(rename),
              Eq("User: rename field name to full_name (field number 1)"));

  MigrationInstructionProto reuse;
  reuse.set_operation(Operation::CHANGE_TYPE);
  reuse.add_container("User");
  reuse.set_member("id");
  ChangeDetailsProto* details = reuse.mutable_change()->mutable_details();
  details->set_identity_name_changed(true);
  details->set_identity_key("1");
  details->set_new_type("int64");
  EXPECT_THAT(protobuf_adapter::Render(reuse),
              Eq("User: field number 1 is reused by id as int64; reserve it "
                 "and give id a new number"));
}

}  // namespace

}  // namespace lib
}  // namespace schemadiff
