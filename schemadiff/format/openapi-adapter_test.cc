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

#include "schemadiff/format/openapi-adapter.h"

#include <initializer_list>
#include <string>
#include <string_view>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "schemadiff/model/schema-node-util.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/testing/common-matchers.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::IsTrue;
using ::testing::NotNull;
using ::testing::SizeIs;

constexpr int kMaxDepth = 64;

constexpr char kUsersApi[] = R"(
openapi: 3.0.3
info:
  title: Users
  version: 1.0.0
paths:
  /users/{id}:
    parameters:
      - name: id
        in: path
        schema:
          type: integer
    get:
      parameters:
        - name: verbose
          in: query
          schema:
            type: boolean
        - $ref: '#/components/parameters/Limit'
      responses:
        '200':
          description: The user
          content:
            application/json:
              schema:
                $ref: '#/components/schemas/User'
    delete:
      deprecated: true
      responses:
        '204':
          description: Deleted
  /users:
    post:
      requestBody:
        required: true
        content:
          application/json:
            schema:
              type: object
              properties:
                name:
                  type: string
      responses:
        '201':
          description: Created
components:
  parameters:
    Limit:
      name: limit
      in: query
      required: false
      schema:
        type: integer
        maximum: 100
  schemas:
    User:
      type: object
      properties:
        id:
          type: integer
      required: [id]
)";

const SchemaNodeProto* FindPath(const SchemaNodeProto& root,
                                std::initializer_list<std::string_view> path) {
  const SchemaNodeProto* node = &root;
  for (std::string_view segment : path) {
    if (!node->has_object()) {
      return nullptr;
    }
    const FieldProto* field =
        schema_node_util::FindField(node->object(), segment);
    if (field == nullptr) {
      return nullptr;
    }
    node = &field->node();
  }
  return node;
}

TEST(OpenApiAdapterTest, NormalizesPathsAndOperations) {
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(
      NormalizedSchemaProto schema,
      openapi_adapter::Normalize(kUsersApi, kMaxDepth));
  EXPECT_THAT(schema.format(), Eq(SchemaFormat::OPENAPI));

  const SchemaNodeProto* paths = FindPath(schema.root(), {"paths"});
  ASSERT_THAT(paths, NotNull());
  ASSERT_THAT(paths->object().fields(), SizeIs(2));
  EXPECT_THAT(paths->object().fields(0).name(), Eq("/users/{id}"));
  EXPECT_THAT(paths->object().fields(1).name(), Eq("/users"));

  const SchemaNodeProto* get = FindPath(schema.root(), {"paths", "/users/{id}", "get"});
  ASSERT_THAT(get, NotNull());
  EXPECT_THAT(get->object().fields(0).name(), Eq("parameters"));
  EXPECT_THAT(get->object().fields(1).name(), Eq("responses"));

  const SchemaNodeProto* deleted =
      FindPath(schema.root(), {"paths", "/users/{id}", "delete"});
  ASSERT_THAT(deleted, NotNull());
  EXPECT_THAT(deleted->metadata().deprecated(), IsTrue());
}

TEST(OpenApiAdapterTest, ParametersMergePathLevelAndResolveReferences) {
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(
      NormalizedSchemaProto schema,
      openapi_adapter::Normalize(kUsersApi, kMaxDepth));
  const SchemaNodeProto* parameters = FindPath(
      schema.root(), {"paths", "/users/{id}", "get", "parameters"});
  ASSERT_THAT(parameters, NotNull());
  const ObjectNodeProto& object = parameters->object();
  ASSERT_THAT(object.fields(), SizeIs(3));
  EXPECT_THAT(object.fields(0).name(), Eq("id"));
  EXPECT_THAT(object.fields(1).name(), Eq("verbose"));
  EXPECT_THAT(object.fields(2).name(), Eq("limit"));
  // Path parameters are required.
  EXPECT_THAT(object.required(), ElementsAre("id"));

  const SchemaNodeProto& limit = object.fields(2).node();
  EXPECT_THAT(limit.metadata().identity_key(), Eq("query:limit"));
  EXPECT_THAT(schema_node_util::GetAttribute(limit, "in"), Eq("query"));
  EXPECT_THAT(limit.scalar().primitive(), Eq("integer"));
  EXPECT_THAT(limit.scalar().constraints(0).name(), Eq("maximum"));
}

TEST(OpenApiAdapterTest, RequestBodiesAndResponses) {
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(
      NormalizedSchemaProto schema,
      openapi_adapter::Normalize(kUsersApi, kMaxDepth));
  const SchemaNodeProto* post =
      FindPath(schema.root(), {"paths", "/users", "post"});
  ASSERT_THAT(post, NotNull());
  EXPECT_THAT(post->object().required(), ElementsAre("requestBody"));
  const SchemaNodeProto* body_name = FindPath(
      schema.root(), {"paths", "/users", "post", "requestBody", "name"});
  ASSERT_THAT(body_name, NotNull());
  EXPECT_THAT(body_name->scalar().primitive(), Eq("string"));

  const SchemaNodeProto* ok = FindPath(
      schema.root(), {"paths", "/users/{id}", "get", "responses", "200"});
  ASSERT_THAT(ok, NotNull());
  EXPECT_THAT(ok->reference().target(), Eq("#/components/schemas/User"));

  const SchemaNodeProto* no_content = FindPath(
      schema.root(), {"paths", "/users/{id}", "delete", "responses", "204"});
  ASSERT_THAT(no_content, NotNull());
  EXPECT_THAT(no_content->object().fields(), IsEmpty());

  ASSERT_THAT(schema.definitions(), SizeIs(1));
  EXPECT_THAT(schema.definitions(0).name(), Eq("User"));
}

TEST(OpenApiAdapterTest, SwaggerBodyParameter) {
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(
      NormalizedSchemaProto schema,
      openapi_adapter::Normalize(R"(
swagger: '2.0'
paths:
  /pets:
    post:
      parameters:
        - name: pet
          in: body
          required: true
          schema:
            type: object
            properties:
              name: {type: string}
        - name: dry_run
          in: query
          type: boolean
      responses:
        '200': {description: ok}
definitions:
  Pet:
    type: object
)",
                                 kMaxDepth));
  const SchemaNodeProto* post =
      FindPath(schema.root(), {"paths", "/pets", "post"});
  ASSERT_THAT(post, NotNull());
  EXPECT_THAT(post->object().required(), ElementsAre("requestBody"));
  const SchemaNodeProto* dry_run =
      FindPath(schema.root(), {"paths", "/pets", "post", "parameters",
                               "dry_run"});
  ASSERT_THAT(dry_run, NotNull());
  EXPECT_THAT(dry_run->scalar().primitive(), Eq("boolean"));
  ASSERT_THAT(schema.definitions(), SizeIs(1));
  EXPECT_THAT(schema.definitions(0).name(), Eq("Pet"));
}

TEST(OpenApiAdapterTest, SecuritySchemes) {
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(NormalizedSchemaProto schema,
                                  openapi_adapter::Normalize(R"(
openapi: 3.0.3
paths: {}
components:
  securitySchemes:
    bearerAuth:
      type: http
      scheme: bearer
      bearerFormat: JWT
    oauth:
      type: oauth2
      flows:
        clientCredentials:
          tokenUrl: https://auth.example.com/token
          scopes:
            read: Read access
)",
                                                             kMaxDepth));
  const SchemaNodeProto* schemes =
      FindPath(schema.root(), {"components", "securitySchemes"});
  ASSERT_THAT(schemes, NotNull());
  ASSERT_THAT(schemes->object().fields(), SizeIs(2));
  EXPECT_THAT(schemes->object().fields(0).name(), Eq("bearerAuth"));
  EXPECT_THAT(schemes->object().fields(1).name(), Eq("oauth"));

  const SchemaNodeProto* scheme = FindPath(
      schema.root(), {"components", "securitySchemes", "bearerAuth", "scheme"});
  ASSERT_THAT(scheme, NotNull());
  EXPECT_THAT(scheme->scalar().primitive(), Eq("string"));
  ASSERT_THAT(scheme->scalar().constraints(), SizeIs(1));
  EXPECT_THAT(scheme->scalar().constraints(0).name(), Eq("enum"));
  EXPECT_THAT(scheme->scalar().constraints(0).enum_values(),
              ElementsAre("bearer"));

  EXPECT_THAT(FindPath(schema.root(),
                       {"components", "securitySchemes", "oauth", "flows",
                        "clientCredentials", "scopes", "read"}),
              NotNull());
}

TEST(OpenApiAdapterTest, SwaggerSecurityDefinitions) {
  SCHEMADIFF_ASSERT_OK_AND_ASSIGN(NormalizedSchemaProto schema,
                                  openapi_adapter::Normalize(R"(
swagger: '2.0'
paths: {}
securityDefinitions:
  api_key:
    type: apiKey
    name: X-API-Key
    in: header
)",
                                                             kMaxDepth));
  const SchemaNodeProto* in = FindPath(
      schema.root(), {"components", "securitySchemes", "api_key", "in"});
  ASSERT_THAT(in, NotNull());
  EXPECT_THAT(in->scalar().constraints(0).enum_values(),
              ElementsAre("header"));
}

TEST(OpenApiAdapterTest, SecuritySchemesMustBeAMapping) {
  EXPECT_THAT(openapi_adapter::Normalize(R"(
openapi: 3.0.0
paths: {}
components:
  securitySchemes: [bearerAuth]
)",
                                         kMaxDepth),
              StatusIs(libtextclassifier3::StatusCode::INVALID_ARGUMENT,
                       HasSubstr("securitySchemes must be a mapping")));
}

TEST(OpenApiAdapterTest, SyntaxErrors) {
  EXPECT_THAT(openapi_adapter::CheckSyntax("paths: {}"),
              StatusIs(libtextclassifier3::StatusCode::INVALID_ARGUMENT,
                       HasSubstr("version")));
  EXPECT_THAT(openapi_adapter::CheckSyntax("openapi: 3.0.0\npaths: []"),
              StatusIs(libtextclassifier3::StatusCode::INVALID_ARGUMENT,
                       HasSubstr("'paths' must be a mapping")));
  EXPECT_TRUE(IsFormatSpecificError(
      openapi_adapter::CheckSyntax("openapi: [3.0")));
  SCHEMADIFF_EXPECT_OK(openapi_adapter::CheckSyntax(kUsersApi));
}

TEST(OpenApiAdapterTest, UnresolvedReference) {
  EXPECT_THAT(openapi_adapter::Normalize(R"(
openapi: 3.0.0
paths:
  /a:
    get:
      parameters:
        - $ref: '#/components/parameters/Missing'
)",
                                         kMaxDepth),
              StatusIs(libtextclassifier3::StatusCode::INVALID_ARGUMENT,
                       HasSubstr("Unresolved reference")));
}

TEST(OpenApiAdapterTest, DepthTooSmallForOperations) {
  EXPECT_TRUE(IsParseError(
      openapi_adapter::Normalize(kUsersApi, /*max_depth=*/4).status()));
}

MigrationInstructionProto MakeInstruction(
    MigrationInstructionProto::Operation::Code operation,
    std::initializer_list<std::string> container, std::string_view member) {
  MigrationInstructionProto instruction;
  instruction.set_operation(operation);
  for (const std::string& segment : container) {
    instruction.add_container(segment);
  }
  instruction.set_member(std::string(member));
  return instruction;
}

TEST(OpenApiAdapterTest, Render) {
  using Operation = MigrationInstructionProto::Operation;

  MigrationInstructionProto add = MakeInstruction(
      Operation::ADD_MEMBER, {"paths", "/users", "get", "parameters"}, "limit");
  add.mutable_node()->mutable_scalar()->set_primitive("integer");
  EXPECT_THAT(openapi_adapter::Render(add),
              Eq("add GET /users parameters.limit (integer, optional)"));

  EXPECT_THAT(openapi_adapter::Render(MakeInstruction(
                  Operation::DROP_MEMBER, {"paths", "/users"}, "delete")),
              Eq("remove DELETE /users"));
  EXPECT_THAT(openapi_adapter::Render(
                  MakeInstruction(Operation::DROP_MEMBER, {"paths"}, "/pets")),
              Eq("remove path /pets"));

  MigrationInstructionProto type = MakeInstruction(
      Operation::CHANGE_TYPE, {"$defs", "User"}, "id");
  type.mutable_change()->mutable_details()->set_old_type("integer");
  type.mutable_change()->mutable_details()->set_new_type("string");
  EXPECT_THAT(openapi_adapter::Render(type),
              Eq("change type of schema User.id from integer to string"));

  EXPECT_THAT(openapi_adapter::Render(MakeInstruction(
                  Operation::MAKE_REQUIRED,
                  {"paths", "/users", "post"}, "requestBody")),
              Eq("make POST /users requestBody required"));

  EXPECT_THAT(openapi_adapter::Render(MakeInstruction(
                  Operation::DROP_MEMBER, {"components", "securitySchemes"},
                  "bearerAuth")),
              Eq("remove security scheme bearerAuth"));
}

}  // namespace

}  // namespace lib
}  // namespace schemadiff
