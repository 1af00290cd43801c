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

#ifndef SCHEMADIFF_FORMAT_JSON_SCHEMA_ADAPTER_H_
#define SCHEMADIFF_FORMAT_JSON_SCHEMA_ADAPTER_H_

#include <string>
#include <string_view>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include <google/protobuf/repeated_field.h>
#include <yaml-cpp/yaml.h>
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {

// Turns JSON Schema documents, or the schema objects embedded in an OpenAPI
// document, into normalized nodes.
class JsonSchemaNormalizer {
 public:
  JsonSchemaNormalizer(SchemaFormat::Code format, int max_depth)
      : format_(format), max_depth_(max_depth) {}

  // Returns:
  //   The normalized node on success
  //   INVALID_ARGUMENT (ParseError) if the schema is malformed, uses an
  //     unknown type or nests deeper than max_depth
  libtextclassifier3::StatusOr<SchemaNodeProto> NormalizeNode(
      const YAML::Node& node, const std::string& path, int depth) const;

  // Appends the entries of a name -> schema mapping to definitions.
  libtextclassifier3::Status NormalizeDefinitions(
      const YAML::Node& node, const std::string& path,
      google::protobuf::RepeatedPtrField<FieldProto>* definitions) const;

 private:
  libtextclassifier3::StatusOr<SchemaNodeProto> NormalizeTyped(
      const YAML::Node& node, std::string_view type, const std::string& path,
      int depth) const;

  libtextclassifier3::StatusOr<SchemaNodeProto> NormalizeAllOf(
      const YAML::Node& node, const std::string& path, int depth) const;

  libtextclassifier3::Status AddScalarConstraints(const YAML::Node& node,
                                                  const std::string& path,
                                                  ScalarNodeProto* scalar) const;

  libtextclassifier3::Status ApplyMetadata(const YAML::Node& node,
                                           const std::string& path,
                                           SchemaNodeProto* result) const;

  const SchemaFormat::Code format_;
  const int max_depth_;
};

namespace json_schema_adapter {

// Returns:
//   OK if content is a JSON (or YAML) document whose root is a schema
//   UNKNOWN (FormatSpecificError) if the document does not parse
//   INVALID_ARGUMENT (ParseError) if the root is not a schema object
libtextclassifier3::Status CheckSyntax(std::string_view content);

libtextclassifier3::StatusOr<NormalizedSchemaProto> Normalize(
    std::string_view content, int max_depth);

// Renders a step as a patch line, e.g. "add /user/age: integer (optional)".
std::string Render(const MigrationInstructionProto& instruction);

// RFC 6901 pointer of a member below container, e.g. "/user/a~1b".
std::string MemberPointer(
    const google::protobuf::RepeatedPtrField<std::string>& container,
    std::string_view member);

// JSON Schema keyword of a canonical constraint name, e.g. "maxLength".
std::string_view ConstraintKeyword(std::string_view constraint);

}  // namespace json_schema_adapter

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_FORMAT_JSON_SCHEMA_ADAPTER_H_
