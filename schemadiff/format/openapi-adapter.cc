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

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include <yaml-cpp/yaml.h>
#include "schemadiff/absl_ports/ascii_str_to_lower.h"
#include "schemadiff/absl_ports/status_macros.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/absl_ports/str_join.h"
#include "schemadiff/format/json-schema-adapter.h"
#include "schemadiff/format/yaml-document.h"
#include "schemadiff/model/schema-node-util.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/util/logging.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {
namespace openapi_adapter {

namespace {

using Operation = MigrationInstructionProto::Operation;

constexpr std::string_view kMethods[] = {"get",     "put",  "post",
                                         "delete",  "options", "head",
                                         "patch",   "trace"};

constexpr std::string_view kPathItemKeys[] = {
    "parameters", "summary", "description", "servers", "$ref"};

// Depth of the schemas below paths/<path>/<method>/<section>/<member>.
constexpr int kOperationSchemaDepth = 5;

bool IsMethod(std::string_view key) {
  for (std::string_view method : kMethods) {
    if (method == key) {
      return true;
    }
  }
  return false;
}

bool IsPathItemKey(std::string_view key) {
  for (std::string_view known : kPathItemKeys) {
    if (known == key) {
      return true;
    }
  }
  return false;
}

std::string UnescapePointerSegment(std::string_view segment) {
  std::string result;
  for (size_t i = 0; i < segment.size(); ++i) {
    if (segment[i] == '~' && i + 1 < segment.size()) {
      if (segment[i + 1] == '0') {
        result += '~';
        ++i;
        continue;
      }
      if (segment[i + 1] == '1') {
        result += '/';
        ++i;
        continue;
      }
    }
    result += segment[i];
  }
  return result;
}

SchemaNodeProto* AddObjectMember(ObjectNodeProto* object,
                                 std::string_view name) {
  FieldProto* field = object->add_fields();
  field->set_name(std::string(name));
  SchemaNodeProto* node = field->mutable_node();
  node->mutable_metadata()->set_format(SchemaFormat::OPENAPI);
  node->mutable_object();
  return node;
}

struct Parameter {
  std::string in;
  std::string name;
  YAML::Node node;
};

class OpenApiNormalizer {
 public:
  OpenApiNormalizer(YAML::Node root, int max_depth)
      : root_(std::move(root)),
        schemas_(SchemaFormat::OPENAPI, max_depth),
        max_depth_(max_depth) {}

  libtextclassifier3::StatusOr<NormalizedSchemaProto> Normalize() const;

 private:
  // Follows a local "#/..." reference; returns node itself when it has none.
  libtextclassifier3::StatusOr<YAML::Node> Resolve(
      const YAML::Node& node, const std::string& location) const;

  libtextclassifier3::StatusOr<SchemaNodeProto> NormalizeOperation(
      const YAML::Node& path_item, const YAML::Node& operation,
      const std::string& location) const;

  libtextclassifier3::Status CollectParameters(
      const YAML::Node& list, const std::string& location,
      std::vector<Parameter>* parameters) const;

  // Security schemes by name. Settings become single value string enums so
  // that any edit is reported.
  libtextclassifier3::Status NormalizeSecuritySchemes(
      const YAML::Node& schemes, ObjectNodeProto* root) const;

  libtextclassifier3::StatusOr<SchemaNodeProto> NormalizeSecurityValue(
      const YAML::Node& value, const std::string& location, int depth) const;

  // Schema of a request body or response, taken from its JSON media type
  // or the first one declared.
  libtextclassifier3::StatusOr<SchemaNodeProto> NormalizeContent(
      const YAML::Node& holder, const std::string& location) const;

  const YAML::Node root_;
  const JsonSchemaNormalizer schemas_;
  const int max_depth_;
};

libtextclassifier3::StatusOr<YAML::Node> OpenApiNormalizer::Resolve(
    const YAML::Node& node, const std::string& location) const {
  YAML::Node ref = yaml_document::Child(node, "$ref");
  if (!ref.IsDefined()) {
    return node;
  }
  SCHEMADIFF_ASSIGN_OR_RETURN(std::string target,
                              yaml_document::GetString(ref, location));
  if (target.rfind("#/", 0) != 0) {
    return ParseError(absl_ports::StrCat(
        "Only local references are supported, got '", target, "' at '",
        location, "'"));
  }
  YAML::Node current = root_;
  size_t start = 2;
  while (start <= target.size()) {
    size_t end = target.find('/', start);
    if (end == std::string::npos) {
      end = target.size();
    }
    current.reset(yaml_document::Child(
        current,
        UnescapePointerSegment(std::string_view(target).substr(start,
                                                               end - start))));
    if (!current.IsDefined()) {
      return ParseError(absl_ports::StrCat("Unresolved reference '", target,
                                           "' at '", location, "'"));
    }
    start = end + 1;
  }
  return current;
}

libtextclassifier3::StatusOr<NormalizedSchemaProto>
OpenApiNormalizer::Normalize() const {
  NormalizedSchemaProto schema;
  schema.set_format(SchemaFormat::OPENAPI);
  SchemaNodeProto* root = schema.mutable_root();
  root->mutable_metadata()->set_format(SchemaFormat::OPENAPI);
  ObjectNodeProto* paths =
      AddObjectMember(root->mutable_object(), "paths")->mutable_object();

  for (const auto& path_entry : yaml_document::Child(root_, "paths")) {
    std::string path = path_entry.first.Scalar();
    std::string location = absl_ports::StrCat("paths/", path);
    SCHEMADIFF_ASSIGN_OR_RETURN(YAML::Node path_item,
                                Resolve(path_entry.second, location));
    if (!path_item.IsMap()) {
      return ParseError(absl_ports::StrCat("Path item '", path,
                                           "' must be a mapping"));
    }
    ObjectNodeProto* operations = AddObjectMember(paths, path)->mutable_object();
    for (const auto& operation_entry : path_item) {
      std::string method =
          absl_ports::AsciiStrToLower(operation_entry.first.Scalar());
      if (!IsMethod(method)) {
        if (!IsPathItemKey(method)) {
          SCHEMADIFF_VLOG(1) << "Skipping unknown key '" << method
                             << "' of path " << path;
        }
        continue;
      }
      FieldProto* operation_field = operations->add_fields();
      operation_field->set_name(method);
      SCHEMADIFF_ASSIGN_OR_RETURN(
          *operation_field->mutable_node(),
          NormalizeOperation(path_item, operation_entry.second,
                             absl_ports::StrCat(location, "/", method)));
    }
  }

  YAML::Node components = yaml_document::Child(root_, "components");
  YAML::Node security_schemes =
      yaml_document::Child(components, kSecuritySchemesMember);
  if (!security_schemes.IsDefined()) {
    // Swagger 2.
    security_schemes.reset(
        yaml_document::Child(root_, "securityDefinitions"));
  }
  if (security_schemes.IsDefined() && !security_schemes.IsNull()) {
    SCHEMADIFF_RETURN_IF_ERROR(NormalizeSecuritySchemes(
        security_schemes, root->mutable_object()));
  }

  YAML::Node definitions = yaml_document::Child(components, "schemas");
  std::string definitions_path = "#/components/schemas";
  if (!definitions.IsDefined()) {
    definitions.reset(yaml_document::Child(root_, "definitions"));
    definitions_path = "#/definitions";
  }
  if (definitions.IsDefined() && !definitions.IsNull()) {
    SCHEMADIFF_RETURN_IF_ERROR(schemas_.NormalizeDefinitions(
        definitions, definitions_path, schema.mutable_definitions()));
  }
  return schema;
}

libtextclassifier3::Status OpenApiNormalizer::NormalizeSecuritySchemes(
    const YAML::Node& schemes, ObjectNodeProto* root) const {
  std::string location =
      absl_ports::StrCat(kComponentsMember, "/", kSecuritySchemesMember);
  if (!schemes.IsMap()) {
    return ParseError(absl_ports::StrCat(location, " must be a mapping, got ",
                                         yaml_document::NodeClass(schemes)));
  }
  ObjectNodeProto* components =
      AddObjectMember(root, kComponentsMember)->mutable_object();
  ObjectNodeProto* by_name =
      AddObjectMember(components, kSecuritySchemesMember)->mutable_object();
  for (const auto& scheme_entry : schemes) {
    std::string name = scheme_entry.first.Scalar();
    std::string scheme_location = absl_ports::StrCat(location, "/", name);
    SCHEMADIFF_ASSIGN_OR_RETURN(YAML::Node scheme,
                                Resolve(scheme_entry.second, scheme_location));
    if (!scheme.IsMap()) {
      return ParseError(absl_ports::StrCat("Security scheme '", name,
                                           "' must be a mapping"));
    }
    FieldProto* field = by_name->add_fields();
    field->set_name(name);
    // components/securitySchemes/<name>
    SCHEMADIFF_ASSIGN_OR_RETURN(
        *field->mutable_node(),
        NormalizeSecurityValue(scheme, scheme_location, /*depth=*/3));
  }
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::StatusOr<SchemaNodeProto>
OpenApiNormalizer::NormalizeSecurityValue(const YAML::Node& value,
                                          const std::string& location,
                                          int depth) const {
  if (depth > max_depth_) {
    return ParseError(absl_ports::StrCat(
        "Security scheme nesting exceeds the maximum depth of ",
        std::to_string(max_depth_), " at '", location, "'"));
  }
  SchemaNodeProto node;
  node.mutable_metadata()->set_format(SchemaFormat::OPENAPI);
  if (value.IsMap()) {
    ObjectNodeProto* object = node.mutable_object();
    for (const auto& entry : value) {
      std::string key = entry.first.Scalar();
      FieldProto* field = object->add_fields();
      field->set_name(key);
      SCHEMADIFF_ASSIGN_OR_RETURN(
          *field->mutable_node(),
          NormalizeSecurityValue(entry.second,
                                 absl_ports::StrCat(location, "/", key),
                                 depth + 1));
    }
    return node;
  }
  ConstraintProto* constraint = node.mutable_scalar()->add_constraints();
  node.mutable_scalar()->set_primitive("string");
  constraint->set_name(std::string(schema_node_util::kEnum));
  if (value.IsSequence()) {
    for (const YAML::Node& item : value) {
      constraint->add_enum_values(yaml_document::ToCompactString(item));
    }
  } else {
    constraint->add_enum_values(yaml_document::ToCompactString(value));
  }
  return node;
}

libtextclassifier3::Status OpenApiNormalizer::CollectParameters(
    const YAML::Node& list, const std::string& location,
    std::vector<Parameter>* parameters) const {
  if (!list.IsDefined() || list.IsNull()) {
    return libtextclassifier3::Status::OK;
  }
  if (!list.IsSequence()) {
    return ParseError(absl_ports::StrCat("parameters at '", location,
                                         "' must be a list"));
  }
  for (const YAML::Node& item : list) {
    SCHEMADIFF_ASSIGN_OR_RETURN(
        YAML::Node node,
        Resolve(item, absl_ports::StrCat(location, "/parameters")));
    Parameter parameter;
    SCHEMADIFF_ASSIGN_OR_RETURN(
        parameter.name,
        yaml_document::GetString(yaml_document::Child(node, "name"),
                                 absl_ports::StrCat(location, "/parameters")));
    SCHEMADIFF_ASSIGN_OR_RETURN(
        parameter.in,
        yaml_document::GetString(
            yaml_document::Child(node, "in"),
            absl_ports::StrCat(location, "/parameters/", parameter.name)));
    parameter.node.reset(node);
    bool replaced = false;
    // Operation parameters override path parameters with the same identity.
    for (Parameter& existing : *parameters) {
      if (existing.in == parameter.in && existing.name == parameter.name) {
        existing.node.reset(parameter.node);
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      parameters->push_back(std::move(parameter));
    }
  }
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::StatusOr<SchemaNodeProto>
OpenApiNormalizer::NormalizeContent(const YAML::Node& holder,
                                    const std::string& location) const {
  YAML::Node content = yaml_document::Child(holder, "content");
  if (content.IsMap() && content.size() > 0) {
    YAML::Node media = yaml_document::Child(content, "application/json");
    if (!media.IsDefined()) {
      media.reset((*content.begin()).second);
    }
    YAML::Node schema = yaml_document::Child(media, "schema");
    if (schema.IsDefined()) {
      return schemas_.NormalizeNode(schema, location, kOperationSchemaDepth);
    }
  }
  YAML::Node schema = yaml_document::Child(holder, "schema");
  if (schema.IsDefined()) {
    return schemas_.NormalizeNode(schema, location, kOperationSchemaDepth);
  }
  SchemaNodeProto empty;
  empty.mutable_metadata()->set_format(SchemaFormat::OPENAPI);
  empty.mutable_object();
  return empty;
}

libtextclassifier3::StatusOr<SchemaNodeProto>
OpenApiNormalizer::NormalizeOperation(const YAML::Node& path_item,
                                      const YAML::Node& operation,
                                      const std::string& location) const {
  if (!operation.IsMap()) {
    return ParseError(absl_ports::StrCat("Operation '", location,
                                         "' must be a mapping"));
  }
  SchemaNodeProto result;
  NodeMetadataProto* metadata = result.mutable_metadata();
  metadata->set_format(SchemaFormat::OPENAPI);
  YAML::Node deprecated = yaml_document::Child(operation, "deprecated");
  if (deprecated.IsDefined()) {
    SCHEMADIFF_ASSIGN_OR_RETURN(
        bool is_deprecated,
        yaml_document::GetBool(deprecated,
                               absl_ports::StrCat(location, "/deprecated")));
    metadata->set_deprecated(is_deprecated);
  }
  ObjectNodeProto* object = result.mutable_object();

  std::vector<Parameter> parameters;
  SCHEMADIFF_RETURN_IF_ERROR(CollectParameters(
      yaml_document::Child(path_item, "parameters"), location, &parameters));
  SCHEMADIFF_RETURN_IF_ERROR(CollectParameters(
      yaml_document::Child(operation, "parameters"), location, &parameters));

  ObjectNodeProto* parameter_object =
      AddObjectMember(object, kParametersMember)->mutable_object();
  const Parameter* body_parameter = nullptr;
  for (const Parameter& parameter : parameters) {
    if (parameter.in == "body") {
      body_parameter = &parameter;
      continue;
    }
    std::string name = parameter.name;
    if (schema_node_util::FindField(*parameter_object, name) != nullptr) {
      name = absl_ports::StrCat(parameter.in, ":", parameter.name);
    }
    std::string parameter_location =
        absl_ports::StrCat(location, "/parameters/", name);
    YAML::Node schema = yaml_document::Child(parameter.node, "schema");
    FieldProto* field = parameter_object->add_fields();
    field->set_name(name);
    // Swagger 2 declares the type on the parameter itself.
    SCHEMADIFF_ASSIGN_OR_RETURN(
        *field->mutable_node(),
        schemas_.NormalizeNode(schema.IsDefined() ? schema : parameter.node,
                               parameter_location, kOperationSchemaDepth));
    NodeMetadataProto* parameter_metadata =
        field->mutable_node()->mutable_metadata();
    parameter_metadata->set_identity_key(
        absl_ports::StrCat(parameter.in, ":", parameter.name));
    (*parameter_metadata->mutable_attributes())[std::string(
        schema_node_util::kLocationAttribute)] = parameter.in;
    YAML::Node parameter_deprecated =
        yaml_document::Child(parameter.node, "deprecated");
    if (parameter_deprecated.IsDefined()) {
      SCHEMADIFF_ASSIGN_OR_RETURN(
          bool is_deprecated,
          yaml_document::GetBool(parameter_deprecated, parameter_location));
      parameter_metadata->set_deprecated(is_deprecated);
    }
    bool required = parameter.in == "path";
    YAML::Node required_node = yaml_document::Child(parameter.node, "required");
    if (required_node.IsDefined()) {
      SCHEMADIFF_ASSIGN_OR_RETURN(
          required, yaml_document::GetBool(required_node, parameter_location));
    }
    if (required) {
      parameter_object->add_required(name);
    }
  }

  YAML::Node request_body = yaml_document::Child(operation, "requestBody");
  if (request_body.IsDefined() || body_parameter != nullptr) {
    std::string body_location =
        absl_ports::StrCat(location, "/", kRequestBodyMember);
    YAML::Node body;
    if (request_body.IsDefined()) {
      SCHEMADIFF_ASSIGN_OR_RETURN(body, Resolve(request_body, body_location));
    } else {
      body.reset(body_parameter->node);
    }
    FieldProto* field = object->add_fields();
    field->set_name(std::string(kRequestBodyMember));
    SCHEMADIFF_ASSIGN_OR_RETURN(*field->mutable_node(),
                                NormalizeContent(body, body_location));
    YAML::Node required_node = yaml_document::Child(body, "required");
    bool required = false;
    if (required_node.IsDefined()) {
      SCHEMADIFF_ASSIGN_OR_RETURN(
          required, yaml_document::GetBool(required_node, body_location));
    }
    if (required) {
      object->add_required(std::string(kRequestBodyMember));
    }
  }

  ObjectNodeProto* responses =
      AddObjectMember(object, kResponsesMember)->mutable_object();
  YAML::Node response_map = yaml_document::Child(operation, "responses");
  if (response_map.IsDefined() && !response_map.IsMap()) {
    return ParseError(absl_ports::StrCat("responses at '", location,
                                         "' must be a mapping"));
  }
  if (response_map.IsMap()) {
    for (const auto& response_entry : response_map) {
      std::string status = response_entry.first.Scalar();
      std::string response_location =
          absl_ports::StrCat(location, "/responses/", status);
      SCHEMADIFF_ASSIGN_OR_RETURN(
          YAML::Node response,
          Resolve(response_entry.second, response_location));
      FieldProto* field = responses->add_fields();
      field->set_name(status);
      SCHEMADIFF_ASSIGN_OR_RETURN(*field->mutable_node(),
                                  NormalizeContent(response, response_location));
    }
  }
  return result;
}

// Describes a location in endpoint terms, e.g. "GET /users parameters.limit".
std::string DescribeTarget(const MigrationInstructionProto& instruction,
                           std::string_view member) {
  std::vector<std::string> segments(instruction.container().begin(),
                                    instruction.container().end());
  if (!member.empty()) {
    segments.push_back(std::string(member));
  }
  if (segments.empty()) {
    return "document";
  }
  if (segments[0] == "paths") {
    if (segments.size() == 1) {
      return "paths";
    }
    if (segments.size() == 2) {
      return absl_ports::StrCat("path ", segments[1]);
    }
    std::string target = absl_ports::StrCat(
        absl_ports::AsciiStrToUpper(segments[2]), " ", segments[1]);
    if (segments.size() > 3) {
      absl_ports::StrAppend(
          &target, " ",
          absl_ports::StrJoin(segments.begin() + 3, segments.end(), "."));
    }
    return target;
  }
  if (segments[0] == kComponentsMember && segments.size() > 2 &&
      segments[1] == kSecuritySchemesMember) {
    return absl_ports::StrCat(
        "security scheme ",
        absl_ports::StrJoin(segments.begin() + 2, segments.end(), "."));
  }
  if (segments[0] == schema_node_util::kDefinitionsSegment) {
    return absl_ports::StrCat(
        "schema ",
        absl_ports::StrJoin(segments.begin() + 1, segments.end(), "."));
  }
  return absl_ports::StrJoin(segments, ".");
}

}  // namespace

libtextclassifier3::Status CheckSyntax(std::string_view content) {
  SCHEMADIFF_ASSIGN_OR_RETURN(YAML::Node root, yaml_document::Load(content));
  if (!root.IsMap()) {
    return ParseError(absl_ports::StrCat("OpenAPI document must be a mapping, got ",
                                         yaml_document::NodeClass(root)));
  }
  if (!yaml_document::Child(root, "openapi").IsDefined() &&
      !yaml_document::Child(root, "swagger").IsDefined()) {
    return ParseError("OpenAPI document has no 'openapi' or 'swagger' version");
  }
  YAML::Node paths = yaml_document::Child(root, "paths");
  if (!paths.IsMap()) {
    return ParseError(absl_ports::StrCat(
        "OpenAPI 'paths' must be a mapping, got ",
        yaml_document::NodeClass(paths)));
  }
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::StatusOr<NormalizedSchemaProto> Normalize(
    std::string_view content, int max_depth) {
  SCHEMADIFF_RETURN_IF_ERROR(CheckSyntax(content));
  SCHEMADIFF_ASSIGN_OR_RETURN(YAML::Node root, yaml_document::Load(content));
  if (max_depth < kOperationSchemaDepth) {
    return ParseError(absl_ports::StrCat(
        "OpenAPI documents nest at least ",
        std::to_string(kOperationSchemaDepth), " levels, max_depth is ",
        std::to_string(max_depth)));
  }
  OpenApiNormalizer normalizer(std::move(root), max_depth);
  return normalizer.Normalize();
}

std::string Render(const MigrationInstructionProto& instruction) {
  const ChangeProto& change = instruction.change();
  const ChangeDetailsProto& details = change.details();
  std::string target = DescribeTarget(instruction, instruction.member());
  switch (instruction.operation()) {
    case Operation::ADD_MEMBER: {
      std::string type = instruction.has_node()
                             ? schema_node_util::NodeSignature(instruction.node())
                             : details.new_type();
      return absl_ports::StrCat("add ", target, " (", type, ", ",
                                instruction.required() ? "required" : "optional",
                                ")");
    }
    case Operation::DROP_MEMBER:
      return absl_ports::StrCat("remove ", target);
    case Operation::RENAME_MEMBER:
      return absl_ports::StrCat("rename ", target, " to ",
                                DescribeTarget(instruction, details.new_name()));
    case Operation::CHANGE_TYPE:
      return absl_ports::StrCat("change type of ", target, " from ",
                                details.old_type(), " to ", details.new_type());
    case Operation::TIGHTEN_CONSTRAINT:
    case Operation::LOOSEN_CONSTRAINT:
      return absl_ports::StrCat(
          instruction.operation() == Operation::TIGHTEN_CONSTRAINT
              ? "tighten "
              : "loosen ",
          json_schema_adapter::ConstraintKeyword(details.constraint()), " of ",
          target, " from ",
          details.old_value().empty() ? "none" : details.old_value(), " to ",
          details.new_value().empty() ? "none" : details.new_value());
    case Operation::MAKE_REQUIRED:
      return absl_ports::StrCat("make ", target, " required");
    case Operation::MAKE_OPTIONAL:
      return absl_ports::StrCat("make ", target, " optional");
    case Operation::REVIEW:
    case Operation::UNKNOWN:
      break;
  }
  return absl_ports::StrCat("review ", target, ": ", change.description());
}

}  // namespace openapi_adapter
}  // namespace lib
}  // namespace schemadiff
