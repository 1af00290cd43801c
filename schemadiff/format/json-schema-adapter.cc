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

#include "schemadiff/format/json-schema-adapter.h"

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include <yaml-cpp/yaml.h>
#include "schemadiff/absl_ports/status_macros.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/format/yaml-document.h"
#include "schemadiff/model/schema-node-util.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/util/logging.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

using Operation = MigrationInstructionProto::Operation;

struct KeywordMapping {
  std::string_view keyword;
  std::string_view constraint;
};

constexpr KeywordMapping kNumericKeywords[] = {
    {"minimum", schema_node_util::kMinimum},
    {"maximum", schema_node_util::kMaximum},
    {"exclusiveMinimum", schema_node_util::kExclusiveMinimum},
    {"exclusiveMaximum", schema_node_util::kExclusiveMaximum},
    {"minLength", schema_node_util::kMinLength},
    {"maxLength", schema_node_util::kMaxLength},
    {"multipleOf", schema_node_util::kMultipleOf},
};

constexpr KeywordMapping kStringKeywords[] = {
    {"pattern", schema_node_util::kPattern},
    {"format", schema_node_util::kFormat},
};

constexpr KeywordMapping kOtherKeywords[] = {
    {"enum", schema_node_util::kEnum},
    {"default", schema_node_util::kDefault},
    {"minItems", schema_node_util::kMinItems},
    {"maxItems", schema_node_util::kMaxItems},
};

constexpr std::string_view kScalarTypes[] = {"string",  "integer", "number",
                                             "boolean", "null",    "any"};

bool IsScalarType(std::string_view type) {
  for (std::string_view scalar_type : kScalarTypes) {
    if (scalar_type == type) {
      return true;
    }
  }
  return false;
}

std::string ChildPath(const std::string& path, std::string_view key) {
  return absl_ports::StrCat(path, "/", key);
}

// Reads minItems, maxItems, minLength or maxLength.
//
// Returns:
//   The length on success
//   INVALID_ARGUMENT if the value is not a non-negative integer within the
//     int64_t range
libtextclassifier3::StatusOr<int64_t> GetLength(const YAML::Node& node,
                                                const std::string& path) {
  SCHEMADIFF_ASSIGN_OR_RETURN(double value,
                              yaml_document::GetNumber(node, path));
  // 2^63 is the first double past the int64_t range.
  if (!(value >= 0 && value < 9223372036854775808.0) ||
      value != std::floor(value)) {
    return ParseError(absl_ports::StrCat(
        "Expected a non-negative integer length at '", path, "', got ",
        yaml_document::ToCompactString(node)));
  }
  return static_cast<int64_t>(value);
}

bool IsLengthConstraint(std::string_view constraint) {
  return constraint == schema_node_util::kMinLength ||
         constraint == schema_node_util::kMaxLength;
}

// Escapes a pointer segment as RFC 6901 requires.
std::string EscapeSegment(std::string_view segment) {
  std::string escaped;
  for (char c : segment) {
    if (c == '~') {
      escaped += "~0";
    } else if (c == '/') {
      escaped += "~1";
    } else {
      escaped += c;
    }
  }
  return escaped;
}

std::string ValueOrNone(const std::string& value) {
  return value.empty() ? "none" : value;
}

}  // namespace

libtextclassifier3::StatusOr<SchemaNodeProto> JsonSchemaNormalizer::NormalizeNode(
    const YAML::Node& node, const std::string& path, int depth) const {
  if (depth > max_depth_) {
    return ParseError(absl_ports::StrCat(
        "Schema nesting exceeds the maximum depth of ",
        std::to_string(max_depth_), " at '", path, "'"));
  }
  SchemaNodeProto result;
  bool accepts_all = false;
  if (node.IsScalar() && YAML::convert<bool>::decode(node, accepts_all)) {
    // Boolean schemas accept everything or nothing.
    result.mutable_scalar()->set_primitive(accepts_all ? "any" : "never");
    result.mutable_metadata()->set_format(format_);
    return result;
  }
  if (!node.IsMap()) {
    return ParseError(absl_ports::StrCat("Schema at '", path,
                                         "' must be an object, got ",
                                         yaml_document::NodeClass(node)));
  }

  YAML::Node ref = yaml_document::Child(node, "$ref");
  YAML::Node all_of = yaml_document::Child(node, "allOf");
  YAML::Node one_of = yaml_document::Child(node, "oneOf");
  if (!one_of.IsDefined()) {
    one_of.reset(yaml_document::Child(node, "anyOf"));
  }
  YAML::Node type = yaml_document::Child(node, "type");

  if (ref.IsDefined()) {
    SCHEMADIFF_ASSIGN_OR_RETURN(
        std::string target,
        yaml_document::GetString(ref, ChildPath(path, "$ref")));
    result.mutable_reference()->set_target(std::move(target));
  } else if (all_of.IsDefined()) {
    SCHEMADIFF_ASSIGN_OR_RETURN(result, NormalizeAllOf(node, path, depth));
  } else if (one_of.IsDefined()) {
    if (!one_of.IsSequence()) {
      return ParseError(absl_ports::StrCat(
          "oneOf/anyOf at '", path, "' must be a list of schemas"));
    }
    UnionNodeProto* union_node = result.mutable_union_node();
    int index = 0;
    for (const YAML::Node& alternative : one_of) {
      SCHEMADIFF_ASSIGN_OR_RETURN(
          *union_node->add_alternatives(),
          NormalizeNode(alternative,
                        ChildPath(path, std::to_string(index++)), depth + 1));
    }
  } else if (type.IsSequence()) {
    SCHEMADIFF_ASSIGN_OR_RETURN(
        std::vector<std::string> types,
        yaml_document::GetStringList(type, ChildPath(path, "type")));
    if (types.size() == 1) {
      SCHEMADIFF_ASSIGN_OR_RETURN(result,
                                  NormalizeTyped(node, types[0], path, depth));
    } else {
      UnionNodeProto* union_node = result.mutable_union_node();
      for (const std::string& alternative_type : types) {
        SCHEMADIFF_ASSIGN_OR_RETURN(
            *union_node->add_alternatives(),
            NormalizeTyped(node, alternative_type, path, depth + 1));
      }
    }
  } else if (type.IsDefined()) {
    SCHEMADIFF_ASSIGN_OR_RETURN(
        std::string type_name,
        yaml_document::GetString(type, ChildPath(path, "type")));
    SCHEMADIFF_ASSIGN_OR_RETURN(result,
                                NormalizeTyped(node, type_name, path, depth));
  } else if (yaml_document::Child(node, "properties").IsDefined() ||
             yaml_document::Child(node, "required").IsDefined()) {
    SCHEMADIFF_ASSIGN_OR_RETURN(result,
                                NormalizeTyped(node, "object", path, depth));
  } else if (yaml_document::Child(node, "items").IsDefined()) {
    SCHEMADIFF_ASSIGN_OR_RETURN(result,
                                NormalizeTyped(node, "array", path, depth));
  } else {
    SCHEMADIFF_ASSIGN_OR_RETURN(result,
                                NormalizeTyped(node, "any", path, depth));
  }
  SCHEMADIFF_RETURN_IF_ERROR(ApplyMetadata(node, path, &result));
  return result;
}

libtextclassifier3::StatusOr<SchemaNodeProto>
JsonSchemaNormalizer::NormalizeTyped(const YAML::Node& node,
                                     std::string_view type,
                                     const std::string& path,
                                     int depth) const {
  SchemaNodeProto result;
  result.mutable_metadata()->set_format(format_);
  if (type == "object") {
    ObjectNodeProto* object = result.mutable_object();
    YAML::Node properties = yaml_document::Child(node, "properties");
    if (properties.IsDefined() && !properties.IsNull()) {
      if (!properties.IsMap()) {
        return ParseError(absl_ports::StrCat(
            "properties at '", path, "' must be a mapping"));
      }
      for (const auto& entry : properties) {
        std::string name = entry.first.Scalar();
        FieldProto* field = object->add_fields();
        field->set_name(name);
        SCHEMADIFF_ASSIGN_OR_RETURN(
            *field->mutable_node(),
            NormalizeNode(entry.second, ChildPath(path, name), depth + 1));
      }
    }
    YAML::Node required = yaml_document::Child(node, "required");
    if (required.IsDefined()) {
      SCHEMADIFF_ASSIGN_OR_RETURN(
          std::vector<std::string> names,
          yaml_document::GetStringList(required, ChildPath(path, "required")));
      for (std::string& name : names) {
        if (!schema_node_util::IsRequired(*object, name)) {
          object->add_required(std::move(name));
        }
      }
    }
    return result;
  }
  if (type == "array") {
    ArrayNodeProto* array = result.mutable_array();
    YAML::Node items = yaml_document::Child(node, "items");
    if (!items.IsDefined()) {
      array->mutable_element()->mutable_scalar()->set_primitive("any");
      array->mutable_element()->mutable_metadata()->set_format(format_);
    } else if (items.IsSequence()) {
      // Tuple validation: any listed schema may appear.
      UnionNodeProto* union_node =
          array->mutable_element()->mutable_union_node();
      int index = 0;
      for (const YAML::Node& item : items) {
        SCHEMADIFF_ASSIGN_OR_RETURN(
            *union_node->add_alternatives(),
            NormalizeNode(item,
                          ChildPath(path, absl_ports::StrCat(
                                              "items/",
                                              std::to_string(index++))),
                          depth + 1));
      }
    } else {
      SCHEMADIFF_ASSIGN_OR_RETURN(
          *array->mutable_element(),
          NormalizeNode(items, ChildPath(path, "items"), depth + 1));
    }
    YAML::Node min_items = yaml_document::Child(node, "minItems");
    if (min_items.IsDefined()) {
      SCHEMADIFF_ASSIGN_OR_RETURN(
          int64_t length, GetLength(min_items, ChildPath(path, "minItems")));
      array->set_min_length(length);
    }
    YAML::Node max_items = yaml_document::Child(node, "maxItems");
    if (max_items.IsDefined()) {
      SCHEMADIFF_ASSIGN_OR_RETURN(
          int64_t length, GetLength(max_items, ChildPath(path, "maxItems")));
      array->set_max_length(length);
    }
    return result;
  }
  if (!IsScalarType(type)) {
    return ParseError(
        absl_ports::StrCat("Unknown type '", type, "' at '", path, "'"));
  }
  ScalarNodeProto* scalar = result.mutable_scalar();
  scalar->set_primitive(std::string(type));
  SCHEMADIFF_RETURN_IF_ERROR(AddScalarConstraints(node, path, scalar));
  return result;
}

libtextclassifier3::StatusOr<SchemaNodeProto>
JsonSchemaNormalizer::NormalizeAllOf(const YAML::Node& node,
                                     const std::string& path,
                                     int depth) const {
  YAML::Node all_of = yaml_document::Child(node, "allOf");
  if (!all_of.IsSequence() || all_of.size() == 0) {
    return ParseError(absl_ports::StrCat(
        "allOf at '", path, "' must be a non-empty list of schemas"));
  }
  std::vector<SchemaNodeProto> parts;
  int index = 0;
  for (const YAML::Node& part : all_of) {
    SCHEMADIFF_ASSIGN_OR_RETURN(
        SchemaNodeProto normalized,
        NormalizeNode(part,
                      ChildPath(path, absl_ports::StrCat(
                                          "allOf/", std::to_string(index++))),
                      depth + 1));
    parts.push_back(std::move(normalized));
  }
  // Sibling keywords constrain the same instance.
  if (yaml_document::Child(node, "properties").IsDefined()) {
    SCHEMADIFF_ASSIGN_OR_RETURN(SchemaNodeProto siblings,
                                NormalizeTyped(node, "object", path, depth));
    parts.push_back(std::move(siblings));
  }
  if (parts.size() == 1) {
    return std::move(parts[0]);
  }

  SchemaNodeProto merged;
  merged.mutable_metadata()->set_format(format_);
  ObjectNodeProto* object = merged.mutable_object();
  for (SchemaNodeProto& part : parts) {
    if (part.kind_case() != SchemaNodeProto::kObject) {
      return ParseError(absl_ports::StrCat(
          "allOf at '", path, "' can only combine object schemas, found ",
          schema_node_util::NodeSignature(part)));
    }
    for (FieldProto& field : *part.mutable_object()->mutable_fields()) {
      if (schema_node_util::FindField(*object, field.name()) != nullptr) {
        SCHEMADIFF_VLOG(1) << "allOf at " << path << " redefines "
                           << field.name() << ", keeping the first";
        continue;
      }
      *object->add_fields() = std::move(field);
    }
    for (const std::string& name : part.object().required()) {
      if (!schema_node_util::IsRequired(*object, name)) {
        object->add_required(name);
      }
    }
  }
  return merged;
}

libtextclassifier3::Status JsonSchemaNormalizer::AddScalarConstraints(
    const YAML::Node& node, const std::string& path,
    ScalarNodeProto* scalar) const {
  for (const KeywordMapping& mapping : kNumericKeywords) {
    YAML::Node value = yaml_document::Child(node, mapping.keyword);
    if (!value.IsDefined()) {
      continue;
    }
    bool flag = false;
    if (YAML::convert<bool>::decode(value, flag)) {
      // Draft 4 boolean exclusive bounds only modify minimum and maximum.
      SCHEMADIFF_VLOG(1) << "Ignoring boolean " << mapping.keyword << " at "
                         << path;
      continue;
    }
    double number = 0;
    if (IsLengthConstraint(mapping.constraint)) {
      SCHEMADIFF_ASSIGN_OR_RETURN(
          int64_t length, GetLength(value, ChildPath(path, mapping.keyword)));
      number = static_cast<double>(length);
    } else {
      SCHEMADIFF_ASSIGN_OR_RETURN(
          number,
          yaml_document::GetNumber(value, ChildPath(path, mapping.keyword)));
    }
    ConstraintProto* constraint = scalar->add_constraints();
    constraint->set_name(std::string(mapping.constraint));
    constraint->set_number_value(number);
  }
  for (const KeywordMapping& mapping : kStringKeywords) {
    YAML::Node value = yaml_document::Child(node, mapping.keyword);
    if (!value.IsDefined()) {
      continue;
    }
    SCHEMADIFF_ASSIGN_OR_RETURN(
        std::string text,
        yaml_document::GetString(value, ChildPath(path, mapping.keyword)));
    ConstraintProto* constraint = scalar->add_constraints();
    constraint->set_name(std::string(mapping.constraint));
    constraint->set_string_value(std::move(text));
  }

  YAML::Node enum_values = yaml_document::Child(node, "enum");
  YAML::Node const_value = yaml_document::Child(node, "const");
  if (enum_values.IsDefined()) {
    if (!enum_values.IsSequence()) {
      return ParseError(
          absl_ports::StrCat("enum at '", path, "' must be a list"));
    }
    ConstraintProto* constraint = scalar->add_constraints();
    constraint->set_name(std::string(schema_node_util::kEnum));
    for (const YAML::Node& value : enum_values) {
      constraint->add_enum_values(yaml_document::ToCompactString(value));
    }
  } else if (const_value.IsDefined()) {
    ConstraintProto* constraint = scalar->add_constraints();
    constraint->set_name(std::string(schema_node_util::kEnum));
    constraint->add_enum_values(yaml_document::ToCompactString(const_value));
  }

  YAML::Node default_value = yaml_document::Child(node, "default");
  if (default_value.IsDefined()) {
    ConstraintProto* constraint = scalar->add_constraints();
    constraint->set_name(std::string(schema_node_util::kDefault));
    constraint->set_string_value(yaml_document::ToCompactString(default_value));
  }
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::Status JsonSchemaNormalizer::ApplyMetadata(
    const YAML::Node& node, const std::string& path,
    SchemaNodeProto* result) const {
  NodeMetadataProto* metadata = result->mutable_metadata();
  metadata->set_format(format_);
  YAML::Node deprecated = yaml_document::Child(node, "deprecated");
  if (deprecated.IsDefined()) {
    SCHEMADIFF_ASSIGN_OR_RETURN(
        bool is_deprecated,
        yaml_document::GetBool(deprecated, ChildPath(path, "deprecated")));
    metadata->set_deprecated(is_deprecated);
  }
  YAML::Node default_value = yaml_document::Child(node, "default");
  if (default_value.IsDefined()) {
    (*metadata->mutable_attributes())[std::string(
        schema_node_util::kDefaultAttribute)] =
        yaml_document::ToCompactString(default_value);
  }
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::Status JsonSchemaNormalizer::NormalizeDefinitions(
    const YAML::Node& node, const std::string& path,
    google::protobuf::RepeatedPtrField<FieldProto>* definitions) const {
  if (!node.IsMap()) {
    return ParseError(
        absl_ports::StrCat("Definitions at '", path, "' must be a mapping"));
  }
  for (const auto& entry : node) {
    std::string name = entry.first.Scalar();
    for (const FieldProto& existing : *definitions) {
      if (existing.name() == name) {
        return ParseError(absl_ports::StrCat("Definition '", name,
                                             "' is declared twice"));
      }
    }
    FieldProto* definition = definitions->Add();
    definition->set_name(name);
    SCHEMADIFF_ASSIGN_OR_RETURN(
        *definition->mutable_node(),
        NormalizeNode(entry.second, ChildPath(path, name), /*depth=*/1));
  }
  return libtextclassifier3::Status::OK;
}

namespace json_schema_adapter {

libtextclassifier3::Status CheckSyntax(std::string_view content) {
  SCHEMADIFF_ASSIGN_OR_RETURN(YAML::Node root, yaml_document::Load(content));
  bool accepts_all = false;
  if (!root.IsMap() &&
      !(root.IsScalar() && YAML::convert<bool>::decode(root, accepts_all))) {
    return ParseError(absl_ports::StrCat(
        "JSON Schema root must be an object, got ",
        yaml_document::NodeClass(root)));
  }
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::StatusOr<NormalizedSchemaProto> Normalize(
    std::string_view content, int max_depth) {
  SCHEMADIFF_RETURN_IF_ERROR(CheckSyntax(content));
  SCHEMADIFF_ASSIGN_OR_RETURN(YAML::Node root, yaml_document::Load(content));
  JsonSchemaNormalizer normalizer(SchemaFormat::JSON_SCHEMA, max_depth);
  NormalizedSchemaProto schema;
  schema.set_format(SchemaFormat::JSON_SCHEMA);
  SCHEMADIFF_ASSIGN_OR_RETURN(*schema.mutable_root(),
                              normalizer.NormalizeNode(root, "#", 0));
  for (std::string_view key : {"$defs", "definitions"}) {
    YAML::Node definitions = yaml_document::Child(root, key);
    if (definitions.IsDefined()) {
      SCHEMADIFF_RETURN_IF_ERROR(normalizer.NormalizeDefinitions(
          definitions, absl_ports::StrCat("#/", key),
          schema.mutable_definitions()));
    }
  }
  return schema;
}

std::string MemberPointer(
    const google::protobuf::RepeatedPtrField<std::string>& container,
    std::string_view member) {
  std::string pointer;
  for (const std::string& segment : container) {
    absl_ports::StrAppend(&pointer, "/", EscapeSegment(segment));
  }
  if (!member.empty()) {
    absl_ports::StrAppend(&pointer, "/", EscapeSegment(member));
  }
  return pointer.empty() ? "/" : pointer;
}

std::string_view ConstraintKeyword(std::string_view constraint) {
  for (const KeywordMapping& mapping : kNumericKeywords) {
    if (mapping.constraint == constraint) {
      return mapping.keyword;
    }
  }
  for (const KeywordMapping& mapping : kStringKeywords) {
    if (mapping.constraint == constraint) {
      return mapping.keyword;
    }
  }
  for (const KeywordMapping& mapping : kOtherKeywords) {
    if (mapping.constraint == constraint) {
      return mapping.keyword;
    }
  }
  return constraint;
}

std::string Render(const MigrationInstructionProto& instruction) {
  const ChangeProto& change = instruction.change();
  const ChangeDetailsProto& details = change.details();
  std::string pointer =
      MemberPointer(instruction.container(), instruction.member());
  switch (instruction.operation()) {
    case Operation::ADD_MEMBER: {
      std::string type = instruction.has_node()
                             ? schema_node_util::NodeSignature(instruction.node())
                             : details.new_type();
      return absl_ports::StrCat("add ", pointer, ": ", type,
                                instruction.required() ? " (required)"
                                                       : " (optional)");
    }
    case Operation::DROP_MEMBER:
      return absl_ports::StrCat("remove ", pointer);
    case Operation::RENAME_MEMBER:
      return absl_ports::StrCat(
          "move ", pointer, " -> ",
          MemberPointer(instruction.container(), details.new_name()));
    case Operation::CHANGE_TYPE:
      return absl_ports::StrCat("replace ", pointer, ": ", details.old_type(),
                                " -> ", details.new_type());
    case Operation::TIGHTEN_CONSTRAINT:
    case Operation::LOOSEN_CONSTRAINT:
      return absl_ports::StrCat(
          instruction.operation() == Operation::TIGHTEN_CONSTRAINT
              ? "tighten "
              : "loosen ",
          pointer, " ", ConstraintKeyword(details.constraint()), ": ",
          ValueOrNone(details.old_value()), " -> ",
          ValueOrNone(details.new_value()));
    case Operation::MAKE_REQUIRED:
      return absl_ports::StrCat("require ", pointer);
    case Operation::MAKE_OPTIONAL:
      return absl_ports::StrCat("unrequire ", pointer);
    case Operation::REVIEW:
    case Operation::UNKNOWN:
      break;
  }
  return absl_ports::StrCat("review ", pointer, ": ", change.description());
}

}  // namespace json_schema_adapter

}  // namespace lib
}  // namespace schemadiff
