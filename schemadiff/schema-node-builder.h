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

#ifndef SCHEMADIFF_SCHEMA_NODE_BUILDER_H_
#define SCHEMADIFF_SCHEMA_NODE_BUILDER_H_

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {

constexpr SchemaFormat::Code FORMAT_JSON_SCHEMA = SchemaFormat::JSON_SCHEMA;
constexpr SchemaFormat::Code FORMAT_OPENAPI = SchemaFormat::OPENAPI;
constexpr SchemaFormat::Code FORMAT_PROTOBUF = SchemaFormat::PROTOBUF;
constexpr SchemaFormat::Code FORMAT_SQL_DDL = SchemaFormat::SQL_DDL;

class NodeBuilder {
 public:
  NodeBuilder() = default;
  explicit NodeBuilder(SchemaNodeProto node) : node_(std::move(node)) {}

  static NodeBuilder Scalar(std::string_view primitive) {
    NodeBuilder builder;
    builder.node_.mutable_scalar()->set_primitive(std::string(primitive));
    return builder;
  }

  static NodeBuilder Object() {
    NodeBuilder builder;
    builder.node_.mutable_object();
    return builder;
  }

  static NodeBuilder Array(SchemaNodeProto element) {
    NodeBuilder builder;
    *builder.node_.mutable_array()->mutable_element() = std::move(element);
    return builder;
  }

  static NodeBuilder Union(std::initializer_list<SchemaNodeProto> alternatives) {
    NodeBuilder builder;
    UnionNodeProto* union_node = builder.node_.mutable_union_node();
    for (const SchemaNodeProto& alternative : alternatives) {
      *union_node->add_alternatives() = alternative;
    }
    return builder;
  }

  static NodeBuilder Reference(std::string_view target) {
    NodeBuilder builder;
    builder.node_.mutable_reference()->set_target(std::string(target));
    return builder;
  }

  NodeBuilder& AddField(std::string_view name, SchemaNodeProto node,
                        bool required = false) {
    ObjectNodeProto* object = node_.mutable_object();
    FieldProto* field = object->add_fields();
    field->set_name(std::string(name));
    *field->mutable_node() = std::move(node);
    if (required) {
      object->add_required(std::string(name));
    }
    return *this;
  }

  NodeBuilder& AddConstraint(std::string_view name, double value) {
    ConstraintProto* constraint = node_.mutable_scalar()->add_constraints();
    constraint->set_name(std::string(name));
    constraint->set_number_value(value);
    return *this;
  }

  NodeBuilder& AddStringConstraint(std::string_view name,
                                   std::string_view value) {
    ConstraintProto* constraint = node_.mutable_scalar()->add_constraints();
    constraint->set_name(std::string(name));
    constraint->set_string_value(std::string(value));
    return *this;
  }

  NodeBuilder& AddEnumConstraint(std::initializer_list<std::string> values) {
    ConstraintProto* constraint = node_.mutable_scalar()->add_constraints();
    constraint->set_name("enum");
    for (const std::string& value : values) {
      constraint->add_enum_values(value);
    }
    return *this;
  }

  NodeBuilder& SetArrayLength(int64_t min_length, int64_t max_length) {
    node_.mutable_array()->set_min_length(min_length);
    node_.mutable_array()->set_max_length(max_length);
    return *this;
  }

  NodeBuilder& SetIdentityKey(std::string_view key) {
    node_.mutable_metadata()->set_identity_key(std::string(key));
    return *this;
  }

  NodeBuilder& SetDeprecated(bool deprecated = true) {
    node_.mutable_metadata()->set_deprecated(deprecated);
    return *this;
  }

  NodeBuilder& SetAttribute(std::string_view key, std::string_view value) {
    (*node_.mutable_metadata()->mutable_attributes())[std::string(key)] =
        std::string(value);
    return *this;
  }

  SchemaNodeProto Build() const { return node_; }

 private:
  SchemaNodeProto node_;
};

inline NormalizedSchemaProto MakeNormalizedSchema(SchemaFormat::Code format,
                                                  SchemaNodeProto root) {
  NormalizedSchemaProto schema;
  schema.set_format(format);
  *schema.mutable_root() = std::move(root);
  return schema;
}

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_SCHEMA_NODE_BUILDER_H_
