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

#include "schemadiff/model/schema-node-util.h"

#include <cmath>
#include <cstdio>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/absl_ports/str_join.h"
#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {
namespace schema_node_util {

ConstraintDirection GetConstraintDirection(std::string_view name) {
  if (name == kMinimum || name == kExclusiveMinimum || name == kMinLength ||
      name == kMinItems || name == kMinProperties) {
    return ConstraintDirection::kLowerBound;
  }
  if (name == kMaximum || name == kExclusiveMaximum || name == kMaxLength ||
      name == kMaxItems || name == kMaxProperties) {
    return ConstraintDirection::kUpperBound;
  }
  if (name == kEnum) {
    return ConstraintDirection::kValueSet;
  }
  if (name == kDefault) {
    return ConstraintDirection::kPresenceLoosens;
  }
  return ConstraintDirection::kPresenceTightens;
}

std::string NodeSignature(const SchemaNodeProto& node) {
  switch (node.kind_case()) {
    case SchemaNodeProto::kScalar:
      return node.scalar().primitive();
    case SchemaNodeProto::kObject:
      return "object";
    case SchemaNodeProto::kArray:
      return absl_ports::StrCat("array<", NodeSignature(node.array().element()),
                                ">");
    case SchemaNodeProto::kUnionNode: {
      std::vector<std::string> alternatives;
      for (const SchemaNodeProto& alternative :
           node.union_node().alternatives()) {
        alternatives.push_back(NodeSignature(alternative));
      }
      return absl_ports::StrCat("union<",
                                absl_ports::StrJoin(alternatives, "|"), ">");
    }
    case SchemaNodeProto::kReference:
      return absl_ports::StrCat("ref:", node.reference().target());
    case SchemaNodeProto::KIND_NOT_SET:
      break;
  }
  return "unset";
}

const char* NodeKindName(SchemaNodeProto::KindCase kind) {
  switch (kind) {
    case SchemaNodeProto::kScalar:
      return "scalar";
    case SchemaNodeProto::kObject:
      return "object";
    case SchemaNodeProto::kArray:
      return "array";
    case SchemaNodeProto::kUnionNode:
      return "union";
    case SchemaNodeProto::kReference:
      return "reference";
    case SchemaNodeProto::KIND_NOT_SET:
      break;
  }
  return "unset";
}

std::vector<std::string> UnionAlternativeLabels(
    const UnionNodeProto& union_node) {
  std::vector<std::string> labels;
  std::unordered_map<std::string, int> seen;
  for (const SchemaNodeProto& alternative : union_node.alternatives()) {
    std::string signature = NodeSignature(alternative);
    int count = ++seen[signature];
    if (count == 1) {
      labels.push_back(std::move(signature));
    } else {
      labels.push_back(
          absl_ports::StrCat(signature, "#", std::to_string(count)));
    }
  }
  return labels;
}

std::string NumberToString(double value) {
  if (std::isfinite(value) && value == std::floor(value) &&
      std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  char buffer[32];
  snprintf(buffer, sizeof(buffer), "%g", value);
  return buffer;
}

std::string ConstraintValueToString(const ConstraintProto& constraint) {
  if (constraint.enum_values_size() > 0) {
    return absl_ports::StrCat("[", absl_ports::StrJoin(constraint.enum_values(),
                                                       ", "),
                              "]");
  }
  switch (constraint.value_case()) {
    case ConstraintProto::kNumberValue:
      return NumberToString(constraint.number_value());
    case ConstraintProto::kStringValue:
      return constraint.string_value();
    case ConstraintProto::VALUE_NOT_SET:
      break;
  }
  return "true";
}

bool IsRequired(const ObjectNodeProto& object, std::string_view name) {
  for (const std::string& required : object.required()) {
    if (required == name) {
      return true;
    }
  }
  return false;
}

std::string GetAttribute(const SchemaNodeProto& node, std::string_view key) {
  const auto& attributes = node.metadata().attributes();
  auto itr = attributes.find(std::string(key));
  if (itr == attributes.end()) {
    return "";
  }
  return itr->second;
}

bool HasAttribute(const SchemaNodeProto& node, std::string_view key) {
  return node.metadata().attributes().count(std::string(key)) > 0;
}

const FieldProto* FindField(const ObjectNodeProto& object,
                            std::string_view name) {
  for (const FieldProto& field : object.fields()) {
    if (field.name() == name) {
      return &field;
    }
  }
  return nullptr;
}

}  // namespace schema_node_util
}  // namespace lib
}  // namespace schemadiff
