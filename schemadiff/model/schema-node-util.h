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

#ifndef SCHEMADIFF_MODEL_SCHEMA_NODE_UTIL_H_
#define SCHEMADIFF_MODEL_SCHEMA_NODE_UTIL_H_

#include <string>
#include <string_view>
#include <vector>

#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {
namespace schema_node_util {

// Canonical constraint names shared by all adapters.
inline constexpr std::string_view kMinimum = "minimum";
inline constexpr std::string_view kMaximum = "maximum";
inline constexpr std::string_view kExclusiveMinimum = "exclusive_minimum";
inline constexpr std::string_view kExclusiveMaximum = "exclusive_maximum";
inline constexpr std::string_view kMinLength = "min_length";
inline constexpr std::string_view kMaxLength = "max_length";
inline constexpr std::string_view kMinItems = "min_items";
inline constexpr std::string_view kMaxItems = "max_items";
inline constexpr std::string_view kMinProperties = "min_properties";
inline constexpr std::string_view kMaxProperties = "max_properties";
inline constexpr std::string_view kPattern = "pattern";
inline constexpr std::string_view kFormat = "format";
inline constexpr std::string_view kEnum = "enum";
inline constexpr std::string_view kMultipleOf = "multiple_of";
inline constexpr std::string_view kUnique = "unique";
inline constexpr std::string_view kPrimaryKey = "primary_key";
inline constexpr std::string_view kDefault = "default";

// Well known metadata attribute keys.
inline constexpr std::string_view kFieldNumberAttribute = "field_number";
inline constexpr std::string_view kWireTypeAttribute = "wire_type";
inline constexpr std::string_view kNullableAttribute = "nullable";
inline constexpr std::string_view kPrimaryKeyAttribute = "primary_key";
inline constexpr std::string_view kDefaultAttribute = "default";
inline constexpr std::string_view kLocationAttribute = "in";

// Location segments that are not member names.
inline constexpr std::string_view kElementSegment = "[]";
inline constexpr std::string_view kDefinitionsSegment = "$defs";
inline constexpr char kConstraintSegmentPrefix = '@';

// How a change in a constraint's value affects the set of accepted values.
enum class ConstraintDirection {
  // Larger value accepts less (minimum, min_length, ...).
  kLowerBound,
  // Smaller value accepts less (maximum, max_length, ...).
  kUpperBound,
  // Subset accepts less (enum).
  kValueSet,
  // Presence accepts less, changed values are not ordered (pattern, ...).
  kPresenceTightens,
  // Presence accepts more (default).
  kPresenceLoosens,
};

ConstraintDirection GetConstraintDirection(std::string_view name);

// Short type description used in change details, e.g. "string", "object",
// "array<integer>", "ref:User", "union<string|null>".
std::string NodeSignature(const SchemaNodeProto& node);

const char* NodeKindName(SchemaNodeProto::KindCase kind);

// Location segments of the alternatives of a union: the alternative's
// signature, with "#n" appended to the n-th alternative of a repeated
// signature.
std::vector<std::string> UnionAlternativeLabels(
    const UnionNodeProto& union_node);

// Renders a constraint's value for descriptions and change details.
std::string ConstraintValueToString(const ConstraintProto& constraint);

// Renders a number without a trailing ".0" for integral values.
std::string NumberToString(double value);

bool IsRequired(const ObjectNodeProto& object, std::string_view name);

// Returns the attribute value, or empty string if absent.
std::string GetAttribute(const SchemaNodeProto& node, std::string_view key);

bool HasAttribute(const SchemaNodeProto& node, std::string_view key);

// Returns the named member of an object, or nullptr.
const FieldProto* FindField(const ObjectNodeProto& object,
                            std::string_view name);

}  // namespace schema_node_util
}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_MODEL_SCHEMA_NODE_UTIL_H_
