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

#include "schemadiff/format/yaml-document.h"

#include <string>
#include <string_view>
#include <vector>

#include "utils/base/statusor.h"
#include <yaml-cpp/yaml.h>
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {
namespace yaml_document {

namespace {

libtextclassifier3::Status TypeMismatch(std::string_view path,
                                        std::string_view expected,
                                        const YAML::Node& node) {
  return ParseError(absl_ports::StrCat("Expected ", expected, " at '", path,
                                       "', got ", NodeClass(node)));
}

}  // namespace

libtextclassifier3::StatusOr<YAML::Node> Load(std::string_view content) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(content));
  } catch (const YAML::Exception& e) {
    return FormatSpecificError(absl_ports::StrCat(
        "line ", std::to_string(e.mark.line + 1), ", column ",
        std::to_string(e.mark.column + 1), ": ", e.msg));
  }
  if (!root.IsDefined() || root.IsNull()) {
    return ParseError("Document is empty");
  }
  return root;
}

const char* NodeClass(const YAML::Node& node) {
  if (!node.IsDefined() || node.IsNull()) {
    return "null";
  }
  if (node.IsScalar()) {
    return "scalar";
  }
  if (node.IsSequence()) {
    return "sequence";
  }
  if (node.IsMap()) {
    return "map";
  }
  return "unknown";
}

YAML::Node Child(const YAML::Node& node, std::string_view key) {
  if (!node.IsMap()) {
    return YAML::Node(YAML::NodeType::Undefined);
  }
  for (const auto& entry : node) {
    if (entry.first.IsScalar() && entry.first.Scalar() == key) {
      return entry.second;
    }
  }
  return YAML::Node(YAML::NodeType::Undefined);
}

libtextclassifier3::StatusOr<std::string> GetString(const YAML::Node& node,
                                                     std::string_view path) {
  if (!node.IsScalar()) {
    return TypeMismatch(path, "a string", node);
  }
  return node.Scalar();
}

libtextclassifier3::StatusOr<double> GetNumber(const YAML::Node& node,
                                               std::string_view path) {
  double value = 0;
  if (!node.IsScalar() || !YAML::convert<double>::decode(node, value)) {
    return TypeMismatch(path, "a number", node);
  }
  return value;
}

libtextclassifier3::StatusOr<bool> GetBool(const YAML::Node& node,
                                           std::string_view path) {
  bool value = false;
  if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
    return TypeMismatch(path, "a boolean", node);
  }
  return value;
}

libtextclassifier3::StatusOr<std::vector<std::string>> GetStringList(
    const YAML::Node& node, std::string_view path) {
  if (!node.IsSequence()) {
    return TypeMismatch(path, "a list", node);
  }
  std::vector<std::string> values;
  values.reserve(node.size());
  for (const YAML::Node& item : node) {
    if (!item.IsScalar()) {
      return TypeMismatch(path, "a list of strings", item);
    }
    values.push_back(item.Scalar());
  }
  return values;
}

std::string ToCompactString(const YAML::Node& node) {
  if (node.IsScalar()) {
    return node.Scalar();
  }
  if (!node.IsDefined() || node.IsNull()) {
    return "null";
  }
  YAML::Emitter out;
  out << YAML::Flow << node;
  return out.c_str();
}

}  // namespace yaml_document
}  // namespace lib
}  // namespace schemadiff
