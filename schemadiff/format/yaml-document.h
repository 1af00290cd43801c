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

#ifndef SCHEMADIFF_FORMAT_YAML_DOCUMENT_H_
#define SCHEMADIFF_FORMAT_YAML_DOCUMENT_H_

#include <string>
#include <string_view>
#include <vector>

#include "utils/base/statusor.h"
#include <yaml-cpp/yaml.h>

namespace schemadiff {
namespace lib {
namespace yaml_document {

// Parses a JSON or YAML document.
//
// Returns:
//   The document root on success
//   UNKNOWN (FormatSpecificError) if yaml-cpp rejects the content
//   INVALID_ARGUMENT (ParseError) if the document is empty
libtextclassifier3::StatusOr<YAML::Node> Load(std::string_view content);

// "null", "scalar", "sequence" or "map".
const char* NodeClass(const YAML::Node& node);

// Child of a mapping, or an undefined node if node is not a mapping or has
// no such key. Never throws.
YAML::Node Child(const YAML::Node& node, std::string_view key);

// Returns:
//   The scalar text on success
//   INVALID_ARGUMENT if node is not a scalar
libtextclassifier3::StatusOr<std::string> GetString(const YAML::Node& node,
                                                     std::string_view path);

// Returns:
//   The number on success
//   INVALID_ARGUMENT if node is not a numeric scalar
libtextclassifier3::StatusOr<double> GetNumber(const YAML::Node& node,
                                               std::string_view path);

// Returns:
//   The boolean on success
//   INVALID_ARGUMENT if node is not a boolean scalar
libtextclassifier3::StatusOr<bool> GetBool(const YAML::Node& node,
                                           std::string_view path);

// Returns:
//   The scalars of a sequence on success
//   INVALID_ARGUMENT if node is not a sequence of scalars
libtextclassifier3::StatusOr<std::vector<std::string>> GetStringList(
    const YAML::Node& node, std::string_view path);

// Compact single line text of any node, used for defaults and enum values.
std::string ToCompactString(const YAML::Node& node);

}  // namespace yaml_document
}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_FORMAT_YAML_DOCUMENT_H_
