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

#include "schemadiff/model/schema.h"

#include <string>
#include <string_view>
#include <utility>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/absl_ports/status_macros.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/format/format-registry.h"
#include "schemadiff/model/semantic-version.h"
#include "schemadiff/util/i18n-utils.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

bool IsBlank(std::string_view content) {
  for (char c : content) {
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' &&
        c != '\v') {
      return false;
    }
  }
  return true;
}

}  // namespace

Schema::Schema(SchemaFormat::Code format, std::string content,
               SemanticVersion version)
    : format_(format),
      content_(std::move(content)),
      version_(std::move(version)) {}

libtextclassifier3::StatusOr<Schema> Schema::Create(SchemaFormat::Code format,
                                                    std::string content,
                                                    std::string_view version) {
  SCHEMADIFF_ASSIGN_OR_RETURN(const FormatCapabilities* capabilities,
                              LookupFormat(format));
  if (IsBlank(content)) {
    return ParseError(absl_ports::StrCat("Empty ", capabilities->name,
                                         " schema content"));
  }
  int error_offset = 0;
  if (!i18n_utils::IsValidUtf8(content, &error_offset)) {
    return EncodingError(absl_ports::StrCat(
        "Schema content is not valid UTF-8 at byte ",
        std::to_string(error_offset)));
  }
  SCHEMADIFF_ASSIGN_OR_RETURN(SemanticVersion parsed_version,
                              SemanticVersion::Parse(version));
  SCHEMADIFF_RETURN_IF_ERROR(capabilities->check_syntax(content));
  return Schema(format, std::move(content), std::move(parsed_version));
}

}  // namespace lib
}  // namespace schemadiff
