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

#ifndef SCHEMADIFF_MODEL_SCHEMA_H_
#define SCHEMADIFF_MODEL_SCHEMA_H_

#include <string>
#include <string_view>

#include "utils/base/statusor.h"
#include "schemadiff/model/semantic-version.h"
#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {

// One version of a schema document as supplied by the caller. The content is
// only checked to be well formed; it is normalized when it is analyzed.
class Schema {
 public:
  // Validates, in this order, that format has an adapter, that content is
  // neither empty nor all whitespace, that it is valid UTF-8, that version is
  // a semantic version and that content is syntactically valid for format.
  //
  // Returns:
  //   Schema on success
  //   UNIMPLEMENTED (InvalidFormatError) if format is not supported
  //   INVALID_ARGUMENT (ParseError) on empty content, a malformed version or
  //     a document of the wrong shape
  //   DATA_LOSS (EncodingError) if content is not valid UTF-8
  //   UNKNOWN (FormatSpecificError) if the format's parser rejects content
  static libtextclassifier3::StatusOr<Schema> Create(SchemaFormat::Code format,
                                                     std::string content,
                                                     std::string_view version);

  SchemaFormat::Code format() const { return format_; }
  const std::string& content() const { return content_; }
  const SemanticVersion& version() const { return version_; }

 private:
  Schema(SchemaFormat::Code format, std::string content,
         SemanticVersion version);

  SchemaFormat::Code format_;
  std::string content_;
  SemanticVersion version_;
};

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_MODEL_SCHEMA_H_
