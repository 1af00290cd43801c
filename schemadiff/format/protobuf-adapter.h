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

#ifndef SCHEMADIFF_FORMAT_PROTOBUF_ADAPTER_H_
#define SCHEMADIFF_FORMAT_PROTOBUF_ADAPTER_H_

#include <string>
#include <string_view>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include <google/protobuf/descriptor.h>
#include <google/protobuf/descriptor.pb.h>
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {
namespace protobuf_adapter {

// Returns:
//   The parsed file on success
//   UNKNOWN (FormatSpecificError) if content is not a FileDescriptorProto in
//     text format
libtextclassifier3::StatusOr<google::protobuf::FileDescriptorProto> ParseFile(
    std::string_view content);

libtextclassifier3::Status CheckSyntax(std::string_view content);

// Builds the file into a descriptor pool, so that type references resolve,
// and normalizes its top-level messages and enums. Fields are identified by
// their number.
//
// Returns:
//   The normalized schema on success
//   UNKNOWN (FormatSpecificError) if the text does not parse or the
//     descriptor pool rejects the file
//   INVALID_ARGUMENT (ParseError) if messages nest deeper than max_depth
libtextclassifier3::StatusOr<NormalizedSchemaProto> Normalize(
    std::string_view content, int max_depth);

// "varint", "i64", "len", "group" or "i32".
const char* WireTypeName(google::protobuf::FieldDescriptor::Type type);

// Renders a step as a .proto edit, e.g.
// "User: remove field email and reserve 3, \"email\"".
std::string Render(const MigrationInstructionProto& instruction);

}  // namespace protobuf_adapter
}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_FORMAT_PROTOBUF_ADAPTER_H_
