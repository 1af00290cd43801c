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

#ifndef SCHEMADIFF_FORMAT_OPENAPI_ADAPTER_H_
#define SCHEMADIFF_FORMAT_OPENAPI_ADAPTER_H_

#include <string>
#include <string_view>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {
namespace openapi_adapter {

// Member names of an operation object in the normalized tree.
inline constexpr std::string_view kParametersMember = "parameters";
inline constexpr std::string_view kRequestBodyMember = "requestBody";
inline constexpr std::string_view kResponsesMember = "responses";

// Security schemes live at components/securitySchemes/<name>, for Swagger 2
// securityDefinitions too.
inline constexpr std::string_view kComponentsMember = "components";
inline constexpr std::string_view kSecuritySchemesMember = "securitySchemes";

// Returns:
//   OK if content is an OpenAPI 3 or Swagger 2 document with a paths
//     mapping
//   UNKNOWN (FormatSpecificError) if the document does not parse
//   INVALID_ARGUMENT (ParseError) if the version key or paths are missing
libtextclassifier3::Status CheckSyntax(std::string_view content);

// Normalizes the document into
//   paths/<path>/<method>/{parameters, requestBody, responses}
// with the reusable schemas as definitions. Parameters are identified by
// "<in>:<name>".
libtextclassifier3::StatusOr<NormalizedSchemaProto> Normalize(
    std::string_view content, int max_depth);

// Renders a step in endpoint terms, e.g.
// "add GET /users parameters.limit (integer, optional)".
std::string Render(const MigrationInstructionProto& instruction);

}  // namespace openapi_adapter
}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_FORMAT_OPENAPI_ADAPTER_H_
