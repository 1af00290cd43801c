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

#ifndef SCHEMADIFF_FORMAT_FORMAT_REGISTRY_H_
#define SCHEMADIFF_FORMAT_FORMAT_REGISTRY_H_

#include <string>
#include <string_view>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {

// Everything the core needs from one source format. Entries are plain
// functions so that a format is selected by looking up its code, not by
// subclassing.
struct FormatCapabilities {
  SchemaFormat::Code format;

  // Lower case identifier, e.g. "json_schema".
  const char* name;

  // Prefix of the issue codes reported for this format, e.g. "SQL".
  const char* issue_prefix;

  // Checks that content is a well-formed document of the format without
  // building the normalized tree.
  libtextclassifier3::Status (*check_syntax)(std::string_view content);

  // Parses content into the normalized tree, refusing nesting deeper than
  // max_depth.
  libtextclassifier3::StatusOr<NormalizedSchemaProto> (*normalize)(
      std::string_view content, int max_depth);

  // Renders an abstract migration instruction as a format specific step.
  std::string (*render)(const MigrationInstructionProto& instruction);

  // Rule table used when the caller does not override it.
  RuleTableProto (*default_rule_table)();
};

// Returns:
//   The capability set of format on success
//   UNIMPLEMENTED (InvalidFormatError) if format has no adapter
libtextclassifier3::StatusOr<const FormatCapabilities*> LookupFormat(
    SchemaFormat::Code format);

// Name of a format for messages, also for formats without an adapter.
std::string FormatName(SchemaFormat::Code format);

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_FORMAT_FORMAT_REGISTRY_H_
