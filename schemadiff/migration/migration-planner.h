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

#ifndef SCHEMADIFF_MIGRATION_MIGRATION_PLANNER_H_
#define SCHEMADIFF_MIGRATION_MIGRATION_PLANNER_H_

#include <vector>

#include "utils/base/statusor.h"
#include "schemadiff/format/format-registry.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {

// Turns classified changes into an ordered migration plan.
//
// Each change becomes one abstract instruction. Instructions are grouped by
// the object that owns the affected member, groups keep the order in which
// they first appear, and inside a group instructions run in phases:
//
//   1. relaxations (make optional, loosen constraint)
//   2. drops, which free names and slots
//   3. renames
//   4. type changes and manual reviews
//   5. additions
//   6. tightened constraints
//   7. make required, after any addition that populates the member
//
// The sort is stable, so changes of one phase keep their diff order. A
// make required step is then moved behind the last addition below the
// member it requires, even when that addition belongs to another group.
// The owning adapter renders every instruction into a step.
class MigrationPlanner {
 public:
  explicit MigrationPlanner(const FormatCapabilities* format)
      : format_(*format) {}

  // Returns:
  //   The plan on success, with one step per change
  //   INVALID_ARGUMENT if a change has no kind
  libtextclassifier3::StatusOr<MigrationPlanProto> Plan(
      const std::vector<ChangeProto>& changes,
      const NormalizedSchemaProto& new_schema) const;

  static libtextclassifier3::StatusOr<MigrationInstructionProto::Operation::Code>
  OperationFor(const ChangeProto& change);

  // 1-based execution phase of an operation.
  static int Phase(MigrationInstructionProto::Operation::Code operation);

  // Relative impact of a step, from 25 for an addition to 100 for a drop.
  static int Impact(MigrationInstructionProto::Operation::Code operation);

 private:
  const FormatCapabilities& format_;
};

// Looks up the node at location in schema, following member names, "[]",
// union alternative labels and the definitions segment. Returns nullptr if
// the path does not resolve.
const SchemaNodeProto* ResolveLocation(
    const NormalizedSchemaProto& schema,
    const google::protobuf::RepeatedPtrField<std::string>& location);

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_MIGRATION_MIGRATION_PLANNER_H_
