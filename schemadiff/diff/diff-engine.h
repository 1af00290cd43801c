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

#ifndef SCHEMADIFF_DIFF_DIFF_ENGINE_H_
#define SCHEMADIFF_DIFF_DIFF_ENGINE_H_

#include <string>
#include <vector>

#include "utils/base/statusor.h"
#include <google/protobuf/repeated_field.h>
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/schema.pb.h"

namespace schemadiff {
namespace lib {

// Structural comparison of two normalized schemas. The engine only detects
// changes; severity and is_breaking are left unset for the rule set.
//
// Members are matched by identity key when both sides carry one, by name
// otherwise. Changes come out in traversal order: old members in declared
// order, then members only present in the new schema in their declared
// order, which makes the output deterministic and keeps every
// (location, kind) pair unique.
class DiffEngine {
 public:
  explicit DiffEngine(int max_depth = 64) : max_depth_(max_depth) {}

  // Returns:
  //   Ordered changes on success, empty if the schemas are equal
  //   FAILED_PRECONDITION (ComparisonError) if the roots have different
  //     kinds, an object has duplicate members or nesting exceeds max_depth
  libtextclassifier3::StatusOr<std::vector<ChangeProto>> Diff(
      const NormalizedSchemaProto& old_schema,
      const NormalizedSchemaProto& new_schema) const;

 private:
  int max_depth_;
};

// Renders a location for messages, "users/name" or "<root>".
std::string LocationToString(
    const google::protobuf::RepeatedPtrField<std::string>& location);

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_DIFF_DIFF_ENGINE_H_
