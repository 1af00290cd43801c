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

#include "schemadiff/migration/migration-planner.h"

#include <algorithm>
#include <iterator>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "utils/base/statusor.h"
#include "schemadiff/absl_ports/canonical_errors.h"
#include "schemadiff/absl_ports/status_macros.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/absl_ports/str_join.h"
#include "schemadiff/model/schema-node-util.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/util/logging.h"

namespace schemadiff {
namespace lib {

namespace {

using Operation = MigrationInstructionProto::Operation;

bool IsConstraintSegment(const std::string& segment) {
  return !segment.empty() &&
         segment[0] == schema_node_util::kConstraintSegmentPrefix;
}

// Splits a change location into the owning container and the member name.
// Constraint changes belong to the member that carries the constraint.
void SplitLocation(const ChangeProto& change,
                   MigrationInstructionProto* instruction) {
  int member_index = change.location_size() - 1;
  if (member_index >= 0 && IsConstraintSegment(change.location(member_index))) {
    --member_index;
  }
  for (int i = 0; i < member_index; ++i) {
    instruction->add_container(change.location(i));
  }
  if (member_index >= 0) {
    instruction->set_member(change.location(member_index));
  }
}

// Whether `inner` addresses a member strictly below the member `outer`
// addresses.
bool IsBelow(const MigrationInstructionProto& inner,
             const MigrationInstructionProto& outer) {
  int outer_depth = outer.container_size() + 1;
  if (inner.container_size() < outer_depth) {
    return false;
  }
  for (int i = 0; i < outer.container_size(); ++i) {
    if (inner.container(i) != outer.container(i)) {
      return false;
    }
  }
  return inner.container(outer.container_size()) == outer.member();
}

// Moves every MAKE_REQUIRED step behind the last ADD_MEMBER step that
// populates its subtree. Those additions may sit in other containers.
void DeferRequirements(std::vector<MigrationInstructionProto>* ordered) {
  for (int i = static_cast<int>(ordered->size()) - 1; i >= 0; --i) {
    const MigrationInstructionProto& required = (*ordered)[i];
    if (required.operation() != Operation::MAKE_REQUIRED) {
      continue;
    }
    int last_addition = -1;
    for (int j = static_cast<int>(ordered->size()) - 1; j > i; --j) {
      const MigrationInstructionProto& candidate = (*ordered)[j];
      if (candidate.operation() == Operation::ADD_MEMBER &&
          IsBelow(candidate, required)) {
        last_addition = j;
        break;
      }
    }
    if (last_addition >= 0) {
      std::rotate(ordered->begin() + i, ordered->begin() + i + 1,
                  ordered->begin() + last_addition + 1);
    }
  }
}

}  // namespace

const SchemaNodeProto* ResolveLocation(
    const NormalizedSchemaProto& schema,
    const google::protobuf::RepeatedPtrField<std::string>& location) {
  const SchemaNodeProto* node = &schema.root();
  int start = 0;
  if (!location.empty() &&
      location.Get(0) == schema_node_util::kDefinitionsSegment) {
    if (location.size() < 2) {
      return nullptr;
    }
    node = nullptr;
    for (const FieldProto& definition : schema.definitions()) {
      if (definition.name() == location.Get(1)) {
        node = &definition.node();
        break;
      }
    }
    if (node == nullptr) {
      return nullptr;
    }
    start = 2;
  }
  for (int i = start; i < location.size(); ++i) {
    const std::string& segment = location.Get(i);
    if (IsConstraintSegment(segment)) {
      return node;
    }
    switch (node->kind_case()) {
      case SchemaNodeProto::kObject: {
        const FieldProto* field =
            schema_node_util::FindField(node->object(), segment);
        if (field == nullptr) {
          return nullptr;
        }
        node = &field->node();
        break;
      }
      case SchemaNodeProto::kArray:
        if (segment != schema_node_util::kElementSegment) {
          return nullptr;
        }
        node = &node->array().element();
        break;
      case SchemaNodeProto::kUnionNode: {
        std::vector<std::string> labels =
            schema_node_util::UnionAlternativeLabels(node->union_node());
        auto itr = std::find(labels.begin(), labels.end(), segment);
        if (itr == labels.end()) {
          return nullptr;
        }
        node = &node->union_node().alternatives(itr - labels.begin());
        break;
      }
      case SchemaNodeProto::kScalar:
      case SchemaNodeProto::kReference:
      case SchemaNodeProto::KIND_NOT_SET:
        return nullptr;
    }
  }
  return node;
}

libtextclassifier3::StatusOr<Operation::Code> MigrationPlanner::OperationFor(
    const ChangeProto& change) {
  switch (change.kind()) {
    case ChangeKind::ADDED:
      return Operation::ADD_MEMBER;
    case ChangeKind::REMOVED:
      return Operation::DROP_MEMBER;
    case ChangeKind::RENAMED:
      return Operation::RENAME_MEMBER;
    case ChangeKind::TYPE_CHANGED:
      return Operation::CHANGE_TYPE;
    case ChangeKind::CONSTRAINT_TIGHTENED:
      return Operation::TIGHTEN_CONSTRAINT;
    case ChangeKind::CONSTRAINT_LOOSENED:
      return Operation::LOOSEN_CONSTRAINT;
    case ChangeKind::REQUIREDNESS_CHANGED:
      return change.details().new_required() ? Operation::MAKE_REQUIRED
                                             : Operation::MAKE_OPTIONAL;
    case ChangeKind::OTHER:
      return Operation::REVIEW;
    case ChangeKind::UNKNOWN:
      break;
  }
  return absl_ports::InvalidArgumentError(absl_ports::StrCat(
      "Cannot plan a change without kind at ",
      absl_ports::StrJoin(change.location(), "/")));
}

int MigrationPlanner::Phase(Operation::Code operation) {
  switch (operation) {
    case Operation::MAKE_OPTIONAL:
    case Operation::LOOSEN_CONSTRAINT:
      return 1;
    case Operation::DROP_MEMBER:
      return 2;
    case Operation::RENAME_MEMBER:
      return 3;
    case Operation::CHANGE_TYPE:
    case Operation::REVIEW:
    case Operation::UNKNOWN:
      return 4;
    case Operation::ADD_MEMBER:
      return 5;
    case Operation::TIGHTEN_CONSTRAINT:
      return 6;
    case Operation::MAKE_REQUIRED:
      return 7;
  }
  return 4;
}

int MigrationPlanner::Impact(Operation::Code operation) {
  switch (operation) {
    case Operation::ADD_MEMBER:
      return 25;
    case Operation::RENAME_MEMBER:
      return 30;
    case Operation::DROP_MEMBER:
      return 100;
    default:
      return 50;
  }
}

libtextclassifier3::StatusOr<MigrationPlanProto> MigrationPlanner::Plan(
    const std::vector<ChangeProto>& changes,
    const NormalizedSchemaProto& new_schema) const {
  // Groups in order of first appearance.
  std::vector<std::vector<MigrationInstructionProto>> groups;
  std::unordered_map<std::string, size_t> group_index;
  bool is_breaking = false;
  for (const ChangeProto& change : changes) {
    SCHEMADIFF_ASSIGN_OR_RETURN(Operation::Code operation,
                                OperationFor(change));
    MigrationInstructionProto instruction;
    instruction.set_operation(operation);
    SplitLocation(change, &instruction);
    *instruction.mutable_change() = change;
    if (operation == Operation::ADD_MEMBER ||
        operation == Operation::CHANGE_TYPE) {
      const SchemaNodeProto* node =
          ResolveLocation(new_schema, change.location());
      if (node != nullptr) {
        *instruction.mutable_node() = *node;
      }
      instruction.set_required(change.details().new_required());
    }
    is_breaking |= change.is_breaking();

    std::string key = absl_ports::StrJoin(instruction.container(), "\x1f");
    auto [itr, inserted] = group_index.emplace(key, groups.size());
    if (inserted) {
      groups.emplace_back();
    }
    groups[itr->second].push_back(std::move(instruction));
  }

  std::vector<MigrationInstructionProto> ordered;
  ordered.reserve(changes.size());
  for (std::vector<MigrationInstructionProto>& group : groups) {
    std::stable_sort(group.begin(), group.end(),
                     [](const MigrationInstructionProto& a,
                        const MigrationInstructionProto& b) {
                       return Phase(a.operation()) < Phase(b.operation());
                     });
    std::move(group.begin(), group.end(), std::back_inserter(ordered));
  }
  DeferRequirements(&ordered);

  MigrationPlanProto plan;
  int impact_score = 0;
  for (MigrationInstructionProto& instruction : ordered) {
    impact_score = std::max(impact_score, Impact(instruction.operation()));
    plan.add_steps(format_.render(instruction));
    *plan.add_instructions() = std::move(instruction);
  }

  auto& metadata = *plan.mutable_metadata();
  metadata["step_count"] = std::to_string(plan.steps_size());
  metadata["is_breaking"] = is_breaking ? "true" : "false";
  metadata["impact_score"] = std::to_string(impact_score);
  SCHEMADIFF_VLOG(1) << "Planned " << plan.steps_size() << " steps in "
                     << groups.size() << " groups";
  return plan;
}

}  // namespace lib
}  // namespace schemadiff
