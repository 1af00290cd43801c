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

#include "schemadiff/diff/diff-engine.h"

#include <algorithm>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include <google/protobuf/util/message_differencer.h>
#include "schemadiff/absl_ports/status_macros.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/absl_ports/str_join.h"
#include "schemadiff/model/schema-node-util.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/util/logging.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

using schema_node_util::ConstraintDirection;

// Context of the member whose node is being compared.
struct MemberContext {
  MemberKind::Code member_kind = MemberKind::ROOT;
  // Matched by identity key under a different name.
  bool identity_name_changed = false;
  // Array nodes owning the compared element. Attributes of a repeated
  // member, such as its wire type, live on the owner.
  const SchemaNodeProto* old_owner = nullptr;
  const SchemaNodeProto* new_owner = nullptr;
};

void CopyAttributes(
    const SchemaNodeProto& node,
    google::protobuf::Map<std::string, std::string>* attributes) {
  for (const auto& [key, value] : node.metadata().attributes()) {
    (*attributes)[key] = value;
  }
}

bool SameConstraintValue(const ConstraintProto& a, const ConstraintProto& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

bool IsSubset(const ConstraintProto& a, const ConstraintProto& b) {
  std::unordered_set<std::string> values(b.enum_values().begin(),
                                         b.enum_values().end());
  for (const std::string& value : a.enum_values()) {
    if (values.count(value) == 0) {
      return false;
    }
  }
  return true;
}

class DiffWalker {
 public:
  DiffWalker(int max_depth, std::vector<ChangeProto>* changes)
      : max_depth_(max_depth), changes_(*changes) {}

  libtextclassifier3::Status CompareRoots(const NormalizedSchemaProto& old_schema,
                                          const NormalizedSchemaProto& new_schema);

 private:
  libtextclassifier3::Status CompareNode(const SchemaNodeProto& old_node,
                                         const SchemaNodeProto& new_node,
                                         const MemberContext& context,
                                         int depth);

  libtextclassifier3::Status CompareMembers(
      const google::protobuf::RepeatedPtrField<FieldProto>& old_fields,
      const google::protobuf::RepeatedPtrField<FieldProto>& new_fields,
      const ObjectNodeProto* old_object, const ObjectNodeProto* new_object,
      MemberKind::Code member_kind, int depth);

  libtextclassifier3::Status CompareUnion(const UnionNodeProto& old_union,
                                          const UnionNodeProto& new_union,
                                          int depth);

  void CompareConstraints(const ScalarNodeProto& old_scalar,
                          const ScalarNodeProto& new_scalar);

  void CompareLength(std::string_view name, bool old_present,
                     int64_t old_value, bool new_present, int64_t new_value);

  void EmitConstraintChange(ChangeKind::Code kind, std::string_view name,
                            std::string old_value, std::string new_value);

  void EmitTypeChanged(const SchemaNodeProto& old_node,
                       const SchemaNodeProto& new_node,
                       const MemberContext& context);

  ChangeProto* NewChange(ChangeKind::Code kind, std::string description);

  std::string CurrentPath() const {
    return path_.empty() ? "<root>" : absl_ports::StrJoin(path_, "/");
  }

  const int max_depth_;
  std::vector<ChangeProto>& changes_;
  std::vector<std::string> path_;
};

ChangeProto* DiffWalker::NewChange(ChangeKind::Code kind,
                                   std::string description) {
  changes_.emplace_back();
  ChangeProto* change = &changes_.back();
  for (const std::string& segment : path_) {
    change->add_location(segment);
  }
  change->set_kind(kind);
  change->set_description(std::move(description));
  return change;
}

libtextclassifier3::Status DiffWalker::CompareRoots(
    const NormalizedSchemaProto& old_schema,
    const NormalizedSchemaProto& new_schema) {
  SchemaNodeProto::KindCase old_kind = old_schema.root().kind_case();
  SchemaNodeProto::KindCase new_kind = new_schema.root().kind_case();
  if (old_kind == SchemaNodeProto::KIND_NOT_SET ||
      new_kind == SchemaNodeProto::KIND_NOT_SET) {
    return ComparisonError("Schema has no root node");
  }
  if (old_kind != new_kind) {
    return ComparisonError(absl_ports::StrCat(
        "Root kinds differ: ", schema_node_util::NodeKindName(old_kind),
        " vs ", schema_node_util::NodeKindName(new_kind)));
  }
  SCHEMADIFF_RETURN_IF_ERROR(CompareNode(old_schema.root(), new_schema.root(),
                                         MemberContext(), /*depth=*/0));
  if (old_schema.definitions_size() > 0 || new_schema.definitions_size() > 0) {
    path_.push_back(std::string(schema_node_util::kDefinitionsSegment));
    SCHEMADIFF_RETURN_IF_ERROR(CompareMembers(
        old_schema.definitions(), new_schema.definitions(),
        /*old_object=*/nullptr, /*new_object=*/nullptr, MemberKind::DEFINITION,
        /*depth=*/1));
    path_.pop_back();
  }
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::Status DiffWalker::CompareNode(
    const SchemaNodeProto& old_node, const SchemaNodeProto& new_node,
    const MemberContext& context, int depth) {
  if (depth > max_depth_) {
    return ComparisonError(absl_ports::StrCat(
        "Schema nesting exceeds the maximum depth of ",
        std::to_string(max_depth_), " at ", CurrentPath()));
  }
  if (old_node.kind_case() != new_node.kind_case()) {
    EmitTypeChanged(old_node, new_node, context);
    return libtextclassifier3::Status::OK;
  }
  switch (old_node.kind_case()) {
    case SchemaNodeProto::kScalar:
      if (old_node.scalar().primitive() != new_node.scalar().primitive()) {
        EmitTypeChanged(old_node, new_node, context);
      }
      CompareConstraints(old_node.scalar(), new_node.scalar());
      break;
    case SchemaNodeProto::kObject:
      return CompareMembers(old_node.object().fields(),
                            new_node.object().fields(), &old_node.object(),
                            &new_node.object(), MemberKind::FIELD, depth);
    case SchemaNodeProto::kArray: {
      const ArrayNodeProto& old_array = old_node.array();
      const ArrayNodeProto& new_array = new_node.array();
      path_.push_back(std::string(schema_node_util::kElementSegment));
      MemberContext element_context;
      element_context.member_kind = MemberKind::ELEMENT;
      element_context.identity_name_changed = context.identity_name_changed;
      element_context.old_owner = &old_node;
      element_context.new_owner = &new_node;
      SCHEMADIFF_RETURN_IF_ERROR(CompareNode(old_array.element(),
                                             new_array.element(),
                                             element_context, depth + 1));
      path_.pop_back();
      CompareLength(schema_node_util::kMinItems, old_array.has_min_length(),
                    old_array.min_length(), new_array.has_min_length(),
                    new_array.min_length());
      CompareLength(schema_node_util::kMaxItems, old_array.has_max_length(),
                    old_array.max_length(), new_array.has_max_length(),
                    new_array.max_length());
      break;
    }
    case SchemaNodeProto::kUnionNode:
      return CompareUnion(old_node.union_node(), new_node.union_node(), depth);
    case SchemaNodeProto::kReference:
      if (old_node.reference().target() != new_node.reference().target()) {
        EmitTypeChanged(old_node, new_node, context);
      }
      break;
    case SchemaNodeProto::KIND_NOT_SET:
      return ComparisonError(
          absl_ports::StrCat("Node without a kind at ", CurrentPath()));
  }
  return libtextclassifier3::Status::OK;
}

void DiffWalker::EmitTypeChanged(const SchemaNodeProto& old_node,
                                 const SchemaNodeProto& new_node,
                                 const MemberContext& context) {
  std::string old_type = schema_node_util::NodeSignature(old_node);
  std::string new_type = schema_node_util::NodeSignature(new_node);
  ChangeProto* change = NewChange(
      ChangeKind::TYPE_CHANGED,
      absl_ports::StrCat("Type of '", CurrentPath(), "' changed from ",
                         old_type, " to ", new_type));
  ChangeDetailsProto* details = change->mutable_details();
  details->set_member_kind(context.member_kind);
  details->set_old_type(std::move(old_type));
  details->set_new_type(std::move(new_type));
  details->set_identity_name_changed(context.identity_name_changed);
  if (!new_node.metadata().identity_key().empty()) {
    details->set_identity_key(new_node.metadata().identity_key());
  } else if (context.new_owner != nullptr &&
             !context.new_owner->metadata().identity_key().empty()) {
    details->set_identity_key(context.new_owner->metadata().identity_key());
  }
  // Attributes of the node itself take precedence over its owner's.
  if (context.old_owner != nullptr) {
    CopyAttributes(*context.old_owner, details->mutable_old_attributes());
  }
  if (context.new_owner != nullptr) {
    CopyAttributes(*context.new_owner, details->mutable_new_attributes());
  }
  CopyAttributes(old_node, details->mutable_old_attributes());
  CopyAttributes(new_node, details->mutable_new_attributes());
}

libtextclassifier3::Status DiffWalker::CompareMembers(
    const google::protobuf::RepeatedPtrField<FieldProto>& old_fields,
    const google::protobuf::RepeatedPtrField<FieldProto>& new_fields,
    const ObjectNodeProto* old_object, const ObjectNodeProto* new_object,
    MemberKind::Code member_kind, int depth) {
  std::unordered_map<std::string, int> new_by_name;
  std::unordered_map<std::string, int> new_by_identity;
  for (int i = 0; i < new_fields.size(); ++i) {
    const FieldProto& field = new_fields.Get(i);
    if (!new_by_name.emplace(field.name(), i).second) {
      return ComparisonError(absl_ports::StrCat(
          "Duplicate member '", field.name(), "' in ", CurrentPath()));
    }
    const std::string& key = field.node().metadata().identity_key();
    if (!key.empty() && !new_by_identity.emplace(key, i).second) {
      return ComparisonError(absl_ports::StrCat(
          "Duplicate identity key ", key, " in ", CurrentPath()));
    }
  }

  // old index -> new index, -1 if unmatched.
  std::vector<int> match(old_fields.size(), -1);
  std::vector<bool> new_matched(new_fields.size(), false);
  std::unordered_set<std::string> old_names;
  for (int i = 0; i < old_fields.size(); ++i) {
    const FieldProto& field = old_fields.Get(i);
    if (!old_names.insert(field.name()).second) {
      return ComparisonError(absl_ports::StrCat(
          "Duplicate member '", field.name(), "' in ", CurrentPath()));
    }
    const std::string& key = field.node().metadata().identity_key();
    int candidate = -1;
    if (!key.empty()) {
      auto itr = new_by_identity.find(key);
      if (itr != new_by_identity.end()) {
        candidate = itr->second;
      }
    }
    if (candidate < 0) {
      auto itr = new_by_name.find(field.name());
      // Members that both carry an identity key only match on it.
      if (itr != new_by_name.end() &&
          (key.empty() ||
           new_fields.Get(itr->second).node().metadata().identity_key()
               .empty())) {
        candidate = itr->second;
      }
    }
    if (candidate >= 0 && !new_matched[candidate]) {
      match[i] = candidate;
      new_matched[candidate] = true;
    }
  }

  for (int i = 0; i < old_fields.size(); ++i) {
    const FieldProto& old_field = old_fields.Get(i);
    bool old_required = old_object != nullptr &&
                        schema_node_util::IsRequired(*old_object,
                                                     old_field.name());
    if (match[i] < 0) {
      path_.push_back(old_field.name());
      ChangeProto* change = NewChange(
          ChangeKind::REMOVED,
          absl_ports::StrCat("Member '", CurrentPath(), "' was removed"));
      ChangeDetailsProto* details = change->mutable_details();
      details->set_member_kind(member_kind);
      details->set_old_name(old_field.name());
      details->set_old_required(old_required);
      details->set_old_type(schema_node_util::NodeSignature(old_field.node()));
      details->set_deprecated(old_field.node().metadata().deprecated());
      if (!old_field.node().metadata().identity_key().empty()) {
        details->set_identity_key(old_field.node().metadata().identity_key());
      }
      CopyAttributes(old_field.node(), details->mutable_old_attributes());
      path_.pop_back();
      continue;
    }

    const FieldProto& new_field = new_fields.Get(match[i]);
    bool new_required = new_object != nullptr &&
                        schema_node_util::IsRequired(*new_object,
                                                     new_field.name());
    MemberContext context;
    context.member_kind = member_kind;
    if (old_field.name() != new_field.name()) {
      path_.push_back(old_field.name());
      ChangeProto* change = NewChange(
          ChangeKind::RENAMED,
          absl_ports::StrCat("Member '", CurrentPath(), "' was renamed to '",
                             new_field.name(), "'"));
      ChangeDetailsProto* details = change->mutable_details();
      details->set_member_kind(member_kind);
      details->set_old_name(old_field.name());
      details->set_new_name(new_field.name());
      details->set_identity_key(old_field.node().metadata().identity_key());
      details->set_old_required(old_required);
      details->set_new_required(new_required);
      path_.pop_back();
      context.identity_name_changed = true;
    }

    path_.push_back(new_field.name());
    SCHEMADIFF_RETURN_IF_ERROR(CompareNode(old_field.node(), new_field.node(),
                                           context, depth + 1));
    if (old_required != new_required) {
      ChangeProto* change = NewChange(
          ChangeKind::REQUIREDNESS_CHANGED,
          absl_ports::StrCat("Member '", CurrentPath(), "' changed from ",
                             old_required ? "required" : "optional", " to ",
                             new_required ? "required" : "optional"));
      ChangeDetailsProto* details = change->mutable_details();
      details->set_member_kind(member_kind);
      details->set_old_required(old_required);
      details->set_new_required(new_required);
      details->set_new_type(schema_node_util::NodeSignature(new_field.node()));
      CopyAttributes(old_field.node(), details->mutable_old_attributes());
      CopyAttributes(new_field.node(), details->mutable_new_attributes());
    }
    path_.pop_back();
  }

  for (int i = 0; i < new_fields.size(); ++i) {
    if (new_matched[i]) {
      continue;
    }
    const FieldProto& new_field = new_fields.Get(i);
    bool new_required = new_object != nullptr &&
                        schema_node_util::IsRequired(*new_object,
                                                     new_field.name());
    path_.push_back(new_field.name());
    ChangeProto* change = NewChange(
        ChangeKind::ADDED,
        absl_ports::StrCat(new_required ? "Required" : "Optional",
                           " member '", CurrentPath(), "' was added"));
    ChangeDetailsProto* details = change->mutable_details();
    details->set_member_kind(member_kind);
    details->set_new_name(new_field.name());
    details->set_new_required(new_required);
    details->set_new_type(schema_node_util::NodeSignature(new_field.node()));
    if (!new_field.node().metadata().identity_key().empty()) {
      details->set_identity_key(new_field.node().metadata().identity_key());
    }
    CopyAttributes(new_field.node(), details->mutable_new_attributes());
    path_.pop_back();
  }
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::Status DiffWalker::CompareUnion(
    const UnionNodeProto& old_union, const UnionNodeProto& new_union,
    int depth) {
  std::vector<std::string> old_labels =
      schema_node_util::UnionAlternativeLabels(old_union);
  std::vector<std::string> new_labels =
      schema_node_util::UnionAlternativeLabels(new_union);
  std::vector<int> match(old_union.alternatives_size(), -1);
  std::vector<bool> new_matched(new_union.alternatives_size(), false);

  // Pairs the first unmatched alternatives that satisfy matches(old, new).
  auto match_pass = [&](auto matches) {
    for (int i = 0; i < old_union.alternatives_size(); ++i) {
      if (match[i] >= 0) continue;
      for (int j = 0; j < new_union.alternatives_size(); ++j) {
        if (new_matched[j]) continue;
        if (matches(old_union.alternatives(i), new_union.alternatives(j))) {
          match[i] = j;
          new_matched[j] = true;
          break;
        }
      }
    }
  };
  match_pass([](const SchemaNodeProto& a, const SchemaNodeProto& b) {
    return google::protobuf::util::MessageDifferencer::Equals(a, b);
  });
  match_pass([](const SchemaNodeProto& a, const SchemaNodeProto& b) {
    return schema_node_util::NodeSignature(a) ==
           schema_node_util::NodeSignature(b);
  });
  // Containers keep their identity when their content changes.
  match_pass([](const SchemaNodeProto& a, const SchemaNodeProto& b) {
    return a.kind_case() == b.kind_case() &&
           (a.kind_case() == SchemaNodeProto::kObject ||
            a.kind_case() == SchemaNodeProto::kArray);
  });

  MemberContext context;
  context.member_kind = MemberKind::ALTERNATIVE;
  for (int i = 0; i < old_union.alternatives_size(); ++i) {
    path_.push_back(old_labels[i]);
    if (match[i] < 0) {
      ChangeProto* change = NewChange(
          ChangeKind::REMOVED,
          absl_ports::StrCat("Alternative '", CurrentPath(), "' was removed"));
      change->mutable_details()->set_member_kind(MemberKind::ALTERNATIVE);
      change->mutable_details()->set_old_type(old_labels[i]);
    } else {
      SCHEMADIFF_RETURN_IF_ERROR(CompareNode(old_union.alternatives(i),
                                             new_union.alternatives(match[i]),
                                             context, depth + 1));
    }
    path_.pop_back();
  }
  for (int j = 0; j < new_union.alternatives_size(); ++j) {
    if (new_matched[j]) continue;
    path_.push_back(new_labels[j]);
    ChangeProto* change = NewChange(
        ChangeKind::ADDED,
        absl_ports::StrCat("Alternative '", CurrentPath(), "' was added"));
    change->mutable_details()->set_member_kind(MemberKind::ALTERNATIVE);
    change->mutable_details()->set_new_type(new_labels[j]);
    path_.pop_back();
  }
  return libtextclassifier3::Status::OK;
}

void DiffWalker::CompareConstraints(const ScalarNodeProto& old_scalar,
                                    const ScalarNodeProto& new_scalar) {
  // Sorted by name so the output does not depend on declaration order.
  std::map<std::string, const ConstraintProto*> old_constraints;
  std::map<std::string, const ConstraintProto*> new_constraints;
  for (const ConstraintProto& constraint : old_scalar.constraints()) {
    old_constraints[constraint.name()] = &constraint;
  }
  for (const ConstraintProto& constraint : new_scalar.constraints()) {
    new_constraints[constraint.name()] = &constraint;
  }
  std::map<std::string, std::pair<const ConstraintProto*,
                                  const ConstraintProto*>> all;
  for (const auto& [name, constraint] : old_constraints) {
    all[name].first = constraint;
  }
  for (const auto& [name, constraint] : new_constraints) {
    all[name].second = constraint;
  }

  for (const auto& [name, pair] : all) {
    const ConstraintProto* old_constraint = pair.first;
    const ConstraintProto* new_constraint = pair.second;
    ConstraintDirection direction =
        schema_node_util::GetConstraintDirection(name);
    std::string old_value =
        old_constraint == nullptr
            ? ""
            : schema_node_util::ConstraintValueToString(*old_constraint);
    std::string new_value =
        new_constraint == nullptr
            ? ""
            : schema_node_util::ConstraintValueToString(*new_constraint);

    if (old_constraint == nullptr || new_constraint == nullptr) {
      // Adding a restriction tightens, except for defaults.
      bool added = old_constraint == nullptr;
      bool tightened =
          (direction == ConstraintDirection::kPresenceLoosens) != added;
      EmitConstraintChange(tightened ? ChangeKind::CONSTRAINT_TIGHTENED
                                     : ChangeKind::CONSTRAINT_LOOSENED,
                           name, std::move(old_value), std::move(new_value));
      continue;
    }
    if (SameConstraintValue(*old_constraint, *new_constraint)) {
      continue;
    }

    ChangeKind::Code kind = ChangeKind::OTHER;
    bool both_numbers = old_constraint->has_number_value() &&
                        new_constraint->has_number_value();
    switch (direction) {
      case ConstraintDirection::kLowerBound:
        if (both_numbers) {
          kind = new_constraint->number_value() > old_constraint->number_value()
                     ? ChangeKind::CONSTRAINT_TIGHTENED
                     : ChangeKind::CONSTRAINT_LOOSENED;
        }
        break;
      case ConstraintDirection::kUpperBound:
        if (both_numbers) {
          kind = new_constraint->number_value() < old_constraint->number_value()
                     ? ChangeKind::CONSTRAINT_TIGHTENED
                     : ChangeKind::CONSTRAINT_LOOSENED;
        }
        break;
      case ConstraintDirection::kValueSet:
        if (IsSubset(*new_constraint, *old_constraint)) {
          if (IsSubset(*old_constraint, *new_constraint)) {
            // Same values in another order.
            continue;
          }
          kind = ChangeKind::CONSTRAINT_TIGHTENED;
        } else if (IsSubset(*old_constraint, *new_constraint)) {
          kind = ChangeKind::CONSTRAINT_LOOSENED;
        } else {
          // Some accepted values were dropped.
          kind = ChangeKind::CONSTRAINT_TIGHTENED;
        }
        break;
      case ConstraintDirection::kPresenceTightens:
      case ConstraintDirection::kPresenceLoosens:
        break;
    }
    EmitConstraintChange(kind, name, std::move(old_value),
                         std::move(new_value));
  }
}

void DiffWalker::CompareLength(std::string_view name, bool old_present,
                               int64_t old_value, bool new_present,
                               int64_t new_value) {
  if (!old_present && !new_present) {
    return;
  }
  std::string old_text = old_present ? std::to_string(old_value) : "";
  std::string new_text = new_present ? std::to_string(new_value) : "";
  bool lower = schema_node_util::GetConstraintDirection(name) ==
               ConstraintDirection::kLowerBound;
  ChangeKind::Code kind;
  if (!old_present || !new_present) {
    kind = new_present ? ChangeKind::CONSTRAINT_TIGHTENED
                       : ChangeKind::CONSTRAINT_LOOSENED;
  } else if (old_value == new_value) {
    return;
  } else {
    bool tightened = lower ? new_value > old_value : new_value < old_value;
    kind = tightened ? ChangeKind::CONSTRAINT_TIGHTENED
                     : ChangeKind::CONSTRAINT_LOOSENED;
  }
  EmitConstraintChange(kind, name, std::move(old_text), std::move(new_text));
}

void DiffWalker::EmitConstraintChange(ChangeKind::Code kind,
                                      std::string_view name,
                                      std::string old_value,
                                      std::string new_value) {
  std::string node_path = CurrentPath();
  path_.push_back(absl_ports::StrCat(
      std::string_view(&schema_node_util::kConstraintSegmentPrefix, 1), name));
  std::string verb = kind == ChangeKind::CONSTRAINT_TIGHTENED  ? "tightened"
                     : kind == ChangeKind::CONSTRAINT_LOOSENED ? "loosened"
                                                               : "changed";
  ChangeProto* change = NewChange(
      kind, absl_ports::StrCat(
                "Constraint ", name, " on '", node_path, "' ", verb, " from ",
                old_value.empty() ? "none" : old_value, " to ",
                new_value.empty() ? "none" : new_value));
  ChangeDetailsProto* details = change->mutable_details();
  details->set_constraint(std::string(name));
  details->set_old_value(std::move(old_value));
  details->set_new_value(std::move(new_value));
  path_.pop_back();
}

}  // namespace

std::string LocationToString(
    const google::protobuf::RepeatedPtrField<std::string>& location) {
  return location.empty() ? "<root>" : absl_ports::StrJoin(location, "/");
}

libtextclassifier3::StatusOr<std::vector<ChangeProto>> DiffEngine::Diff(
    const NormalizedSchemaProto& old_schema,
    const NormalizedSchemaProto& new_schema) const {
  if (old_schema.format() != new_schema.format()) {
    return ComparisonError("Cannot compare schemas of different formats");
  }
  std::vector<ChangeProto> changes;
  DiffWalker walker(max_depth_, &changes);
  SCHEMADIFF_RETURN_IF_ERROR(walker.CompareRoots(old_schema, new_schema));
  SCHEMADIFF_VLOG(1) << "Diff found " << changes.size() << " changes";
  return changes;
}

}  // namespace lib
}  // namespace schemadiff
