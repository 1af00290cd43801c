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

#include "schemadiff/rules/rule-set.h"

#include <memory>
#include <string>
#include <utility>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/absl_ports/canonical_errors.h"
#include "schemadiff/absl_ports/status_macros.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/format/format-registry.h"
#include "schemadiff/model/schema-node-util.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/rules/type-relation.h"
#include "schemadiff/util/logging.h"

namespace schemadiff {
namespace lib {

namespace {

bool AttributeIsTrue(
    const google::protobuf::Map<std::string, std::string>& attributes,
    std::string_view key) {
  auto itr = attributes.find(std::string(key));
  return itr != attributes.end() && itr->second == "true";
}

bool HasAttribute(
    const google::protobuf::Map<std::string, std::string>& attributes,
    std::string_view key) {
  return attributes.find(std::string(key)) != attributes.end();
}

}  // namespace

libtextclassifier3::StatusOr<std::unique_ptr<RuleSet>> RuleSet::Create(
    SchemaFormat::Code format, const RuleTableProto* overrides) {
  SCHEMADIFF_ASSIGN_OR_RETURN(const FormatCapabilities* capabilities,
                              LookupFormat(format));
  RuleTableProto rule_table = capabilities->default_rule_table();
  if (overrides != nullptr) {
    if (overrides->has_format() && overrides->format() != format) {
      return absl_ports::InvalidArgumentError(absl_ports::StrCat(
          "Rule overrides for ", FormatName(overrides->format()),
          " cannot be applied to ", FormatName(format)));
    }
    for (const RuleProto& override_rule : overrides->rules()) {
      bool replaced = false;
      for (RuleProto& rule : *rule_table.mutable_rules()) {
        if (rule.rule_case() == override_rule.rule_case()) {
          rule = override_rule;
          replaced = true;
          break;
        }
      }
      if (!replaced) {
        *rule_table.add_rules() = override_rule;
      }
    }
    for (const TypeWideningProto& widening : overrides->widenings()) {
      *rule_table.add_widenings() = widening;
    }
    if (overrides->has_compatibility_threshold()) {
      rule_table.set_compatibility_threshold(
          overrides->compatibility_threshold());
    }
  }
  return CreateFromTable(std::move(rule_table));
}

libtextclassifier3::StatusOr<std::unique_ptr<RuleSet>> RuleSet::CreateFromTable(
    RuleTableProto rule_table) {
  if (rule_table.compatibility_threshold() < 0 ||
      rule_table.compatibility_threshold() > 100) {
    return absl_ports::InvalidArgumentError(absl_ports::StrCat(
        "Compatibility threshold must be within [0, 100], got ",
        std::to_string(rule_table.compatibility_threshold())));
  }
  for (const RuleProto& rule : rule_table.rules()) {
    if (rule.rule_case() == RuleCase::UNKNOWN ||
        rule.severity() == Severity::UNKNOWN) {
      return absl_ports::InvalidArgumentError(absl_ports::StrCat(
          "Rule for case ", RuleCase::Code_Name(rule.rule_case()),
          " needs a case and a severity"));
    }
  }
  // The constructor indexes the rules, so check completeness afterwards.
  std::unique_ptr<RuleSet> rule_set(new RuleSet(std::move(rule_table)));
  for (int i = RuleCase::Code_MIN; i <= RuleCase::Code_MAX; ++i) {
    if (i == RuleCase::UNKNOWN || !RuleCase::Code_IsValid(i)) {
      continue;
    }
    if (rule_set->rules_by_case_.count(i) == 0) {
      return absl_ports::InvalidArgumentError(absl_ports::StrCat(
          "Rule table for ", FormatName(rule_set->format()),
          " has no rule for case ",
          RuleCase::Code_Name(static_cast<RuleCase::Code>(i))));
    }
  }
  return rule_set;
}

RuleSet::RuleSet(RuleTableProto rule_table)
    : rule_table_(std::move(rule_table)), type_relations_(rule_table_) {
  for (const RuleProto& rule : rule_table_.rules()) {
    rules_by_case_[rule.rule_case()] = &rule;
  }
}

libtextclassifier3::StatusOr<RuleCase::Code> RuleSet::DeriveCase(
    const ChangeProto& change) const {
  const ChangeDetailsProto& details = change.details();
  switch (change.kind()) {
    case ChangeKind::ADDED:
      if (details.member_kind() == MemberKind::ALTERNATIVE) {
        return RuleCase::ADDED_ALTERNATIVE;
      }
      if (!details.new_required()) {
        return RuleCase::ADDED_OPTIONAL;
      }
      if (HasAttribute(details.new_attributes(),
                       schema_node_util::kDefaultAttribute)) {
        return RuleCase::ADDED_REQUIRED_WITH_DEFAULT;
      }
      return RuleCase::ADDED_REQUIRED;
    case ChangeKind::REMOVED:
      if (details.member_kind() == MemberKind::ALTERNATIVE) {
        return RuleCase::REMOVED_ALTERNATIVE;
      }
      if (AttributeIsTrue(details.old_attributes(),
                          schema_node_util::kPrimaryKeyAttribute)) {
        return RuleCase::REMOVED_PRIMARY_KEY;
      }
      if (details.deprecated()) {
        return RuleCase::REMOVED_DEPRECATED;
      }
      if (AttributeIsTrue(details.old_attributes(),
                          schema_node_util::kNullableAttribute)) {
        return RuleCase::REMOVED_NULLABLE;
      }
      return RuleCase::REMOVED;
    case ChangeKind::TYPE_CHANGED: {
      if (details.identity_name_changed()) {
        return RuleCase::IDENTITY_REUSE;
      }
      TypeRelation relation =
          type_relations_.Relate(details.old_type(), details.new_type());
      switch (relation) {
        case TypeRelation::kWidened: {
          auto old_wire = details.old_attributes().find(
              std::string(schema_node_util::kWireTypeAttribute));
          auto new_wire = details.new_attributes().find(
              std::string(schema_node_util::kWireTypeAttribute));
          if (old_wire != details.old_attributes().end() &&
              new_wire != details.new_attributes().end() &&
              old_wire->second != new_wire->second) {
            return RuleCase::TYPE_WIRE_MISMATCH;
          }
          return RuleCase::TYPE_WIDENED;
        }
        case TypeRelation::kNarrowed:
          return RuleCase::TYPE_NARROWED;
        case TypeRelation::kSame:
        case TypeRelation::kIncompatible:
          return RuleCase::TYPE_INCOMPATIBLE;
      }
      return RuleCase::TYPE_INCOMPATIBLE;
    }
    case ChangeKind::CONSTRAINT_TIGHTENED:
      return details.on_new_member() ? RuleCase::CONSTRAINT_TIGHTENED_NEW_MEMBER
                                     : RuleCase::CONSTRAINT_TIGHTENED;
    case ChangeKind::CONSTRAINT_LOOSENED:
      return RuleCase::CONSTRAINT_LOOSENED;
    case ChangeKind::REQUIREDNESS_CHANGED:
      return details.new_required() ? RuleCase::OPTIONAL_TO_REQUIRED
                                    : RuleCase::REQUIRED_TO_OPTIONAL;
    case ChangeKind::RENAMED:
      return RuleCase::RENAMED;
    case ChangeKind::OTHER:
      return RuleCase::OTHER;
    case ChangeKind::UNKNOWN:
      break;
  }
  return absl_ports::InvalidArgumentError("Change has no kind");
}

libtextclassifier3::StatusOr<const RuleProto*> RuleSet::GetRule(
    RuleCase::Code rule_case) const {
  auto itr = rules_by_case_.find(rule_case);
  if (itr == rules_by_case_.end()) {
    return absl_ports::NotFoundError(absl_ports::StrCat(
        "No rule for case ", RuleCase::Code_Name(rule_case)));
  }
  return itr->second;
}

libtextclassifier3::Status RuleSet::Classify(ChangeProto* change) const {
  SCHEMADIFF_ASSIGN_OR_RETURN(RuleCase::Code rule_case, DeriveCase(*change));
  SCHEMADIFF_ASSIGN_OR_RETURN(const RuleProto* rule, GetRule(rule_case));
  change->set_severity(rule->severity());
  change->set_is_breaking(rule->severity() == Severity::BREAKING);
  SCHEMADIFF_VLOG(1) << "Classified " << ChangeKind::Code_Name(change->kind())
                     << " as " << RuleCase::Code_Name(rule_case) << " -> "
                     << Severity::Code_Name(rule->severity());
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::StatusOr<std::string> RuleSet::GetRemediation(
    const ChangeProto& change) const {
  SCHEMADIFF_ASSIGN_OR_RETURN(RuleCase::Code rule_case, DeriveCase(change));
  SCHEMADIFF_ASSIGN_OR_RETURN(const RuleProto* rule, GetRule(rule_case));
  return rule->remediation();
}

}  // namespace lib
}  // namespace schemadiff
