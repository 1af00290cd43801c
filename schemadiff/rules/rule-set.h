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

#ifndef SCHEMADIFF_RULES_RULE_SET_H_
#define SCHEMADIFF_RULES_RULE_SET_H_

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/rules/type-relation.h"

namespace schemadiff {
namespace lib {

// Table driven classification of changes for one format. A change is first
// mapped to a RuleCase from its kind and structural details, then the case is
// looked up in the rule table.
class RuleSet {
 public:
  // Builds the rule set of format from its default table. Rules in overrides
  // replace the default rule of the same case, its widenings are added and
  // its threshold, if set, replaces the default one.
  //
  // Returns:
  //   RuleSet on success
  //   UNIMPLEMENTED (InvalidFormatError) if format has no adapter
  //   INVALID_ARGUMENT if overrides are for another format or the merged
  //     table is incomplete
  static libtextclassifier3::StatusOr<std::unique_ptr<RuleSet>> Create(
      SchemaFormat::Code format, const RuleTableProto* overrides = nullptr);

  // Returns:
  //   RuleSet on success
  //   INVALID_ARGUMENT if a case has no rule, a rule has no severity or the
  //     threshold is outside [0, 100]
  static libtextclassifier3::StatusOr<std::unique_ptr<RuleSet>>
  CreateFromTable(RuleTableProto rule_table);

  // Returns:
  //   The rule case of change on success
  //   INVALID_ARGUMENT if the change has no kind
  libtextclassifier3::StatusOr<RuleCase::Code> DeriveCase(
      const ChangeProto& change) const;

  // Returns:
  //   The rule for rule_case on success
  //   NOT_FOUND if the table has no such rule
  libtextclassifier3::StatusOr<const RuleProto*> GetRule(
      RuleCase::Code rule_case) const;

  // Sets severity and is_breaking of change.
  libtextclassifier3::Status Classify(ChangeProto* change) const;

  // Remediation hint of the rule that classifies change; empty if none.
  libtextclassifier3::StatusOr<std::string> GetRemediation(
      const ChangeProto& change) const;

  SchemaFormat::Code format() const { return rule_table_.format(); }

  int compatibility_threshold() const {
    return rule_table_.compatibility_threshold();
  }

  const RuleTableProto& rule_table() const { return rule_table_; }

 private:
  explicit RuleSet(RuleTableProto rule_table);

  RuleTableProto rule_table_;
  TypeRelationTable type_relations_;
  std::unordered_map<int, const RuleProto*> rules_by_case_;
};

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_RULES_RULE_SET_H_
