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

#include "schemadiff/validate/change-validator.h"

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "utils/base/statusor.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/absl_ports/str_join.h"
#include "schemadiff/diff/diff-engine.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/util/logging.h"

namespace schemadiff {
namespace lib {

namespace {

void AddError(ValidationResultProto* result, const char* prefix,
              const char* code, const ChangeProto& change,
              std::string message) {
  ValidationErrorProto* error = result->add_errors();
  error->set_message(std::move(message));
  error->set_path(LocationToString(change.location()));
  error->set_code(absl_ports::StrCat(prefix, code));
}

}  // namespace

ValidationResultProto ChangeValidator::Validate(
    const std::vector<ChangeProto>& changes) const {
  ValidationResultProto result;
  int additions = 0;
  int removals = 0;
  int modifications = 0;
  int renames = 0;
  std::set<std::pair<std::string, int>> seen;

  for (size_t i = 0; i < changes.size(); ++i) {
    const ChangeProto& change = changes[i];
    std::string index = std::to_string(i);
    switch (change.kind()) {
      case ChangeKind::ADDED:
        ++additions;
        break;
      case ChangeKind::REMOVED:
        ++removals;
        break;
      case ChangeKind::RENAMED:
        ++renames;
        break;
      case ChangeKind::UNKNOWN:
        break;
      default:
        ++modifications;
        break;
    }

    if (change.kind() == ChangeKind::UNKNOWN) {
      AddError(&result, format_.issue_prefix, "101", change,
               absl_ports::StrCat("Change ", index, " has no kind"));
      continue;
    }
    if (change.location_size() == 0 &&
        change.kind() != ChangeKind::TYPE_CHANGED &&
        change.kind() != ChangeKind::CONSTRAINT_TIGHTENED &&
        change.kind() != ChangeKind::CONSTRAINT_LOOSENED &&
        change.kind() != ChangeKind::OTHER) {
      // Only changes of the root node itself may have an empty location.
      AddError(&result, format_.issue_prefix, "101", change,
               absl_ports::StrCat("Change ", index, " (",
                                  ChangeKind::Code_Name(change.kind()),
                                  ") has no location"));
      continue;
    }

    std::string location = absl_ports::StrJoin(change.location(), "\x1f");
    if (!seen.emplace(location, change.kind()).second) {
      AddError(&result, format_.issue_prefix, "104", change,
               absl_ports::StrCat("Change ", index, " repeats ",
                                  ChangeKind::Code_Name(change.kind()),
                                  " at the same location"));
    }

    libtextclassifier3::StatusOr<RuleCase::Code> rule_case_or =
        rule_set_.DeriveCase(change);
    if (!rule_case_or.ok()) {
      AddError(&result, format_.issue_prefix, "101", change,
               rule_case_or.status().error_message());
      continue;
    }
    libtextclassifier3::StatusOr<const RuleProto*> rule_or =
        rule_set_.GetRule(rule_case_or.ValueOrDie());
    if (!rule_or.ok()) {
      AddError(&result, format_.issue_prefix, "101", change,
               rule_or.status().error_message());
      continue;
    }
    Severity::Code expected = rule_or.ValueOrDie()->severity();
    if (change.severity() != expected) {
      AddError(&result, format_.issue_prefix, "102", change,
               absl_ports::StrCat(
                   "Change ", index, " is marked ",
                   Severity::Code_Name(change.severity()), " but rule ",
                   RuleCase::Code_Name(rule_case_or.ValueOrDie()),
                   " classifies it as ", Severity::Code_Name(expected)));
    }
    if (change.is_breaking() != (change.severity() == Severity::BREAKING)) {
      AddError(&result, format_.issue_prefix, "103", change,
               absl_ports::StrCat("Change ", index, " has is_breaking=",
                                  change.is_breaking() ? "true" : "false",
                                  " with severity ",
                                  Severity::Code_Name(change.severity())));
    }
  }

  result.set_valid(result.errors_size() == 0);
  auto& context = *result.mutable_context();
  context["format"] = format_.name;
  context["total_changes"] = std::to_string(changes.size());
  context["additions"] = std::to_string(additions);
  context["removals"] = std::to_string(removals);
  context["modifications"] = std::to_string(modifications);
  context["renames"] = std::to_string(renames);
  SCHEMADIFF_VLOG(1) << "Validated " << changes.size() << " changes, "
                     << result.errors_size() << " errors";
  return result;
}

}  // namespace lib
}  // namespace schemadiff
