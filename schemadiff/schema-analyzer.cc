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

#include "schemadiff/schema-analyzer.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/absl_ports/canonical_errors.h"
#include "schemadiff/absl_ports/status_macros.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/diff/diff-engine.h"
#include "schemadiff/format/format-registry.h"
#include "schemadiff/migration/migration-planner.h"
#include "schemadiff/model/schema.h"
#include "schemadiff/model/semantic-version.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/rules/rule-set.h"
#include "schemadiff/score/score-aggregator.h"
#include "schemadiff/util/logging.h"
#include "schemadiff/util/schema-diff-errors.h"
#include "schemadiff/validate/change-validator.h"

namespace schemadiff {
namespace lib {

namespace {

constexpr char kBreakingIssueSuffix[] = "001";
constexpr char kWarningIssueSuffix[] = "002";

struct ChangeCounters {
  int breaking = 0;
  int warning = 0;
  int info = 0;
  int additions = 0;
  int removals = 0;
  int modifications = 0;
  int renames = 0;
};

ChangeCounters CountChanges(const std::vector<ChangeProto>& changes) {
  ChangeCounters counters;
  for (const ChangeProto& change : changes) {
    switch (change.severity()) {
      case Severity::BREAKING:
        ++counters.breaking;
        break;
      case Severity::WARNING:
        ++counters.warning;
        break;
      case Severity::INFO:
      case Severity::UNKNOWN:
        ++counters.info;
        break;
    }
    switch (change.kind()) {
      case ChangeKind::ADDED:
        ++counters.additions;
        break;
      case ChangeKind::REMOVED:
        ++counters.removals;
        break;
      case ChangeKind::RENAMED:
        ++counters.renames;
        break;
      default:
        ++counters.modifications;
        break;
    }
  }
  return counters;
}

}  // namespace

libtextclassifier3::Status SchemaAnalyzer::ValidateOptions(
    SchemaFormat::Code format, const SchemaDiffOptionsProto& options) {
  if (options.max_depth() <= 0) {
    return absl_ports::InvalidArgumentError(absl_ports::StrCat(
        "max_depth must be positive, got ",
        std::to_string(options.max_depth())));
  }
  SCHEMADIFF_RETURN_IF_ERROR(ScoreAggregator::ValidatePolicy(options.scoring()));
  if (options.has_rule_overrides()) {
    const RuleTableProto& overrides = options.rule_overrides();
    if (overrides.has_format() && overrides.format() != format) {
      return absl_ports::InvalidArgumentError(absl_ports::StrCat(
          "Rule overrides are for ", FormatName(overrides.format()),
          ", analyzer is for ", FormatName(format)));
    }
    if (overrides.has_compatibility_threshold() &&
        (overrides.compatibility_threshold() < 0 ||
         overrides.compatibility_threshold() > 100)) {
      return absl_ports::InvalidArgumentError(absl_ports::StrCat(
          "Compatibility threshold must be within [0, 100], got ",
          std::to_string(overrides.compatibility_threshold())));
    }
  }
  return libtextclassifier3::Status::OK;
}

libtextclassifier3::StatusOr<std::unique_ptr<SchemaAnalyzer>>
SchemaAnalyzer::Create(SchemaFormat::Code format,
                       const SchemaDiffOptionsProto& options) {
  SCHEMADIFF_ASSIGN_OR_RETURN(const FormatCapabilities* capabilities,
                              LookupFormat(format));
  SCHEMADIFF_RETURN_IF_ERROR(ValidateOptions(format, options));
  SCHEMADIFF_ASSIGN_OR_RETURN(
      std::unique_ptr<RuleSet> rule_set,
      RuleSet::Create(format, options.has_rule_overrides()
                                  ? &options.rule_overrides()
                                  : nullptr));
  return std::unique_ptr<SchemaAnalyzer>(
      new SchemaAnalyzer(capabilities, options, std::move(rule_set)));
}

SchemaAnalyzer::SchemaAnalyzer(const FormatCapabilities* format,
                               const SchemaDiffOptionsProto& options,
                               std::unique_ptr<RuleSet> rule_set)
    : format_(*format), options_(options), rule_set_(std::move(rule_set)) {}

libtextclassifier3::StatusOr<NormalizedSchemaProto> SchemaAnalyzer::Normalize(
    const Schema& schema) const {
  if (schema.format() != format_.format) {
    return ComparisonError(absl_ports::StrCat(
        "Cannot compare a ", FormatName(schema.format()), " schema with a ",
        format_.name, " analyzer"));
  }
  return format_.normalize(schema.content(), options_.max_depth());
}

libtextclassifier3::StatusOr<std::vector<ChangeProto>>
SchemaAnalyzer::ClassifiedChanges(
    const NormalizedSchemaProto& old_normalized,
    const NormalizedSchemaProto& new_normalized) const {
  DiffEngine diff_engine(options_.max_depth());
  SCHEMADIFF_ASSIGN_OR_RETURN(std::vector<ChangeProto> changes,
                              diff_engine.Diff(old_normalized, new_normalized));
  for (ChangeProto& change : changes) {
    SCHEMADIFF_RETURN_IF_ERROR(rule_set_->Classify(&change));
  }
  SCHEMADIFF_VLOG(1) << "Found " << changes.size() << " " << format_.name
                     << " changes";
  return changes;
}

libtextclassifier3::StatusOr<CompatibilityReportProto>
SchemaAnalyzer::AnalyzeCompatibility(const Schema& old_schema,
                                     const Schema& new_schema) const {
  SCHEMADIFF_ASSIGN_OR_RETURN(NormalizedSchemaProto old_normalized,
                              Normalize(old_schema));
  SCHEMADIFF_ASSIGN_OR_RETURN(NormalizedSchemaProto new_normalized,
                              Normalize(new_schema));
  SCHEMADIFF_ASSIGN_OR_RETURN(
      std::vector<ChangeProto> changes,
      ClassifiedChanges(old_normalized, new_normalized));

  ScoreAggregator aggregator(options_.scoring());
  CompatibilityVerdict verdict =
      aggregator.Aggregate(changes, rule_set_->compatibility_threshold());

  CompatibilityReportProto report;
  report.set_is_compatible(verdict.is_compatible);
  report.set_compatibility_score(verdict.score);

  // Info changes never get an issue, whatever the option says.
  Severity::Code issue_min_severity =
      std::max(options_.issue_min_severity(), Severity::WARNING);
  for (int i = 0; i < static_cast<int>(changes.size()); ++i) {
    const ChangeProto& change = changes[i];
    if (change.severity() < issue_min_severity) {
      continue;
    }
    SCHEMADIFF_ASSIGN_OR_RETURN(std::string remediation,
                                rule_set_->GetRemediation(change));
    CompatibilityIssueProto* issue = report.add_issues();
    issue->set_change_index(i);
    *issue->mutable_location() = change.location();
    issue->set_severity(change.severity());
    issue->set_code(absl_ports::StrCat(
        format_.issue_prefix, change.severity() == Severity::BREAKING
                                  ? kBreakingIssueSuffix
                                  : kWarningIssueSuffix));
    issue->set_remediation(std::move(remediation));
  }

  ChangeCounters counters = CountChanges(changes);
  VersionBump bump = RequiredBump(changes);
  auto& metadata = *report.mutable_metadata();
  metadata["format"] = format_.name;
  metadata["old_version"] = old_schema.version().ToString();
  metadata["new_version"] = new_schema.version().ToString();
  metadata["total_changes"] = std::to_string(changes.size());
  metadata["breaking_changes"] = std::to_string(counters.breaking);
  metadata["warning_changes"] = std::to_string(counters.warning);
  metadata["info_changes"] = std::to_string(counters.info);
  metadata["additions"] = std::to_string(counters.additions);
  metadata["removals"] = std::to_string(counters.removals);
  metadata["modifications"] = std::to_string(counters.modifications);
  metadata["renames"] = std::to_string(counters.renames);
  metadata["compatibility_threshold"] =
      std::to_string(rule_set_->compatibility_threshold());
  metadata["required_version_bump"] = VersionBumpToString(bump);
  metadata["version_bump_satisfied"] =
      SatisfiesBump(old_schema.version(), new_schema.version(), bump)
          ? "true"
          : "false";

  for (ChangeProto& change : changes) {
    *report.add_changes() = std::move(change);
  }
  if (!report.is_compatible()) {
    SCHEMADIFF_VLOG(1) << "Schema " << new_schema.version().ToString()
                       << " is incompatible with "
                       << old_schema.version().ToString() << ", score "
                       << report.compatibility_score();
  }
  return report;
}

libtextclassifier3::StatusOr<MigrationPlanProto>
SchemaAnalyzer::GenerateMigrationPath(const Schema& old_schema,
                                      const Schema& new_schema) const {
  SCHEMADIFF_ASSIGN_OR_RETURN(NormalizedSchemaProto old_normalized,
                              Normalize(old_schema));
  SCHEMADIFF_ASSIGN_OR_RETURN(NormalizedSchemaProto new_normalized,
                              Normalize(new_schema));
  SCHEMADIFF_ASSIGN_OR_RETURN(
      std::vector<ChangeProto> changes,
      ClassifiedChanges(old_normalized, new_normalized));

  MigrationPlanner planner(&format_);
  SCHEMADIFF_ASSIGN_OR_RETURN(MigrationPlanProto plan,
                              planner.Plan(changes, new_normalized));
  auto& metadata = *plan.mutable_metadata();
  metadata["source_version"] = old_schema.version().ToString();
  metadata["target_version"] = new_schema.version().ToString();
  return plan;
}

libtextclassifier3::StatusOr<ValidationResultProto>
SchemaAnalyzer::ValidateChanges(const std::vector<ChangeProto>& changes) const {
  ChangeValidator validator(rule_set_.get(), &format_);
  return validator.Validate(changes);
}

}  // namespace lib
}  // namespace schemadiff
