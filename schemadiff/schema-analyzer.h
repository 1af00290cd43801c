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

#ifndef SCHEMADIFF_SCHEMA_ANALYZER_H_
#define SCHEMADIFF_SCHEMA_ANALYZER_H_

#include <memory>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include "schemadiff/format/format-registry.h"
#include "schemadiff/model/schema.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/rules/rule-set.h"

namespace schemadiff {
namespace lib {

// Compares versions of schemas of a single format.
//
// An analyzer holds no mutable state; every call normalizes its inputs
// afresh, so one instance may be shared between threads.
class SchemaAnalyzer {
 public:
  // Returns:
  //   SchemaAnalyzer on success
  //   UNIMPLEMENTED (InvalidFormatError) if format has no adapter
  //   INVALID_ARGUMENT if options fail ValidateOptions or the rule overrides
  //     do not form a complete table
  static libtextclassifier3::StatusOr<std::unique_ptr<SchemaAnalyzer>> Create(
      SchemaFormat::Code format, const SchemaDiffOptionsProto& options);

  // Returns:
  //   OK if max_depth is positive, the scoring policy is sane, the threshold
  //     override is within [0, 100] and overrides name no other format
  //   INVALID_ARGUMENT otherwise
  static libtextclassifier3::Status ValidateOptions(
      SchemaFormat::Code format, const SchemaDiffOptionsProto& options);

  // Classifies every difference between old_schema and new_schema and scores
  // the result. Changes at or above options.issue_min_severity, and at least
  // WARNING, are annotated with an issue carrying the format's issue code
  // and the rule's remediation hint.
  //
  // Returns:
  //   CompatibilityReportProto on success
  //   FAILED_PRECONDITION (ComparisonError) if a schema is of another format,
  //     the roots cannot be compared or nesting exceeds max_depth
  //   INVALID_ARGUMENT (ParseError) or UNKNOWN (FormatSpecificError) if a
  //     schema does not normalize
  libtextclassifier3::StatusOr<CompatibilityReportProto> AnalyzeCompatibility(
      const Schema& old_schema, const Schema& new_schema) const;

  // Plans the steps that take old_schema to new_schema, rendered in the
  // format's own syntax.
  //
  // Returns:
  //   MigrationPlanProto on success, with no steps if the schemas are equal
  //   Same errors as AnalyzeCompatibility
  libtextclassifier3::StatusOr<MigrationPlanProto> GenerateMigrationPath(
      const Schema& old_schema, const Schema& new_schema) const;

  // Checks a change set that was not produced by AnalyzeCompatibility.
  // Problems with the changes are reported in the result, not as an error.
  libtextclassifier3::StatusOr<ValidationResultProto> ValidateChanges(
      const std::vector<ChangeProto>& changes) const;

  SchemaFormat::Code format() const { return format_.format; }

 private:
  SchemaAnalyzer(const FormatCapabilities* format,
                 const SchemaDiffOptionsProto& options,
                 std::unique_ptr<RuleSet> rule_set);

  libtextclassifier3::StatusOr<NormalizedSchemaProto> Normalize(
      const Schema& schema) const;

  // Diffs the normalized schemas and classifies the changes.
  libtextclassifier3::StatusOr<std::vector<ChangeProto>> ClassifiedChanges(
      const NormalizedSchemaProto& old_normalized,
      const NormalizedSchemaProto& new_normalized) const;

  const FormatCapabilities& format_;
  SchemaDiffOptionsProto options_;
  std::unique_ptr<RuleSet> rule_set_;
};

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_SCHEMA_ANALYZER_H_
