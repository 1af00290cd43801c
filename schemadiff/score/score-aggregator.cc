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

#include "schemadiff/score/score-aggregator.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <vector>

#include "utils/base/status.h"
#include "schemadiff/absl_ports/canonical_errors.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/util/logging.h"

namespace schemadiff {
namespace lib {

libtextclassifier3::Status ScoreAggregator::ValidatePolicy(
    const ScoringPolicyProto& policy) {
  if (policy.breaking_penalty() < 0 || policy.warning_penalty() < 0 ||
      policy.info_penalty() < 0) {
    return absl_ports::InvalidArgumentError(
        "Scoring penalties must be non-negative");
  }
  if (policy.breaking_decay() < 0 || policy.breaking_decay() > 1) {
    return absl_ports::InvalidArgumentError(
        "Breaking decay must be within [0, 1]");
  }
  return libtextclassifier3::Status::OK;
}

int ScoreAggregator::Score(const std::vector<ChangeProto>& changes) const {
  double score = 100.0;
  std::unordered_map<int, int> breaking_count_by_kind;
  for (const ChangeProto& change : changes) {
    switch (change.severity()) {
      case Severity::BREAKING: {
        int& seen = breaking_count_by_kind[change.kind()];
        score -= policy_.breaking_penalty() *
                 std::pow(policy_.breaking_decay(), seen);
        ++seen;
        break;
      }
      case Severity::WARNING:
        score -= policy_.warning_penalty();
        break;
      case Severity::INFO:
        score -= policy_.info_penalty();
        break;
      case Severity::UNKNOWN:
        SCHEMADIFF_LOG(WARNING) << "Scoring unclassified change: "
                                << change.description();
        break;
    }
  }
  score = std::clamp(score, 0.0, 100.0);
  return static_cast<int>(std::lround(score));
}

CompatibilityVerdict ScoreAggregator::Aggregate(
    const std::vector<ChangeProto>& changes, int threshold) const {
  CompatibilityVerdict verdict;
  verdict.score = Score(changes);
  bool any_breaking = std::any_of(
      changes.begin(), changes.end(), [](const ChangeProto& change) {
        return change.is_breaking() || change.severity() == Severity::BREAKING;
      });
  verdict.is_compatible = !any_breaking && verdict.score >= threshold;
  return verdict;
}

}  // namespace lib
}  // namespace schemadiff
