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

#ifndef SCHEMADIFF_SCORE_SCORE_AGGREGATOR_H_
#define SCHEMADIFF_SCORE_SCORE_AGGREGATOR_H_

#include <utility>
#include <vector>

#include "utils/base/status.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/options.pb.h"

namespace schemadiff {
namespace lib {

struct CompatibilityVerdict {
  // 0 to 100.
  int score;
  bool is_compatible;
};

// Folds classified changes into a score. The score starts at 100 and every
// change subtracts the penalty of its severity. Repeated breaking changes of
// the same kind cost less each time (breaking_decay), so that a single
// refactoring touching many members does not drown out everything else.
class ScoreAggregator {
 public:
  explicit ScoreAggregator(ScoringPolicyProto policy)
      : policy_(std::move(policy)) {}

  // Returns:
  //   OK if every penalty is non-negative and the decay is within [0, 1]
  //   INVALID_ARGUMENT otherwise
  static libtextclassifier3::Status ValidatePolicy(
      const ScoringPolicyProto& policy);

  int Score(const std::vector<ChangeProto>& changes) const;

  // Compatible iff no change is breaking and the score reaches threshold.
  CompatibilityVerdict Aggregate(const std::vector<ChangeProto>& changes,
                                 int threshold) const;

 private:
  ScoringPolicyProto policy_;
};

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_SCORE_SCORE_AGGREGATOR_H_
