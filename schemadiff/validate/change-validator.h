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

#ifndef SCHEMADIFF_VALIDATE_CHANGE_VALIDATOR_H_
#define SCHEMADIFF_VALIDATE_CHANGE_VALIDATOR_H_

#include <vector>

#include "schemadiff/format/format-registry.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/rules/rule-set.h"

namespace schemadiff {
namespace lib {

// Checks a change sequence that did not necessarily come from the diff
// engine, e.g. one assembled by hand, against the rule set.
//
// Error codes, prefixed with the format's issue prefix:
//   101  the change has no kind or no location
//   102  the severity differs from the one the rule set assigns
//   103  is_breaking does not match the severity
//   104  another change has the same location and kind
class ChangeValidator {
 public:
  ChangeValidator(const RuleSet* rule_set, const FormatCapabilities* format)
      : rule_set_(*rule_set), format_(*format) {}

  ValidationResultProto Validate(const std::vector<ChangeProto>& changes) const;

 private:
  const RuleSet& rule_set_;
  const FormatCapabilities& format_;
};

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_VALIDATE_CHANGE_VALIDATOR_H_
