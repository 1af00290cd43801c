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

// Open source gMock has no EqualsProto. This header provides one built on
// MessageDifferencer, which also reports the differing fields.

#ifndef SCHEMADIFF_PORTABLE_EQUALS_PROTO_H_
#define SCHEMADIFF_PORTABLE_EQUALS_PROTO_H_

#include <string>
#include <tuple>

#include "gmock/gmock.h"  // IWYU pragma: export
#include <google/protobuf/message.h>  // IWYU pragma: export
#include <google/protobuf/util/message_differencer.h>

namespace schemadiff {
namespace lib {
namespace portable_equals_proto {

// Maps are compared as maps, so their iteration order does not matter.
MATCHER_P(EqualsProto, other, "Compare Message with MessageDifferencer") {
  std::string differences;
  google::protobuf::util::MessageDifferencer differencer;
  differencer.ReportDifferencesToString(&differences);
  if (differencer.Compare(other, arg)) {
    return true;
  }
  *result_listener << "\n" << differences;
  return false;
}

MATCHER(EqualsProto, "") {
  return ::testing::ExplainMatchResult(EqualsProto(std::get<1>(arg)),
                                       std::get<0>(arg), result_listener);
}

}  // namespace portable_equals_proto
}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_PORTABLE_EQUALS_PROTO_H_
