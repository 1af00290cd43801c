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

#include "schemadiff/testing/common-matchers.h"

#include <string>

#include "utils/base/status.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/absl_ports/str_join.h"
#include "schemadiff/proto/change.pb.h"

namespace schemadiff {
namespace lib {

std::string StatusCodeToString(libtextclassifier3::StatusCode code) {
  switch (code) {
    case libtextclassifier3::StatusCode::OK:
      return "OK";
    case libtextclassifier3::StatusCode::CANCELLED:
      return "CANCELLED";
    case libtextclassifier3::StatusCode::UNKNOWN:
      return "UNKNOWN";
    case libtextclassifier3::StatusCode::INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    case libtextclassifier3::StatusCode::DEADLINE_EXCEEDED:
      return "DEADLINE_EXCEEDED";
    case libtextclassifier3::StatusCode::NOT_FOUND:
      return "NOT_FOUND";
    case libtextclassifier3::StatusCode::ALREADY_EXISTS:
      return "ALREADY_EXISTS";
    case libtextclassifier3::StatusCode::PERMISSION_DENIED:
      return "PERMISSION_DENIED";
    case libtextclassifier3::StatusCode::RESOURCE_EXHAUSTED:
      return "RESOURCE_EXHAUSTED";
    case libtextclassifier3::StatusCode::FAILED_PRECONDITION:
      return "FAILED_PRECONDITION";
    case libtextclassifier3::StatusCode::ABORTED:
      return "ABORTED";
    case libtextclassifier3::StatusCode::OUT_OF_RANGE:
      return "OUT_OF_RANGE";
    case libtextclassifier3::StatusCode::UNIMPLEMENTED:
      return "UNIMPLEMENTED";
    case libtextclassifier3::StatusCode::INTERNAL:
      return "INTERNAL";
    case libtextclassifier3::StatusCode::UNAVAILABLE:
      return "UNAVAILABLE";
    case libtextclassifier3::StatusCode::DATA_LOSS:
      return "DATA_LOSS";
    case libtextclassifier3::StatusCode::UNAUTHENTICATED:
      return "UNAUTHENTICATED";
    default:
      return "";
  }
}

std::string ChangeToString(const ChangeProto& change) {
  return absl_ports::StrCat(ChangeKind::Code_Name(change.kind()), "@",
                            absl_ports::StrJoin(change.location(), "/"));
}

}  // namespace lib
}  // namespace schemadiff
