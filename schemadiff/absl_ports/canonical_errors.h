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

#ifndef SCHEMADIFF_ABSL_PORTS_CANONICAL_ERRORS_H_
#define SCHEMADIFF_ABSL_PORTS_CANONICAL_ERRORS_H_

#include <string>

#include "utils/base/status.h"

namespace schemadiff {
namespace lib {
namespace absl_ports {

// Both const char* and std::string are overloaded so that
// `FooError(StrCat("text", a_str))` can move its argument while
// `FooError("simple text")` avoids a temporary on the caller side.
libtextclassifier3::Status UnknownError(const char* error_message);
libtextclassifier3::Status InvalidArgumentError(const char* error_message);
libtextclassifier3::Status NotFoundError(const char* error_message);
libtextclassifier3::Status FailedPreconditionError(const char* error_message);
libtextclassifier3::Status OutOfRangeError(const char* error_message);
libtextclassifier3::Status UnimplementedError(const char* error_message);
libtextclassifier3::Status InternalError(const char* error_message);
libtextclassifier3::Status DataLossError(const char* error_message);

libtextclassifier3::Status UnknownError(std::string error_message);
libtextclassifier3::Status InvalidArgumentError(std::string error_message);
libtextclassifier3::Status NotFoundError(std::string error_message);
libtextclassifier3::Status FailedPreconditionError(std::string error_message);
libtextclassifier3::Status OutOfRangeError(std::string error_message);
libtextclassifier3::Status UnimplementedError(std::string error_message);
libtextclassifier3::Status InternalError(std::string error_message);
libtextclassifier3::Status DataLossError(std::string error_message);

bool IsUnknown(const libtextclassifier3::Status& status);
bool IsInvalidArgument(const libtextclassifier3::Status& status);
bool IsNotFound(const libtextclassifier3::Status& status);
bool IsFailedPrecondition(const libtextclassifier3::Status& status);
bool IsOutOfRange(const libtextclassifier3::Status& status);
bool IsUnimplemented(const libtextclassifier3::Status& status);
bool IsInternal(const libtextclassifier3::Status& status);
bool IsDataLoss(const libtextclassifier3::Status& status);

}  // namespace absl_ports
}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_ABSL_PORTS_CANONICAL_ERRORS_H_
