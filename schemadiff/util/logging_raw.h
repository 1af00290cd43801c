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

#ifndef SCHEMADIFF_UTIL_LOGGING_RAW_H_
#define SCHEMADIFF_UTIL_LOGGING_RAW_H_

#include <string>

#include "schemadiff/proto/debug.pb.h"

namespace schemadiff {
namespace lib {

// Writes one already formatted log line, prefixed with severity and tag.
void LowLevelLogging(LogSeverity::Code severity, const std::string& tag,
                     const std::string& message);

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_UTIL_LOGGING_RAW_H_
