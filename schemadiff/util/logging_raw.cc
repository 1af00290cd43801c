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

#include "schemadiff/util/logging_raw.h"

#include <cstdio>
#include <string>

#include "schemadiff/proto/debug.pb.h"

namespace schemadiff {
namespace lib {

namespace {
// Converts LogSeverity to human-readable text.
const char *LogSeverityToString(LogSeverity::Code severity) {
  switch (severity) {
    case LogSeverity::VERBOSE:
      return "VERBOSE";
    case LogSeverity::DBG:
      return "DEBUG";
    case LogSeverity::INFO:
      return "INFO";
    case LogSeverity::WARNING:
      return "WARNING";
    case LogSeverity::ERROR:
      return "ERROR";
  }
  return "UNKNOWN";
}
}  // namespace

void LowLevelLogging(LogSeverity::Code severity, const std::string &tag,
                     const std::string &message) {
  fprintf(stderr, "[%s] %s : %s\n", LogSeverityToString(severity), tag.c_str(),
          message.c_str());
  fflush(stderr);
}

}  // namespace lib
}  // namespace schemadiff
