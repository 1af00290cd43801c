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

#include "schemadiff/util/logging.h"

#include <string_view>

#include "schemadiff/proto/debug.pb.h"
#include "schemadiff/util/logging_raw.h"

namespace schemadiff {
namespace lib {

namespace {

#if defined(SCHEMADIFF_DEBUG_LOGGING)
constexpr LogSeverity::Code kMinSeverity = LogSeverity::VERBOSE;
constexpr int kMaxVerbosity = 1;
#else
constexpr LogSeverity::Code kMinSeverity = LogSeverity::INFO;
constexpr int kMaxVerbosity = 0;
#endif

const char* Basename(const char* file_name) {
  if (file_name == nullptr) {
    return "";
  }
  std::string_view path(file_name);
  size_t slash = path.find_last_of('/');
  return slash == std::string_view::npos ? file_name : file_name + slash + 1;
}

}  // namespace

bool ShouldLog(LogSeverity::Code severity, int verbosity) {
  if (verbosity < 0 || severity < kMinSeverity) {
    return false;
  }
  return severity != LogSeverity::VERBOSE || verbosity <= kMaxVerbosity;
}

LogMessage::LogMessage(LogSeverity::Code severity, int verbosity,
                       const char* file_name, int line_number)
    : severity_(severity), stream_(ShouldLog(severity, verbosity)) {
  if (stream_.should_log_) {
    stream_ << Basename(file_name) << ":" << line_number << ": ";
  }
}

LogMessage::~LogMessage() {
  if (stream_.should_log_) {
    LowLevelLogging(severity_, kSchemaDiffLoggingTag, stream_.message);
  }
}

}  // namespace lib
}  // namespace schemadiff
