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

#ifndef SCHEMADIFF_UTIL_LOGGING_H_
#define SCHEMADIFF_UTIL_LOGGING_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "schemadiff/proto/debug.pb.h"

namespace schemadiff {
namespace lib {

// Whether a message of this severity and verbosity is printed. Builds with
// SCHEMADIFF_DEBUG_LOGGING print VERBOSE messages up to verbosity 1, other
// builds print INFO and above.
bool ShouldLog(LogSeverity::Code severity, int verbosity = 0);

// Collects one log line. Nothing is formatted for disabled messages.
struct LoggingStringStream {
  explicit LoggingStringStream(bool should_log) : should_log_(should_log) {}
  LoggingStringStream& stream() { return *this; }

  std::string message;
  const bool should_log_;
};

template <typename T>
inline LoggingStringStream& operator<<(LoggingStringStream& stream,
                                       const T& entry) {
  if (stream.should_log_) {
    stream.message.append(std::to_string(entry));
  }
  return stream;
}

inline LoggingStringStream& operator<<(LoggingStringStream& stream,
                                       const char* message) {
  if (stream.should_log_) {
    stream.message.append(message);
  }
  return stream;
}

inline LoggingStringStream& operator<<(LoggingStringStream& stream,
                                       const std::string& message) {
  if (stream.should_log_) {
    stream.message.append(message);
  }
  return stream;
}

inline LoggingStringStream& operator<<(LoggingStringStream& stream,
                                       std::string_view message) {
  if (stream.should_log_) {
    stream.message.append(message);
  }
  return stream;
}

// Prints the collected line with its source position when destroyed.
class LogMessage {
 public:
  LogMessage(LogSeverity::Code severity, int verbosity, const char* file_name,
             int line_number) __attribute__((noinline));

  ~LogMessage() __attribute__((noinline));

  LoggingStringStream& stream() { return stream_; }

 private:
  const LogSeverity::Code severity_;
  LoggingStringStream stream_;
};

inline constexpr char kSchemaDiffLoggingTag[] = "SchemaDiff";

#define SCHEMADIFF_VLOG(verbose_level)                                   \
  ::schemadiff::lib::LogMessage(::schemadiff::lib::LogSeverity::VERBOSE, \
                                verbose_level, __FILE__, __LINE__)       \
      .stream()
#define SCHEMADIFF_LOG(severity)                                          \
  ::schemadiff::lib::LogMessage(::schemadiff::lib::LogSeverity::severity, \
                                /*verbosity=*/0, __FILE__, __LINE__)      \
      .stream()

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_UTIL_LOGGING_H_
