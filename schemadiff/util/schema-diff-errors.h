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

#ifndef SCHEMADIFF_UTIL_SCHEMA_DIFF_ERRORS_H_
#define SCHEMADIFF_UTIL_SCHEMA_DIFF_ERRORS_H_

#include <string>
#include <string_view>

#include "utils/base/status.h"

namespace schemadiff {
namespace lib {

// Error taxonomy of the analysis pipeline. Every category is an ordinary
// libtextclassifier3::Status with a fixed canonical code and message prefix:
//
//   ParseError          INVALID_ARGUMENT     content does not normalize
//   ComparisonError     FAILED_PRECONDITION  trees cannot be compared
//   InvalidFormatError  UNIMPLEMENTED        format has no adapter
//   IoError             INTERNAL             delegated I/O failed
//   EncodingError       DATA_LOSS            content is not valid UTF-8
//   FormatSpecificError UNKNOWN              raised by a format library
libtextclassifier3::Status ParseError(std::string_view message);
libtextclassifier3::Status ComparisonError(std::string_view message);
libtextclassifier3::Status InvalidFormatError(std::string_view message);
libtextclassifier3::Status IoError(std::string_view message);
libtextclassifier3::Status EncodingError(std::string_view message);
libtextclassifier3::Status FormatSpecificError(std::string_view message);

bool IsParseError(const libtextclassifier3::Status& status);
bool IsComparisonError(const libtextclassifier3::Status& status);
bool IsInvalidFormatError(const libtextclassifier3::Status& status);
bool IsIoError(const libtextclassifier3::Status& status);
bool IsEncodingError(const libtextclassifier3::Status& status);
bool IsFormatSpecificError(const libtextclassifier3::Status& status);

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_UTIL_SCHEMA_DIFF_ERRORS_H_
