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

#include "schemadiff/util/schema-diff-errors.h"

#include <string>
#include <string_view>

#include "utils/base/status.h"
#include "schemadiff/absl_ports/canonical_errors.h"
#include "schemadiff/absl_ports/str_cat.h"

namespace schemadiff {
namespace lib {

namespace {

constexpr std::string_view kParsePrefix = "Parse error: ";
constexpr std::string_view kComparisonPrefix = "Comparison error: ";
constexpr std::string_view kInvalidFormatPrefix = "Invalid format: ";
constexpr std::string_view kIoPrefix = "IO error: ";
constexpr std::string_view kEncodingPrefix = "Encoding error: ";
constexpr std::string_view kFormatSpecificPrefix = "Format specific error: ";

bool HasPrefix(const libtextclassifier3::Status& status,
               std::string_view prefix) {
  return std::string_view(status.error_message()).substr(0, prefix.size()) ==
         prefix;
}

}  // namespace

libtextclassifier3::Status ParseError(std::string_view message) {
  return absl_ports::InvalidArgumentError(
      absl_ports::StrCat(kParsePrefix, message));
}

libtextclassifier3::Status ComparisonError(std::string_view message) {
  return absl_ports::FailedPreconditionError(
      absl_ports::StrCat(kComparisonPrefix, message));
}

libtextclassifier3::Status InvalidFormatError(std::string_view message) {
  return absl_ports::UnimplementedError(
      absl_ports::StrCat(kInvalidFormatPrefix, message));
}

libtextclassifier3::Status IoError(std::string_view message) {
  return absl_ports::InternalError(absl_ports::StrCat(kIoPrefix, message));
}

libtextclassifier3::Status EncodingError(std::string_view message) {
  return absl_ports::DataLossError(
      absl_ports::StrCat(kEncodingPrefix, message));
}

libtextclassifier3::Status FormatSpecificError(std::string_view message) {
  return absl_ports::UnknownError(
      absl_ports::StrCat(kFormatSpecificPrefix, message));
}

bool IsParseError(const libtextclassifier3::Status& status) {
  return absl_ports::IsInvalidArgument(status) &&
         HasPrefix(status, kParsePrefix);
}

bool IsComparisonError(const libtextclassifier3::Status& status) {
  return absl_ports::IsFailedPrecondition(status) &&
         HasPrefix(status, kComparisonPrefix);
}

bool IsInvalidFormatError(const libtextclassifier3::Status& status) {
  return absl_ports::IsUnimplemented(status) &&
         HasPrefix(status, kInvalidFormatPrefix);
}

bool IsIoError(const libtextclassifier3::Status& status) {
  return absl_ports::IsInternal(status) && HasPrefix(status, kIoPrefix);
}

bool IsEncodingError(const libtextclassifier3::Status& status) {
  return absl_ports::IsDataLoss(status) && HasPrefix(status, kEncodingPrefix);
}

bool IsFormatSpecificError(const libtextclassifier3::Status& status) {
  return absl_ports::IsUnknown(status) &&
         HasPrefix(status, kFormatSpecificPrefix);
}

}  // namespace lib
}  // namespace schemadiff
