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

#include "schemadiff/absl_ports/canonical_errors.h"

#include <string>
#include <utility>

#include "utils/base/status.h"

namespace schemadiff {
namespace lib {
namespace absl_ports {

libtextclassifier3::Status UnknownError(const char* error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::UNKNOWN, std::string(error_message));
}

libtextclassifier3::Status InvalidArgumentError(const char* error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::INVALID_ARGUMENT,
      std::string(error_message));
}

libtextclassifier3::Status NotFoundError(const char* error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::NOT_FOUND, std::string(error_message));
}

libtextclassifier3::Status FailedPreconditionError(const char* error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::FAILED_PRECONDITION,
      std::string(error_message));
}

libtextclassifier3::Status OutOfRangeError(const char* error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::OUT_OF_RANGE, std::string(error_message));
}

libtextclassifier3::Status UnimplementedError(const char* error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::UNIMPLEMENTED,
      std::string(error_message));
}

libtextclassifier3::Status InternalError(const char* error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::INTERNAL, std::string(error_message));
}

libtextclassifier3::Status DataLossError(const char* error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::DATA_LOSS, std::string(error_message));
}

libtextclassifier3::Status UnknownError(std::string error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::UNKNOWN, std::move(error_message));
}

libtextclassifier3::Status InvalidArgumentError(std::string error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::INVALID_ARGUMENT,
      std::move(error_message));
}

libtextclassifier3::Status NotFoundError(std::string error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::NOT_FOUND, std::move(error_message));
}

libtextclassifier3::Status FailedPreconditionError(std::string error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::FAILED_PRECONDITION,
      std::move(error_message));
}

libtextclassifier3::Status OutOfRangeError(std::string error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::OUT_OF_RANGE, std::move(error_message));
}

libtextclassifier3::Status UnimplementedError(std::string error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::UNIMPLEMENTED, std::move(error_message));
}

libtextclassifier3::Status InternalError(std::string error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::INTERNAL, std::move(error_message));
}

libtextclassifier3::Status DataLossError(std::string error_message) {
  return libtextclassifier3::Status(
      libtextclassifier3::StatusCode::DATA_LOSS, std::move(error_message));
}

bool IsUnknown(const libtextclassifier3::Status& status) {
  return status.CanonicalCode() ==
         libtextclassifier3::StatusCode::UNKNOWN;
}

bool IsInvalidArgument(const libtextclassifier3::Status& status) {
  return status.CanonicalCode() ==
         libtextclassifier3::StatusCode::INVALID_ARGUMENT;
}

bool IsNotFound(const libtextclassifier3::Status& status) {
  return status.CanonicalCode() ==
         libtextclassifier3::StatusCode::NOT_FOUND;
}

bool IsFailedPrecondition(const libtextclassifier3::Status& status) {
  return status.CanonicalCode() ==
         libtextclassifier3::StatusCode::FAILED_PRECONDITION;
}

bool IsOutOfRange(const libtextclassifier3::Status& status) {
  return status.CanonicalCode() ==
         libtextclassifier3::StatusCode::OUT_OF_RANGE;
}

bool IsUnimplemented(const libtextclassifier3::Status& status) {
  return status.CanonicalCode() ==
         libtextclassifier3::StatusCode::UNIMPLEMENTED;
}

bool IsInternal(const libtextclassifier3::Status& status) {
  return status.CanonicalCode() ==
         libtextclassifier3::StatusCode::INTERNAL;
}

bool IsDataLoss(const libtextclassifier3::Status& status) {
  return status.CanonicalCode() ==
         libtextclassifier3::StatusCode::DATA_LOSS;
}

}  // namespace absl_ports
}  // namespace lib
}  // namespace schemadiff
