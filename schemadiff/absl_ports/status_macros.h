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

#ifndef SCHEMADIFF_ABSL_PORTS_STATUS_MACROS_H_
#define SCHEMADIFF_ABSL_PORTS_STATUS_MACROS_H_

#include <utility>

#include "utils/base/status.h"
#include "utils/base/statusor.h"

namespace schemadiff {
namespace lib {
namespace absl_ports {

// Wraps either a Status or a StatusOr<T> so that the macros below can test
// and forward the error without caring which one they were handed.
class StatusAdapter {
 public:
  explicit StatusAdapter(const libtextclassifier3::Status& s) : s_(s) {}
  explicit StatusAdapter(libtextclassifier3::Status&& s) : s_(std::move(s)) {}
  template <typename T>
  explicit StatusAdapter(const libtextclassifier3::StatusOr<T>& s)
      : s_(s.status()) {}
  template <typename T>
  explicit StatusAdapter(libtextclassifier3::StatusOr<T>&& s)
      : s_(std::move(s).status()) {}

  bool ok() const { return s_.ok(); }
  explicit operator bool() const { return ok(); }

  const libtextclassifier3::Status& status() const& { return s_; }
  libtextclassifier3::Status status() && { return std::move(s_); }

 private:
  libtextclassifier3::Status s_;
};

}  // namespace absl_ports
}  // namespace lib
}  // namespace schemadiff

// Evaluates an expression that produces a `libtextclassifier3::Status`. If the
// status is not ok, returns it from the current function.
//
// For example:
//   libtextclassifier3::Status NormalizeBoth() {
//     SCHEMADIFF_RETURN_IF_ERROR(CheckSyntax(old_content));
//     SCHEMADIFF_RETURN_IF_ERROR(CheckSyntax(new_content));
//     return libtextclassifier3::Status::OK;
//   }
#define SCHEMADIFF_RETURN_IF_ERROR(expr) SCHEMADIFF_RETURN_IF_ERROR_IMPL(expr)
#define SCHEMADIFF_RETURN_IF_ERROR_IMPL(expr)                       \
  SCHEMADIFF_STATUS_MACROS_IMPL_ELSE_BLOCKER_                       \
  if (::schemadiff::lib::absl_ports::StatusAdapter adapter{expr}) { \
  } else /* NOLINT */                                               \
    return std::move(adapter).status()

// Executes an expression that returns a `libtextclassifier3::StatusOr<T>`,
// extracting its value into the variable defined by lhs (or returning on
// error).
//
// Example: Assigning to an existing value
//   ValueType value;
//   SCHEMADIFF_ASSIGN_OR_RETURN(value, MaybeGetValue(arg));
//
// Example: Creating and assigning variable in one line.
//   SCHEMADIFF_ASSIGN_OR_RETURN(ValueType value, MaybeGetValue(arg));
//
// WARNING: Expands into multiple statements; cannot be used in a single
// statement (e.g. as the body of an if statement without {})!
#define SCHEMADIFF_ASSIGN_OR_RETURN(lhs, rexpr)                            \
  SCHEMADIFF_ASSIGN_OR_RETURN_IMPL(                                        \
      SCHEMADIFF_STATUS_MACROS_CONCAT_NAME(_status_or_value, __COUNTER__), \
      lhs, rexpr)

#define SCHEMADIFF_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                     \
  if (!statusor.ok()) {                                        \
    return std::move(statusor).status();                       \
  }                                                            \
  lhs = std::move(statusor).ValueOrDie()

#define SCHEMADIFF_STATUS_MACROS_CONCAT_NAME(x, y) \
  SCHEMADIFF_STATUS_MACROS_CONCAT_IMPL(x, y)
#define SCHEMADIFF_STATUS_MACROS_CONCAT_IMPL(x, y) x##y

// The GNU compiler emits a warning for code like:
//
//   if (foo)
//     if (bar) { } else baz;
//
// because it thinks you might want the else to bind to the first if.  This
// leads to problems with code like:
//
//   if (do_expr) SCHEMADIFF_RETURN_IF_ERROR(expr);
//
// The "switch (0) case 0:" idiom is used to suppress this.
#define SCHEMADIFF_STATUS_MACROS_IMPL_ELSE_BLOCKER_ \
  switch (0)                                        \
  case 0:                                           \
  default:  // NOLINT

#endif  // SCHEMADIFF_ABSL_PORTS_STATUS_MACROS_H_
