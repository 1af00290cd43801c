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

#ifndef SCHEMADIFF_ABSL_PORTS_STR_JOIN_H_
#define SCHEMADIFF_ABSL_PORTS_STR_JOIN_H_

#include <string>
#include <string_view>

namespace schemadiff {
namespace lib {
namespace absl_ports {

// Joins the elements of [first, last) with sep. Elements must be convertible
// to std::string_view.
template <typename Iterator>
std::string StrJoin(Iterator first, Iterator last, std::string_view sep) {
  std::string result;
  for (Iterator it = first; it != last; ++it) {
    if (it != first) {
      result.append(sep.data(), sep.size());
    }
    std::string_view piece(*it);
    result.append(piece.data(), piece.size());
  }
  return result;
}

template <typename Container>
std::string StrJoin(const Container& container, std::string_view sep) {
  return StrJoin(container.begin(), container.end(), sep);
}

}  // namespace absl_ports
}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_ABSL_PORTS_STR_JOIN_H_
