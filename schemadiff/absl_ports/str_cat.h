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

#ifndef SCHEMADIFF_ABSL_PORTS_STR_CAT_H_
#define SCHEMADIFF_ABSL_PORTS_STR_CAT_H_

#include <string>
#include <string_view>
#include <vector>

namespace schemadiff {
namespace lib {
namespace absl_ports {

// Concatenates the given pieces into a single string. Numbers have to be
// converted by the caller (std::to_string) before they are passed in.
std::string StrCat(const std::vector<std::string_view>& pieces);

template <typename... AV>
std::string StrCat(const AV&... args) {
  return StrCat(std::vector<std::string_view>{std::string_view(args)...});
}

// Appends the given pieces to *dest.
void StrAppend(std::string* dest, const std::vector<std::string_view>& pieces);

template <typename... AV>
void StrAppend(std::string* dest, const AV&... args) {
  StrAppend(dest, std::vector<std::string_view>{std::string_view(args)...});
}

}  // namespace absl_ports
}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_ABSL_PORTS_STR_CAT_H_
