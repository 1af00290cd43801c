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

#include "schemadiff/absl_ports/str_cat.h"

#include <string>
#include <string_view>
#include <vector>

namespace schemadiff {
namespace lib {
namespace absl_ports {

std::string StrCat(const std::vector<std::string_view>& pieces) {
  std::string result;
  StrAppend(&result, pieces);
  return result;
}

void StrAppend(std::string* dest,
               const std::vector<std::string_view>& pieces) {
  size_t total = dest->size();
  for (std::string_view piece : pieces) {
    total += piece.size();
  }
  dest->reserve(total);
  for (std::string_view piece : pieces) {
    dest->append(piece.data(), piece.size());
  }
}

}  // namespace absl_ports
}  // namespace lib
}  // namespace schemadiff
