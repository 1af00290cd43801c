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

#include "schemadiff/absl_ports/ascii_str_to_lower.h"

#include <cctype>
#include <string>

namespace schemadiff {
namespace lib {
namespace absl_ports {

void AsciiStrToLower(std::string* s) {
  for (char& c : *s) {
    c = std::tolower(static_cast<unsigned char>(c));
  }
}

void AsciiStrToUpper(std::string* s) {
  for (char& c : *s) {
    c = std::toupper(static_cast<unsigned char>(c));
  }
}

}  // namespace absl_ports
}  // namespace lib
}  // namespace schemadiff
