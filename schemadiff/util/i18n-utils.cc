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

#include "schemadiff/util/i18n-utils.h"

#include <cstdint>
#include <string_view>

#include "unicode/umachine.h"
#include "unicode/utf8.h"

namespace schemadiff {
namespace lib {
namespace i18n_utils {

bool IsValidUtf8(std::string_view input, int* error_offset_out) {
  const uint8_t* data = reinterpret_cast<const uint8_t*>(input.data());
  int32_t length = static_cast<int32_t>(input.size());
  int32_t offset = 0;
  while (offset < length) {
    int32_t start = offset;
    UChar32 c;
    U8_NEXT(data, offset, length, c);
    if (c < 0) {
      if (error_offset_out != nullptr) {
        *error_offset_out = start;
      }
      return false;
    }
  }
  return true;
}

bool IsAscii(char c) { return (c & 0x80) == 0; }

}  // namespace i18n_utils
}  // namespace lib
}  // namespace schemadiff
