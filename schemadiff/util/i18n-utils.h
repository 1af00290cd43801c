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

#ifndef SCHEMADIFF_UTIL_I18N_UTILS_H_
#define SCHEMADIFF_UTIL_I18N_UTILS_H_

#include <string_view>

namespace schemadiff {
namespace lib {
namespace i18n_utils {

// Returns true if every byte sequence in input decodes to a valid Unicode
// scalar value. *error_offset_out, if not null, receives the offset of the
// first invalid sequence.
bool IsValidUtf8(std::string_view input, int* error_offset_out = nullptr);

// Checks if the single char is within ASCII range.
bool IsAscii(char c);

}  // namespace i18n_utils
}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_UTIL_I18N_UTILS_H_
