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

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace schemadiff {
namespace lib {
namespace {

TEST(I18nUtilsTest, AcceptsMultiByteText) {
  EXPECT_TRUE(i18n_utils::IsValidUtf8("{\"title\": \"caf\xC3\xA9 \xE2\x82\xAC\"}"));
  EXPECT_TRUE(i18n_utils::IsValidUtf8(""));
}

TEST(I18nUtilsTest, ReportsOffsetOfInvalidSequence) {
  std::string input = "ab";
  input.push_back(static_cast<char>(0xC3));
  input.push_back('(');
  int offset = -1;
  EXPECT_FALSE(i18n_utils::IsValidUtf8(input, &offset));
  EXPECT_EQ(offset, 2);
}

TEST(I18nUtilsTest, RejectsSurrogateEncoding) {
  // CESU-8 style encoded surrogate U+D800.
  EXPECT_FALSE(i18n_utils::IsValidUtf8("\xED\xA0\x80"));
}

TEST(I18nUtilsTest, IsAscii) {
  EXPECT_TRUE(i18n_utils::IsAscii('a'));
  EXPECT_FALSE(i18n_utils::IsAscii(static_cast<char>(0xC3)));
}

}  // namespace
}  // namespace lib
}  // namespace schemadiff
