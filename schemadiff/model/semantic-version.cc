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

#include "schemadiff/model/semantic-version.h"

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "utils/base/statusor.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/proto/change.pb.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {

namespace {

bool IsAllDigits(std::string_view s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

// Parses a numeric identifier: digits only, no leading zero unless it is "0".
bool ParseNumericIdentifier(std::string_view s, uint64_t* value_out) {
  if (!IsAllDigits(s) || (s.size() > 1 && s[0] == '0') || s.size() > 19) {
    return false;
  }
  uint64_t value = 0;
  for (char c : s) {
    value = value * 10 + (c - '0');
  }
  *value_out = value;
  return true;
}

std::vector<std::string_view> SplitDots(std::string_view s) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    size_t dot = s.find('.', start);
    if (dot == std::string_view::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, dot - start));
    start = dot + 1;
  }
}

// Dot separated identifiers of [0-9A-Za-z-], none of them empty.
bool IsValidIdentifierList(std::string_view s, bool check_leading_zeros) {
  for (std::string_view part : SplitDots(s)) {
    if (part.empty()) {
      return false;
    }
    for (char c : part) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
        return false;
      }
    }
    if (check_leading_zeros && IsAllDigits(part) && part.size() > 1 &&
        part[0] == '0') {
      return false;
    }
  }
  return true;
}

int CompareNumbers(uint64_t a, uint64_t b) {
  if (a == b) return 0;
  return a < b ? -1 : 1;
}

// Pre-release precedence from semver.org item 11.
int ComparePreRelease(std::string_view a, std::string_view b) {
  if (a == b) return 0;
  // A version without pre-release has higher precedence.
  if (a.empty()) return 1;
  if (b.empty()) return -1;
  std::vector<std::string_view> a_parts = SplitDots(a);
  std::vector<std::string_view> b_parts = SplitDots(b);
  for (size_t i = 0; i < a_parts.size() && i < b_parts.size(); ++i) {
    bool a_numeric = IsAllDigits(a_parts[i]);
    bool b_numeric = IsAllDigits(b_parts[i]);
    if (a_numeric && b_numeric) {
      uint64_t a_value = 0;
      uint64_t b_value = 0;
      ParseNumericIdentifier(a_parts[i], &a_value);
      ParseNumericIdentifier(b_parts[i], &b_value);
      int cmp = CompareNumbers(a_value, b_value);
      if (cmp != 0) return cmp;
    } else if (a_numeric != b_numeric) {
      // Numeric identifiers have lower precedence than alphanumeric ones.
      return a_numeric ? -1 : 1;
    } else {
      int cmp = a_parts[i].compare(b_parts[i]);
      if (cmp != 0) return cmp < 0 ? -1 : 1;
    }
  }
  return CompareNumbers(a_parts.size(), b_parts.size());
}

}  // namespace

libtextclassifier3::StatusOr<SemanticVersion> SemanticVersion::Parse(
    std::string_view text) {
  std::string_view rest = text;
  std::string build;
  size_t plus = rest.find('+');
  if (plus != std::string_view::npos) {
    build = std::string(rest.substr(plus + 1));
    rest = rest.substr(0, plus);
    if (!IsValidIdentifierList(build, /*check_leading_zeros=*/false)) {
      return ParseError(absl_ports::StrCat("Invalid build metadata in version '",
                                           text, "'"));
    }
  }
  std::string pre_release;
  size_t dash = rest.find('-');
  if (dash != std::string_view::npos) {
    pre_release = std::string(rest.substr(dash + 1));
    rest = rest.substr(0, dash);
    if (!IsValidIdentifierList(pre_release, /*check_leading_zeros=*/true)) {
      return ParseError(absl_ports::StrCat("Invalid pre-release in version '",
                                           text, "'"));
    }
  }
  std::vector<std::string_view> core = SplitDots(rest);
  uint64_t numbers[3];
  if (core.size() != 3 || !ParseNumericIdentifier(core[0], &numbers[0]) ||
      !ParseNumericIdentifier(core[1], &numbers[1]) ||
      !ParseNumericIdentifier(core[2], &numbers[2])) {
    return ParseError(absl_ports::StrCat(
        "Version '", text, "' is not of the form MAJOR.MINOR.PATCH"));
  }
  return SemanticVersion(numbers[0], numbers[1], numbers[2],
                         std::move(pre_release), std::move(build));
}

SemanticVersion::SemanticVersion(uint64_t major, uint64_t minor,
                                 uint64_t patch, std::string pre_release,
                                 std::string build)
    : major_(major),
      minor_(minor),
      patch_(patch),
      pre_release_(std::move(pre_release)),
      build_(std::move(build)) {}

std::string SemanticVersion::ToString() const {
  std::string result = absl_ports::StrCat(
      std::to_string(major_), ".", std::to_string(minor_), ".",
      std::to_string(patch_));
  if (!pre_release_.empty()) {
    absl_ports::StrAppend(&result, "-", pre_release_);
  }
  if (!build_.empty()) {
    absl_ports::StrAppend(&result, "+", build_);
  }
  return result;
}

int SemanticVersion::Compare(const SemanticVersion& other) const {
  int cmp = CompareNumbers(major_, other.major_);
  if (cmp != 0) return cmp;
  cmp = CompareNumbers(minor_, other.minor_);
  if (cmp != 0) return cmp;
  cmp = CompareNumbers(patch_, other.patch_);
  if (cmp != 0) return cmp;
  return ComparePreRelease(pre_release_, other.pre_release_);
}

const char* VersionBumpToString(VersionBump bump) {
  switch (bump) {
    case VersionBump::kNone:
      return "none";
    case VersionBump::kPatch:
      return "patch";
    case VersionBump::kMinor:
      return "minor";
    case VersionBump::kMajor:
      return "major";
  }
  return "none";
}

VersionBump RequiredBump(const std::vector<ChangeProto>& changes) {
  VersionBump bump = VersionBump::kNone;
  for (const ChangeProto& change : changes) {
    if (change.severity() == Severity::BREAKING || change.is_breaking()) {
      return VersionBump::kMajor;
    }
    if (change.kind() == ChangeKind::ADDED) {
      bump = VersionBump::kMinor;
    } else if (bump == VersionBump::kNone) {
      bump = VersionBump::kPatch;
    }
  }
  return bump;
}

bool SatisfiesBump(const SemanticVersion& old_version,
                   const SemanticVersion& new_version, VersionBump bump) {
  switch (bump) {
    case VersionBump::kNone:
      return new_version >= old_version;
    case VersionBump::kPatch:
      return new_version > old_version;
    case VersionBump::kMinor:
      if (old_version.major_version() == 0) {
        return new_version > old_version;
      }
      return new_version.major_version() > old_version.major_version() ||
             (new_version.major_version() == old_version.major_version() &&
              new_version.minor_version() > old_version.minor_version());
    case VersionBump::kMajor:
      if (old_version.major_version() == 0) {
        return new_version.major_version() > 0 ||
               new_version.minor_version() > old_version.minor_version();
      }
      return new_version.major_version() > old_version.major_version();
  }
  return false;
}

}  // namespace lib
}  // namespace schemadiff
