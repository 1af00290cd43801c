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

#ifndef SCHEMADIFF_MODEL_SEMANTIC_VERSION_H_
#define SCHEMADIFF_MODEL_SEMANTIC_VERSION_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "utils/base/statusor.h"
#include "schemadiff/proto/change.pb.h"

namespace schemadiff {
namespace lib {

// A MAJOR.MINOR.PATCH[-pre.release][+build] version as defined by
// semver.org 2.0.0.
class SemanticVersion {
 public:
  // Returns:
  //   SemanticVersion on success
  //   INVALID_ARGUMENT (ParseError) if text is not a valid semantic version
  static libtextclassifier3::StatusOr<SemanticVersion> Parse(
      std::string_view text);

  SemanticVersion() = default;
  SemanticVersion(uint64_t major, uint64_t minor, uint64_t patch,
                  std::string pre_release = "", std::string build = "");

  uint64_t major_version() const { return major_; }
  uint64_t minor_version() const { return minor_; }
  uint64_t patch_version() const { return patch_; }
  const std::string& pre_release() const { return pre_release_; }
  const std::string& build() const { return build_; }

  std::string ToString() const;

  // Precedence comparison. Build metadata is ignored.
  int Compare(const SemanticVersion& other) const;

  bool operator==(const SemanticVersion& other) const {
    return Compare(other) == 0;
  }
  bool operator!=(const SemanticVersion& other) const {
    return Compare(other) != 0;
  }
  bool operator<(const SemanticVersion& other) const {
    return Compare(other) < 0;
  }
  bool operator>(const SemanticVersion& other) const {
    return Compare(other) > 0;
  }
  bool operator<=(const SemanticVersion& other) const {
    return Compare(other) <= 0;
  }
  bool operator>=(const SemanticVersion& other) const {
    return Compare(other) >= 0;
  }

 private:
  uint64_t major_ = 0;
  uint64_t minor_ = 0;
  uint64_t patch_ = 0;
  std::string pre_release_;
  std::string build_;
};

// The smallest version increment a set of classified changes calls for.
enum class VersionBump { kNone, kPatch, kMinor, kMajor };

const char* VersionBumpToString(VersionBump bump);

// Breaking changes need a major bump, additions a minor bump and anything
// else a patch bump. No change needs no bump.
VersionBump RequiredBump(const std::vector<ChangeProto>& changes);

// Whether going from old_version to new_version is at least the given bump.
// For 0.y.z versions the minor component plays the role of the major one.
bool SatisfiesBump(const SemanticVersion& old_version,
                   const SemanticVersion& new_version, VersionBump bump);

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_MODEL_SEMANTIC_VERSION_H_
