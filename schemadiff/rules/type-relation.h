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

#ifndef SCHEMADIFF_RULES_TYPE_RELATION_H_
#define SCHEMADIFF_RULES_TYPE_RELATION_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "schemadiff/proto/options.pb.h"

namespace schemadiff {
namespace lib {

enum class TypeRelation {
  kSame,
  // Every value of the old type is a value of the new type.
  kWidened,
  // Every value of the new type is a value of the old type.
  kNarrowed,
  kIncompatible,
};

const char* TypeRelationToString(TypeRelation relation);

// A type signature split into its base name and numeric parameters,
// e.g. "numeric(10,2)" -> {"numeric", {10, 2}}.
struct TypeSignature {
  std::string base;
  std::vector<int64_t> parameters;
};

TypeSignature ParseTypeSignature(std::string_view type);

// Relates two type signatures using the widening pairs of a rule table,
// closed under transitivity. Types that share a base name are compared
// parameter by parameter instead, a missing parameter list counting as
// unbounded.
class TypeRelationTable {
 public:
  explicit TypeRelationTable(const RuleTableProto& rule_table);

  TypeRelation Relate(std::string_view old_type,
                      std::string_view new_type) const;

 private:
  bool Widens(const TypeSignature& from, const TypeSignature& to) const;
  bool WidensName(const std::string& from, const std::string& to) const;

  // Type name -> every type name it widens to, directly or transitively.
  std::unordered_map<std::string, std::unordered_set<std::string>> widens_to_;
};

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_RULES_TYPE_RELATION_H_
