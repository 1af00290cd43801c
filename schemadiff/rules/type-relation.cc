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

#include "schemadiff/rules/type-relation.h"

#include <cctype>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "schemadiff/absl_ports/ascii_str_to_lower.h"
#include "schemadiff/proto/options.pb.h"
#include "schemadiff/util/logging.h"

namespace schemadiff {
namespace lib {

namespace {

// Longer parameters do not fit in an int64_t and are kept in the base name.
constexpr int kMaxParameterDigits = 18;

// Precision and scale of numeric(p,s) are compared as integer digits and
// fraction digits, so that numeric(10,2) -> numeric(12,4) is a widening but
// numeric(10,2) -> numeric(10,4) is not.
std::vector<int64_t> ComparableParameters(const TypeSignature& type) {
  if ((type.base == "numeric" || type.base == "decimal") &&
      type.parameters.size() == 2) {
    return {type.parameters[0] - type.parameters[1], type.parameters[1]};
  }
  return type.parameters;
}

TypeRelation RelateParameters(const TypeSignature& old_type,
                              const TypeSignature& new_type) {
  // No parameter list means unbounded.
  if (old_type.parameters.empty()) {
    return new_type.parameters.empty() ? TypeRelation::kSame
                                       : TypeRelation::kNarrowed;
  }
  if (new_type.parameters.empty()) {
    return TypeRelation::kWidened;
  }
  std::vector<int64_t> old_parameters = ComparableParameters(old_type);
  std::vector<int64_t> new_parameters = ComparableParameters(new_type);
  if (old_parameters.size() != new_parameters.size()) {
    return TypeRelation::kIncompatible;
  }
  bool any_larger = false;
  bool any_smaller = false;
  for (size_t i = 0; i < old_parameters.size(); ++i) {
    any_larger |= new_parameters[i] > old_parameters[i];
    any_smaller |= new_parameters[i] < old_parameters[i];
  }
  if (any_larger && any_smaller) {
    return TypeRelation::kIncompatible;
  }
  if (any_larger) {
    return TypeRelation::kWidened;
  }
  if (any_smaller) {
    return TypeRelation::kNarrowed;
  }
  return TypeRelation::kSame;
}

// Relation of two types whose base names are related by `base`, refined by
// their parameter lists when both carry one. Parameters pulling the other
// way make the pair incompatible, e.g. char(10) -> varchar(5).
TypeRelation RefineByParameters(TypeRelation base,
                                const TypeSignature& old_type,
                                const TypeSignature& new_type) {
  if (old_type.parameters.empty() || new_type.parameters.empty()) {
    return base;
  }
  TypeRelation parameters = RelateParameters(old_type, new_type);
  if (parameters == TypeRelation::kSame || parameters == base) {
    return base;
  }
  return TypeRelation::kIncompatible;
}

}  // namespace

const char* TypeRelationToString(TypeRelation relation) {
  switch (relation) {
    case TypeRelation::kSame:
      return "same";
    case TypeRelation::kWidened:
      return "widened";
    case TypeRelation::kNarrowed:
      return "narrowed";
    case TypeRelation::kIncompatible:
      return "incompatible";
  }
  return "incompatible";
}

TypeSignature ParseTypeSignature(std::string_view type) {
  TypeSignature signature;
  size_t open = type.find('(');
  if (type.empty() || open == std::string_view::npos || open == 0 ||
      type.back() != ')') {
    signature.base = absl_ports::AsciiStrToLower(type);
    return signature;
  }
  signature.base = absl_ports::AsciiStrToLower(type.substr(0, open));
  std::string_view inner = type.substr(open + 1, type.size() - open - 2);
  int64_t value = 0;
  int digits = 0;
  bool has_digits = false;
  for (char c : inner) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      if (++digits > kMaxParameterDigits) {
        return TypeSignature{absl_ports::AsciiStrToLower(type), {}};
      }
      value = value * 10 + (c - '0');
      has_digits = true;
    } else if (c == ',') {
      if (!has_digits) {
        // Not a numeric parameter list; keep the full text as the base.
        return TypeSignature{absl_ports::AsciiStrToLower(type), {}};
      }
      signature.parameters.push_back(value);
      value = 0;
      digits = 0;
      has_digits = false;
    } else if (!std::isspace(static_cast<unsigned char>(c))) {
      return TypeSignature{absl_ports::AsciiStrToLower(type), {}};
    }
  }
  if (!has_digits) {
    return TypeSignature{absl_ports::AsciiStrToLower(type), {}};
  }
  signature.parameters.push_back(value);
  return signature;
}

TypeRelationTable::TypeRelationTable(const RuleTableProto& rule_table) {
  std::unordered_map<std::string, std::vector<std::string>> edges;
  for (const TypeWideningProto& widening : rule_table.widenings()) {
    edges[absl_ports::AsciiStrToLower(widening.from())].push_back(
        absl_ports::AsciiStrToLower(widening.to()));
  }
  // Transitive closure by a breadth first walk from every source.
  for (const auto& [source, targets] : edges) {
    std::unordered_set<std::string>& reachable = widens_to_[source];
    std::deque<std::string> queue(targets.begin(), targets.end());
    while (!queue.empty()) {
      std::string next = std::move(queue.front());
      queue.pop_front();
      if (next == source || !reachable.insert(next).second) {
        continue;
      }
      auto itr = edges.find(next);
      if (itr != edges.end()) {
        queue.insert(queue.end(), itr->second.begin(), itr->second.end());
      }
    }
  }
}

bool TypeRelationTable::WidensName(const std::string& from,
                                   const std::string& to) const {
  auto itr = widens_to_.find(from);
  return itr != widens_to_.end() && itr->second.count(to) > 0;
}

bool TypeRelationTable::Widens(const TypeSignature& from,
                               const TypeSignature& to) const {
  return WidensName(from.base, to.base);
}

TypeRelation TypeRelationTable::Relate(std::string_view old_type,
                                       std::string_view new_type) const {
  if (old_type == new_type) {
    return TypeRelation::kSame;
  }
  std::string old_lower = absl_ports::AsciiStrToLower(old_type);
  std::string new_lower = absl_ports::AsciiStrToLower(new_type);
  if (old_lower == new_lower) {
    return TypeRelation::kSame;
  }
  if (WidensName(old_lower, new_lower)) {
    return TypeRelation::kWidened;
  }
  if (WidensName(new_lower, old_lower)) {
    return TypeRelation::kNarrowed;
  }
  TypeSignature old_signature = ParseTypeSignature(old_type);
  TypeSignature new_signature = ParseTypeSignature(new_type);
  TypeRelation relation = TypeRelation::kIncompatible;
  if (old_signature.base == new_signature.base) {
    relation = RelateParameters(old_signature, new_signature);
  } else if (Widens(old_signature, new_signature)) {
    relation = RefineByParameters(TypeRelation::kWidened, old_signature,
                                  new_signature);
  } else if (Widens(new_signature, old_signature)) {
    relation = RefineByParameters(TypeRelation::kNarrowed, old_signature,
                                  new_signature);
  }
  SCHEMADIFF_VLOG(2) << "Type " << old_lower << " -> " << new_lower << " is "
                     << TypeRelationToString(relation);
  return relation;
}

}  // namespace lib
}  // namespace schemadiff
