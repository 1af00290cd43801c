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

#ifndef SCHEMADIFF_RULES_DEFAULT_RULE_TABLES_H_
#define SCHEMADIFF_RULES_DEFAULT_RULE_TABLES_H_

#include "schemadiff/proto/options.pb.h"

namespace schemadiff {
namespace lib {

// Rules shared by every format. The format tables below start from it and
// replace individual cases.
RuleTableProto BaseRuleTable();

// Validators do not apply defaults, so a new required property is breaking
// even when it declares one.
RuleTableProto JsonSchemaRuleTable();
RuleTableProto OpenApiRuleTable();

// Varint and fixed width widenings. Widening across wire types is reported
// as a wire mismatch by the rule set.
RuleTableProto ProtobufRuleTable();

// Dropping a nullable column loses data but no reader depends on it being
// present; a NOT NULL column added with a DEFAULT is filled in by the
// database.
RuleTableProto SqlRuleTable();

}  // namespace lib
}  // namespace schemadiff

#endif  // SCHEMADIFF_RULES_DEFAULT_RULE_TABLES_H_
