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

#include "schemadiff/format/protobuf-adapter.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "utils/base/status.h"
#include "utils/base/statusor.h"
#include <google/protobuf/descriptor.h>
#include <google/protobuf/descriptor.pb.h>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/text_format.h>
#include "schemadiff/absl_ports/status_macros.h"
#include "schemadiff/absl_ports/str_cat.h"
#include "schemadiff/absl_ports/str_join.h"
#include "schemadiff/model/schema-node-util.h"
#include "schemadiff/proto/report.pb.h"
#include "schemadiff/proto/schema.pb.h"
#include "schemadiff/util/logging.h"
#include "schemadiff/util/schema-diff-errors.h"

namespace schemadiff {
namespace lib {
namespace protobuf_adapter {

namespace {

using ::google::protobuf::Descriptor;
using ::google::protobuf::DescriptorPool;
using ::google::protobuf::EnumDescriptor;
using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::FieldDescriptorProto;
using ::google::protobuf::FileDescriptor;
using ::google::protobuf::FileDescriptorProto;
using Operation = MigrationInstructionProto::Operation;

constexpr char kDefaultFileName[] = "schema.proto";
constexpr char kFileScope[] = "file";

class TextErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  void AddError(int line, google::protobuf::io::ColumnNumber column,
                const std::string& message) override {
    errors_.push_back(absl_ports::StrCat("line ", std::to_string(line + 1),
                                         ", column ",
                                         std::to_string(column + 1), ": ",
                                         message));
  }

  void AddWarning(int line, google::protobuf::io::ColumnNumber column,
                  const std::string& message) override {
    SCHEMADIFF_VLOG(1) << "Text format warning at line " << line + 1 << ": "
                       << message;
  }

  const std::vector<std::string>& errors() const { return errors_; }

 private:
  std::vector<std::string> errors_;
};

class PoolErrorCollector : public DescriptorPool::ErrorCollector {
 public:
  void AddError(const std::string& filename, const std::string& element_name,
                const google::protobuf::Message* descriptor,
                ErrorLocation location, const std::string& message) override {
    errors_.push_back(absl_ports::StrCat(element_name, ": ", message));
  }

  const std::vector<std::string>& errors() const { return errors_; }

 private:
  std::vector<std::string> errors_;
};

class DescriptorNormalizer {
 public:
  explicit DescriptorNormalizer(int max_depth) : max_depth_(max_depth) {}

  libtextclassifier3::StatusOr<SchemaNodeProto> NormalizeMessage(
      const Descriptor& message, int depth) const;

  SchemaNodeProto NormalizeEnum(const EnumDescriptor& enum_type) const;

 private:
  SchemaNodeProto NormalizeField(const FieldDescriptor& field) const;

  const int max_depth_;
};

SchemaNodeProto FieldTypeNode(const FieldDescriptor& field) {
  SchemaNodeProto node;
  node.mutable_metadata()->set_format(SchemaFormat::PROTOBUF);
  switch (field.type()) {
    case FieldDescriptor::TYPE_MESSAGE:
    case FieldDescriptor::TYPE_GROUP:
      node.mutable_reference()->set_target(field.message_type()->full_name());
      break;
    case FieldDescriptor::TYPE_ENUM:
      node.mutable_reference()->set_target(field.enum_type()->full_name());
      break;
    default:
      node.mutable_scalar()->set_primitive(field.type_name());
      break;
  }
  return node;
}

SchemaNodeProto DescriptorNormalizer::NormalizeField(
    const FieldDescriptor& field) const {
  SchemaNodeProto node;
  const char* wire_type = WireTypeName(field.type());
  if (field.is_map()) {
    const Descriptor* entry = field.message_type();
    node.mutable_scalar()->set_primitive(absl_ports::StrCat(
        "map<", entry->map_key()->type_name(), ",",
        schema_node_util::NodeSignature(FieldTypeNode(*entry->map_value())),
        ">"));
  } else if (field.is_repeated()) {
    *node.mutable_array()->mutable_element() = FieldTypeNode(field);
  } else {
    node = FieldTypeNode(field);
  }

  NodeMetadataProto* metadata = node.mutable_metadata();
  metadata->set_format(SchemaFormat::PROTOBUF);
  metadata->set_identity_key(std::to_string(field.number()));
  metadata->set_deprecated(field.options().deprecated());
  auto& attributes = *metadata->mutable_attributes();
  attributes[std::string(schema_node_util::kFieldNumberAttribute)] =
      std::to_string(field.number());
  attributes[std::string(schema_node_util::kWireTypeAttribute)] = wire_type;
  if (field.has_default_value()) {
    FieldDescriptorProto field_proto;
    field.CopyTo(&field_proto);
    attributes[std::string(schema_node_util::kDefaultAttribute)] =
        field_proto.default_value();
    if (node.has_scalar()) {
      ConstraintProto* constraint = node.mutable_scalar()->add_constraints();
      constraint->set_name(std::string(schema_node_util::kDefault));
      constraint->set_string_value(field_proto.default_value());
    }
  }
  return node;
}

SchemaNodeProto DescriptorNormalizer::NormalizeEnum(
    const EnumDescriptor& enum_type) const {
  SchemaNodeProto node;
  node.mutable_metadata()->set_format(SchemaFormat::PROTOBUF);
  node.mutable_metadata()->set_deprecated(enum_type.options().deprecated());
  ScalarNodeProto* scalar = node.mutable_scalar();
  scalar->set_primitive("enum");
  ConstraintProto* values = scalar->add_constraints();
  values->set_name(std::string(schema_node_util::kEnum));
  for (int i = 0; i < enum_type.value_count(); ++i) {
    // The number is part of the value: renumbering breaks the wire format.
    values->add_enum_values(absl_ports::StrCat(
        enum_type.value(i)->name(), "=",
        std::to_string(enum_type.value(i)->number())));
  }
  return node;
}

libtextclassifier3::StatusOr<SchemaNodeProto>
DescriptorNormalizer::NormalizeMessage(const Descriptor& message,
                                       int depth) const {
  if (depth > max_depth_) {
    return ParseError(absl_ports::StrCat(
        "Message ", message.full_name(), " nests deeper than ",
        std::to_string(max_depth_), " levels"));
  }
  SchemaNodeProto node;
  node.mutable_metadata()->set_format(SchemaFormat::PROTOBUF);
  node.mutable_metadata()->set_deprecated(message.options().deprecated());
  ObjectNodeProto* object = node.mutable_object();
  for (int i = 0; i < message.field_count(); ++i) {
    const FieldDescriptor& field = *message.field(i);
    FieldProto* member = object->add_fields();
    member->set_name(field.name());
    *member->mutable_node() = NormalizeField(field);
    if (field.is_required()) {
      object->add_required(field.name());
    }
  }
  for (int i = 0; i < message.nested_type_count(); ++i) {
    const Descriptor& nested = *message.nested_type(i);
    if (nested.options().map_entry()) {
      continue;
    }
    FieldProto* member = object->add_fields();
    member->set_name(nested.name());
    SCHEMADIFF_ASSIGN_OR_RETURN(*member->mutable_node(),
                                NormalizeMessage(nested, depth + 1));
  }
  for (int i = 0; i < message.enum_type_count(); ++i) {
    FieldProto* member = object->add_fields();
    member->set_name(message.enum_type(i)->name());
    *member->mutable_node() = NormalizeEnum(*message.enum_type(i));
  }
  return node;
}

// Field number of a dropped field, or empty for messages and enums.
std::string DroppedFieldNumber(const ChangeDetailsProto& details) {
  auto itr = details.old_attributes().find(
      std::string(schema_node_util::kFieldNumberAttribute));
  return itr == details.old_attributes().end() ? "" : itr->second;
}

std::string FieldTypeName(const SchemaNodeProto& node) {
  switch (node.kind_case()) {
    case SchemaNodeProto::kReference:
      return node.reference().target();
    case SchemaNodeProto::kArray:
      return FieldTypeName(node.array().element());
    default:
      return schema_node_util::NodeSignature(node);
  }
}

std::string RenderAdd(const MigrationInstructionProto& instruction,
                      const std::string& scope) {
  const SchemaNodeProto& node = instruction.node();
  std::string number =
      schema_node_util::GetAttribute(node, schema_node_util::kFieldNumberAttribute);
  if (number.empty()) {
    const char* kind = node.has_object() ? "message" : "enum";
    return absl_ports::StrCat(scope, ": add ", kind, " ", instruction.member());
  }
  const char* label = instruction.required() ? "required"
                      : node.has_array()     ? "repeated"
                                             : "optional";
  return absl_ports::StrCat(scope, ": add field ", label, " ",
                            FieldTypeName(node), " ", instruction.member(),
                            " = ", number, ";");
}

}  // namespace

const char* WireTypeName(FieldDescriptor::Type type) {
  switch (type) {
    case FieldDescriptor::TYPE_INT32:
    case FieldDescriptor::TYPE_INT64:
    case FieldDescriptor::TYPE_UINT32:
    case FieldDescriptor::TYPE_UINT64:
    case FieldDescriptor::TYPE_SINT32:
    case FieldDescriptor::TYPE_SINT64:
    case FieldDescriptor::TYPE_BOOL:
    case FieldDescriptor::TYPE_ENUM:
      return "varint";
    case FieldDescriptor::TYPE_FIXED64:
    case FieldDescriptor::TYPE_SFIXED64:
    case FieldDescriptor::TYPE_DOUBLE:
      return "i64";
    case FieldDescriptor::TYPE_FIXED32:
    case FieldDescriptor::TYPE_SFIXED32:
    case FieldDescriptor::TYPE_FLOAT:
      return "i32";
    case FieldDescriptor::TYPE_GROUP:
      return "group";
    case FieldDescriptor::TYPE_STRING:
    case FieldDescriptor::TYPE_BYTES:
    case FieldDescriptor::TYPE_MESSAGE:
      return "len";
  }
  return "len";
}

libtextclassifier3::StatusOr<FileDescriptorProto> ParseFile(
    std::string_view content) {
  FileDescriptorProto file;
  TextErrorCollector collector;
  google::protobuf::TextFormat::Parser parser;
  parser.RecordErrorsTo(&collector);
  if (!parser.ParseFromString(std::string(content), &file)) {
    return FormatSpecificError(absl_ports::StrCat(
        "Invalid FileDescriptorProto text: ",
        collector.errors().empty()
            ? std::string("parse failed")
            : absl_ports::StrJoin(collector.errors(), "; ")));
  }
  return file;
}

libtextclassifier3::Status CheckSyntax(std::string_view content) {
  return ParseFile(content).status();
}

libtextclassifier3::StatusOr<NormalizedSchemaProto> Normalize(
    std::string_view content, int max_depth) {
  SCHEMADIFF_ASSIGN_OR_RETURN(FileDescriptorProto file, ParseFile(content));
  if (file.name().empty()) {
    file.set_name(kDefaultFileName);
  }
  DescriptorPool pool;
  pool.AllowUnknownDependencies();
  PoolErrorCollector collector;
  const FileDescriptor* descriptor =
      pool.BuildFileCollectingErrors(file, &collector);
  if (descriptor == nullptr) {
    return FormatSpecificError(absl_ports::StrCat(
        "Invalid descriptor ", file.name(), ": ",
        absl_ports::StrJoin(collector.errors(), "; ")));
  }

  DescriptorNormalizer normalizer(max_depth);
  NormalizedSchemaProto schema;
  schema.set_format(SchemaFormat::PROTOBUF);
  SchemaNodeProto* root = schema.mutable_root();
  root->mutable_metadata()->set_format(SchemaFormat::PROTOBUF);
  ObjectNodeProto* object = root->mutable_object();
  for (int i = 0; i < descriptor->message_type_count(); ++i) {
    FieldProto* member = object->add_fields();
    member->set_name(descriptor->message_type(i)->name());
    SCHEMADIFF_ASSIGN_OR_RETURN(
        *member->mutable_node(),
        normalizer.NormalizeMessage(*descriptor->message_type(i), 1));
  }
  for (int i = 0; i < descriptor->enum_type_count(); ++i) {
    FieldProto* member = object->add_fields();
    member->set_name(descriptor->enum_type(i)->name());
    *member->mutable_node() = normalizer.NormalizeEnum(*descriptor->enum_type(i));
  }
  if (descriptor->service_count() > 0) {
    SCHEMADIFF_VLOG(1) << "Ignoring " << descriptor->service_count()
                       << " services of " << file.name();
  }
  return schema;
}

std::string Render(const MigrationInstructionProto& instruction) {
  const ChangeProto& change = instruction.change();
  const ChangeDetailsProto& details = change.details();
  std::string scope = instruction.container().empty()
                          ? std::string(kFileScope)
                          : absl_ports::StrJoin(instruction.container(), ".");
  const std::string& member = instruction.member();
  switch (instruction.operation()) {
    case Operation::ADD_MEMBER:
      return RenderAdd(instruction, scope);
    case Operation::DROP_MEMBER: {
      std::string number = DroppedFieldNumber(details);
      if (number.empty()) {
        return absl_ports::StrCat(scope, ": remove ", member);
      }
      return absl_ports::StrCat(scope, ": remove field ", member,
                                " and reserve ", number, ", \"", member,
                                "\"");
    }
    case Operation::RENAME_MEMBER:
      return absl_ports::StrCat(scope, ": rename field ", member, " to ",
                                details.new_name(), " (field number ",
                                details.identity_key(), ")");
    case Operation::CHANGE_TYPE:
      if (details.identity_name_changed()) {
        return absl_ports::StrCat(
            scope, ": field number ", details.identity_key(),
            " is reused by ", member, " as ", details.new_type(),
            "; reserve it and give ", member, " a new number");
      }
      return absl_ports::StrCat(scope, ": change type of ", member, " from ",
                                details.old_type(), " to ",
                                details.new_type());
    case Operation::MAKE_REQUIRED:
      return absl_ports::StrCat(scope, ": change label of ", member,
                                " to required");
    case Operation::MAKE_OPTIONAL:
      return absl_ports::StrCat(scope, ": change label of ", member,
                                " to optional");
    case Operation::TIGHTEN_CONSTRAINT:
    case Operation::LOOSEN_CONSTRAINT:
      return absl_ports::StrCat(
          scope, ": change ", details.constraint(), " of ", member, " from ",
          details.old_value().empty() ? "none" : details.old_value(), " to ",
          details.new_value().empty() ? "none" : details.new_value());
    case Operation::REVIEW:
    case Operation::UNKNOWN:
      break;
  }
  return absl_ports::StrCat(scope, ": review ", member, ": ",
                            change.description());
}

}  // namespace protobuf_adapter
}  // namespace lib
}  // namespace schemadiff
