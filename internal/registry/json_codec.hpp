#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <string>
#include <vector>

#include "internal/registry/model/audit_entry.hpp"
#include "internal/registry/model/instance.hpp"
#include "internal/registry/model/node_record.hpp"

namespace fleet::registry::codec {

/*
  JSON encoding of persisted values.

  Values go through google::protobuf::Value so that the wire shape stays the
  loose JSON external readers of the store expect (camelCase keys, status as
  "Online"/"Offline"/"Unknown", the index as a bare array of ids).

  Decode* throw std::runtime_error on text that is not JSON of the expected
  kind. Individual fields are read leniently: missing or null fields decode
  to their defaults.
*/

google::protobuf::Value ParseJson(const std::string& json);
std::string             ToJson(const google::protobuf::Value& value);

std::string       EncodeNode(const model::NodeRecord& node);
model::NodeRecord DecodeNode(const std::string& json);

std::string              EncodeIds(const std::vector<std::string>& ids);
std::vector<std::string> DecodeIds(const std::string& json);

// Reads a single entry of the "instances" list.
model::Instance DecodeInstance(const google::protobuf::Value& value);

google::protobuf::Value EncodeAuditEntry(const model::AuditEntry& entry);
model::AuditEntry       DecodeAuditEntry(const google::protobuf::Value& value);

model::NodeStatus ParseStatus(const std::string& text);

// Field accessors shared with the instance/audit stores.
std::string StringField(const google::protobuf::Struct& object, const std::string& key);
bool        BoolField(const google::protobuf::Struct& object, const std::string& key);
uint64_t    UnsignedField(const google::protobuf::Struct& object, const std::string& key);

} // namespace fleet::registry::codec
