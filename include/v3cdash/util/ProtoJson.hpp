// Repository: V3CDash
// Component: Protobuf JSON files
// Purpose: Read/write protobuf messages as JSON documents on disk.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_UTIL_PROTO_JSON_HPP_
#define V3CDASH_UTIL_PROTO_JSON_HPP_

#include <string>

#include <google/protobuf/message.h>

namespace v3cdash::util {

// Pretty-printed, proto field names, default-valued fields included.
bool MessageToJson(const google::protobuf::Message& message, std::string* json,
                   std::string* error);

// Single line, for JSONL journals.
bool MessageToJsonLine(const google::protobuf::Message& message, std::string* json,
                       std::string* error);

// Unknown fields are ignored.
bool JsonToMessage(const std::string& json, google::protobuf::Message* message,
                   std::string* error);

// Writes <path>.tmp then renames over path.
bool WriteMessageJsonFile(const std::string& path, const google::protobuf::Message& message,
                          std::string* error);

bool ReadMessageJsonFile(const std::string& path, google::protobuf::Message* message,
                         std::string* error);

}  // namespace v3cdash::util

#endif  // V3CDASH_UTIL_PROTO_JSON_HPP_
