// Repository: V3CDash
// Component: Protobuf JSON files implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/util/ProtoJson.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

#include <google/protobuf/util/json_util.h>

namespace v3cdash::util {

namespace {

bool Print(const google::protobuf::Message& message, bool pretty, std::string* json,
           std::string* error) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = pretty;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  json->clear();
  auto status = google::protobuf::util::MessageToJsonString(message, json, options);
  if (!status.ok()) {
    *error = "cannot encode " + message.GetTypeName() + ": " + status.ToString();
    return false;
  }
  return true;
}

}  // namespace

bool MessageToJson(const google::protobuf::Message& message, std::string* json,
                   std::string* error) {
  return Print(message, true, json, error);
}

bool MessageToJsonLine(const google::protobuf::Message& message, std::string* json,
                       std::string* error) {
  return Print(message, false, json, error);
}

bool JsonToMessage(const std::string& json, google::protobuf::Message* message,
                   std::string* error) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  message->Clear();
  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    *error = "cannot decode " + message->GetTypeName() + ": " + status.ToString();
    return false;
  }
  return true;
}

bool WriteMessageJsonFile(const std::string& path, const google::protobuf::Message& message,
                          std::string* error) {
  std::string json;
  if (!MessageToJson(message, &json, error)) return false;

  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      *error = "cannot create " + tmp_path + ": " + std::strerror(errno);
      return false;
    }
    out << json << '\n';
    out.flush();
    if (!out) {
      *error = "write error on " + tmp_path;
      std::remove(tmp_path.c_str());
      return false;
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    *error = "cannot rename " + tmp_path + ": " + std::strerror(errno);
    std::remove(tmp_path.c_str());
    return false;
  }
  return true;
}

bool ReadMessageJsonFile(const std::string& path, google::protobuf::Message* message,
                         std::string* error) {
  std::ifstream in(path);
  if (!in) {
    *error = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (!JsonToMessage(buffer.str(), message, error)) {
    *error = path + ": " + *error;
    return false;
  }
  return true;
}

}  // namespace v3cdash::util
