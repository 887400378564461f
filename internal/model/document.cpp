#include "document.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <stdexcept>

namespace offsync::model {

std::string ToJson(const Document& doc) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(doc, &json);
  if (!status.ok()) {
    throw std::runtime_error("document serialize failed: " + std::string(status.message()));
  }
  return json;
}

Document FromJson(const std::string& json) {
  Document doc;
  if (json.empty()) {
    return doc;
  }

  auto status = google::protobuf::util::JsonStringToMessage(json, &doc);
  if (!status.ok()) {
    throw std::runtime_error("document parse failed: " + std::string(status.message()));
  }
  return doc;
}

bool ValueEquals(const Value& a, const Value& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

bool DocumentEquals(const Document& a, const Document& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

Document Overlay(const Document& base, const Document& patch) {
  Document merged = base;
  for (const auto& [field, value] : patch.fields()) {
    (*merged.mutable_fields())[field] = value;
  }
  return merged;
}

Value StringValue(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Value NumberValue(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value BoolValue(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

} // namespace offsync::model
