#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

namespace offsync::model {

/*
  Documents are JSON objects carried as google.protobuf.Struct.

  Persisted as JSON text; compared field by field.
*/
using Document = google::protobuf::Struct;
using Value    = google::protobuf::Value;

std::string ToJson(const Document& doc);

// Throws std::runtime_error on malformed JSON or a non-object root.
Document FromJson(const std::string& json);

bool ValueEquals(const Value& a, const Value& b);

bool DocumentEquals(const Document& a, const Document& b);

// Copy of base with every top-level field of patch written over it.
Document Overlay(const Document& base, const Document& patch);

// Convenience for tests and callers building payloads by hand.
Value StringValue(const std::string& s);
Value NumberValue(double n);
Value BoolValue(bool b);

} // namespace offsync::model
