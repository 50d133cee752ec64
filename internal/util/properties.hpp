#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

namespace datagraph::util {

/*
  JSON codec for entity and relationship property maps.

  Storage keeps properties as JSON object text ("" when absent). Neither
  direction rejects input: a map that cannot be serialized, or stored text
  that is not a JSON object, is carried as {"raw_properties": "<text>"}.
*/

inline constexpr const char* kRawPropertiesKey = "raw_properties";

std::string PropertiesToJson(const google::protobuf::Struct& properties);

google::protobuf::Struct PropertiesFromJson(const std::string& json);

// Equality under JSON semantics (key order and number formatting ignored).
bool PropertiesEquivalent(const google::protobuf::Struct& a, const google::protobuf::Struct& b);

} // namespace datagraph::util
