#include "properties.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include "internal/observability/logging.hpp"

namespace datagraph::util {

namespace {

google::protobuf::Struct RawProperties(const std::string& text) {
  google::protobuf::Struct raw;
  (*raw.mutable_fields())[kRawPropertiesKey].set_string_value(text);
  return raw;
}

} // namespace

std::string PropertiesToJson(const google::protobuf::Struct& properties) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(properties, &json);
  if (status.ok()) {
    return json;
  }

  DATAGRAPH_LOG_WARN("properties not serializable, storing raw form",
                     {observability::StringField("error", std::string(status.message()))});

  json.clear();
  auto raw_status = google::protobuf::util::MessageToJsonString(RawProperties(properties.ShortDebugString()), &json);
  if (!raw_status.ok()) {
    return "{}";
  }
  return json;
}

google::protobuf::Struct PropertiesFromJson(const std::string& json) {
  google::protobuf::Struct properties;
  if (json.empty()) {
    return properties;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &properties, options);
  if (!status.ok()) {
    return RawProperties(json);
  }
  return properties;
}

bool PropertiesEquivalent(const google::protobuf::Struct& a, const google::protobuf::Struct& b) {
  return google::protobuf::util::MessageDifferencer::Equivalent(a, b);
}

} // namespace datagraph::util
