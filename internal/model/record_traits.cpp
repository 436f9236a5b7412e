#include "internal/model/record_traits.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace infragraph::model {

namespace {

using Properties = v1::EntityBody::PropertiesCase;

Properties ExpectedProperties(std::string_view entity_type) {
  if (entity_type == kApplicationType) return v1::EntityBody::kApplication;
  if (entity_type == kSystemType) return v1::EntityBody::kSystem;
  if (entity_type == kServiceType) return v1::EntityBody::kService;
  return v1::EntityBody::PROPERTIES_NOT_SET;
}

void RequireNonEmpty(const std::string& value, std::string_view what) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(what) + " must not be empty");
  }
}

} // namespace

void RecordTraits<v1::EntityBody>::Validate(const v1::EntityBody& body) {
  RequireNonEmpty(body.entity_type(), "entity entity_type");
  RequireNonEmpty(body.name(), "entity name");

  if (body.properties_case() == v1::EntityBody::PROPERTIES_NOT_SET) {
    return;
  }

  const auto expected = ExpectedProperties(body.entity_type());
  if (expected == v1::EntityBody::PROPERTIES_NOT_SET) {
    throw util::InvalidArgument("entity of type '" + body.entity_type() +
                                "' must carry its attributes in extension, not in typed properties");
  }
  if (body.properties_case() != expected) {
    throw util::InvalidArgument("entity properties do not match entity_type '" + body.entity_type() + "'");
  }
}

void RecordTraits<v1::NodeBody>::Validate(const v1::NodeBody& body) {
  RequireNonEmpty(body.object_type(), "node object_type");
  RequireNonEmpty(body.entity_object_id(), "node entity_object_id");
}

void RecordTraits<v1::EdgeBody>::Validate(const v1::EdgeBody& body) {
  RequireNonEmpty(body.edge_kind(), "edge edge_kind");
  RequireNonEmpty(body.tail_vertex().object_id(), "edge tail_vertex.object_id");
  RequireNonEmpty(body.head_vertex().object_id(), "edge head_vertex.object_id");
}

std::string EncodePayload(const google::protobuf::Message& body) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    throw util::SerializationError("encode " + std::string(body.GetTypeName()) + ": " + std::string(status.message()));
  }
  return json;
}

std::string EncodePrettyPayload(const google::protobuf::Message& body) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(body, &json, options);
  if (!status.ok()) {
    throw util::SerializationError("encode " + std::string(body.GetTypeName()) + ": " + std::string(status.message()));
  }
  return json;
}

void DecodePayload(const std::string& json, google::protobuf::Message* body) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, body, options);
  if (!status.ok()) {
    throw util::SerializationError("decode " + std::string(body->GetTypeName()) + ": " + std::string(status.message()));
  }
}

}  // namespace infragraph::model
