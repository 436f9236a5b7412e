#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <google/protobuf/message.h>

#include "infragraph/v1.hpp"
#include "internal/model/tier.hpp"

namespace infragraph::model {

inline constexpr std::string_view kApplicationType = "application";
inline constexpr std::string_view kSystemType      = "system";
inline constexpr std::string_view kServiceType     = "service";

inline constexpr std::string_view kIncludesEdge = "Includes";

/*
  Kind-specific behaviour layered over the generic versioned record.

  Validate() throws util::InvalidArgument; it runs on every write before the
  row reaches the repository.
*/
template <typename Body>
struct RecordTraits;

template <>
struct RecordTraits<v1::EntityBody> {
  static constexpr RecordKind kRecordKind = RecordKind::kEntity;

  static const std::string& KindTag(const v1::EntityBody& body) {
    return body.entity_type();
  }
  static std::pair<std::string, std::string> Endpoints(const v1::EntityBody&) {
    return {};
  }
  static void Validate(const v1::EntityBody& body);
};

template <>
struct RecordTraits<v1::NodeBody> {
  static constexpr RecordKind kRecordKind = RecordKind::kNode;

  static const std::string& KindTag(const v1::NodeBody& body) {
    return body.object_type();
  }
  static std::pair<std::string, std::string> Endpoints(const v1::NodeBody&) {
    return {};
  }
  static void Validate(const v1::NodeBody& body);
};

template <>
struct RecordTraits<v1::EdgeBody> {
  static constexpr RecordKind kRecordKind = RecordKind::kEdge;

  static const std::string& KindTag(const v1::EdgeBody& body) {
    return body.edge_kind();
  }
  // tail, head
  static std::pair<std::string, std::string> Endpoints(const v1::EdgeBody& body) {
    return {body.tail_vertex().object_id(), body.head_vertex().object_id()};
  }
  static void Validate(const v1::EdgeBody& body);
};

// JSON payload codec shared by every record kind.
std::string EncodePayload(const google::protobuf::Message& body);

// Indented form of EncodePayload, one field per line.
std::string EncodePrettyPayload(const google::protobuf::Message& body);

// Throws util::SerializationError when the document does not parse as `body`.
void DecodePayload(const std::string& json, google::protobuf::Message* body);

}  // namespace infragraph::model
