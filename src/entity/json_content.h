#pragma once

#include <string>

namespace google {
namespace protobuf {
class Message;
}  // namespace protobuf
}  // namespace google

namespace Estuary {

/**
 * Schema-checked decoding of JSON record content into a protobuf message.
 * Unknown fields are ignored. Returns false (leaving `out` cleared) when the
 * content is not a JSON object of the expected shape; callers then fall back
 * to treating the content as raw text.
 */
bool DecodeJsonContent(const std::string& content, google::protobuf::Message* out);

// Compact JSON using lowerCamelCase field names; "{}" on failure.
std::string EncodeJsonContent(const google::protobuf::Message& message);

}  // namespace Estuary
