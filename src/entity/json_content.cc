#include "json_content.h"

#include <glog/logging.h>
#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

namespace Estuary {

bool DecodeJsonContent(const std::string& content, google::protobuf::Message* out) {
	out->Clear();
	// Cheap reject for plain text; JsonStringToMessage would fail anyway.
	size_t first = content.find_first_not_of(" \t\r\n");
	if (first == std::string::npos || content[first] != '{') {
		return false;
	}

	google::protobuf::util::JsonParseOptions options;
	options.ignore_unknown_fields = true;
	auto status = google::protobuf::util::JsonStringToMessage(content, out, options);
	if (!status.ok()) {
		VLOG(2) << "[JsonContent] Falling back to raw text for " << out->GetTypeName()
			<< ": " << status.ToString();
		out->Clear();
		return false;
	}
	return true;
}

std::string EncodeJsonContent(const google::protobuf::Message& message) {
	google::protobuf::util::JsonPrintOptions options;
	std::string out;
	auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
	if (!status.ok()) {
		LOG(ERROR) << "[JsonContent] Failed to encode " << message.GetTypeName() << ": " << status.ToString();
		return "{}";
	}
	return out;
}

}  // namespace Estuary
