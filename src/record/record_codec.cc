#include "record_codec.h"

#include <cmath>

#include <glog/logging.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <estuary.pb.h>

#include "absl/strings/str_cat.h"

namespace Estuary {

namespace {

std::string ValueToTagElement(const google::protobuf::Value& value) {
	switch (value.kind_case()) {
		case google::protobuf::Value::kStringValue:
			return value.string_value();
		case google::protobuf::Value::kNumberValue: {
			double number = value.number_value();
			if (std::floor(number) == number && std::fabs(number) < 9.0e15) {
				return absl::StrCat(static_cast<int64_t>(number));
			}
			return absl::StrCat(number);
		}
		case google::protobuf::Value::kBoolValue:
			return value.bool_value() ? "true" : "false";
		default:
			return "";
	}
}

}  // namespace

Record RecordFromMessage(const estuary::RecordMessage& message) {
	Record record;
	record.id = message.id();
	record.creator = message.pubkey();
	record.kind = message.kind();
	record.created_at = message.created_at();
	record.content = message.content();
	record.tags.reserve(message.tags_size());
	for (const auto& list : message.tags()) {
		Tag tag;
		tag.reserve(list.values_size());
		for (const auto& value : list.values()) {
			tag.push_back(ValueToTagElement(value));
		}
		record.tags.push_back(std::move(tag));
	}
	return record;
}

void RecordToMessage(const Record& record, estuary::RecordMessage* message) {
	message->Clear();
	message->set_id(record.id);
	message->set_pubkey(record.creator);
	message->set_kind(record.kind);
	message->set_created_at(record.created_at);
	message->set_content(record.content);
	for (const auto& tag : record.tags) {
		auto* list = message->add_tags();
		for (const auto& element : tag) {
			list->add_values()->set_string_value(element);
		}
	}
}

std::optional<Record> RecordFromJson(const std::string& json) {
	estuary::RecordMessage message;
	google::protobuf::util::JsonParseOptions options;
	options.ignore_unknown_fields = true;
	auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
	if (!status.ok()) {
		VLOG(1) << "[RecordCodec] Rejected record JSON: " << status.ToString();
		return std::nullopt;
	}
	return RecordFromMessage(message);
}

std::string RecordToJson(const Record& record) {
	estuary::RecordMessage message;
	RecordToMessage(record, &message);

	google::protobuf::util::JsonPrintOptions options;
	options.preserve_proto_field_names = true;
	options.always_print_primitive_fields = true;
	std::string out;
	auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
	if (!status.ok()) {
		LOG(ERROR) << "[RecordCodec] Failed to encode record " << record.id << ": " << status.ToString();
		return "{}";
	}
	return out;
}

}  // namespace Estuary
