#include "record.h"

#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace Estuary {

bool operator==(const Record& a, const Record& b) {
	return a.id == b.id &&
		a.creator == b.creator &&
		a.kind == b.kind &&
		a.created_at == b.created_at &&
		a.content == b.content &&
		a.tags == b.tags;
}

const Tag* FindTag(const Record& record, std::string_view key) {
	for (const auto& tag : record.tags) {
		if (!tag.empty() && tag[0] == key) {
			return &tag;
		}
	}
	return nullptr;
}

bool HasTag(const Record& record, std::string_view key) {
	return FindTag(record, key) != nullptr;
}

std::optional<std::string> TagValue(const Record& record, std::string_view key) {
	const Tag* tag = FindTag(record, key);
	if (tag == nullptr || tag->size() < 2) {
		return std::nullopt;
	}
	return (*tag)[1];
}

std::optional<std::string> NonEmptyTagValue(const Record& record, std::string_view key) {
	auto value = TagValue(record, key);
	if (!value.has_value() || value->empty()) {
		return std::nullopt;
	}
	return value;
}

std::vector<std::string> TagValues(const Record& record, std::string_view key) {
	std::vector<std::string> values;
	for (const auto& tag : record.tags) {
		if (tag.size() >= 2 && tag[0] == key) {
			values.push_back(tag[1]);
		}
	}
	return values;
}

std::string AddressableIdentity(int kind, std::string_view creator, std::string_view slug) {
	return absl::StrCat(kind, ":", absl::string_view(creator.data(), creator.size()), ":",
		absl::string_view(slug.data(), slug.size()));
}

std::string NormalizeAddress(std::string_view reference) {
	std::vector<absl::string_view> segments =
		absl::StrSplit(absl::string_view(reference.data(), reference.size()), absl::MaxSplits(':', 3));
	if (segments.size() < 3) {
		return std::string(reference);
	}
	return absl::StrCat(segments[0], ":", segments[1], ":", segments[2]);
}

std::string ProjectReference(const Record& record) {
	auto reference = TagValue(record, "a");
	if (!reference.has_value()) {
		return "";
	}
	return NormalizeAddress(*reference);
}

std::string FirstLine(std::string_view content) {
	size_t end = content.find_first_of("\r\n");
	return std::string(content.substr(0, end));
}

}  // namespace Estuary
