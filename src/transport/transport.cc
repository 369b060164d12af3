#include "transport.h"

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace Estuary {

std::optional<CachePolicy> ParseCachePolicy(const std::string& name) {
	if (name == "cache_only") return CachePolicy::kCacheOnly;
	if (name == "network_only") return CachePolicy::kNetworkOnly;
	if (name == "cache_then_network") return CachePolicy::kCacheThenNetwork;
	return std::nullopt;
}

const char* CachePolicyName(CachePolicy policy) {
	switch (policy) {
		case CachePolicy::kCacheOnly:
			return "cache_only";
		case CachePolicy::kNetworkOnly:
			return "network_only";
		case CachePolicy::kCacheThenNetwork:
			return "cache_then_network";
	}
	return "unknown";
}

namespace {

// Length-prefixed so that separators inside values cannot alias another filter.
template <typename Values>
void AppendField(std::string* signature, absl::string_view name, const Values& values) {
	absl::StrAppend(signature, name, "[");
	for (const auto& value : values) {
		std::string text = absl::StrCat(value);
		absl::StrAppend(signature, text.size(), ":", text);
	}
	absl::StrAppend(signature, "]");
}

}  // namespace

std::string Filter::Signature() const {
	std::string signature;
	AppendField(&signature, "authors", authors);
	AppendField(&signature, "kinds", kinds);
	for (const auto& [key, values] : tags) {
		AppendField(&signature, absl::StrCat("#", key.size(), ":", key), values);
	}
	return signature;
}

bool Filter::Matches(const Record& record) const {
	if (!authors.empty() && !authors.contains(record.creator)) {
		return false;
	}
	if (!kinds.empty() && !kinds.contains(record.kind)) {
		return false;
	}
	for (const auto& [key, values] : tags) {
		bool matched = false;
		for (const Tag& tag : record.tags) {
			if (tag.size() >= 2 && tag[0] == key && values.contains(tag[1])) {
				matched = true;
				break;
			}
		}
		if (!matched) {
			return false;
		}
	}
	return true;
}

}  // namespace Estuary
