#ifndef ESTUARY_SRC_RECORD_RECORD_H_
#define ESTUARY_SRC_RECORD_RECORD_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Estuary {

using Tag = std::vector<std::string>;

/**
 * Immutable signed event as delivered by the transport. Tags are looked up by
 * their first element; a group [key, v1, v2, ...] yields v1.
 */
struct Record {
	std::string id;
	std::string creator;
	int kind = 0;
	int64_t created_at = 0;	// unix seconds, as declared by the creator
	std::string content;
	std::vector<Tag> tags;
};

bool operator==(const Record& a, const Record& b);
inline bool operator!=(const Record& a, const Record& b) { return !(a == b); }

/**
 * Second element of the first tag group whose key matches.
 * nullopt if no group matches or the first match has no value.
 */
std::optional<std::string> TagValue(const Record& record, std::string_view key);

// Like TagValue but treats an empty value as absent.
std::optional<std::string> NonEmptyTagValue(const Record& record, std::string_view key);

// Second element of every matching group with at least two elements, in tag order.
std::vector<std::string> TagValues(const Record& record, std::string_view key);

// Whole first group with the given key (key included), nullptr if absent.
const Tag* FindTag(const Record& record, std::string_view key);

bool HasTag(const Record& record, std::string_view key);

// "kind:creator:slug"
std::string AddressableIdentity(int kind, std::string_view creator, std::string_view slug);

/**
 * Normalizes an `a`-style reference. "kind:creator:slug[:relay-hint...]"
 * becomes exactly "kind:creator:slug". Values with fewer than three segments
 * are returned unchanged.
 */
std::string NormalizeAddress(std::string_view reference);

// Normalized first `a` reference of the record, empty string if absent.
std::string ProjectReference(const Record& record);

// First line of the content, empty if content is empty.
std::string FirstLine(std::string_view content);

}  // namespace Estuary

#endif  // ESTUARY_SRC_RECORD_RECORD_H_
