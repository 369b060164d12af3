#pragma once

#include <optional>
#include <string>

#include "record.h"

namespace estuary {
class RecordMessage;
}

namespace Estuary {

/**
 * Conversion between Record and the nostr-style JSON object
 * {"id", "pubkey", "kind", "created_at", "content", "tags"}.
 * Unknown fields (e.g. "sig") are ignored. Non-string tag elements are
 * rendered as text so a malformed tag never rejects the whole record.
 */
std::optional<Record> RecordFromJson(const std::string& json);

std::string RecordToJson(const Record& record);

Record RecordFromMessage(const estuary::RecordMessage& message);

void RecordToMessage(const Record& record, estuary::RecordMessage* message);

}  // namespace Estuary
