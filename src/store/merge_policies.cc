#include "merge_policies.h"

#include "absl/strings/numbers.h"
#include "common/event_kinds.h"

namespace Estuary {

namespace {

// Overwrite `field` only when the record supplies a non-empty value for `key`.
void Refresh(std::string& field, const Record& update, const char* key) {
	if (auto value = NonEmptyTagValue(update, key)) {
		field = *value;
	}
}

void Refresh(std::optional<std::string>& field, const Record& update, const char* key) {
	if (auto value = NonEmptyTagValue(update, key)) {
		field = *value;
	}
}

void RefreshList(std::vector<std::string>& field, const Record& update, const char* key) {
	auto values = TagValues(update, key);
	if (!values.empty()) {
		field = std::move(values);
	}
}

}  // namespace

Project Merge(const Project& stored, const Project& candidate) {
	if (!candidate.source) return stored;
	const Record& update = *candidate.source;

	Project merged = stored;
	Refresh(merged.title, update, "title");
	if (!update.content.empty()) {
		merged.description = update.content;
	}
	Refresh(merged.repo_url, update, "repo");
	Refresh(merged.image_url, update, "picture");
	if (const Tag* hashtags = FindTag(update, "hashtags"); hashtags != nullptr && hashtags->size() > 1) {
		merged.hashtags.assign(hashtags->begin() + 1, hashtags->end());
	}
	RefreshList(merged.agent_ids, update, "agent");
	RefreshList(merged.tool_ids, update, "mcp");
	merged.source = candidate.source;
	return merged;
}

Conversation Merge(const Conversation& stored, const Conversation& candidate) {
	if (!candidate.source) return stored;
	const Record& update = *candidate.source;

	Conversation merged = stored;
	Refresh(merged.title, update, "title");
	if (auto count = NonEmptyTagValue(update, "reply-count")) {
		int parsed = 0;
		if (absl::SimpleAtoi(*count, &parsed)) {
			merged.reply_count = parsed;
		}
	}
	merged.source = candidate.source;
	return merged;
}

Task Merge(const Task& stored, const Task& candidate) {
	if (!candidate.source) return stored;
	const Record& update = *candidate.source;

	Task merged = stored;
	// Reply content is a status message, not a new task description.
	if (update.kind == kKindTask && !update.content.empty()) {
		merged.content = update.content;
	}
	Refresh(merged.title, update, "title");
	Refresh(merged.status, update, "status");
	RefreshList(merged.assignees, update, "p");
	Refresh(merged.branch, update, "branch");
	merged.source = candidate.source;
	return merged;
}

AgentProfile Merge(const AgentProfile& stored, const AgentProfile& candidate) {
	if (!candidate.source) return stored;
	const Record& update = *candidate.source;

	AgentProfile merged = stored;
	if (!update.content.empty()) {
		merged.instructions_markdown = update.content;
	}
	Refresh(merged.display_name, update, "title");
	Refresh(merged.description, update, "description");
	Refresh(merged.role, update, "role");
	Refresh(merged.usage_criteria, update, "use-criteria");
	Refresh(merged.version, update, "ver");
	RefreshList(merged.labels, update, "t");
	merged.source = candidate.source;
	return merged;
}

ProjectStatus Merge(const ProjectStatus&, const ProjectStatus& candidate) {
	return candidate;
}

TypingSignal Merge(const TypingSignal&, const TypingSignal& candidate) {
	return candidate;
}

LlmConfigChange Merge(const LlmConfigChange&, const LlmConfigChange& candidate) {
	return candidate;
}

Lesson Merge(const Lesson& stored, const Lesson&) {
	return stored;
}

Reply Merge(const Reply& stored, const Reply&) {
	return stored;
}

TaskAbortSignal Merge(const TaskAbortSignal& stored, const TaskAbortSignal&) {
	return stored;
}

}  // namespace Estuary
