#include "builders.h"

#include <estuary.pb.h>

#include "absl/strings/str_cat.h"
#include "common/event_kinds.h"
#include "json_content.h"

namespace Estuary {

namespace {

Record NewRecord(int kind, const BuildContext& ctx, std::string content) {
	Record record;
	record.creator = ctx.creator;
	record.kind = kind;
	record.created_at = ctx.created_at;
	record.content = std::move(content);
	return record;
}

void AddTag(Record& record, const std::string& key, const std::string& value) {
	record.tags.push_back({key, value});
}

void AddOptionalTag(Record& record, const std::string& key, const std::optional<std::string>& value) {
	if (value.has_value()) {
		AddTag(record, key, *value);
	}
}

void AddProjectReference(Record& record, const std::string& project_identity) {
	if (!project_identity.empty()) {
		AddTag(record, "a", project_identity);
	}
}

void AddRepeatedTag(Record& record, const std::string& key, const std::vector<std::string>& values) {
	for (const auto& value : values) {
		AddTag(record, key, value);
	}
}

void AddThreadRoot(Record& record, const std::string& root_id, int root_kind) {
	AddTag(record, "E", root_id);
	AddTag(record, "e", root_id);
	AddTag(record, "K", absl::StrCat(root_kind));
}

}  // namespace

Record BuildProject(const ProjectIntent& intent, const BuildContext& ctx) {
	Record record = NewRecord(kKindProject, ctx, intent.description.value_or(""));
	AddTag(record, "d", intent.slug);
	AddTag(record, "title", intent.title);
	AddOptionalTag(record, "repo", intent.repo_url);
	AddOptionalTag(record, "picture", intent.image_url);
	if (!intent.hashtags.empty()) {
		Tag hashtags{"hashtags"};
		hashtags.insert(hashtags.end(), intent.hashtags.begin(), intent.hashtags.end());
		record.tags.push_back(std::move(hashtags));
	}
	AddRepeatedTag(record, "agent", intent.agent_ids);
	AddRepeatedTag(record, "mcp", intent.tool_ids);
	return record;
}

Record BuildConversation(const ConversationIntent& intent, const BuildContext& ctx) {
	Record record = NewRecord(kKindConversation, ctx, intent.content);
	AddProjectReference(record, intent.project_identity);
	AddOptionalTag(record, "title", intent.title);
	AddRepeatedTag(record, "p", intent.mentioned_agents);
	return record;
}

Record BuildConversationMetadata(const ConversationMetadataIntent& intent, const BuildContext& ctx) {
	Record record = NewRecord(kKindConversationMetadata, ctx, "");
	AddTag(record, "e", intent.conversation_id);
	AddProjectReference(record, intent.project_identity);
	AddOptionalTag(record, "title", intent.title);
	if (intent.reply_count.has_value()) {
		AddTag(record, "reply-count", absl::StrCat(*intent.reply_count));
	}
	return record;
}

Record BuildReply(const ReplyIntent& intent, const BuildContext& ctx) {
	Record record = NewRecord(kKindThreadReply, ctx, intent.content);
	AddThreadRoot(record, intent.root_id, intent.root_kind);
	AddProjectReference(record, intent.project_identity);
	AddRepeatedTag(record, "p", intent.mentioned_agents);
	return record;
}

Record BuildLessonComment(const ReplyIntent& intent, const BuildContext& ctx) {
	ReplyIntent comment = intent;
	comment.root_kind = kKindAgentLesson;
	return BuildReply(comment, ctx);
}

Record BuildTask(const TaskIntent& intent, const BuildContext& ctx) {
	Record record = NewRecord(kKindTask, ctx, intent.content);
	AddProjectReference(record, intent.project_identity);
	AddTag(record, "title", intent.title);
	AddOptionalTag(record, "status", intent.status);
	AddRepeatedTag(record, "p", intent.assignees);
	AddOptionalTag(record, "branch", intent.branch);
	AddOptionalTag(record, "e", intent.conversation_id);
	return record;
}

Record BuildTaskStatusUpdate(const TaskStatusUpdateIntent& intent, const BuildContext& ctx) {
	Record record = NewRecord(kKindThreadReply, ctx, intent.message);
	AddThreadRoot(record, intent.task_id, kKindTask);
	AddProjectReference(record, intent.project_identity);
	AddOptionalTag(record, "title", intent.title);
	AddOptionalTag(record, "status", intent.status);
	AddRepeatedTag(record, "p", intent.assignees);
	AddOptionalTag(record, "branch", intent.branch);
	return record;
}

Record BuildAgentProfile(const AgentProfileIntent& intent, const BuildContext& ctx) {
	Record record = NewRecord(kKindAgentProfile, ctx, intent.instructions_markdown);
	AddTag(record, "title", intent.display_name);
	AddOptionalTag(record, "description", intent.description);
	AddOptionalTag(record, "role", intent.role);
	AddOptionalTag(record, "use-criteria", intent.usage_criteria);
	AddOptionalTag(record, "ver", intent.version);
	AddRepeatedTag(record, "t", intent.labels);
	AddOptionalTag(record, "e", intent.supersedes);
	return record;
}

Record BuildProjectStatus(const ProjectStatusIntent& intent, const BuildContext& ctx) {
	Record record = NewRecord(kKindProjectStatus, ctx, "");
	AddProjectReference(record, intent.project_identity);
	for (const auto& agent : intent.agents) {
		record.tags.push_back({"agent", agent.pubkey, agent.slug});
	}
	return record;
}

Record BuildTyping(const TypingIntent& intent, const BuildContext& ctx) {
	Record record = NewRecord(intent.stop ? kKindTypingStop : kKindTypingStart, ctx, intent.message);
	AddTag(record, "e", intent.conversation_id);
	AddProjectReference(record, intent.project_identity);
	AddOptionalTag(record, "phase", intent.phase);
	return record;
}

Record BuildTaskAbort(const TaskAbortIntent& intent, const BuildContext& ctx) {
	Record record = NewRecord(kKindTaskAbort, ctx, "abort");
	record.tags.push_back({"e", intent.task_id, "", "task"});
	return record;
}

Record BuildLesson(const LessonIntent& intent, const BuildContext& ctx) {
	estuary::LessonPayload payload;
	payload.set_title(intent.title);
	payload.set_content(intent.content);

	Record record = NewRecord(kKindAgentLesson, ctx, EncodeJsonContent(payload));
	AddProjectReference(record, intent.project_identity);
	// Readers that cannot decode the JSON still get a title.
	AddTag(record, "title", intent.title);
	AddOptionalTag(record, "lesson-type", intent.lesson_type);
	AddOptionalTag(record, "agent-name", intent.agent_name);
	return record;
}

Record BuildLlmConfigChange(const LlmConfigIntent& intent, const BuildContext& ctx) {
	estuary::LlmConfigPayload payload;
	if (intent.model.has_value()) payload.set_model(*intent.model);
	if (intent.temperature.has_value()) payload.set_temperature(*intent.temperature);
	if (intent.max_tokens.has_value()) payload.set_max_tokens(*intent.max_tokens);
	if (intent.provider.has_value()) payload.set_provider(*intent.provider);

	Record record = NewRecord(kKindLlmConfigChange, ctx, EncodeJsonContent(payload));
	AddProjectReference(record, intent.project_identity);
	return record;
}

}  // namespace Estuary
