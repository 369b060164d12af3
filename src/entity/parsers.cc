#include "parsers.h"

#include <memory>

#include <glog/logging.h>
#include <estuary.pb.h>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "common/event_kinds.h"
#include "json_content.h"

namespace Estuary {

namespace {

std::shared_ptr<const Record> Share(const Record& record) {
	return std::make_shared<const Record>(record);
}

std::string ReplyRoot(const Record& record) {
	if (auto root = NonEmptyTagValue(record, "E")) {
		return *root;
	}
	return TagValue(record, "e").value_or("");
}

std::optional<int> ParseKindTag(const Record& record) {
	auto value = TagValue(record, "K");
	int kind = 0;
	if (value.has_value() && absl::SimpleAtoi(*value, &kind)) {
		return kind;
	}
	return std::nullopt;
}

}  // namespace

Project ParseProject(const Record& record) {
	Project project;
	project.creator_id = record.creator;
	project.slug = TagValue(record, "d").value_or("");
	project.identity = AddressableIdentity(record.kind, record.creator, project.slug);
	project.title = TagValue(record, "title").value_or(project.slug);
	if (!record.content.empty()) {
		project.description = record.content;
	}
	project.repo_url = TagValue(record, "repo");
	project.image_url = TagValue(record, "picture");
	if (const Tag* hashtags = FindTag(record, "hashtags")) {
		project.hashtags.assign(hashtags->begin() + 1, hashtags->end());
	}
	project.agent_ids = TagValues(record, "agent");
	project.tool_ids = TagValues(record, "mcp");
	if (project.slug.empty()) {
		VLOG(2) << "[Parsers] Project record " << record.id << " has no d tag";
	}
	project.source = Share(record);
	return project;
}

Conversation ParseConversation(const Record& record) {
	Conversation conversation;
	conversation.id = record.id;
	conversation.author = record.creator;
	conversation.project_identity = ProjectReference(record);
	conversation.title = TagValue(record, "title");
	conversation.content = record.content;
	conversation.created_at = record.created_at;
	conversation.mentioned_agents = TagValues(record, "p");
	conversation.source = Share(record);
	return conversation;
}

Conversation ParseConversationMetadata(const Record& record) {
	Conversation patch;
	patch.id = TagValue(record, "e").value_or("");
	patch.author = record.creator;
	patch.project_identity = ProjectReference(record);
	patch.title = NonEmptyTagValue(record, "title");
	if (auto count = TagValue(record, "reply-count")) {
		if (!absl::SimpleAtoi(*count, &patch.reply_count)) {
			VLOG(2) << "[Parsers] Ignoring malformed reply-count '" << *count << "' in " << record.id;
		}
	}
	patch.created_at = record.created_at;
	patch.source = Share(record);
	return patch;
}

Task ParseTask(const Record& record) {
	Task task;
	task.id = record.id;
	task.author = record.creator;
	task.project_identity = ProjectReference(record);
	task.title = TagValue(record, "title").value_or(kUntitledTask);
	task.content = record.content;
	task.status = TagValue(record, "status");
	task.assignees = TagValues(record, "p");
	task.branch = TagValue(record, "branch");
	task.related_conversation_id = TagValue(record, "e");
	task.created_at = record.created_at;
	task.source = Share(record);
	return task;
}

Task ParseTaskUpdate(const Record& record) {
	Task patch;
	patch.id = ReplyRoot(record);
	patch.author = record.creator;
	patch.project_identity = ProjectReference(record);
	patch.title = NonEmptyTagValue(record, "title").value_or("");
	patch.status = NonEmptyTagValue(record, "status");
	patch.assignees = TagValues(record, "p");
	patch.branch = NonEmptyTagValue(record, "branch");
	patch.created_at = record.created_at;
	patch.source = Share(record);
	return patch;
}

std::string AgentProfileIdentity(const Record& record) {
	std::string root = NonEmptyTagValue(record, "e").value_or(record.id);
	return absl::StrCat(record.creator, ":", root);
}

AgentProfile ParseAgentProfile(const Record& record) {
	AgentProfile agent;
	agent.id = NonEmptyTagValue(record, "e").value_or(record.id);
	agent.creator_id = record.creator;
	agent.display_name = TagValue(record, "title").value_or(kUntitledAgent);
	agent.instructions_markdown = record.content;
	agent.description = TagValue(record, "description");
	agent.role = TagValue(record, "role");
	agent.usage_criteria = TagValue(record, "use-criteria");
	agent.version = TagValue(record, "ver");
	agent.labels = TagValues(record, "t");
	agent.source = Share(record);
	return agent;
}

ProjectStatus ParseProjectStatus(const Record& record) {
	ProjectStatus status;
	status.project_identity = ProjectReference(record);
	status.observed_at = record.created_at;
	for (const auto& tag : record.tags) {
		if (tag.size() < 3 || tag[0] != "agent") {
			continue;
		}
		status.available_agents.push_back(AgentPresence{tag[1], tag[2], tag[2]});
	}
	status.source = Share(record);
	return status;
}

TypingSignal ParseTypingSignal(const Record& record) {
	TypingSignal signal;
	signal.conversation_id = TagValue(record, "e").value_or("");
	signal.project_identity = ProjectReference(record);
	signal.creator = record.creator;
	signal.message = record.content;
	signal.observed_at = record.created_at;
	signal.phase = TagValue(record, "phase");
	signal.stopped = record.kind == kKindTypingStop;
	signal.source = Share(record);
	return signal;
}

TaskAbortSignal ParseTaskAbort(const Record& record) {
	TaskAbortSignal abort;
	abort.record_id = record.id;
	abort.task_id = TagValue(record, "e").value_or("");
	abort.observed_at = record.created_at;
	abort.source = Share(record);
	return abort;
}

Lesson ParseLesson(const Record& record) {
	Lesson lesson;
	lesson.id = record.id;
	lesson.agent_id = record.creator;
	lesson.project_identity = ProjectReference(record);
	lesson.created_at = record.created_at;
	lesson.lesson_type = TagValue(record, "lesson-type");
	lesson.agent_name = TagValue(record, "agent-name");

	estuary::LessonPayload payload;
	if (DecodeJsonContent(record.content, &payload)) {
		lesson.title = payload.has_title() ? payload.title() : kUntitledLesson;
		lesson.content = payload.has_content() ? payload.content() : record.content;
	} else {
		lesson.title = TagValue(record, "title").value_or(kUntitledLesson);
		lesson.content = record.content;
	}
	lesson.source = Share(record);
	return lesson;
}

Reply ParseReply(const Record& record) {
	Reply reply;
	reply.id = record.id;
	reply.author = record.creator;
	reply.root_id = ReplyRoot(record);
	reply.root_kind = ParseKindTag(record);
	reply.project_identity = ProjectReference(record);
	reply.content = record.content;
	reply.created_at = record.created_at;
	reply.mentioned_agents = TagValues(record, "p");
	reply.status = TagValue(record, "status");
	reply.phase = TagValue(record, "phase");
	reply.source = Share(record);
	return reply;
}

LlmConfigChange ParseLlmConfigChange(const Record& record) {
	LlmConfigChange change;
	change.project_identity = ProjectReference(record);
	change.observed_at = record.created_at;

	estuary::LlmConfigPayload payload;
	if (DecodeJsonContent(record.content, &payload)) {
		if (payload.has_model()) change.model = payload.model();
		if (payload.has_temperature()) change.temperature = payload.temperature();
		if (payload.has_max_tokens()) change.max_tokens = payload.max_tokens();
		if (payload.has_provider()) change.provider = payload.provider();
	} else {
		VLOG(2) << "[Parsers] LLM config record " << record.id << " has no JSON payload";
	}
	change.source = Share(record);
	return change;
}

}  // namespace Estuary
