#include "entities.h"

#include <algorithm>

namespace Estuary {

std::string Conversation::DisplayTitle() const {
	if (title.has_value() && !title->empty()) {
		return *title;
	}
	std::string line = FirstLine(content);
	return line.empty() ? kUntitledConversation : line;
}

bool Task::IsAssignedTo(const std::string& pubkey) const {
	return std::find(assignees.begin(), assignees.end(), pubkey) != assignees.end();
}

Tag AgentProfile::MentionTag() const {
	return {"p", id};
}

bool TypingSignal::IsValid(std::chrono::system_clock::time_point now, std::chrono::seconds validity) const {
	if (stopped) {
		return false;
	}
	const std::chrono::system_clock::time_point observed{std::chrono::seconds(observed_at)};
	return now - observed < validity;
}

bool operator==(const Project& a, const Project& b) {
	return a.identity == b.identity &&
		a.creator_id == b.creator_id &&
		a.slug == b.slug &&
		a.title == b.title &&
		a.description == b.description &&
		a.repo_url == b.repo_url &&
		a.image_url == b.image_url &&
		a.hashtags == b.hashtags &&
		a.agent_ids == b.agent_ids &&
		a.tool_ids == b.tool_ids;
}

bool operator==(const Conversation& a, const Conversation& b) {
	return a.id == b.id &&
		a.author == b.author &&
		a.project_identity == b.project_identity &&
		a.title == b.title &&
		a.content == b.content &&
		a.created_at == b.created_at &&
		a.mentioned_agents == b.mentioned_agents &&
		a.reply_count == b.reply_count;
}

bool operator==(const Task& a, const Task& b) {
	return a.id == b.id &&
		a.author == b.author &&
		a.project_identity == b.project_identity &&
		a.title == b.title &&
		a.content == b.content &&
		a.status == b.status &&
		a.assignees == b.assignees &&
		a.branch == b.branch &&
		a.related_conversation_id == b.related_conversation_id &&
		a.created_at == b.created_at;
}

bool operator==(const AgentProfile& a, const AgentProfile& b) {
	return a.id == b.id &&
		a.creator_id == b.creator_id &&
		a.display_name == b.display_name &&
		a.instructions_markdown == b.instructions_markdown &&
		a.description == b.description &&
		a.role == b.role &&
		a.usage_criteria == b.usage_criteria &&
		a.version == b.version &&
		a.labels == b.labels;
}

bool operator==(const AgentPresence& a, const AgentPresence& b) {
	return a.agent_id == b.agent_id && a.slug == b.slug && a.name == b.name;
}

bool operator==(const ProjectStatus& a, const ProjectStatus& b) {
	return a.project_identity == b.project_identity &&
		a.observed_at == b.observed_at &&
		a.available_agents == b.available_agents;
}

bool operator==(const TypingSignal& a, const TypingSignal& b) {
	return a.conversation_id == b.conversation_id &&
		a.project_identity == b.project_identity &&
		a.creator == b.creator &&
		a.message == b.message &&
		a.observed_at == b.observed_at &&
		a.phase == b.phase &&
		a.stopped == b.stopped;
}

bool operator==(const TaskAbortSignal& a, const TaskAbortSignal& b) {
	return a.record_id == b.record_id && a.task_id == b.task_id && a.observed_at == b.observed_at;
}

bool operator==(const Lesson& a, const Lesson& b) {
	return a.id == b.id &&
		a.agent_id == b.agent_id &&
		a.project_identity == b.project_identity &&
		a.title == b.title &&
		a.content == b.content &&
		a.created_at == b.created_at &&
		a.lesson_type == b.lesson_type &&
		a.agent_name == b.agent_name;
}

bool operator==(const Reply& a, const Reply& b) {
	return a.id == b.id &&
		a.author == b.author &&
		a.root_id == b.root_id &&
		a.root_kind == b.root_kind &&
		a.project_identity == b.project_identity &&
		a.content == b.content &&
		a.created_at == b.created_at &&
		a.mentioned_agents == b.mentioned_agents &&
		a.status == b.status &&
		a.phase == b.phase;
}

bool operator==(const LlmConfigChange& a, const LlmConfigChange& b) {
	return a.project_identity == b.project_identity &&
		a.observed_at == b.observed_at &&
		a.model == b.model &&
		a.temperature == b.temperature &&
		a.max_tokens == b.max_tokens &&
		a.provider == b.provider;
}

}  // namespace Estuary
