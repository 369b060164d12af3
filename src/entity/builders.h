#ifndef ESTUARY_SRC_ENTITY_BUILDERS_H_
#define ESTUARY_SRC_ENTITY_BUILDERS_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "record/record.h"

namespace Estuary {

/*
 * Builders turn a local mutation intent into an unsigned record (empty id)
 * using exactly the tag vocabulary the parsers read. They are pure: the same
 * intent and context always give the same record. Signing and transmission
 * happen at the transport boundary.
 */

struct BuildContext {
	std::string creator;
	int64_t created_at = 0;
};

struct ProjectIntent {
	std::string slug;
	std::string title;
	std::optional<std::string> description;
	std::optional<std::string> repo_url;
	std::optional<std::string> image_url;
	std::vector<std::string> hashtags;
	std::vector<std::string> agent_ids;
	std::vector<std::string> tool_ids;
};

struct ConversationIntent {
	std::string project_identity;
	std::optional<std::string> title;
	std::string content;
	std::vector<std::string> mentioned_agents;
};

struct ConversationMetadataIntent {
	std::string conversation_id;
	std::string project_identity;
	std::optional<std::string> title;
	std::optional<int> reply_count;
};

// Reply in a thread: conversation replies and lesson comments.
struct ReplyIntent {
	std::string root_id;
	int root_kind = 0;
	std::string project_identity;
	std::string content;
	std::vector<std::string> mentioned_agents;
};

struct TaskIntent {
	std::string project_identity;
	std::string title;
	std::string content;
	std::optional<std::string> status;
	std::vector<std::string> assignees;
	std::optional<std::string> branch;
	std::optional<std::string> conversation_id;
};

struct TaskStatusUpdateIntent {
	std::string task_id;
	std::string project_identity;
	std::string message;
	std::optional<std::string> title;
	std::optional<std::string> status;
	std::vector<std::string> assignees;
	std::optional<std::string> branch;
};

struct AgentProfileIntent {
	std::string display_name;
	std::string instructions_markdown;
	std::optional<std::string> description;
	std::optional<std::string> role;
	std::optional<std::string> usage_criteria;
	std::optional<std::string> version;
	std::vector<std::string> labels;
	std::optional<std::string> supersedes;	// id of the profile being updated
};

struct AgentPresenceIntent {
	std::string pubkey;
	std::string slug;
};

struct ProjectStatusIntent {
	std::string project_identity;
	std::vector<AgentPresenceIntent> agents;
};

struct TypingIntent {
	std::string conversation_id;
	std::string project_identity;
	std::string message;
	std::optional<std::string> phase;
	bool stop = false;
};

struct TaskAbortIntent {
	std::string task_id;
};

struct LessonIntent {
	std::string project_identity;
	std::string title;
	std::string content;
	std::optional<std::string> lesson_type;
	std::optional<std::string> agent_name;
};

struct LlmConfigIntent {
	std::string project_identity;
	std::optional<std::string> model;
	std::optional<double> temperature;
	std::optional<int> max_tokens;
	std::optional<std::string> provider;
};

Record BuildProject(const ProjectIntent& intent, const BuildContext& ctx);
Record BuildConversation(const ConversationIntent& intent, const BuildContext& ctx);
Record BuildConversationMetadata(const ConversationMetadataIntent& intent, const BuildContext& ctx);
Record BuildReply(const ReplyIntent& intent, const BuildContext& ctx);
// Thread reply rooted at a lesson; root_kind is forced to the lesson kind.
Record BuildLessonComment(const ReplyIntent& intent, const BuildContext& ctx);
Record BuildTask(const TaskIntent& intent, const BuildContext& ctx);
Record BuildTaskStatusUpdate(const TaskStatusUpdateIntent& intent, const BuildContext& ctx);
Record BuildAgentProfile(const AgentProfileIntent& intent, const BuildContext& ctx);
Record BuildProjectStatus(const ProjectStatusIntent& intent, const BuildContext& ctx);
Record BuildTyping(const TypingIntent& intent, const BuildContext& ctx);
Record BuildTaskAbort(const TaskAbortIntent& intent, const BuildContext& ctx);
Record BuildLesson(const LessonIntent& intent, const BuildContext& ctx);
Record BuildLlmConfigChange(const LlmConfigIntent& intent, const BuildContext& ctx);

}  // namespace Estuary

#endif  // ESTUARY_SRC_ENTITY_BUILDERS_H_
