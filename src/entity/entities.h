#ifndef ESTUARY_SRC_ENTITY_ENTITIES_H_
#define ESTUARY_SRC_ENTITY_ENTITIES_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "record/record.h"

namespace Estuary {

inline constexpr char kUntitledTask[] = "Untitled Task";
inline constexpr char kUntitledAgent[] = "Untitled Agent";
inline constexpr char kUntitledLesson[] = "Untitled Lesson";
inline constexpr char kUntitledConversation[] = "Untitled";
inline constexpr int64_t kDefaultTypingValiditySeconds = 60;

/*
 * Entities are derived from records only. Each keeps the record it was last
 * refreshed from in `source`; equality compares derived fields, not sources.
 */

struct Project {
	std::string identity;	// kind:creator:slug
	std::string creator_id;
	std::string slug;
	std::string title;
	std::optional<std::string> description;
	std::optional<std::string> repo_url;
	std::optional<std::string> image_url;
	std::vector<std::string> hashtags;
	std::vector<std::string> agent_ids;
	std::vector<std::string> tool_ids;

	std::shared_ptr<const Record> source;
};

struct Conversation {
	std::string id;
	std::string author;
	std::string project_identity;
	std::optional<std::string> title;
	std::string content;
	int64_t created_at = 0;
	std::vector<std::string> mentioned_agents;
	int reply_count = 0;

	// Title tag, else first content line, else "Untitled".
	std::string DisplayTitle() const;

	std::shared_ptr<const Record> source;
};

struct Task {
	std::string id;
	std::string author;
	std::string project_identity;
	std::string title;
	std::string content;
	std::optional<std::string> status;
	std::vector<std::string> assignees;
	std::optional<std::string> branch;
	std::optional<std::string> related_conversation_id;
	int64_t created_at = 0;

	bool IsAssignedTo(const std::string& pubkey) const;

	std::shared_ptr<const Record> source;
};

struct AgentProfile {
	std::string id;
	std::string creator_id;
	std::string display_name;
	std::string instructions_markdown;
	std::optional<std::string> description;
	std::optional<std::string> role;
	std::optional<std::string> usage_criteria;
	std::optional<std::string> version;
	std::vector<std::string> labels;

	// ["p", id]
	Tag MentionTag() const;

	std::shared_ptr<const Record> source;
};

struct AgentPresence {
	std::string agent_id;
	std::string slug;
	std::string name;
};

struct ProjectStatus {
	std::string project_identity;
	int64_t observed_at = 0;
	std::vector<AgentPresence> available_agents;

	std::shared_ptr<const Record> source;
};

struct TypingSignal {
	std::string conversation_id;
	std::string project_identity;
	std::string creator;
	std::string message;
	int64_t observed_at = 0;
	std::optional<std::string> phase;
	bool stopped = false;	// explicit stop record

	/**
	 * Pure function of the clock: false once `validity` has elapsed since
	 * observed_at, or when the signal is an explicit stop. Never cached.
	 */
	bool IsValid(std::chrono::system_clock::time_point now = std::chrono::system_clock::now(),
			std::chrono::seconds validity = std::chrono::seconds(kDefaultTypingValiditySeconds)) const;

	std::shared_ptr<const Record> source;
};

struct TaskAbortSignal {
	std::string record_id;
	std::string task_id;
	int64_t observed_at = 0;

	std::shared_ptr<const Record> source;
};

struct Lesson {
	std::string id;
	std::string agent_id;
	std::string project_identity;
	std::string title;
	std::string content;
	int64_t created_at = 0;
	std::optional<std::string> lesson_type;
	std::optional<std::string> agent_name;

	std::shared_ptr<const Record> source;
};

// Thread reply: conversation replies, lesson comments and task status updates.
struct Reply {
	std::string id;
	std::string author;
	std::string root_id;
	std::optional<int> root_kind;
	std::string project_identity;
	std::string content;
	int64_t created_at = 0;
	std::vector<std::string> mentioned_agents;
	std::optional<std::string> status;
	std::optional<std::string> phase;

	std::shared_ptr<const Record> source;
};

struct LlmConfigChange {
	std::string project_identity;
	int64_t observed_at = 0;
	std::optional<std::string> model;
	std::optional<double> temperature;
	std::optional<int> max_tokens;
	std::optional<std::string> provider;

	std::shared_ptr<const Record> source;
};

bool operator==(const Project& a, const Project& b);
bool operator==(const Conversation& a, const Conversation& b);
bool operator==(const Task& a, const Task& b);
bool operator==(const AgentProfile& a, const AgentProfile& b);
bool operator==(const AgentPresence& a, const AgentPresence& b);
bool operator==(const ProjectStatus& a, const ProjectStatus& b);
bool operator==(const TypingSignal& a, const TypingSignal& b);
bool operator==(const TaskAbortSignal& a, const TaskAbortSignal& b);
bool operator==(const Lesson& a, const Lesson& b);
bool operator==(const Reply& a, const Reply& b);
bool operator==(const LlmConfigChange& a, const LlmConfigChange& b);

// Creation time of the record an entity was derived from; 0 without source.
template <typename Entity>
int64_t SourceTime(const Entity& entity) {
	return entity.source ? entity.source->created_at : 0;
}

}  // namespace Estuary

#endif  // ESTUARY_SRC_ENTITY_ENTITIES_H_
