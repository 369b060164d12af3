#include <gtest/gtest.h>
#include "../../src/entity/parsers.h"
#include "../../src/common/event_kinds.h"
#include <chrono>

using namespace Estuary;
using namespace std::chrono_literals;

namespace {

Record MakeRecord(int kind, std::vector<Tag> tags, std::string content = "", int64_t created_at = 100) {
	Record record;
	record.id = "id-" + std::to_string(kind);
	record.creator = "pk1";
	record.kind = kind;
	record.created_at = created_at;
	record.content = std::move(content);
	record.tags = std::move(tags);
	return record;
}

}  // namespace

TEST(ParsersTest, ProjectFields) {
	Record record = MakeRecord(kKindProject, {
		{"d", "proj1"},
		{"title", "Alpha"},
		{"repo", "https://git.example/alpha"},
		{"picture", "https://img.example/a.png"},
		{"hashtags", "rust", "cpp"},
		{"hashtags", "ignored"},
		{"agent", "agent-1"},
		{"agent", "agent-2"},
		{"mcp", "tool-1"},
	}, "Project description");

	Project project = ParseProject(record);
	EXPECT_EQ(project.identity, "31933:pk1:proj1");
	EXPECT_EQ(project.slug, "proj1");
	EXPECT_EQ(project.title, "Alpha");
	EXPECT_EQ(project.description, "Project description");
	EXPECT_EQ(project.repo_url, "https://git.example/alpha");
	EXPECT_EQ(project.image_url, "https://img.example/a.png");
	EXPECT_EQ(project.hashtags, (std::vector<std::string>{"rust", "cpp"}));
	EXPECT_EQ(project.agent_ids, (std::vector<std::string>{"agent-1", "agent-2"}));
	EXPECT_EQ(project.tool_ids, (std::vector<std::string>{"tool-1"}));
	ASSERT_NE(project.source, nullptr);
	EXPECT_EQ(project.source->id, record.id);
}

TEST(ParsersTest, ProjectDefaults) {
	Project project = ParseProject(MakeRecord(kKindProject, {{"d", "proj1"}}));
	EXPECT_EQ(project.title, "proj1");
	EXPECT_FALSE(project.description.has_value());
	EXPECT_TRUE(project.hashtags.empty());

	Project anonymous = ParseProject(MakeRecord(kKindProject, {}));
	EXPECT_EQ(anonymous.identity, "31933:pk1:");
	EXPECT_EQ(anonymous.title, "");
}

TEST(ParsersTest, ConversationDisplayTitleFallbacks) {
	Conversation titled = ParseConversation(MakeRecord(kKindConversation, {{"title", "Plan"}}, "body"));
	EXPECT_EQ(titled.DisplayTitle(), "Plan");

	Conversation untitled = ParseConversation(MakeRecord(kKindConversation, {}, "first line\nsecond"));
	EXPECT_FALSE(untitled.title.has_value());
	EXPECT_EQ(untitled.DisplayTitle(), "first line");

	Conversation empty = ParseConversation(MakeRecord(kKindConversation, {}));
	EXPECT_EQ(empty.DisplayTitle(), "Untitled");
}

TEST(ParsersTest, ConversationReferencesProjectAndAgents) {
	Conversation conversation = ParseConversation(MakeRecord(kKindConversation, {
		{"a", "31933:pk1:proj1:wss://hint"},
		{"p", "agent-1"},
		{"p", "agent-2"},
	}, "hi"));
	EXPECT_EQ(conversation.project_identity, "31933:pk1:proj1");
	EXPECT_EQ(conversation.mentioned_agents, (std::vector<std::string>{"agent-1", "agent-2"}));
	EXPECT_EQ(conversation.created_at, 100);
}

TEST(ParsersTest, ConversationMetadata) {
	Conversation patch = ParseConversationMetadata(MakeRecord(kKindConversationMetadata, {
		{"e", "conv-1"},
		{"title", "Backfilled"},
		{"reply-count", "7"},
	}));
	EXPECT_EQ(patch.id, "conv-1");
	EXPECT_EQ(patch.title, "Backfilled");
	EXPECT_EQ(patch.reply_count, 7);

	Conversation malformed = ParseConversationMetadata(MakeRecord(kKindConversationMetadata, {
		{"e", "conv-1"},
		{"reply-count", "many"},
	}));
	EXPECT_EQ(malformed.reply_count, 0);
	EXPECT_FALSE(malformed.title.has_value());
}

TEST(ParsersTest, TaskDefaults) {
	Task task = ParseTask(MakeRecord(kKindTask, {}, "do it"));
	EXPECT_EQ(task.title, "Untitled Task");
	EXPECT_EQ(task.content, "do it");
	EXPECT_FALSE(task.status.has_value());
	EXPECT_TRUE(task.assignees.empty());
	EXPECT_FALSE(task.branch.has_value());
	EXPECT_FALSE(task.related_conversation_id.has_value());
}

TEST(ParsersTest, TaskFields) {
	Task task = ParseTask(MakeRecord(kKindTask, {
		{"a", "31933:pk1:proj1"},
		{"title", "Fix build"},
		{"status", "in-progress"},
		{"p", "agent-1"},
		{"branch", "fix/build"},
		{"e", "conv-9"},
	}));
	EXPECT_EQ(task.project_identity, "31933:pk1:proj1");
	EXPECT_EQ(task.title, "Fix build");
	EXPECT_EQ(task.status, "in-progress");
	EXPECT_TRUE(task.IsAssignedTo("agent-1"));
	EXPECT_FALSE(task.IsAssignedTo("agent-2"));
	EXPECT_EQ(task.branch, "fix/build");
	EXPECT_EQ(task.related_conversation_id, "conv-9");
}

TEST(ParsersTest, TaskUpdateTargetsRoot) {
	Task patch = ParseTaskUpdate(MakeRecord(kKindThreadReply, {
		{"E", "task-1"},
		{"e", "other"},
		{"K", "1934"},
		{"status", "done"},
	}, "finished"));
	EXPECT_EQ(patch.id, "task-1");
	EXPECT_EQ(patch.status, "done");
	EXPECT_EQ(patch.title, "");
}

TEST(ParsersTest, AgentProfileIdentityFollowsSupersededProfile) {
	Record original = MakeRecord(kKindAgentProfile, {{"title", "Reviewer"}}, "Review code");
	original.id = "profile-1";
	EXPECT_EQ(AgentProfileIdentity(original), "pk1:profile-1");

	Record update = MakeRecord(kKindAgentProfile, {{"title", "Reviewer v2"}, {"e", "profile-1"}});
	update.id = "profile-2";
	EXPECT_EQ(AgentProfileIdentity(update), "pk1:profile-1");
	EXPECT_EQ(ParseAgentProfile(update).id, "profile-1");
}

TEST(ParsersTest, AgentProfileFieldsAndDefaults) {
	AgentProfile agent = ParseAgentProfile(MakeRecord(kKindAgentProfile, {
		{"description", "Reviews PRs"},
		{"role", "reviewer"},
		{"use-criteria", "when code changes"},
		{"ver", "2"},
		{"t", "review"},
		{"t", "code"},
	}, "# Instructions"));
	EXPECT_EQ(agent.display_name, "Untitled Agent");
	EXPECT_EQ(agent.instructions_markdown, "# Instructions");
	EXPECT_EQ(agent.description, "Reviews PRs");
	EXPECT_EQ(agent.role, "reviewer");
	EXPECT_EQ(agent.usage_criteria, "when code changes");
	EXPECT_EQ(agent.version, "2");
	EXPECT_EQ(agent.labels, (std::vector<std::string>{"review", "code"}));
	EXPECT_EQ(agent.MentionTag(), (Tag{"p", agent.id}));
}

TEST(ParsersTest, ProjectStatusSkipsShortAgentGroups) {
	ProjectStatus status = ParseProjectStatus(MakeRecord(kKindProjectStatus, {
		{"a", "31933:pk1:proj1"},
		{"agent", "pk-a", "planner"},
		{"agent", "pk-b"},
		{"agent", "pk-c", "coder", "extra"},
	}, "", 60));
	EXPECT_EQ(status.project_identity, "31933:pk1:proj1");
	EXPECT_EQ(status.observed_at, 60);
	ASSERT_EQ(status.available_agents.size(), 2u);
	EXPECT_EQ(status.available_agents[0], (AgentPresence{"pk-a", "planner", "planner"}));
	EXPECT_EQ(status.available_agents[1].agent_id, "pk-c");
	EXPECT_EQ(status.available_agents[1].name, "coder");
}

TEST(ParsersTest, TypingSignalValidityWindow) {
	const int64_t observed = 1700000000;
	TypingSignal signal = ParseTypingSignal(MakeRecord(kKindTypingStart, {
		{"e", "conv-1"},
		{"phase", "thinking"},
	}, "typing...", observed));
	EXPECT_EQ(signal.conversation_id, "conv-1");
	EXPECT_EQ(signal.phase, "thinking");
	EXPECT_FALSE(signal.stopped);

	const std::chrono::system_clock::time_point at{std::chrono::seconds(observed)};
	EXPECT_TRUE(signal.IsValid(at + 59s));
	EXPECT_FALSE(signal.IsValid(at + 61s));
	EXPECT_FALSE(signal.IsValid(at + 60s));
	EXPECT_TRUE(signal.IsValid(at + 100s, 120s));
}

TEST(ParsersTest, TypingStopIsNeverValid) {
	const int64_t observed = 1700000000;
	TypingSignal stop = ParseTypingSignal(MakeRecord(kKindTypingStop, {{"e", "conv-1"}}, "", observed));
	EXPECT_TRUE(stop.stopped);
	EXPECT_FALSE(stop.IsValid(std::chrono::system_clock::time_point{std::chrono::seconds(observed)}));
}

TEST(ParsersTest, TaskAbort) {
	TaskAbortSignal abort = ParseTaskAbort(MakeRecord(kKindTaskAbort, {{"e", "task-1", "", "task"}}, "abort"));
	EXPECT_EQ(abort.task_id, "task-1");
	EXPECT_EQ(abort.record_id, "id-24133");
}

TEST(ParsersTest, LessonFromJsonContent) {
	Lesson lesson = ParseLesson(MakeRecord(kKindAgentLesson, {{"title", "Tag title"}},
		R"({"title":"Use RAII","content":"Wrap handles in owners","extra":1})"));
	EXPECT_EQ(lesson.title, "Use RAII");
	EXPECT_EQ(lesson.content, "Wrap handles in owners");
}

TEST(ParsersTest, LessonJsonMissingFields) {
	const std::string raw = R"({"content":"only content"})";
	Lesson no_title = ParseLesson(MakeRecord(kKindAgentLesson, {{"title", "ignored"}}, raw));
	EXPECT_EQ(no_title.title, "Untitled Lesson");
	EXPECT_EQ(no_title.content, "only content");

	const std::string title_only = R"({"title":"Just a title"})";
	Lesson no_content = ParseLesson(MakeRecord(kKindAgentLesson, {}, title_only));
	EXPECT_EQ(no_content.title, "Just a title");
	EXPECT_EQ(no_content.content, title_only);
}

TEST(ParsersTest, LessonFallsBackToRawText) {
	Lesson tagged = ParseLesson(MakeRecord(kKindAgentLesson, {{"title", "From tag"}}, "plain text lesson"));
	EXPECT_EQ(tagged.title, "From tag");
	EXPECT_EQ(tagged.content, "plain text lesson");

	Lesson broken = ParseLesson(MakeRecord(kKindAgentLesson, {}, "{not json"));
	EXPECT_EQ(broken.title, "Untitled Lesson");
	EXPECT_EQ(broken.content, "{not json");
}

TEST(ParsersTest, ReplyRootPrefersUppercaseTag) {
	Reply reply = ParseReply(MakeRecord(kKindThreadReply, {
		{"e", "parent"},
		{"E", "root"},
		{"K", "11"},
		{"p", "agent-1"},
	}, "hello"));
	EXPECT_EQ(reply.root_id, "root");
	EXPECT_EQ(reply.root_kind, 11);
	EXPECT_EQ(reply.mentioned_agents, (std::vector<std::string>{"agent-1"}));

	Reply legacy = ParseReply(MakeRecord(kKindThreadReply, {{"e", "parent"}, {"K", "x"}}));
	EXPECT_EQ(legacy.root_id, "parent");
	EXPECT_FALSE(legacy.root_kind.has_value());
}

TEST(ParsersTest, LlmConfigChange) {
	LlmConfigChange change = ParseLlmConfigChange(MakeRecord(kKindLlmConfigChange, {{"a", "31933:pk1:proj1"}},
		R"({"model":"sonnet","temperature":0.5,"maxTokens":2048,"provider":"anthropic"})"));
	EXPECT_EQ(change.project_identity, "31933:pk1:proj1");
	EXPECT_EQ(change.model, "sonnet");
	EXPECT_DOUBLE_EQ(change.temperature.value_or(0), 0.5);
	EXPECT_EQ(change.max_tokens, 2048);
	EXPECT_EQ(change.provider, "anthropic");

	LlmConfigChange invalid = ParseLlmConfigChange(MakeRecord(kKindLlmConfigChange, {}, "model=sonnet"));
	EXPECT_FALSE(invalid.model.has_value());
	EXPECT_FALSE(invalid.temperature.has_value());
	EXPECT_FALSE(invalid.max_tokens.has_value());
	EXPECT_FALSE(invalid.provider.has_value());
}
