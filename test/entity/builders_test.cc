#include <gtest/gtest.h>
#include "../../src/entity/builders.h"
#include "../../src/entity/parsers.h"
#include "../../src/common/event_kinds.h"

using namespace Estuary;

/*
 * Every builder must emit exactly the tags its parser reads: parsing a built
 * record gives back the intent's values.
 */
class BuildersTest : public ::testing::Test {
protected:
	void SetUp() override {
		ctx_.creator = "pk1";
		ctx_.created_at = 1700000000;
	}

	// Records are unsigned until they reach the transport; tests fake an id.
	Record Signed(Record record, const std::string& id = "built-1") {
		record.id = id;
		return record;
	}

	BuildContext ctx_;
};

TEST_F(BuildersTest, RecordsAreUnsigned) {
	Record record = BuildConversation(ConversationIntent{}, ctx_);
	EXPECT_TRUE(record.id.empty());
	EXPECT_EQ(record.creator, "pk1");
	EXPECT_EQ(record.created_at, 1700000000);
}

TEST_F(BuildersTest, Project) {
	ProjectIntent intent;
	intent.slug = "proj1";
	intent.title = "Alpha";
	intent.description = "Desc";
	intent.repo_url = "https://git.example/alpha";
	intent.image_url = "https://img.example/a.png";
	intent.hashtags = {"cpp", "sync"};
	intent.agent_ids = {"agent-1", "agent-2"};
	intent.tool_ids = {"tool-1"};

	Record record = BuildProject(intent, ctx_);
	EXPECT_EQ(record.kind, kKindProject);
	Project project = ParseProject(record);
	EXPECT_EQ(project.identity, "31933:pk1:proj1");
	EXPECT_EQ(project.slug, intent.slug);
	EXPECT_EQ(project.title, intent.title);
	EXPECT_EQ(project.description, intent.description);
	EXPECT_EQ(project.repo_url, intent.repo_url);
	EXPECT_EQ(project.image_url, intent.image_url);
	EXPECT_EQ(project.hashtags, intent.hashtags);
	EXPECT_EQ(project.agent_ids, intent.agent_ids);
	EXPECT_EQ(project.tool_ids, intent.tool_ids);
}

TEST_F(BuildersTest, ProjectWithoutOptionalFields) {
	ProjectIntent intent;
	intent.slug = "bare";
	intent.title = "Bare";
	Project project = ParseProject(BuildProject(intent, ctx_));
	EXPECT_FALSE(project.description.has_value());
	EXPECT_FALSE(project.repo_url.has_value());
	EXPECT_TRUE(project.hashtags.empty());
}

TEST_F(BuildersTest, Conversation) {
	ConversationIntent intent{"31933:pk1:proj1", std::string("Kickoff"), "Let's start", {"agent-1"}};
	Conversation conversation = ParseConversation(Signed(BuildConversation(intent, ctx_)));
	EXPECT_EQ(conversation.id, "built-1");
	EXPECT_EQ(conversation.author, "pk1");
	EXPECT_EQ(conversation.project_identity, intent.project_identity);
	EXPECT_EQ(conversation.title, intent.title);
	EXPECT_EQ(conversation.content, intent.content);
	EXPECT_EQ(conversation.mentioned_agents, intent.mentioned_agents);
	EXPECT_EQ(conversation.created_at, ctx_.created_at);
}

TEST_F(BuildersTest, ConversationMetadata) {
	ConversationMetadataIntent intent{"conv-1", "31933:pk1:proj1", std::string("Renamed"), 12};
	Record record = BuildConversationMetadata(intent, ctx_);
	EXPECT_EQ(record.kind, kKindConversationMetadata);
	Conversation patch = ParseConversationMetadata(record);
	EXPECT_EQ(patch.id, intent.conversation_id);
	EXPECT_EQ(patch.title, intent.title);
	EXPECT_EQ(patch.reply_count, 12);
}

TEST_F(BuildersTest, ConversationReply) {
	ReplyIntent intent{"conv-1", kKindConversation, "31933:pk1:proj1", "Sounds good", {"agent-2"}};
	Record record = BuildReply(intent, ctx_);
	EXPECT_EQ(record.kind, kKindThreadReply);
	Reply reply = ParseReply(Signed(record));
	EXPECT_EQ(reply.root_id, intent.root_id);
	EXPECT_EQ(reply.root_kind, kKindConversation);
	EXPECT_EQ(reply.project_identity, intent.project_identity);
	EXPECT_EQ(reply.content, intent.content);
	EXPECT_EQ(reply.mentioned_agents, intent.mentioned_agents);
}

TEST_F(BuildersTest, LessonComment) {
	ReplyIntent intent{"lesson-1", 0, "", "Good point", {}};
	Reply reply = ParseReply(Signed(BuildLessonComment(intent, ctx_)));
	EXPECT_EQ(reply.root_id, "lesson-1");
	EXPECT_EQ(reply.root_kind, kKindAgentLesson);
	EXPECT_EQ(reply.content, "Good point");
	EXPECT_EQ(reply.project_identity, "");
}

TEST_F(BuildersTest, Task) {
	TaskIntent intent;
	intent.project_identity = "31933:pk1:proj1";
	intent.title = "Write tests";
	intent.content = "Cover the store";
	intent.status = "pending";
	intent.assignees = {"agent-1"};
	intent.branch = "tests";
	intent.conversation_id = "conv-1";

	Task task = ParseTask(Signed(BuildTask(intent, ctx_)));
	EXPECT_EQ(task.project_identity, intent.project_identity);
	EXPECT_EQ(task.title, intent.title);
	EXPECT_EQ(task.content, intent.content);
	EXPECT_EQ(task.status, intent.status);
	EXPECT_EQ(task.assignees, intent.assignees);
	EXPECT_EQ(task.branch, intent.branch);
	EXPECT_EQ(task.related_conversation_id, intent.conversation_id);
}

TEST_F(BuildersTest, TaskStatusUpdate) {
	TaskStatusUpdateIntent intent;
	intent.task_id = "task-1";
	intent.project_identity = "31933:pk1:proj1";
	intent.message = "Merged";
	intent.status = "done";
	intent.assignees = {"agent-3"};
	intent.branch = "main";

	Record record = BuildTaskStatusUpdate(intent, ctx_);
	Reply reply = ParseReply(Signed(record));
	EXPECT_EQ(reply.root_id, "task-1");
	EXPECT_EQ(reply.root_kind, kKindTask);

	Task patch = ParseTaskUpdate(record);
	EXPECT_EQ(patch.id, intent.task_id);
	EXPECT_EQ(patch.status, intent.status);
	EXPECT_EQ(patch.assignees, intent.assignees);
	EXPECT_EQ(patch.branch, intent.branch);
	EXPECT_EQ(patch.title, "");
}

TEST_F(BuildersTest, AgentProfile) {
	AgentProfileIntent intent;
	intent.display_name = "Planner";
	intent.instructions_markdown = "# Plan things";
	intent.description = "Plans work";
	intent.role = "planner";
	intent.usage_criteria = "new projects";
	intent.version = "3";
	intent.labels = {"planning"};

	AgentProfile agent = ParseAgentProfile(Signed(BuildAgentProfile(intent, ctx_), "profile-1"));
	EXPECT_EQ(agent.id, "profile-1");
	EXPECT_EQ(agent.display_name, intent.display_name);
	EXPECT_EQ(agent.instructions_markdown, intent.instructions_markdown);
	EXPECT_EQ(agent.description, intent.description);
	EXPECT_EQ(agent.role, intent.role);
	EXPECT_EQ(agent.usage_criteria, intent.usage_criteria);
	EXPECT_EQ(agent.version, intent.version);
	EXPECT_EQ(agent.labels, intent.labels);

	intent.supersedes = "profile-1";
	Record update = Signed(BuildAgentProfile(intent, ctx_), "profile-2");
	EXPECT_EQ(AgentProfileIdentity(update), "pk1:profile-1");
}

TEST_F(BuildersTest, ProjectStatus) {
	ProjectStatusIntent intent{"31933:pk1:proj1", {{"pk-a", "planner"}, {"pk-b", "coder"}}};
	ProjectStatus status = ParseProjectStatus(BuildProjectStatus(intent, ctx_));
	EXPECT_EQ(status.project_identity, intent.project_identity);
	EXPECT_EQ(status.observed_at, ctx_.created_at);
	ASSERT_EQ(status.available_agents.size(), 2u);
	EXPECT_EQ(status.available_agents[0].agent_id, "pk-a");
	EXPECT_EQ(status.available_agents[0].slug, "planner");
	EXPECT_EQ(status.available_agents[1].agent_id, "pk-b");
	EXPECT_EQ(status.available_agents[1].slug, "coder");
}

TEST_F(BuildersTest, TypingStartAndStop) {
	TypingIntent intent{"conv-1", "31933:pk1:proj1", "drafting", std::string("writing"), false};
	Record start = BuildTyping(intent, ctx_);
	EXPECT_EQ(start.kind, kKindTypingStart);
	TypingSignal signal = ParseTypingSignal(start);
	EXPECT_EQ(signal.conversation_id, intent.conversation_id);
	EXPECT_EQ(signal.project_identity, intent.project_identity);
	EXPECT_EQ(signal.message, intent.message);
	EXPECT_EQ(signal.phase, intent.phase);
	EXPECT_FALSE(signal.stopped);

	intent.stop = true;
	Record stop = BuildTyping(intent, ctx_);
	EXPECT_EQ(stop.kind, kKindTypingStop);
	EXPECT_TRUE(ParseTypingSignal(stop).stopped);
}

TEST_F(BuildersTest, TaskAbort) {
	Record record = Signed(BuildTaskAbort(TaskAbortIntent{"task-1"}, ctx_), "abort-1");
	EXPECT_EQ(record.kind, kKindTaskAbort);
	TaskAbortSignal abort = ParseTaskAbort(record);
	EXPECT_EQ(abort.task_id, "task-1");
	EXPECT_EQ(abort.record_id, "abort-1");
}

TEST_F(BuildersTest, Lesson) {
	LessonIntent intent{"31933:pk1:proj1", "Prefer RAII", "Own every handle", std::string("pattern"),
		std::string("planner")};
	Record record = Signed(BuildLesson(intent, ctx_));
	EXPECT_EQ(TagValue(record, "title"), intent.title);
	Lesson lesson = ParseLesson(record);
	EXPECT_EQ(lesson.title, intent.title);
	EXPECT_EQ(lesson.content, intent.content);
	EXPECT_EQ(lesson.project_identity, intent.project_identity);
	EXPECT_EQ(lesson.lesson_type, intent.lesson_type);
	EXPECT_EQ(lesson.agent_name, intent.agent_name);
}

TEST_F(BuildersTest, LlmConfigChange) {
	LlmConfigIntent intent{"31933:pk1:proj1", std::string("sonnet"), 0.25, 4096, std::string("anthropic")};
	LlmConfigChange change = ParseLlmConfigChange(BuildLlmConfigChange(intent, ctx_));
	EXPECT_EQ(change.project_identity, intent.project_identity);
	EXPECT_EQ(change.model, intent.model);
	EXPECT_EQ(change.temperature, intent.temperature);
	EXPECT_EQ(change.max_tokens, intent.max_tokens);
	EXPECT_EQ(change.provider, intent.provider);

	LlmConfigIntent partial{"31933:pk1:proj1", std::string("haiku"), std::nullopt, std::nullopt, std::nullopt};
	LlmConfigChange model_only = ParseLlmConfigChange(BuildLlmConfigChange(partial, ctx_));
	EXPECT_EQ(model_only.model, "haiku");
	EXPECT_FALSE(model_only.temperature.has_value());
	EXPECT_FALSE(model_only.max_tokens.has_value());
}
