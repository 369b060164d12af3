#ifndef ESTUARY_SRC_SYNC_SYNC_ENGINE_H_
#define ESTUARY_SRC_SYNC_SYNC_ENGINE_H_

#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "common/configuration.h"
#include "entity/builders.h"
#include "entity/entities.h"
#include "monitor_group.h"
#include "presence/presence_reducers.h"
#include "store/merge_store.h"
#include "subscription_orchestrator.h"
#include "transport/transport.h"

namespace Estuary {

// Several subscriptions opened together for one view, cancelled together.
struct WatchSet {
	std::vector<SubscriptionHandle> handles;

	void Cancel();
	bool IsActive() const;
};

struct PublishResult {
	Record record;	// signed
	std::set<std::string> relays;
};

/**
 * Wires the transport, the parsers, the merge stores and the presence
 * reducers together. Every subscription the engine opens feeds Ingest(), so
 * callers observe results through the stores (snapshots or change listeners)
 * and the boards.
 */
class SyncEngine {
	public:
		using Clock = std::function<std::chrono::system_clock::time_point()>;
		using RecordAction = std::function<void(const Record&)>;

		explicit SyncEngine(const EstuaryConfig& config,
				std::shared_ptr<ITransport> transport = nullptr,
				std::shared_ptr<ISigner> signer = nullptr,
				Clock clock = nullptr);
		~SyncEngine();

		SyncEngine(const SyncEngine&) = delete;
		SyncEngine& operator=(const SyncEngine&) = delete;

		void BindTransport(std::shared_ptr<ITransport> transport);
		void BindSigner(std::shared_ptr<ISigner> signer);

		/**
		 * Routes one record to its parser and store or board by kind. Unknown
		 * kinds are ignored. Returns true if any local state changed.
		 */
		bool Ingest(const Record& record);

		/**
		 * Watches the projects authored by `user` and keeps one status monitor
		 * per project, started when the project first appears. Restarts
		 * monitoring if it was already running.
		 */
		void StartProjectMonitoring(const std::string& user);
		void StopProjectMonitoring();
		bool IsMonitoringProjects() const;
		std::vector<std::string> MonitoredProjects() const;

		// Conversations, tasks, lessons and LLM config changes referencing the project.
		SubscriptionHandle WatchProjectContent(const std::string& project_identity);
		// Replies, metadata and typing indicators of one conversation.
		WatchSet WatchConversation(const std::string& conversation_id);
		// Status updates and abort requests of one task.
		WatchSet WatchTask(const std::string& task_id);
		SubscriptionHandle WatchLessonComments(const std::string& lesson_id);
		// Agent profiles of the given authors, all authors when empty.
		SubscriptionHandle WatchAgents(const std::vector<std::string>& authors);
		SubscriptionHandle WatchAgentLessons(const std::string& agent_pubkey);

		// One-shot collection, ingested and returned newest first.
		std::vector<MergeStore<Conversation>::EntityPtr> FetchConversations(const std::string& author);
		std::vector<MergeStore<Task>::EntityPtr> FetchTasks(const std::string& project_identity);

		std::vector<AgentPresence> AvailableAgents(const std::string& project_identity) const;
		bool IsProjectOnline(const std::string& project_identity) const;
		std::vector<TypingSignal> ActiveTyping(const std::string& conversation_id) const;
		// Replies rooted at `root_id`, oldest first.
		std::vector<MergeStore<Reply>::EntityPtr> RepliesTo(const std::string& root_id) const;

		/**
		 * Signs `draft`, runs `apply` with the signed record, then publishes.
		 * If publishing fails `rollback` runs and the TransportError is
		 * rethrown. Throws TransportNotConfigured without signer or transport.
		 */
		PublishResult Publish(const Record& draft, const RecordAction& apply, const RecordAction& rollback);

		// Publish, then ingest the signed record locally.
		MergeStore<Conversation>::EntityPtr CreateConversation(const ConversationIntent& intent);
		MergeStore<Task>::EntityPtr CreateTask(const TaskIntent& intent);
		MergeStore<Reply>::EntityPtr PostReply(const ReplyIntent& intent);
		MergeStore<Task>::EntityPtr UpdateTaskStatus(const TaskStatusUpdateIntent& intent);
		void SetTyping(const TypingIntent& intent);
		void AbortTask(const std::string& task_id);

		MergeStore<Project>& projects() { return projects_; }
		MergeStore<Conversation>& conversations() { return conversations_; }
		MergeStore<Task>& tasks() { return tasks_; }
		MergeStore<AgentProfile>& agents() { return agents_; }
		MergeStore<Lesson>& lessons() { return lessons_; }
		MergeStore<Reply>& replies() { return replies_; }
		ProjectStatusBoard& status_board() { return status_board_; }
		TypingBoard& typing_board() { return typing_board_; }
		TaskAbortInbox& abort_inbox() { return abort_inbox_; }
		LlmConfigBoard& llm_configs() { return llm_configs_; }
		SubscriptionOrchestrator& orchestrator() { return orchestrator_; }

	private:
		bool IngestReply(const Record& record);
		Record SignAndPublish(const Record& draft);
		BuildContext Context() const;
		SubscriptionHandle WatchRecords(const Filter& filter, CachePolicy policy);
		std::shared_ptr<ISigner> signer() const;
		void StopProjectMonitoringLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(lifecycle_mu_);

		const CachePolicy project_policy_;
		const CachePolicy status_policy_;
		const CachePolicy content_policy_;
		const CachePolicy typing_policy_;
		const int collect_timeout_ms_;
		Clock clock_;

		MergeStore<Project> projects_;
		MergeStore<Conversation> conversations_;
		MergeStore<Task> tasks_;
		MergeStore<AgentProfile> agents_;
		MergeStore<Lesson> lessons_;
		MergeStore<Reply> replies_;

		ProjectStatusBoard status_board_;
		TypingBoard typing_board_;
		TaskAbortInbox abort_inbox_;
		LlmConfigBoard llm_configs_;

		SubscriptionOrchestrator orchestrator_;

		mutable absl::Mutex signer_mu_;
		std::shared_ptr<ISigner> signer_ ABSL_GUARDED_BY(signer_mu_);

		// Serializes StartProjectMonitoring and StopProjectMonitoring. Taken
		// before monitoring_mu_.
		absl::Mutex lifecycle_mu_;
		mutable absl::Mutex monitoring_mu_;
		SubscriptionHandle project_watch_ ABSL_GUARDED_BY(monitoring_mu_);
		std::shared_ptr<MonitorGroup> status_monitors_ ABSL_GUARDED_BY(monitoring_mu_);
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_SYNC_SYNC_ENGINE_H_
