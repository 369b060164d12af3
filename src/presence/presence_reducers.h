#ifndef ESTUARY_SRC_PRESENCE_PRESENCE_REDUCERS_H_
#define ESTUARY_SRC_PRESENCE_PRESENCE_REDUCERS_H_

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "entity/entities.h"

namespace Estuary {

/**
 * Latest-wins by observed_at, replacing wholesale: an incoming snapshot that
 * is not newer leaves `current` in place. Equal timestamps keep the current one.
 */
ProjectStatus ReduceProjectStatus(const std::optional<ProjectStatus>& current, const ProjectStatus& incoming);

/**
 * Latest status snapshot per project.
 *
 * online_window 0 means a project is online as soon as any status record has
 * been seen for it. A positive window requires the latest snapshot to be at
 * most that old.
 */
class ProjectStatusBoard {
	public:
		explicit ProjectStatusBoard(std::chrono::seconds online_window = std::chrono::seconds(0))
			: online_window_(online_window) {}

		// Returns true if the board changed.
		bool Apply(const ProjectStatus& status);

		std::optional<ProjectStatus> Get(const std::string& project_identity) const;
		std::vector<AgentPresence> AvailableAgents(const std::string& project_identity) const;
		bool IsOnline(const std::string& project_identity,
				std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
		size_t Size() const;

	private:
		const std::chrono::seconds online_window_;
		mutable absl::Mutex mu_;
		absl::flat_hash_map<std::string, ProjectStatus> latest_ ABSL_GUARDED_BY(mu_);
};

/**
 * Latest typing signal per (conversation, creator). Nothing expires on its
 * own; Active() filters by validity at read time.
 */
class TypingBoard {
	public:
		explicit TypingBoard(std::chrono::seconds validity = std::chrono::seconds(kDefaultTypingValiditySeconds))
			: validity_(validity) {}

		bool Apply(const TypingSignal& signal);

		std::vector<TypingSignal> Active(const std::string& conversation_id,
				std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

		// Drops signals that are no longer valid; returns how many were removed.
		size_t Prune(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

		size_t Size() const;
		std::chrono::seconds validity() const { return validity_; }

	private:
		const std::chrono::seconds validity_;
		mutable absl::Mutex mu_;
		// conversation id -> creator -> latest signal
		absl::flat_hash_map<std::string, absl::flat_hash_map<std::string, TypingSignal>> signals_ ABSL_GUARDED_BY(mu_);
};

/**
 * Abort requests waiting to be consumed by the task they target. Each abort
 * record is delivered once: re-delivered records (same id) are ignored, and
 * Take() or a one-shot callback consumes the signal.
 */
class TaskAbortInbox {
	public:
		using AbortCallback = std::function<void(const TaskAbortSignal&)>;

		// Duplicate detection remembers the last `max_remembered_ids` record ids.
		explicit TaskAbortInbox(size_t max_remembered_ids = 1024);

		// Returns false for duplicates and for signals without a task id.
		bool Post(const TaskAbortSignal& signal);

		std::optional<TaskAbortSignal> Take(const std::string& task_id);

		// Fires once, immediately if an abort is already pending.
		void OnAbort(const std::string& task_id, AbortCallback callback);

		bool HasPending(const std::string& task_id) const;
		size_t PendingCount() const;
		size_t RememberedIdCount() const;

	private:
		const size_t max_remembered_ids_;
		mutable absl::Mutex mu_;
		absl::flat_hash_set<std::string> seen_record_ids_ ABSL_GUARDED_BY(mu_);
		std::deque<std::string> seen_order_ ABSL_GUARDED_BY(mu_);
		absl::flat_hash_map<std::string, TaskAbortSignal> pending_ ABSL_GUARDED_BY(mu_);
		absl::flat_hash_map<std::string, std::vector<AbortCallback>> callbacks_ ABSL_GUARDED_BY(mu_);
};

// Latest LLM configuration per project, replaced wholesale.
class LlmConfigBoard {
	public:
		bool Apply(const LlmConfigChange& change);
		std::optional<LlmConfigChange> Get(const std::string& project_identity) const;

	private:
		mutable absl::Mutex mu_;
		absl::flat_hash_map<std::string, LlmConfigChange> latest_ ABSL_GUARDED_BY(mu_);
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_PRESENCE_PRESENCE_REDUCERS_H_
