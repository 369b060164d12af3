#ifndef ESTUARY_SRC_STORE_MERGE_STORE_H_
#define ESTUARY_SRC_STORE_MERGE_STORE_H_

#include <algorithm>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "entity/entities.h"
#include "fine_grained_lock.h"
#include "merge_policies.h"

namespace Estuary {

/**
 * Keyed table identity -> live entity with last-writer-wins merge.
 *
 * Writes for one identity are serialized by a striped lock; the map itself is
 * guarded by a short reader/writer mutex. Stored versions are immutable
 * (shared_ptr<const Entity>), so readers always see a complete snapshot.
 * Change listeners run only when something changed, after every store lock
 * is released, in per-identity commit order. A listener may write back into
 * the store.
 */
template <typename Entity>
class MergeStore {
	public:
		using EntityPtr = std::shared_ptr<const Entity>;
		using ChangeListener = std::function<void(const std::string& identity, const EntityPtr& entity)>;
		using ListenerId = uint64_t;

		struct UpsertResult {
			EntityPtr entity;
			bool changed = false;
		};

		explicit MergeStore(std::string name, size_t max_pending_per_identity = 64)
			: name_(std::move(name)), max_pending_per_identity_(max_pending_per_identity) {}

		MergeStore(const MergeStore&) = delete;
		MergeStore& operator=(const MergeStore&) = delete;

		/**
		 * Insert or merge a candidate derived from one record.
		 *  - unknown identity: insert, changed
		 *  - candidate not newer than the stored version: discarded, unchanged
		 *  - otherwise: Merge(stored, candidate), changed
		 */
		UpsertResult Upsert(const std::string& identity, Entity candidate) {
			if (!candidate.source) {
				LOG(ERROR) << "[MergeStore:" << name_ << "] Candidate for " << identity << " has no source record";
				return {Get(identity), false};
			}
			UpsertResult result;
			{
				StripedLock<std::string>::Guard stripe(stripes_, identity);
				result = UpsertLocked(identity, std::move(candidate));
				if (result.changed) {
					EnqueueNotification(identity, result.entity);
				}
			}
			if (result.changed) {
				DrainNotifications(identity);
			}
			return result;
		}

		/**
		 * Apply an update record that references an existing identity (e.g. a
		 * task status reply). Same recency rule as Upsert. When the identity is
		 * not known yet the update is parked and applied on insertion, so the
		 * outcome does not depend on arrival order.
		 */
		UpsertResult Refresh(const std::string& identity, Entity patch) {
			if (!patch.source) {
				LOG(ERROR) << "[MergeStore:" << name_ << "] Refresh for " << identity << " has no source record";
				return {Get(identity), false};
			}
			UpsertResult result;
			{
				StripedLock<std::string>::Guard stripe(stripes_, identity);
				result = RefreshLocked(identity, std::move(patch));
				if (result.changed) {
					EnqueueNotification(identity, result.entity);
				}
			}
			if (result.changed) {
				DrainNotifications(identity);
			}
			return result;
		}

		EntityPtr Get(const std::string& identity) const {
			absl::ReaderMutexLock lock(&mutex_);
			auto it = slots_.find(identity);
			return it == slots_.end() ? nullptr : it->second.entity;
		}

		bool Contains(const std::string& identity) const {
			absl::ReaderMutexLock lock(&mutex_);
			return slots_.contains(identity);
		}

		// Version (record created_at) currently stored, -1 if unknown.
		int64_t VersionOf(const std::string& identity) const {
			absl::ReaderMutexLock lock(&mutex_);
			auto it = slots_.find(identity);
			return it == slots_.end() ? -1 : it->second.version;
		}

		std::vector<EntityPtr> Snapshot() const {
			return Select([](const Entity&) { return true; });
		}

		std::vector<EntityPtr> Select(const std::function<bool(const Entity&)>& predicate) const {
			std::vector<EntityPtr> out;
			absl::ReaderMutexLock lock(&mutex_);
			out.reserve(slots_.size());
			for (const auto& [identity, slot] : slots_) {
				if (predicate(*slot.entity)) {
					out.push_back(slot.entity);
				}
			}
			return out;
		}

		size_t Size() const {
			absl::ReaderMutexLock lock(&mutex_);
			return slots_.size();
		}

		size_t PendingCount(const std::string& identity) const {
			absl::ReaderMutexLock lock(&mutex_);
			auto it = pending_.find(identity);
			return it == pending_.end() ? 0 : it->second.size();
		}

		ListenerId AddListener(ChangeListener listener) {
			absl::MutexLock lock(&listener_mutex_);
			ListenerId id = next_listener_id_++;
			listeners_.emplace_back(id, std::make_shared<ChangeListener>(std::move(listener)));
			return id;
		}

		void RemoveListener(ListenerId id) {
			absl::MutexLock lock(&listener_mutex_);
			listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
						[id](const auto& entry) { return entry.first == id; }),
					listeners_.end());
		}

		const std::string& name() const { return name_; }

	private:
		struct Slot {
			EntityPtr entity;
			int64_t version = -1;
		};

		// Committed changes of one identity awaiting delivery. Only the thread
		// that set draining delivers them.
		struct NotificationQueue {
			std::deque<EntityPtr> entities;
			bool draining = false;
		};

		// Requires the identity's stripe held.
		UpsertResult UpsertLocked(const std::string& identity, Entity candidate) {
			int64_t version = candidate.source->created_at;

			Slot current;
			bool exists = false;
			{
				absl::ReaderMutexLock lock(&mutex_);
				auto it = slots_.find(identity);
				if (it != slots_.end()) {
					current = it->second;
					exists = true;
				}
			}

			if (!exists) {
				Slot fresh{std::make_shared<const Entity>(std::move(candidate)), version};
				ApplyParked(identity, fresh);
				Store(identity, fresh);
				return {fresh.entity, true};
			}

			if (version <= current.version) {
				VLOG(3) << "[MergeStore:" << name_ << "] Discarding stale version " << version
					<< " of " << identity << " (stored " << current.version << ")";
				return {current.entity, false};
			}

			Slot next{std::make_shared<const Entity>(Merge(*current.entity, candidate)), version};
			Store(identity, next);
			return {next.entity, true};
		}

		// Requires the identity's stripe held.
		UpsertResult RefreshLocked(const std::string& identity, Entity patch) {
			int64_t version = patch.source->created_at;

			Slot current;
			{
				absl::MutexLock lock(&mutex_);
				auto it = slots_.find(identity);
				if (it == slots_.end()) {
					Park(identity, std::move(patch));
					return {nullptr, false};
				}
				current = it->second;
			}

			if (version <= current.version) {
				return {current.entity, false};
			}
			Slot next{std::make_shared<const Entity>(Merge(*current.entity, patch)), version};
			Store(identity, next);
			return {next.entity, true};
		}

		void Store(const std::string& identity, const Slot& slot) {
			absl::MutexLock lock(&mutex_);
			slots_[identity] = slot;
		}

		// Requires mutex_ held.
		void Park(const std::string& identity, Entity patch) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
			auto& queue = pending_[identity];
			if (queue.size() >= max_pending_per_identity_) {
				LOG(WARNING) << "[MergeStore:" << name_ << "] Dropping oldest parked update for " << identity;
				queue.erase(queue.begin());
			}
			VLOG(3) << "[MergeStore:" << name_ << "] Parking update for unknown " << identity;
			queue.push_back(std::move(patch));
		}

		// Folds parked updates newer than the inserted version, oldest first.
		void ApplyParked(const std::string& identity, Slot& slot) {
			std::vector<Entity> parked;
			{
				absl::MutexLock lock(&mutex_);
				auto it = pending_.find(identity);
				if (it == pending_.end()) return;
				parked = std::move(it->second);
				pending_.erase(it);
			}
			std::stable_sort(parked.begin(), parked.end(), [](const Entity& a, const Entity& b) {
				return a.source->created_at < b.source->created_at;
			});
			for (const auto& patch : parked) {
				int64_t version = patch.source->created_at;
				if (version <= slot.version) continue;
				slot.entity = std::make_shared<const Entity>(Merge(*slot.entity, patch));
				slot.version = version;
			}
		}

		// Called under the identity's stripe so queue order is commit order.
		void EnqueueNotification(const std::string& identity, const EntityPtr& entity) {
			absl::MutexLock lock(&notify_mutex_);
			notifications_[identity].entities.push_back(entity);
		}

		void DrainNotifications(const std::string& identity) {
			{
				absl::MutexLock lock(&notify_mutex_);
				auto it = notifications_.find(identity);
				if (it == notifications_.end() || it->second.draining) return;
				it->second.draining = true;
			}
			while (true) {
				EntityPtr entity;
				{
					absl::MutexLock lock(&notify_mutex_);
					auto it = notifications_.find(identity);
					if (it->second.entities.empty()) {
						notifications_.erase(it);
						return;
					}
					entity = std::move(it->second.entities.front());
					it->second.entities.pop_front();
				}
				Notify(identity, entity);
			}
		}

		void Notify(const std::string& identity, const EntityPtr& entity) {
			std::vector<std::shared_ptr<ChangeListener>> listeners;
			{
				absl::MutexLock lock(&listener_mutex_);
				listeners.reserve(listeners_.size());
				for (const auto& entry : listeners_) {
					listeners.push_back(entry.second);
				}
			}
			for (const auto& listener : listeners) {
				try {
					(*listener)(identity, entity);
				} catch (const std::exception& e) {
					LOG(ERROR) << "[MergeStore:" << name_ << "] Listener failed for " << identity << ": " << e.what();
				}
			}
		}

		const std::string name_;
		const size_t max_pending_per_identity_;

		StripedLock<std::string> stripes_;

		mutable absl::Mutex mutex_;
		absl::flat_hash_map<std::string, Slot> slots_ ABSL_GUARDED_BY(mutex_);
		absl::flat_hash_map<std::string, std::vector<Entity>> pending_ ABSL_GUARDED_BY(mutex_);

		absl::Mutex notify_mutex_;
		absl::flat_hash_map<std::string, NotificationQueue> notifications_ ABSL_GUARDED_BY(notify_mutex_);

		absl::Mutex listener_mutex_;
		ListenerId next_listener_id_ ABSL_GUARDED_BY(listener_mutex_) = 1;
		std::vector<std::pair<ListenerId, std::shared_ptr<ChangeListener>>> listeners_ ABSL_GUARDED_BY(listener_mutex_);
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_STORE_MERGE_STORE_H_
