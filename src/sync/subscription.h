#ifndef ESTUARY_SRC_SYNC_SUBSCRIPTION_H_
#define ESTUARY_SRC_SYNC_SUBSCRIPTION_H_

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "transport/record_channel.h"
#include "transport/transport.h"

namespace Estuary {

using RecordHandler = std::function<void(const Record&)>;

/**
 * One transport stream shared by every consumer that watches the same filter.
 *
 * A dedicated worker thread blocks on the channel and hands each record to the
 * consumers in arrival order. Records are also kept in a bounded replay
 * buffer so a consumer that joins later first sees what was already
 * delivered, then the live records, without gaps.
 *
 * @threading Consumers may be added or removed from any thread, including
 *            from inside a handler running on the worker.
 */
class Subscription : public std::enable_shared_from_this<Subscription> {
	public:
		enum class State {
			kIdle,
			kRunning,
			kCompleted,	// stream ended normally (cache-only)
			kFailed,
			kStopped,
		};

		Subscription(uint64_t id, Filter filter, CachePolicy policy, size_t replay_capacity);
		~Subscription();

		Subscription(const Subscription&) = delete;
		Subscription& operator=(const Subscription&) = delete;

		// Spawns the worker on `channel`. Also used to restart after a failure.
		void Start(std::shared_ptr<RecordChannel> channel);

		/**
		 * Registers a handler and replays the buffered records to it on the
		 * calling thread. Returns 0 if the subscription was already stopped.
		 */
		uint64_t AddConsumer(RecordHandler handler);

		/**
		 * After this returns the handler is not running and will not run again,
		 * unless called from inside that handler, where the current invocation
		 * is the last one. Returns the number of consumers left.
		 */
		size_t RemoveConsumer(uint64_t consumer_id);

		// Closes the stream and joins the worker. Idempotent.
		void Stop();

		bool IsActive() const;
		State state() const;
		std::string last_error() const;

		uint64_t id() const { return id_; }
		const Filter& filter() const { return filter_; }
		CachePolicy policy() const { return policy_; }
		const std::string& signature() const { return signature_; }

		size_t ConsumerCount() const;
		size_t DeliveredCount() const { return delivered_.load(std::memory_order_relaxed); }

	private:
		struct Consumer {
			uint64_t id;
			RecordHandler handler;
			absl::Mutex delivery_mu;
			std::atomic<bool> cancelled{false};
			std::atomic<std::thread::id> delivering_thread{};
		};

		void Run(std::shared_ptr<RecordChannel> channel);
		void Dispatch(const Record& record);
		static void Deliver(Consumer& consumer, const Record& record)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(consumer.delivery_mu);
		void JoinWorker();

		const uint64_t id_;
		const Filter filter_;
		const CachePolicy policy_;
		const std::string signature_;
		const size_t replay_capacity_;

		mutable absl::Mutex mu_;
		State state_ ABSL_GUARDED_BY(mu_) = State::kIdle;
		std::string last_error_ ABSL_GUARDED_BY(mu_);
		std::shared_ptr<RecordChannel> channel_ ABSL_GUARDED_BY(mu_);
		std::vector<std::shared_ptr<Consumer>> consumers_ ABSL_GUARDED_BY(mu_);
		uint64_t next_consumer_id_ ABSL_GUARDED_BY(mu_) = 1;
		std::deque<Record> replay_ ABSL_GUARDED_BY(mu_);
		absl::flat_hash_set<std::string> replay_ids_ ABSL_GUARDED_BY(mu_);

		absl::Mutex worker_mu_;
		std::thread worker_ ABSL_GUARDED_BY(worker_mu_);

		std::atomic<size_t> delivered_{0};
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_SYNC_SUBSCRIPTION_H_
