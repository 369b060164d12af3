#ifndef ESTUARY_SRC_SYNC_SUBSCRIPTION_ORCHESTRATOR_H_
#define ESTUARY_SRC_SYNC_SUBSCRIPTION_ORCHESTRATOR_H_

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "subscription.h"
#include "transport/transport.h"

namespace Estuary {

class SubscriptionRegistry;

/**
 * Cancellable reference to one consumer of a shared subscription. Copies
 * refer to the same consumer. Cancel() is idempotent and may be called from
 * any thread, including from inside the handler it cancels.
 */
class SubscriptionHandle {
	public:
		SubscriptionHandle() = default;

		void Cancel();
		// False once cancelled, or while the underlying stream is failed.
		bool IsActive() const;
		bool IsCancelled() const;
		bool valid() const { return state_ != nullptr; }
		std::string signature() const;

	private:
		friend class SubscriptionOrchestrator;

		struct HandleState {
			std::weak_ptr<SubscriptionRegistry> registry;
			std::shared_ptr<Subscription> subscription;
			uint64_t consumer_id = 0;
			std::atomic<bool> cancelled{false};
		};

		explicit SubscriptionHandle(std::shared_ptr<HandleState> state) : state_(std::move(state)) {}

		std::shared_ptr<HandleState> state_;
};

/**
 * Cancels its handle when it goes out of scope.
 */
class ScopedSubscription {
	public:
		ScopedSubscription() = default;
		explicit ScopedSubscription(SubscriptionHandle handle) : handle_(std::move(handle)) {}
		~ScopedSubscription() { handle_.Cancel(); }

		ScopedSubscription(const ScopedSubscription&) = delete;
		ScopedSubscription& operator=(const ScopedSubscription&) = delete;

		ScopedSubscription(ScopedSubscription&& other) noexcept : handle_(std::move(other.handle_)) {
			other.handle_ = SubscriptionHandle();
		}
		ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
			if (this != &other) {
				handle_.Cancel();
				handle_ = std::move(other.handle_);
				other.handle_ = SubscriptionHandle();
			}
			return *this;
		}

		const SubscriptionHandle& handle() const { return handle_; }

	private:
		SubscriptionHandle handle_;
};

/**
 * Deduplicates transport subscriptions by filter signature. The first Watch
 * of a signature opens the stream and starts its worker; later watches of the
 * same signature join it and get a replay of what was already delivered. The
 * cache policy of the first watcher applies to the shared stream.
 */
class SubscriptionOrchestrator {
	public:
		explicit SubscriptionOrchestrator(std::shared_ptr<ITransport> transport = nullptr,
				size_t replay_buffer_size = 1024);
		~SubscriptionOrchestrator();

		SubscriptionOrchestrator(const SubscriptionOrchestrator&) = delete;
		SubscriptionOrchestrator& operator=(const SubscriptionOrchestrator&) = delete;

		void BindTransport(std::shared_ptr<ITransport> transport);
		std::shared_ptr<ITransport> transport() const;

		/**
		 * Throws TransportNotConfigured without a transport and
		 * TransportUnavailable when the stream cannot be opened.
		 */
		SubscriptionHandle Watch(const Filter& filter, CachePolicy policy, RecordHandler handler);

		// Reopens a failed subscription keeping its consumers. False if it is not failed.
		bool Retry(const SubscriptionHandle& handle);
		// Retries every failed subscription; returns how many were reopened.
		size_t RetryInactive();

		std::vector<Record> CollectOnce(const Filter& filter, int timeout_ms, CachePolicy policy);

		// Stops every subscription; handles become inactive.
		void Shutdown();

		size_t SubscriptionCount() const;
		size_t ConsumerCount(const Filter& filter) const;

	private:
		std::shared_ptr<SubscriptionRegistry> registry_;
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_SYNC_SUBSCRIPTION_ORCHESTRATOR_H_
