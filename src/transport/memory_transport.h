#ifndef ESTUARY_SRC_TRANSPORT_MEMORY_TRANSPORT_H_
#define ESTUARY_SRC_TRANSPORT_MEMORY_TRANSPORT_H_

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "record_channel.h"
#include "transport.h"

namespace Estuary {

/**
 * In-process ITransport. Holds a record cache and the live subscriptions.
 *
 *   Seed()    - record already in the local cache (cache policies see it)
 *   Deliver() - record arriving from the network: cached and pushed to every
 *               live subscription whose filter matches
 *   Publish() - Deliver() plus an acknowledgement from each configured relay
 *
 * Used by the replay tool and by tests; SetAvailable(false) and
 * FailLiveSubscriptions() simulate relay outages.
 */
class MemoryTransport : public ITransport {
	public:
		explicit MemoryTransport(std::vector<std::string> relays = {"memory"});
		~MemoryTransport() override;

		std::shared_ptr<RecordChannel> Subscribe(const Filter& filter, CachePolicy policy) override;
		std::vector<Record> CollectOnce(const Filter& filter, int timeout_ms, CachePolicy policy) override;
		std::set<std::string> Publish(const Record& record) override;

		void Seed(const Record& record);
		void Deliver(const Record& record);

		void SetAvailable(bool available);
		// Fails every open stream; the channels report kFailed to their readers.
		void FailLiveSubscriptions(const std::string& error);

		size_t LiveSubscriptionCount() const;
		size_t SubscribeCount() const;
		std::vector<Record> Published() const;

	private:
		struct LiveSubscription {
			Filter filter;
			std::weak_ptr<RecordChannel> channel;
		};

		// Shared with channel release callbacks, which may outlive the transport.
		struct State {
			absl::Mutex mu;
			bool available ABSL_GUARDED_BY(mu) = true;
			std::vector<Record> cache ABSL_GUARDED_BY(mu);
			absl::flat_hash_set<std::string> cached_ids ABSL_GUARDED_BY(mu);
			absl::flat_hash_map<uint64_t, LiveSubscription> live ABSL_GUARDED_BY(mu);
			uint64_t next_subscription_id ABSL_GUARDED_BY(mu) = 1;
			size_t subscribe_count ABSL_GUARDED_BY(mu) = 0;
			std::vector<Record> published ABSL_GUARDED_BY(mu);
		};

		// Returns false if the id was cached already.
		static bool CacheLocked(State& state, const Record& record) ABSL_EXCLUSIVE_LOCKS_REQUIRED(state.mu);

		const std::vector<std::string> relays_;
		std::shared_ptr<State> state_;
};

/**
 * Deterministic stand-in for a key-holding signer: stamps the creator and
 * derives the id from the record contents. Signatures are out of scope here.
 */
class LocalSigner : public ISigner {
	public:
		explicit LocalSigner(std::string public_key) : public_key_(std::move(public_key)) {}

		Record Sign(const Record& unsigned_record) override;
		std::string PublicKey() const override { return public_key_; }

	private:
		std::string public_key_;
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_TRANSPORT_MEMORY_TRANSPORT_H_
