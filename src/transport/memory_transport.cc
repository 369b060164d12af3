#include "memory_transport.h"

#include <glog/logging.h>
#include "absl/hash/hash.h"
#include "absl/strings/str_cat.h"

#include "common/errors.h"

namespace Estuary {

MemoryTransport::MemoryTransport(std::vector<std::string> relays)
	: relays_(std::move(relays)), state_(std::make_shared<State>()) {}

MemoryTransport::~MemoryTransport() {
	std::vector<std::shared_ptr<RecordChannel>> open;
	{
		absl::MutexLock lock(&state_->mu);
		for (auto& [id, live] : state_->live) {
			if (auto channel = live.channel.lock()) {
				open.push_back(std::move(channel));
			}
		}
		state_->live.clear();
	}
	for (auto& channel : open) {
		channel->Fail("transport destroyed");
	}
}

bool MemoryTransport::CacheLocked(State& state, const Record& record) {
	if (!record.id.empty() && !state.cached_ids.insert(record.id).second) {
		return false;
	}
	state.cache.push_back(record);
	return true;
}

std::shared_ptr<RecordChannel> MemoryTransport::Subscribe(const Filter& filter, CachePolicy policy) {
	std::weak_ptr<State> weak_state = state_;
	absl::MutexLock lock(&state_->mu);
	if (!state_->available) {
		throw TransportUnavailable(absl::StrCat("subscribe ", filter.Signature(), ": no relay reachable"));
	}
	state_->subscribe_count++;
	uint64_t id = state_->next_subscription_id++;

	auto channel = std::make_shared<RecordChannel>([weak_state, id]() {
		if (auto state = weak_state.lock()) {
			absl::MutexLock release_lock(&state->mu);
			state->live.erase(id);
		}
	});

	if (policy != CachePolicy::kNetworkOnly) {
		for (const Record& record : state_->cache) {
			if (filter.Matches(record)) {
				channel->Push(record);
			}
		}
	}
	if (policy == CachePolicy::kCacheOnly) {
		channel->Finish();
		return channel;
	}

	state_->live.emplace(id, LiveSubscription{filter, channel});
	VLOG(2) << "[MemoryTransport] Subscription " << id << " open for " << filter.Signature()
		<< " (" << CachePolicyName(policy) << ")";
	return channel;
}

std::vector<Record> MemoryTransport::CollectOnce(const Filter& filter, int timeout_ms, CachePolicy policy) {
	absl::MutexLock lock(&state_->mu);
	if (!state_->available && policy != CachePolicy::kCacheOnly) {
		throw TransportUnavailable(absl::StrCat("collect ", filter.Signature(), ": no relay reachable"));
	}
	std::vector<Record> out;
	for (const Record& record : state_->cache) {
		if (filter.Matches(record)) {
			out.push_back(record);
		}
	}
	VLOG(2) << "[MemoryTransport] Collected " << out.size() << " records for " << filter.Signature()
		<< " within " << timeout_ms << "ms";
	return out;
}

std::set<std::string> MemoryTransport::Publish(const Record& record) {
	{
		absl::MutexLock lock(&state_->mu);
		if (!state_->available || relays_.empty()) {
			throw TransportUnavailable(absl::StrCat("publish ", record.id, ": no relay acknowledged"));
		}
		state_->published.push_back(record);
	}
	Deliver(record);
	return std::set<std::string>(relays_.begin(), relays_.end());
}

void MemoryTransport::Seed(const Record& record) {
	absl::MutexLock lock(&state_->mu);
	CacheLocked(*state_, record);
}

void MemoryTransport::Deliver(const Record& record) {
	std::vector<std::shared_ptr<RecordChannel>> targets;
	{
		absl::MutexLock lock(&state_->mu);
		CacheLocked(*state_, record);
		for (auto& [id, live] : state_->live) {
			if (!live.filter.Matches(record)) continue;
			if (auto channel = live.channel.lock()) {
				targets.push_back(std::move(channel));
			}
		}
	}
	// Duplicates are pushed again, as several relays would.
	for (auto& channel : targets) {
		channel->Push(record);
	}
}

void MemoryTransport::SetAvailable(bool available) {
	absl::MutexLock lock(&state_->mu);
	state_->available = available;
	LOG(INFO) << "[MemoryTransport] Relays " << (available ? "reachable" : "unreachable");
}

void MemoryTransport::FailLiveSubscriptions(const std::string& error) {
	std::vector<std::shared_ptr<RecordChannel>> failed;
	{
		absl::MutexLock lock(&state_->mu);
		for (auto& [id, live] : state_->live) {
			if (auto channel = live.channel.lock()) {
				failed.push_back(std::move(channel));
			}
		}
		state_->live.clear();
	}
	LOG(WARNING) << "[MemoryTransport] Failing " << failed.size() << " live subscriptions: " << error;
	for (auto& channel : failed) {
		channel->Fail(error);
	}
}

size_t MemoryTransport::LiveSubscriptionCount() const {
	absl::MutexLock lock(&state_->mu);
	return state_->live.size();
}

size_t MemoryTransport::SubscribeCount() const {
	absl::MutexLock lock(&state_->mu);
	return state_->subscribe_count;
}

std::vector<Record> MemoryTransport::Published() const {
	absl::MutexLock lock(&state_->mu);
	return state_->published;
}

Record LocalSigner::Sign(const Record& unsigned_record) {
	Record signed_record = unsigned_record;
	signed_record.creator = public_key_;
	size_t digest = absl::HashOf(signed_record.creator, signed_record.kind, signed_record.created_at,
			signed_record.content, signed_record.tags);
	signed_record.id = absl::StrCat(absl::Hex(digest, absl::kZeroPad16));
	return signed_record;
}

}  // namespace Estuary
