#include "subscription_orchestrator.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"

#include "common/errors.h"

namespace Estuary {

/**
 * Shared state behind the orchestrator. Handles keep a weak reference so a
 * handle outliving its orchestrator can still be cancelled safely.
 */
class SubscriptionRegistry {
	public:
		struct Acquired {
			std::shared_ptr<Subscription> subscription;
			std::shared_ptr<RecordChannel> channel;	// set when the caller must start the worker
		};

		SubscriptionRegistry(std::shared_ptr<ITransport> transport, size_t replay_buffer_size)
			: transport_(std::move(transport)), replay_buffer_size_(replay_buffer_size) {}

		void Bind(std::shared_ptr<ITransport> transport) {
			absl::MutexLock lock(&mu_);
			transport_ = std::move(transport);
		}

		std::shared_ptr<ITransport> transport() const {
			absl::MutexLock lock(&mu_);
			return transport_;
		}

		Acquired Acquire(const Filter& filter, CachePolicy policy) {
			std::string signature = filter.Signature();
			absl::MutexLock lock(&mu_);
			auto it = subscriptions_.find(signature);
			if (it != subscriptions_.end()) {
				auto& existing = it->second;
				if (existing->state() != Subscription::State::kFailed) {
					return {existing, nullptr};
				}
				LOG(INFO) << "[SubscriptionOrchestrator] Reopening failed subscription " << signature;
				return {existing, OpenLocked(filter, existing->policy())};
			}

			auto channel = OpenLocked(filter, policy);
			auto subscription = std::make_shared<Subscription>(next_id_++, filter, policy, replay_buffer_size_);
			subscriptions_.emplace(signature, subscription);
			VLOG(1) << "[SubscriptionOrchestrator] New subscription " << subscription->id() << " for " << signature;
			return {subscription, channel};
		}

		void Release(const std::shared_ptr<Subscription>& subscription, uint64_t consumer_id) {
			if (subscription->RemoveConsumer(consumer_id) > 0) {
				return;
			}
			{
				absl::MutexLock lock(&mu_);
				auto it = subscriptions_.find(subscription->signature());
				if (it == subscriptions_.end() || it->second != subscription ||
						subscription->ConsumerCount() > 0) {
					return;
				}
				subscriptions_.erase(it);
			}
			VLOG(1) << "[SubscriptionOrchestrator] Last consumer gone, closing " << subscription->signature();
			subscription->Stop();
		}

		bool Reopen(const std::shared_ptr<Subscription>& subscription) {
			std::shared_ptr<RecordChannel> channel;
			{
				absl::MutexLock lock(&mu_);
				auto it = subscriptions_.find(subscription->signature());
				if (it == subscriptions_.end() || it->second != subscription ||
						subscription->state() != Subscription::State::kFailed) {
					return false;
				}
				channel = OpenLocked(subscription->filter(), subscription->policy());
			}
			subscription->Start(std::move(channel));
			LOG(INFO) << "[SubscriptionOrchestrator] Reopened " << subscription->signature();
			return true;
		}

		std::vector<std::shared_ptr<Subscription>> Failed() const {
			std::vector<std::shared_ptr<Subscription>> failed;
			absl::MutexLock lock(&mu_);
			for (const auto& [signature, subscription] : subscriptions_) {
				if (subscription->state() == Subscription::State::kFailed) {
					failed.push_back(subscription);
				}
			}
			return failed;
		}

		std::vector<std::shared_ptr<Subscription>> TakeAll() {
			std::vector<std::shared_ptr<Subscription>> all;
			absl::MutexLock lock(&mu_);
			for (auto& [signature, subscription] : subscriptions_) {
				all.push_back(std::move(subscription));
			}
			subscriptions_.clear();
			return all;
		}

		size_t Size() const {
			absl::MutexLock lock(&mu_);
			return subscriptions_.size();
		}

		std::shared_ptr<Subscription> Find(const std::string& signature) const {
			absl::MutexLock lock(&mu_);
			auto it = subscriptions_.find(signature);
			return it == subscriptions_.end() ? nullptr : it->second;
		}

	private:
		std::shared_ptr<RecordChannel> OpenLocked(const Filter& filter, CachePolicy policy)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
			if (!transport_) {
				throw TransportNotConfigured(absl::StrCat("no transport bound for ", filter.Signature()));
			}
			try {
				return transport_->Subscribe(filter, policy);
			} catch (const TransportError&) {
				throw;
			} catch (const std::exception& e) {
				throw TransportUnavailable(e.what());
			}
		}

		mutable absl::Mutex mu_;
		std::shared_ptr<ITransport> transport_ ABSL_GUARDED_BY(mu_);
		absl::flat_hash_map<std::string, std::shared_ptr<Subscription>> subscriptions_ ABSL_GUARDED_BY(mu_);
		uint64_t next_id_ ABSL_GUARDED_BY(mu_) = 1;
		const size_t replay_buffer_size_;
};

void SubscriptionHandle::Cancel() {
	if (!state_ || state_->cancelled.exchange(true)) {
		return;
	}
	if (auto registry = state_->registry.lock()) {
		registry->Release(state_->subscription, state_->consumer_id);
	} else {
		state_->subscription->RemoveConsumer(state_->consumer_id);
	}
}

bool SubscriptionHandle::IsActive() const {
	return state_ && !state_->cancelled.load() && state_->subscription->IsActive();
}

bool SubscriptionHandle::IsCancelled() const {
	return state_ && state_->cancelled.load();
}

std::string SubscriptionHandle::signature() const {
	return state_ ? state_->subscription->signature() : std::string();
}

SubscriptionOrchestrator::SubscriptionOrchestrator(std::shared_ptr<ITransport> transport, size_t replay_buffer_size)
	: registry_(std::make_shared<SubscriptionRegistry>(std::move(transport), replay_buffer_size)) {}

SubscriptionOrchestrator::~SubscriptionOrchestrator() {
	Shutdown();
}

void SubscriptionOrchestrator::BindTransport(std::shared_ptr<ITransport> transport) {
	registry_->Bind(std::move(transport));
}

std::shared_ptr<ITransport> SubscriptionOrchestrator::transport() const {
	return registry_->transport();
}

SubscriptionHandle SubscriptionOrchestrator::Watch(const Filter& filter, CachePolicy policy, RecordHandler handler) {
	while (true) {
		SubscriptionRegistry::Acquired acquired = registry_->Acquire(filter, policy);
		uint64_t consumer_id = acquired.subscription->AddConsumer(handler);
		if (consumer_id == 0) {
			// Lost a race with the last consumer leaving; the stream was closed.
			if (acquired.channel) {
				acquired.channel->Close();
			}
			continue;
		}
		if (acquired.channel) {
			acquired.subscription->Start(std::move(acquired.channel));
		}

		auto state = std::make_shared<SubscriptionHandle::HandleState>();
		state->registry = registry_;
		state->subscription = acquired.subscription;
		state->consumer_id = consumer_id;
		return SubscriptionHandle(std::move(state));
	}
}

bool SubscriptionOrchestrator::Retry(const SubscriptionHandle& handle) {
	if (!handle.state_ || handle.state_->cancelled.load()) {
		return false;
	}
	return registry_->Reopen(handle.state_->subscription);
}

size_t SubscriptionOrchestrator::RetryInactive() {
	size_t reopened = 0;
	for (const auto& subscription : registry_->Failed()) {
		try {
			if (registry_->Reopen(subscription)) {
				reopened++;
			}
		} catch (const TransportError& e) {
			LOG(WARNING) << "[SubscriptionOrchestrator] Retry of " << subscription->signature()
				<< " failed: " << e.what();
		}
	}
	return reopened;
}

std::vector<Record> SubscriptionOrchestrator::CollectOnce(const Filter& filter, int timeout_ms, CachePolicy policy) {
	auto transport = registry_->transport();
	if (!transport) {
		throw TransportNotConfigured(absl::StrCat("no transport bound for ", filter.Signature()));
	}
	try {
		return transport->CollectOnce(filter, timeout_ms, policy);
	} catch (const TransportError&) {
		throw;
	} catch (const std::exception& e) {
		throw TransportUnavailable(e.what());
	}
}

void SubscriptionOrchestrator::Shutdown() {
	auto all = registry_->TakeAll();
	if (!all.empty()) {
		LOG(INFO) << "[SubscriptionOrchestrator] Stopping " << all.size() << " subscriptions";
	}
	for (auto& subscription : all) {
		subscription->Stop();
	}
}

size_t SubscriptionOrchestrator::SubscriptionCount() const {
	return registry_->Size();
}

size_t SubscriptionOrchestrator::ConsumerCount(const Filter& filter) const {
	auto subscription = registry_->Find(filter.Signature());
	return subscription ? subscription->ConsumerCount() : 0;
}

}  // namespace Estuary
