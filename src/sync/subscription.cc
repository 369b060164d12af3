#include "subscription.h"

#include <glog/logging.h>

namespace Estuary {

Subscription::Subscription(uint64_t id, Filter filter, CachePolicy policy, size_t replay_capacity)
	: id_(id),
	filter_(std::move(filter)),
	policy_(policy),
	signature_(filter_.Signature()),
	replay_capacity_(replay_capacity) {}

Subscription::~Subscription() {
	Stop();
}

void Subscription::Start(std::shared_ptr<RecordChannel> channel) {
	// A previous worker has ended (failed or completed) before a restart.
	JoinWorker();
	{
		absl::MutexLock lock(&mu_);
		if (state_ == State::kStopped) {
			channel->Close();
			return;
		}
		if (state_ == State::kRunning) {
			LOG(WARNING) << "[Subscription " << id_ << "] Start called while running, ignoring new stream";
			channel->Close();
			return;
		}
		channel_ = channel;
		state_ = State::kRunning;
		last_error_.clear();
	}
	VLOG(1) << "[Subscription " << id_ << "] Worker starting for " << signature_
		<< " (" << CachePolicyName(policy_) << ")";
	absl::MutexLock worker_lock(&worker_mu_);
	worker_ = std::thread([self = shared_from_this(), channel]() {
		self->Run(channel);
	});
}

void Subscription::Run(std::shared_ptr<RecordChannel> channel) {
	Record record;
	while (true) {
		StreamStatus status = channel->Next(record);
		if (status == StreamStatus::kRecord) {
			Dispatch(record);
			continue;
		}
		if (status == StreamStatus::kTimeout) {
			continue;
		}

		absl::MutexLock lock(&mu_);
		if (state_ != State::kRunning || channel_ != channel) {
			// Stopped, or replaced by a restart.
			return;
		}
		if (status == StreamStatus::kFailed) {
			state_ = State::kFailed;
			last_error_ = channel->error();
			LOG(WARNING) << "[Subscription " << id_ << "] Stream for " << signature_
				<< " failed: " << last_error_;
		} else {
			state_ = State::kCompleted;
			VLOG(1) << "[Subscription " << id_ << "] Stream for " << signature_ << " completed after "
				<< delivered_.load() << " records";
		}
		channel_.reset();
		return;
	}
}

void Subscription::Dispatch(const Record& record) {
	std::vector<std::shared_ptr<Consumer>> targets;
	{
		absl::MutexLock lock(&mu_);
		if (state_ == State::kStopped) {
			return;
		}
		if (replay_capacity_ > 0 && (record.id.empty() || !replay_ids_.contains(record.id))) {
			if (replay_.size() >= replay_capacity_) {
				replay_ids_.erase(replay_.front().id);
				replay_.pop_front();
			}
			if (!record.id.empty()) {
				replay_ids_.insert(record.id);
			}
			replay_.push_back(record);
		}
		targets = consumers_;
	}

	for (auto& consumer : targets) {
		absl::MutexLock delivery(&consumer->delivery_mu);
		if (consumer->cancelled.load()) {
			continue;
		}
		Deliver(*consumer, record);
	}
	delivered_.fetch_add(1, std::memory_order_relaxed);
}

void Subscription::Deliver(Consumer& consumer, const Record& record) {
	consumer.delivering_thread.store(std::this_thread::get_id());
	try {
		consumer.handler(record);
	} catch (const std::exception& e) {
		LOG(ERROR) << "[Subscription] Handler " << consumer.id << " threw on record " << record.id
			<< ": " << e.what();
	} catch (...) {
		LOG(ERROR) << "[Subscription] Handler " << consumer.id << " threw a non-standard exception on record "
			<< record.id;
	}
	consumer.delivering_thread.store(std::thread::id());
}

uint64_t Subscription::AddConsumer(RecordHandler handler) {
	auto consumer = std::make_shared<Consumer>();
	consumer->handler = std::move(handler);

	// Held through the replay so live records queue up behind it.
	absl::MutexLock delivery(&consumer->delivery_mu);
	std::deque<Record> replay;
	{
		absl::MutexLock lock(&mu_);
		if (state_ == State::kStopped) {
			return 0;
		}
		consumer->id = next_consumer_id_++;
		consumers_.push_back(consumer);
		replay = replay_;
	}

	if (!replay.empty()) {
		VLOG(2) << "[Subscription " << id_ << "] Replaying " << replay.size()
			<< " records to consumer " << consumer->id;
	}
	for (const Record& record : replay) {
		if (consumer->cancelled.load()) {
			break;
		}
		Deliver(*consumer, record);
	}
	return consumer->id;
}

size_t Subscription::RemoveConsumer(uint64_t consumer_id) {
	std::shared_ptr<Consumer> target;
	size_t remaining = 0;
	{
		absl::MutexLock lock(&mu_);
		for (auto it = consumers_.begin(); it != consumers_.end(); ++it) {
			if ((*it)->id == consumer_id) {
				target = *it;
				consumers_.erase(it);
				break;
			}
		}
		remaining = consumers_.size();
	}
	if (target) {
		target->cancelled.store(true);
		// Wait out an in-flight delivery, unless we are that delivery.
		if (target->delivering_thread.load() != std::this_thread::get_id()) {
			absl::MutexLock wait(&target->delivery_mu);
		}
	}
	return remaining;
}

void Subscription::Stop() {
	std::shared_ptr<RecordChannel> channel;
	{
		absl::MutexLock lock(&mu_);
		if (state_ == State::kStopped) {
			return;
		}
		state_ = State::kStopped;
		channel = std::move(channel_);
		for (auto& consumer : consumers_) {
			consumer->cancelled.store(true);
		}
		consumers_.clear();
		replay_.clear();
		replay_ids_.clear();
	}
	if (channel) {
		channel->Close();
	}
	JoinWorker();
	VLOG(1) << "[Subscription " << id_ << "] Stopped " << signature_;
}

void Subscription::JoinWorker() {
	std::thread worker;
	{
		absl::MutexLock lock(&worker_mu_);
		worker = std::move(worker_);
	}
	if (!worker.joinable()) {
		return;
	}
	if (worker.get_id() == std::this_thread::get_id()) {
		// Stopped from its own handler; the thread holds a reference and exits on its own.
		worker.detach();
	} else {
		worker.join();
	}
}

bool Subscription::IsActive() const {
	absl::MutexLock lock(&mu_);
	return state_ == State::kRunning || state_ == State::kCompleted;
}

Subscription::State Subscription::state() const {
	absl::MutexLock lock(&mu_);
	return state_;
}

std::string Subscription::last_error() const {
	absl::MutexLock lock(&mu_);
	return last_error_;
}

size_t Subscription::ConsumerCount() const {
	absl::MutexLock lock(&mu_);
	return consumers_.size();
}

}  // namespace Estuary
