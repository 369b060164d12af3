#include "record_channel.h"

#include <glog/logging.h>
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace Estuary {

RecordChannel::RecordChannel(std::function<void()> on_release)
	: on_release_(std::move(on_release)) {}

RecordChannel::~RecordChannel() {
	Close();
}

bool RecordChannel::Push(Record record) {
	absl::MutexLock lock(&mu_);
	if (closed_ || failed_ || finished_) {
		return false;
	}
	queue_.push_back(std::move(record));
	return true;
}

void RecordChannel::Fail(const std::string& error) {
	absl::MutexLock lock(&mu_);
	if (closed_ || failed_) {
		return;
	}
	failed_ = true;
	error_ = error;
	VLOG(1) << "[RecordChannel] Stream failed: " << error;
}

void RecordChannel::Finish() {
	absl::MutexLock lock(&mu_);
	finished_ = true;
}

void RecordChannel::Close() {
	std::function<void()> release;
	{
		absl::MutexLock lock(&mu_);
		if (closed_) {
			return;
		}
		closed_ = true;
		queue_.clear();
		release = std::move(on_release_);
		on_release_ = nullptr;
	}
	// Outside the lock: the transport may take its own locks here.
	if (release) {
		release();
	}
}

bool RecordChannel::Ready() const {
	return closed_ || failed_ || finished_ || !queue_.empty();
}

StreamStatus RecordChannel::NextLocked(Record& out) {
	if (closed_) {
		return StreamStatus::kClosed;
	}
	if (!queue_.empty()) {
		out = std::move(queue_.front());
		queue_.pop_front();
		return StreamStatus::kRecord;
	}
	if (failed_) {
		return StreamStatus::kFailed;
	}
	if (finished_) {
		return StreamStatus::kClosed;
	}
	return StreamStatus::kTimeout;
}

StreamStatus RecordChannel::Next(Record& out) {
	absl::MutexLock lock(&mu_);
	mu_.Await(absl::Condition(this, &RecordChannel::Ready));
	return NextLocked(out);
}

StreamStatus RecordChannel::NextUntil(Record& out, std::chrono::steady_clock::time_point deadline) {
	absl::Duration remaining = absl::FromChrono(deadline - std::chrono::steady_clock::now());
	absl::MutexLock lock(&mu_);
	mu_.AwaitWithTimeout(absl::Condition(this, &RecordChannel::Ready), remaining);
	return NextLocked(out);
}

bool RecordChannel::closed() const {
	absl::MutexLock lock(&mu_);
	return closed_;
}

std::string RecordChannel::error() const {
	absl::MutexLock lock(&mu_);
	return error_;
}

}  // namespace Estuary
