#include "monitor_group.h"

#include <glog/logging.h>

#include "common/errors.h"

namespace Estuary {

MonitorGroup::MonitorGroup(SubscriptionOrchestrator& orchestrator, std::string name, CachePolicy policy,
		FilterFactory filter_for, HandlerFactory handler_for)
	: orchestrator_(orchestrator),
	name_(std::move(name)),
	policy_(policy),
	filter_for_(std::move(filter_for)),
	handler_for_(std::move(handler_for)) {}

MonitorGroup::~MonitorGroup() {
	StopAll();
}

bool MonitorGroup::Ensure(const std::string& identity, const std::string& record_id) {
	SubscriptionHandle replaced;
	{
		absl::MutexLock lock(&mu_);
		if (stopped_) {
			return false;
		}
		auto it = monitors_.find(identity);
		if (it != monitors_.end()) {
			Monitor& monitor = it->second;
			if (monitor.handle.IsActive()) {
				return true;
			}
			if (monitor.record_id == record_id) {
				VLOG(2) << "[MonitorGroup:" << name_ << "] " << identity << " inactive, same parent record";
				return false;
			}
			replaced = monitor.handle;
			monitors_.erase(it);
		}
	}
	if (replaced.valid()) {
		LOG(INFO) << "[MonitorGroup:" << name_ << "] Restarting inactive monitor for " << identity;
		replaced.Cancel();
	}

	// Watch runs outside the lock: replayed records may reach handlers that call back in.
	SubscriptionHandle handle;
	try {
		handle = orchestrator_.Watch(filter_for_(identity), policy_, handler_for_(identity));
	} catch (const TransportError& e) {
		LOG(WARNING) << "[MonitorGroup:" << name_ << "] Could not monitor " << identity << ": " << e.what();
		return false;
	}

	{
		absl::MutexLock lock(&mu_);
		if (!stopped_ && !monitors_.contains(identity)) {
			monitors_.emplace(identity, Monitor{record_id, handle});
			starts_++;
			VLOG(1) << "[MonitorGroup:" << name_ << "] Monitoring " << identity;
			return true;
		}
	}
	// Lost to a concurrent Ensure or StopAll.
	handle.Cancel();
	return IsActive(identity);
}

bool MonitorGroup::Remove(const std::string& identity) {
	SubscriptionHandle handle;
	{
		absl::MutexLock lock(&mu_);
		auto it = monitors_.find(identity);
		if (it == monitors_.end()) {
			return false;
		}
		handle = it->second.handle;
		monitors_.erase(it);
	}
	handle.Cancel();
	return true;
}

void MonitorGroup::StopAll() {
	std::vector<SubscriptionHandle> handles;
	{
		absl::MutexLock lock(&mu_);
		stopped_ = true;
		for (auto& [identity, monitor] : monitors_) {
			handles.push_back(monitor.handle);
		}
		monitors_.clear();
	}
	if (!handles.empty()) {
		LOG(INFO) << "[MonitorGroup:" << name_ << "] Stopping " << handles.size() << " monitors";
	}
	for (auto& handle : handles) {
		handle.Cancel();
	}
}

bool MonitorGroup::IsMonitoring(const std::string& identity) const {
	absl::MutexLock lock(&mu_);
	return monitors_.contains(identity);
}

bool MonitorGroup::IsActive(const std::string& identity) const {
	absl::MutexLock lock(&mu_);
	auto it = monitors_.find(identity);
	return it != monitors_.end() && it->second.handle.IsActive();
}

size_t MonitorGroup::Size() const {
	absl::MutexLock lock(&mu_);
	return monitors_.size();
}

std::vector<std::string> MonitorGroup::Identities() const {
	std::vector<std::string> identities;
	absl::MutexLock lock(&mu_);
	for (const auto& [identity, monitor] : monitors_) {
		identities.push_back(identity);
	}
	return identities;
}

size_t MonitorGroup::StartCount() const {
	absl::MutexLock lock(&mu_);
	return starts_;
}

}  // namespace Estuary
