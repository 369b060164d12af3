#include "presence_reducers.h"

#include <algorithm>

#include <glog/logging.h>

namespace Estuary {

ProjectStatus ReduceProjectStatus(const std::optional<ProjectStatus>& current, const ProjectStatus& incoming) {
	if (current.has_value() && incoming.observed_at <= current->observed_at) {
		return *current;
	}
	return incoming;
}

bool ProjectStatusBoard::Apply(const ProjectStatus& status) {
	if (status.project_identity.empty()) {
		VLOG(2) << "[ProjectStatusBoard] Ignoring status without project reference";
		return false;
	}
	absl::MutexLock lock(&mu_);
	auto it = latest_.find(status.project_identity);
	if (it == latest_.end()) {
		latest_.emplace(status.project_identity, status);
		VLOG(1) << "[ProjectStatusBoard] " << status.project_identity << " online with "
			<< status.available_agents.size() << " agents";
		return true;
	}
	ProjectStatus reduced = ReduceProjectStatus(it->second, status);
	if (reduced.observed_at == it->second.observed_at && reduced.source == it->second.source) {
		return false;
	}
	it->second = std::move(reduced);
	return true;
}

std::optional<ProjectStatus> ProjectStatusBoard::Get(const std::string& project_identity) const {
	absl::MutexLock lock(&mu_);
	auto it = latest_.find(project_identity);
	if (it == latest_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::vector<AgentPresence> ProjectStatusBoard::AvailableAgents(const std::string& project_identity) const {
	absl::MutexLock lock(&mu_);
	auto it = latest_.find(project_identity);
	if (it == latest_.end()) {
		return {};
	}
	return it->second.available_agents;
}

bool ProjectStatusBoard::IsOnline(const std::string& project_identity,
		std::chrono::system_clock::time_point now) const {
	absl::MutexLock lock(&mu_);
	auto it = latest_.find(project_identity);
	if (it == latest_.end()) {
		return false;
	}
	if (online_window_.count() <= 0) {
		return true;
	}
	auto observed = std::chrono::system_clock::time_point(std::chrono::seconds(it->second.observed_at));
	return now - observed <= online_window_;
}

size_t ProjectStatusBoard::Size() const {
	absl::MutexLock lock(&mu_);
	return latest_.size();
}

bool TypingBoard::Apply(const TypingSignal& signal) {
	if (signal.conversation_id.empty()) {
		VLOG(2) << "[TypingBoard] Ignoring typing signal without conversation from " << signal.creator;
		return false;
	}
	absl::MutexLock lock(&mu_);
	auto& by_creator = signals_[signal.conversation_id];
	auto it = by_creator.find(signal.creator);
	if (it != by_creator.end()) {
		const TypingSignal& current = it->second;
		// A stop observed in the same second as the start still ends it.
		bool newer = signal.observed_at > current.observed_at ||
			(signal.observed_at == current.observed_at && signal.stopped && !current.stopped);
		if (!newer) {
			return false;
		}
		it->second = signal;
		return true;
	}
	by_creator.emplace(signal.creator, signal);
	return true;
}

std::vector<TypingSignal> TypingBoard::Active(const std::string& conversation_id,
		std::chrono::system_clock::time_point now) const {
	std::vector<TypingSignal> active;
	absl::MutexLock lock(&mu_);
	auto it = signals_.find(conversation_id);
	if (it == signals_.end()) {
		return active;
	}
	for (const auto& [creator, signal] : it->second) {
		if (signal.IsValid(now, validity_)) {
			active.push_back(signal);
		}
	}
	return active;
}

size_t TypingBoard::Prune(std::chrono::system_clock::time_point now) {
	size_t removed = 0;
	absl::MutexLock lock(&mu_);
	for (auto conversation = signals_.begin(); conversation != signals_.end();) {
		auto& by_creator = conversation->second;
		for (auto it = by_creator.begin(); it != by_creator.end();) {
			if (!it->second.IsValid(now, validity_)) {
				by_creator.erase(it++);
				removed++;
			} else {
				++it;
			}
		}
		if (by_creator.empty()) {
			signals_.erase(conversation++);
		} else {
			++conversation;
		}
	}
	return removed;
}

size_t TypingBoard::Size() const {
	size_t total = 0;
	absl::MutexLock lock(&mu_);
	for (const auto& [conversation, by_creator] : signals_) {
		total += by_creator.size();
	}
	return total;
}

TaskAbortInbox::TaskAbortInbox(size_t max_remembered_ids)
	: max_remembered_ids_(std::max<size_t>(max_remembered_ids, 1)) {}

bool TaskAbortInbox::Post(const TaskAbortSignal& signal) {
	if (signal.task_id.empty()) {
		VLOG(2) << "[TaskAbortInbox] Abort record " << signal.record_id << " names no task";
		return false;
	}
	std::vector<AbortCallback> fire;
	{
		absl::MutexLock lock(&mu_);
		if (!signal.record_id.empty()) {
			if (!seen_record_ids_.insert(signal.record_id).second) {
				return false;
			}
			seen_order_.push_back(signal.record_id);
			if (seen_order_.size() > max_remembered_ids_) {
				seen_record_ids_.erase(seen_order_.front());
				seen_order_.pop_front();
			}
		}
		auto waiting = callbacks_.find(signal.task_id);
		if (waiting != callbacks_.end()) {
			fire = std::move(waiting->second);
			callbacks_.erase(waiting);
		} else {
			pending_[signal.task_id] = signal;
		}
	}
	LOG(INFO) << "[TaskAbortInbox] Abort requested for task " << signal.task_id;
	for (auto& callback : fire) {
		callback(signal);
	}
	return true;
}

std::optional<TaskAbortSignal> TaskAbortInbox::Take(const std::string& task_id) {
	absl::MutexLock lock(&mu_);
	auto it = pending_.find(task_id);
	if (it == pending_.end()) {
		return std::nullopt;
	}
	TaskAbortSignal signal = std::move(it->second);
	pending_.erase(it);
	return signal;
}

void TaskAbortInbox::OnAbort(const std::string& task_id, AbortCallback callback) {
	std::optional<TaskAbortSignal> ready;
	{
		absl::MutexLock lock(&mu_);
		auto it = pending_.find(task_id);
		if (it == pending_.end()) {
			callbacks_[task_id].push_back(std::move(callback));
			return;
		}
		ready = std::move(it->second);
		pending_.erase(it);
	}
	callback(*ready);
}

bool TaskAbortInbox::HasPending(const std::string& task_id) const {
	absl::MutexLock lock(&mu_);
	return pending_.contains(task_id);
}

size_t TaskAbortInbox::PendingCount() const {
	absl::MutexLock lock(&mu_);
	return pending_.size();
}

size_t TaskAbortInbox::RememberedIdCount() const {
	absl::MutexLock lock(&mu_);
	return seen_record_ids_.size();
}

bool LlmConfigBoard::Apply(const LlmConfigChange& change) {
	if (change.project_identity.empty()) {
		return false;
	}
	absl::MutexLock lock(&mu_);
	auto it = latest_.find(change.project_identity);
	if (it != latest_.end() && change.observed_at <= it->second.observed_at) {
		return false;
	}
	latest_[change.project_identity] = change;
	return true;
}

std::optional<LlmConfigChange> LlmConfigBoard::Get(const std::string& project_identity) const {
	absl::MutexLock lock(&mu_);
	auto it = latest_.find(project_identity);
	if (it == latest_.end()) {
		return std::nullopt;
	}
	return it->second;
}

}  // namespace Estuary
