#include "sync_engine.h"

#include <algorithm>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/event_kinds.h"
#include "entity/parsers.h"

namespace Estuary {

namespace {

CachePolicy PolicyFrom(const ConfigValue<std::string>& value, CachePolicy fallback) {
	std::string name = value.get();
	if (auto policy = ParseCachePolicy(name)) {
		return *policy;
	}
	LOG(WARNING) << "[SyncEngine] Unknown cache policy '" << name << "' (" << value.env_var()
		<< "), using " << CachePolicyName(fallback);
	return fallback;
}

Filter KindsFilter(std::initializer_list<int> kinds) {
	Filter filter;
	filter.kinds.insert(kinds.begin(), kinds.end());
	return filter;
}

template <typename EntityPtr>
void NewestFirst(std::vector<EntityPtr>& entities) {
	std::sort(entities.begin(), entities.end(), [](const EntityPtr& a, const EntityPtr& b) {
		return a->created_at > b->created_at;
	});
}

}  // namespace

void WatchSet::Cancel() {
	for (auto& handle : handles) {
		handle.Cancel();
	}
}

bool WatchSet::IsActive() const {
	return !handles.empty() && std::all_of(handles.begin(), handles.end(),
			[](const SubscriptionHandle& handle) { return handle.IsActive(); });
}

SyncEngine::SyncEngine(const EstuaryConfig& config, std::shared_ptr<ITransport> transport,
		std::shared_ptr<ISigner> signer, Clock clock)
	: project_policy_(PolicyFrom(config.subscriptions.project_cache_policy, CachePolicy::kCacheThenNetwork)),
	status_policy_(PolicyFrom(config.subscriptions.status_cache_policy, CachePolicy::kCacheThenNetwork)),
	content_policy_(PolicyFrom(config.subscriptions.content_cache_policy, CachePolicy::kCacheThenNetwork)),
	typing_policy_(PolicyFrom(config.subscriptions.typing_cache_policy, CachePolicy::kNetworkOnly)),
	collect_timeout_ms_(config.subscriptions.collect_timeout_ms.get()),
	clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); })),
	projects_("projects", config.sync.max_pending_refreshes.get()),
	conversations_("conversations", config.sync.max_pending_refreshes.get()),
	tasks_("tasks", config.sync.max_pending_refreshes.get()),
	agents_("agents", config.sync.max_pending_refreshes.get()),
	lessons_("lessons", config.sync.max_pending_refreshes.get()),
	replies_("replies", config.sync.max_pending_refreshes.get()),
	status_board_(std::chrono::seconds(config.sync.status_online_window_seconds.get())),
	typing_board_(std::chrono::seconds(config.sync.typing_validity_seconds.get())),
	abort_inbox_(config.sync.replay_buffer_size.get()),
	orchestrator_(std::move(transport), config.sync.replay_buffer_size.get()),
	signer_(std::move(signer)) {}

SyncEngine::~SyncEngine() {
	StopProjectMonitoring();
	orchestrator_.Shutdown();
}

void SyncEngine::BindTransport(std::shared_ptr<ITransport> transport) {
	orchestrator_.BindTransport(std::move(transport));
}

void SyncEngine::BindSigner(std::shared_ptr<ISigner> signer) {
	absl::MutexLock lock(&signer_mu_);
	signer_ = std::move(signer);
}

std::shared_ptr<ISigner> SyncEngine::signer() const {
	absl::MutexLock lock(&signer_mu_);
	return signer_;
}

bool SyncEngine::Ingest(const Record& record) {
	switch (record.kind) {
		case kKindProject: {
			Project project = ParseProject(record);
			std::string identity = project.identity;
			return projects_.Upsert(identity, std::move(project)).changed;
		}
		case kKindConversation:
			return conversations_.Upsert(record.id, ParseConversation(record)).changed;
		case kKindConversationMetadata: {
			Conversation patch = ParseConversationMetadata(record);
			if (patch.id.empty()) {
				VLOG(2) << "[SyncEngine] Metadata record " << record.id << " names no conversation";
				return false;
			}
			std::string id = patch.id;
			return conversations_.Refresh(id, std::move(patch)).changed;
		}
		case kKindTask:
			return tasks_.Upsert(record.id, ParseTask(record)).changed;
		case kKindThreadReply:
			return IngestReply(record);
		case kKindAgentProfile:
			return agents_.Upsert(AgentProfileIdentity(record), ParseAgentProfile(record)).changed;
		case kKindAgentLesson:
			return lessons_.Upsert(record.id, ParseLesson(record)).changed;
		case kKindProjectStatus:
			return status_board_.Apply(ParseProjectStatus(record));
		case kKindTypingStart:
		case kKindTypingStop:
			return typing_board_.Apply(ParseTypingSignal(record));
		case kKindTaskAbort:
			return abort_inbox_.Post(ParseTaskAbort(record));
		case kKindLlmConfigChange:
			return llm_configs_.Apply(ParseLlmConfigChange(record));
		default:
			VLOG(3) << "[SyncEngine] Ignoring record " << record.id << " of kind " << record.kind;
			return false;
	}
}

bool SyncEngine::IngestReply(const Record& record) {
	Reply reply = ParseReply(record);
	std::string root = reply.root_id;
	bool task_update = !root.empty() &&
		((reply.root_kind.has_value() && *reply.root_kind == kKindTask) || tasks_.Contains(root));
	bool changed = replies_.Upsert(record.id, std::move(reply)).changed;
	if (task_update) {
		changed = tasks_.Refresh(root, ParseTaskUpdate(record)).changed || changed;
	}
	return changed;
}

void SyncEngine::StartProjectMonitoring(const std::string& user) {
	absl::MutexLock lifecycle(&lifecycle_mu_);
	StopProjectMonitoringLocked();

	CachePolicy status_policy = status_policy_;
	auto monitors = std::make_shared<MonitorGroup>(orchestrator_, "project-status", status_policy,
			[](const std::string& project_identity) {
				Filter filter = KindsFilter({kKindProjectStatus});
				filter.tags["a"].insert(project_identity);
				return filter;
			},
			[this](const std::string&) {
				return RecordHandler([this](const Record& record) { Ingest(record); });
			});

	std::weak_ptr<MonitorGroup> weak_group = monitors;
	Filter filter = KindsFilter({kKindProject});
	filter.authors.insert(user);
	// Throws before anything is recorded if the transport is missing or down.
	SubscriptionHandle handle = orchestrator_.Watch(filter, project_policy_, [this, weak_group](const Record& record) {
		Ingest(record);
		std::shared_ptr<MonitorGroup> group = weak_group.lock();
		if (!group) {
			return;
		}
		std::string slug = TagValue(record, "d").value_or("");
		group->Ensure(AddressableIdentity(record.kind, record.creator, slug), record.id);
	});

	absl::MutexLock lock(&monitoring_mu_);
	project_watch_ = handle;
	status_monitors_ = std::move(monitors);
	LOG(INFO) << "[SyncEngine] Monitoring projects of " << user;
}

void SyncEngine::StopProjectMonitoring() {
	absl::MutexLock lifecycle(&lifecycle_mu_);
	StopProjectMonitoringLocked();
}

void SyncEngine::StopProjectMonitoringLocked() {
	SubscriptionHandle handle;
	std::shared_ptr<MonitorGroup> monitors;
	{
		absl::MutexLock lock(&monitoring_mu_);
		handle = std::move(project_watch_);
		project_watch_ = SubscriptionHandle();
		monitors = std::move(status_monitors_);
	}
	// Parent first: once Cancel returns no handler can touch the group.
	handle.Cancel();
	if (monitors) {
		monitors->StopAll();
		LOG(INFO) << "[SyncEngine] Project monitoring stopped";
	}
}

bool SyncEngine::IsMonitoringProjects() const {
	absl::MutexLock lock(&monitoring_mu_);
	return project_watch_.IsActive();
}

std::vector<std::string> SyncEngine::MonitoredProjects() const {
	absl::MutexLock lock(&monitoring_mu_);
	if (!status_monitors_) {
		return {};
	}
	return status_monitors_->Identities();
}

SubscriptionHandle SyncEngine::WatchRecords(const Filter& filter, CachePolicy policy) {
	return orchestrator_.Watch(filter, policy, [this](const Record& record) { Ingest(record); });
}

SubscriptionHandle SyncEngine::WatchProjectContent(const std::string& project_identity) {
	Filter filter = KindsFilter({kKindConversation, kKindTask, kKindAgentLesson, kKindLlmConfigChange});
	filter.tags["a"].insert(NormalizeAddress(project_identity));
	return WatchRecords(filter, content_policy_);
}

WatchSet SyncEngine::WatchConversation(const std::string& conversation_id) {
	WatchSet watches;
	Filter content = KindsFilter({kKindThreadReply, kKindConversationMetadata});
	content.tags["e"].insert(conversation_id);
	watches.handles.push_back(WatchRecords(content, content_policy_));

	Filter typing = KindsFilter({kKindTypingStart, kKindTypingStop});
	typing.tags["e"].insert(conversation_id);
	try {
		watches.handles.push_back(WatchRecords(typing, typing_policy_));
	} catch (const TransportError&) {
		watches.Cancel();
		throw;
	}
	return watches;
}

WatchSet SyncEngine::WatchTask(const std::string& task_id) {
	WatchSet watches;
	Filter updates = KindsFilter({kKindThreadReply});
	updates.tags["e"].insert(task_id);
	watches.handles.push_back(WatchRecords(updates, content_policy_));

	// Aborts are ephemeral like typing indicators.
	Filter aborts = KindsFilter({kKindTaskAbort});
	aborts.tags["e"].insert(task_id);
	try {
		watches.handles.push_back(WatchRecords(aborts, typing_policy_));
	} catch (const TransportError&) {
		watches.Cancel();
		throw;
	}
	return watches;
}

SubscriptionHandle SyncEngine::WatchLessonComments(const std::string& lesson_id) {
	Filter filter = KindsFilter({kKindThreadReply});
	filter.tags["e"].insert(lesson_id);
	return WatchRecords(filter, content_policy_);
}

SubscriptionHandle SyncEngine::WatchAgents(const std::vector<std::string>& authors) {
	Filter filter = KindsFilter({kKindAgentProfile});
	filter.authors.insert(authors.begin(), authors.end());
	return WatchRecords(filter, content_policy_);
}

SubscriptionHandle SyncEngine::WatchAgentLessons(const std::string& agent_pubkey) {
	Filter filter = KindsFilter({kKindAgentLesson});
	filter.authors.insert(agent_pubkey);
	return WatchRecords(filter, content_policy_);
}

std::vector<MergeStore<Conversation>::EntityPtr> SyncEngine::FetchConversations(const std::string& author) {
	Filter filter = KindsFilter({kKindConversation});
	filter.authors.insert(author);
	for (const Record& record : orchestrator_.CollectOnce(filter, collect_timeout_ms_, content_policy_)) {
		Ingest(record);
	}
	auto conversations = conversations_.Select([&author](const Conversation& c) { return c.author == author; });
	NewestFirst(conversations);
	return conversations;
}

std::vector<MergeStore<Task>::EntityPtr> SyncEngine::FetchTasks(const std::string& project_identity) {
	std::string project = NormalizeAddress(project_identity);
	Filter filter = KindsFilter({kKindTask});
	filter.tags["a"].insert(project);
	for (const Record& record : orchestrator_.CollectOnce(filter, collect_timeout_ms_, content_policy_)) {
		Ingest(record);
	}

	Filter updates = KindsFilter({kKindThreadReply});
	updates.tags["a"].insert(project);
	updates.tags["K"].insert(std::to_string(kKindTask));
	for (const Record& record : orchestrator_.CollectOnce(updates, collect_timeout_ms_, content_policy_)) {
		Ingest(record);
	}

	auto tasks = tasks_.Select([&project](const Task& t) { return t.project_identity == project; });
	NewestFirst(tasks);
	return tasks;
}

std::vector<AgentPresence> SyncEngine::AvailableAgents(const std::string& project_identity) const {
	return status_board_.AvailableAgents(NormalizeAddress(project_identity));
}

bool SyncEngine::IsProjectOnline(const std::string& project_identity) const {
	return status_board_.IsOnline(NormalizeAddress(project_identity), clock_());
}

std::vector<TypingSignal> SyncEngine::ActiveTyping(const std::string& conversation_id) const {
	return typing_board_.Active(conversation_id, clock_());
}

std::vector<MergeStore<Reply>::EntityPtr> SyncEngine::RepliesTo(const std::string& root_id) const {
	auto replies = replies_.Select([&root_id](const Reply& r) { return r.root_id == root_id; });
	std::sort(replies.begin(), replies.end(), [](const auto& a, const auto& b) {
		return a->created_at < b->created_at;
	});
	return replies;
}

BuildContext SyncEngine::Context() const {
	auto signing = signer();
	if (!signing) {
		throw TransportNotConfigured("no signer bound");
	}
	int64_t now = std::chrono::duration_cast<std::chrono::seconds>(clock_().time_since_epoch()).count();
	return BuildContext{signing->PublicKey(), now};
}

PublishResult SyncEngine::Publish(const Record& draft, const RecordAction& apply, const RecordAction& rollback) {
	auto signing = signer();
	if (!signing) {
		throw TransportNotConfigured("no signer bound");
	}
	auto transport = orchestrator_.transport();
	if (!transport) {
		throw TransportNotConfigured("no transport bound");
	}

	PublishResult result;
	result.record = signing->Sign(draft);
	if (apply) {
		apply(result.record);
	}
	try {
		result.relays = transport->Publish(result.record);
	} catch (const TransportError& e) {
		LOG(WARNING) << "[SyncEngine] Publish of kind " << result.record.kind << " failed, rolling back: " << e.what();
		if (rollback) {
			rollback(result.record);
		}
		throw;
	}
	VLOG(1) << "[SyncEngine] Published " << result.record.id << " to " << result.relays.size() << " relays";
	return result;
}

Record SyncEngine::SignAndPublish(const Record& draft) {
	PublishResult result = Publish(draft, nullptr, nullptr);
	Ingest(result.record);
	return result.record;
}

MergeStore<Conversation>::EntityPtr SyncEngine::CreateConversation(const ConversationIntent& intent) {
	Record record = SignAndPublish(BuildConversation(intent, Context()));
	return conversations_.Get(record.id);
}

MergeStore<Task>::EntityPtr SyncEngine::CreateTask(const TaskIntent& intent) {
	Record record = SignAndPublish(BuildTask(intent, Context()));
	return tasks_.Get(record.id);
}

MergeStore<Reply>::EntityPtr SyncEngine::PostReply(const ReplyIntent& intent) {
	Record record = SignAndPublish(BuildReply(intent, Context()));
	return replies_.Get(record.id);
}

MergeStore<Task>::EntityPtr SyncEngine::UpdateTaskStatus(const TaskStatusUpdateIntent& intent) {
	SignAndPublish(BuildTaskStatusUpdate(intent, Context()));
	return tasks_.Get(intent.task_id);
}

void SyncEngine::SetTyping(const TypingIntent& intent) {
	SignAndPublish(BuildTyping(intent, Context()));
}

void SyncEngine::AbortTask(const std::string& task_id) {
	TaskAbortIntent intent;
	intent.task_id = task_id;
	SignAndPublish(BuildTaskAbort(intent, Context()));
}

}  // namespace Estuary
