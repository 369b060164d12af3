#ifndef ESTUARY_SRC_SYNC_MONITOR_GROUP_H_
#define ESTUARY_SRC_SYNC_MONITOR_GROUP_H_

#include <functional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "subscription_orchestrator.h"

namespace Estuary {

/**
 * Child subscriptions keyed by parent identity, e.g. one status watch per
 * project. The owner calls Ensure() whenever a parent record is seen.
 *
 *  - Ensure is idempotent for an active monitor.
 *  - A monitor whose stream failed is restarted when its parent shows up
 *    again under a different record.
 *  - StopAll() (and destruction) cancels every child.
 */
class MonitorGroup {
	public:
		using FilterFactory = std::function<Filter(const std::string& identity)>;
		using HandlerFactory = std::function<RecordHandler(const std::string& identity)>;

		MonitorGroup(SubscriptionOrchestrator& orchestrator, std::string name, CachePolicy policy,
				FilterFactory filter_for, HandlerFactory handler_for);
		~MonitorGroup();

		MonitorGroup(const MonitorGroup&) = delete;
		MonitorGroup& operator=(const MonitorGroup&) = delete;

		/**
		 * Starts (or keeps) the monitor for `identity`. `record_id` names the
		 * parent record that triggered the call. Returns whether a monitor is
		 * active afterwards; transport errors are logged, not thrown.
		 */
		bool Ensure(const std::string& identity, const std::string& record_id);

		bool Remove(const std::string& identity);
		void StopAll();

		bool IsMonitoring(const std::string& identity) const;
		bool IsActive(const std::string& identity) const;
		size_t Size() const;
		std::vector<std::string> Identities() const;
		size_t StartCount() const;

	private:
		struct Monitor {
			std::string record_id;
			SubscriptionHandle handle;
		};

		SubscriptionOrchestrator& orchestrator_;
		const std::string name_;
		const CachePolicy policy_;
		const FilterFactory filter_for_;
		const HandlerFactory handler_for_;

		mutable absl::Mutex mu_;
		absl::flat_hash_map<std::string, Monitor> monitors_ ABSL_GUARDED_BY(mu_);
		bool stopped_ ABSL_GUARDED_BY(mu_) = false;
		size_t starts_ ABSL_GUARDED_BY(mu_) = 0;
};

}  // namespace Estuary

#endif  // ESTUARY_SRC_SYNC_MONITOR_GROUP_H_
