#include <gtest/gtest.h>
#include "../../src/sync/monitor_group.h"
#include "../../src/transport/memory_transport.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace Estuary;

namespace {

template <typename Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
	auto deadline = std::chrono::steady_clock::now() + timeout;
	while (std::chrono::steady_clock::now() < deadline) {
		if (predicate()) {
			return true;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(2));
	}
	return predicate();
}

Record StatusRecord(const std::string& id, const std::string& project) {
	Record record;
	record.id = id;
	record.creator = "agent-host";
	record.kind = 24010;
	record.created_at = 100;
	record.tags = {{"a", project}};
	return record;
}

}  // namespace

class MonitorGroupTest : public ::testing::Test {
protected:
	void SetUp() override {
		transport_ = std::make_shared<MemoryTransport>();
		orchestrator_ = std::make_unique<SubscriptionOrchestrator>(transport_);
		group_ = std::make_unique<MonitorGroup>(*orchestrator_, "status", CachePolicy::kNetworkOnly,
			[](const std::string& identity) {
				Filter filter;
				filter.kinds = {24010};
				filter.tags["a"] = {identity};
				return filter;
			},
			[this](const std::string& identity) -> RecordHandler {
				return [this, identity](const Record&) {
					if (identity == "31933:pk1:proj1") {
						proj1_records_++;
					}
				};
			});
	}

	void TearDown() override {
		group_.reset();
		orchestrator_.reset();
	}

	std::shared_ptr<MemoryTransport> transport_;
	std::unique_ptr<SubscriptionOrchestrator> orchestrator_;
	std::unique_ptr<MonitorGroup> group_;
	std::atomic<int> proj1_records_{0};
};

TEST_F(MonitorGroupTest, EnsureIsIdempotent) {
	EXPECT_TRUE(group_->Ensure("31933:pk1:proj1", "rec-1"));
	EXPECT_TRUE(group_->Ensure("31933:pk1:proj1", "rec-1"));
	EXPECT_TRUE(group_->Ensure("31933:pk1:proj1", "rec-2"));

	EXPECT_EQ(group_->StartCount(), 1u);
	EXPECT_EQ(group_->Size(), 1u);
	EXPECT_EQ(transport_->SubscribeCount(), 1u);
	EXPECT_TRUE(group_->IsActive("31933:pk1:proj1"));
}

TEST_F(MonitorGroupTest, OneMonitorPerIdentity) {
	group_->Ensure("31933:pk1:proj1", "rec-1");
	group_->Ensure("31933:pk1:proj2", "rec-2");
	EXPECT_EQ(group_->Size(), 2u);
	EXPECT_EQ(transport_->LiveSubscriptionCount(), 2u);

	auto identities = group_->Identities();
	std::sort(identities.begin(), identities.end());
	EXPECT_EQ(identities, (std::vector<std::string>{"31933:pk1:proj1", "31933:pk1:proj2"}));

	transport_->Deliver(StatusRecord("s1", "31933:pk1:proj1"));
	transport_->Deliver(StatusRecord("s2", "31933:pk1:proj2"));
	ASSERT_TRUE(WaitFor([&]() { return proj1_records_.load() == 1; }));
}

TEST_F(MonitorGroupTest, FailedMonitorRestartsOnNewParentRecord) {
	group_->Ensure("31933:pk1:proj1", "rec-1");
	transport_->FailLiveSubscriptions("relay reset");
	ASSERT_TRUE(WaitFor([&]() { return !group_->IsActive("31933:pk1:proj1"); }));
	EXPECT_TRUE(group_->IsMonitoring("31933:pk1:proj1"));

	// Same parent record: nothing new to react to
	EXPECT_FALSE(group_->Ensure("31933:pk1:proj1", "rec-1"));
	EXPECT_EQ(group_->StartCount(), 1u);

	EXPECT_TRUE(group_->Ensure("31933:pk1:proj1", "rec-2"));
	EXPECT_EQ(group_->StartCount(), 2u);
	EXPECT_TRUE(group_->IsActive("31933:pk1:proj1"));
	EXPECT_EQ(orchestrator_->SubscriptionCount(), 1u);

	transport_->Deliver(StatusRecord("s1", "31933:pk1:proj1"));
	ASSERT_TRUE(WaitFor([&]() { return proj1_records_.load() == 1; }));
}

TEST_F(MonitorGroupTest, RemoveCancelsMonitor) {
	group_->Ensure("31933:pk1:proj1", "rec-1");
	EXPECT_TRUE(group_->Remove("31933:pk1:proj1"));
	EXPECT_FALSE(group_->Remove("31933:pk1:proj1"));
	EXPECT_FALSE(group_->IsMonitoring("31933:pk1:proj1"));
	EXPECT_EQ(transport_->LiveSubscriptionCount(), 0u);
}

TEST_F(MonitorGroupTest, StopAllCancelsEveryMonitor) {
	group_->Ensure("31933:pk1:proj1", "rec-1");
	group_->Ensure("31933:pk1:proj2", "rec-2");
	group_->StopAll();

	EXPECT_EQ(group_->Size(), 0u);
	EXPECT_EQ(transport_->LiveSubscriptionCount(), 0u);
	EXPECT_EQ(orchestrator_->SubscriptionCount(), 0u);
	// A stopped group starts nothing new
	EXPECT_FALSE(group_->Ensure("31933:pk1:proj3", "rec-3"));
}

TEST_F(MonitorGroupTest, UnavailableTransportIsReportedNotThrown) {
	transport_->SetAvailable(false);
	EXPECT_FALSE(group_->Ensure("31933:pk1:proj1", "rec-1"));
	EXPECT_FALSE(group_->IsMonitoring("31933:pk1:proj1"));

	transport_->SetAvailable(true);
	EXPECT_TRUE(group_->Ensure("31933:pk1:proj1", "rec-1"));
}
