#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>
#include "absl/container/btree_set.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

#include "common/configuration.h"
#include "common/errors.h"
#include "common/event_kinds.h"
#include "record/record_codec.h"
#include "sync/sync_engine.h"
#include "transport/memory_transport.h"

using namespace Estuary;

namespace {

// Reads one JSON record per line into the transport cache. Returns the count.
size_t SeedFromFile(const std::string& path, MemoryTransport& transport, absl::btree_set<std::string>& project_owners) {
	std::ifstream in(path);
	if (!in) {
		LOG(ERROR) << "Cannot open " << path;
		return 0;
	}
	size_t seeded = 0;
	size_t line_number = 0;
	std::string line;
	while (std::getline(in, line)) {
		line_number++;
		if (line.empty()) continue;
		auto record = RecordFromJson(line);
		if (!record.has_value()) {
			LOG(WARNING) << path << ":" << line_number << " is not a record, skipped";
			continue;
		}
		if (record->kind == kKindProject) {
			project_owners.insert(record->creator);
		}
		transport.Seed(*record);
		seeded++;
	}
	return seeded;
}

// Waits until every known project has a status monitor or the deadline passes.
void Settle(SyncEngine& engine, absl::Duration wait) {
	absl::Time deadline = absl::Now() + wait;
	while (absl::Now() < deadline) {
		if (engine.projects().Size() > 0 && engine.MonitoredProjects().size() >= engine.projects().Size()) {
			break;
		}
		absl::SleepFor(absl::Milliseconds(10));
	}
	// Cache-only streams finish quickly once started.
	absl::SleepFor(absl::Milliseconds(50));
}

void PrintProject(SyncEngine& engine, const Project& project) {
	std::cout << "project " << project.identity << " \"" << project.title << "\""
		<< (engine.IsProjectOnline(project.identity) ? " online" : " offline") << "\n";
	for (const auto& agent : engine.AvailableAgents(project.identity)) {
		std::cout << "  agent " << agent.slug << " " << agent.agent_id << "\n";
	}
	for (const auto& task : engine.FetchTasks(project.identity)) {
		std::cout << "  task " << task->id << " \"" << task->title << "\" status="
			<< task->status.value_or("-") << "\n";
	}
}

}  // namespace

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1;

	cxxopts::Options options("estuary_replay", "Replays recorded events through the Estuary sync engine");
	// Configuration flags (--typing-validity, --online-window, ...) are read by Configuration.
	options.allow_unrecognised_options();
	options.add_options()
		("i,input", "JSON lines file, one record per line", cxxopts::value<std::string>())
		("f,config", "YAML configuration file", cxxopts::value<std::string>()->default_value(""))
		("u,user", "Project owner to monitor (default: every project owner in the input)",
			cxxopts::value<std::string>()->default_value(""))
		("wait_ms", "How long to wait for monitors to settle", cxxopts::value<int>()->default_value("2000"))
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	auto result = options.parse(argc, argv);
	if (result.count("help") || !result.count("input")) {
		std::cout << options.help() << std::endl;
		return result.count("help") ? 0 : 1;
	}
	FLAGS_v = result["log_level"].as<int>();

	Configuration& configuration = Configuration::getInstance();
	configuration.overrideFromCommandLine(argc, argv);
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Config: " << error;
		}
		return 1;
	}

	// Recorded input is the whole world: read it from the cache and stop.
	EstuaryConfig config = configuration.config();
	config.subscriptions.project_cache_policy.set("cache_only");
	config.subscriptions.status_cache_policy.set("cache_only");
	config.subscriptions.content_cache_policy.set("cache_only");
	config.subscriptions.typing_cache_policy.set("cache_only");

	auto transport = std::make_shared<MemoryTransport>(config.transport.relays);
	absl::btree_set<std::string> owners;
	size_t seeded = SeedFromFile(result["input"].as<std::string>(), *transport, owners);
	LOG(INFO) << "Seeded " << seeded << " records, " << owners.size() << " project owners";

	const std::string user = result["user"].as<std::string>();
	if (!user.empty()) {
		owners = {user};
	}

	SyncEngine engine(config, transport);
	for (const auto& owner : owners) {
		try {
			engine.StartProjectMonitoring(owner);
		} catch (const TransportError& e) {
			LOG(ERROR) << "Cannot monitor projects of " << owner << ": " << e.what();
			return 1;
		}
		Settle(engine, absl::Milliseconds(result["wait_ms"].as<int>()));

		for (const auto& project : engine.projects().Select([&owner](const Project& p) { return p.creator_id == owner; })) {
			PrintProject(engine, *project);
		}
		for (const auto& conversation : engine.FetchConversations(owner)) {
			std::cout << "conversation " << conversation->id << " \"" << conversation->DisplayTitle() << "\"\n";
		}
		engine.StopProjectMonitoring();
	}
	return 0;
}
