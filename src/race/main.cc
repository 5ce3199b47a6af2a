#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "common/epoch_clock.h"
#include "common/stream_identity.h"
#include "feed/grpc_feed_connector.h"
#include "feed/stream_runner.h"
#include "referee/race_processor.h"
#include "reporter/periodic_reporter.h"

using namespace SlotRace;

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	cxxopts::Options options("slotrace", "Race Yellowstone gRPC feeds slot by slot");
	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>()->default_value("config/slotrace.yaml"))
		("l,log_level", "Verbose log level", cxxopts::value<int>()->default_value("0"))
		("m,max_slots", "Number of slots to track", cxxopts::value<size_t>())
		("stop_at_max", "Stop admitting slots once max_slots are tracked and exit")
		("commitment", "processed, confirmed or finalized", cxxopts::value<std::string>())
		("i,summary_interval", "Seconds between summaries", cxxopts::value<int>())
		("h,help", "Print usage");

	std::optional<cxxopts::ParseResult> parsed;
	try {
		parsed.emplace(options.parse(argc, argv));
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid command line: " << e.what();
		return 1;
	}
	const cxxopts::ParseResult& result = *parsed;
	if (result.count("help")) {
		std::cout << options.help() << std::endl;
		return 0;
	}
	FLAGS_v = result["log_level"].as<int>();

	Configuration& config = Configuration::getInstance();
	const std::string config_path = result["config"].as<std::string>();
	bool loaded = config.loadFromFile(config_path);

	// Command line beats the file; environment variables beat both
	if (result.count("max_slots")) config.config().race.max_slots.set(result["max_slots"].as<size_t>());
	if (result.count("stop_at_max")) config.config().race.stop_at_max.set(true);
	if (result.count("commitment")) config.config().race.commitment.set(result["commitment"].as<std::string>());
	if (result.count("summary_interval")) config.config().report.summary_interval_sec.set(result["summary_interval"].as<int>());

	if (!loaded || !config.validate()) {
		LOG(ERROR) << "Failed to load configuration from " << config_path;
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Config validation error: " << error;
		}
		return 1;
	}

	const SlotRaceConfig& cfg = config.config();
	const size_t max_slots = config.getMaxSlots();
	const bool stop_at_max = config.getStopAtMax();
	const Commitment commitment = config.getCommitment();

	LOG(INFO) << "Starting gRPC subscription comparison with " << cfg.streams.size() << " streams";
	std::vector<StreamIdentity> identities;
	for (size_t i = 0; i < cfg.streams.size(); ++i) {
		identities.emplace_back(static_cast<uint32_t>(i), cfg.streams[i].name, cfg.streams[i].endpoint);
		LOG(INFO) << "Stream " << i + 1 << ": " << cfg.streams[i].name << " - " << cfg.streams[i].endpoint
			<< (cfg.streams[i].access_token ? " (token)" : "");
	}

	LOG(INFO) << "Race configuration:";
	LOG(INFO) << "  Max slots: " << max_slots;
	LOG(INFO) << "  Stop at max: " << (stop_at_max ? "true" : "false");
	LOG(INFO) << "  Commitment level: " << CommitmentName(commitment);
	LOG(INFO) << "  Warmup slots: " << config.getWarmupSlots() << " (not applied to statistics)";

	// One epoch for every stream so timestamps compare across them
	SteadyEpochClock clock;

	RaceProcessor processor(max_slots, stop_at_max, identities.size());
	processor.Start();

	GrpcFeedConnector connector(cfg.network.connect_timeout_sec.get());
	std::vector<std::unique_ptr<StreamRunner>> runners;
	for (size_t i = 0; i < identities.size(); ++i) {
		runners.push_back(std::make_unique<StreamRunner>(
					identities[i], cfg.streams[i], commitment, clock, processor, connector));
	}
	for (auto& runner : runners) {
		runner->Start();
	}

	PeriodicReporter reporter(processor, std::chrono::seconds(cfg.report.summary_interval_sec.get()));
	reporter.Start();

	// Without stop_at_max this never returns; the process runs until terminated
	processor.WaitForCompletion();

	std::future<RaceSnapshot> final_snapshot = processor.RequestSnapshot();
	try {
		LogRaceSummary(final_snapshot.get());
	} catch (const std::future_error& e) {
		LOG(ERROR) << "Final summary unavailable: " << e.what();
	}

	reporter.Stop();
	for (auto& runner : runners) {
		runner->Stop();
	}
	processor.Stop();
	LOG(INFO) << "Race finished, " << processor.dropped_slots() << " slots seen after completion were dropped";
	return 0;
}
