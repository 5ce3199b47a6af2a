#include "periodic_reporter.h"

#include <future>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace SlotRace {

namespace {

std::string Ms(double ns) {
	std::ostringstream ss;
	ss << std::fixed << std::setprecision(3) << ns / 1e6 << "ms";
	return ss.str();
}

} // namespace

std::vector<std::string> FormatRaceSummary(const RaceSnapshot& snapshot) {
	std::vector<std::string> lines;
	lines.push_back("=== RACE SUMMARY ===");
	{
		std::ostringstream ss;
		ss << "Total slots tracked: " << snapshot.total_slots << "/" << snapshot.max_slots;
		lines.push_back(ss.str());
	}
	{
		std::ostringstream ss;
		ss << "Complete races: " << snapshot.complete_races << ", partial: " << snapshot.partial_races
			<< " (" << snapshot.known_streams;
		if (snapshot.configured_streams > 0) {
			ss << "/" << snapshot.configured_streams;
		}
		ss << " streams seen)";
		lines.push_back(ss.str());
	}

	int rank = 1;
	for (const auto& m : snapshot.metrics) {
		std::ostringstream ss;
		ss << "#" << rank++ << " " << m.stream.name
			<< ": wins " << m.wins << "/" << m.participation
			<< " (" << std::fixed << std::setprecision(1) << m.win_rate << "%)"
			<< ", behind median " << Ms(m.median_behind_ns)
			<< " p90 " << Ms(static_cast<double>(m.p90_behind_ns))
			<< " p95 " << Ms(static_cast<double>(m.p95_behind_ns))
			<< " p99 " << Ms(static_cast<double>(m.p99_behind_ns));
		if (m.avg_win_margin_ns > 0.0) {
			ss << ", avg winning margin " << Ms(m.avg_win_margin_ns);
		}
		lines.push_back(ss.str());
	}

	if (snapshot.metrics.empty()) {
		lines.push_back(">>> No slots recorded yet");
	} else if (snapshot.metrics.size() == 1) {
		lines.push_back(">>> Only " + snapshot.metrics.front().stream.name + " has reported");
	} else {
		const StreamMetrics& fastest = snapshot.metrics[0];
		const StreamMetrics& runner_up = snapshot.metrics[1];
		const double lead = runner_up.median_behind_ns - fastest.median_behind_ns;
		if (lead > 0.0) {
			lines.push_back(">>> " + fastest.stream.name + " is fastest overall, median lead " + Ms(lead) +
					" over " + runner_up.stream.name);
		} else {
			lines.push_back(">>> " + fastest.stream.name + " and " + runner_up.stream.name + " are tied on median");
		}
	}
	lines.push_back("====================");
	return lines;
}

void LogRaceSummary(const RaceSnapshot& snapshot) {
	for (const auto& line : FormatRaceSummary(snapshot)) {
		LOG(INFO) << line;
	}
}

PeriodicReporter::PeriodicReporter(RaceProcessor& processor, std::chrono::milliseconds interval,
		std::chrono::milliseconds snapshot_timeout)
	: processor_(processor), interval_(interval), snapshot_timeout_(snapshot_timeout) {}

PeriodicReporter::~PeriodicReporter() {
	Stop();
}

void PeriodicReporter::Start() {
	if (thread_.joinable()) {
		return;
	}
	thread_ = std::thread(&PeriodicReporter::ReportLoop, this);
}

void PeriodicReporter::Stop() {
	{
		absl::MutexLock lock(&mu_);
		stopping_ = true;
		stop_cv_.SignalAll();
	}
	if (thread_.joinable()) {
		thread_.join();
	}
}

void PeriodicReporter::ReportLoop() {
	while (true) {
		{
			absl::MutexLock lock(&mu_);
			const absl::Time deadline = absl::Now() + absl::FromChrono(interval_);
			while (!stopping_) {
				if (stop_cv_.WaitWithDeadline(&mu_, deadline)) {
					break;
				}
			}
			if (stopping_) {
				break;
			}
		}
		if (!ReportOnce()) {
			break;
		}
	}
	VLOG(1) << "[PeriodicReporter] Stopped after " << reports_logged() << " summaries";
}

bool PeriodicReporter::ReportOnce() {
	std::future<RaceSnapshot> future = processor_.RequestSnapshot();
	if (future.wait_for(snapshot_timeout_) != std::future_status::ready) {
		LOG(WARNING) << "[PeriodicReporter] Snapshot not ready after " << snapshot_timeout_.count()
			<< "ms, skipping this summary";
		return true;
	}

	RaceSnapshot snapshot;
	try {
		snapshot = future.get();
	} catch (const std::future_error& e) {
		LOG(WARNING) << "[PeriodicReporter] Race processor is gone: " << e.what();
		return false;
	}

	LogRaceSummary(snapshot);
	reports_logged_.fetch_add(1, std::memory_order_relaxed);

	if (snapshot.is_complete) {
		saw_completion_.store(true, std::memory_order_release);
		return false;
	}
	return true;
}

} // namespace SlotRace
