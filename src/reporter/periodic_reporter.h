#ifndef SLOTRACE_SRC_REPORTER_PERIODIC_REPORTER_H_
#define SLOTRACE_SRC_REPORTER_PERIODIC_REPORTER_H_

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "referee/race_processor.h"
#include "referee/referee.h"

namespace SlotRace {

/// Human-readable ranked summary, one entry per log line.
std::vector<std::string> FormatRaceSummary(const RaceSnapshot& snapshot);

void LogRaceSummary(const RaceSnapshot& snapshot);

/**
 * Every interval, asks the race processor for a snapshot through its channel and logs
 * the ranking. Stops on its own once the snapshot reports completion.
 */
class PeriodicReporter {
public:
	PeriodicReporter(RaceProcessor& processor, std::chrono::milliseconds interval,
			std::chrono::milliseconds snapshot_timeout = std::chrono::seconds(5));
	~PeriodicReporter();

	PeriodicReporter(const PeriodicReporter&) = delete;
	PeriodicReporter& operator=(const PeriodicReporter&) = delete;

	void Start();
	void Stop();

	size_t reports_logged() const { return reports_logged_.load(std::memory_order_relaxed); }
	bool saw_completion() const { return saw_completion_.load(std::memory_order_acquire); }

private:
	void ReportLoop();
	// false once the loop should end
	bool ReportOnce();

	RaceProcessor& processor_;
	const std::chrono::milliseconds interval_;
	const std::chrono::milliseconds snapshot_timeout_;

	absl::Mutex mu_;
	absl::CondVar stop_cv_;
	bool stopping_ ABSL_GUARDED_BY(mu_) = false;

	std::atomic<size_t> reports_logged_{0};
	std::atomic<bool> saw_completion_{false};
	std::thread thread_;
};

} // namespace SlotRace

#endif // SLOTRACE_SRC_REPORTER_PERIODIC_REPORTER_H_
