#ifndef SLOTRACE_SRC_REFEREE_RACE_PROCESSOR_H_
#define SLOTRACE_SRC_REFEREE_RACE_PROCESSOR_H_

#include <atomic>
#include <future>
#include <thread>

#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "common/interfaces.h"
#include "race_event.h"
#include "referee.h"

namespace SlotRace {

/**
 * Single writer of race state.
 * Owns the Referee and applies events strictly in enqueue order on its own thread.
 * Producers (stream runners, the reporter) only enqueue; they never touch the ledger.
 */
class RaceProcessor : public ISlotSink {
public:
	RaceProcessor(size_t max_slots, bool stop_at_max, size_t configured_streams = 0);
	~RaceProcessor();

	RaceProcessor(const RaceProcessor&) = delete;
	RaceProcessor& operator=(const RaceProcessor&) = delete;

	void Start();

	/// Enqueues a shutdown marker and joins the processing thread.
	/// Events queued behind the marker are discarded.
	void Stop();

	void SendSlot(uint64_t slot, const StreamIdentity& stream, Nanos timestamp) override;

	/// The future is fulfilled by the processing thread; it is broken if the
	/// processor stops before reaching the request.
	std::future<RaceSnapshot> RequestSnapshot();

	/// Fired once, when stop_at_max has filled the ledger.
	bool IsComplete() const { return complete_.HasBeenNotified(); }
	void WaitForCompletion() const { complete_.WaitForNotification(); }
	bool WaitForCompletion(absl::Duration timeout) const {
		return complete_.WaitForNotificationWithTimeout(timeout);
	}

	size_t processed_reports() const { return processed_reports_.load(std::memory_order_relaxed); }
	// Reports for unseen slots refused by a full ledger
	size_t dropped_slots() const { return dropped_slots_.load(std::memory_order_relaxed); }

private:
	void ProcessLoop();

	Referee referee_;
	EventChannel channel_;
	std::thread thread_;
	std::atomic<bool> running_{false};
	std::atomic<size_t> processed_reports_{0};
	std::atomic<size_t> dropped_slots_{0};
	absl::Notification complete_;
};

} // namespace SlotRace

#endif // SLOTRACE_SRC_REFEREE_RACE_PROCESSOR_H_
