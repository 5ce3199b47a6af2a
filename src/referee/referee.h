#ifndef SLOTRACE_SRC_REFEREE_REFEREE_H_
#define SLOTRACE_SRC_REFEREE_REFEREE_H_

#include <cstdint>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "common/epoch_clock.h"
#include "common/stream_identity.h"
#include "race_ledger.h"

namespace SlotRace {

/**
 * Per-stream comparison over the current ledger. Behind-times are in nanoseconds.
 */
struct StreamMetrics {
	StreamIdentity stream;
	size_t wins = 0;
	size_t participation = 0;
	double win_rate = 0.0;          // percent
	double median_behind_ns = 0.0;
	Nanos p90_behind_ns = 0;
	Nanos p95_behind_ns = 0;
	Nanos p99_behind_ns = 0;
	// Mean lead over the next finisher in races this stream won (0 when none had a runner-up)
	double avg_win_margin_ns = 0.0;
};

/**
 * Point-in-time copy handed out of the race processor
 */
struct RaceSnapshot {
	size_t total_slots = 0;
	size_t complete_races = 0;  // every observed stream has a finish
	size_t partial_races = 0;
	size_t known_streams = 0;
	size_t configured_streams = 0;
	size_t max_slots = 0;
	bool is_complete = false;
	std::vector<StreamMetrics> metrics;  // ascending by median behind-time
};

/**
 * Decides per-slot winners and computes cross-stream statistics.
 * Processing order is authoritative: the first report for a slot wins regardless of the
 * timestamps carried by later reports.
 * @threading Not thread-safe. Driven by a single consumer (RaceProcessor).
 */
class Referee {
public:
	/**
	 * @param configured_streams number of streams racing; a record is complete once that many
	 *        streams have finished it. 0 falls back to the streams seen so far.
	 */
	Referee(size_t max_slots, bool stop_at_max, size_t configured_streams = 0);

	/**
	 * Records one stream's sighting of a slot.
	 * @return false only when the ledger is frozen at capacity and the slot is new;
	 *         the ledger is untouched in that case.
	 */
	bool Report(uint64_t slot, const StreamIdentity& stream, Nanos timestamp);

	bool IsComplete() const { return ledger_.IsFrozen(); }

	std::vector<StreamMetrics> SnapshotMetrics() const;
	RaceSnapshot Snapshot() const;

	const RaceLedger& ledger() const { return ledger_; }
	const std::vector<StreamIdentity>& known_streams() const { return known_streams_; }

private:
	void Observe(const StreamIdentity& stream);

	RaceLedger ledger_;
	const size_t configured_streams_;
	// Every stream ever seen, in first-seen order
	std::vector<StreamIdentity> known_streams_;
	absl::flat_hash_set<uint32_t> known_ids_;
};

} // namespace SlotRace

#endif // SLOTRACE_SRC_REFEREE_REFEREE_H_
