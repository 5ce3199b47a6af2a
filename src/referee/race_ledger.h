#ifndef SLOTRACE_SRC_REFEREE_RACE_LEDGER_H_
#define SLOTRACE_SRC_REFEREE_RACE_LEDGER_H_

#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "common/epoch_clock.h"
#include "common/stream_identity.h"

namespace SlotRace {

struct Finish {
	StreamIdentity stream;
	Nanos timestamp;
};

/**
 * Outcome of one slot's race.
 * winner and winner_timestamp are set by the first report and never revised.
 * finishes holds one entry per stream, in the order streams first reported.
 */
struct SlotRaceRecord {
	uint64_t slot = 0;
	StreamIdentity winner;
	Nanos winner_timestamp = 0;
	std::vector<Finish> finishes;

	const Finish* FindFinish(const StreamIdentity& stream) const;

	// Returns the 1-based position of the stream among recorded finishes.
	size_t RecordFinish(const StreamIdentity& stream, Nanos timestamp);

	// Finish time minus winner time, floored at zero.
	Nanos BehindWinner(Nanos timestamp) const {
		return timestamp > winner_timestamp ? timestamp - winner_timestamp : 0;
	}
};

/**
 * Records in first-sighting order, unique by slot.
 * In ring mode the oldest record is evicted once size exceeds capacity.
 * In frozen mode (stop_at_max) no new slot is admitted once size reaches capacity,
 * while admitted records stay mutable.
 * @threading Not thread-safe; owned by the race processor thread.
 */
class RaceLedger {
public:
	RaceLedger(size_t capacity, bool stop_at_max)
		: capacity_(capacity), stop_at_max_(stop_at_max) {}

	size_t size() const { return records_.size(); }
	size_t capacity() const { return capacity_; }
	bool stop_at_max() const { return stop_at_max_; }
	bool empty() const { return records_.empty(); }

	bool Contains(uint64_t slot) const { return index_.contains(slot); }
	SlotRaceRecord* Find(uint64_t slot);
	const SlotRaceRecord* Find(uint64_t slot) const;

	// True when frozen mode has filled the ledger.
	bool IsFrozen() const { return stop_at_max_ && records_.size() >= capacity_; }

	/**
	 * Appends a record for an unseen slot.
	 * @return the evicted slot when ring mode overflowed
	 */
	std::optional<uint64_t> Append(SlotRaceRecord record);

	const std::deque<SlotRaceRecord>& records() const { return records_; }

private:
	size_t capacity_;
	bool stop_at_max_;
	std::deque<SlotRaceRecord> records_;
	// slot -> absolute sequence number; position in records_ is seq - head_seq_
	absl::flat_hash_map<uint64_t, uint64_t> index_;
	uint64_t head_seq_ = 0;
};

} // namespace SlotRace

#endif // SLOTRACE_SRC_REFEREE_RACE_LEDGER_H_
