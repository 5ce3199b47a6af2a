#ifndef SLOTRACE_SRC_REFEREE_RACE_EVENT_H_
#define SLOTRACE_SRC_REFEREE_RACE_EVENT_H_

#include <cstdint>
#include <future>
#include <variant>

#include "folly/concurrency/UnboundedQueue.h"

#include "common/epoch_clock.h"
#include "common/stream_identity.h"
#include "referee.h"

namespace SlotRace {

struct SlotReport {
	uint64_t slot = 0;
	StreamIdentity stream;
	Nanos timestamp = 0;
};

struct SnapshotRequest {
	std::promise<RaceSnapshot> reply;
};

struct ShutdownRequest {};

using RaceEvent = std::variant<SlotReport, SnapshotRequest, ShutdownRequest>;

// Unbounded MPSC: enqueue never blocks; the single consumer blocks while empty.
using EventChannel = folly::UMPSCQueue<RaceEvent, /*MayBlock=*/true>;

} // namespace SlotRace

#endif // SLOTRACE_SRC_REFEREE_RACE_EVENT_H_
