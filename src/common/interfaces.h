#pragma once

#include <cstdint>

#include "epoch_clock.h"
#include "stream_identity.h"

namespace SlotRace {

/**
 * Interface for the receive path to hand slot sightings to the race state.
 * Implementations must not block the caller.
 */
class ISlotSink {
public:
	virtual ~ISlotSink() = default;

	virtual void SendSlot(uint64_t slot, const StreamIdentity& stream, Nanos timestamp) = 0;
};

} // namespace SlotRace
