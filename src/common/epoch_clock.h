#ifndef SLOTRACE_SRC_COMMON_EPOCH_CLOCK_H_
#define SLOTRACE_SRC_COMMON_EPOCH_CLOCK_H_

#include <chrono>
#include <cstdint>

namespace SlotRace {

// Nanoseconds elapsed since the shared epoch.
using Nanos = uint64_t;

/**
 * Source of cross-stream comparable timestamps.
 * One instance is created at startup and handed to every StreamRunner.
 */
class EpochClock {
public:
	virtual ~EpochClock() = default;
	virtual Nanos ElapsedNanos() const = 0;
};

class SteadyEpochClock : public EpochClock {
public:
	SteadyEpochClock() : epoch_(std::chrono::steady_clock::now()) {}

	Nanos ElapsedNanos() const override {
		return static_cast<Nanos>(std::chrono::duration_cast<std::chrono::nanoseconds>(
					std::chrono::steady_clock::now() - epoch_).count());
	}

	std::chrono::steady_clock::time_point epoch() const { return epoch_; }

private:
	const std::chrono::steady_clock::time_point epoch_;
};

inline double NanosToMs(Nanos ns) {
	return static_cast<double>(ns) / 1e6;
}

} // namespace SlotRace

#endif // SLOTRACE_SRC_COMMON_EPOCH_CLOCK_H_
