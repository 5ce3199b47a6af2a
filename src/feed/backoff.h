#ifndef SLOTRACE_SRC_FEED_BACKOFF_H_
#define SLOTRACE_SRC_FEED_BACKOFF_H_

#include <chrono>
#include <optional>
#include <random>

#include "common/config.h"

namespace SlotRace {

/**
 * @brief Exponential reconnect delay with an optional attempt limit
 *
 * delay(n) = min(max_delay, initial_delay * multiplier^n), plus up to jitter*delay of
 * random noise. With the default jitter of 0 the sequence is non-decreasing.
 */
class ExponentialBackoff {
public:
	struct Options {
		std::chrono::milliseconds initial_delay{kDefaultBackoffInitialMs};
		double multiplier = kDefaultBackoffMultiplier;
		std::chrono::milliseconds max_delay{kDefaultBackoffMaxMs};
		// nullopt retries forever
		std::optional<int> max_attempts;
		// Fraction of the delay added as random noise, in [0, 1]
		double jitter = 0.0;
	};

	ExponentialBackoff();
	explicit ExponentialBackoff(Options options);

	/**
	 * @return the delay before the next attempt, or nullopt once max_attempts is used up
	 */
	std::optional<std::chrono::milliseconds> NextDelay();

	/// Restart from initial_delay after a healthy connection
	void Reset() { attempts_ = 0; }

	int attempts() const { return attempts_; }
	const Options& options() const { return options_; }

private:
	Options options_;
	int attempts_ = 0;
	std::mt19937 random_engine_;
};

} // namespace SlotRace

#endif // SLOTRACE_SRC_FEED_BACKOFF_H_
