#include "backoff.h"

#include <algorithm>
#include <cmath>

namespace SlotRace {

ExponentialBackoff::ExponentialBackoff() : ExponentialBackoff(Options()) {}

ExponentialBackoff::ExponentialBackoff(Options options)
	: options_(options), random_engine_(std::random_device{}()) {
	options_.multiplier = std::max(1.0, options_.multiplier);
	options_.jitter = std::clamp(options_.jitter, 0.0, 1.0);
}

std::optional<std::chrono::milliseconds> ExponentialBackoff::NextDelay() {
	if (options_.max_attempts.has_value() && attempts_ >= *options_.max_attempts) {
		return std::nullopt;
	}

	const double max_ms = static_cast<double>(options_.max_delay.count());
	double delay_ms = static_cast<double>(options_.initial_delay.count()) *
		std::pow(options_.multiplier, static_cast<double>(attempts_));
	delay_ms = std::min(max_ms, delay_ms);
	attempts_++;

	if (options_.jitter > 0.0 && delay_ms > 0.0) {
		std::uniform_real_distribution<double> dist(0.0, delay_ms * options_.jitter);
		delay_ms += dist(random_engine_);
	}

	return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

} // namespace SlotRace
