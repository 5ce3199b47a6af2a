#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <vector>

#include "common/epoch_clock.h"

namespace SlotRace {

class LatencyStats {
public:
	struct Summary {
		double median_ns = 0.0;
		Nanos p90_ns = 0;
		Nanos p95_ns = 0;
		Nanos p99_ns = 0;
		Nanos worst_ns = 0;
		size_t count = 0;
	};

	// Standard median; the two middle values are averaged on even counts.
	static double Median(std::vector<Nanos> values) {
		if (values.empty()) {
			return 0.0;
		}
		std::sort(values.begin(), values.end());
		const size_t mid = values.size() / 2;
		if (values.size() % 2 == 0) {
			return (static_cast<double>(values[mid - 1]) + static_cast<double>(values[mid])) / 2.0;
		}
		return static_cast<double>(values[mid]);
	}

	// Nearest rank over the worst-first ordering: sorted descending, index ceil(n*q)-1.
	// q is the tail fraction, so P90 is q=0.10.
	static Nanos WorstTailPercentile(std::vector<Nanos> values, double q) {
		if (values.empty()) {
			return 0;
		}
		std::sort(values.begin(), values.end(), std::greater<Nanos>());
		return WorstTailPercentileSorted(values, q);
	}

	static Summary ComputeSummary(std::vector<Nanos> values) {
		Summary s{};
		if (values.empty()) {
			return s;
		}
		s.count = values.size();
		s.median_ns = Median(values);

		std::sort(values.begin(), values.end(), std::greater<Nanos>());
		s.worst_ns = values.front();
		s.p90_ns = WorstTailPercentileSorted(values, 0.10);
		s.p95_ns = WorstTailPercentileSorted(values, 0.05);
		s.p99_ns = WorstTailPercentileSorted(values, 0.01);
		return s;
	}

private:
	// Expects values sorted descending.
	static Nanos WorstTailPercentileSorted(const std::vector<Nanos>& values, double q) {
		const double rank = std::ceil(q * static_cast<double>(values.size()));
		size_t idx = (rank <= 1.0) ? 0 : static_cast<size_t>(rank - 1.0);
		if (idx >= values.size()) idx = values.size() - 1;
		return values[idx];
	}
};

} // namespace SlotRace
