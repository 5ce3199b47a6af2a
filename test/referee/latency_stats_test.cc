#include <gtest/gtest.h>
#include "../../src/referee/latency_stats.h"

#include <algorithm>

using namespace SlotRace;

namespace {
constexpr Nanos kMs = 1000000;
}

TEST(LatencyStatsTest, SmallSampleTailCollapsesToWorstValue) {
	std::vector<Nanos> behind = {10 * kMs, 20 * kMs, 30 * kMs, 40 * kMs, 50 * kMs};

	EXPECT_EQ(LatencyStats::WorstTailPercentile(behind, 0.10), 50 * kMs);
	EXPECT_EQ(LatencyStats::WorstTailPercentile(behind, 0.05), 50 * kMs);
	EXPECT_EQ(LatencyStats::WorstTailPercentile(behind, 0.01), 50 * kMs);
	EXPECT_DOUBLE_EQ(LatencyStats::Median(behind), 30.0 * kMs);
}

TEST(LatencyStatsTest, NearestRankOnWorstFirstOrdering) {
	// 10, 20, ..., 200
	std::vector<Nanos> behind;
	for (Nanos v = 10; v <= 200; v += 10) {
		behind.push_back(v);
	}
	// n=20: P90 -> ceil(2)-1 = 1, P95 -> ceil(1)-1 = 0, P99 -> ceil(0.2)-1 = 0
	EXPECT_EQ(LatencyStats::WorstTailPercentile(behind, 0.10), 190u);
	EXPECT_EQ(LatencyStats::WorstTailPercentile(behind, 0.05), 200u);
	EXPECT_EQ(LatencyStats::WorstTailPercentile(behind, 0.01), 200u);
}

TEST(LatencyStatsTest, MedianAveragesMiddlePairOnEvenCount) {
	EXPECT_DOUBLE_EQ(LatencyStats::Median({0, 850}), 425.0);
	EXPECT_DOUBLE_EQ(LatencyStats::Median({150, 0}), 75.0);
	EXPECT_DOUBLE_EQ(LatencyStats::Median({7}), 7.0);
	EXPECT_DOUBLE_EQ(LatencyStats::Median({4, 1, 3, 2}), 2.5);
}

TEST(LatencyStatsTest, EmptyInputYieldsZeros) {
	EXPECT_DOUBLE_EQ(LatencyStats::Median({}), 0.0);
	EXPECT_EQ(LatencyStats::WorstTailPercentile({}, 0.10), 0u);
	LatencyStats::Summary s = LatencyStats::ComputeSummary({});
	EXPECT_EQ(s.count, 0u);
	EXPECT_EQ(s.p99_ns, 0u);
}

TEST(LatencyStatsTest, ResultsDoNotDependOnInputOrder) {
	std::vector<Nanos> values = {3, 1, 4, 1, 5, 9};
	std::sort(values.begin(), values.end());
	const LatencyStats::Summary reference = LatencyStats::ComputeSummary(values);

	do {
		LatencyStats::Summary s = LatencyStats::ComputeSummary(values);
		EXPECT_DOUBLE_EQ(s.median_ns, reference.median_ns);
		EXPECT_EQ(s.p90_ns, reference.p90_ns);
		EXPECT_EQ(s.p95_ns, reference.p95_ns);
		EXPECT_EQ(s.p99_ns, reference.p99_ns);
		EXPECT_EQ(s.worst_ns, 9u);
	} while (std::next_permutation(values.begin(), values.end()));
}

TEST(LatencyStatsTest, SummaryMatchesIndividualFunctions) {
	std::vector<Nanos> values = {50, 10, 40, 20, 30, 60, 70};
	LatencyStats::Summary s = LatencyStats::ComputeSummary(values);
	EXPECT_EQ(s.count, values.size());
	EXPECT_DOUBLE_EQ(s.median_ns, LatencyStats::Median(values));
	EXPECT_EQ(s.p90_ns, LatencyStats::WorstTailPercentile(values, 0.10));
	EXPECT_EQ(s.p95_ns, LatencyStats::WorstTailPercentile(values, 0.05));
	EXPECT_EQ(s.p99_ns, LatencyStats::WorstTailPercentile(values, 0.01));
}
