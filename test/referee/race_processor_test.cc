#include <gtest/gtest.h>
#include "../../src/referee/race_processor.h"

#include <chrono>
#include <thread>
#include <vector>

using namespace SlotRace;
using namespace std::chrono_literals;

class RaceProcessorTest : public ::testing::Test {
protected:
	RaceSnapshot Snapshot(RaceProcessor& processor) {
		std::future<RaceSnapshot> future = processor.RequestSnapshot();
		EXPECT_EQ(future.wait_for(5s), std::future_status::ready);
		return future.get();
	}

	StreamIdentity a_{0, "alpha", "https://alpha"};
	StreamIdentity b_{1, "beta", "https://beta"};
};

TEST_F(RaceProcessorTest, AppliesReportsInEnqueueOrder) {
	RaceProcessor processor(10, false);
	processor.Start();

	// beta is enqueued first, so beta wins despite carrying the later timestamp
	processor.SendSlot(1, b_, 900);
	processor.SendSlot(1, a_, 100);

	RaceSnapshot snapshot = Snapshot(processor);
	ASSERT_EQ(snapshot.total_slots, 1u);
	ASSERT_EQ(snapshot.metrics.size(), 2u);
	for (const auto& m : snapshot.metrics) {
		if (m.stream == b_) {
			EXPECT_EQ(m.wins, 1u);
		} else {
			EXPECT_EQ(m.wins, 0u);
		}
	}
	EXPECT_EQ(processor.processed_reports(), 2u);
	processor.Stop();
}

TEST_F(RaceProcessorTest, SnapshotReflectsEveryEarlierReport) {
	RaceProcessor processor(1000, false);
	processor.Start();

	constexpr int kProducers = 4;
	constexpr int kSlotsPerProducer = 200;
	std::vector<std::thread> producers;
	for (int p = 0; p < kProducers; ++p) {
		producers.emplace_back([&, p]() {
			StreamIdentity id(static_cast<uint32_t>(p), "s" + std::to_string(p), "http://s");
			for (int s = 0; s < kSlotsPerProducer; ++s) {
				processor.SendSlot(static_cast<uint64_t>(s), id, static_cast<Nanos>(s * 10 + p));
			}
		});
	}
	for (auto& t : producers) {
		t.join();
	}

	RaceSnapshot snapshot = Snapshot(processor);
	EXPECT_EQ(processor.processed_reports(), static_cast<size_t>(kProducers * kSlotsPerProducer));
	EXPECT_EQ(snapshot.total_slots, static_cast<size_t>(kSlotsPerProducer));
	EXPECT_EQ(snapshot.known_streams, static_cast<size_t>(kProducers));
	EXPECT_EQ(snapshot.complete_races, static_cast<size_t>(kSlotsPerProducer));
	processor.Stop();
}

TEST_F(RaceProcessorTest, NotifiesCompletionAndKeepsMergingLateFinishes) {
	RaceProcessor processor(2, true);
	processor.Start();

	processor.SendSlot(1, a_, 10);
	EXPECT_FALSE(processor.WaitForCompletion(absl::Milliseconds(50)));
	processor.SendSlot(2, a_, 20);
	ASSERT_TRUE(processor.WaitForCompletion(absl::Seconds(5)));
	EXPECT_TRUE(processor.IsComplete());

	processor.SendSlot(3, a_, 30);
	processor.SendSlot(2, b_, 25);

	RaceSnapshot snapshot = Snapshot(processor);
	EXPECT_TRUE(snapshot.is_complete);
	EXPECT_EQ(snapshot.total_slots, 2u);
	EXPECT_EQ(snapshot.complete_races, 1u);
	EXPECT_EQ(snapshot.partial_races, 1u);
	EXPECT_EQ(processor.dropped_slots(), 1u);
	processor.Stop();
}

TEST_F(RaceProcessorTest, CompleteRacesCountConfiguredStreams) {
	RaceProcessor processor(10, false, 2);
	processor.Start();
	processor.SendSlot(1, a_, 10);
	processor.SendSlot(2, a_, 20);

	RaceSnapshot snapshot = Snapshot(processor);
	EXPECT_EQ(snapshot.complete_races, 0u);
	EXPECT_EQ(snapshot.partial_races, 2u);
	processor.Stop();
}

TEST_F(RaceProcessorTest, SnapshotAfterStopIsBroken) {
	RaceProcessor processor(10, false);
	processor.Start();
	processor.SendSlot(1, a_, 1);
	processor.Stop();

	std::future<RaceSnapshot> future = processor.RequestSnapshot();
	EXPECT_THROW(future.get(), std::future_error);
}

TEST_F(RaceProcessorTest, StopIsIdempotent) {
	RaceProcessor processor(10, false);
	processor.Start();
	processor.Stop();
	processor.Stop();
	EXPECT_EQ(processor.processed_reports(), 0u);
}
