#include <gtest/gtest.h>
#include "../../src/referee/race_ledger.h"

using namespace SlotRace;

namespace {

SlotRaceRecord MakeRecord(uint64_t slot, const StreamIdentity& winner, Nanos ts) {
	SlotRaceRecord record;
	record.slot = slot;
	record.winner = winner;
	record.winner_timestamp = ts;
	record.finishes.push_back({winner, ts});
	return record;
}

} // namespace

class RaceLedgerTest : public ::testing::Test {
protected:
	StreamIdentity a_{0, "a", "http://a"};
	StreamIdentity b_{1, "b", "http://b"};
};

TEST_F(RaceLedgerTest, RingModeEvictsOldestFirstSighting) {
	RaceLedger ledger(3, false);

	EXPECT_FALSE(ledger.Append(MakeRecord(10, a_, 1)).has_value());
	EXPECT_FALSE(ledger.Append(MakeRecord(12, a_, 2)).has_value());
	// Out-of-order slot numbers; eviction follows sighting order, not slot order
	EXPECT_FALSE(ledger.Append(MakeRecord(11, a_, 3)).has_value());

	auto evicted = ledger.Append(MakeRecord(13, a_, 4));
	ASSERT_TRUE(evicted.has_value());
	EXPECT_EQ(*evicted, 10u);
	EXPECT_EQ(ledger.size(), 3u);
	EXPECT_FALSE(ledger.Contains(10));
	EXPECT_EQ(ledger.Find(10), nullptr);

	ASSERT_NE(ledger.Find(11), nullptr);
	EXPECT_EQ(ledger.Find(11)->winner_timestamp, 3u);
	ASSERT_NE(ledger.Find(13), nullptr);
	EXPECT_EQ(ledger.Find(13)->winner_timestamp, 4u);
	EXPECT_EQ(ledger.records().front().slot, 12u);
	EXPECT_FALSE(ledger.IsFrozen());
}

TEST_F(RaceLedgerTest, RingModeIndexStaysConsistentAcrossManyEvictions) {
	RaceLedger ledger(4, false);
	for (uint64_t slot = 0; slot < 100; ++slot) {
		ledger.Append(MakeRecord(slot, a_, slot * 10));
		ASSERT_LE(ledger.size(), 4u);
	}
	for (uint64_t slot = 96; slot < 100; ++slot) {
		const SlotRaceRecord* record = ledger.Find(slot);
		ASSERT_NE(record, nullptr) << "slot " << slot;
		EXPECT_EQ(record->slot, slot);
		EXPECT_EQ(record->winner_timestamp, slot * 10);
	}
	EXPECT_FALSE(ledger.Contains(95));
}

TEST_F(RaceLedgerTest, FrozenModeReportsFullAtCapacity) {
	RaceLedger ledger(2, true);
	ledger.Append(MakeRecord(1, a_, 1));
	EXPECT_FALSE(ledger.IsFrozen());
	ledger.Append(MakeRecord(2, a_, 2));
	EXPECT_TRUE(ledger.IsFrozen());

	// Admitted records remain mutable
	SlotRaceRecord* record = ledger.Find(1);
	ASSERT_NE(record, nullptr);
	EXPECT_EQ(record->RecordFinish(b_, 7), 2u);
	EXPECT_EQ(ledger.Find(1)->finishes.size(), 2u);
}

TEST_F(RaceLedgerTest, RecordFinishOverwritesDuplicateStream) {
	SlotRaceRecord record = MakeRecord(5, a_, 100);
	EXPECT_EQ(record.RecordFinish(b_, 300), 2u);
	EXPECT_EQ(record.RecordFinish(b_, 250), 2u);

	ASSERT_EQ(record.finishes.size(), 2u);
	const Finish* finish = record.FindFinish(b_);
	ASSERT_NE(finish, nullptr);
	EXPECT_EQ(finish->timestamp, 250u);
	EXPECT_EQ(record.winner, a_);
}

TEST_F(RaceLedgerTest, BehindWinnerIsFlooredAtZero) {
	SlotRaceRecord record = MakeRecord(5, a_, 1000);
	EXPECT_EQ(record.BehindWinner(1150), 150u);
	EXPECT_EQ(record.BehindWinner(1000), 0u);
	EXPECT_EQ(record.BehindWinner(400), 0u);
}
