#include "race_ledger.h"

#include <glog/logging.h>

namespace SlotRace {

const Finish* SlotRaceRecord::FindFinish(const StreamIdentity& stream) const {
	for (const auto& f : finishes) {
		if (f.stream == stream) {
			return &f;
		}
	}
	return nullptr;
}

size_t SlotRaceRecord::RecordFinish(const StreamIdentity& stream, Nanos timestamp) {
	for (size_t i = 0; i < finishes.size(); ++i) {
		if (finishes[i].stream == stream) {
			// Duplicate delivery: last write for a stream wins
			finishes[i].timestamp = timestamp;
			return i + 1;
		}
	}
	finishes.push_back({stream, timestamp});
	return finishes.size();
}

SlotRaceRecord* RaceLedger::Find(uint64_t slot) {
	auto it = index_.find(slot);
	if (it == index_.end()) {
		return nullptr;
	}
	return &records_[it->second - head_seq_];
}

const SlotRaceRecord* RaceLedger::Find(uint64_t slot) const {
	auto it = index_.find(slot);
	if (it == index_.end()) {
		return nullptr;
	}
	return &records_[it->second - head_seq_];
}

std::optional<uint64_t> RaceLedger::Append(SlotRaceRecord record) {
	DCHECK(!Contains(record.slot)) << "slot " << record.slot << " already tracked";
	const uint64_t seq = head_seq_ + records_.size();
	index_[record.slot] = seq;
	records_.push_back(std::move(record));

	if (!stop_at_max_ && records_.size() > capacity_) {
		uint64_t evicted = records_.front().slot;
		index_.erase(evicted);
		records_.pop_front();
		head_seq_++;
		return evicted;
	}
	return std::nullopt;
}

} // namespace SlotRace
