#include "referee.h"

#include <algorithm>
#include <limits>

#include <glog/logging.h>

#include "latency_stats.h"

namespace SlotRace {

Referee::Referee(size_t max_slots, bool stop_at_max, size_t configured_streams)
	: ledger_(max_slots, stop_at_max), configured_streams_(configured_streams) {}

void Referee::Observe(const StreamIdentity& stream) {
	if (known_ids_.insert(stream.id).second) {
		known_streams_.push_back(stream);
	}
}

bool Referee::Report(uint64_t slot, const StreamIdentity& stream, Nanos timestamp) {
	SlotRaceRecord* record = ledger_.Find(slot);

	if (record == nullptr) {
		if (ledger_.IsFrozen()) {
			VLOG(2) << "Slot " << slot << " from " << stream << " dropped, ledger full ("
				<< ledger_.size() << "/" << ledger_.capacity() << ")";
			return false;
		}
		Observe(stream);

		SlotRaceRecord created;
		created.slot = slot;
		created.winner = stream;
		created.winner_timestamp = timestamp;
		created.finishes.push_back({stream, timestamp});
		ledger_.Append(std::move(created));

		LOG(INFO) << "Slot " << slot << " #1 " << stream << " at "
			<< NanosToMs(timestamp) << "ms";
		return true;
	}

	Observe(stream);
	size_t position = record->RecordFinish(stream, timestamp);
	Nanos behind = record->BehindWinner(timestamp);

	LOG(INFO) << "Slot " << slot << " #" << position << " " << stream << " at "
		<< NanosToMs(timestamp) << "ms, +" << NanosToMs(behind) << "ms behind "
		<< record->winner;
	return true;
}

std::vector<StreamMetrics> Referee::SnapshotMetrics() const {
	std::vector<StreamMetrics> result;
	result.reserve(known_streams_.size());

	for (const auto& stream : known_streams_) {
		std::vector<Nanos> behind;
		size_t wins = 0;
		long double margin_sum = 0;
		size_t margin_count = 0;

		for (const auto& record : ledger_.records()) {
			const Finish* finish = record.FindFinish(stream);
			if (finish == nullptr) {
				continue;
			}
			behind.push_back(record.BehindWinner(finish->timestamp));

			if (record.winner != stream) {
				continue;
			}
			wins++;
			Nanos runner_up = std::numeric_limits<Nanos>::max();
			for (const auto& other : record.finishes) {
				if (other.stream != stream) {
					runner_up = std::min(runner_up, record.BehindWinner(other.timestamp));
				}
			}
			if (runner_up != std::numeric_limits<Nanos>::max()) {
				margin_sum += runner_up;
				margin_count++;
			}
		}

		if (behind.empty()) {
			continue;
		}

		StreamMetrics m;
		m.stream = stream;
		m.wins = wins;
		m.participation = behind.size();
		m.win_rate = static_cast<double>(wins) / static_cast<double>(m.participation) * 100.0;
		LatencyStats::Summary summary = LatencyStats::ComputeSummary(std::move(behind));
		m.median_behind_ns = summary.median_ns;
		m.p90_behind_ns = summary.p90_ns;
		m.p95_behind_ns = summary.p95_ns;
		m.p99_behind_ns = summary.p99_ns;
		if (margin_count > 0) {
			m.avg_win_margin_ns = static_cast<double>(margin_sum / margin_count);
		}
		result.push_back(std::move(m));
	}

	std::sort(result.begin(), result.end(), [](const StreamMetrics& a, const StreamMetrics& b) {
		if (a.median_behind_ns != b.median_behind_ns) {
			return a.median_behind_ns < b.median_behind_ns;
		}
		return a.stream.id < b.stream.id;
	});
	return result;
}

RaceSnapshot Referee::Snapshot() const {
	RaceSnapshot snapshot;
	snapshot.total_slots = ledger_.size();
	snapshot.known_streams = known_streams_.size();
	snapshot.max_slots = ledger_.capacity();
	snapshot.configured_streams = configured_streams_;
	snapshot.is_complete = IsComplete();
	// A stream that is down from startup still counts against every record
	const size_t expected = std::max(configured_streams_, known_streams_.size());
	for (const auto& record : ledger_.records()) {
		if (record.finishes.size() >= expected) {
			snapshot.complete_races++;
		} else {
			snapshot.partial_races++;
		}
	}
	snapshot.metrics = SnapshotMetrics();
	return snapshot;
}

} // namespace SlotRace
