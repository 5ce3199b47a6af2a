#include "race_processor.h"

#include <glog/logging.h>

namespace SlotRace {

RaceProcessor::RaceProcessor(size_t max_slots, bool stop_at_max, size_t configured_streams)
	: referee_(max_slots, stop_at_max, configured_streams) {}

RaceProcessor::~RaceProcessor() {
	Stop();
}

void RaceProcessor::Start() {
	bool expected = false;
	if (!running_.compare_exchange_strong(expected, true)) {
		LOG(WARNING) << "[RaceProcessor] Already running";
		return;
	}
	thread_ = std::thread(&RaceProcessor::ProcessLoop, this);
}

void RaceProcessor::Stop() {
	if (!thread_.joinable()) {
		return;
	}
	running_.store(false);
	channel_.enqueue(RaceEvent{ShutdownRequest{}});
	thread_.join();
}

void RaceProcessor::SendSlot(uint64_t slot, const StreamIdentity& stream, Nanos timestamp) {
	channel_.enqueue(RaceEvent{SlotReport{slot, stream, timestamp}});
}

std::future<RaceSnapshot> RaceProcessor::RequestSnapshot() {
	SnapshotRequest request;
	std::future<RaceSnapshot> future = request.reply.get_future();
	if (!running_.load()) {
		// Nobody will answer; dropping the promise breaks the future
		return future;
	}
	channel_.enqueue(RaceEvent{std::move(request)});
	return future;
}

void RaceProcessor::ProcessLoop() {
	VLOG(1) << "[RaceProcessor] Started";
	while (true) {
		RaceEvent event;
		channel_.dequeue(event);

		if (auto* report = std::get_if<SlotReport>(&event)) {
			bool should_continue = referee_.Report(report->slot, report->stream, report->timestamp);
			processed_reports_.fetch_add(1, std::memory_order_relaxed);
			if (!should_continue) {
				dropped_slots_.fetch_add(1, std::memory_order_relaxed);
			}
			// Late finishes for admitted slots keep merging after this point
			if (referee_.IsComplete() && !complete_.HasBeenNotified()) {
				LOG(INFO) << "Race complete! Maximum slots reached (" << referee_.ledger().size() << ")";
				complete_.Notify();
			}
		} else if (auto* request = std::get_if<SnapshotRequest>(&event)) {
			request->reply.set_value(referee_.Snapshot());
		} else {
			break;
		}
	}

	// Pending snapshot requests see a broken promise once their event is destroyed
	RaceEvent leftover;
	size_t dropped = 0;
	while (channel_.try_dequeue(leftover)) {
		dropped++;
	}
	VLOG(1) << "[RaceProcessor] Stopped, discarded " << dropped << " queued events";
}

} // namespace SlotRace
