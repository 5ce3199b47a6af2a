#ifndef SLOTRACE_SRC_FEED_STREAM_RUNNER_H_
#define SLOTRACE_SRC_FEED_STREAM_RUNNER_H_

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

#include "absl/synchronization/mutex.h"
#include <grpcpp/grpcpp.h>
#include <geyser.pb.h>

#include "backoff.h"
#include "common/configuration.h"
#include "common/epoch_clock.h"
#include "common/interfaces.h"
#include "common/stream_identity.h"
#include "feed_connection.h"
#include "update_logger.h"

namespace SlotRace {

enum class RunnerState {
	kDisconnected,
	kConnecting,
	kSubscribed,
	kConsuming,
};

const char* RunnerStateName(RunnerState state);

geyser::CommitmentLevel ToGeyserCommitment(Commitment commitment);

/// Slot-only subscription filtered by commitment; other update kinds are not requested.
geyser::SubscribeRequest BuildSubscribeRequest(Commitment commitment);

/**
 * Drives one configured endpoint through connect, subscribe and consume, reconnecting
 * with exponential backoff after every failure. Slot sightings go to the ISlotSink
 * stamped with the shared EpochClock.
 * @threading Run() on one dedicated thread (Start() spawns it). Stop() from any thread.
 */
class StreamRunner {
public:
	// Waits for the given delay; replaceable so tests need not sleep.
	using Sleeper = std::function<void(std::chrono::milliseconds)>;

	StreamRunner(StreamIdentity identity,
			StreamConfig config,
			Commitment commitment,
			const EpochClock& clock,
			ISlotSink& sink,
			FeedConnector& connector,
			ExponentialBackoff backoff = ExponentialBackoff(),
			Sleeper sleeper = nullptr);
	~StreamRunner();

	StreamRunner(const StreamRunner&) = delete;
	StreamRunner& operator=(const StreamRunner&) = delete;

	void Start();

	/// Cancels the open stream and the pending backoff wait, then joins.
	void Stop();

	/// Retry loop; returns only after Stop() or when a bounded backoff is exhausted.
	void Run();

	RunnerState state() const { return state_.load(std::memory_order_acquire); }
	const StreamIdentity& identity() const { return identity_; }
	size_t slots_emitted() const { return slots_emitted_.load(std::memory_order_relaxed); }
	size_t connection_attempts() const { return connection_attempts_.load(std::memory_order_relaxed); }

private:
	grpc::Status ConnectAndSubscribe(std::unique_ptr<FeedConnection>* connection);

	/**
	 * Reads until the stream ends or a message is unusable.
	 * @param received_any set when at least one update arrived
	 * @return why the loop ended
	 */
	grpc::Status ConsumeLoop(FeedConnection* connection, bool* received_any);

	// false when a ping reply could not be written
	bool Dispatch(FeedConnection* connection, const geyser::SubscribeUpdate& update, Nanos received_at);

	void SetState(RunnerState state);
	void Sleep(std::chrono::milliseconds delay);
	bool stopping() const { return stopping_.load(std::memory_order_acquire); }

	const StreamIdentity identity_;
	const StreamConfig config_;
	const Commitment commitment_;
	const EpochClock& clock_;
	ISlotSink& sink_;
	FeedConnector& connector_;
	ExponentialBackoff backoff_;
	Sleeper sleeper_;
	UpdateLogger update_logger_;

	std::atomic<RunnerState> state_{RunnerState::kDisconnected};
	std::atomic<bool> stopping_{false};
	std::atomic<size_t> slots_emitted_{0};
	std::atomic<size_t> connection_attempts_{0};

	absl::Mutex mu_;
	absl::CondVar stop_cv_;
	FeedConnection* active_connection_ ABSL_GUARDED_BY(mu_) = nullptr;

	std::thread thread_;
};

} // namespace SlotRace

#endif // SLOTRACE_SRC_FEED_STREAM_RUNNER_H_
