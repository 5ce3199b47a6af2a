#include "stream_runner.h"

#include <glog/logging.h>

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "common/config.h"

namespace SlotRace {

const char* RunnerStateName(RunnerState state) {
	switch (state) {
		case RunnerState::kDisconnected: return "Disconnected";
		case RunnerState::kConnecting: return "Connecting";
		case RunnerState::kSubscribed: return "Subscribed";
		case RunnerState::kConsuming: return "Consuming";
	}
	return "Unknown";
}

geyser::CommitmentLevel ToGeyserCommitment(Commitment commitment) {
	switch (commitment) {
		case Commitment::kProcessed: return geyser::PROCESSED;
		case Commitment::kConfirmed: return geyser::CONFIRMED;
		case Commitment::kFinalized: return geyser::FINALIZED;
	}
	return geyser::PROCESSED;
}

geyser::SubscribeRequest BuildSubscribeRequest(Commitment commitment) {
	geyser::SubscribeRequest request;
	geyser::SubscribeRequestFilterSlots& filter = (*request.mutable_slots())[SLOT_FILTER_NAME];
	filter.set_filter_by_commitment(true);
	filter.set_interslot_updates(false);
	request.set_commitment(ToGeyserCommitment(commitment));
	return request;
}

StreamRunner::StreamRunner(StreamIdentity identity,
		StreamConfig config,
		Commitment commitment,
		const EpochClock& clock,
		ISlotSink& sink,
		FeedConnector& connector,
		ExponentialBackoff backoff,
		Sleeper sleeper)
	: identity_(std::move(identity)),
	config_(std::move(config)),
	commitment_(commitment),
	clock_(clock),
	sink_(sink),
	connector_(connector),
	backoff_(std::move(backoff)),
	sleeper_(std::move(sleeper)),
	update_logger_(identity_.name) {}

StreamRunner::~StreamRunner() {
	Stop();
}

void StreamRunner::Start() {
	if (thread_.joinable()) {
		LOG(WARNING) << "[" << identity_ << "] Runner already started";
		return;
	}
	thread_ = std::thread(&StreamRunner::Run, this);
}

void StreamRunner::Stop() {
	stopping_.store(true, std::memory_order_release);
	{
		absl::MutexLock lock(&mu_);
		if (active_connection_ != nullptr) {
			active_connection_->Cancel();
		}
		stop_cv_.SignalAll();
	}
	if (thread_.joinable()) {
		thread_.join();
	}
}

void StreamRunner::SetState(RunnerState state) {
	RunnerState previous = state_.exchange(state, std::memory_order_acq_rel);
	if (previous != state) {
		VLOG(2) << "[" << identity_ << "] " << RunnerStateName(previous) << " -> " << RunnerStateName(state);
	}
}

void StreamRunner::Sleep(std::chrono::milliseconds delay) {
	if (sleeper_) {
		sleeper_(delay);
		return;
	}
	absl::MutexLock lock(&mu_);
	const absl::Time deadline = absl::Now() + absl::FromChrono(delay);
	while (!stopping()) {
		if (stop_cv_.WaitWithDeadline(&mu_, deadline)) {
			break;
		}
	}
}

void StreamRunner::Run() {
	while (!stopping()) {
		std::unique_ptr<FeedConnection> connection;
		bool received_any = false;

		grpc::Status status = ConnectAndSubscribe(&connection);
		if (status.ok()) {
			status = ConsumeLoop(connection.get(), &received_any);
		}

		{
			absl::MutexLock lock(&mu_);
			active_connection_ = nullptr;
		}
		connection.reset();
		SetState(RunnerState::kDisconnected);

		if (stopping()) {
			break;
		}
		if (received_any) {
			backoff_.Reset();
		}

		LOG(ERROR) << "[" << identity_ << "] Connection failed, will retry: ("
			<< status.error_code() << ") " << status.error_message();

		std::optional<std::chrono::milliseconds> delay = backoff_.NextDelay();
		if (!delay.has_value()) {
			LOG(ERROR) << "[" << identity_ << "] Giving up after " << backoff_.attempts() << " retries";
			break;
		}
		VLOG(1) << "[" << identity_ << "] Reconnecting in " << delay->count() << "ms (retry "
			<< backoff_.attempts() << ")";
		Sleep(*delay);
	}
	LOG(INFO) << "[" << identity_ << "] Runner stopped";
}

grpc::Status StreamRunner::ConnectAndSubscribe(std::unique_ptr<FeedConnection>* connection) {
	SetState(RunnerState::kConnecting);
	connection_attempts_.fetch_add(1, std::memory_order_relaxed);
	LOG(INFO) << "[" << identity_ << "] Connecting to gRPC endpoint: " << config_.endpoint;

	grpc::Status status = connector_.Connect(config_, stopping_, connection);
	if (!status.ok()) {
		return status;
	}
	if (!*connection) {
		return grpc::Status(grpc::StatusCode::INTERNAL, "Connector returned no connection");
	}

	{
		absl::MutexLock lock(&mu_);
		active_connection_ = connection->get();
		if (stopping()) {
			active_connection_->Cancel();
		}
	}

	if (!(*connection)->Write(BuildSubscribeRequest(commitment_))) {
		grpc::Status finish = (*connection)->Finish();
		return grpc::Status(grpc::StatusCode::UNAVAILABLE,
				"Failed to create subscription: " + finish.error_message());
	}

	SetState(RunnerState::kSubscribed);
	LOG(INFO) << "[" << identity_ << "] Subscribed to slot updates (" << CommitmentName(commitment_)
		<< "), waiting for messages...";
	return grpc::Status::OK;
}

grpc::Status StreamRunner::ConsumeLoop(FeedConnection* connection, bool* received_any) {
	SetState(RunnerState::kConsuming);
	geyser::SubscribeUpdate update;

	while (connection->Read(&update)) {
		// Stamp before anything else touches the message
		const Nanos received_at = clock_.ElapsedNanos();
		*received_any = true;

		if (update.update_oneof_case() == geyser::SubscribeUpdate::UPDATE_ONEOF_NOT_SET) {
			LOG(ERROR) << "[" << identity_ << "] Update not found in the message";
			connection->Cancel();
			grpc::Status finish = connection->Finish();
			VLOG(2) << "[" << identity_ << "] Stream finished with " << finish.error_code();
			return grpc::Status(grpc::StatusCode::INTERNAL, "Update not found in message");
		}

		if (!Dispatch(connection, update, received_at)) {
			grpc::Status finish = connection->Finish();
			return grpc::Status(grpc::StatusCode::UNAVAILABLE,
					"Failed to reply to ping: " + finish.error_message());
		}
		update.Clear();
	}

	grpc::Status status = connection->Finish();
	LOG(WARNING) << "[" << identity_ << "] Stream closed";
	if (status.ok()) {
		return grpc::Status(grpc::StatusCode::UNAVAILABLE, "Stream closed by server");
	}
	return status;
}

bool StreamRunner::Dispatch(FeedConnection* connection, const geyser::SubscribeUpdate& update, Nanos received_at) {
	switch (update.update_oneof_case()) {
		case geyser::SubscribeUpdate::kSlot: {
			const auto& slot = update.slot();
			VLOG(1) << "[" << identity_ << "] Slot update: slot=" << slot.slot()
				<< ", parent=" << (slot.has_parent() ? slot.parent() : 0)
				<< ", status=" << geyser::SlotStatus_Name(slot.status())
				<< ", received_at=" << NanosToMs(received_at) << "ms (" << received_at << "ns)";
			sink_.SendSlot(slot.slot(), identity_, received_at);
			slots_emitted_.fetch_add(1, std::memory_order_relaxed);
			return true;
		}
		case geyser::SubscribeUpdate::kPing: {
			VLOG(1) << "[" << identity_ << "] Received ping from server - replying to keep connection alive";
			geyser::SubscribeRequest reply;
			reply.mutable_ping()->set_id(1);
			if (!connection->Write(reply)) {
				LOG(ERROR) << "[" << identity_ << "] Failed to send ping reply";
				return false;
			}
			return true;
		}
		case geyser::SubscribeUpdate::kPong:
			VLOG(1) << "[" << identity_ << "] Received pong response with id: " << update.pong().id();
			return true;
		case geyser::SubscribeUpdate::kAccount:
			update_logger_.OnAccount(update.account());
			return true;
		case geyser::SubscribeUpdate::kTransaction:
			update_logger_.OnTransaction(update.transaction());
			return true;
		case geyser::SubscribeUpdate::kTransactionStatus:
			update_logger_.OnTransactionStatus(update.transaction_status());
			return true;
		case geyser::SubscribeUpdate::kBlock:
			update_logger_.OnBlock(update.block());
			return true;
		case geyser::SubscribeUpdate::kBlockMeta:
			update_logger_.OnBlockMeta(update.block_meta());
			return true;
		case geyser::SubscribeUpdate::kEntry:
			update_logger_.OnEntry(update.entry());
			return true;
		case geyser::SubscribeUpdate::UPDATE_ONEOF_NOT_SET:
			break;
	}
	LOG(WARNING) << "[" << identity_ << "] Received unknown update type";
	return true;
}

} // namespace SlotRace
