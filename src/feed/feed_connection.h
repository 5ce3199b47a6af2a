#ifndef SLOTRACE_SRC_FEED_FEED_CONNECTION_H_
#define SLOTRACE_SRC_FEED_FEED_CONNECTION_H_

#include <atomic>
#include <memory>

#include <grpcpp/grpcpp.h>
#include <geyser.pb.h>

#include "common/configuration.h"

namespace SlotRace {

/**
 * One open Subscribe stream to a Geyser endpoint.
 * Read and Write are called from the owning runner thread only; Cancel may be called
 * from any thread to unblock a pending Read.
 */
class FeedConnection {
public:
	virtual ~FeedConnection() = default;

	virtual bool Write(const geyser::SubscribeRequest& request) = 0;

	/// Blocks for the next update. Returns false on end-of-stream or transport error.
	virtual bool Read(geyser::SubscribeUpdate* update) = 0;

	virtual void Cancel() = 0;

	/// Final status of the stream. Call once, after Read or Write returned false
	/// or after Cancel.
	virtual grpc::Status Finish() = 0;
};

/**
 * Opens FeedConnections for configured streams
 */
class FeedConnector {
public:
	virtual ~FeedConnector() = default;

	/// Gives up with CANCELLED soon after *stopping becomes true.
	virtual grpc::Status Connect(const StreamConfig& config, const std::atomic<bool>& stopping,
			std::unique_ptr<FeedConnection>* connection) = 0;
};

} // namespace SlotRace

#endif // SLOTRACE_SRC_FEED_FEED_CONNECTION_H_
