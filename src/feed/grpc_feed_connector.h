#ifndef SLOTRACE_SRC_FEED_GRPC_FEED_CONNECTOR_H_
#define SLOTRACE_SRC_FEED_GRPC_FEED_CONNECTOR_H_

#include <memory>
#include <optional>
#include <string>

#include <grpcpp/grpcpp.h>
#include <geyser.grpc.pb.h>

#include "feed_connection.h"

namespace SlotRace {

struct ParsedEndpoint {
	std::string target;  // host:port
	bool use_tls = true;
};

/**
 * Splits http(s)://host[:port][/path] into a gRPC target.
 * Port defaults to 443 for https and 80 for http.
 */
std::optional<ParsedEndpoint> ParseEndpoint(const std::string& endpoint);

class GrpcFeedConnection : public FeedConnection {
public:
	GrpcFeedConnection(const std::shared_ptr<grpc::Channel>& channel,
			const std::optional<std::string>& access_token);
	~GrpcFeedConnection() override;

	bool Write(const geyser::SubscribeRequest& request) override;
	bool Read(geyser::SubscribeUpdate* update) override;
	void Cancel() override;
	grpc::Status Finish() override;

private:
	std::unique_ptr<geyser::Geyser::Stub> stub_;
	grpc::ClientContext context_;
	std::unique_ptr<grpc::ClientReaderWriter<geyser::SubscribeRequest, geyser::SubscribeUpdate>> stream_;
	bool finished_ = false;
};

/**
 * Connects over TLS (https) or plaintext (http) and attaches the x-token header.
 * The readiness wait is sliced so a stopping runner is not held for the whole timeout.
 */
class GrpcFeedConnector : public FeedConnector {
public:
	explicit GrpcFeedConnector(int connect_timeout_sec) : connect_timeout_sec_(connect_timeout_sec) {}

	grpc::Status Connect(const StreamConfig& config, const std::atomic<bool>& stopping,
			std::unique_ptr<FeedConnection>* connection) override;

private:
	int connect_timeout_sec_;
};

} // namespace SlotRace

#endif // SLOTRACE_SRC_FEED_GRPC_FEED_CONNECTOR_H_
