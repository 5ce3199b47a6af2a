#include "grpc_feed_connector.h"

#include <algorithm>
#include <chrono>

#include <glog/logging.h>

#include "common/config.h"

namespace SlotRace {

std::optional<ParsedEndpoint> ParseEndpoint(const std::string& endpoint) {
	ParsedEndpoint parsed;
	std::string rest;
	std::string default_port;
	if (endpoint.rfind("https://", 0) == 0) {
		rest = endpoint.substr(8);
		parsed.use_tls = true;
		default_port = "443";
	} else if (endpoint.rfind("http://", 0) == 0) {
		rest = endpoint.substr(7);
		parsed.use_tls = false;
		default_port = "80";
	} else {
		return std::nullopt;
	}

	// Drop any path component
	size_t slash = rest.find('/');
	if (slash != std::string::npos) {
		rest = rest.substr(0, slash);
	}
	if (rest.empty()) {
		return std::nullopt;
	}

	// Bracketed IPv6 literal: [::1]:10000
	size_t host_end = 0;
	if (rest[0] == '[') {
		host_end = rest.find(']');
		if (host_end == std::string::npos) {
			return std::nullopt;
		}
		host_end++;
	} else {
		host_end = rest.find(':');
		if (host_end == std::string::npos) {
			host_end = rest.size();
		}
	}

	if (host_end == 0) {
		return std::nullopt;
	}
	if (host_end < rest.size() && rest[host_end] == ':') {
		if (host_end + 1 == rest.size()) {
			return std::nullopt;
		}
		parsed.target = rest;
	} else if (host_end == rest.size()) {
		parsed.target = rest + ":" + default_port;
	} else {
		return std::nullopt;
	}
	return parsed;
}

//
// GrpcFeedConnection implementation
//

GrpcFeedConnection::GrpcFeedConnection(const std::shared_ptr<grpc::Channel>& channel,
		const std::optional<std::string>& access_token)
	: stub_(geyser::Geyser::NewStub(channel)) {
	if (access_token.has_value() && !access_token->empty()) {
		context_.AddMetadata(ACCESS_TOKEN_HEADER, *access_token);
	}
	stream_ = stub_->Subscribe(&context_);
}

GrpcFeedConnection::~GrpcFeedConnection() {
	if (!finished_ && stream_) {
		context_.TryCancel();
		grpc::Status status = stream_->Finish();
		VLOG(3) << "Subscribe stream closed on teardown: " << status.error_code();
	}
}

bool GrpcFeedConnection::Write(const geyser::SubscribeRequest& request) {
	return stream_ && stream_->Write(request);
}

bool GrpcFeedConnection::Read(geyser::SubscribeUpdate* update) {
	return stream_ && stream_->Read(update);
}

void GrpcFeedConnection::Cancel() {
	context_.TryCancel();
}

grpc::Status GrpcFeedConnection::Finish() {
	if (finished_) {
		return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "stream already finished");
	}
	finished_ = true;
	if (!stream_) {
		return grpc::Status(grpc::StatusCode::INTERNAL, "stream was never opened");
	}
	return stream_->Finish();
}

//
// GrpcFeedConnector implementation
//

grpc::Status GrpcFeedConnector::Connect(const StreamConfig& config, const std::atomic<bool>& stopping,
		std::unique_ptr<FeedConnection>* connection) {
	std::optional<ParsedEndpoint> parsed = ParseEndpoint(config.endpoint);
	if (!parsed.has_value()) {
		return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Malformed endpoint " + config.endpoint);
	}

	std::shared_ptr<grpc::ChannelCredentials> credentials = parsed->use_tls
		? grpc::SslCredentials(grpc::SslCredentialsOptions())
		: grpc::InsecureChannelCredentials();

	grpc::ChannelArguments args;
	// Block updates can be large
	args.SetMaxReceiveMessageSize(-1);
	args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, 10000);
	args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, 5000);
	args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);

	std::shared_ptr<grpc::Channel> channel = grpc::CreateCustomChannel(parsed->target, credentials, args);

	const std::chrono::system_clock::time_point deadline =
		std::chrono::system_clock::now() + std::chrono::seconds(connect_timeout_sec_);
	const std::chrono::milliseconds slice(kConnectPollIntervalMs);
	while (true) {
		if (stopping.load(std::memory_order_acquire)) {
			return grpc::Status(grpc::StatusCode::CANCELLED, "Connect to " + parsed->target + " abandoned, stopping");
		}
		const std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
		if (now >= deadline) {
			return grpc::Status(grpc::StatusCode::UNAVAILABLE,
					"Failed to connect to " + parsed->target + " within " + std::to_string(connect_timeout_sec_) + "s");
		}
		const std::chrono::system_clock::time_point next = now + slice;
		if (channel->WaitForConnected(std::min(deadline, next))) {
			break;
		}
	}

	*connection = std::make_unique<GrpcFeedConnection>(channel, config.access_token);
	return grpc::Status::OK;
}

} // namespace SlotRace
