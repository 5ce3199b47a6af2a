#ifndef SLOTRACE_SRC_FEED_UPDATE_LOGGER_H_
#define SLOTRACE_SRC_FEED_UPDATE_LOGGER_H_

#include <string>
#include <utility>

#include <geyser.pb.h>

namespace SlotRace {

/**
 * Logs non-racing payloads (accounts, transactions, blocks). Never touches race state.
 */
class UpdateLogger {
public:
	explicit UpdateLogger(std::string stream_name) : stream_name_(std::move(stream_name)) {}

	void OnAccount(const geyser::SubscribeUpdateAccount& update) const;
	void OnTransaction(const geyser::SubscribeUpdateTransaction& update) const;
	void OnTransactionStatus(const geyser::SubscribeUpdateTransactionStatus& update) const;
	void OnBlock(const geyser::SubscribeUpdateBlock& update) const;
	void OnBlockMeta(const geyser::SubscribeUpdateBlockMeta& update) const;
	void OnEntry(const geyser::SubscribeUpdateEntry& update) const;

private:
	std::string stream_name_;
};

} // namespace SlotRace

#endif // SLOTRACE_SRC_FEED_UPDATE_LOGGER_H_
