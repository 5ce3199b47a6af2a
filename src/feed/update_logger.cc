#include "update_logger.h"

#include <glog/logging.h>

#include "base58.h"

namespace SlotRace {

void UpdateLogger::OnAccount(const geyser::SubscribeUpdateAccount& update) const {
	if (!update.has_account()) {
		LOG(WARNING) << "[" << stream_name_ << "] Account update with no account info, slot=" << update.slot();
		return;
	}
	const auto& account = update.account();
	LOG(INFO) << "[" << stream_name_ << "] Account update: pubkey=" << Base58Encode(account.pubkey())
		<< ", slot=" << update.slot() << ", lamports=" << account.lamports();
}

void UpdateLogger::OnTransaction(const geyser::SubscribeUpdateTransaction& update) const {
	if (!update.has_transaction()) {
		VLOG(1) << "[" << stream_name_ << "] Transaction update with no transaction info";
		return;
	}
	const auto& info = update.transaction();
	if (!info.has_transaction()) {
		VLOG(1) << "[" << stream_name_ << "] Transaction update with no transaction data";
		return;
	}
	if (!info.transaction().has_message()) {
		VLOG(1) << "[" << stream_name_ << "] Transaction update with no message";
		return;
	}
	const auto& message = info.transaction().message();

	LOG(INFO) << "[" << stream_name_ << "] Transaction update: signature=" << Base58Encode(info.signature())
		<< ", slot=" << update.slot();
	VLOG(2) << "[" << stream_name_ << "]   Accounts: " << message.account_keys_size()
		<< ", Instructions: " << message.instructions_size();

	if (info.has_meta()) {
		const auto& meta = info.meta();
		if (meta.has_err()) {
			VLOG(2) << "[" << stream_name_ << "]   Status: FAILED";
		} else {
			VLOG(2) << "[" << stream_name_ << "]   Status: SUCCESS";
		}
		if (meta.has_compute_units_consumed()) {
			VLOG(2) << "[" << stream_name_ << "]   Compute units: " << meta.compute_units_consumed();
		}
	}
}

void UpdateLogger::OnTransactionStatus(const geyser::SubscribeUpdateTransactionStatus& update) const {
	VLOG(1) << "[" << stream_name_ << "] Transaction status: signature=" << Base58Encode(update.signature())
		<< ", slot=" << update.slot() << ", " << (update.has_err() ? "FAILED" : "SUCCESS");
}

void UpdateLogger::OnBlock(const geyser::SubscribeUpdateBlock& update) const {
	LOG(INFO) << "[" << stream_name_ << "] Block update: slot=" << update.slot()
		<< ", blockhash=" << update.blockhash();
}

void UpdateLogger::OnBlockMeta(const geyser::SubscribeUpdateBlockMeta& update) const {
	VLOG(1) << "[" << stream_name_ << "] Block meta: slot=" << update.slot()
		<< ", blockhash=" << update.blockhash()
		<< ", transactions=" << update.executed_transaction_count();
}

void UpdateLogger::OnEntry(const geyser::SubscribeUpdateEntry& update) const {
	VLOG(3) << "[" << stream_name_ << "] Entry: slot=" << update.slot() << ", index=" << update.index();
}

} // namespace SlotRace
