#ifndef SLOTRACE_SRC_COMMON_CONFIG_H_
#define SLOTRACE_SRC_COMMON_CONFIG_H_

#include <cstdint>

/// Race defaults
/// Ledger capacity
const uint64_t kDefaultMaxSlots = 360;
/// Slots intended to be excluded from measurement after startup
const uint64_t kDefaultWarmupSlots = 10;
/// Interval between two periodic summaries
const int64_t kDefaultSummaryIntervalSec = 30;

/// Connection configs
/// Time allowed for a channel to become ready before the attempt counts as failed
const int64_t kDefaultConnectTimeoutSec = 10;
/// Granularity at which a pending connect notices a stop request
const int64_t kConnectPollIntervalMs = 100;
/// Name of the slot filter sent in every subscription
#define SLOT_FILTER_NAME "slotrace"
/// Metadata key carrying the access token
#define ACCESS_TOKEN_HEADER "x-token"

/// Reconnect backoff configs
const int64_t kDefaultBackoffInitialMs = 500;
const double kDefaultBackoffMultiplier = 1.5;
const int64_t kDefaultBackoffMaxMs = 60000;

#endif  // SLOTRACE_SRC_COMMON_CONFIG_H_
