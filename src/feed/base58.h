#pragma once

#include <string>

namespace SlotRace {

/// Bitcoin-alphabet base58, as used for Solana pubkeys and signatures.
/// Each leading zero byte maps to a leading '1'.
std::string Base58Encode(const std::string& bytes);

} // namespace SlotRace
