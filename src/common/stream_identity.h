#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace SlotRace {

/**
 * Stable identity of a configured stream.
 * The id is the stream's index in the configuration; name and endpoint are for display.
 * Two identities are the same stream iff their ids are equal.
 */
struct StreamIdentity {
	uint32_t id = 0;
	std::string name;
	std::string endpoint;

	StreamIdentity() = default;
	StreamIdentity(uint32_t i, std::string n, std::string e)
		: id(i), name(std::move(n)), endpoint(std::move(e)) {}

	bool operator==(const StreamIdentity& other) const { return id == other.id; }
	bool operator!=(const StreamIdentity& other) const { return id != other.id; }

	template <typename H>
	friend H AbslHashValue(H h, const StreamIdentity& s) {
		return H::combine(std::move(h), s.id);
	}
};

inline std::ostream& operator<<(std::ostream& os, const StreamIdentity& s) {
	return os << s.name;
}

} // namespace SlotRace
