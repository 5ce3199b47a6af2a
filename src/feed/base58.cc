#include "base58.h"

#include <cstdint>
#include <vector>

namespace SlotRace {

namespace {
const char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

std::string Base58Encode(const std::string& bytes) {
	size_t zeros = 0;
	while (zeros < bytes.size() && bytes[zeros] == '\0') {
		zeros++;
	}

	// log(256)/log(58) ~= 1.37
	std::vector<uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1, 0);
	size_t length = 0;
	for (size_t i = zeros; i < bytes.size(); ++i) {
		int carry = static_cast<uint8_t>(bytes[i]);
		size_t j = 0;
		for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
			carry += 256 * (*it);
			*it = static_cast<uint8_t>(carry % 58);
			carry /= 58;
		}
		length = j;
	}

	auto it = digits.begin() + (digits.size() - length);
	while (it != digits.end() && *it == 0) {
		++it;
	}
	std::string result(zeros, '1');
	result.reserve(zeros + length);
	for (; it != digits.end(); ++it) {
		result.push_back(kAlphabet[*it]);
	}
	return result;
}

} // namespace SlotRace
