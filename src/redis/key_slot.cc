#include "key_slot.h"

namespace Ftsb {

uint16_t Crc16(const char* buf, size_t len) {
	uint16_t crc = 0;
	for (size_t i = 0; i < len; ++i) {
		crc ^= static_cast<uint16_t>(static_cast<uint8_t>(buf[i])) << 8;
		for (int bit = 0; bit < 8; ++bit) {
			if (crc & 0x8000) {
				crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
			} else {
				crc = static_cast<uint16_t>(crc << 1);
			}
		}
	}
	return crc;
}

uint16_t KeyHashSlot(const std::string& key) {
	size_t open = key.find('{');
	if (open != std::string::npos) {
		size_t close = key.find('}', open + 1);
		// "{}" hashes the whole key
		if (close != std::string::npos && close != open + 1) {
			return Crc16(key.data() + open + 1, close - open - 1) % kClusterSlots;
		}
	}
	return Crc16(key.data(), key.size()) % kClusterSlots;
}

}  // namespace Ftsb
