#include "WCH_Key.h"

uint8_t WCH_XorKey::KeyChecksum() const
{
	uint8_t u8Sum = 0;
	for (uint32_t i = 0; i < WCH_KEY_SIZE; ++i) {
		u8Sum += u8Key[i];
	}
	return u8Sum;
}

uint8_t WCH_Key::Checksum(const std::vector<uint8_t> &bytes)
{
	uint8_t u8Sum = 0;
	for (size_t i = 0; i < bytes.size(); ++i) {
		u8Sum += bytes[i];
	}
	return u8Sum;
}

WCH_XorKey WCH_Key::Derive(const std::vector<uint8_t> &chipUid, uint8_t u8ChipId)
{
	WCH_XorKey key;

	key.u8Checksum = Checksum(chipUid);
	for (uint32_t i = 0; i < WCH_KEY_SIZE; ++i) {
		key.u8Key[i] = key.u8Checksum;
	}
	key.u8Key[WCH_KEY_SIZE - 1] += u8ChipId;
	return key;
}

void WCH_Key::Apply(std::vector<uint8_t> &data, const WCH_XorKey &key)
{
	for (size_t i = 0; i < data.size(); ++i) {
		data[i] ^= key.u8Key[i % WCH_KEY_SIZE];
	}
}
