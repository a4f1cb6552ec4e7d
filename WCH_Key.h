#ifndef WCH_KEY_H
#define WCH_KEY_H

#include <stdint.h>
#include <stddef.h>
#include <vector>

#define WCH_KEY_SIZE   8
#define WCH_CHUNK_SIZE 56

/* Keystream is indexed by position within a chunk, which only matches an
 * image-offset keystream while the chunk size is a whole number of keys. */
static_assert(WCH_CHUNK_SIZE % WCH_KEY_SIZE == 0, "chunk size must be a multiple of the xor key size");

struct WCH_XorKey
{
	uint8_t u8Key[WCH_KEY_SIZE];
	uint8_t u8Checksum; /* wrapping sum of the chip uid bytes */

	/* what the device answers to ISP_KEY */
	uint8_t KeyChecksum() const;
};

class WCH_Key
{
public:
	static uint8_t Checksum(const std::vector<uint8_t> &bytes);
	static WCH_XorKey Derive(const std::vector<uint8_t> &chipUid, uint8_t u8ChipId);
	static void Apply(std::vector<uint8_t> &data, const WCH_XorKey &key);
};

#endif
