#ifndef WCH_BINIO_H
#define WCH_BINIO_H

#include <stdint.h>
#include <stdio.h>
#include <string>
#include <vector>

#include "WCH_Status.h"

/* Hex images linked at the flash alias are rebased to 0 */
#define WCH_FLASH_BASE    0x08000000
#define WCH_IMAGE_MAX     (16 * 1024 * 1024)

/* Loads a firmware image, raw binary or Intel HEX, as a flat buffer from address 0 */
class WCH_BinIO
{
public:
	WCH_BinIO() {}

	/* .hex and .ihex are parsed as Intel HEX, anything else is raw */
	WCH_Status Read(const char *path);
	WCH_Status ReadBin(const char *path);
	WCH_Status ReadHex(const char *path);

	const std::vector<uint8_t> &Data() const { return data; }
	uint32_t Size() const { return (uint32_t)data.size(); }

private:
	static int HexToNum(const char *str, int sz);
	static bool ReadLine(FILE *file, std::string &line);
	WCH_Status Store(uint32_t u32Address, const uint8_t *p8Data, uint32_t u32Length);

	std::vector<uint8_t> data;
};

#endif
