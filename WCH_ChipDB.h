#ifndef WCH_CHIPDB_H
#define WCH_CHIPDB_H

#include <stdint.h>

struct WCH_ChipDescriptor
{
	const char *name;
	uint8_t u8ChipId;
	uint8_t u8TypeId;
	uint32_t u32FlashSize;
	uint32_t u32EepromSize;     /* 0 if the chip has no data eeprom */
	uint32_t u32SectorSize;
	uint32_t u32MinEraseSectors;
	bool bCodeFlashProtect;
};

/* Lookup of a chip by the two identification bytes the device reports */
class WCH_ChipDB
{
public:
	virtual ~WCH_ChipDB() {}
	/* NULL if unknown */
	virtual const WCH_ChipDescriptor *Find(uint8_t u8ChipId, uint8_t u8TypeId) const = 0;
};

/* Built-in, immutable chip table */
class WCH_StaticChipDB : public WCH_ChipDB
{
public:
	const WCH_ChipDescriptor *Find(uint8_t u8ChipId, uint8_t u8TypeId) const;

	static const WCH_ChipDescriptor *Table();
};

#endif
