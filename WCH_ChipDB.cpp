#include <stddef.h>

#include "WCH_ChipDB.h"

/* name, chip id, type id, flash, eeprom, sector, min erase sectors, protect */
static const WCH_ChipDescriptor s_chipList[] = {
	/* CH55x */
	{ "CH551",        0x51, 0x11,  10 * 1024,  128,       1024, 8, false },
	{ "CH552",        0x52, 0x11,  16 * 1024,  128,       1024, 8, false },
	{ "CH554",        0x54, 0x11,  16 * 1024,  128,       1024, 8, false },
	{ "CH555",        0x55, 0x11,  64 * 1024,  1024,      1024, 8, false },
	{ "CH556",        0x56, 0x11,  64 * 1024,  1024,      1024, 8, false },
	{ "CH557",        0x57, 0x11,  64 * 1024,  1024,      1024, 8, false },
	{ "CH558",        0x58, 0x11,  32 * 1024,  5 * 1024,  1024, 8, false },
	{ "CH559",        0x59, 0x11,  64 * 1024,  1024,      1024, 8, false },
	/* CH56x */
	{ "CH569",        0x69, 0x10, 448 * 1024, 32 * 1024,  4096, 8, false },
	/* CH57x */
	{ "CH573",        0x73, 0x13, 448 * 1024, 32 * 1024,  4096, 8, true  },
	/* CH58x */
	{ "CH582",        0x82, 0x16, 448 * 1024, 32 * 1024,  4096, 8, true  },
	{ "CH583",        0x83, 0x16, 448 * 1024, 32 * 1024,  4096, 8, true  },
	/* CH32F103 */
	{ "CH32F103C8T6", 0x3F, 0x14,  64 * 1024,  0,         1024, 8, true  },
	/* CH32V103 */
	{ "CH32V103C8T6", 0x3F, 0x15,  64 * 1024,  0,         1024, 8, true  },
	/* CH32V30x */
	{ "CH32V303VCT6", 0x30, 0x17, 256 * 1024,  0,         1024, 8, true  },
	{ "CH32V305RBT6", 0x50, 0x17, 128 * 1024,  0,         1024, 8, true  },
	{ "CH32V307VCT6", 0x70, 0x17, 256 * 1024,  0,         1024, 8, true  },
	{ NULL, 0, 0, 0, 0, 0, 0, false }
};

const WCH_ChipDescriptor *WCH_StaticChipDB::Table()
{
	return s_chipList;
}

const WCH_ChipDescriptor *WCH_StaticChipDB::Find(uint8_t u8ChipId, uint8_t u8TypeId) const
{
	for (const WCH_ChipDescriptor *p = s_chipList; p->name != NULL; ++p) {
		if (p->u8ChipId == u8ChipId && p->u8TypeId == u8TypeId) {
			return p;
		}
	}
	return NULL;
}
