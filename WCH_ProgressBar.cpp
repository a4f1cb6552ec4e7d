#include "WCH_ProgressBar.h"

void WCH_ProgressBar::Display()
{
	uint32_t done = (uint64_t)u32Pos * u32Num / u32Max;

	fputc('\r', fOut);
	fputc('[', fOut);
	for (uint32_t i = 0; i < u32Num; ++i) {
		fputc(i < done ? '#' : ' ', fOut);
	}
	fprintf(fOut, "] %3u%%", (uint32_t)((uint64_t)u32Pos * 100 / u32Max));
	fflush(fOut);
}
