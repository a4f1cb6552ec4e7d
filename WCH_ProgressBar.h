#ifndef WCH_PROGRESSBAR_H
#define WCH_PROGRESSBAR_H

#include <stdint.h>
#include <stdio.h>

/* [#####     ]  50% */
class WCH_ProgressBar
{
public:
	explicit WCH_ProgressBar(FILE *out = stdout)
		: fOut(out), u32Max(1), u32Num(50), u32Pos(0) {}

	void SetMax(uint32_t max) { u32Max = max ? max : 1; }
	void SetNum(uint32_t num) { u32Num = num; }
	void SetPos(uint32_t pos) { u32Pos = pos > u32Max ? u32Max : pos; }
	void Display();

private:
	FILE *fOut;
	uint32_t u32Max;
	uint32_t u32Num;
	uint32_t u32Pos;
};

#endif
