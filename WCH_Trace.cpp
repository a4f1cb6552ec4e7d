#include <stdarg.h>

#include "WCH_Trace.h"

void WCH_ConsoleTrace::Transfer(WCH_Direction dir, const uint8_t *p8Buff, uint32_t u32Length)
{
	if (!bVerbose) {
		return;
	}
	fprintf(fOut, "Transport: %s ", dir == WCH_DIR_OUT ? "=>" : "<=");
	for (uint32_t i = 0; i < u32Length; ++i) {
		fprintf(fOut, "%02x", p8Buff[i]);
	}
	fprintf(fOut, "\n");
}

void WCH_ConsoleTrace::Info(const char *fmt, ...)
{
	va_list ap;
	va_start(ap, fmt);
	vfprintf(fOut, fmt, ap);
	va_end(ap);
	fprintf(fOut, "\n");
}
