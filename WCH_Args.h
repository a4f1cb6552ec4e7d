#ifndef WCH_ARGS_H
#define WCH_ARGS_H

#include <stdint.h>

/* Decimal, 0x hex or 0 octal, whole string, fits in 32 bits */
bool WCH_ParseUint(const char *str, uint32_t &value);

#endif
