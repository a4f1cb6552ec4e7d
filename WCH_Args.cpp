#include <errno.h>
#include <stdlib.h>

#include "WCH_Args.h"

bool WCH_ParseUint(const char *str, uint32_t &value)
{
	char *end = NULL;
	unsigned long v;

	if (str == NULL || *str == '\0' || *str == '-') {
		return false;
	}
	errno = 0;
	v = strtoul(str, &end, 0);
	if (errno != 0 || end == str || *end != '\0' || v > 0xFFFFFFFFUL) {
		return false;
	}
	value = (uint32_t)v;
	return true;
}
