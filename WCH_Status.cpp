#include "WCH_Status.h"

const char *WCH_Status::KindName(WCH_ErrorKind kind)
{
	switch (kind) {
		case WCH_OK:              return "ok";
		case WCH_ERR_TRANSPORT:   return "transport error";
		case WCH_ERR_PROTOCOL:    return "protocol error";
		case WCH_ERR_CHECKSUM:    return "checksum mismatch";
		case WCH_ERR_UNSUPPORTED: return "unsupported operation";
		case WCH_ERR_NO_EEPROM:   return "no data eeprom";
		case WCH_ERR_LOOKUP:      return "chip lookup failed";
		case WCH_ERR_FILE:        return "file error";
	}
	return "unknown error";
}
