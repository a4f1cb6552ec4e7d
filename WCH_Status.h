#ifndef WCH_STATUS_H
#define WCH_STATUS_H

#include <string>

/* Error kinds, callers branch on these and never on the message text */
enum WCH_ErrorKind {
	WCH_OK = 0,
	WCH_ERR_TRANSPORT,   /* usb write/read failed or timed out */
	WCH_ERR_PROTOCOL,    /* non-ok status or malformed frame */
	WCH_ERR_CHECKSUM,    /* isp key checksum or verify mismatch */
	WCH_ERR_UNSUPPORTED, /* operation not implemented for this chip */
	WCH_ERR_NO_EEPROM,   /* chip has no data eeprom */
	WCH_ERR_LOOKUP,      /* unknown chip identification */
	WCH_ERR_FILE         /* firmware image could not be loaded */
};

class WCH_Status
{
public:
	WCH_Status() : eKind(WCH_OK) {}
	WCH_Status(WCH_ErrorKind kind, const std::string &msg) : eKind(kind), strMsg(msg) {}

	bool Ok() const { return eKind == WCH_OK; }
	WCH_ErrorKind Kind() const { return eKind; }
	const std::string &Message() const { return strMsg; }

	static const char *KindName(WCH_ErrorKind kind);

private:
	WCH_ErrorKind eKind;
	std::string strMsg;
};

#endif
