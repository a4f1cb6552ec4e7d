#ifndef WCH_TRANSPORT_H
#define WCH_TRANSPORT_H

#include <stdint.h>

/* Exclusive duplex byte channel to one device, bulk OUT / bulk IN */
class WCH_Transport
{
public:
	virtual ~WCH_Transport() {}

	virtual bool Open() = 0;
	virtual bool ClaimInterface(int iConfig, int iInterface) = 0;
	virtual bool Write(const uint8_t *p8Buff, uint32_t u32Length, uint32_t u32TimeoutMs) = 0;
	/* u32Received is set to the number of bytes actually read */
	virtual bool Read(uint8_t *p8Buff, uint32_t u32Capacity, uint32_t &u32Received, uint32_t u32TimeoutMs) = 0;
	/* Safe to call more than once, and after a failed Open */
	virtual void Close() = 0;

	virtual const char *LastError() const = 0;
};

#endif
