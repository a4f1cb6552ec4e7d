#ifndef WCH_USBTRANSPORT_H
#define WCH_USBTRANSPORT_H

#include <string>
#include <libusb-1.0/libusb.h>

#include "WCH_Transport.h"

/* WCH ISP vid and pid */
#define WCH_USB_VID     0x4348
#define WCH_USB_VID_ALT 0x1A86
#define WCH_USB_PID     0x55E0

#define WCH_USB_EP_OUT  0x02
#define WCH_USB_EP_IN   0x82

class WCH_UsbTransport : public WCH_Transport
{
public:
	WCH_UsbTransport();
	~WCH_UsbTransport();

	bool Open();
	bool ClaimInterface(int iConfig, int iInterface);
	bool Write(const uint8_t *p8Buff, uint32_t u32Length, uint32_t u32TimeoutMs);
	bool Read(uint8_t *p8Buff, uint32_t u32Capacity, uint32_t &u32Received, uint32_t u32TimeoutMs);
	void Close();

	const char *LastError() const { return strError.c_str(); }

	/* Number of attached devices in ISP mode, -1 on libusb failure */
	static int Count();

private:
	bool Fail(const char *what, int rc);

	libusb_context *context;
	libusb_device_handle *handle;
	int iClaimed;
	std::string strError;
};

#endif
