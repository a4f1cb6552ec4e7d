#include <stdio.h>

#include "WCH_UsbTransport.h"

static bool IsIspDevice(const libusb_device_descriptor &desc)
{
	return (desc.idVendor == WCH_USB_VID || desc.idVendor == WCH_USB_VID_ALT)
		&& desc.idProduct == WCH_USB_PID;
}

WCH_UsbTransport::WCH_UsbTransport()
	: context(NULL), handle(NULL), iClaimed(-1)
{
}

WCH_UsbTransport::~WCH_UsbTransport()
{
	Close();
}

bool WCH_UsbTransport::Fail(const char *what, int rc)
{
	char msg[128];
	snprintf(msg, sizeof(msg), "%s: %s", what, libusb_error_name(rc));
	strError = msg;
	return false;
}

int WCH_UsbTransport::Count()
{
	libusb_context *ctx = NULL;
	libusb_device **deviceList = NULL;
	int found = 0;

	if (libusb_init(&ctx) < 0) {
		return -1;
	}

	ssize_t deviceCount = libusb_get_device_list(ctx, &deviceList);
	if (deviceCount < 0) {
		libusb_exit(ctx);
		return -1;
	}

	for (ssize_t idx = 0; idx < deviceCount; ++idx) {
		libusb_device_descriptor desc = {0};
		if (libusb_get_device_descriptor(deviceList[idx], &desc) < 0) {
			continue;
		}
		if (IsIspDevice(desc)) {
			++found;
		}
	}

	libusb_free_device_list(deviceList, 1);
	libusb_exit(ctx);
	return found;
}

bool WCH_UsbTransport::Open()
{
	libusb_device **deviceList = NULL;
	int rc;

	Close();

	rc = libusb_init(&context);
	if (rc < 0) {
		context = NULL;
		return Fail("Cannot initialize libusb", rc);
	}

	ssize_t deviceCount = libusb_get_device_list(context, &deviceList);
	if (deviceCount < 0) {
		return Fail("Cannot list usb devices", (int)deviceCount);
	}

	/* first device in ISP mode wins */
	rc = LIBUSB_ERROR_NO_DEVICE;
	for (ssize_t idx = 0; idx < deviceCount; ++idx) {
		libusb_device_descriptor desc = {0};
		if (libusb_get_device_descriptor(deviceList[idx], &desc) < 0) {
			continue;
		}
		if (IsIspDevice(desc)) {
			rc = libusb_open(deviceList[idx], &handle);
			break;
		}
	}
	libusb_free_device_list(deviceList, 1);

	if (rc != 0) {
		handle = NULL;
		return Fail("Cannot open WCH ISP device", rc);
	}
	return true;
}

bool WCH_UsbTransport::ClaimInterface(int iConfig, int iInterface)
{
	int current = -1;
	int rc;

	if (handle == NULL) {
		return Fail("Claim interface", LIBUSB_ERROR_NO_DEVICE);
	}

	libusb_set_auto_detach_kernel_driver(handle, 1);

	rc = libusb_get_configuration(handle, &current);
	if (rc != 0) {
		return Fail("Get configuration", rc);
	}
	if (current != iConfig) {
		rc = libusb_set_configuration(handle, iConfig);
		if (rc != 0) {
			return Fail("Set configuration", rc);
		}
	}

	rc = libusb_claim_interface(handle, iInterface);
	if (rc != 0) {
		return Fail("Claim interface", rc);
	}
	iClaimed = iInterface;
	return true;
}

bool WCH_UsbTransport::Write(const uint8_t *p8Buff, uint32_t u32Length, uint32_t u32TimeoutMs)
{
	int len = 0;
	int rc;

	if (handle == NULL) {
		return Fail("Write", LIBUSB_ERROR_NO_DEVICE);
	}
	rc = libusb_bulk_transfer(handle, WCH_USB_EP_OUT, (unsigned char *)p8Buff, (int)u32Length, &len, u32TimeoutMs);
	if (rc != 0) {
		return Fail("Write", rc);
	}
	if ((uint32_t)len != u32Length) {
		char msg[64];
		snprintf(msg, sizeof(msg), "Write: short transfer %d of %u bytes", len, u32Length);
		strError = msg;
		return false;
	}
	return true;
}

bool WCH_UsbTransport::Read(uint8_t *p8Buff, uint32_t u32Capacity, uint32_t &u32Received, uint32_t u32TimeoutMs)
{
	int len = 0;
	int rc;

	u32Received = 0;
	if (handle == NULL) {
		return Fail("Read", LIBUSB_ERROR_NO_DEVICE);
	}
	rc = libusb_bulk_transfer(handle, WCH_USB_EP_IN, p8Buff, (int)u32Capacity, &len, u32TimeoutMs);
	if (rc != 0) {
		return Fail("Read", rc);
	}
	u32Received = (uint32_t)len;
	return true;
}

void WCH_UsbTransport::Close()
{
	/* interface first, then the handle, then the context */
	if (handle != NULL && iClaimed >= 0) {
		libusb_release_interface(handle, iClaimed);
	}
	iClaimed = -1;

	if (handle != NULL) {
		libusb_close(handle);
		handle = NULL;
	}

	if (context != NULL) {
		libusb_exit(context);
		context = NULL;
	}
}
