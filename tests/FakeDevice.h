#ifndef WCH_TEST_FAKEDEVICE_H
#define WCH_TEST_FAKEDEVICE_H

#include <stdint.h>
#include <set>
#include <string>
#include <vector>

#include "WCH_Frame.h"
#include "WCH_Key.h"
#include "WCH_Transport.h"

/* Device state outlives the transport, the session deletes the transport on Close() */
struct FakeDeviceState
{
	FakeDeviceState();

	uint8_t u8ChipId;
	uint8_t u8TypeId;
	std::vector<uint8_t> regs;   /* RDPR USER DATA WPR */
	std::vector<uint8_t> btVer;
	std::vector<uint8_t> uid;
	std::vector<uint8_t> flash;

	/* failure injection */
	std::set<uint8_t> failCmds;
	bool bFailClaim;
	bool bTimeoutWrite;
	bool bShortConfig;
	int iKeyChecksumDelta;
	bool bCorruptFlash;
	uint32_t u32FailProgramAddress; /* 0xFFFFFFFF = never */

	/* observation */
	std::vector<std::vector<uint8_t> > frames;
	std::vector<uint32_t> programAddresses;
	std::vector<uint32_t> programLengths;
	std::vector<uint32_t> verifyAddresses;
	std::vector<uint32_t> eraseSectors;
	std::vector<std::string> lifecycle;

	size_t Count(uint8_t u8Cmd) const;
};

class FakeDevice : public WCH_Transport
{
public:
	explicit FakeDevice(FakeDeviceState &state) : s(state) {}
	~FakeDevice() { Close(); }

	bool Open();
	bool ClaimInterface(int iConfig, int iInterface);
	bool Write(const uint8_t *p8Buff, uint32_t u32Length, uint32_t u32TimeoutMs);
	bool Read(uint8_t *p8Buff, uint32_t u32Capacity, uint32_t &u32Received, uint32_t u32TimeoutMs);
	void Close();

	const char *LastError() const { return strError.c_str(); }

private:
	void Respond(uint8_t u8Cmd, uint8_t u8Status, const std::vector<uint8_t> &payload);
	void Handle(const std::vector<uint8_t> &frame);
	WCH_XorKey Key() const;

	FakeDeviceState &s;
	bool bOpen = false;
	bool bClaimed = false;
	std::vector<uint8_t> pending;
	std::string strError;
};

#endif
