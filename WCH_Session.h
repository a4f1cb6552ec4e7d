#ifndef WCH_SESSION_H
#define WCH_SESSION_H

#include <stdint.h>
#include <memory>
#include <vector>

#include "WCH_ChipDB.h"
#include "WCH_Frame.h"
#include "WCH_Key.h"
#include "WCH_Status.h"
#include "WCH_Trace.h"
#include "WCH_Transport.h"

#define WCH_TIMEOUT_MS      1000
#define WCH_RX_BUFF_SIZE    64

#define WCH_USB_CONFIG      1
#define WCH_USB_INTERFACE   0

/* Layout of a READ_CONFIG payload */
#define WCH_CFG_OFFSET_REGS   2
#define WCH_CFG_REGS_SIZE     12
#define WCH_CFG_OFFSET_BTVER  14
#define WCH_BTVER_SIZE        4
#define WCH_CFG_OFFSET_UID    18
/* uid is the rest of the payload, at least this long */
#define WCH_UID_SIZE          8

/* RDPR unlock sentinel, first two config bytes */
#define WCH_RDPR_UNLOCK_0     0xA5
#define WCH_RDPR_UNLOCK_1     0x5A
/* WPR word within the config registers */
#define WCH_CFG_WPR_OFFSET    8

#define WCH_ISP_END_REBOOT    1

/*
 * One programming session with a device in ISP mode.
 *
 * Open() claims the transport, reads the configuration and identifies the
 * chip. Every other call is a blocking request/response over the transport.
 * Flash() and Verify() derive and exchange the xor key on each call.
 */
class WCH_Session
{
public:
	WCH_Session(const WCH_ChipDB &chipDB, WCH_Trace &trace);
	~WCH_Session();

	WCH_Status Open(std::unique_ptr<WCH_Transport> transport);
	void Close();
	bool IsOpen() const { return pTransport.get() != NULL && pChip != NULL; }

	WCH_Status Identify();
	WCH_Status ReadConfig(uint8_t u8Mask, std::vector<uint8_t> &payload);
	WCH_Status WriteConfig(uint8_t u8Mask, const std::vector<uint8_t> &data);
	WCH_Status Transfer(const std::vector<uint8_t> &frame, WCH_Response &resp);

	WCH_Status Flash(const std::vector<uint8_t> &image);
	WCH_Status Verify(const std::vector<uint8_t> &image);
	WCH_Status EraseCode(uint32_t u32Sectors);
	WCH_Status EraseData(uint32_t u32Sectors);
	WCH_Status UnProtect(bool force = false);
	WCH_Status Reset();

	WCH_XorKey XorKey() const;
	bool CheckChipName(const char *prefix) const;

	const WCH_ChipDescriptor *Chip() const { return pChip; }
	const std::vector<uint8_t> &ChipUid() const { return chipUid; }
	const std::vector<uint8_t> &BootloaderVersion() const { return btVer; }
	bool CodeFlashProtected() const { return bCodeFlashProtected; }
	/* payload of the last successful ReadConfig */
	const std::vector<uint8_t> &RawConfig() const { return rawConfig; }

private:
	typedef WCH_Status (WCH_Session::*ChunkOp)(uint32_t u32Address, std::vector<uint8_t> &chunk, const WCH_XorKey &key);

	WCH_Status RequireOpen() const;
	WCH_Status ExchangeKey(const WCH_XorKey &key);
	WCH_Status ProgramChunk(uint32_t u32Address, std::vector<uint8_t> &chunk, const WCH_XorKey &key);
	WCH_Status VerifyChunk(uint32_t u32Address, std::vector<uint8_t> &chunk, const WCH_XorKey &key);
	/* key exchange, then every chunk of the image through op */
	WCH_Status SendChunks(const std::vector<uint8_t> &image, ChunkOp op, uint32_t &u32Address);

	const WCH_ChipDB &chipDB;
	WCH_Trace &trace;
	std::unique_ptr<WCH_Transport> pTransport;

	const WCH_ChipDescriptor *pChip;
	std::vector<uint8_t> chipUid;
	std::vector<uint8_t> btVer;
	std::vector<uint8_t> rawConfig;
	bool bCodeFlashProtected;
};

#endif
