#ifndef WCH_FRAME_H
#define WCH_FRAME_H

#include <stdint.h>
#include <stddef.h>
#include <vector>

#include "WCH_Status.h"

/* ISP command codes */
#define WCH_CMD_IDENTIFY     0xA1
#define WCH_CMD_ISP_END      0xA2
#define WCH_CMD_ISP_KEY      0xA3
#define WCH_CMD_ERASE        0xA4
#define WCH_CMD_PROGRAM      0xA5
#define WCH_CMD_VERIFY       0xA6
#define WCH_CMD_READ_CONFIG  0xA7
#define WCH_CMD_WRITE_CONFIG 0xA8
#define WCH_CMD_DATA_ERASE   0xA9
#define WCH_CMD_DATA_PROGRAM 0xAA
#define WCH_CMD_DATA_READ    0xAB

/* Config register masks */
#define WCH_CFG_MASK_RDPR_USER_DATA_WPR 0x07
#define WCH_CFG_MASK_BTVER              0x08
#define WCH_CFG_MASK_UID                0x10
#define WCH_CFG_MASK_ALL                0x1F

/* [cmd][len lo][len hi] */
#define WCH_CMD_HEADER_SIZE  3
/* [cmd][status][len lo][len hi] */
#define WCH_RESP_HEADER_SIZE 4

#define WCH_ISP_KEY_SEED_SIZE 0x1E

struct WCH_Response
{
	uint8_t u8Cmd;
	uint8_t u8Status;
	std::vector<uint8_t> payload;

	bool IsOk() const { return u8Status == 0x00; }
};

/* Encodes outbound command frames and decodes device responses */
class WCH_Frame
{
public:
	static std::vector<uint8_t> Encode(uint8_t u8Cmd, const std::vector<uint8_t> &payload);

	static std::vector<uint8_t> Identify(uint8_t u8DeviceId, uint8_t u8DeviceType);
	static std::vector<uint8_t> IspEnd(uint8_t u8Reason);
	static std::vector<uint8_t> IspKey(const std::vector<uint8_t> &seed);
	static std::vector<uint8_t> Erase(uint32_t u32Sectors);
	static std::vector<uint8_t> Program(uint32_t u32Address, uint8_t u8Padding, const std::vector<uint8_t> &data);
	static std::vector<uint8_t> Verify(uint32_t u32Address, uint8_t u8Padding, const std::vector<uint8_t> &data);
	static std::vector<uint8_t> ReadConfig(uint8_t u8Mask);
	static std::vector<uint8_t> WriteConfig(uint8_t u8Mask, const std::vector<uint8_t> &data);

	/* raw is not modified, u32Length is the number of bytes actually received */
	static WCH_Status Decode(const uint8_t *raw, uint32_t u32Length, WCH_Response &resp);

	static const char *CommandName(uint8_t u8Cmd);

private:
	static std::vector<uint8_t> AddressedData(uint32_t u32Address, uint8_t u8Padding, const std::vector<uint8_t> &data);
};

#endif
