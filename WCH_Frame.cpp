#include <stdio.h>
#include <string.h>

#include "WCH_Frame.h"

/* Identify magic */
static const char s8IdentifyMagic[] = "MCU ISP & WCH.CN";

std::vector<uint8_t> WCH_Frame::Encode(uint8_t u8Cmd, const std::vector<uint8_t> &payload)
{
	std::vector<uint8_t> frame;
	uint16_t u16Len = (uint16_t)payload.size();

	frame.reserve(WCH_CMD_HEADER_SIZE + payload.size());
	frame.push_back(u8Cmd);
	frame.push_back((uint8_t)u16Len);
	frame.push_back((uint8_t)(u16Len >> 8));
	frame.insert(frame.end(), payload.begin(), payload.end());
	return frame;
}

std::vector<uint8_t> WCH_Frame::Identify(uint8_t u8DeviceId, uint8_t u8DeviceType)
{
	std::vector<uint8_t> payload;
	payload.push_back(u8DeviceId);
	payload.push_back(u8DeviceType);
	payload.insert(payload.end(), s8IdentifyMagic, s8IdentifyMagic + strlen(s8IdentifyMagic));
	return Encode(WCH_CMD_IDENTIFY, payload);
}

std::vector<uint8_t> WCH_Frame::IspEnd(uint8_t u8Reason)
{
	return Encode(WCH_CMD_ISP_END, std::vector<uint8_t>(1, u8Reason));
}

std::vector<uint8_t> WCH_Frame::IspKey(const std::vector<uint8_t> &seed)
{
	return Encode(WCH_CMD_ISP_KEY, seed);
}

std::vector<uint8_t> WCH_Frame::Erase(uint32_t u32Sectors)
{
	std::vector<uint8_t> payload(4);
	payload[0] = (uint8_t)u32Sectors;
	payload[1] = (uint8_t)(u32Sectors >> 8);
	payload[2] = (uint8_t)(u32Sectors >> 16);
	payload[3] = (uint8_t)(u32Sectors >> 24);
	return Encode(WCH_CMD_ERASE, payload);
}

std::vector<uint8_t> WCH_Frame::AddressedData(uint32_t u32Address, uint8_t u8Padding, const std::vector<uint8_t> &data)
{
	std::vector<uint8_t> payload(5);
	payload[0] = (uint8_t)u32Address;
	payload[1] = (uint8_t)(u32Address >> 8);
	payload[2] = (uint8_t)(u32Address >> 16);
	payload[3] = (uint8_t)(u32Address >> 24);
	payload[4] = u8Padding;
	payload.insert(payload.end(), data.begin(), data.end());
	return payload;
}

std::vector<uint8_t> WCH_Frame::Program(uint32_t u32Address, uint8_t u8Padding, const std::vector<uint8_t> &data)
{
	return Encode(WCH_CMD_PROGRAM, AddressedData(u32Address, u8Padding, data));
}

std::vector<uint8_t> WCH_Frame::Verify(uint32_t u32Address, uint8_t u8Padding, const std::vector<uint8_t> &data)
{
	return Encode(WCH_CMD_VERIFY, AddressedData(u32Address, u8Padding, data));
}

std::vector<uint8_t> WCH_Frame::ReadConfig(uint8_t u8Mask)
{
	std::vector<uint8_t> payload;
	payload.push_back(u8Mask);
	payload.push_back(0x00);
	return Encode(WCH_CMD_READ_CONFIG, payload);
}

std::vector<uint8_t> WCH_Frame::WriteConfig(uint8_t u8Mask, const std::vector<uint8_t> &data)
{
	std::vector<uint8_t> payload;
	payload.push_back(u8Mask);
	payload.push_back(0x00);
	payload.insert(payload.end(), data.begin(), data.end());
	return Encode(WCH_CMD_WRITE_CONFIG, payload);
}

WCH_Status WCH_Frame::Decode(const uint8_t *raw, uint32_t u32Length, WCH_Response &resp)
{
	char msg[80];

	if (raw == NULL || u32Length < WCH_RESP_HEADER_SIZE) {
		snprintf(msg, sizeof(msg), "response too short: %u bytes", u32Length);
		return WCH_Status(WCH_ERR_PROTOCOL, msg);
	}

	uint32_t u32PayloadLen = raw[2] | (raw[3] << 8);
	if (u32PayloadLen > u32Length - WCH_RESP_HEADER_SIZE) {
		snprintf(msg, sizeof(msg), "response truncated: expect %u payload bytes, got %u",
			u32PayloadLen, u32Length - WCH_RESP_HEADER_SIZE);
		return WCH_Status(WCH_ERR_PROTOCOL, msg);
	}

	resp.u8Cmd = raw[0];
	resp.u8Status = raw[1];
	resp.payload.assign(raw + WCH_RESP_HEADER_SIZE, raw + WCH_RESP_HEADER_SIZE + u32PayloadLen);
	return WCH_Status();
}

const char *WCH_Frame::CommandName(uint8_t u8Cmd)
{
	switch (u8Cmd) {
		case WCH_CMD_IDENTIFY:     return "identify";
		case WCH_CMD_ISP_END:      return "isp_end";
		case WCH_CMD_ISP_KEY:      return "isp_key";
		case WCH_CMD_ERASE:        return "erase";
		case WCH_CMD_PROGRAM:      return "program";
		case WCH_CMD_VERIFY:       return "verify";
		case WCH_CMD_READ_CONFIG:  return "read config";
		case WCH_CMD_WRITE_CONFIG: return "write config";
		case WCH_CMD_DATA_ERASE:   return "data erase";
		case WCH_CMD_DATA_PROGRAM: return "data program";
		case WCH_CMD_DATA_READ:    return "data read";
	}
	return "unknown";
}
