#include <string.h>

#include <gtest/gtest.h>

#include "WCH_Frame.h"

namespace {

TEST(FrameTest, IdentifyCarriesMagic)
{
	std::vector<uint8_t> f = WCH_Frame::Identify(0, 0);
	ASSERT_EQ(3u + 2 + 16, f.size());
	EXPECT_EQ(0xA1, f[0]);
	EXPECT_EQ(18, f[1]);
	EXPECT_EQ(0, f[2]);
	EXPECT_EQ(0, f[3]);
	EXPECT_EQ(0, f[4]);
	EXPECT_EQ(0, memcmp(&f[5], "MCU ISP & WCH.CN", 16));
}

TEST(FrameTest, ReadConfigMatchesKnownBytes)
{
	/* same bytes the ch55x bootloader accepts */
	const uint8_t expect[] = { 0xA7, 0x02, 0x00, 0x1F, 0x00 };
	std::vector<uint8_t> f = WCH_Frame::ReadConfig(WCH_CFG_MASK_ALL);
	ASSERT_EQ(sizeof(expect), f.size());
	EXPECT_EQ(0, memcmp(expect, f.data(), sizeof(expect)));
}

TEST(FrameTest, WriteConfigPrefixesMask)
{
	std::vector<uint8_t> regs(12, 0xFF);
	std::vector<uint8_t> f = WCH_Frame::WriteConfig(WCH_CFG_MASK_RDPR_USER_DATA_WPR, regs);
	ASSERT_EQ(3u + 14, f.size());
	EXPECT_EQ(0xA8, f[0]);
	EXPECT_EQ(0x0E, f[1]);
	EXPECT_EQ(0x07, f[3]);
	EXPECT_EQ(0x00, f[4]);
	EXPECT_EQ(0xFF, f[5]);
}

TEST(FrameTest, ProgramLayout)
{
	std::vector<uint8_t> data(56, 0x5A);
	std::vector<uint8_t> f = WCH_Frame::Program(0x12345678, 0, data);
	ASSERT_EQ(3u + 5 + 56, f.size());
	EXPECT_EQ(0xA5, f[0]);
	EXPECT_EQ(0x3D, f[1]);
	EXPECT_EQ(0x00, f[2]);
	EXPECT_EQ(0x78, f[3]);
	EXPECT_EQ(0x56, f[4]);
	EXPECT_EQ(0x34, f[5]);
	EXPECT_EQ(0x12, f[6]);
	EXPECT_EQ(0x00, f[7]);
	EXPECT_EQ(0x5A, f[8]);
	EXPECT_EQ(0x5A, f.back());

	f = WCH_Frame::Verify(56, 0, std::vector<uint8_t>());
	ASSERT_EQ(8u, f.size());
	EXPECT_EQ(0xA6, f[0]);
	EXPECT_EQ(0x05, f[1]);
	EXPECT_EQ(56, f[3]);
}

TEST(FrameTest, EraseSectorCountLittleEndian)
{
	std::vector<uint8_t> f = WCH_Frame::Erase(0x0102);
	ASSERT_EQ(7u, f.size());
	EXPECT_EQ(0xA4, f[0]);
	EXPECT_EQ(4, f[1]);
	EXPECT_EQ(0x02, f[3]);
	EXPECT_EQ(0x01, f[4]);
	EXPECT_EQ(0x00, f[5]);
	EXPECT_EQ(0x00, f[6]);
}

TEST(FrameTest, IspKeyAndEnd)
{
	std::vector<uint8_t> f = WCH_Frame::IspKey(std::vector<uint8_t>(WCH_ISP_KEY_SEED_SIZE, 0));
	ASSERT_EQ(3u + 0x1E, f.size());
	EXPECT_EQ(0xA3, f[0]);
	EXPECT_EQ(0x1E, f[1]);

	f = WCH_Frame::IspEnd(1);
	ASSERT_EQ(4u, f.size());
	EXPECT_EQ(0xA2, f[0]);
	EXPECT_EQ(0x01, f[1]);
	EXPECT_EQ(0x01, f[3]);
}

TEST(FrameTest, DecodeOk)
{
	const uint8_t raw[] = { 0xA1, 0x00, 0x02, 0x00, 0x52, 0x11, 0xEE };
	uint8_t copy[sizeof(raw)];
	memcpy(copy, raw, sizeof(raw));

	WCH_Response resp;
	WCH_Status st = WCH_Frame::Decode(copy, sizeof(copy), resp);
	ASSERT_TRUE(st.Ok());
	EXPECT_TRUE(resp.IsOk());
	EXPECT_EQ(0xA1, resp.u8Cmd);
	ASSERT_EQ(2u, resp.payload.size());
	EXPECT_EQ(0x52, resp.payload[0]);
	EXPECT_EQ(0x11, resp.payload[1]);
	EXPECT_EQ(0, memcmp(raw, copy, sizeof(raw)));
}

TEST(FrameTest, DecodeFailStatus)
{
	const uint8_t raw[] = { 0xA5, 0xFE, 0x02, 0x00, 0x00, 0x00 };
	WCH_Response resp;
	ASSERT_TRUE(WCH_Frame::Decode(raw, sizeof(raw), resp).Ok());
	EXPECT_FALSE(resp.IsOk());
	EXPECT_EQ(2u, resp.payload.size());
}

TEST(FrameTest, DecodeShortBufferIsFramingError)
{
	const uint8_t raw[] = { 0xA1, 0x00, 0x02 };
	WCH_Response resp;
	EXPECT_EQ(WCH_ERR_PROTOCOL, WCH_Frame::Decode(raw, sizeof(raw), resp).Kind());
	EXPECT_EQ(WCH_ERR_PROTOCOL, WCH_Frame::Decode(raw, 0, resp).Kind());
	EXPECT_EQ(WCH_ERR_PROTOCOL, WCH_Frame::Decode(NULL, 4, resp).Kind());
}

TEST(FrameTest, DecodeTruncatedPayload)
{
	const uint8_t raw[] = { 0xA7, 0x00, 0x1A, 0x00, 0x1F, 0x00 };
	WCH_Response resp;
	EXPECT_EQ(WCH_ERR_PROTOCOL, WCH_Frame::Decode(raw, sizeof(raw), resp).Kind());
}

TEST(FrameTest, CommandNames)
{
	EXPECT_STREQ("read config", WCH_Frame::CommandName(WCH_CMD_READ_CONFIG));
	EXPECT_STREQ("isp_end", WCH_Frame::CommandName(WCH_CMD_ISP_END));
	EXPECT_STREQ("unknown", WCH_Frame::CommandName(0x00));
}

}
