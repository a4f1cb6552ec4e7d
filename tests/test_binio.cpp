#include <stdio.h>
#include <unistd.h>

#include <string>

#include <gtest/gtest.h>

#include "WCH_BinIO.h"

namespace {

class BinIOTest : public ::testing::Test
{
protected:
	std::string WriteFile(const char *suffix, const std::string &content)
	{
		char name[64];
		snprintf(name, sizeof(name), "/tmp/wchisp_test_%d_%u%s", (int)getpid(), (unsigned)files.size(), suffix);
		FILE *f = fopen(name, "wb");
		EXPECT_TRUE(f != NULL);
		if (f != NULL) {
			fwrite(content.data(), 1, content.size(), f);
			fclose(f);
		}
		files.push_back(name);
		return name;
	}

	void TearDown()
	{
		for (size_t i = 0; i < files.size(); ++i) {
			unlink(files[i].c_str());
		}
	}

	std::vector<std::string> files;
	WCH_BinIO bin;
};

TEST_F(BinIOTest, ReadRaw)
{
	std::string content("\x01\x02\x03\x00\xff", 5);
	std::string path = WriteFile(".bin", content);
	ASSERT_TRUE(bin.Read(path.c_str()).Ok());
	ASSERT_EQ(5u, bin.Size());
	EXPECT_EQ(0x01, bin.Data()[0]);
	EXPECT_EQ(0x00, bin.Data()[3]);
	EXPECT_EQ(0xFF, bin.Data()[4]);
}

TEST_F(BinIOTest, ReadEmptyRaw)
{
	std::string path = WriteFile(".bin", "");
	ASSERT_TRUE(bin.Read(path.c_str()).Ok());
	EXPECT_EQ(0u, bin.Size());
}

TEST_F(BinIOTest, MissingFile)
{
	WCH_Status st = bin.Read("/nonexistent/firmware.bin");
	EXPECT_EQ(WCH_ERR_FILE, st.Kind());
}

TEST_F(BinIOTest, ReadHexWithGap)
{
	std::string path = WriteFile(".hex",
		":0400000001020304F2\n"
		":02000800AABB91\n"
		":00000001FF\n");
	WCH_Status st = bin.Read(path.c_str());
	ASSERT_TRUE(st.Ok()) << st.Message();
	ASSERT_EQ(10u, bin.Size());
	EXPECT_EQ(0x01, bin.Data()[0]);
	EXPECT_EQ(0x04, bin.Data()[3]);
	EXPECT_EQ(0xFF, bin.Data()[4]);
	EXPECT_EQ(0xFF, bin.Data()[7]);
	EXPECT_EQ(0xAA, bin.Data()[8]);
	EXPECT_EQ(0xBB, bin.Data()[9]);
}

TEST_F(BinIOTest, ReadHexAtFlashBase)
{
	std::string path = WriteFile(".hex",
		":020000040800F2\r\n"
		":020000001234B8\r\n"
		":00000001FF\r\n");
	WCH_Status st = bin.Read(path.c_str());
	ASSERT_TRUE(st.Ok()) << st.Message();
	ASSERT_EQ(2u, bin.Size());
	EXPECT_EQ(0x12, bin.Data()[0]);
	EXPECT_EQ(0x34, bin.Data()[1]);
}

TEST_F(BinIOTest, ReadHexEmptyDataRecord)
{
	std::string path = WriteFile(".hex",
		":0000000000\n"
		":00000001FF\n");
	WCH_Status st = bin.Read(path.c_str());
	ASSERT_TRUE(st.Ok()) << st.Message();
	EXPECT_EQ(0u, bin.Size());

	path = WriteFile(".hex",
		":020000001234B8\n"
		":00000200FE\n"
		":00000001FF\n");
	st = bin.Read(path.c_str());
	ASSERT_TRUE(st.Ok()) << st.Message();
	EXPECT_EQ(2u, bin.Size());
}

TEST_F(BinIOTest, HexChecksumError)
{
	std::string path = WriteFile(".hex",
		":0400000001020304F3\n"
		":00000001FF\n");
	WCH_Status st = bin.Read(path.c_str());
	EXPECT_EQ(WCH_ERR_FILE, st.Kind());
	EXPECT_NE(std::string::npos, st.Message().find("checksum"));
}

TEST_F(BinIOTest, HexMissingEof)
{
	std::string path = WriteFile(".hex", ":0400000001020304F2\n");
	EXPECT_EQ(WCH_ERR_FILE, bin.Read(path.c_str()).Kind());
}

TEST_F(BinIOTest, HexBadRecord)
{
	std::string path = WriteFile(".ihex", "0400000001020304F2\n:00000001FF\n");
	EXPECT_EQ(WCH_ERR_FILE, bin.Read(path.c_str()).Kind());
}

}
