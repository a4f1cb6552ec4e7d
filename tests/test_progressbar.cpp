#include <stdio.h>

#include <string>

#include <gtest/gtest.h>

#include "WCH_ProgressBar.h"
#include "WCH_Status.h"

namespace {

std::string Render(uint32_t max, uint32_t num, uint32_t pos)
{
	FILE *f = tmpfile();
	EXPECT_TRUE(f != NULL);
	if (f == NULL)
		return "";

	WCH_ProgressBar bar(f);
	bar.SetMax(max);
	bar.SetNum(num);
	bar.SetPos(pos);
	bar.Display();

	std::string out;
	rewind(f);
	int c;
	while ((c = fgetc(f)) != EOF)
		out.push_back((char)c);
	fclose(f);
	return out;
}

TEST(ProgressBarTest, Half)
{
	EXPECT_EQ("\r[#####     ]  50%", Render(4, 10, 2));
}

TEST(ProgressBarTest, ClampsPosition)
{
	EXPECT_EQ("\r[####] 100%", Render(3, 4, 9));
}

TEST(ProgressBarTest, ZeroMax)
{
	EXPECT_EQ("\r[  ]   0%", Render(0, 2, 0));
}

TEST(StatusTest, KindNames)
{
	WCH_Status ok;
	EXPECT_TRUE(ok.Ok());
	EXPECT_STREQ("checksum mismatch", WCH_Status::KindName(WCH_ERR_CHECKSUM));
	EXPECT_STREQ("unsupported operation", WCH_Status::KindName(WCH_ERR_UNSUPPORTED));
}

}
