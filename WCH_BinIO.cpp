#include <string.h>
#include <strings.h>

#include "WCH_BinIO.h"

static bool EndsWith(const char *str, const char *suffix)
{
	size_t n = strlen(str);
	size_t m = strlen(suffix);
	if (m > n) {
		return false;
	}
	return strcasecmp(str + n - m, suffix) == 0;
}

WCH_Status WCH_BinIO::Read(const char *path)
{
	if (EndsWith(path, ".hex") || EndsWith(path, ".ihex")) {
		return ReadHex(path);
	}
	return ReadBin(path);
}

WCH_Status WCH_BinIO::ReadBin(const char *path)
{
	FILE *f;
	long size;

	data.clear();
	f = fopen(path, "rb");
	if (f == NULL) {
		return WCH_Status(WCH_ERR_FILE, std::string("cannot open ") + path);
	}

	fseek(f, 0, SEEK_END);
	size = ftell(f);
	fseek(f, 0, SEEK_SET);
	if (size < 0 || size > WCH_IMAGE_MAX) {
		fclose(f);
		return WCH_Status(WCH_ERR_FILE, std::string("bad image size: ") + path);
	}

	data.resize((size_t)size);
	if (size > 0 && fread(&data[0], 1, (size_t)size, f) != (size_t)size) {
		fclose(f);
		data.clear();
		return WCH_Status(WCH_ERR_FILE, std::string("cannot read ") + path);
	}
	fclose(f);
	return WCH_Status();
}

int WCH_BinIO::HexToNum(const char *str, int sz)
{
	int val = 0;
	for (int i = 0; i < sz; ++i) {
		if (*str >= '0' && *str <= '9')
			val = (val << 4) + (*str - '0');
		else if (*str >= 'A' && *str <= 'F')
			val = (val << 4) + (*str - 'A' + 10);
		else if (*str >= 'a' && *str <= 'f')
			val = (val << 4) + (*str - 'a' + 10);
		else
			return -1;
		++str;
	}
	return val;
}

bool WCH_BinIO::ReadLine(FILE *file, std::string &line)
{
	int c;

	line.clear();
	while ((c = fgetc(file)) >= 0) {
		if (c == '\n') {
			return true;
		}
		if (c > 0x20 && c < 0x7f) {
			line.push_back((char)c);
		}
	}
	return !line.empty();
}

WCH_Status WCH_BinIO::Store(uint32_t u32Address, const uint8_t *p8Data, uint32_t u32Length)
{
	if (u32Length == 0) {
		return WCH_Status();
	}
	if (u32Address >= WCH_FLASH_BASE) {
		u32Address -= WCH_FLASH_BASE;
	}
	if ((uint64_t)u32Address + u32Length > WCH_IMAGE_MAX) {
		char msg[64];
		snprintf(msg, sizeof(msg), "address 0x%08x out of range", u32Address);
		return WCH_Status(WCH_ERR_FILE, msg);
	}
	if (data.size() < u32Address + u32Length) {
		data.resize(u32Address + u32Length, 0xFF);
	}
	memcpy(&data[u32Address], p8Data, u32Length);
	return WCH_Status();
}

WCH_Status WCH_BinIO::ReadHex(const char *path)
{
	FILE *f;
	std::string line;
	uint32_t u32Base = 0;
	int lno = 0;
	bool eof = false;
	char msg[80];

	data.clear();
	f = fopen(path, "r");
	if (f == NULL) {
		return WCH_Status(WCH_ERR_FILE, std::string("cannot open ") + path);
	}

	while (!eof && ReadLine(f, line)) {
		uint8_t u8Rec[260];
		uint8_t u8Sum = 0;
		++lno;

		if (line.empty()) {
			continue;
		}
		if (line[0] != ':' || line.size() < 11 || line.size() > 1 + 2 * sizeof(u8Rec) || (line.size() - 1) % 2 != 0) {
			snprintf(msg, sizeof(msg), "%s: invalid format at line %d", path, lno);
			fclose(f);
			return WCH_Status(WCH_ERR_FILE, msg);
		}

		uint32_t n = (uint32_t)(line.size() - 1) / 2;
		for (uint32_t i = 0; i < n; ++i) {
			int v = HexToNum(line.c_str() + 1 + i * 2, 2);
			if (v < 0) {
				snprintf(msg, sizeof(msg), "%s: bad hex digit at line %d", path, lno);
				fclose(f);
				return WCH_Status(WCH_ERR_FILE, msg);
			}
			u8Rec[i] = (uint8_t)v;
			u8Sum += u8Rec[i];
		}

		/* len, addr hi, addr lo, type, data, checksum */
		uint8_t u8Len = u8Rec[0];
		if (n != (uint32_t)u8Len + 5) {
			snprintf(msg, sizeof(msg), "%s: record size is invalid at line %d", path, lno);
			fclose(f);
			return WCH_Status(WCH_ERR_FILE, msg);
		}
		if (u8Sum != 0) {
			snprintf(msg, sizeof(msg), "%s: checksum error at line %d", path, lno);
			fclose(f);
			return WCH_Status(WCH_ERR_FILE, msg);
		}

		uint32_t u32Offset = (u8Rec[1] << 8) | u8Rec[2];
		switch (u8Rec[3]) {
			case 0x00: {
				WCH_Status st = Store(u32Base + u32Offset, &u8Rec[4], u8Len);
				if (!st.Ok()) {
					fclose(f);
					return st;
				}
				break;
			}
			case 0x01:
				eof = true;
				break;
			case 0x02:
				u32Base = ((u8Rec[4] << 8) | u8Rec[5]) << 4;
				break;
			case 0x04:
				u32Base = (uint32_t)((u8Rec[4] << 8) | u8Rec[5]) << 16;
				break;
			case 0x03:
			case 0x05:
				/* start address, not needed for flashing */
				break;
			default:
				snprintf(msg, sizeof(msg), "%s: unknown record type %02X at line %d", path, u8Rec[3], lno);
				fclose(f);
				return WCH_Status(WCH_ERR_FILE, msg);
		}
	}
	fclose(f);

	if (!eof) {
		return WCH_Status(WCH_ERR_FILE, std::string(path) + ": missing end of file record");
	}
	return WCH_Status();
}
