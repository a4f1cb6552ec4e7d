#include <stdio.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "WCH_Args.h"
#include "WCH_BinIO.h"
#include "WCH_ChipDB.h"
#include "WCH_ProgressBar.h"
#include "WCH_Session.h"
#include "WCH_UsbTransport.h"

/* Console trace that also drives the progress bar during flash/verify */
class CliTrace : public WCH_ConsoleTrace
{
public:
	explicit CliTrace(bool verbose) : WCH_ConsoleTrace(stderr, verbose), bar(stdout) {
		bar.SetNum(50);
	}

	void Progress(uint32_t u32Pos, uint32_t u32Max) {
		bar.SetMax(u32Max);
		bar.SetPos(u32Pos);
		bar.Display();
		if (u32Pos == u32Max) {
			printf("\n");
		}
	}

private:
	WCH_ProgressBar bar;
};

static void Usage(void)
{
	printf("usage: wchisptool [-v] [-f] [-n] [-s sectors] <command> [file]\n");
	printf("commands:\n");
	printf("  info                 show chip information\n");
	printf("  flash <file>         unprotect, erase, write, verify and reset\n");
	printf("  verify <file>        verify code flash against file\n");
	printf("  erase                erase code flash\n");
	printf("  erase-data           erase data eeprom\n");
	printf("  unprotect            remove code flash protection\n");
	printf("  reset                leave ISP mode and run the application\n");
	printf("options:\n");
	printf("  -v                   dump usb frames\n");
	printf("  -f                   force unprotect\n");
	printf("  -n                   do not reset after flash\n");
	printf("  -s sectors           number of sectors to erase\n");
}

static int Fail(const WCH_Status &st)
{
	fprintf(stderr, "Error (%s): %s\n", WCH_Status::KindName(st.Kind()), st.Message().c_str());
	return 1;
}

static void ShowInfo(const WCH_Session &session)
{
	const WCH_ChipDescriptor *chip = session.Chip();
	const std::vector<uint8_t> &uid = session.ChipUid();
	const std::vector<uint8_t> &ver = session.BootloaderVersion();

	if (chip->u32EepromSize > 0) {
		printf("Chip: %s (Code Flash: %uKiB, Data EEPROM: %uB)\n", chip->name,
			chip->u32FlashSize / 1024, chip->u32EepromSize);
	} else {
		printf("Chip: %s (Code Flash: %uKiB)\n", chip->name, chip->u32FlashSize / 1024);
	}
	printf("Chip UID: ");
	for (size_t i = 0; i < uid.size(); ++i) {
		printf(i ? "-%02x" : "%02x", uid[i]);
	}
	printf("\n");
	printf("Bootloader: %x%x.%x%x\n", ver[0], ver[1], ver[2], ver[3]);
	printf("Code Flash protected: %s\n", session.CodeFlashProtected() ? "yes" : "no");
}

int main(int argc, char *argv[])
{
	bool verbose = false;
	bool force = false;
	bool noReset = false;
	uint32_t sectors = 0;
	int opt;
	WCH_Status st;
	WCH_BinIO bin;

	printf("WCH ISP programmer\n");

	while ((opt = getopt(argc, argv, "vfns:h")) != -1) {
		switch (opt) {
			case 'v': verbose = true; break;
			case 'f': force = true; break;
			case 'n': noReset = true; break;
			case 's':
				if (!WCH_ParseUint(optarg, sectors)) {
					fprintf(stderr, "Bad sector count: %s\n", optarg);
					Usage();
					return 1;
				}
				break;
			default:
				Usage();
				return 1;
		}
	}

	if (optind >= argc) {
		Usage();
		return 1;
	}
	const char *cmd = argv[optind];
	bool needFile = strcmp(cmd, "flash") == 0 || strcmp(cmd, "verify") == 0;

	if (needFile) {
		if (optind + 1 >= argc) {
			Usage();
			return 1;
		}
		/* load flash file */
		st = bin.Read(argv[optind + 1]);
		if (!st.Ok()) {
			return Fail(st);
		}
		printf("Read file: %u bytes\n", bin.Size());
	}

	int found = WCH_UsbTransport::Count();
	if (found < 0) {
		fprintf(stderr, "Cannot initialize libusb\n");
		return 1;
	}
	if (found == 0) {
		printf("Not found WCH device: please make sure it's in ISP mode and plugged in.\n");
		return 1;
	}

	WCH_StaticChipDB chipDB;
	CliTrace trace(verbose);
	WCH_Session session(chipDB, trace);

	st = session.Open(std::unique_ptr<WCH_Transport>(new WCH_UsbTransport()));
	if (!st.Ok()) {
		return Fail(st);
	}

	if (strcmp(cmd, "info") == 0) {
		ShowInfo(session);
	} else if (strcmp(cmd, "flash") == 0) {
		const WCH_ChipDescriptor *chip = session.Chip();
		if (bin.Size() > chip->u32FlashSize) {
			fprintf(stderr, "Image too large: %u bytes, %s has %u bytes of code flash\n",
				bin.Size(), chip->name, chip->u32FlashSize);
			return 1;
		}
		if (sectors == 0) {
			sectors = (bin.Size() + chip->u32SectorSize - 1) / chip->u32SectorSize;
		}

		st = session.UnProtect(force);
		if (!st.Ok()) {
			return Fail(st);
		}
		st = session.EraseCode(sectors);
		if (!st.Ok()) {
			return Fail(st);
		}
		printf("Write:\n");
		st = session.Flash(bin.Data());
		if (!st.Ok()) {
			return Fail(st);
		}
		printf("Verify:\n");
		st = session.Verify(bin.Data());
		if (!st.Ok()) {
			return Fail(st);
		}
		if (!noReset) {
			st = session.Reset();
			if (!st.Ok()) {
				return Fail(st);
			}
		}
		printf("Write complete!!!\n");
	} else if (strcmp(cmd, "verify") == 0) {
		printf("Verify:\n");
		st = session.Verify(bin.Data());
		if (!st.Ok()) {
			return Fail(st);
		}
		printf("Verify complete\n");
	} else if (strcmp(cmd, "erase") == 0) {
		if (sectors == 0) {
			sectors = session.Chip()->u32FlashSize / session.Chip()->u32SectorSize;
		}
		st = session.EraseCode(sectors);
		if (!st.Ok()) {
			return Fail(st);
		}
	} else if (strcmp(cmd, "erase-data") == 0) {
		st = session.EraseData(sectors);
		if (!st.Ok()) {
			return Fail(st);
		}
	} else if (strcmp(cmd, "unprotect") == 0) {
		st = session.UnProtect(force);
		if (!st.Ok()) {
			return Fail(st);
		}
	} else if (strcmp(cmd, "reset") == 0) {
		st = session.Reset();
		if (!st.Ok()) {
			return Fail(st);
		}
	} else {
		Usage();
		return 1;
	}

	return 0;
}
