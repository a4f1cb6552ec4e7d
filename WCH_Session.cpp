#include <stdio.h>
#include <string.h>

#include "WCH_Session.h"

static WCH_Status CommandFailed(const char *what)
{
	return WCH_Status(WCH_ERR_PROTOCOL, what);
}

WCH_Session::WCH_Session(const WCH_ChipDB &db, WCH_Trace &tr)
	: chipDB(db), trace(tr), pChip(NULL), bCodeFlashProtected(false)
{
}

WCH_Session::~WCH_Session()
{
	Close();
}

WCH_Status WCH_Session::Open(std::unique_ptr<WCH_Transport> transport)
{
	std::vector<uint8_t> config;
	WCH_Status st;

	Close();
	pTransport = std::move(transport);
	if (pTransport.get() == NULL) {
		return WCH_Status(WCH_ERR_TRANSPORT, "no transport");
	}

	if (!pTransport->Open() || !pTransport->ClaimInterface(WCH_USB_CONFIG, WCH_USB_INTERFACE)) {
		st = WCH_Status(WCH_ERR_TRANSPORT, pTransport->LastError());
		Close();
		return st;
	}

	st = ReadConfig(WCH_CFG_MASK_ALL, config);
	if (!st.Ok()) {
		Close();
		return st;
	}
	if (config.size() < WCH_CFG_OFFSET_UID + WCH_UID_SIZE) {
		char msg[64];
		snprintf(msg, sizeof(msg), "read config: short payload, %u bytes", (uint32_t)config.size());
		Close();
		return WCH_Status(WCH_ERR_PROTOCOL, msg);
	}

	st = Identify();
	if (!st.Ok()) {
		Close();
		return st;
	}

	btVer.assign(config.begin() + WCH_CFG_OFFSET_BTVER, config.begin() + WCH_CFG_OFFSET_BTVER + WCH_BTVER_SIZE);
	chipUid.assign(config.begin() + WCH_CFG_OFFSET_UID, config.end());
	bCodeFlashProtected = pChip->bCodeFlashProtect && config[WCH_CFG_OFFSET_REGS] != WCH_RDPR_UNLOCK_0;

	trace.Info("Found chip %s, bootloader %02x%02x.%02x%02x, code flash %s",
		pChip->name, btVer[0], btVer[1], btVer[2], btVer[3],
		bCodeFlashProtected ? "protected" : "unprotected");
	return WCH_Status();
}

void WCH_Session::Close()
{
	if (pTransport.get() != NULL) {
		pTransport->Close();
		pTransport.reset();
	}
	pChip = NULL;
	chipUid.clear();
	btVer.clear();
	rawConfig.clear();
	bCodeFlashProtected = false;
}

WCH_Status WCH_Session::RequireOpen() const
{
	if (!IsOpen()) {
		return WCH_Status(WCH_ERR_TRANSPORT, "device not open");
	}
	return WCH_Status();
}

WCH_Status WCH_Session::Transfer(const std::vector<uint8_t> &frame, WCH_Response &resp)
{
	uint8_t u8Buff[WCH_RX_BUFF_SIZE];
	uint32_t u32Received = 0;
	const char *name = frame.empty() ? "unknown" : WCH_Frame::CommandName(frame[0]);
	char msg[160];

	if (pTransport.get() == NULL) {
		return WCH_Status(WCH_ERR_TRANSPORT, "device not open");
	}

	if (!pTransport->Write(frame.data(), (uint32_t)frame.size(), WCH_TIMEOUT_MS)) {
		snprintf(msg, sizeof(msg), "send %s: %s", name, pTransport->LastError());
		return WCH_Status(WCH_ERR_TRANSPORT, msg);
	}
	if (!pTransport->Read(u8Buff, sizeof(u8Buff), u32Received, WCH_TIMEOUT_MS)) {
		snprintf(msg, sizeof(msg), "receive %s: %s", name, pTransport->LastError());
		return WCH_Status(WCH_ERR_TRANSPORT, msg);
	}

	trace.Transfer(WCH_DIR_OUT, frame.data(), (uint32_t)frame.size());
	trace.Transfer(WCH_DIR_IN, u8Buff, u32Received);

	WCH_Status st = WCH_Frame::Decode(u8Buff, u32Received, resp);
	if (!st.Ok()) {
		snprintf(msg, sizeof(msg), "%s: %s", name, st.Message().c_str());
		return WCH_Status(st.Kind(), msg);
	}
	return st;
}

WCH_Status WCH_Session::Identify()
{
	WCH_Response resp;
	WCH_Status st = Transfer(WCH_Frame::Identify(0, 0), resp);
	if (!st.Ok()) {
		return st;
	}
	if (!resp.IsOk() || resp.payload.size() < 2) {
		return CommandFailed("chip identification failed");
	}

	const WCH_ChipDescriptor *chip = chipDB.Find(resp.payload[0], resp.payload[1]);
	if (chip == NULL) {
		char msg[80];
		snprintf(msg, sizeof(msg), "chip identification failed: unknown chip %02X, type %02X",
			resp.payload[0], resp.payload[1]);
		return WCH_Status(WCH_ERR_LOOKUP, msg);
	}
	pChip = chip;
	return WCH_Status();
}

WCH_Status WCH_Session::ReadConfig(uint8_t u8Mask, std::vector<uint8_t> &payload)
{
	WCH_Response resp;
	WCH_Status st = Transfer(WCH_Frame::ReadConfig(u8Mask), resp);
	if (!st.Ok()) {
		return st;
	}
	if (!resp.IsOk()) {
		return CommandFailed("read config failed");
	}

	payload = resp.payload;
	rawConfig = resp.payload;
	if (pChip != NULL && (u8Mask & WCH_CFG_MASK_RDPR_USER_DATA_WPR) && payload.size() > WCH_CFG_OFFSET_REGS) {
		bCodeFlashProtected = pChip->bCodeFlashProtect && payload[WCH_CFG_OFFSET_REGS] != WCH_RDPR_UNLOCK_0;
	}
	return WCH_Status();
}

WCH_Status WCH_Session::WriteConfig(uint8_t u8Mask, const std::vector<uint8_t> &data)
{
	WCH_Response resp;
	WCH_Status st = Transfer(WCH_Frame::WriteConfig(u8Mask, data), resp);
	if (!st.Ok()) {
		return st;
	}
	if (!resp.IsOk()) {
		return CommandFailed("write config failed");
	}
	return WCH_Status();
}

WCH_XorKey WCH_Session::XorKey() const
{
	return WCH_Key::Derive(chipUid, pChip != NULL ? pChip->u8ChipId : 0);
}

bool WCH_Session::CheckChipName(const char *prefix) const
{
	if (pChip == NULL || prefix == NULL) {
		return false;
	}
	return strncmp(pChip->name, prefix, strlen(prefix)) == 0;
}

WCH_Status WCH_Session::ExchangeKey(const WCH_XorKey &key)
{
	WCH_Response resp;
	WCH_Status st = Transfer(WCH_Frame::IspKey(std::vector<uint8_t>(WCH_ISP_KEY_SEED_SIZE, 0)), resp);
	if (!st.Ok()) {
		return st;
	}
	if (!resp.IsOk() || resp.payload.empty()) {
		return CommandFailed("isp_key failed");
	}
	if (resp.payload[0] != key.KeyChecksum()) {
		char msg[64];
		snprintf(msg, sizeof(msg), "isp_key checksum failed: device %02X, expect %02X",
			resp.payload[0], key.KeyChecksum());
		return WCH_Status(WCH_ERR_CHECKSUM, msg);
	}
	return WCH_Status();
}

WCH_Status WCH_Session::ProgramChunk(uint32_t u32Address, std::vector<uint8_t> &chunk, const WCH_XorKey &key)
{
	WCH_Response resp;

	WCH_Key::Apply(chunk, key);
	WCH_Status st = Transfer(WCH_Frame::Program(u32Address, 0, chunk), resp);
	if (!st.Ok()) {
		return st;
	}
	if (!resp.IsOk()) {
		char msg[48];
		snprintf(msg, sizeof(msg), "program at address 0x%08x failed", u32Address);
		return CommandFailed(msg);
	}
	return WCH_Status();
}

WCH_Status WCH_Session::VerifyChunk(uint32_t u32Address, std::vector<uint8_t> &chunk, const WCH_XorKey &key)
{
	WCH_Response resp;

	WCH_Key::Apply(chunk, key);
	WCH_Status st = Transfer(WCH_Frame::Verify(u32Address, 0, chunk), resp);
	if (!st.Ok()) {
		return st;
	}
	if (!resp.IsOk() || resp.payload.empty()) {
		return CommandFailed("verify response failed");
	}
	if (resp.payload[0] != 0x00) {
		char msg[64];
		snprintf(msg, sizeof(msg), "verify failed, mismatch at address 0x%08x", u32Address);
		return WCH_Status(WCH_ERR_CHECKSUM, msg);
	}
	return WCH_Status();
}

WCH_Status WCH_Session::SendChunks(const std::vector<uint8_t> &image, ChunkOp op, uint32_t &u32Address)
{
	WCH_Status st = RequireOpen();
	if (!st.Ok()) {
		return st;
	}

	WCH_XorKey key = XorKey();
	st = ExchangeKey(key);
	if (!st.Ok()) {
		return st;
	}

	u32Address = 0;
	uint32_t n = (uint32_t)((image.size() + WCH_CHUNK_SIZE - 1) / WCH_CHUNK_SIZE);
	for (uint32_t i = 0; i < n; ++i) {
		size_t len = image.size() - (size_t)i * WCH_CHUNK_SIZE;
		if (len > WCH_CHUNK_SIZE) {
			len = WCH_CHUNK_SIZE;
		}
		std::vector<uint8_t> chunk(image.begin() + (size_t)i * WCH_CHUNK_SIZE,
			image.begin() + (size_t)i * WCH_CHUNK_SIZE + len);
		st = (this->*op)(u32Address, chunk, key);
		if (!st.Ok()) {
			return st;
		}
		u32Address += (uint32_t)len;
		trace.Progress(i + 1, n);
	}

	if (op == &WCH_Session::ProgramChunk) {
		/* empty chunk ends the sequence */
		std::vector<uint8_t> last;
		st = ProgramChunk(u32Address, last, key);
		if (!st.Ok()) {
			return st;
		}
	}
	return WCH_Status();
}

WCH_Status WCH_Session::Flash(const std::vector<uint8_t> &image)
{
	uint32_t u32Written = 0;
	WCH_Status st = SendChunks(image, &WCH_Session::ProgramChunk, u32Written);
	if (!st.Ok()) {
		return st;
	}

	trace.Info("Code flash %u bytes written", u32Written);
	return WCH_Status();
}

WCH_Status WCH_Session::Verify(const std::vector<uint8_t> &image)
{
	uint32_t u32Verified = 0;
	WCH_Status st = SendChunks(image, &WCH_Session::VerifyChunk, u32Verified);
	if (!st.Ok()) {
		return st;
	}

	trace.Info("Code flash %u bytes verified", u32Verified);
	return WCH_Status();
}

WCH_Status WCH_Session::EraseCode(uint32_t u32Sectors)
{
	WCH_Status st = RequireOpen();
	if (!st.Ok()) {
		return st;
	}

	if (u32Sectors < pChip->u32MinEraseSectors) {
		u32Sectors = pChip->u32MinEraseSectors;
	}

	WCH_Response resp;
	st = Transfer(WCH_Frame::Erase(u32Sectors), resp);
	if (!st.Ok()) {
		return st;
	}
	if (!resp.IsOk()) {
		return CommandFailed("erase failed");
	}

	trace.Info("Erased %u code flash sectors", u32Sectors);
	return WCH_Status();
}

WCH_Status WCH_Session::EraseData(uint32_t)
{
	WCH_Status st = RequireOpen();
	if (!st.Ok()) {
		return st;
	}

	if (pChip->u32EepromSize == 0) {
		return WCH_Status(WCH_ERR_NO_EEPROM, "chip doesn't support data EEPROM");
	}
	return WCH_Status(WCH_ERR_UNSUPPORTED, "data EEPROM erase is not supported");
}

WCH_Status WCH_Session::UnProtect(bool force)
{
	WCH_Status st = RequireOpen();
	if (!st.Ok()) {
		return st;
	}

	if (!force && !bCodeFlashProtected) {
		return WCH_Status();
	}

	WCH_Response resp;
	st = Transfer(WCH_Frame::ReadConfig(WCH_CFG_MASK_RDPR_USER_DATA_WPR), resp);
	if (!st.Ok()) {
		return st;
	}
	if (!resp.IsOk()) {
		return CommandFailed("read_config failed");
	}
	if (resp.payload.size() < WCH_CFG_OFFSET_REGS + WCH_CFG_REGS_SIZE) {
		return CommandFailed("read_config: short payload");
	}

	/* RDPR, USER, DATA, WPR */
	std::vector<uint8_t> config(resp.payload.begin() + WCH_CFG_OFFSET_REGS,
		resp.payload.begin() + WCH_CFG_OFFSET_REGS + WCH_CFG_REGS_SIZE);
	config[0] = WCH_RDPR_UNLOCK_0;
	config[1] = WCH_RDPR_UNLOCK_1;
	for (uint32_t i = 0; i < 4; ++i) {
		config[WCH_CFG_WPR_OFFSET + i] = 0xFF;
	}

	st = Transfer(WCH_Frame::WriteConfig(WCH_CFG_MASK_RDPR_USER_DATA_WPR, config), resp);
	if (!st.Ok()) {
		return st;
	}
	if (!resp.IsOk()) {
		return CommandFailed("write_config failed");
	}

	bCodeFlashProtected = false;
	trace.Info("Code flash unprotected");
	return WCH_Status();
}

WCH_Status WCH_Session::Reset()
{
	WCH_Status st = RequireOpen();
	if (!st.Ok()) {
		return st;
	}

	WCH_Response resp;
	st = Transfer(WCH_Frame::IspEnd(WCH_ISP_END_REBOOT), resp);
	if (!st.Ok()) {
		return st;
	}
	if (!resp.IsOk()) {
		return CommandFailed("isp_end failed");
	}
	return WCH_Status();
}
