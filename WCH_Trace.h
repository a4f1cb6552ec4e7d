#ifndef WCH_TRACE_H
#define WCH_TRACE_H

#include <stdint.h>
#include <stdio.h>

enum WCH_Direction {
	WCH_DIR_OUT,
	WCH_DIR_IN
};

/* Observability sink injected into the session */
class WCH_Trace
{
public:
	virtual ~WCH_Trace() {}

	virtual void Transfer(WCH_Direction dir, const uint8_t *p8Buff, uint32_t u32Length) = 0;
	virtual void Info(const char *fmt, ...) = 0;
	virtual void Progress(uint32_t u32Pos, uint32_t u32Max) = 0;
};

class WCH_NullTrace : public WCH_Trace
{
public:
	void Transfer(WCH_Direction, const uint8_t *, uint32_t) {}
	void Info(const char *, ...) {}
	void Progress(uint32_t, uint32_t) {}
};

/* Prints raw frames and messages to a stdio stream, frames only when verbose */
class WCH_ConsoleTrace : public WCH_Trace
{
public:
	explicit WCH_ConsoleTrace(FILE *out = stderr, bool verbose = false)
		: fOut(out), bVerbose(verbose) {}

	void SetVerbose(bool verbose) { bVerbose = verbose; }

	void Transfer(WCH_Direction dir, const uint8_t *p8Buff, uint32_t u32Length);
	void Info(const char *fmt, ...);
	void Progress(uint32_t, uint32_t) {}

private:
	FILE *fOut;
	bool bVerbose;
};

#endif
