#include "oclogger.h"
#include "ocfg.h"
#include "meta.h"
#include "fileio.h"
#include "debug.h"

#include <iostream>
#include <fstream>

using namespace std;

namespace orca
{

namespace log
{

LPCSTR g_szLogPrefix = "orcadl";
bool logIsEnabled = false;

static std::mutex mx;
static std::ofstream fErr, fMsg;

static void stamp(std::ostream& os, char cType)
{
	char buf[40];
	struct tm tmp;
	auto now = GetTime();
	if (0 == strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", localtime_r(&now, &tmp)))
		buf[0] = 0x0;
	os << buf << '|' << cType << '|';
}

mstring open()
{
	lguard g(mx);

	if (cfg::logdir.empty())
		return se;

	auto logBase = cfg::logdir + SZPATHSEP + g_szLogPrefix;
	mkdirhier(cfg::logdir);
	fErr.open((logBase + ".err").c_str(), ios::out | ios::app);
	if (!fErr.is_open())
		return tErrnoFmter("Cannot open the error log");
	fMsg.open((logBase + ".log").c_str(), ios::out | ios::app);
	if (!fMsg.is_open())
	{
		fErr.close();
		return tErrnoFmter("Cannot open the activity log");
	}
	logIsEnabled = true;
	return se;
}

void close(bool bReopen)
{
	{
		lguard g(mx);
		if (!logIsEnabled)
			return;
		fErr.flush();
		fMsg.flush();
		fErr.close();
		fMsg.close();
		logIsEnabled = false;
	}
	if (!bReopen)
		return;
	auto sErr = open();
	if (!sErr.empty())
		cerr << g_szLogPrefix << ": " << sErr << endl;
}

void flush()
{
	lguard g(mx);
	if (!logIsEnabled)
		return;
	fErr.flush();
	fMsg.flush();
}

inline void write_to(std::ostream& os, string_view msg, char cType)
{
	stamp(os, cType);
	os << msg << '\n';
	if (cfg::debug & LOG_FLUSH)
		os.flush();
}

void err(string_view msg)
{
	lguard g(mx);
	if (logIsEnabled)
		write_to(fErr, msg, 'E');
	if (!logIsEnabled || (cfg::debug & LOG_DEBUG_CONSOLE))
		cerr << g_szLogPrefix << ": " << msg << endl;
}

void err(const tSS& msg)
{
	err(msg.view());
}

void misc(string_view msg, char cLogType)
{
	lguard g(mx);
	if (logIsEnabled)
		write_to(fMsg, msg, cLogType);
	else if (!cfg::g_bQuiet)
		cerr << g_szLogPrefix << ": " << msg << endl;
}

void dbg(string_view msg)
{
	lguard g(mx);
	if (logIsEnabled)
		write_to(fErr, msg, 'D');
	if (!logIsEnabled || (cfg::debug & LOG_DEBUG_CONSOLE))
		cerr << msg << endl;
}

void transfer(string_view jobId, string_view state, string_view kind,
		off_t bytes, string_view target, string_view reason)
{
	tSS line;
	line << jobId << '|' << state << '|' << kind << '|' << bytes << '|' << target;
	if (!reason.empty())
		line << '|' << reason;
	misc(line.view(), 'T');
}

}

#ifdef DEBUG
t_logger::t_logger(LPCSTR szFuncName, const void * ptr)
	: m_szName(szFuncName), m_id(uintptr_t(ptr)), m_bActive(cfg::debug & log::LOG_DEBUG)
{
	if (!m_bActive)
		return;
	tSS fmt;
	fmt << ">> " << m_szName << " [" << m_id << "]";
	log::dbg(fmt.view());
}

t_logger::~t_logger()
{
	if (!m_bActive)
		return;
	tSS fmt;
	fmt << "<< " << m_szName << " [" << m_id << "]";
	log::dbg(fmt.view());
}
#endif

}
