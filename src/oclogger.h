#ifndef OCLOGGER_H_
#define OCLOGGER_H_

#include "octypes.h"

namespace orca
{

class tSS;

namespace log
{

// access internal counters
enum ETypeFlags : int
{
	LOG_FLUSH = 1,
	LOG_MORE = 2,
	LOG_DEBUG = 4,
	LOG_DEBUG_CONSOLE = 8
};

extern ORCA_API LPCSTR g_szLogPrefix;
extern ORCA_API bool logIsEnabled;

/**
 * Open the activity and error logs in the configured directory.
 * @return Error description, empty string on success
 */
ORCA_API mstring open();
ORCA_API void close(bool bReopen);
ORCA_API void flush();

ORCA_API void err(string_view msg);
ORCA_API void err(const tSS& msg);
ORCA_API void misc(string_view msg, char cLogType = 'M');
ORCA_API void dbg(string_view msg);

/**
 * One record per job which left the system, in the activity log.
 */
ORCA_API void transfer(string_view jobId, string_view state, string_view kind,
		off_t bytes, string_view target, string_view reason);

}

}

#endif /*OCLOGGER_H_*/
