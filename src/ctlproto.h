#ifndef CTLPROTO_H
#define CTLPROTO_H

#include "jobtypes.h"

#include <vector>
#include <utility>

namespace orca
{

class jobscheduler;
struct tSchedulerStats;

/*
 * Line based control protocol. A request is one line: command word followed by
 * key=value tokens with URL-escaped values. The first response line starts with
 * "OK" or "ERR <reason>". LIST sends one line per job after the status line and
 * terminates with a line containing a single dot.
 */

using tCtlFields = std::vector<std::pair<mstring, mstring>>;

ORCA_API mstring FormatFields(const tCtlFields& fields);
ORCA_API bool ParseFields(string_view line, tCtlFields& ret);
// first value of the key or nullptr
ORCA_API const mstring* FindField(const tCtlFields& fields, string_view key);

ORCA_API tCtlFields JobInfoToFields(const tJobInfo& info);
ORCA_API bool FieldsToJobInfo(const tCtlFields& fields, tJobInfo& ret);

ORCA_API mstring FormatSubmitRequest(const tSubmitRequest& req);
ORCA_API bool ParseSubmitRequest(string_view args, tSubmitRequest& ret, mstring& sErr);

ORCA_API tCtlFields StatsToFields(const tSchedulerStats& stats);

// whether the reply to this command is terminated by the dot line
ORCA_API bool IsMultiLineCommand(string_view requestLine);

#define CTL_END_MARK "."

/**
 * Server side of the protocol, executes the requests on the scheduler.
 */
class ORCA_API ctlhandler
{
	jobscheduler& m_sched;
public:
	explicit ctlhandler(jobscheduler& sched) : m_sched(sched) {}
	/**
	 * @param bQuit Set when the peer asked to close the connection
	 * @return Complete response, each line terminated by a newline
	 */
	mstring Dispatch(string_view line, bool& bQuit);
};

}

#endif // CTLPROTO_H
