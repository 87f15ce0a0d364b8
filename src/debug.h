#ifndef DEBUG_H_
#define DEBUG_H_

#include "meta.h"
#include "oclogger.h"
#include "ocfg.h"

#include <cassert>

#ifdef DEBUG

#define IFDEBUG(x) x
#define ASSERT(x) assert(x)

namespace orca
{
// function scope tracer, active when the debug log level is set
class ORCA_API t_logger
{
	LPCSTR m_szName;
	uintptr_t m_id;
	bool m_bActive;
public:
	t_logger(LPCSTR szFuncName, const void * ptr);
	~t_logger();
	template<typename... Targs>
	void args(const Targs&... a)
	{
		if (!m_bActive)
			return;
		tSS fmt;
		fmt << "   args: ";
		((fmt << a << ", "), ...);
		log::dbg(fmt.view());
	}
	t_logger(const t_logger&) = delete;
};
}

#define LOGSTARTFUNC orca::t_logger __logobj(__func__, this);
#define LOGSTARTFUNCs orca::t_logger __logobj(__func__, nullptr);
#define LOGSTARTFUNCx(...) orca::t_logger __logobj(__func__, this); __logobj.args(__VA_ARGS__);
#define LOGSTARTFUNCxs(...) orca::t_logger __logobj(__func__, nullptr); __logobj.args(__VA_ARGS__);
#define ldbg(msg) { if (orca::cfg::debug & orca::log::LOG_DEBUG) { orca::tSS __fmt; __fmt << msg; orca::log::dbg(__fmt.view()); } }
#define DBGQLOG(msg) ldbg(msg)

#else

#define IFDEBUG(x)
#define ASSERT(x)
#define LOGSTARTFUNC
#define LOGSTARTFUNCs
#define LOGSTARTFUNCx(...)
#define LOGSTARTFUNCxs(...)
#define ldbg(msg)
#define DBGQLOG(msg)

#endif

// user-visible diagnostics, independent of the build type
#define USRERR(msg) { orca::tSS __fmt; __fmt << msg; orca::log::err(__fmt.view()); }
#define USRDBG(msg) { if (orca::cfg::debug & orca::log::LOG_MORE) { orca::tSS __fmt; __fmt << msg; orca::log::misc(__fmt.view(), 'D'); } }
#define USRMSG(msg) { orca::tSS __fmt; __fmt << msg; orca::log::misc(__fmt.view()); }

#define ASSERT_HAVE_MAIN_THREAD ASSERT(orca::evabase::IsMainThread())

#endif /*DEBUG_H_*/
