#ifndef _META_H
#define _META_H

#include "octypes.h"
#include "octemplates.h"
#include "astrop.h"

#include <string>
#include <map>
#include <set>
#include <vector>
#include <deque>
#include <limits>
#include <cstdio>
#include <ctime>
#include <cstring>
#include <atomic>
#include <mutex>
#include <type_traits>

#include <sys/time.h>
#include <errno.h>

namespace orca
{

using lguard = std::lock_guard<std::mutex>;
using ulock = std::unique_lock<std::mutex>;

typedef std::pair<mstring, mstring> tStrPair;
typedef std::vector<mstring> tStrVec;
typedef std::deque<mstring> tStrDeq;

#define CPATHSEP '/'
#define SZPATHSEP "/"

extern ORCA_API cmstring se;

// human readable size, like 12.3 MiB
ORCA_API mstring offttosH(off_t n);

mstring BytesToHexString(const uint8_t b[], unsigned short binLength);
bool CsAsciiToBin(LPCSTR a, uint8_t b[], unsigned short binLength);
bool IsHexString(string_view s);

ORCA_API mstring UrlEscape(string_view s);
void UrlEscapeAppend(string_view s, mstring &sTarget);
bool UrlUnescapeAppend(string_view from, mstring & to);
// Decode with result as return value, no error reporting
ORCA_API mstring UrlUnescape(string_view from);
// application/x-www-form-urlencoded body from key/value pairs
mstring FormEncode(std::initializer_list<std::pair<string_view, string_view>> fields);

tStrDeq ExpandFilePattern(cmstring& pattern, bool bSorted=false);

static inline time_t GetTime()
{
	return ::time(0);
}

static const time_t END_OF_TIME(MAX_VAL(time_t)-2);

struct ORCA_API tErrnoFmter: public mstring
{
	tErrnoFmter(LPCSTR prefix = nullptr) { fmt(errno, prefix);}
	tErrnoFmter(int errnoCode, LPCSTR prefix = nullptr) { fmt(errnoCode, prefix); }
private:
	void fmt(int errnoCode, LPCSTR prefix);
};

/**
 * Minimal string builder, used for log messages and protocol formatting.
 */
class ORCA_API tSS
{
	mstring m_buf;
public:
	tSS() =default;
	tSS& operator<<(string_view s) { m_buf.append(s); return *this; }
	tSS& operator<<(cmstring& s) { m_buf.append(s); return *this; }
	tSS& operator<<(LPCSTR s) { if (s) m_buf.append(s); return *this; }
	tSS& operator<<(char c) { m_buf.push_back(c); return *this; }
	tSS& operator<<(double d);
	template<typename T>
	typename std::enable_if<std::is_integral<T>::value, tSS&>::type operator<<(T n)
	{
		m_buf.append(std::to_string(n));
		return *this;
	}
	string_view view() const { return m_buf; }
	cmstring& str() const { return m_buf; }
	LPCSTR c_str() const { return m_buf.c_str(); }
	size_t size() const { return m_buf.size(); }
	bool empty() const { return m_buf.empty(); }
	void clear() { m_buf.clear(); }
	operator mstring() const { return m_buf; }
};

struct CTimeVal
{
	struct timeval tv = {0,23};
public:
	// calculates for relative time (span)
	struct timeval* For(time_t tExpSec, suseconds_t tExpUsec = 23)
	{
		tv.tv_sec = tExpSec;
		tv.tv_usec = tExpUsec;
		return &tv;
	}
	struct timeval* ForMs(unsigned msec)
	{
		tv.tv_sec = msec / 1000;
		tv.tv_usec = (msec % 1000) * 1000;
		return &tv;
	}
};

template<typename T>
T take_front(std::deque<T>& container)
{
	auto ret = std::move(container.front());
	container.pop_front();
	return ret;
}

}

#endif // _META_H
