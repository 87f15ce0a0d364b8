#include "meta.h"

#include <glob.h>
#include <cstdlib>
#include <algorithm>

using namespace std;

namespace orca
{

cmstring se;

mstring offttosH(off_t n)
{
	LPCSTR pref[] = { "", " KiB", " MiB", " GiB", " TiB", " PiB", " EiB" };
	if (n < 0)
		return "-";
	unsigned i = 0;
	double val(n);
	while (val > 1024.0 && i < _countof(pref) - 1)
	{
		val /= 1024.0;
		++i;
	}
	char buf[64];
	if (i == 0)
		snprintf(buf, sizeof(buf), "%ld", long(n));
	else
		snprintf(buf, sizeof(buf), "%.1f%s", val, pref[i]);
	return buf;
}

static const char hexmap[] = "0123456789abcdef";

mstring BytesToHexString(const uint8_t b[], unsigned short binLength)
{
	mstring out;
	out.reserve(binLength * 2);
	for (unsigned i = 0; i < binLength; i++)
	{
		out += hexmap[b[i] >> 4];
		out += hexmap[b[i] & 0x0f];
	}
	return out;
}

inline int hexval(char c)
{
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

bool CsAsciiToBin(LPCSTR a, uint8_t b[], unsigned short binLength)
{
	for (unsigned i = 0; i < binLength; i++)
	{
		auto hi = hexval(a[2*i]), lo = hexval(a[2*i+1]);
		if (hi < 0 || lo < 0)
			return false;
		b[i] = uint8_t(hi * 16 + lo);
	}
	return true;
}

bool IsHexString(string_view s)
{
	return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return hexval(c) >= 0; });
}

void UrlEscapeAppend(string_view s, mstring &sTarget)
{
	for (auto c: s)
	{
		if (isalnum((unsigned char) c) || (c && strchr("-._~/:", c)))
			sTarget += c;
		else
		{
			sTarget += '%';
			sTarget += hexmap[(unsigned char) c >> 4];
			sTarget += hexmap[(unsigned char) c & 0x0f];
		}
	}
}

mstring UrlEscape(string_view s)
{
	mstring ret;
	ret.reserve(s.size());
	UrlEscapeAppend(s, ret);
	return ret;
}

bool UrlUnescapeAppend(string_view from, mstring & to)
{
	bool ret = true;
	for (size_t i = 0; i < from.length(); i++)
	{
		if (from[i] == '+')
		{
			to += ' ';
			continue;
		}
		if (from[i] != '%')
		{
			to += from[i];
			continue;
		}
		if (i + 2 >= from.length())
		{
			ret = false;
			break;
		}
		auto hi = hexval(from[i+1]), lo = hexval(from[i+2]);
		if (hi < 0 || lo < 0)
		{
			ret = false;
			to += from[i];
			continue;
		}
		to += char(hi * 16 + lo);
		i += 2;
	}
	return ret;
}

mstring UrlUnescape(string_view from)
{
	mstring ret;
	UrlUnescapeAppend(from, ret);
	return ret;
}

mstring FormEncode(std::initializer_list<std::pair<string_view, string_view>> fields)
{
	mstring ret;
	for (const auto& kv: fields)
	{
		if (!ret.empty())
			ret += '&';
		ret += kv.first;
		ret += '=';
		// form encoding is stricter than the path escaping
		for (auto c: kv.second)
		{
			if (isalnum((unsigned char) c) || (c && strchr("-._~", c)))
				ret += c;
			else
			{
				ret += '%';
				ret += hexmap[(unsigned char) c >> 4];
				ret += hexmap[(unsigned char) c & 0x0f];
			}
		}
	}
	return ret;
}

tStrDeq ExpandFilePattern(cmstring& pattern, bool bSorted)
{
	tStrDeq srcs;
	glob_t globbuf;
	memset(&globbuf, 0, sizeof(glob_t));
	int globres = glob(pattern.c_str(), GLOB_DOOFFS | GLOB_NOSORT, nullptr, &globbuf);
	switch (globres)
	{
	case 0:
		break;
	case GLOB_NOMATCH:
		break;
	default:
		globfree(&globbuf);
		return srcs;
	}
	for (unsigned i = 0; i < globbuf.gl_pathc; i++)
		srcs.push_back(globbuf.gl_pathv[i]);
	globfree(&globbuf);
	if (bSorted)
		std::sort(srcs.begin(), srcs.end());
	return srcs;
}

void tErrnoFmter::fmt(int errnoCode, LPCSTR prefix)
{
	char buf[64];
	buf[0] = buf[sizeof(buf) - 1] = 0x0;

#if (_POSIX_C_SOURCE >= 200112L || _XOPEN_SOURCE >= 600) && ! _GNU_SOURCE
	if (strerror_r(errnoCode, buf, sizeof(buf) - 1))
		snprintf(buf, sizeof(buf) - 1, "error %d", errnoCode);
	LPCSTR msg = buf;
#else
	LPCSTR msg = strerror_r(errnoCode, buf, sizeof(buf) - 1);
#endif
	if (prefix)
	{
		assign(prefix);
		append(": ");
		append(msg);
	}
	else
		assign(msg);
}

tSS& tSS::operator<<(double d)
{
	char buf[40];
	snprintf(buf, sizeof(buf), "%.6g", d);
	m_buf.append(buf);
	return *this;
}

}
