/*
 * astrop.h
 *
 * Small string operations on std::string and string_view.
 */

#ifndef ASTROP_H_
#define ASTROP_H_

#include "octypes.h"

#include <functional>
#include <cstring>
#include <strings.h>

#define SPACECHARS " \f\n\r\t\v"
#define SPACECHARSsv " \f\n\r\t\v"sv

namespace orca
{

inline void trimFront(mstring &s, LPCSTR junk = SPACECHARS)
{
	s.erase(0, s.find_first_not_of(junk));
}

inline void trimBack(mstring &s, LPCSTR junk = SPACECHARS)
{
	auto pos = s.find_last_not_of(junk);
	s.erase(pos == stmiss ? 0 : pos + 1);
}

inline void trimBoth(mstring &s, LPCSTR junk = SPACECHARS)
{
	trimBack(s, junk);
	trimFront(s, junk);
}

inline void trimFront(string_view& s, string_view junk = SPACECHARSsv)
{
	auto pos = s.find_first_not_of(junk);
	s.remove_prefix(pos == stmiss ? s.length() : pos);
}

inline void trimBack(string_view& s, string_view junk = SPACECHARSsv)
{
	auto pos = s.find_last_not_of(junk);
	s.remove_suffix(pos == stmiss ? s.length() : s.length() - pos - 1);
}

inline string_view trimBoth(string_view s, string_view junk = SPACECHARSsv)
{
	trimFront(s, junk);
	trimBack(s, junk);
	return s;
}

inline bool startsWith(string_view where, string_view what)
{
	return where.starts_with(what);
}

inline bool endsWith(string_view where, string_view what)
{
	return where.ends_with(what);
}

#define startsWithSz(where, what) startsWith(where, what ""sv)
#define endsWithSz(where, what) endsWith(where, what ""sv)

inline bool startsWithNoCase(string_view where, string_view what)
{
	return where.size() >= what.size() && 0 == strncasecmp(where.data(), what.data(), what.size());
}

inline bool endsWithNoCase(string_view where, string_view what)
{
	return where.size() >= what.size()
			&& 0 == strncasecmp(where.data() + where.size() - what.size(), what.data(), what.size());
}

inline bool equalsNoCase(string_view a, string_view b)
{
	return a.size() == b.size() && 0 == strncasecmp(a.data(), b.data(), a.size());
}

void tolower_inplace(mstring& s);

/**
 * Parse a decimal number, return the default value on any kind of trouble.
 */
off_t atoofft(string_view s, off_t nDefVal = 0);
double atodbl(string_view s, double nDefVal, bool* pOk = nullptr);

/**
 * Tokenizer over a string view, skipping empty tokens.
 * Can be used with Next()/view() or as a range in a for loop.
 */
class tSplitWalk
{
	string_view m_input, m_seps, m_cur;
	tStrPos m_pos = 0;
public:
	explicit tSplitWalk(string_view line, string_view separators = SPACECHARSsv)
	: m_input(line), m_seps(separators)
	{
	}
	bool Next();
	string_view view() const { return m_cur; }
	mstring str() const { return mstring(m_cur); }
	// rest of the input after the current token, trimmed of leading separators
	string_view right() const;

	struct iterator
	{
		tSplitWalk* w;
		bool operator!=(const iterator& other) const { return w != other.w; }
		iterator& operator++() { if (!w->Next()) w = nullptr; return *this; }
		string_view operator*() const { return w->view(); }
	};
	iterator begin() { return iterator { Next() ? this : nullptr }; }
	iterator end() { return iterator { nullptr }; }
};

}

#endif /* ASTROP_H_ */
