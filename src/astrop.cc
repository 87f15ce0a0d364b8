/*
 * astrop.cc
 *
 *  Created on: 10.03.2020
 */

#include "astrop.h"

#include <charconv>
#include <cctype>
#include <cstdlib>

namespace orca
{

using namespace std;

bool tSplitWalk::Next()
{
	m_pos = m_input.find_first_not_of(m_seps, m_pos);
	if (m_pos == stmiss)
	{
		m_pos = m_input.size();
		return false;
	}
	auto tokEnd = m_input.find_first_of(m_seps, m_pos);
	if (tokEnd == stmiss)
		tokEnd = m_input.size();
	m_cur = m_input.substr(m_pos, tokEnd - m_pos);
	m_pos = tokEnd;
	return true;
}

string_view tSplitWalk::right() const
{
	auto pos = m_input.find_first_not_of(m_seps, m_pos);
	return pos == stmiss ? string_view() : m_input.substr(pos);
}

void tolower_inplace(mstring& s)
{
	for (auto& c: s)
		c = tolower((unsigned char) c);
}

template<typename Tresult>
Tresult aToSomething(string_view s, Tresult nDefVal)
{
	Tresult ret(nDefVal);
	auto pstart = s.find_first_not_of(SPACECHARSsv);
	if (pstart == stmiss)
		return nDefVal;

	auto ec(std::from_chars(s.data() + pstart, s.data() + s.size(), ret, 10).ec);
	switch (ec)
	{
	case std::errc::invalid_argument:
	case std::errc::result_out_of_range:
		return nDefVal;
	default:
		return ret;
	}
}

off_t atoofft(string_view s, off_t nDefVal)
{
	return aToSomething<off_t>(s, nDefVal);
}

double atodbl(string_view s, double nDefVal, bool* pOk)
{
	// strtod wants a terminated string and respects the C locale set at startup
	mstring buf(trimBoth(s));
	char* pEnd = nullptr;
	auto ret = buf.empty() ? nDefVal : strtod(buf.c_str(), &pEnd);
	bool ok = !buf.empty() && pEnd && !*pEnd;
	if (pOk)
		*pOk = ok;
	return ok ? ret : nDefVal;
}

}
