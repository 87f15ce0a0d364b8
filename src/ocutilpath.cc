#include "ocutilpath.h"
#include "meta.h"

namespace orca
{

using namespace std;

string_view GetBaseName(string_view in)
{
	if(in.empty())
		return in;

	auto end = in.find_last_not_of(CPATHSEP); // must be the last char of basename
	if(end == stmiss) // empty, or just a slash?
		return "/";

	auto start = in.rfind(CPATHSEP, end);
	if(stmiss == start)
		start = 0;
	else
		start++;

	return in.substr(start, end+1-start);
}

mstring GetDirPart(string_view in)
{
	trimBack(in, SZPATHSEP);
	auto end = in.find_last_of(CPATHSEP);
	if (end == stmiss)
		return ".";
	if (end == 0)
		return SZPATHSEP;
	return mstring(in.substr(0, end));
}

mstring GetExtension(string_view path)
{
	auto base = GetBaseName(path);
	auto pos = base.rfind('.');
	// hidden files like .profile have no extension
	if (pos == stmiss || pos == 0)
		return mstring();
	mstring ret(base.substr(pos + 1));
	tolower_inplace(ret);
	return ret;
}

std::string PathCombine(string_view a, string_view b)
{
	std::string ret;
	ret.reserve(a.length() + b.length() + 1);
	if (a.size() > 1)
		trimBack(a, SZPATHSEP);
	b = trimBoth(b, SZPATHSEP);

	ret += a;

	if (!a.empty() && !b.empty())
	{
		if (!ret.ends_with(CPATHSEP))
			ret += CPATHSEP;
		ret += b;
	}
	return ret;
}

bool IsAbsolute(string_view path)
{
	return !path.empty() && path.front() == CPATHSEP;
}

}
