#include "ahttpurl.h"
#include "meta.h"

#include <algorithm>

namespace orca {

using namespace std;

namespace
{
const struct
{
	string_view prefix;
	tHttpUrl::EProtoType proto;
	uint16_t port;
} schemas[] =
{
	{ "http://", tHttpUrl::EProtoType::HTTP, 80 },
	{ "https://", tHttpUrl::EProtoType::HTTPS, 443 },
	{ "ftp://", tHttpUrl::EProtoType::FTP, 21 },
	{ "sftp://", tHttpUrl::EProtoType::SFTP, 22 }
};
}

uint16_t tHttpUrl::GetDefaultPortForProto() const
{
	for (const auto& s: schemas)
		if (s.proto == m_schema)
			return s.port;
	return 0;
}

// RFC3986, reduced to what download sources look like
bool tHttpUrl::SetHttpUrl(string_view raw, bool unescape)
{
	*this = tHttpUrl();

	mstring buf(unescape ? UrlUnescape(raw) : mstring(raw));
	auto url = trimBoth(string_view(buf));
	if (url.empty())
		return false;

	auto known = find_if(begin(schemas), end(schemas), [&](const auto& s)
	{
		return startsWithNoCase(url, s.prefix);
	});
	if (known != end(schemas))
	{
		m_schema = known->proto;
		url.remove_prefix(known->prefix.size());
#ifndef HAVE_SSL
		if (m_schema == EProtoType::HTTPS)
			return false;
#endif
	}
	else if (url.find("://") != string_view::npos)
		return false;
	else if (url[0] != '[' && !isalnum((unsigned char) url[0]))
		return false;

	while (!url.empty() && url[0] == '/')
		url.remove_prefix(1);

	auto authEnd = url.find_first_of("/?");
	string_view auth = url.substr(0, authEnd);
	if (authEnd == string_view::npos)
		sPath = "/";
	else
	{
		auto rest = url.substr(authEnd);
		// collapse a leading run of slashes
		while (rest.size() > 1 && rest[0] == '/' && rest[1] == '/')
			rest.remove_prefix(1);
		sPath = rest[0] == '?' ? "/" + mstring(rest) : mstring(rest);
	}

	auto at = auth.rfind('@');
	if (at != string_view::npos)
	{
		sUserPass = UrlUnescape(auth.substr(0, at));
		auth.remove_prefix(at + 1);
	}
	if (auth.empty() || auth[0] == '_')
		return false;

	string_view host = auth, port;
	if (auth[0] == '[')
	{
		auto close = auth.find(']');
		if (close == string_view::npos)
			return false;
		host = auth.substr(1, close - 1);
		auto tail = auth.substr(close + 1);
		if (!tail.empty())
		{
			if (tail[0] != ':')
				return false;
			port = tail.substr(1);
			if (port.empty())
				return false;
		}
	}
	// two or more colons without brackets, a bare IPv6 address
	else if (count(auth.begin(), auth.end(), ':') < 2)
	{
		auto colon = auth.rfind(':');
		if (colon != string_view::npos)
		{
			port = auth.substr(colon + 1);
			host = auth.substr(0, colon);
			if (port.empty())
				return false;
		}
	}
	if (!port.empty())
	{
		if (port.size() > 5 || !all_of(port.begin(), port.end(), [](char c) { return isdigit((unsigned char) c); }))
			return false;
		auto val = atoi(mstring(port).c_str());
		if (val > MAX_VAL(uint16_t))
			return false;
		nPort = (uint16_t) val;
	}
	if (host.empty() || host.find(":::") != string_view::npos)
		return false;
	bool v6 = host.find(':') != string_view::npos;
	sHost = (v6 || unescape) ? mstring(host) : UrlUnescape(host);
	return true;
}

}
