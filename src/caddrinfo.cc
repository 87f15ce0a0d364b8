#include "caddrinfo.h"
#include "ocfg.h"
#include "debug.h"
#include "evabase.h"

#include <algorithm>
#include <cstring>
#include <unordered_map>
#include <vector>

#include <ares.h>
#include <arpa/inet.h>

using namespace std;

namespace orca
{
// cached names
#define DNS_CACHE_MAX 255
// seconds, failures are not kept longer than that
#define DNS_ERROR_KEEP_MAX 10
// addresses per name
#define DNS_MAX_ADDR 10

mstring orca_addrinfo::formatIpPort(const sockaddr *pAddr, socklen_t addrLen, int ipFamily)
{
	char host[NI_MAXHOST], port[NI_MAXSERV];
	if (getnameinfo(pAddr, addrLen, host, sizeof(host), port, sizeof(port), NI_NUMERICHOST | NI_NUMERICSERV))
		return "<unknown>";
	if (ipFamily == PF_INET6)
		return "["s + host + "]:" + port;
	return host + ":"s + port;
}

mstring orca_addrinfo::formatIp() const
{
	char buf[INET6_ADDRSTRLEN];
	auto pAddr = ai_family == PF_INET6
			? (const void*) &((const sockaddr_in6*) &ai_addr)->sin6_addr
			: (const void*) &((const sockaddr_in*) &ai_addr)->sin_addr;
	return inet_ntop(ai_family, pAddr, buf, sizeof(buf)) ? mstring(buf) : se;
}

bool orca_addrinfo::operator==(const orca_addrinfo &other) const
{
	return ai_family == other.ai_family && ai_addrlen == other.ai_addrlen
			&& 0 == memcmp(&ai_addr, &other.ai_addr, ai_addrlen);
}

orca_addrinfo::orca_addrinfo(const ares_addrinfo_node *src)
	: ai_family(src->ai_family), ai_addrlen(src->ai_addrlen)
{
	memset(&ai_addr, 0, sizeof(ai_addr));
	memcpy(&ai_addr, src->ai_addr, std::min<size_t>(ai_addrlen, sizeof(ai_addr)));
}

/**
 * One running c-ares query with everybody waiting for it.
 */
struct tLookup
{
	mstring key, host, port;
	std::shared_ptr<tAresChannel> channel;
	std::vector<CAddrInfo::tDnsResultReporter> waiters;

	static void cbDone(void *arg, int status, int timeouts, ares_addrinfo *results);
	CAddrInfoPtr MakeResult(int status, ares_addrinfo *results);
	static void StoreInCache(cmstring& key, CAddrInfoPtr res);
};

static unordered_map<mstring, CAddrInfoPtr> g_cache;
static unordered_map<mstring, tLookup*> g_running;

void tLookup::StoreInCache(cmstring& key, CAddrInfoPtr res)
{
	if (g_cache.size() >= DNS_CACHE_MAX)
	{
		auto now = GetTime();
		for (auto it = g_cache.begin(); it != g_cache.end();)
		{
			if (it->second->m_expTime <= now)
				it = g_cache.erase(it);
			else
				++it;
		}
	}
	// still full of valid entries, drop the one expiring first
	if (g_cache.size() >= DNS_CACHE_MAX)
	{
		g_cache.erase(min_element(g_cache.begin(), g_cache.end(), [](const auto& a, const auto& b)
		{
			return a.second->m_expTime < b.second->m_expTime;
		}));
	}
	g_cache[key] = move(res);
}

CAddrInfoPtr tLookup::MakeResult(int status, ares_addrinfo *results)
{
	auto ret = make_shared<CAddrInfo>();
	auto now = GetTime();
	auto errKeep = std::min(cfg::dnscachetime, DNS_ERROR_KEEP_MAX);
	switch (status)
	{
	case ARES_SUCCESS:
		break;
	case ARES_ENOTFOUND:
		ret->m_sError = "Host not found";
		return ret;
	case ARES_ENOTIMP:
		ret->m_sError = "Unsupported address family";
		return ret;
	case ARES_ECANCELLED:
	case ARES_EDESTRUCTION:
		ret->m_sError = "Temporary DNS resolution error";
		return ret;
	default:
		ret->m_sError = "DNS error, "s + ares_strerror(status);
		ret->m_expTime = now + errKeep;
		return ret;
	}

	// one entry per socket type and protocol, keep the TCP ones without duplicates
	vector<orca_addrinfo> v4, v6;
	for (auto p = results ? results->nodes : nullptr; p; p = p->ai_next)
	{
		if (p->ai_socktype != SOCK_STREAM || p->ai_protocol != IPPROTO_TCP)
			continue;
		orca_addrinfo a(p);
		auto& target = a.ai_family == PF_INET6 ? v6 : v4;
		if (a.ai_family != PF_INET && a.ai_family != PF_INET6)
			continue;
		if (find(target.begin(), target.end(), a) == target.end())
			target.push_back(a);
	}
	// alternate between the families, IPv4 first
	for (size_t i = 0; ret->m_addrs.size() < DNS_MAX_ADDR && (i < v4.size() || i < v6.size()); ++i)
	{
		if (i < v4.size())
			ret->m_addrs.push_back(v4[i]);
		if (i < v6.size() && ret->m_addrs.size() < DNS_MAX_ADDR)
			ret->m_addrs.push_back(v6[i]);
	}
	if (ret->m_addrs.empty())
	{
		ret->m_sError = "DNS error, no usable address";
		ret->m_expTime = now + errKeep;
	}
	else
	{
		ret->m_expTime = now + cfg::dnscachetime;
		for (const auto& a: ret->m_addrs)
			ldbg("Resolved " << host << ": " << a.formatIp());
	}
	return ret;
}

void tLookup::cbDone(void *arg, int status, int, ares_addrinfo *results)
{
	unique_ptr<tLookup> me((tLookup*) arg);
	g_running.erase(me->key);
	auto res = me->MakeResult(status, results);
	if (results)
		ares_freeaddrinfo(results);
	if (cfg::dnscachetime > 0 && res->m_expTime > GetTime())
		StoreInCache(me->key, res);
	for (auto& w: me->waiters)
		w(res);
}

void CAddrInfo::Resolve(cmstring & sHostname, cmstring &sPort, tDnsResultReporter rep)
{
	evabase::Post([host = sHostname, port = sPort, rep = move(rep)]() mutable
	{
		if (!rep)
			return;
		LOGSTARTFUNCxs(host);
		if (g_shutdownHint)
			return rep(make_shared<CAddrInfo>("System shutting down"));

		auto key = host + ":" + port;
		auto cached = g_cache.find(key);
		if (cached != g_cache.end())
		{
			if (!cached->second->IsExpired())
				return rep(cached->second);
			g_cache.erase(cached);
		}
		auto running = g_running.find(key);
		if (running != g_running.end())
		{
			running->second->waiters.emplace_back(move(rep));
			return;
		}

		auto channel = evabase::GetGlobal().GetDnsBase();
		if (!channel || !channel->get())
			return rep(make_shared<CAddrInfo>("Bad DNS configuration"));

		auto lookup = new tLookup { key, host, port, channel, { move(rep) } };
		g_running[key] = lookup;

		ares_addrinfo_hints hints;
		memset(&hints, 0, sizeof(hints));
		// numeric ports only, no service lookup
		hints.ai_flags = ARES_AI_NUMERICSERV;
		hints.ai_family = PF_UNSPEC;
		hints.ai_socktype = SOCK_STREAM;
		hints.ai_protocol = IPPROTO_TCP;
		// the channel may be replaced during the query, the lookup keeps it alive
		ares_getaddrinfo(channel->get(), lookup->host.c_str(), lookup->port.empty() ? nullptr : lookup->port.c_str(),
				&hints, tLookup::cbDone, lookup);
		channel->sync();
	});
}

void RejectPendingDnsRequests()
{
	for (auto& kv: g_running)
	{
		auto waiters = move(kv.second->waiters);
		kv.second->waiters.clear();
		for (auto& w: waiters)
			w(make_shared<CAddrInfo>("System shutting down"));
	}
}

}
