#ifndef CADDRINFO_H_
#define CADDRINFO_H_

#include "meta.h"

#include <memory>
#include <deque>
#include <functional>

#include <sys/socket.h>
#include <netdb.h>

extern "C"
{
struct ares_addrinfo;
struct ares_addrinfo_node;
}

namespace orca
{

struct ORCA_API orca_addrinfo
{
	int ai_family;
	socklen_t ai_addrlen;
	sockaddr_storage ai_addr;

	explicit orca_addrinfo(const ares_addrinfo_node* src);
	bool operator==(const orca_addrinfo& other) const;
	// numeric host address without port
	mstring formatIp() const;
	static mstring formatIpPort(const sockaddr *pAddr, socklen_t addrLen, int ipFamily);
};

class CAddrInfo;
using CAddrInfoPtr = std::shared_ptr<CAddrInfo>;

/**
 * Result of a host name lookup through c-ares. Results are cached for DnsCacheSeconds,
 * concurrent lookups of the same name share one query.
 */
class ORCA_API CAddrInfo
{
	mstring m_sError;
	time_t m_expTime = 0;
	// preferred address first
	std::deque<orca_addrinfo> m_addrs;

	friend struct tLookup;

public:
	using tDnsResultReporter = std::function<void(CAddrInfoPtr)>;

	CAddrInfo() =default;
	explicit CAddrInfo(mstring&& error) : m_sError(std::move(error)) {}
	CAddrInfo(const CAddrInfo&) = delete;
	CAddrInfo& operator=(const CAddrInfo&) = delete;

	const std::deque<orca_addrinfo>& getAddrs() const { return m_addrs; }
	cmstring& getError() const { return m_sError; }
	bool HasError() const { return !m_sError.empty(); }
	bool IsExpired() const { return m_expTime <= GetTime(); }

	/**
	 * Asynchronous resolution, the reporter is called on the event thread.
	 * Can be called from any thread.
	 * @param sPort numeric port or empty
	 */
	static void Resolve(cmstring& sHostname, cmstring& sPort, tDnsResultReporter);
};

// to be called once from the event thread when the loop is finished
void RejectPendingDnsRequests();

}

#endif /*CADDRINFO_H_*/
