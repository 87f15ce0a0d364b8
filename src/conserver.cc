#include "conserver.h"
#include "ctlproto.h"
#include "meta.h"
#include "ocfg.h"
#include "caddrinfo.h"
#include "ahttpurl.h"
#include "fileio.h"
#include "evabase.h"

#include <event2/bufferevent.h>
#include <event2/buffer.h>
#include <event2/listener.h>

#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>

#include <algorithm>
#include <cstddef>
#include <list>
#include <vector>
#include <unordered_map>
#include <iostream>

#include "debug.h"

using namespace std;

namespace orca
{

// longest accepted request line, longer ones close the connection
#define MAX_REQUEST_LINE 65536
// seconds
#define CTL_IDLE_TIMEOUT 600
// ms, pause of accepting after running out of descriptors
#define ACCEPT_RETRY_DELAY 2000

using unique_listener = auto_raii<evconnlistener*, evconnlistener_free, nullptr>;

class conserverImpl;

struct tCtlConnection
{
	conserverImpl* server;
	mstring clientName;
};

class conserverImpl : public conserver
{
	ctlhandler& m_handler;
	std::list<unique_listener> m_listeners;
	std::unordered_map<bufferevent*, std::unique_ptr<tCtlConnection>> m_conns;
	unique_event m_resumeTimer;

	void Drop(bufferevent* bev)
	{
		auto it = m_conns.find(bev);
		if (it == m_conns.end())
			return;
		USRDBG("Closing control connection from " << it->second->clientName);
		bufferevent_free(bev);
		m_conns.erase(it);
	}

	// serves all complete lines, returns false if the connection is gone or closing
	bool Serve(bufferevent* bev, tCtlConnection& conn)
	{
		auto in = bufferevent_get_input(bev);
		for (;;)
		{
			size_t len = 0;
			unique_ptr<char, decltype(&free)> line(evbuffer_readln(in, &len, EVBUFFER_EOL_CRLF), &free);
			if (!line)
			{
				if (evbuffer_get_length(in) <= MAX_REQUEST_LINE)
					return true;
				USRERR("Oversized control request from " << conn.clientName);
				Drop(bev);
				return false;
			}
			bool bQuit = false;
			mstring reply;
			try
			{
				reply = m_handler.Dispatch(string_view(line.get(), len), bQuit);
			}
			catch (const std::exception& ex)
			{
				reply = "ERR Internal error: "s + ex.what() + "\n";
			}
			bufferevent_write(bev, reply.data(), reply.size());
			if (bQuit)
			{
				// close after the output is flushed
				bufferevent_disable(bev, EV_READ);
				bufferevent_setcb(bev, nullptr, cbFlushed, cbEvent, &conn);
				return false;
			}
		}
	}

	static void cbRead(bufferevent* bev, void* arg)
	{
		auto conn = (tCtlConnection*) arg;
		conn->server->Serve(bev, *conn);
	}

	static void cbFlushed(bufferevent* bev, void* arg)
	{
		((tCtlConnection*) arg)->server->Drop(bev);
	}

	static void cbEvent(bufferevent* bev, short what, void* arg)
	{
		if (what & (BEV_EVENT_EOF | BEV_EVENT_ERROR | BEV_EVENT_TIMEOUT))
			((tCtlConnection*) arg)->server->Drop(bev);
	}

	static void cbAccept(evconnlistener*, evutil_socket_t fd, sockaddr* addr, int addrLen, void* arg)
	{
		auto me = (conserverImpl*) arg;
		unique_fd guard(fd);
		mstring name = addr->sa_family == AF_UNIX ? mstring("<UNIX>")
				: orca_addrinfo::formatIpPort(addr, addrLen, addr->sa_family);
		auto bev = bufferevent_socket_new(evabase::base, fd, BEV_OPT_CLOSE_ON_FREE);
		if (!bev)
		{
			USRERR("Cannot serve the connection from " << name);
			return;
		}
		guard.release();
		USRDBG("Control client: " << name);
		auto conn = make_unique<tCtlConnection>(tCtlConnection { me, move(name) });
		bufferevent_setcb(bev, cbRead, nullptr, cbEvent, conn.get());
		CTimeVal idle;
		bufferevent_set_timeouts(bev, idle.For(CTL_IDLE_TIMEOUT), nullptr);
		bufferevent_enable(bev, EV_READ | EV_WRITE);
		me->m_conns.emplace(bev, move(conn));
	}

	static void cbAcceptError(evconnlistener*, void* arg)
	{
		auto me = (conserverImpl*) arg;
		auto err = EVUTIL_SOCKET_ERROR();
		if (err != EMFILE && err != ENFILE && err != ENOBUFS && err != ENOMEM)
			return;
		// out of resources, pause accepting for a while
		log::err(tErrnoFmter(err, "Cannot accept control connections: "));
		for (auto& l: me->m_listeners)
			evconnlistener_disable(l.get());
		if (!me->m_resumeTimer.valid())
		{
			me->m_resumeTimer.reset(evtimer_new(evabase::base, [](evutil_socket_t, short, void* a)
			{
				for (auto& l: ((conserverImpl*) a)->m_listeners)
					evconnlistener_enable(l.get());
			}, me));
		}
		CTimeVal tv;
		evtimer_add(me->m_resumeTimer.get(), tv.ForMs(ACCEPT_RETRY_DELAY));
	}

	// takes ownership of the bound socket
	bool Listen(evutil_socket_t fd)
	{
		auto l = evconnlistener_new(evabase::base, cbAccept, this,
				LEV_OPT_CLOSE_ON_FREE | LEV_OPT_CLOSE_ON_EXEC, SOMAXCONN, fd);
		if (!l)
		{
			perror("Couldn't listen on socket");
			justforceclose(fd);
			return false;
		}
		evconnlistener_set_error_cb(l, cbAcceptError);
		m_listeners.emplace_back(l);
		return true;
	}

	static int GetBoundPort(evutil_socket_t fd)
	{
		sockaddr_storage ss;
		socklen_t len = sizeof(ss);
		if (0 != getsockname(fd, (sockaddr*) &ss, &len))
			return -1;
		switch (ss.ss_family)
		{
		case AF_INET:
			return ntohs(((sockaddr_in*) &ss)->sin_port);
		case AF_INET6:
			return ntohs(((sockaddr_in6*) &ss)->sin6_port);
		default:
			return -1;
		}
	}

public:
	explicit conserverImpl(ctlhandler& handler) : m_handler(handler) {}
	~conserverImpl()
	{
		Abandon();
	}

	bool SetupUnix(cmstring& sPath) override
	{
		sockaddr_un sa;
		memset(&sa, 0, sizeof(sa));
		if (sPath.length() >= sizeof(sa.sun_path))
		{
			cerr << "Socket path too long: " << sPath << endl;
			return false;
		}
		sa.sun_family = AF_UNIX;
		memcpy(sa.sun_path, sPath.data(), sPath.length());
		auto saLen = socklen_t(offsetof(sockaddr_un, sun_path) + sPath.length() + 1);

		mkbasedir(sPath);
		// left over by a previous instance
		unlink(sPath.c_str());

		unique_fd fd(socket(PF_UNIX, SOCK_STREAM, 0));
		if (!fd.valid())
		{
			cerr << tErrnoFmter("Error creating UNIX domain socket: ") << endl;
			return false;
		}
		if (0 != ::bind(fd.get(), (sockaddr*) &sa, saLen))
		{
			cerr << tErrnoFmter(("Cannot bind " + sPath + ": ").c_str())
					<< ", please check the permissions" << endl;
			return false;
		}
		evutil_make_socket_nonblocking(fd.get());
		if (!Listen(fd.release()))
			return false;
		// job control is for the owner and the group
		if (0 != chmod(sPath.c_str(), 0770))
			cerr << tErrnoFmter("Failed to change socket permissions: ") << endl;
		return true;
	}

	int SetupTcp(LPCSTR bindAddr, uint16_t port) override
	{
		LOGSTARTFUNCxs(bindAddr, port);
		addrinfo hints;
		memset(&hints, 0, sizeof(hints));
		hints.ai_socktype = SOCK_STREAM;
		hints.ai_flags = AI_PASSIVE;
		hints.ai_family = PF_UNSPEC;
		addrinfo* res = nullptr;
		auto rc = getaddrinfo(bindAddr, to_string(port).c_str(), &hints, &res);
		if (rc)
		{
			cerr << "Error resolving address for binding: " << gai_strerror(rc) << endl;
			return -1;
		}
		unique_ptr<addrinfo, decltype(&freeaddrinfo)> resGuard(res, &freeaddrinfo);

		int boundPort = -1;
		vector<mstring> seen;
		for (auto p = res; p; p = p->ai_next)
		{
			mstring key((const char*) p->ai_addr, p->ai_addrlen);
			if (find(seen.begin(), seen.end(), key) != seen.end())
				continue;
			seen.push_back(key);

			// the next address family should share a randomly picked port
			if (!port && boundPort > 0)
			{
				if (p->ai_family == AF_INET)
					((sockaddr_in*) p->ai_addr)->sin_port = htons(boundPort);
				else if (p->ai_family == AF_INET6)
					((sockaddr_in6*) p->ai_addr)->sin6_port = htons(boundPort);
			}

			unique_fd fd(socket(p->ai_family, p->ai_socktype, p->ai_protocol));
			if (!fd.valid())
			{
				// no IPv6 here
				if (errno != EAFNOSUPPORT && errno != EPFNOSUPPORT && errno != EPROTONOSUPPORT)
					cerr << tErrnoFmter("Error creating socket: ") << endl;
				continue;
			}
			int on = 1;
#ifdef IPV6_V6ONLY
			if (p->ai_family == AF_INET6)
				setsockopt(fd.get(), IPPROTO_IPV6, IPV6_V6ONLY, &on, sizeof(on));
#endif
			setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
			auto where = orca_addrinfo::formatIpPort(p->ai_addr, p->ai_addrlen, p->ai_family);
			USRDBG("Binding " << where);
			if (0 != ::bind(fd.get(), p->ai_addr, p->ai_addrlen))
			{
				cerr << "Cannot bind " << where << ": " << tErrnoFmter() << endl;
				continue;
			}
			evutil_make_socket_nonblocking(fd.get());
			auto raw = fd.release();
			if (!Listen(raw))
				continue;
			boundPort = GetBoundPort(raw);
		}
		return boundPort;
	}

	bool Setup() override
	{
		LOGSTARTFUNCs;
		if (cfg::udspath.empty() && !cfg::port && cfg::bindaddr.empty())
		{
			cerr << "Neither TCP nor UNIX interface configured, cannot proceed." << endl;
			return false;
		}
		if (!cfg::udspath.empty())
			SetupUnix(cfg::udspath);

		bool explicitTcp = false;
		for (auto sp: tSplitWalk(cfg::bindaddr))
		{
			// plain address or host[:port]
			tHttpUrl url;
			mstring host(sp);
			uint16_t port = cfg::port;
			if (url.SetHttpUrl(sp, false))
			{
				host = url.sHost;
				port = url.GetPort(cfg::port);
			}
			if (!port)
			{
				USRDBG("Not creating TCP listening socket for " << sp << ", no port specified");
				continue;
			}
			SetupTcp(host.c_str(), port);
			explicitTcp = true;
		}
		// local control only if nothing else was requested
		if (!explicitTcp && cfg::port)
			SetupTcp("localhost", cfg::port);

		return !m_listeners.empty();
	}

	void Abandon() override
	{
		m_listeners.clear();
		m_resumeTimer.reset();
		for (auto& kv: m_conns)
			bufferevent_free(kv.first);
		m_conns.clear();
	}

	size_t GetConnectionCount() override
	{
		return m_conns.size();
	}
};

std::unique_ptr<conserver> conserver::Create(ctlhandler& handler)
{
	return make_unique<conserverImpl>(handler);
}

}
