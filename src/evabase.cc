#include "evabase.h"
#include "meta.h"
#include "debug.h"
#include "ocfg.h"
#include "caddrinfo.h"

#include <deque>
#include <mutex>

#include <event2/util.h>

#include <ares.h>

using namespace std;

namespace orca
{

event_base* evabase::base = nullptr;
std::atomic_bool g_shutdownHint = false;

static evabase* g_global = nullptr;
static std::thread::id g_mainThread;

// actions handed over from other threads
static std::mutex g_postMx;
static deque<tAction> g_posted;
static event* g_postWakeup = nullptr;

tAresChannel::~tAresChannel()
{
	if (m_channel)
		ares_destroy(m_channel);
	m_watches.clear();
	m_rescan.reset();
}

void tAresChannel::sync()
{
	static const timeval asap { 0, 0 };
	if (!m_rescan.valid())
		m_rescan.reset(evtimer_new(evabase::base, cbRescan, this));
	event_add(m_rescan.get(), &asap);
}

void tAresChannel::cbRescan(evutil_socket_t, short, void* arg)
{
	((tAresChannel*) arg)->Rewatch();
}

void tAresChannel::cbSocket(evutil_socket_t fd, short what, void* arg)
{
	auto me = (tAresChannel*) arg;
	if (what & EV_TIMEOUT)
		ares_process_fd(me->m_channel, ARES_SOCKET_BAD, ARES_SOCKET_BAD);
	else
	{
		ares_process_fd(me->m_channel,
				(what & EV_READ) ? fd : ARES_SOCKET_BAD,
				(what & EV_WRITE) ? fd : ARES_SOCKET_BAD);
	}
	// the socket set may have changed
	me->sync();
}

void tAresChannel::Rewatch()
{
	m_watches.clear();
	if (!m_channel)
		return;
	ares_socket_t socks[ARES_GETSOCK_MAXNUM];
	auto mask = ares_getsock(m_channel, socks, ARES_GETSOCK_MAXNUM);
	timeval tvBuf;
	auto tmout = ares_timeout(m_channel, nullptr, &tvBuf);
	for (int i = 0; i < ARES_GETSOCK_MAXNUM; ++i)
	{
		short what = 0;
		if (ARES_GETSOCK_READABLE(mask, i))
			what |= EV_READ;
		if (ARES_GETSOCK_WRITABLE(mask, i))
			what |= EV_WRITE;
		if (!what)
			continue;
		unique_event ev(event_new(evabase::base, socks[i], what, cbSocket, this));
		if (!ev.valid())
			continue;
		event_add(ev.get(), tmout);
		m_watches.emplace_back(move(ev));
	}
}

std::shared_ptr<tAresChannel> evabase::GetDnsBase()
{
	Cstat conf(cfg::dnsresconf);
	// without the file c-ares uses its defaults, keep whatever is there
	if (!conf)
		return m_dns;
	auto confId = conf.fpr();
	if (m_dns && confId == m_dnsConfId)
		return m_dns;

	ares_channel ch;
	auto r = ares_init(&ch);
	if (r != ARES_SUCCESS)
	{
		log::err(tSS() << "Cannot set up the DNS resolver: " << ares_strerror(r));
		return m_dns;
	}
	m_dns.reset(new tAresChannel(ch));
	m_dnsConfId = confId;
	return m_dns;
}

evabase &evabase::GetGlobal()
{
	return *g_global;
}

bool evabase::IsMainThread()
{
	return g_mainThread == std::this_thread::get_id();
}

int evabase::MainLoop()
{
	LOGSTARTFUNCs;
	GetDnsBase();
	int r = event_base_loop(base, EVLOOP_NO_EXIT_ON_EMPTY);
	RejectPendingDnsRequests();
	PushLoop();
	return r;
}

void evabase::SignalStop()
{
	g_shutdownHint = true;
	Post([]()
	{
		if (base)
			event_base_loopbreak(base);
	});
}

void evabase::cbHandover(evutil_socket_t, short, void*)
{
	deque<tAction> todo;
	{
		lguard g(g_postMx);
		todo.swap(g_posted);
	}
	for (auto& ac: todo)
	{
		try
		{
			ac();
		}
		catch (const std::exception& ex)
		{
			USRERR("Error in posted action: " << ex.what());
		}
	}
}

void evabase::Post(tAction&& act)
{
	if (!act)
		return;
	lguard g(g_postMx);
	g_posted.emplace_back(move(act));
	if (g_postWakeup)
		event_active(g_postWakeup, EV_TIMEOUT, 0);
}

evabase::evabase()
{
	g_mainThread = std::this_thread::get_id();
	base = event_base_new();
	m_handover.reset(evtimer_new(base, cbHandover, nullptr));
	{
		lguard g(g_postMx);
		g_postWakeup = m_handover.get();
	}
	g_global = this;
}

evabase::~evabase()
{
	m_dns.reset();
	{
		lguard g(g_postMx);
		g_postWakeup = nullptr;
	}
	m_handover.reset();
	if (base)
	{
		event_base_free(base);
		base = nullptr;
	}
	g_global = nullptr;
}

void evabase::PushLoop()
{
	// a few rounds, callbacks may schedule more work
	for (int i = 0; i < 10; ++i)
	{
		if (0 != event_base_loop(base, EVLOOP_NONBLOCK))
			break;
	}
}

}
