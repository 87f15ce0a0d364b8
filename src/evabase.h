#ifndef EVABASE_H_
#define EVABASE_H_

#include "config.h"
#include "octemplates.h"
#include "fileio.h"

#include <memory>
#include <thread>
#include <atomic>
#include <vector>

#include <event.h>

extern "C"
{
struct ares_channeldata;
}

namespace orca
{
extern std::atomic_bool g_shutdownHint;

using unique_event = auto_raii<event*, event_free, nullptr>;

/**
 * c-ares channel driven by the libevent loop. Replaced when resolv.conf changes,
 * running lookups keep the old one alive through shared references.
 */
class ORCA_API tAresChannel
{
	friend class evabase;
	ares_channeldata* m_channel;
	// deferred rescan of the sockets which c-ares wants to be watched
	unique_event m_rescan;
	std::vector<unique_event> m_watches;

	explicit tAresChannel(ares_channeldata* ch) : m_channel(ch) {}
	static void cbRescan(evutil_socket_t, short, void* arg);
	static void cbSocket(evutil_socket_t fd, short what, void* arg);
	void Rewatch();

public:
	~tAresChannel();
	ares_channeldata* get() const { return m_channel; }
	// to be called after every request submission
	void sync();
};

/**
 * Owner of the global libevent base. One instance per process, created by main.
 */
class ORCA_API evabase
{
	std::shared_ptr<tAresChannel> m_dns;
	// identity of the resolver configuration the channel was made from
	Cstat::tID m_dnsConfId { { 0, 1 }, 0, 0 };
	unique_event m_handover;

	evabase();
	static void cbHandover(evutil_socket_t, short, void*);

public:
	static event_base *base;

	~evabase();
	static std::unique_ptr<evabase> Create() { return std::unique_ptr<evabase>(new evabase); }
	static evabase& GetGlobal();

	// current resolver channel, recreated when the system configuration changed
	std::shared_ptr<tAresChannel> GetDnsBase();

	static bool IsMainThread();

	/**
	 * Run the event loop until SignalStop. Resolution requests still waiting are
	 * rejected afterwards so that nobody waits forever.
	 */
	int MainLoop();
	// from any thread
	static void SignalStop();
	/**
	 * Run the action on the event thread in one of the next loop cycles. Can be
	 * called from any thread.
	 */
	static void Post(tAction&&);

	bool IsShuttingDown() { return g_shutdownHint; }
	// run pending activity without blocking
	void PushLoop();
};

}

#endif
