#include "oclock.h"
#include "evabase.h"
#include "meta.h"
#include "debug.h"

#include <time.h>

namespace orca
{

struct tTimerItem
{
	unique_event m_event;
	tAction m_action;
};

void cbTimerItem(evutil_socket_t, short, void *arg)
{
	auto me = (tTimerItem*) arg;
	// the action might destroy the token and this item with it
	tAction todo;
	todo.swap(me->m_action);
	if (todo)
		todo();
}

class tEvClock : public IEventClock
{
public:
	int64_t Now() override
	{
		struct timespec ts;
		clock_gettime(CLOCK_MONOTONIC, &ts);
		return int64_t(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
	}

	TFinalAction RunAfter(unsigned msDelay, tAction &&action) override
	{
		auto item = new tTimerItem;
		item->m_action = std::move(action);
		item->m_event.reset(evtimer_new(evabase::base, cbTimerItem, item));
		if (!item->m_event.valid())
		{
			delete item;
			throw std::bad_alloc();
		}
		CTimeVal tv;
		event_add(item->m_event.get(), tv.ForMs(msDelay));
		return TFinalAction([item]() { delete item; });
	}

	void Post(tAction &&action) override
	{
		evabase::Post(std::move(action));
	}
};

std::unique_ptr<IEventClock> IEventClock::Create()
{
	return std::make_unique<tEvClock>();
}

}
