#include "tpool.h"
#include "meta.h"
#include "oclogger.h"

#include <mutex>
#include <condition_variable>
#include <thread>
#include <system_error>

using namespace std;

namespace orca {

/*
 * Workers are started on demand, up to m_nMaxActive. A worker which finds the backlog
 * empty either waits for more work (as long as there are at most m_nMaxStandby idle
 * workers) or exits.
 */
class tpoolImpl : public tpool
{
	const unsigned m_nMaxBacklog, m_nMaxActive, m_nMaxStandby;
	// started workers, and those of them waiting for work
	unsigned m_nWorkers = 0, m_nIdle = 0;
	deque<function<void()>> m_todo;
	bool m_bStopping = false;
	mutex m_mx;
	condition_variable m_wakeup, m_gone;

	void RunWorker()
	{
		ulock g(m_mx);
		while (!m_bStopping)
		{
			if (m_todo.empty())
			{
				if (m_nIdle >= m_nMaxStandby)
					break;
				++m_nIdle;
				m_wakeup.wait(g);
				--m_nIdle;
				continue;
			}
			auto work = take_front(m_todo);
			g.unlock();
			try
			{
				work();
			}
			catch (const std::exception& ex)
			{
				log::err(tSS() << "Post-processing task failed: " << ex.what());
			}
			// captures released outside of the lock
			work = nullptr;
			g.lock();
		}
		--m_nWorkers;
		m_gone.notify_all();
	}

	// called with the lock held
	bool AddWorker()
	{
		try
		{
			thread(&tpoolImpl::RunWorker, this).detach();
		}
		catch (const std::system_error& ex)
		{
			log::err(tSS() << "Cannot start worker thread: " << ex.what());
			return false;
		}
		++m_nWorkers;
		return true;
	}

public:
	tpoolImpl(unsigned maxBacklog, unsigned maxActive, unsigned maxStandby)
		: m_nMaxBacklog(maxBacklog), m_nMaxActive(max(1u, maxActive)), m_nMaxStandby(maxStandby)
	{
	}

	~tpoolImpl()
	{
		stop();
	}

	bool schedule(function<void ()> action) override
	{
		lguard g(m_mx);
		if (m_bStopping || m_todo.size() >= m_nMaxBacklog)
			return false;
		// nobody waiting, start another worker if allowed
		if (m_nIdle == 0 && m_nWorkers < m_nMaxActive && !AddWorker() && m_nWorkers == 0)
			return false;
		m_todo.emplace_back(move(action));
		m_wakeup.notify_one();
		return true;
	}

	void stop() override
	{
		ulock g(m_mx);
		m_bStopping = true;
		m_todo.clear();
		m_wakeup.notify_all();
		m_gone.wait(g, [this]() { return m_nWorkers == 0; });
	}
};

std::shared_ptr<tpool> tpool::Create(unsigned maxBacklog, unsigned maxActive, unsigned maxStandby)
{
	return std::make_shared<tpoolImpl>(maxBacklog, maxActive, maxStandby);
}

}
