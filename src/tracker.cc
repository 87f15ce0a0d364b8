#include "tracker.h"
#include "scheduler.h"
#include "checkpoint.h"
#include "oclock.h"
#include "ocfg.h"
#include "oclogger.h"
#include "meta.h"
#include "debug.h"

using namespace std;

namespace orca
{

tTrackerConfig tTrackerConfig::FromCfg()
{
	tTrackerConfig ret;
	ret.pollIntervalMs = max(50, cfg::pollinterval);
	ret.checkpointInterval = max(0, cfg::ckptinterval);
	ret.checkpointPath = cfg::GetCheckpointPath();
	return ret;
}

class progresstrackerImpl : public progresstracker
{
	jobscheduler& m_sched;
	IEventClock& m_clock;
	tTrackerConfig m_conf;
	TFinalAction m_timer, m_subscription;
	bool m_running = false, m_dirty = false;
	int64_t m_lastCheckpoint = 0;

	void Arm()
	{
		m_timer = m_clock.RunAfter(m_conf.pollIntervalMs, [this]() { Beat(); });
	}

	void CheckpointIfDue()
	{
		if (!m_dirty || m_conf.checkpointPath.empty() || !m_conf.checkpointInterval)
			return;
		if (m_clock.Now() - m_lastCheckpoint < int64_t(m_conf.checkpointInterval) * 1000)
			return;
		mstring err;
		if (!WriteCheckpoint(err))
			log::err(err);
	}

public:
	progresstrackerImpl(jobscheduler& sched, IEventClock& clock, const tTrackerConfig& conf)
	: m_sched(sched), m_clock(clock), m_conf(conf)
	{
		m_subscription = m_sched.Subscribe([this](const tJobInfo&, EJobState, EJobState)
		{
			m_dirty = true;
		});
		m_lastCheckpoint = m_clock.Now();
	}

	void Start() override
	{
		if (m_running)
			return;
		m_running = true;
		Arm();
	}

	void Stop() override
	{
		m_timer.reset();
		if (!m_running)
			return;
		m_running = false;
		if (m_conf.checkpointPath.empty())
			return;
		mstring err;
		if (!WriteCheckpoint(err))
			log::err(err);
	}

	void Beat() override
	{
		m_sched.ExecuteCancellations();

		// collect first, reporting may change the set of active jobs
		vector<pair<tJobId, tPollResult>> results;
		m_sched.VisitActive([&results](const tJobId& id, IBackendAdapter& adapter, IBackendHandle& handle)
		{
			results.emplace_back(id, adapter.Poll(handle));
		});
		for (auto& r: results)
			m_sched.ReportPoll(r.first, move(r.second));

		m_sched.ExpireTerminal();
		CheckpointIfDue();
		if (m_running)
			Arm();
	}

	bool WriteCheckpoint(mstring& sErr) override
	{
		if (m_conf.checkpointPath.empty())
		{
			sErr = "No checkpoint location configured";
			return false;
		}
		// cleared before the write, a failure leaves it set for the next attempt
		m_dirty = false;
		m_lastCheckpoint = m_clock.Now();
		if (SaveCheckpoint(m_conf.checkpointPath, m_sched.Snapshot(), sErr))
			return true;
		m_dirty = true;
		return false;
	}

	bool RestoreCheckpoint(mstring& sErr) override
	{
		if (m_conf.checkpointPath.empty())
			return true;
		vector<tJobRecord> records;
		if (!LoadCheckpoint(m_conf.checkpointPath, records, sErr))
			return false;
		if (records.empty())
			return true;
		log::misc((tSS() << "Restoring " << records.size() << " jobs from " << m_conf.checkpointPath).view());
		m_sched.Restore(move(records));
		return true;
	}
};

std::unique_ptr<progresstracker> progresstracker::Create(jobscheduler& sched, IEventClock& clock, const tTrackerConfig& conf)
{
	return make_unique<progresstrackerImpl>(sched, clock, conf);
}

}
