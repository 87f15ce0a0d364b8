#include "scheduler.h"
#include "jobqueue.h"
#include "retrycoord.h"
#include "mirrorsel.h"
#include "postproc.h"
#include "oclock.h"
#include "tpool.h"
#include "csmapping.h"
#include "fileio.h"
#include "ocutilpath.h"
#include "debug.h"

#include <map>
#include <algorithm>
#include <cinttypes>

using namespace std;

namespace orca
{

struct tJob
{
	tJobInfo info;
	uint64_t seq = 0;
	mstring format, checksum;
	IBackendAdapter* adapter = nullptr;
	// only in ACTIVE
	tBackendHandlePtr handle;
	mstring resumeToken;
	bool cancelRequested = false;
	bool holdsSlot = false;
	// invalidates callbacks of abandoned attempts
	unsigned generation = 0;
	// backoff wait
	TFinalAction timer;
	std::shared_ptr<std::atomic_bool> ppCancel;
	int64_t terminalSince = 0;
};

class jobschedulerImpl : public jobscheduler
{
	tSchedulerEnv m_env;
	IEventClock& m_clock;
	tRetryPolicy m_retry;
	std::map<tJobId, std::unique_ptr<tJob>> m_jobs;
	tJobPrioQ m_queueHttp, m_queueBt;
	unsigned m_activeHttp = 0, m_activeBt = 0;
	uint64_t m_nextSeq = 1;
	TFinalAction m_dispatchTimer;
	std::map<unsigned, tStateListener> m_listeners;
	unsigned m_nextListenerId = 0;
	// expires with this object, for the asynchronous callbacks
	std::shared_ptr<bool> m_life = std::make_shared<bool>(true);

	tJob* Find(const tJobId& id)
	{
		auto it = m_jobs.find(id);
		return it == m_jobs.end() ? nullptr : it->second.get();
	}
	tJobPrioQ& Queue(EResourceKind k) { return k == EResourceKind::BITTORRENT ? m_queueBt : m_queueHttp; }
	unsigned& ActiveCount(EResourceKind k) { return k == EResourceKind::BITTORRENT ? m_activeBt : m_activeHttp; }
	unsigned Slots(EResourceKind k) { return k == EResourceKind::BITTORRENT ? m_env.btSlots : m_env.httpSlots; }
	IBackendAdapter* Adapter(EResourceKind k) { return k == EResourceKind::BITTORRENT ? m_env.btAdapter : m_env.httpAdapter; }

	tJobId MakeId(uint64_t seq)
	{
		char buf[50];
		snprintf(buf, sizeof(buf), "%" PRIx64 "-%" PRIx64, seq, (uint64_t) GetTime());
		return buf;
	}

	void Transition(tJob& job, EJobState to)
	{
		auto from = job.info.state;
		if (from == to)
			return;
		ASSERT(!IsTerminal(from));
		job.info.state = to;
		ldbg("Job " << job.info.id << ": " << ToString(from) << " -> " << ToString(to));
		if (m_listeners.empty())
			return;
		auto info = job.info;
		// listeners might unsubscribe while being notified
		vector<tStateListener> todo;
		for (const auto& kv: m_listeners)
			todo.emplace_back(kv.second);
		for (auto& l: todo)
			l(info, from, to);
	}

	void ScheduleDispatch()
	{
		if (m_dispatchTimer)
			return;
		m_dispatchTimer = m_clock.RunAfter(0, [this]()
		{
			m_dispatchTimer.reset();
			Dispatch();
		});
	}

	void Dispatch()
	{
		for (auto kind: { EResourceKind::HTTP_FTP, EResourceKind::BITTORRENT })
		{
			auto& q = Queue(kind);
			while (!q.empty() && ActiveCount(kind) < Slots(kind))
			{
				auto entry = q.pop();
				auto job = Find(entry.id);
				if (!job || job->info.state != EJobState::PENDING)
					continue;
				TakeSlot(*job);
				Transition(*job, EJobState::RESOLVING);
				BeginAttempt(*job);
			}
		}
	}

	void TakeSlot(tJob& job)
	{
		if (job.holdsSlot)
			return;
		job.holdsSlot = true;
		ActiveCount(job.info.kind)++;
	}

	void ReleaseSlot(tJob& job)
	{
		if (!job.holdsSlot)
			return;
		job.holdsSlot = false;
		ActiveCount(job.info.kind)--;
		ScheduleDispatch();
	}

	tStartParams MakeStartParams(const tJob& job, const tStrVec& uris)
	{
		return tStartParams { job.info.id, uris, job.info.outputPath };
	}

	// space check in the first existing parent of the output
	bool CheckFreeSpace(tJob& job)
	{
		if (m_env.minFreeBytes <= 0)
			return true;
		auto dir = GetDirPart(job.info.outputPath);
		while (!Cstat(dir).isDir() && dir != "." && dir != "/")
			dir = GetDirPart(dir);
		auto avail = GetFreeSpace(dir);
		if (avail < 0 || avail >= m_env.minFreeBytes)
			return true;
		OnAttemptFailed(job, tTransferError::Unavailable("Not enough free space in " + dir + ", "
				+ offttosH(avail) + " available"));
		return false;
	}

	void BeginAttempt(tJob& job)
	{
		auto gen = ++job.generation;
		if (!CheckFreeSpace(job))
			return;
		auto id = job.info.id;
		if (job.info.kind == EResourceKind::HTTP_FTP && m_env.mirrors && job.info.uris.size() > 1)
		{
			weak_ptr<bool> life(m_life);
			m_env.mirrors->Select(job.info.uris, [this, life, id, gen](tStrVec ordered, tTransferError geoErr)
			{
				if (!life.lock())
					return;
				auto job = Find(id);
				if (!job || job->generation != gen || job->info.state != EJobState::RESOLVING)
					return;
				if (geoErr.IsError())
					ldbg("Job " << id << ": " << geoErr.ToString());
				StartOnAdapter(*job, ordered);
			});
			return;
		}
		StartOnAdapter(job, job.info.uris);
	}

	void StartOnAdapter(tJob& job, const tStrVec& uris)
	{
		auto adapter = Adapter(job.info.kind);
		if (!adapter)
			return Finish(job, EJobState::FAILED, tTransferError::Unsupported("No backend for this resource kind"));
		job.adapter = adapter;
		auto gen = job.generation;
		auto id = job.info.id;
		weak_ptr<bool> life(m_life);
		adapter->Start(MakeStartParams(job, uris), [this, life, id, gen, adapter](tBackendHandlePtr handle, tTransferError err)
		{
			if (!life.lock())
				return;
			OnStarted(id, gen, adapter, move(handle), move(err));
		});
	}

	void OnStarted(const tJobId& id, unsigned gen, IBackendAdapter* adapter, tBackendHandlePtr handle, tTransferError err)
	{
		auto job = Find(id);
		if (!job || job->generation != gen || job->info.state != EJobState::RESOLVING)
		{
			// nobody wants it anymore
			if (handle)
				adapter->Cancel(*handle, job && job->info.state == EJobState::CANCELLED);
			return;
		}
		if (err.IsError() || !handle)
		{
			if (!err.IsError())
				err = tTransferError::Permanent("Backend returned no handle");
			return OnAttemptFailed(*job, err);
		}
		job->handle = move(handle);
		job->resumeToken = job->handle->GetResumeToken();
		job->info.stagedPath = adapter->GetStagingPath(job->info.outputPath);
		job->info.progress = tProgressSnapshot();
		Transition(*job, EJobState::ACTIVE);
	}

	void DropHandle(tJob& job, bool bCancel, bool bDiscard = false)
	{
		if (job.handle && job.adapter && bCancel)
			job.adapter->Cancel(*job.handle, bDiscard);
		job.handle.reset();
		job.resumeToken.clear();
	}

	void OnAttemptFailed(tJob& job, const tTransferError& err)
	{
		if (job.cancelRequested)
			return Finish(job, EJobState::CANCELLED, tTransferError::Cancelled());
		auto decision = DecideRetry(m_retry, err, job.info.retries);
		if (!decision.retry)
			return Finish(job, EJobState::FAILED, decision.finalError);

		job.info.retries++;
		job.info.error = err;
		USRDBG("Job " << job.info.id << " failed (" << err.ToString() << "), retry "
				<< job.info.retries << " in " << decision.delayMs << " ms");
		DropHandle(job, true);
		Transition(job, EJobState::RESOLVING);
		auto gen = ++job.generation;
		auto id = job.info.id;
		job.timer = m_clock.RunAfter(decision.delayMs, [this, id, gen]()
		{
			auto job = Find(id);
			if (!job || job->generation != gen || job->info.state != EJobState::RESOLVING)
				return;
			// the token is reset by the next attempt, not from here
			BeginAttempt(*job);
		});
	}

	void Finish(tJob& job, EJobState state, const tTransferError& err)
	{
		if (IsTerminal(job.info.state))
			return;
		job.generation++;
		job.timer.reset();
		DropHandle(job, state != EJobState::COMPLETED, state == EJobState::CANCELLED);
		ReleaseSlot(job);
		job.ppCancel.reset();
		job.info.error = state == EJobState::COMPLETED ? tTransferError() : err;
		if (state == EJobState::FAILED && job.info.error.reason.empty())
			job.info.error = tTransferError::Permanent("unknown failure");
		job.terminalSince = m_clock.Now();
		Transition(job, state);
		auto bytes = job.info.progress.done;
		log::transfer(job.info.id, ToString(state), ToString(job.info.kind), bytes,
				state == EJobState::COMPLETED ? job.info.finalPath : job.info.outputPath,
				job.info.error.ToString());
	}

	void StartPostProcessing(tJob& job)
	{
		auto gen = ++job.generation;
		auto flag = make_shared<std::atomic_bool>(false);
		job.ppCancel = flag;
		tPostProcRequest req { job.info.id, job.info.stagedPath, job.info.outputPath, job.format, job.checksum };
		if (!m_env.postProc || !m_env.pool)
			return Finish(job, EJobState::FAILED, tTransferError::PostProcessing("No post-processing available"));
		auto pp = m_env.postProc;
		auto clock = &m_clock;
		weak_ptr<bool> life(m_life);
		auto id = job.info.id;
		bool queued = m_env.pool->schedule([this, pp, clock, life, req, flag, id, gen]()
		{
			auto res = pp->Process(req, *flag);
			clock->Post([this, life, id, gen, res]()
			{
				if (life.lock())
					OnPostProcDone(id, gen, res);
			});
		});
		if (!queued)
			Finish(job, EJobState::FAILED, tTransferError::PostProcessing("Cannot schedule post-processing"));
	}

	void OnPostProcDone(const tJobId& id, unsigned gen, const tPostProcessResult& res)
	{
		auto job = Find(id);
		if (!job || job->generation != gen || job->info.state != EJobState::POSTPROCESSING)
			return;
		if (job->cancelRequested)
			return Finish(*job, EJobState::CANCELLED, tTransferError::Cancelled());
		if (!res.ok)
		{
			return Finish(*job, EJobState::FAILED, tTransferError::PostProcessing(
					res.message + ", raw asset kept at " + job->info.stagedPath));
		}
		job->info.finalPath = res.finalPath;
		Finish(*job, EJobState::COMPLETED, tTransferError());
	}

	tJob& AddJob(tJobInfo&& info, uint64_t seq)
	{
		auto job = make_unique<tJob>();
		job->info = move(info);
		job->seq = seq;
		m_nextSeq = max(m_nextSeq, seq + 1);
		auto& ret = *job;
		m_jobs[ret.info.id] = move(job);
		return ret;
	}

	void Enqueue(tJob& job)
	{
		Queue(job.info.kind).push({ job.info.id, job.info.priority, job.seq });
		ScheduleDispatch();
	}

public:
	jobschedulerImpl(const tSchedulerEnv& env)
	: m_env(env), m_clock(*env.clock)
	{
		m_retry.maxRetries = env.maxRetries;
		m_retry.baseDelayMs = env.backoffBaseMs;
		m_retry.maxDelayMs = env.backoffMaxMs;
		m_env.httpSlots = max(1u, m_env.httpSlots);
		m_env.btSlots = max(1u, m_env.btSlots);
	}

	~jobschedulerImpl()
	{
		m_dispatchTimer.reset();
		for (auto& kv: m_jobs)
		{
			auto& job = *kv.second;
			job.timer.reset();
			if (job.ppCancel)
				*job.ppCancel = true;
			// the transfers go on in the backends, they are reattached after restart
			job.handle.reset();
		}
	}

	bool Submit(const tSubmitRequest &req, tJobId &retId, tTransferError &retErr) override
	{
		tJobInfo info;
		for (const auto& u: req.uris)
		{
			auto s = trimBoth(string_view(u));
			if (!s.empty())
				info.uris.emplace_back(s);
		}
		if (info.uris.empty())
			return retErr = tTransferError::Unsupported("No resource given"), false;
		info.outputPath = trimBoth(string_view(req.outputPath));
		if (info.outputPath.empty())
			return retErr = tTransferError::Unsupported("No output path given"), false;
		if (!IsAbsolute(info.outputPath))
			return retErr = tTransferError::Unsupported("Output path must be absolute: " + info.outputPath), false;

		info.kind = req.kindHint;
		for (const auto& u: info.uris)
		{
			// any link is fine when BitTorrent was asked for, as far as qBittorrent can fetch it
			if (req.kindHint == EResourceKind::BITTORRENT)
			{
				if (!IsTorrentReference(u))
					return retErr = tTransferError::Unsupported("Not a torrent descriptor: " + u), false;
				continue;
			}
			auto k = InferResourceKind(u);
			if (k == EResourceKind::INVALID)
			{
				if (req.kindHint == EResourceKind::INVALID)
					return retErr = tTransferError::Unsupported("Unsupported resource: " + u), false;
				continue;
			}
			if (req.kindHint != EResourceKind::INVALID)
				continue;
			if (info.kind != EResourceKind::INVALID && info.kind != k)
				return retErr = tTransferError::Unsupported("Mixed resource kinds in one request"), false;
			info.kind = k;
		}
		if (!Adapter(info.kind))
			return retErr = tTransferError::Unsupported("No backend for this resource kind"), false;

		if (!req.checksum.empty())
		{
			tFingerprint fpr;
			if (!fpr.Parse(req.checksum))
				return retErr = tTransferError::Unsupported("Bad checksum: " + req.checksum), false;
		}
		auto fmt = mstring(trimBoth(string_view(req.format), "."sv));
		tolower_inplace(fmt);
		if (!all_of(fmt.begin(), fmt.end(), [](char c) { return isalnum((unsigned char) c); }))
			return retErr = tTransferError::Unsupported("Bad output format: " + req.format), false;

		auto seq = m_nextSeq;
		info.id = MakeId(seq);
		info.priority = req.priority;
		info.created = GetTime();
		info.state = EJobState::PENDING;
		auto& job = AddJob(move(info), seq);
		job.format = fmt;
		job.checksum = req.checksum;
		retId = job.info.id;
		USRMSG("Job " << job.info.id << " submitted, " << ToString(job.info.kind) << ", " << job.info.uris.front());
		Enqueue(job);
		return true;
	}

	bool Query(const tJobId &id, tJobInfo &ret) override
	{
		auto job = Find(id);
		if (!job)
			return false;
		ret = job->info;
		return true;
	}

	std::vector<tJobInfo> List() override
	{
		vector<const tJob*> jobs;
		for (const auto& kv: m_jobs)
			jobs.push_back(kv.second.get());
		sort(jobs.begin(), jobs.end(), [](const tJob* a, const tJob* b) { return a->seq < b->seq; });
		vector<tJobInfo> ret;
		for (auto j: jobs)
			ret.push_back(j->info);
		return ret;
	}

	bool Cancel(const tJobId &id) override
	{
		auto job = Find(id);
		if (!job)
			return false;
		if (IsTerminal(job->info.state))
			return true;
		if (job->info.state == EJobState::PENDING)
		{
			Queue(job->info.kind).erase(id);
			Finish(*job, EJobState::CANCELLED, tTransferError::Cancelled());
			return true;
		}
		job->cancelRequested = true;
		if (job->ppCancel)
			*job->ppCancel = true;
		return true;
	}

	TFinalAction Subscribe(tStateListener listener) override
	{
		auto id = m_nextListenerId++;
		m_listeners[id] = move(listener);
		weak_ptr<bool> life(m_life);
		return TFinalAction([this, life, id]()
		{
			if (life.lock())
				m_listeners.erase(id);
		});
	}

	void VisitActive(const tActiveVisitor& visitor) override
	{
		for (auto& kv: m_jobs)
		{
			auto& job = *kv.second;
			if (job.info.state == EJobState::ACTIVE && job.handle && job.adapter && !job.cancelRequested)
				visitor(job.info.id, *job.adapter, *job.handle);
		}
	}

	void ReportPoll(const tJobId &id, tPollResult &&result) override
	{
		auto job = Find(id);
		if (!job || job->info.state != EJobState::ACTIVE || !job->handle || job->cancelRequested)
			return;
		switch (result.kind)
		{
		case tPollResult::PROGRESS:
			job->info.progress = result.progress;
			return;
		case tPollResult::COMPLETED:
			job->info.progress = result.progress;
			if (!result.stagedPath.empty())
				job->info.stagedPath = result.stagedPath;
			USRMSG("Job " << id << " transfer finished, " << offttosH(result.progress.done));
			DropHandle(*job, false);
			ReleaseSlot(*job);
			Transition(*job, EJobState::POSTPROCESSING);
			StartPostProcessing(*job);
			return;
		case tPollResult::FAILED:
			return OnAttemptFailed(*job, result.error.IsError() ? result.error
					: tTransferError::Transient("Transfer failed"));
		case tPollResult::CANCELLED:
			return Finish(*job, EJobState::CANCELLED, tTransferError::Cancelled("Transfer was removed in the backend"));
		}
	}

	void ExecuteCancellations() override
	{
		vector<tJob*> todo;
		for (auto& kv: m_jobs)
		{
			if (kv.second->cancelRequested && !IsTerminal(kv.second->info.state))
				todo.push_back(kv.second.get());
		}
		for (auto job: todo)
		{
			USRMSG("Job " << job->info.id << " cancelled in state " << ToString(job->info.state));
			Finish(*job, EJobState::CANCELLED, tTransferError::Cancelled());
		}
	}

	void ExpireTerminal() override
	{
		auto now = m_clock.Now();
		int64_t keep = int64_t(m_env.retention) * 1000;
		for (auto it = m_jobs.begin(); it != m_jobs.end();)
		{
			auto& job = *it->second;
			if (IsTerminal(job.info.state) && now - job.terminalSince >= keep)
			{
				ldbg("Dropping job " << job.info.id);
				it = m_jobs.erase(it);
			}
			else
				++it;
		}
	}

	std::vector<tJobRecord> Snapshot() override
	{
		vector<tJobRecord> ret;
		for (const auto& kv: m_jobs)
		{
			const auto& job = *kv.second;
			if (IsTerminal(job.info.state))
				continue;
			tJobRecord r;
			r.id = job.info.id;
			r.state = job.info.state;
			r.kind = job.info.kind;
			r.priority = job.info.priority;
			r.seq = job.seq;
			r.retries = job.info.retries;
			r.created = job.info.created;
			r.outputPath = job.info.outputPath;
			r.format = job.format;
			r.checksum = job.checksum;
			if (job.info.state == EJobState::ACTIVE)
				r.resumeToken = job.resumeToken;
			if (job.info.state == EJobState::ACTIVE || job.info.state == EJobState::POSTPROCESSING)
				r.stagedPath = job.info.stagedPath;
			r.uris = job.info.uris;
			ret.emplace_back(move(r));
		}
		sort(ret.begin(), ret.end(), [](const tJobRecord& a, const tJobRecord& b) { return a.seq < b.seq; });
		return ret;
	}

	void Restore(std::vector<tJobRecord> &&records) override
	{
		sort(records.begin(), records.end(), [](const tJobRecord& a, const tJobRecord& b) { return a.seq < b.seq; });
		for (auto& r: records)
		{
			if (r.id.empty() || Find(r.id) || r.uris.empty() || IsTerminal(r.state)
					|| r.kind == EResourceKind::INVALID || !Adapter(r.kind))
			{
				log::err(tSS() << "Skipping unusable checkpoint record " << r.id);
				continue;
			}
			tJobInfo info;
			info.id = r.id;
			info.kind = r.kind;
			info.priority = r.priority;
			info.retries = min(r.retries, m_retry.maxRetries);
			info.created = r.created;
			info.outputPath = r.outputPath;
			info.stagedPath = r.stagedPath;
			info.uris = r.uris;
			info.state = EJobState::PENDING;
			auto& job = AddJob(move(info), r.seq);
			job.format = r.format;
			job.checksum = r.checksum;

			if (r.state == EJobState::ACTIVE && !r.resumeToken.empty())
			{
				// already running in the backend, even beyond the slot limit
				TakeSlot(job);
				job.info.state = EJobState::RESOLVING;
				Reattach(job, r.resumeToken);
			}
			else if (r.state == EJobState::POSTPROCESSING && !r.stagedPath.empty() && Cstat(r.stagedPath))
			{
				job.info.state = EJobState::POSTPROCESSING;
				StartPostProcessing(job);
			}
			else
			{
				job.info.stagedPath.clear();
				Enqueue(job);
			}
			USRMSG("Job " << job.info.id << " restored as " << ToString(job.info.state));
		}
	}

	void Reattach(tJob& job, cmstring& token)
	{
		auto adapter = Adapter(job.info.kind);
		job.adapter = adapter;
		auto gen = ++job.generation;
		auto id = job.info.id;
		weak_ptr<bool> life(m_life);
		adapter->Reattach(MakeStartParams(job, job.info.uris), token,
				[this, life, id, gen, adapter](tBackendHandlePtr handle, tTransferError err)
		{
			if (!life.lock())
				return;
			auto job = Find(id);
			if (job && job->generation == gen && job->info.state == EJobState::RESOLVING
					&& (err.IsError() || !handle))
			{
				// not known anymore, start over
				USRMSG("Job " << id << " cannot be reattached (" << err.ToString() << "), restarting");
				return BeginAttempt(*job);
			}
			OnStarted(id, gen, adapter, move(handle), move(err));
		});
	}

	tSchedulerStats GetStats() override
	{
		tSchedulerStats ret;
		ret.pendingHttp = m_queueHttp.size();
		ret.pendingBt = m_queueBt.size();
		ret.activeHttp = m_activeHttp;
		ret.activeBt = m_activeBt;
		ret.slotsHttp = m_env.httpSlots;
		ret.slotsBt = m_env.btSlots;
		for (const auto& kv: m_jobs)
			ret.byState[(unsigned) kv.second->info.state]++;
		ret.total = m_jobs.size();
		return ret;
	}
};

std::unique_ptr<jobscheduler> jobscheduler::Create(const tSchedulerEnv &env)
{
	return std::make_unique<jobschedulerImpl>(env);
}

}
