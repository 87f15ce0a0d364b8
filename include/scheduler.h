#ifndef SCHEDULER_H
#define SCHEDULER_H

#include "backend.h"
#include "octemplates.h"

#include <memory>
#include <vector>
#include <functional>

namespace orca
{

class IEventClock;
class IMirrorSelector;
class IPostProcessor;
class tpool;

struct tSchedulerEnv
{
	IEventClock* clock = nullptr;
	IBackendAdapter* httpAdapter = nullptr;
	IBackendAdapter* btAdapter = nullptr;
	// optional, the declared source order is used without it
	IMirrorSelector* mirrors = nullptr;
	IPostProcessor* postProc = nullptr;
	std::shared_ptr<tpool> pool;
	unsigned maxRetries = 3, backoffBaseMs = 2000, backoffMaxMs = 60000;
	unsigned httpSlots = 4, btSlots = 2;
	// seconds until terminal jobs are dropped
	unsigned retention = 3600;
	// required free space in the output directory, 0 for no check
	off_t minFreeBytes = 0;
};

struct tSchedulerStats
{
	size_t pendingHttp = 0, pendingBt = 0;
	unsigned activeHttp = 0, activeBt = 0;
	unsigned slotsHttp = 0, slotsBt = 0;
	// per EJobState
	size_t byState[7] = {};
	size_t total = 0;
};

// job, old state, new state
using tStateListener = std::function<void(const tJobInfo&, EJobState, EJobState)>;
using tActiveVisitor = std::function<void(const tJobId&, IBackendAdapter&, IBackendHandle&)>;

/**
 * Owner of the job table and of all state transitions. To be used on the event thread only.
 */
class ORCA_API jobscheduler
{
public:
	virtual ~jobscheduler() =default;

	/**
	 * Register a new job, it is dispatched later from the event loop.
	 * @return false with the reason in retErr if the request is not acceptable
	 */
	virtual bool Submit(const tSubmitRequest& req, tJobId& retId, tTransferError& retErr) =0;
	virtual bool Query(const tJobId& id, tJobInfo& ret) =0;
	// all known jobs, in submission order
	virtual std::vector<tJobInfo> List() =0;
	/**
	 * Request cancellation. Pending jobs end immediately, others at the next poll beat.
	 * @return false for unknown jobs, terminal jobs are not touched
	 */
	virtual bool Cancel(const tJobId& id) =0;
	// the listener is removed when the returned token is reset or destroyed
	virtual TFinalAction Subscribe(tStateListener listener) WARN_UNUSED =0;

	// poll beat interface
	virtual void VisitActive(const tActiveVisitor& visitor) =0;
	virtual void ReportPoll(const tJobId& id, tPollResult&& result) =0;
	virtual void ExecuteCancellations() =0;
	// drop terminal jobs older than the retention time
	virtual void ExpireTerminal() =0;

	// non-terminal jobs in submission order
	virtual std::vector<tJobRecord> Snapshot() =0;
	virtual void Restore(std::vector<tJobRecord>&& records) =0;

	virtual tSchedulerStats GetStats() =0;

	static std::unique_ptr<jobscheduler> Create(const tSchedulerEnv& env);
};

}

#endif // SCHEDULER_H
