#ifndef TRACKER_H
#define TRACKER_H

#include "octypes.h"

#include <memory>

namespace orca
{

class jobscheduler;
class IEventClock;

struct tTrackerConfig
{
	unsigned pollIntervalMs = 1000;
	// seconds between checkpoints, 0 writes only on Stop
	unsigned checkpointInterval = 60;
	// empty disables persistence
	mstring checkpointPath;

	static tTrackerConfig FromCfg();
};

/**
 * @brief Periodic driver of the active transfers and of the persisted job table.
 *
 * Each beat executes pending cancellations, polls every active handle, forwards the
 * results to the scheduler and drops expired jobs. Checkpoints are written only when
 * some job changed its state since the last one.
 */
class ORCA_API progresstracker
{
public:
	virtual ~progresstracker() =default;
	virtual void Start() =0;
	// stops the beat and writes the final checkpoint
	virtual void Stop() =0;
	// one poll cycle, also run by the timer
	virtual void Beat() =0;
	virtual bool WriteCheckpoint(mstring& sErr) =0;
	/**
	 * Load the checkpoint and hand the jobs over to the scheduler.
	 * @return false if the file exists but cannot be used
	 */
	virtual bool RestoreCheckpoint(mstring& sErr) =0;

	static std::unique_ptr<progresstracker> Create(jobscheduler& sched, IEventClock& clock, const tTrackerConfig& conf);
};

}

#endif // TRACKER_H
