#ifndef OCLOCK_H
#define OCLOCK_H

#include "octypes.h"
#include "octemplates.h"

#include <memory>
#include <cstdint>

namespace orca
{

/**
 * @brief Time source and deferred execution on the owning event loop.
 *
 * All engine components take the time and their timers from here, so the tests can
 * drive them with a virtual clock.
 */
class ORCA_API IEventClock
{
public:
	virtual ~IEventClock() =default;
	// monotonic milliseconds, arbitrary epoch
	virtual int64_t Now() =0;
	/**
	 * Run the action once after the delay on the loop thread.
	 * @return Token which cancels the timer when destroyed or reset
	 */
	virtual TFinalAction RunAfter(unsigned msDelay, tAction&& action) WARN_UNUSED =0;
	// thread-safe handover of an action to the loop thread
	virtual void Post(tAction&& action) =0;

	// implementation based on the global evabase
	static std::unique_ptr<IEventClock> Create();
};

}

#endif // OCLOCK_H
