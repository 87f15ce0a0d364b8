#ifndef TPOOL_H
#define TPOOL_H

#include "config.h"
#include <functional>
#include <memory>

namespace orca
{

/**
 * Worker threads for blocking operations (file hashing, external tools, moving big trees).
 */
class ORCA_API tpool
{
public:
	tpool() =default;
	virtual ~tpool() =default;
	// false if the backlog is full or no worker can be started
	virtual bool schedule(std::function<void()>) =0;
	// waits for the running actions, the backlog is abandoned
	virtual void stop() =0;
	static std::shared_ptr<tpool> Create(unsigned maxBacklog = 10000, unsigned maxActive = 16, unsigned maxStandby = 4);
};

}

#endif // TPOOL_H
