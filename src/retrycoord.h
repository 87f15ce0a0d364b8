#ifndef RETRYCOORD_H
#define RETRYCOORD_H

#include "jobtypes.h"

namespace orca
{

struct tRetryPolicy
{
	unsigned maxRetries = 3;
	unsigned baseDelayMs = 2000;
	unsigned maxDelayMs = 60000;

	static tRetryPolicy FromCfg();
};

struct tRetryDecision
{
	bool retry = false;
	// wait time before the next attempt
	unsigned delayMs = 0;
	// final error when giving up
	tTransferError finalError;
};

/**
 * @brief Retry or give up after a failed attempt.
 * @param err The failure
 * @param retriesSoFar Number of retries already done for the job
 */
ORCA_API tRetryDecision DecideRetry(const tRetryPolicy& policy, const tTransferError& err, unsigned retriesSoFar);

// exponential backoff for the n-th retry, starting with 1
ORCA_API unsigned BackoffDelay(const tRetryPolicy& policy, unsigned nRetry);

}

#endif // RETRYCOORD_H
