#include "retrycoord.h"
#include "ocfg.h"

#include <algorithm>
#include <string>

namespace orca
{

tRetryPolicy tRetryPolicy::FromCfg()
{
	tRetryPolicy ret;
	ret.maxRetries = cfg::retrymax;
	ret.baseDelayMs = cfg::backoffbase;
	ret.maxDelayMs = cfg::backoffmax;
	return ret;
}

unsigned BackoffDelay(const tRetryPolicy& policy, unsigned nRetry)
{
	if (nRetry == 0)
		return 0;
	uint64_t delay = policy.baseDelayMs;
	for (unsigned i = 1; i < nRetry && delay < policy.maxDelayMs; ++i)
		delay *= 2;
	return (unsigned) std::min(delay, (uint64_t) policy.maxDelayMs);
}

tRetryDecision DecideRetry(const tRetryPolicy& policy, const tTransferError& err, unsigned retriesSoFar)
{
	tRetryDecision ret;
	if (err.IsTransient() && retriesSoFar < policy.maxRetries)
	{
		ret.retry = true;
		ret.delayMs = BackoffDelay(policy, retriesSoFar + 1);
		return ret;
	}
	if (err.IsTransient())
	{
		ret.finalError = tTransferError::Transient(err.reason + " (gave up after "
				+ std::to_string(retriesSoFar) + " retries)");
		return ret;
	}
	ret.finalError = err;
	return ret;
}

}
