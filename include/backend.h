#ifndef BACKEND_H_
#define BACKEND_H_

#include "jobtypes.h"

#include <memory>
#include <functional>

namespace orca
{

/**
 * Reference to a running transfer inside a backend. Owned by the job while it is active.
 */
class ORCA_API IBackendHandle
{
public:
	virtual ~IBackendHandle() =default;
	// serializable reference which allows reattaching after a restart
	virtual cmstring& GetResumeToken() const =0;
};
using tBackendHandlePtr = std::unique_ptr<IBackendHandle>;

struct tPollResult
{
	enum EKind : uint8_t
	{
		PROGRESS,
		COMPLETED,
		FAILED,
		CANCELLED
	} kind = PROGRESS;
	tProgressSnapshot progress;
	// location of the raw asset, with COMPLETED
	mstring stagedPath;
	// with FAILED
	tTransferError error;
};

struct tStartParams
{
	tJobId jobId;
	// source list, the preferred one first
	std::vector<mstring> uris;
	mstring outputPath;
};

// handle on success, otherwise an error
using tStartReporter = std::function<void(tBackendHandlePtr, tTransferError)>;

/**
 * Uniform control surface over a download engine.
 *
 * All methods are to be called on the event thread. Start and Reattach report their
 * result asynchronously, Poll never blocks and returns the latest known state.
 */
class ORCA_API IBackendAdapter
{
public:
	virtual ~IBackendAdapter() =default;
	virtual EResourceKind GetKind() const =0;
	virtual void Start(const tStartParams& params, tStartReporter reporter) =0;
	virtual tPollResult Poll(IBackendHandle& handle) =0;
	/**
	 * Stop the transfer, idempotent, nothing is reported for that handle afterwards.
	 * @param bDiscard The job is given up, partial data may go if the backend is configured so.
	 * Transfers stopped for a retry keep their data.
	 */
	virtual void Cancel(IBackendHandle& handle, bool bDiscard) =0;
	virtual void Reattach(const tStartParams& params, cmstring& resumeToken, tStartReporter reporter) =0;
	// where the data lives until the transfer is completed
	virtual mstring GetStagingPath(cmstring& outputPath) const =0;
};

}

#endif /* BACKEND_H_ */
