#ifndef POSTPROC_H
#define POSTPROC_H

#include "jobtypes.h"

#include <atomic>
#include <memory>

namespace orca
{

struct tPostProcRequest
{
	tJobId jobId;
	// raw asset, file or directory
	mstring stagedPath;
	mstring outputPath;
	// container extension, empty for no remuxing
	mstring format;
	// expected digest, empty for no verification
	mstring checksum;
};

struct tPostProcConfig
{
	mstring ffmpegPath = "ffmpeg";
	// seconds, 0 for unlimited
	unsigned timeout = 0;
	int dirPerms = 0755;

	static tPostProcConfig FromCfg();
};

/**
 * Turns a raw downloaded asset into the final artifact: verification, remuxing and placement.
 */
class ORCA_API IPostProcessor
{
public:
	virtual ~IPostProcessor() =default;
	/**
	 * Blocking, to be run on a worker thread.
	 * @param cancelled Checked while external tools run, aborts the processing when set
	 */
	virtual tPostProcessResult Process(const tPostProcRequest& req, const std::atomic_bool& cancelled) =0;

	static std::unique_ptr<IPostProcessor> Create(const tPostProcConfig& conf);
};

/**
 * Where the artifact ends up: the output path itself when it already carries the
 * requested extension, otherwise output path plus extension.
 */
ORCA_API mstring GetFinalPath(cmstring& outputPath, cmstring& format);

}

#endif // POSTPROC_H
