#include "postproc.h"
#include "csmapping.h"
#include "fileio.h"
#include "ocutilpath.h"
#include "ocfg.h"
#include "meta.h"
#include "debug.h"

#include <thread>

#include <signal.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/wait.h>

using namespace std;

namespace orca
{

// how often the child is checked for exit and the cancel flag is looked at
#define CHILD_POLL_MS 100
// grace period after SIGTERM before SIGKILL
#define CHILD_KILL_GRACE_MS 3000

tPostProcConfig tPostProcConfig::FromCfg()
{
	tPostProcConfig ret;
	if (!cfg::ffmpegpath.empty())
		ret.ffmpegPath = cfg::ffmpegpath;
	ret.timeout = cfg::pptimeout > 0 ? cfg::pptimeout : 0;
	ret.dirPerms = cfg::dirperms;
	return ret;
}

mstring GetFinalPath(cmstring& outputPath, cmstring& format)
{
	if (format.empty())
		return outputPath;
	auto want = format;
	tolower_inplace(want);
	if (GetExtension(outputPath) == want)
		return outputPath;
	return outputPath + "." + want;
}

namespace
{

// extension of the asset ignoring the partial download marker
mstring GetContainerExtension(string_view path)
{
	if (endsWith(path, ".part"))
		path.remove_suffix(5);
	return GetExtension(path);
}

enum class EChildResult
{
	OK,
	FAILED,
	CANCELLED,
	TIMEOUT
};

class tPostProcessor : public IPostProcessor
{
	tPostProcConfig m_conf;

	/**
	 * Run a command and wait for it, stopping it when cancelled or over time.
	 * @param exitInfo Receives a description of abnormal termination
	 */
	EChildResult RunChild(const tStrVec& args, const std::atomic_bool& cancelled, mstring& exitInfo)
	{
		vector<char*> argv;
		for (auto& a: args)
			argv.push_back(const_cast<char*>(a.c_str()));
		argv.push_back(nullptr);

		auto pid = fork();
		if (pid < 0)
		{
			exitInfo = tErrnoFmter("fork failed: ");
			return EChildResult::FAILED;
		}
		if (pid == 0)
		{
			// child: no stdin, output only via the exit code
			auto nul = ::open("/dev/null", O_RDWR);
			if (nul >= 0)
			{
				dup2(nul, 0);
				dup2(nul, 1);
				dup2(nul, 2);
			}
			execvp(argv[0], argv.data());
			_exit(127);
		}

		auto started = GetTime();
		bool termSent = false;
		unsigned sinceTerm = 0;
		auto result = EChildResult::OK;
		while (true)
		{
			int status = 0;
			auto r = waitpid(pid, &status, WNOHANG);
			if (r == pid)
			{
				if (termSent)
					return result;
				if (WIFEXITED(status))
				{
					auto code = WEXITSTATUS(status);
					if (code == 0)
						return EChildResult::OK;
					exitInfo = code == 127
							? mstring("cannot execute ") + args.front()
							: mstring("exit code ") + to_string(code);
					return EChildResult::FAILED;
				}
				exitInfo = mstring("killed by signal ") + to_string(WTERMSIG(status));
				return EChildResult::FAILED;
			}
			if (r < 0 && errno != EINTR)
			{
				exitInfo = tErrnoFmter("waitpid failed: ");
				return EChildResult::FAILED;
			}
			if (!termSent)
			{
				if (cancelled.load())
					result = EChildResult::CANCELLED;
				else if (m_conf.timeout && GetTime() - started >= (time_t) m_conf.timeout)
					result = EChildResult::TIMEOUT;
				if (result != EChildResult::OK)
				{
					kill(pid, SIGTERM);
					termSent = true;
				}
			}
			else if ((sinceTerm += CHILD_POLL_MS) >= CHILD_KILL_GRACE_MS)
			{
				kill(pid, SIGKILL);
				sinceTerm = 0;
			}
			this_thread::sleep_for(chrono::milliseconds(CHILD_POLL_MS));
		}
	}

	tPostProcessResult Fail(const tPostProcRequest& req, string_view what)
	{
		tPostProcessResult ret;
		ret.ok = false;
		ret.message = mstring(what);
		// the raw asset stays where it is
		ret.finalPath = req.stagedPath;
		return ret;
	}

public:
	tPostProcessor(const tPostProcConfig& conf) : m_conf(conf)
	{
	}

	tPostProcessResult Process(const tPostProcRequest& req, const std::atomic_bool& cancelled) override
	{
		LOGSTARTFUNCx(req.jobId, req.stagedPath);
		Cstat st(req.stagedPath);
		if (!st)
			return Fail(req, "Downloaded asset is missing");

		if (!req.checksum.empty())
		{
			tFingerprint fpr;
			if (!fpr.Parse(req.checksum))
				return Fail(req, "Unusable checksum specification " + req.checksum);
			if (!st.isReg())
				return Fail(req, "Checksum verification requires a single file");
			mstring err;
			if (!fpr.CheckFile(req.stagedPath, &err))
				return Fail(req, err);
			ldbg("checksum OK");
		}
		if (cancelled.load())
			return Fail(req, "Cancelled");

		auto finalPath = GetFinalPath(req.outputPath, req.format);
		if (!mkbasedir(finalPath))
			return Fail(req, tErrnoFmter("Cannot create output directory: "));

		auto source = req.stagedPath;
		mstring remuxed;
		auto want = req.format;
		tolower_inplace(want);
		if (!want.empty() && GetContainerExtension(req.stagedPath) != want)
		{
			if (st.isDir())
				return Fail(req, "Cannot remux a multi-file asset to " + want);
			// ffmpeg picks the muxer by extension
			remuxed = finalPath + ".remux." + want;
			tStrVec args { m_conf.ffmpegPath, "-nostdin", "-y", "-i", req.stagedPath, "-c", "copy", remuxed };
			mstring info;
			auto res = RunChild(args, cancelled, info);
			if (res != EChildResult::OK)
				unlink(remuxed.c_str());
			switch (res)
			{
			case EChildResult::OK:
				break;
			case EChildResult::CANCELLED:
				return Fail(req, "Cancelled");
			case EChildResult::TIMEOUT:
				return Fail(req, "Remuxing timed out after " + to_string(m_conf.timeout) + "s");
			case EChildResult::FAILED:
				return Fail(req, "Remuxing failed, " + info);
			}
			if (!Cstat(remuxed))
				return Fail(req, "Remuxing produced no output");
			source = remuxed;
		}

		mstring err;
		if (!MoveFileOrTree(source, finalPath, err))
		{
			if (!remuxed.empty())
				unlink(remuxed.c_str());
			return Fail(req, "Cannot place the artifact: " + err);
		}
		// the raw asset is not needed after a successful conversion
		if (!remuxed.empty())
			unlink(req.stagedPath.c_str());
		// torrent staging directory of a single-file asset, only if nothing else is left in it
		auto stageDir = GetDirPart(req.stagedPath);
		if (stageDir == req.outputPath + ".part" && 0 != rmdir(stageDir.c_str()))
			USRDBG("Staging directory " << stageDir << " kept: " << tErrnoFmter());

		tPostProcessResult ret;
		ret.ok = true;
		ret.finalPath = finalPath;
		return ret;
	}
};

}

std::unique_ptr<IPostProcessor> IPostProcessor::Create(const tPostProcConfig& conf)
{
	return make_unique<tPostProcessor>(conf);
}

}
