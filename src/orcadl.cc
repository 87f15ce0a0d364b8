#include "debug.h"
#include "config.h"
#include "meta.h"
#include "ocfg.h"
#include "oclogger.h"
#include "fileio.h"
#include "evabase.h"
#include "oclock.h"
#include "oc3rdparty.h"
#include "tpool.h"
#include "httpclient.h"
#include "httpftpadapter.h"
#include "btadapter.h"
#include "geoip.h"
#include "mirrorsel.h"
#include "retrycoord.h"
#include "postproc.h"
#include "scheduler.h"
#include "tracker.h"
#include "ctlproto.h"
#include "conserver.h"

#include <iostream>
#include <vector>

#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>
#include <signal.h>

using namespace std;

namespace orca
{

[[noreturn]] static void usage(int retCode)
{
	auto& chan = retCode ? cerr : cout;
	chan << "Usage: orcadl [options] [ -c configdir ] <var=value ...>\n\n"
		"Options:\n"
		"-h: this help message\n"
		"-c: configuration directory\n"
		"-i: ignore configuration loading errors\n"
		"-v: extra verbosity in logging\n"
		"\n"
		"Most interesting variables:\n"
		"ForeGround: Don't detach (default: 0)\n"
		"SocketPath: control socket (default: " SOCKETDIR "/orcadl.sock)\n"
		"StateDir: /directory/for/checkpoints\n"
		"LogDir: /directory/for/logfiles\n"
		"Aria2Rpc: JSON-RPC endpoint of aria2\n"
		"QbtUrl: WebUI base URL of qBittorrent\n"
		"\n"
		"See the configuration example for all directives or run:\n"
		"orcactl cfgdump\n\n";
	chan.flush();
	exit(retCode);
}

[[noreturn]] static void die(string_view msg, int code = EXIT_FAILURE)
{
	cerr << msg << endl;
	exit(code);
}

static void ParseCommandLine(int argc, const char **argv)
{
	LPCSTR cfgDir = nullptr;
	bool verbose = false, ignoreCfgErrors = false;
	vector<LPCSTR> assignments;

	for (int i = 1; i < argc; ++i)
	{
		string_view arg(argv[i]);
		if (arg == "--")
			break;
		if (arg == "-h" || arg == "--help")
			usage(0);
		else if (arg == "-i")
			ignoreCfgErrors = true;
		else if (arg == "-v")
			verbose = true;
		else if (arg == "-c")
		{
			if (++i == argc)
				usage(2);
			cfgDir = argv[i];
		}
		else if (!arg.empty())
			assignments.push_back(argv[i]);
	}

	cfg::ReadConfigDirectory(cfgDir ? cfgDir : CFGDIR, cfgDir && !ignoreCfgErrors);
	for (auto a: assignments)
	{
		if (!cfg::SetOption(a, 0))
			usage(EXIT_FAILURE);
	}
	auto sErr = cfg::PostProcConfig();
	if (!sErr.empty())
		die("Configuration error: " + sErr);
	if (verbose)
		cfg::debug |= (log::LOG_DEBUG | log::LOG_MORE);
}

static bool Daemonize()
{
#ifdef HAVE_DAEMON
	return 0 == daemon(0, 0);
#else
	unique_fd devnull(open("/dev/null", O_RDWR));
	if (!devnull.valid() || chdir("/"))
		return false;
	for (int fd: { STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO })
		if (dup2(devnull.get(), fd) < 0)
			return false;
	auto pid = fork();
	if (pid < 0)
		return false;
	if (pid > 0)
		_exit(0);
	setsid();
	return true;
#endif
}

/**
 * All long living components of the daemon, in construction order.
 */
class tDaemon
{
	unique_ptr<IEventClock> m_clock;
	shared_ptr<tpool> m_pool;
	unique_ptr<IHttpClient> m_http;
	unique_ptr<IBackendAdapter> m_httpAdapter, m_btAdapter;
	unique_ptr<IHostResolver> m_hostRes;
	unique_ptr<IGeoResolver> m_geo;
	unique_ptr<IMirrorSelector> m_mirrors;
	unique_ptr<IPostProcessor> m_postProc;
	unique_ptr<jobscheduler> m_scheduler;
	unique_ptr<progresstracker> m_tracker;
	unique_ptr<ctlhandler> m_handler;
	unique_ptr<conserver> m_server;
	vector<unique_event> m_sigEvents;

	static void cbSignal(evutil_socket_t signum, short, void*)
	{
		DBGQLOG("caught signal " << signum);
		switch (signum)
		{
		case SIGTERM:
		case SIGINT:
		case SIGQUIT:
			evabase::SignalStop();
			break;
		case SIGUSR1:
			log::close(true);
			break;
		default:
			break;
		}
	}

	void WatchSignals()
	{
		int sigs[] = { SIGTERM, SIGINT, SIGQUIT, SIGUSR1, SIGPIPE,
#ifdef SIGXFSZ
				SIGXFSZ
#endif
		};
		for (auto s: sigs)
		{
			m_sigEvents.emplace_back(event_new(evabase::base, s, EV_SIGNAL | EV_PERSIST, cbSignal, nullptr));
			event_add(m_sigEvents.back().get(), nullptr);
		}
	}

	void PrepareStateDir()
	{
		if (cfg::statedir.empty())
			return;
		mkdirhier(cfg::statedir);
		if (!Cstat(cfg::statedir).isDir())
			die("Error: Cannot create state directory " + cfg::statedir);
		if (0 != access(cfg::statedir.c_str(), W_OK))
			die("State directory not writable, check the permissions of " + cfg::statedir);
	}

	void WritePidFile()
	{
		if (cfg::pidfile.empty())
			return;
		mkbasedir(cfg::pidfile);
		unique_fd fd(open(cfg::pidfile.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, cfg::fileperms));
		if (!fd.valid() || dumpall(fd.get(), to_string(getpid())) < 0)
			log::err(tErrnoFmter("Cannot write PID file: "));
	}

	tSchedulerEnv MakeSchedulerEnv()
	{
		tSchedulerEnv env;
		env.clock = m_clock.get();
		env.httpAdapter = m_httpAdapter.get();
		env.btAdapter = m_btAdapter.get();
		env.mirrors = m_mirrors.get();
		env.postProc = m_postProc.get();
		env.pool = m_pool;
		auto retry = tRetryPolicy::FromCfg();
		env.maxRetries = retry.maxRetries;
		env.backoffBaseMs = retry.baseDelayMs;
		env.backoffMaxMs = retry.maxDelayMs;
		env.httpSlots = cfg::httpslots;
		env.btSlots = cfg::btslots;
		env.retention = max(0, cfg::retention);
		env.minFreeBytes = off_t(max(0, cfg::minfreespace)) * 1024 * 1024;
		return env;
	}

public:
	void Init()
	{
		auto lerr = log::open();
		if (!lerr.empty())
			die("Problem creating log files in " + cfg::logdir + ". " + lerr + ".");

		WatchSignals();
		PrepareStateDir();

		m_clock = IEventClock::Create();
		m_pool = tpool::Create(1000, cfg::ppthreads, 1);
		m_http = IHttpClient::Create();
		m_httpAdapter = CreateHttpFtpAdapter(*m_http, tAria2Config::FromCfg());
		m_btAdapter = CreateBitTorrentAdapter(*m_http, *m_clock, tQbtConfig::FromCfg());
		if (!cfg::geoipdb.empty())
		{
			mstring sErr;
			m_geo = IGeoResolver::Open(cfg::geoipdb, sErr);
			if (!m_geo)
				log::err("GeoIP database not usable, mirrors are tried in declaration order: " + sErr);
		}
		m_hostRes = IHostResolver::Create();
		m_mirrors = IMirrorSelector::Create(*m_clock, m_hostRes.get(), m_geo.get(),
				tMirrorPolicy::FromCfg(), tLocalPosition::FromCfg(), cfg::geotimeout);
		m_postProc = IPostProcessor::Create(tPostProcConfig::FromCfg());
		m_scheduler = jobscheduler::Create(MakeSchedulerEnv());
		m_tracker = progresstracker::Create(*m_scheduler, *m_clock, tTrackerConfig::FromCfg());

		mstring sErr;
		if (!m_tracker->RestoreCheckpoint(sErr))
			die("Cannot restore the job table: " + sErr);

		m_handler = make_unique<ctlhandler>(*m_scheduler);
		m_server = conserver::Create(*m_handler);
		if (!m_server->Setup())
		{
			die("No listening socket(s) could be created/prepared. "
					"Check the SocketPath, Port and BindAddress directives.");
		}
		if (!cfg::foreground && !Daemonize())
			die(tErrnoFmter("Failed to change to daemon mode"), 43);
		WritePidFile();

		m_tracker->Start();
		log::misc("orcadl " ORCA_VERSION " started");
	}

	void Shutdown()
	{
		if (!cfg::pidfile.empty())
			unlink(cfg::pidfile.c_str());
		// nothing new comes in, then the last state is saved
		if (m_server)
			m_server->Abandon();
		if (m_tracker)
			m_tracker->Stop();
		if (m_pool)
			m_pool->stop();
		log::misc("orcadl stopped");
	}
};

}

int main(int argc, const char **argv)
{
	using namespace orca;

	oc3rdparty_init();
	atexit(oc3rdparty_deinit);

	auto eBase = evabase::Create();
	ParseCommandLine(argc, argv);

	int ret;
	{
		tDaemon app;
		app.Init();
		ret = eBase->MainLoop();
		app.Shutdown();
	}
	log::close(false);
	return ret;
}
