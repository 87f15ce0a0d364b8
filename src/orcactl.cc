#include "config.h"
#include "meta.h"
#include "ocfg.h"
#include "oclogger.h"
#include "fileio.h"
#include "csmapping.h"
#include "ctlproto.h"
#include "jobtypes.h"

#include <iostream>
#include <deque>

#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <climits>

#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <netdb.h>
#include <unistd.h>
#include <errno.h>

using namespace std;
using namespace orca;

using tCsDeq = deque<LPCSTR>;

auto szHelp = R"(
USAGE: orcactl command parameter... [options]

command := { submit, query, cancel, list, stats, checksum, printvar, cfgdump }
parameter := (specific to command, or -h for extra help)
options := (see orcadl options, SocketPath or Port select the daemon)
Standard options :=
-h|--help (before or after command type to get command specific help)
-c configdir
-i (ignore config errors)
)";
auto szHelpSubmit = R"(
USAGE: orcactl submit -o output [-k kind] [-p priority] [-f format] [-s checksum] source...
-o: target path of the artifact
-k: HttpFtp or BitTorrent, guessed from the first source if omitted
-p: priority, higher values are served first
-f: container format to remux to (like mkv or mp4)
-s: expected checksum, like sha256:<hex>
Several sources of HTTP/FTP kind are treated as mirrors of the same file.
)";
auto szHelpChecksum = R"(
USAGE: orcactl checksum file [md5|sha1|sha256|sha512]
)";

int fin(int retCode, string_view what)
{
	auto& chan = (retCode ? cerr : cout);
	chan << what;
	if (!what.empty() && what.back() > '\r')
		chan << endl;
	else
		chan.flush();
	exit(retCode);
	return EXIT_FAILURE;
}

bool isUdsAccessible(cmstring& path)
{
	Cstat s(path);
	return s && S_ISSOCK(s.info().st_mode) && 0 == access(path.c_str(), W_OK);
}

/**
 * Blocking connection to the daemon's control socket.
 */
class tCtlClient
{
	unique_fd m_fd;
	mstring m_inbuf;
public:
	bool Connect(mstring& sErr)
	{
		if (!cfg::udspath.empty() && isUdsAccessible(cfg::udspath))
		{
			auto addr = sockaddr_un();
			if (cfg::udspath.size() >= sizeof(addr.sun_path))
			{
				sErr = "Socket path too long";
				return false;
			}
			addr.sun_family = AF_UNIX;
			memcpy(addr.sun_path, cfg::udspath.data(), cfg::udspath.size());
			m_fd.reset(socket(PF_UNIX, SOCK_STREAM, 0));
			if (m_fd.valid() && 0 == connect(m_fd.get(), (sockaddr*) &addr, sizeof(addr)))
				return true;
			sErr = tErrnoFmter((cfg::udspath + ": ").c_str());
			return false;
		}
		if (!cfg::port)
		{
			sErr = "Control socket " + cfg::udspath + " not accessible and no TCP port configured";
			return false;
		}
		auto hints = addrinfo();
		hints.ai_socktype = SOCK_STREAM;
		hints.ai_family = PF_UNSPEC;
		addrinfo* res = nullptr;
		mstring host("localhost");
		tSplitWalk bindAddrs(cfg::bindaddr);
		if (bindAddrs.Next())
			host = bindAddrs.str();
		auto r = getaddrinfo(host.c_str(), to_string(cfg::port).c_str(), &hints, &res);
		if (r)
		{
			sErr = gai_strerror(r);
			return false;
		}
		TFinalAction cleaner([res]() { freeaddrinfo(res); });
		for (auto p = res; p; p = p->ai_next)
		{
			m_fd.reset(socket(p->ai_family, p->ai_socktype, p->ai_protocol));
			if (m_fd.valid() && 0 == connect(m_fd.get(), p->ai_addr, p->ai_addrlen))
				return true;
			sErr = tErrnoFmter("Cannot connect: ");
		}
		m_fd.reset();
		return false;
	}

	bool ReadLine(mstring& line)
	{
		while (true)
		{
			auto pos = m_inbuf.find('\n');
			if (pos != stmiss)
			{
				line = m_inbuf.substr(0, pos);
				trimBack(line, "\r");
				m_inbuf.erase(0, pos + 1);
				return true;
			}
			char buf[4096];
			auto n = ::read(m_fd.get(), buf, sizeof(buf));
			if (n < 0 && errno == EINTR)
				continue;
			if (n <= 0)
				return false;
			m_inbuf.append(buf, n);
		}
	}

	/**
	 * Send one request and collect the response lines, without the end mark.
	 */
	bool Exchange(cmstring& request, tStrVec& lines, mstring& sErr)
	{
		auto req = request + "\n";
		if (dumpall(m_fd.get(), req) < 0)
		{
			sErr = tErrnoFmter("Cannot send request: ");
			return false;
		}
		mstring line;
		if (!ReadLine(line))
		{
			sErr = "Connection closed by the daemon";
			return false;
		}
		lines.emplace_back(line);
		if (!startsWith(line, "OK") || !IsMultiLineCommand(request))
			return true;
		while (ReadLine(line))
		{
			if (line == CTL_END_MARK)
				return true;
			lines.emplace_back(line);
		}
		sErr = "Incomplete response";
		return false;
	}
};

// status line without the OK marker, or exit with the reported error
static tStrVec Request(cmstring& request)
{
	tCtlClient cl;
	mstring sErr;
	tStrVec lines;
	if (!cl.Connect(sErr))
		fin(EXIT_FAILURE, "Cannot reach orcadl: " + sErr);
	if (!cl.Exchange(request, lines, sErr))
		fin(EXIT_FAILURE, sErr);
	auto& head = lines.front();
	if (startsWith(head, "ERR"))
		fin(2, "Error: " + head.substr(min(head.size(), size_t(4))));
	head = mstring(trimBoth(string_view(head).substr(2)));
	return lines;
}

static void PrintJob(const tJobInfo& j, bool verbose)
{
	cout << j.id << "  " << ToString(j.state) << "  " << ToString(j.kind) << "  ";
	if (j.progress.total >= 0)
		cout << offttosH(j.progress.done) << "/" << offttosH(j.progress.total);
	else
		cout << offttosH(j.progress.done);
	if (j.state == EJobState::ACTIVE)
	{
		cout << "  " << offttosH(j.progress.rate) << "/s";
		if (j.progress.eta >= 0)
			cout << "  ETA " << j.progress.eta << "s";
	}
	cout << "  " << (j.finalPath.empty() ? j.outputPath : j.finalPath) << endl;
	if (!verbose)
		return;
	cout << "  priority: " << j.priority << ", retries: " << j.retries << endl;
	for (const auto& u: j.uris)
		cout << "  source: " << u << endl;
	if (!j.stagedPath.empty())
		cout << "  staged: " << j.stagedPath << endl;
	if (j.error.IsError())
		cout << "  error: " << j.error.ToString() << endl;
}

int do_submit(tCsDeq& parms)
{
	tSubmitRequest req;
	for (auto it = parms.begin(); it != parms.end(); ++it)
	{
		string_view opt(*it);
		if (opt.size() == 2 && opt[0] == '-')
		{
			if (++it == parms.end())
				fin(3, szHelpSubmit);
			switch (opt[1])
			{
			case 'o': req.outputPath = *it; break;
			case 'f': req.format = *it; break;
			case 's': req.checksum = *it; break;
			case 'p': req.priority = atoi(*it); break;
			case 'k':
				if (!FromString(*it, req.kindHint))
					fin(3, mstring("Unknown resource kind: ") + *it);
				break;
			default:
				fin(3, szHelpSubmit);
			}
			continue;
		}
		req.uris.emplace_back(*it);
	}
	if (req.uris.empty() || req.outputPath.empty())
		fin(3, szHelpSubmit);
	// relative paths are meant relative to the caller
	if (req.outputPath[0] != '/')
	{
		char buf[PATH_MAX];
		if (getcwd(buf, sizeof(buf)))
			req.outputPath = mstring(buf) + "/" + req.outputPath;
	}
	auto lines = Request(FormatSubmitRequest(req));
	tCtlFields f;
	const mstring* id = nullptr;
	if (!ParseFields(lines.front(), f) || !(id = FindField(f, "id")))
		fin(EXIT_FAILURE, "Unexpected response: " + lines.front());
	cout << *id << endl;
	return 0;
}

int do_query(LPCSTR id)
{
	auto lines = Request(mstring("QUERY id=") + UrlEscape(id));
	tCtlFields f;
	tJobInfo info;
	if (!ParseFields(lines.front(), f) || !FieldsToJobInfo(f, info))
		fin(EXIT_FAILURE, "Unexpected response: " + lines.front());
	PrintJob(info, true);
	// usable in scripts waiting for the result
	switch (info.state)
	{
	case EJobState::COMPLETED: return 0;
	case EJobState::FAILED: return 5;
	case EJobState::CANCELLED: return 6;
	default: return 7;
	}
}

int do_list()
{
	auto lines = Request("LIST");
	for (size_t i = 1; i < lines.size(); ++i)
	{
		tCtlFields f;
		tJobInfo info;
		if (ParseFields(lines[i], f) && FieldsToJobInfo(f, info))
			PrintJob(info, false);
		else
			cerr << "Bad line: " << lines[i] << endl;
	}
	return 0;
}

int do_stats()
{
	auto lines = Request("STATS");
	tCtlFields f;
	if (!ParseFields(lines.front(), f))
		fin(EXIT_FAILURE, "Unexpected response: " + lines.front());
	for (const auto& kv: f)
		cout << kv.first << ": " << kv.second << endl;
	return 0;
}

int do_checksum(tCsDeq& parms)
{
	auto type = CSTYPE_SHA256;
	if (parms.size() > 1)
	{
		type = GetCSTypeByName(parms[1]);
		if (type == CSTYPE_INVALID)
			fin(3, szHelpChecksum);
	}
	tFingerprint fpr;
	mstring sErr;
	if (!fpr.ScanFile(parms.front(), type, &sErr))
		fin(EXIT_FAILURE, sErr);
	cout << (mstring) fpr << "  " << parms.front() << endl;
	return 0;
}

int main(int argc, const char **argv)
{
	log::g_szLogPrefix = "orcactl";

	LPCSTR mode = nullptr, szCfgDir = nullptr;
	LPCSTR *posMode(nullptr);
	tCsDeq xargs;
	bool wantCfgDir = false, ignoreCfgErrors = false, subHelp = false;

	const char **argFirst = argv+1, **argEnd = argv+argc;
	// pick and process early options
	for (auto p = argFirst; p < argEnd; ++p)
	{
		if (wantCfgDir)
		{
			wantCfgDir = false;
			szCfgDir = *p;
		}
		else if (!strcmp(*p, "-c"))
			wantCfgDir = true;
		else if(!strcmp(*p, "-i"))
			ignoreCfgErrors = true;
		else
			continue;
		// consumed
		*p = nullptr;
	}

	if (wantCfgDir)
		fin(2, "-c requires a valid configuration directory");
	cfg::g_bQuiet = true;
	cfg::ReadConfigDirectory(szCfgDir ? szCfgDir : CFGDIR, szCfgDir && !ignoreCfgErrors);

	// apply global options, collect mode name and its options
	for (auto p = argFirst; p < argEnd; ++p)
	{
		if (!*p || !**p)
			continue;
		if (!strncmp(*p, "-h", 2) || !strcmp(*p, "--help"))
		{
			if (!posMode ||  p < posMode)
				fin(0, szHelp);
			subHelp = true;
		}
		else if (!mode && cfg::SetOption(*p, true))
			continue;
		else if (!mode)
		{
			mode = *p;
			posMode = p;
		}
		else
			xargs.emplace_back(*p);
	}
	auto sErr = cfg::PostProcConfig();
	cfg::g_bQuiet = false;
	if (!sErr.empty())
		fin(2, "Configuration error: " + sErr);

	if (!mode)
		return fin(1, szHelp);

#define MODE(x) (strcmp(x, mode) == 0)
#define NA UINT_MAX
#define CHECKARGS(n, m, mode, shelp) if (subHelp) fin(4, shelp); \
	if (xargs.size() < n) fin(3, "Insufficient options for command " mode); \
	if (m != NA && xargs.size() > m) fin(3, "Too many options for command " mode);

	if (MODE("submit"))
	{
		CHECKARGS(3u, NA, "submit", szHelpSubmit);
		return do_submit(xargs);
	}
	if (MODE("query"))
	{
		CHECKARGS(1u, 1u, "query", "USAGE: ... query job-id");
		return do_query(xargs.front());
	}
	if (MODE("cancel"))
	{
		CHECKARGS(1u, NA, "cancel", "USAGE: ... cancel job-id...");
		for (auto id: xargs)
			Request(mstring("CANCEL id=") + UrlEscape(id));
		return 0;
	}
	if (MODE("list"))
	{
		CHECKARGS(0u, 0u, "list", "USAGE: ... list");
		return do_list();
	}
	if (MODE("stats"))
	{
		CHECKARGS(0u, 0u, "stats", "USAGE: ... stats");
		return do_stats();
	}
	if (MODE("checksum"))
	{
		CHECKARGS(1u, 2u, "checksum", szHelpChecksum);
		return do_checksum(xargs);
	}
	if (MODE("printvar"))
	{
		CHECKARGS(1u, 1u, "printvar", "USAGE: ... config-variable-name");
		auto ps(cfg::GetStringPtr(xargs.front()));
		if(ps)
		{
			cout << *ps << endl;
			return 0;
		}
		auto pi(cfg::GetIntPtr(xargs.front()));
		if(pi)
		{
			cout << *pi << endl;
			return 0;
		}
		return 42;
	}
	if (MODE("cfgdump"))
	{
		cfg::dump_config(false);
		return 0;
	}
	cerr << endl << "Unknown command: " << mode << endl;
	return fin(1, szHelp);
}
