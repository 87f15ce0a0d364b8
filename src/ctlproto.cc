#include "ctlproto.h"
#include "scheduler.h"
#include "meta.h"
#include "debug.h"

#include <cerrno>
#include <climits>

using namespace std;

namespace orca
{

mstring FormatFields(const tCtlFields& fields)
{
	mstring ret;
	for (const auto& kv: fields)
	{
		if (!ret.empty())
			ret += ' ';
		ret += kv.first;
		ret += '=';
		UrlEscapeAppend(kv.second, ret);
	}
	return ret;
}

bool ParseFields(string_view line, tCtlFields& ret)
{
	ret.clear();
	for (auto tok: tSplitWalk(line))
	{
		auto pos = tok.find('=');
		if (pos == stmiss || pos == 0)
			return false;
		mstring val;
		if (!UrlUnescapeAppend(tok.substr(pos + 1), val))
			return false;
		ret.emplace_back(mstring(tok.substr(0, pos)), move(val));
	}
	return true;
}

const mstring* FindField(const tCtlFields& fields, string_view key)
{
	for (const auto& kv: fields)
		if (kv.first == key)
			return &kv.second;
	return nullptr;
}

tCtlFields JobInfoToFields(const tJobInfo& info)
{
	tCtlFields ret {
		{"id", info.id},
		{"state", ToString(info.state)},
		{"kind", ToString(info.kind)},
		{"prio", to_string(info.priority)},
		{"retries", to_string(info.retries)},
		{"created", to_string(info.created)},
		{"done", to_string(info.progress.done)},
		{"total", to_string(info.progress.total)},
		{"rate", to_string(info.progress.rate)},
		{"eta", to_string(info.progress.eta)},
		{"out", info.outputPath}
	};
	if (!info.finalPath.empty())
		ret.emplace_back("final", info.finalPath);
	if (!info.stagedPath.empty())
		ret.emplace_back("staged", info.stagedPath);
	if (info.error.IsError())
	{
		ret.emplace_back("error", ToString(info.error.kind));
		ret.emplace_back("class", ToString(info.error.errClass));
		ret.emplace_back("reason", info.error.reason);
	}
	for (const auto& u: info.uris)
		ret.emplace_back("uri", u);
	return ret;
}

bool FieldsToJobInfo(const tCtlFields& fields, tJobInfo& ret)
{
	ret = tJobInfo();
	bool haveId = false, haveState = false;
	for (const auto& kv: fields)
	{
		auto& k = kv.first;
		auto& v = kv.second;
		if (k == "id")
		{
			ret.id = v;
			haveId = !v.empty();
		}
		else if (k == "state")
			haveState = FromString(v, ret.state);
		else if (k == "kind")
			FromString(v, ret.kind);
		else if (k == "prio")
			ret.priority = (int) atoofft(v, 0);
		else if (k == "retries")
			ret.retries = (unsigned) atoofft(v, 0);
		else if (k == "created")
			ret.created = (time_t) atoofft(v, 0);
		else if (k == "done")
			ret.progress.done = atoofft(v, 0);
		else if (k == "total")
			ret.progress.total = atoofft(v, -1);
		else if (k == "rate")
			ret.progress.rate = atoofft(v, 0);
		else if (k == "eta")
			ret.progress.eta = atoofft(v, -1);
		else if (k == "out")
			ret.outputPath = v;
		else if (k == "final")
			ret.finalPath = v;
		else if (k == "staged")
			ret.stagedPath = v;
		else if (k == "error")
		{
			for (auto ek = (int) EErrorKind::UNSUPPORTED_RESOURCE; ek <= (int) EErrorKind::CANCELLATION_REQUESTED; ++ek)
			{
				if (v == ToString(EErrorKind(ek)))
					ret.error.kind = EErrorKind(ek);
			}
		}
		else if (k == "class")
		{
			for (auto ec: { EErrorClass::TRANSIENT, EErrorClass::PERMANENT, EErrorClass::CANCELLED })
			{
				if (v == ToString(ec))
					ret.error.errClass = ec;
			}
		}
		else if (k == "reason")
			ret.error.reason = v;
		else if (k == "uri")
			ret.uris.emplace_back(v);
	}
	return haveId && haveState;
}

mstring FormatSubmitRequest(const tSubmitRequest& req)
{
	tCtlFields f;
	for (const auto& u: req.uris)
		f.emplace_back("uri", u);
	f.emplace_back("out", req.outputPath);
	if (req.kindHint != EResourceKind::INVALID)
		f.emplace_back("kind", ToString(req.kindHint));
	if (req.priority)
		f.emplace_back("prio", to_string(req.priority));
	if (!req.format.empty())
		f.emplace_back("fmt", req.format);
	if (!req.checksum.empty())
		f.emplace_back("sum", req.checksum);
	return "SUBMIT " + FormatFields(f);
}

bool ParseSubmitRequest(string_view args, tSubmitRequest& ret, mstring& sErr)
{
	ret = tSubmitRequest();
	tCtlFields f;
	if (!ParseFields(args, f))
	{
		sErr = "Malformed arguments";
		return false;
	}
	for (const auto& kv: f)
	{
		auto& k = kv.first;
		auto& v = kv.second;
		if (k == "uri")
			ret.uris.emplace_back(v);
		else if (k == "out")
			ret.outputPath = v;
		else if (k == "kind")
		{
			if (!FromString(v, ret.kindHint))
			{
				sErr = "Unknown resource kind " + v;
				return false;
			}
		}
		else if (k == "prio")
		{
			char* end = nullptr;
			errno = 0;
			auto n = strtol(v.c_str(), &end, 10);
			if (v.empty() || !end || *end || errno == ERANGE || n < INT_MIN || n > INT_MAX)
			{
				sErr = "Bad priority " + v;
				return false;
			}
			ret.priority = (int) n;
		}
		else if (k == "fmt")
			ret.format = v;
		else if (k == "sum")
			ret.checksum = v;
		else
		{
			sErr = "Unknown argument " + k;
			return false;
		}
	}
	if (ret.uris.empty())
	{
		sErr = "No source given";
		return false;
	}
	if (ret.outputPath.empty())
	{
		sErr = "No output path given";
		return false;
	}
	return true;
}

tCtlFields StatsToFields(const tSchedulerStats& st)
{
	tCtlFields ret {
		{"pending_http", to_string(st.pendingHttp)},
		{"pending_bt", to_string(st.pendingBt)},
		{"active_http", to_string(st.activeHttp)},
		{"active_bt", to_string(st.activeBt)},
		{"slots_http", to_string(st.slotsHttp)},
		{"slots_bt", to_string(st.slotsBt)},
		{"total", to_string(st.total)}
	};
	for (int i = 0; i <= (int) EJobState::CANCELLED; ++i)
	{
		mstring key(ToString(EJobState(i)));
		tolower_inplace(key);
		ret.emplace_back(key, to_string(st.byState[i]));
	}
	return ret;
}

static string_view GetCommandWord(string_view line, string_view* rest = nullptr)
{
	tSplitWalk split(line);
	if (!split.Next())
		return string_view();
	if (rest)
		*rest = split.right();
	return split.view();
}

bool IsMultiLineCommand(string_view requestLine)
{
	return equalsNoCase(GetCommandWord(requestLine), "LIST");
}

static mstring ReplyErr(string_view reason)
{
	mstring ret("ERR ");
	// keep the framing intact
	for (auto c: reason)
		ret += (c == '\n' || c == '\r') ? ' ' : c;
	return ret + "\n";
}

static mstring ReplyOk(const tCtlFields& fields)
{
	if (fields.empty())
		return "OK\n";
	return "OK " + FormatFields(fields) + "\n";
}

// the job id, either as id=... or as bare word
static bool GetIdArg(string_view args, tJobId& ret)
{
	args = trimBoth(args);
	if (args.empty())
		return false;
	if (startsWith(args, "id="))
	{
		ret.clear();
		return UrlUnescapeAppend(args.substr(3), ret) && !ret.empty();
	}
	ret = mstring(args);
	return ret.find_first_of(SPACECHARS) == stmiss;
}

mstring ctlhandler::Dispatch(string_view line, bool& bQuit)
{
	LOGSTARTFUNCx(line);
	bQuit = false;
	string_view args;
	auto cmd = GetCommandWord(line, &args);
	if (cmd.empty())
		return ReplyErr("Empty request");

	if (equalsNoCase(cmd, "SUBMIT"))
	{
		tSubmitRequest req;
		mstring err;
		if (!ParseSubmitRequest(args, req, err))
			return ReplyErr(err);
		tJobId id;
		tTransferError terr;
		if (!m_sched.Submit(req, id, terr))
			return ReplyErr(terr.ToString());
		return ReplyOk({{"id", id}});
	}
	if (equalsNoCase(cmd, "QUERY"))
	{
		tJobId id;
		if (!GetIdArg(args, id))
			return ReplyErr("Job id expected");
		tJobInfo info;
		if (!m_sched.Query(id, info))
			return ReplyErr("Unknown job " + id);
		return ReplyOk(JobInfoToFields(info));
	}
	if (equalsNoCase(cmd, "CANCEL"))
	{
		tJobId id;
		if (!GetIdArg(args, id))
			return ReplyErr("Job id expected");
		if (!m_sched.Cancel(id))
			return ReplyErr("Unknown job " + id);
		return ReplyOk({});
	}
	if (equalsNoCase(cmd, "LIST"))
	{
		auto jobs = m_sched.List();
		auto ret = ReplyOk({{"count", to_string(jobs.size())}});
		for (const auto& j: jobs)
			ret += FormatFields(JobInfoToFields(j)) + "\n";
		return ret + CTL_END_MARK "\n";
	}
	if (equalsNoCase(cmd, "STATS"))
		return ReplyOk(StatsToFields(m_sched.GetStats()));
	if (equalsNoCase(cmd, "QUIT"))
	{
		bQuit = true;
		return ReplyOk({});
	}
	return ReplyErr("Unknown command " + mstring(cmd));
}

}
