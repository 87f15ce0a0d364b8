#include "httpftpadapter.h"
#include "httpclient.h"
#include "ocfg.h"
#include "ocutilpath.h"
#include "debug.h"

#include <json/json.h>

using namespace std;

namespace orca
{

tAria2Config tAria2Config::FromCfg()
{
	tAria2Config ret;
	ret.rpcUrl = cfg::aria2rpc;
	ret.secret = cfg::aria2secret;
	ret.split = cfg::aria2split;
	return ret;
}

EErrorClass ClassifyAria2Error(int code)
{
	switch(code)
	{
	case 1: // unknown, mostly network trouble
	case 2: // timeout
	case 5: // too slow
	case 6: // network problem
	case 7: // unfinished downloads on shutdown
	case 8: // resume not supported, restart from scratch
	case 9: // not enough disk space
	case 19: // name resolution failed
	case 21: // FTP command failed
	case 22: // bad HTTP response header
	case 29: // server overload or maintenance
		return EErrorClass::TRANSIENT;
	default:
		return EErrorClass::PERMANENT;
	}
}

static off_t jsonOfft(const Json::Value& v, LPCSTR key)
{
	const auto& x = v[key];
	if (x.isString())
		return atoofft(x.asString(), 0);
	if (x.isIntegral())
		return (off_t) x.asInt64();
	return 0;
}

tPollResult MapAria2Status(const Json::Value& status, cmstring& stagedPath)
{
	tPollResult ret;
	auto st = status["status"].asString();

	ret.progress.done = jsonOfft(status, "completedLength");
	auto total = jsonOfft(status, "totalLength");
	// not known before the first response
	ret.progress.total = total > 0 ? total : -1;
	ret.progress.rate = jsonOfft(status, "downloadSpeed");
	ret.progress.CalcEta();

	if (st == "complete")
	{
		ret.kind = tPollResult::COMPLETED;
		ret.stagedPath = stagedPath;
		if (ret.progress.total < 0)
			ret.progress.total = ret.progress.done;
		ret.progress.eta = 0;
	}
	else if (st == "removed")
		ret.kind = tPollResult::CANCELLED;
	else if (st == "error")
	{
		ret.kind = tPollResult::FAILED;
		auto code = (int) atoofft(status["errorCode"].asString(), 1);
		auto msg = status["errorMessage"].asString();
		if (msg.empty())
			msg = "download failed";
		msg = "aria2 error " + to_string(code) + ": " + msg;
		ret.error = ClassifyAria2Error(code) == EErrorClass::TRANSIENT
				? tTransferError::Transient(msg)
				: tTransferError::Permanent(msg);
	}
	return ret;
}

struct tRpcReply
{
	// the call did not reach aria2 or the answer was garbage
	mstring transportError;
	// JSON-RPC error
	int errCode = 0;
	mstring errMessage;
	Json::Value result;

	bool transportOk() const { return transportError.empty(); }
	bool ok() const { return transportOk() && errCode == 0 && errMessage.empty(); }
	mstring Describe() const
	{
		if (!transportOk())
			return transportError;
		return "aria2 RPC error " + to_string(errCode) + ": " + errMessage;
	}
};

using tRpcReporter = std::function<void(tRpcReply&&)>;

struct tAria2Ctx
{
	IHttpClient& m_http;
	tAria2Config m_conf;
	unsigned m_nCallId = 0;

	void Call(LPCSTR method, Json::Value params, tRpcReporter rep)
	{
		Json::Value doc(Json::objectValue);
		doc["jsonrpc"] = "2.0";
		doc["id"] = "orcadl-" + to_string(++m_nCallId);
		doc["method"] = method;
		Json::Value fullParams(Json::arrayValue);
		if (!m_conf.secret.empty())
			fullParams.append("token:" + m_conf.secret);
		for (auto& p: params)
			fullParams.append(p);
		doc["params"] = fullParams;

		tHttpRequest req;
		req.url = m_conf.rpcUrl;
		req.contentType = "application/json";
		req.body = WriteJson(doc);
		ldbg("aria2 call: " << req.body);

		m_http.Send(move(req), [rep = move(rep)](tHttpResponse&& resp)
		{
			tRpcReply ret;
			Json::Value answer;
			mstring sErr;
			// aria2 sends JSON errors with 4xx status codes
			if (resp.status == 0)
				ret.transportError = resp.Describe();
			else if (!ParseJson(resp.body, answer, sErr) || !answer.isObject())
				ret.transportError = "Bad aria2 response, " + resp.Describe();
			else if (answer.isMember("error"))
			{
				ret.errCode = answer["error"]["code"].asInt();
				ret.errMessage = answer["error"]["message"].asString();
				if (ret.errMessage.empty())
					ret.errMessage = "unknown";
			}
			else
				ret.result = answer["result"];
			rep(move(ret));
		});
	}
};

struct tAria2HandleState
{
	mstring gid, stagedPath;
	tPollResult last;
	bool inFlight = false, cancelled = false, finished = false;
	unsigned nFailures = 0;
};

class tAria2Handle : public IBackendHandle
{
public:
	std::shared_ptr<tAria2HandleState> m_state;
	cmstring& GetResumeToken() const override { return m_state->gid; }
};

class tHttpFtpAdapter : public IBackendAdapter
{
	std::shared_ptr<tAria2Ctx> m_ctx;

	static tAria2Handle& H(IBackendHandle& h) { return static_cast<tAria2Handle&>(h); }

	static tBackendHandlePtr MakeHandle(cmstring& gid, cmstring& stagedPath)
	{
		auto ret = make_unique<tAria2Handle>();
		ret->m_state = make_shared<tAria2HandleState>();
		ret->m_state->gid = gid;
		ret->m_state->stagedPath = stagedPath;
		return ret;
	}

	static Json::Value StatusKeys()
	{
		Json::Value keys(Json::arrayValue);
		for (auto k : {"status", "totalLength", "completedLength", "downloadSpeed", "errorCode", "errorMessage"})
			keys.append(k);
		return keys;
	}

public:
	tHttpFtpAdapter(IHttpClient& http, const tAria2Config& conf)
	: m_ctx(new tAria2Ctx { http, conf, 0 })
	{
	}

	EResourceKind GetKind() const override { return EResourceKind::HTTP_FTP; }

	mstring GetStagingPath(cmstring& outputPath) const override
	{
		return outputPath + ".part";
	}

	void Start(const tStartParams &params, tStartReporter reporter) override
	{
		if (params.uris.empty())
			return reporter(tBackendHandlePtr(), tTransferError::Unsupported("No source given"));
		for (const auto& u: params.uris)
		{
			if (InferResourceKind(u) != EResourceKind::HTTP_FTP)
				return reporter(tBackendHandlePtr(), tTransferError::Unsupported("Not a HTTP/FTP source: " + u));
		}
		auto staged = GetStagingPath(params.outputPath);
		Json::Value uris(Json::arrayValue);
		for (const auto& u: params.uris)
			uris.append(u);
		Json::Value opts(Json::objectValue);
		opts["dir"] = GetDirPart(staged);
		opts["out"] = mstring(GetBaseName(staged));
		auto split = to_string(m_ctx->m_conf.split);
		opts["split"] = split;
		opts["max-connection-per-server"] = to_string(std::min(m_ctx->m_conf.split, 16));
		opts["continue"] = "true";
		opts["allow-overwrite"] = "true";
		opts["auto-file-renaming"] = "false";
		Json::Value params2(Json::arrayValue);
		params2.append(uris);
		params2.append(opts);

		m_ctx->Call("aria2.addUri", params2, [staged, reporter = move(reporter)](tRpcReply&& rep)
		{
			if (!rep.transportOk())
				return reporter(tBackendHandlePtr(), tTransferError::Unavailable("aria2 not reachable: " + rep.transportError));
			if (!rep.ok() || !rep.result.isString())
				return reporter(tBackendHandlePtr(), tTransferError::Permanent(rep.Describe()));
			USRDBG("aria2 download started, GID " << rep.result.asString());
			reporter(MakeHandle(rep.result.asString(), staged), tTransferError());
		});
	}

	tPollResult Poll(IBackendHandle &handle) override
	{
		auto st = H(handle).m_state;
		if (st->inFlight || st->cancelled || st->finished)
			return st->last;
		st->inFlight = true;
		Json::Value params(Json::arrayValue);
		params.append(st->gid);
		params.append(StatusKeys());
		auto ctx = m_ctx;
		weak_ptr<tAria2HandleState> wst(st);
		m_ctx->Call("aria2.tellStatus", params, [wst, ctx](tRpcReply&& rep)
		{
			auto st = wst.lock();
			if (!st || st->cancelled)
				return;
			st->inFlight = false;
			if (!rep.transportOk())
			{
				if (++st->nFailures >= ctx->m_conf.maxPollFailures)
				{
					st->last.kind = tPollResult::FAILED;
					st->last.error = tTransferError::Transient("aria2 not reachable: " + rep.transportError);
				}
				return;
			}
			st->nFailures = 0;
			if (!rep.ok())
			{
				// most likely restarted without session, the GID is gone
				st->last.kind = tPollResult::FAILED;
				st->last.error = tTransferError::Transient(rep.Describe());
				return;
			}
			auto res = MapAria2Status(rep.result, st->stagedPath);
			// keep the last known numbers when the download went away
			if (res.kind == tPollResult::CANCELLED || res.kind == tPollResult::FAILED)
				res.progress = st->last.progress;
			st->last = move(res);
			if (st->last.kind != tPollResult::PROGRESS)
			{
				st->finished = true;
				Json::Value p(Json::arrayValue);
				p.append(st->gid);
				ctx->Call("aria2.removeDownloadResult", p, [](tRpcReply&&) {});
			}
		});
		return st->last;
	}

	void Cancel(IBackendHandle &handle, bool) override
	{
		auto st = H(handle).m_state;
		if (st->cancelled)
			return;
		st->cancelled = true;
		bool alreadyGone = st->finished;
		st->last.kind = tPollResult::CANCELLED;
		if (alreadyGone)
			return;
		Json::Value params(Json::arrayValue);
		params.append(st->gid);
		auto ctx = m_ctx;
		auto gid = st->gid;
		m_ctx->Call("aria2.forceRemove", params, [ctx, gid](tRpcReply&& rep)
		{
			if (!rep.ok())
			{
				USRDBG("aria2 remove of " << gid << " failed: " << rep.Describe());
				return;
			}
			Json::Value p(Json::arrayValue);
			p.append(gid);
			ctx->Call("aria2.removeDownloadResult", p, [](tRpcReply&&) {});
		});
	}

	void Reattach(const tStartParams &params, cmstring &resumeToken, tStartReporter reporter) override
	{
		if (resumeToken.empty())
			return reporter(tBackendHandlePtr(), tTransferError::Transient("No resume token"));
		Json::Value p(Json::arrayValue);
		p.append(resumeToken);
		p.append(StatusKeys());
		auto staged = GetStagingPath(params.outputPath);
		m_ctx->Call("aria2.tellStatus", p, [staged, resumeToken, reporter = move(reporter)](tRpcReply&& rep)
		{
			if (!rep.ok())
				return reporter(tBackendHandlePtr(), tTransferError::Transient("Cannot reattach: " + rep.Describe()));
			auto st = rep.result["status"].asString();
			if (st == "removed" || st == "error")
				return reporter(tBackendHandlePtr(), tTransferError::Transient("Cannot reattach, download is " + st));
			reporter(MakeHandle(resumeToken, staged), tTransferError());
		});
	}
};

std::unique_ptr<IBackendAdapter> CreateHttpFtpAdapter(IHttpClient& http, const tAria2Config& conf)
{
	return std::make_unique<tHttpFtpAdapter>(http, conf);
}

}
