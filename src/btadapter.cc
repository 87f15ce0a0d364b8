#include "btadapter.h"
#include "httpclient.h"
#include "oclock.h"
#include "ocfg.h"
#include "fileio.h"
#include "ocutilpath.h"
#include "debug.h"

#include <json/json.h>

#include <fstream>
#include <sstream>
#include <random>

using namespace std;

namespace orca
{

static const mstring tagPrefix("orcadl-");

tQbtConfig tQbtConfig::FromCfg()
{
	tQbtConfig ret;
	ret.url = cfg::qbturl;
	ret.user = cfg::qbtuser;
	ret.password = cfg::qbtpass;
	ret.category = cfg::qbtcategory;
	for (auto t: tSplitWalk(cfg::bttrackers, SPACECHARSsv))
		ret.trackers.emplace_back(t);
	ret.deleteFilesOnCancel = cfg::btdelcancel;
	ret.visibilityTimeoutMs = unsigned(cfg::nettimeout) * 1000;
	return ret;
}

mstring NormalizeTorrentSource(string_view src)
{
	src = trimBoth(src);
	if (src.size() == 40 && IsHexString(src))
		return "magnet:?xt=urn:btih:" + mstring(src);
	// BitTorrent v2, multihash with sha256 prefix
	if (src.size() == 64 && IsHexString(src))
		return "magnet:?xt=urn:btmh:1220" + mstring(src);
	return mstring(src);
}

tPollResult MapQbtTorrent(const Json::Value& t)
{
	static const string_view doneStates[] = { "uploading", "stalledUP", "queuedUP", "forcedUP",
			"pausedUP", "stoppedUP", "checkingUP" };
	tPollResult ret;
	auto state = t["state"].asString();
	auto progress = t["progress"].asDouble();

	ret.progress.total = t.isMember("size") ? (off_t) t["size"].asInt64() : -1;
	if (ret.progress.total <= 0)
		ret.progress.total = -1;
	ret.progress.done = t.isMember("completed")
			? (off_t) t["completed"].asInt64()
			: (ret.progress.total > 0 ? off_t(progress * ret.progress.total) : 0);
	ret.progress.rate = (off_t) t["dlspeed"].asInt64();
	ret.progress.CalcEta();

	if (state == "error" || state == "missingFiles")
	{
		ret.kind = tPollResult::FAILED;
		ret.error = tTransferError::Permanent("qBittorrent reports torrent state " + state);
		return ret;
	}
	bool done = progress >= 1.0;
	for (auto s: doneStates)
		done = done || s == state;
	if (done)
	{
		ret.kind = tPollResult::COMPLETED;
		ret.stagedPath = t["content_path"].asString();
		if (ret.stagedPath.empty())
			ret.stagedPath = PathCombine(t["save_path"].asString(), t["name"].asString());
		if (ret.progress.total > 0)
			ret.progress.done = ret.progress.total;
		ret.progress.eta = 0;
	}
	return ret;
}

struct tQbtCtx : public std::enable_shared_from_this<tQbtCtx>
{
	IHttpClient& m_http;
	IEventClock& m_clock;
	tQbtConfig m_conf;
	mstring m_sid;

	tQbtCtx(IHttpClient& http, IEventClock& clock, const tQbtConfig& conf)
	: m_http(http), m_clock(clock), m_conf(conf)
	{
	}

	mstring Url(string_view path)
	{
		auto base = m_conf.url;
		trimBack(base, "/");
		return base + mstring(path);
	}

	void Login(tHttpReporter rep)
	{
		tHttpRequest req;
		req.url = Url("/api/v2/auth/login");
		req.contentType = "application/x-www-form-urlencoded";
		req.body = FormEncode({{"username", m_conf.user}, {"password", m_conf.password}});
		req.headers.emplace_back("Referer", m_conf.url);
		m_http.Send(move(req), [self = shared_from_this(), rep = move(rep)](tHttpResponse&& resp)
		{
			// SID=xyz; HttpOnly; path=/
			auto setCookie = resp.GetHeader("Set-Cookie");
			tSplitWalk cookie(setCookie, ";");
			if (resp.ok() && cookie.Next() && startsWithSz(trimBoth(cookie.view()), "SID="))
				self->m_sid = trimBoth(cookie.view());
			else if (resp.ok())
			{
				resp.status = 403;
				resp.body = "Login rejected";
			}
			rep(move(resp));
		});
	}

	/**
	 * Send an API request, logging in first when needed and once more when the session expired.
	 */
	void Request(tHttpRequest&& req, tHttpReporter rep, bool bRetried = false)
	{
		if (!m_conf.user.empty() && m_sid.empty())
		{
			auto keep = make_shared<tHttpRequest>(move(req));
			return Login([self = shared_from_this(), keep, rep = move(rep)](tHttpResponse&& lresp)
			{
				if (!lresp.ok())
				{
					if (lresp.status)
						lresp.error = "qBittorrent login failed: " + lresp.Describe();
					return rep(move(lresp));
				}
				self->Request(move(*keep), move(rep), true);
			});
		}
		auto keep = make_shared<tHttpRequest>(req);
		if (!m_sid.empty())
			req.headers.emplace_back("Cookie", m_sid);
		req.headers.emplace_back("Referer", m_conf.url);
		m_http.Send(move(req), [self = shared_from_this(), keep, rep = move(rep), bRetried](tHttpResponse&& resp)
		{
			if (resp.status == 403 && !bRetried && !self->m_conf.user.empty())
			{
				self->m_sid.clear();
				return self->Request(move(*keep), move(rep), true);
			}
			rep(move(resp));
		});
	}

	void Post(string_view path, mstring formBody, tHttpReporter rep)
	{
		tHttpRequest req;
		req.url = Url(path);
		req.contentType = "application/x-www-form-urlencoded";
		req.body = move(formBody);
		Request(move(req), move(rep));
	}

	void Get(string_view pathAndQuery, tHttpReporter rep)
	{
		tHttpRequest req;
		req.method = tHttpRequest::EMethod::GET;
		req.url = Url(pathAndQuery);
		Request(move(req), move(rep));
	}

	// torrents/info for one tag, the reporter gets an array or an error
	void Info(cmstring& tag, std::function<void(Json::Value, mstring)> rep)
	{
		Get("/api/v2/torrents/info?tag=" + UrlEscape(tag), [rep = move(rep)](tHttpResponse&& resp)
		{
			Json::Value list;
			mstring sErr;
			if (!resp.ok())
				return rep(Json::Value(), resp.Describe());
			if (!ParseJson(resp.body, list, sErr) || !list.isArray())
				return rep(Json::Value(), "Bad qBittorrent response: " + sErr);
			rep(list, mstring());
		});
	}

	void Delete(cmstring& hash, bool deleteFiles)
	{
		Post("/api/v2/torrents/delete", FormEncode({{"hashes", hash}, {"deleteFiles", deleteFiles ? "true" : "false"}}),
				[hash](tHttpResponse&& resp)
		{
			if (!resp.ok())
				USRDBG("qBittorrent delete of " << hash << " failed: " << resp.Describe());
		});
	}
};

struct tQbtHandleState
{
	mstring tag, hash;
	tPollResult last;
	int64_t visibleDeadline = 0;
	bool inFlight = false, cancelled = false, finished = false, trackersAdded = false;
};

class tQbtHandle : public IBackendHandle
{
public:
	std::shared_ptr<tQbtHandleState> m_state;
	cmstring& GetResumeToken() const override { return m_state->tag; }
};

class tBitTorrentAdapter : public IBackendAdapter
{
	std::shared_ptr<tQbtCtx> m_ctx;

	static tQbtHandle& H(IBackendHandle& h) { return static_cast<tQbtHandle&>(h); }

	static mstring MakeBoundary()
	{
		std::random_device rd;
		std::mt19937_64 gen(rd());
		uint64_t r = gen();
		return "----orcadl" + BytesToHexString((const uint8_t*) &r, sizeof(r));
	}

	static tBackendHandlePtr MakeHandle(tQbtCtx& ctx, cmstring& tag)
	{
		auto ret = make_unique<tQbtHandle>();
		ret->m_state = make_shared<tQbtHandleState>();
		ret->m_state->tag = tag;
		ret->m_state->visibleDeadline = ctx.m_clock.Now() + ctx.m_conf.visibilityTimeoutMs;
		return ret;
	}

	static void AddPart(mstring& body, cmstring& boundary, string_view name, string_view value,
			LPCSTR fileName = nullptr)
	{
		body += "--" + boundary + "\r\nContent-Disposition: form-data; name=\"" + mstring(name) + "\"";
		if (fileName)
			body += "; filename=\""s + fileName + "\"\r\nContent-Type: application/x-bittorrent";
		body += "\r\n\r\n";
		body += value;
		body += "\r\n";
	}

public:
	tBitTorrentAdapter(IHttpClient& http, IEventClock& clock, const tQbtConfig& conf)
	: m_ctx(make_shared<tQbtCtx>(http, clock, conf))
	{
	}

	EResourceKind GetKind() const override { return EResourceKind::BITTORRENT; }

	mstring GetStagingPath(cmstring& outputPath) const override
	{
		return outputPath + ".part";
	}

	void Start(const tStartParams &params, tStartReporter reporter) override
	{
		if (params.uris.size() != 1)
			return reporter(tBackendHandlePtr(), tTransferError::Unsupported("Exactly one torrent descriptor is needed"));
		auto& src = params.uris.front();
		if (!IsTorrentReference(src))
			return reporter(tBackendHandlePtr(), tTransferError::Unsupported("Not a torrent descriptor: " + src));

		auto tag = tagPrefix + params.jobId;
		auto savePath = GetStagingPath(params.outputPath);
		tHttpRequest req;
		req.url = m_ctx->Url("/api/v2/torrents/add");
		bool localFile = src.find("://") == stmiss && !startsWithNoCase(src, "magnet:")
				&& !(IsHexString(src) && (src.size() == 40 || src.size() == 64));
		if (localFile)
		{
			ifstream inp(src, ios::binary);
			stringstream data;
			if (!inp || !(data << inp.rdbuf()))
				return reporter(tBackendHandlePtr(), tTransferError::Permanent("Cannot read torrent file " + src));
			auto boundary = MakeBoundary();
			req.contentType = "multipart/form-data; boundary=" + boundary;
			AddPart(req.body, boundary, "torrents", data.str(), mstring(GetBaseName(src)).c_str());
			AddPart(req.body, boundary, "savepath", savePath);
			AddPart(req.body, boundary, "tags", tag);
			if (!m_ctx->m_conf.category.empty())
				AddPart(req.body, boundary, "category", m_ctx->m_conf.category);
			req.body += "--" + boundary + "--\r\n";
		}
		else
		{
			req.contentType = "application/x-www-form-urlencoded";
			req.body = FormEncode({{"urls", NormalizeTorrentSource(src)}, {"savepath", savePath},
				{"tags", tag}, {"category", m_ctx->m_conf.category}});
		}
		auto ctx = m_ctx;
		m_ctx->Request(move(req), [ctx, tag, reporter = move(reporter)](tHttpResponse&& resp)
		{
			if (resp.status == 0)
				return reporter(tBackendHandlePtr(), tTransferError::Unavailable("qBittorrent not reachable: " + resp.Describe()));
			if (resp.status == 415 || (resp.ok() && startsWithSz(trimBoth(string_view(resp.body)), "Fails")))
				return reporter(tBackendHandlePtr(), tTransferError::Permanent("qBittorrent rejected the torrent"));
			if (resp.status >= 500)
				return reporter(tBackendHandlePtr(), tTransferError::Unavailable("qBittorrent failure: " + resp.Describe()));
			if (!resp.ok())
				return reporter(tBackendHandlePtr(), tTransferError::Permanent("qBittorrent refused the request: " + resp.Describe()));
			USRDBG("Torrent added with tag " << tag);
			reporter(MakeHandle(*ctx, tag), tTransferError());
		});
	}

	tPollResult Poll(IBackendHandle &handle) override
	{
		auto st = H(handle).m_state;
		if (st->inFlight || st->cancelled || st->finished)
			return st->last;
		st->inFlight = true;
		auto ctx = m_ctx;
		weak_ptr<tQbtHandleState> wst(st);
		m_ctx->Info(st->tag, [wst, ctx](Json::Value list, mstring sErr)
		{
			auto st = wst.lock();
			if (!st || st->cancelled)
				return;
			st->inFlight = false;
			if (!sErr.empty())
			{
				if (ctx->m_clock.Now() > st->visibleDeadline)
				{
					st->last.kind = tPollResult::FAILED;
					st->last.error = tTransferError::Transient(sErr);
				}
				return;
			}
			if (list.empty())
			{
				if (ctx->m_clock.Now() > st->visibleDeadline)
				{
					st->last.kind = tPollResult::FAILED;
					st->last.error = tTransferError::Transient("Torrent " + st->tag + " not known to qBittorrent");
				}
				return;
			}
			// seen, the communication works, a later outage gets the same grace period
			st->visibleDeadline = ctx->m_clock.Now() + ctx->m_conf.visibilityTimeoutMs;
			const auto& t = list[0];
			st->hash = t["hash"].asString();
			if (!st->trackersAdded && !st->hash.empty() && !ctx->m_conf.trackers.empty())
			{
				st->trackersAdded = true;
				mstring urls;
				for (const auto& tr: ctx->m_conf.trackers)
					urls += (urls.empty() ? "" : "\n") + tr;
				ctx->Post("/api/v2/torrents/addTrackers", FormEncode({{"hash", st->hash}, {"urls", urls}}),
						[](tHttpResponse&& resp)
				{
					if (!resp.ok())
						USRDBG("Cannot add trackers: " << resp.Describe());
				});
			}
			st->last = MapQbtTorrent(t);
			if (st->last.kind == tPollResult::COMPLETED)
			{
				// the data is moved away, stop seeding from there
				st->finished = true;
				ctx->Delete(st->hash, false);
			}
			else if (st->last.kind != tPollResult::PROGRESS)
				st->finished = true;
		});
		return st->last;
	}

	void Cancel(IBackendHandle &handle, bool bDiscard) override
	{
		auto st = H(handle).m_state;
		if (st->cancelled)
			return;
		st->cancelled = true;
		bool alreadyGone = st->finished && st->last.kind == tPollResult::COMPLETED;
		st->last.kind = tPollResult::CANCELLED;
		if (alreadyGone)
			return;
		auto delFiles = bDiscard && m_ctx->m_conf.deleteFilesOnCancel;
		if (!st->hash.empty())
			return m_ctx->Delete(st->hash, delFiles);
		auto ctx = m_ctx;
		m_ctx->Info(st->tag, [ctx, delFiles](Json::Value list, mstring)
		{
			for (const auto& t: list)
				ctx->Delete(t["hash"].asString(), delFiles);
		});
	}

	void Reattach(const tStartParams &, cmstring &resumeToken, tStartReporter reporter) override
	{
		if (!startsWith(resumeToken, tagPrefix))
			return reporter(tBackendHandlePtr(), tTransferError::Transient("Bad resume token"));
		auto ctx = m_ctx;
		m_ctx->Info(resumeToken, [ctx, resumeToken, reporter = move(reporter)](Json::Value list, mstring sErr)
		{
			if (!sErr.empty())
				return reporter(tBackendHandlePtr(), tTransferError::Transient("Cannot reattach: " + sErr));
			if (list.empty())
				return reporter(tBackendHandlePtr(), tTransferError::Transient("Cannot reattach, torrent is gone"));
			auto state = list[0]["state"].asString();
			if (state == "error" || state == "missingFiles")
				return reporter(tBackendHandlePtr(), tTransferError::Transient("Cannot reattach, torrent state is " + state));
			reporter(MakeHandle(*ctx, resumeToken), tTransferError());
		});
	}
};

std::unique_ptr<IBackendAdapter> CreateBitTorrentAdapter(IHttpClient& http, IEventClock& clock, const tQbtConfig& conf)
{
	return std::make_unique<tBitTorrentAdapter>(http, clock, conf);
}

}
