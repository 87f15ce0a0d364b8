#include "mirrorsel.h"
#include "oclock.h"
#include "ahttpurl.h"
#include "ocfg.h"
#include "debug.h"

#include <algorithm>
#include <cmath>

#include <arpa/inet.h>

using namespace std;

namespace orca
{

bool tMirrorPolicy::Parse(string_view name, EMirrorPolicy& ret)
{
	name = trimBoth(name);
	if (equalsNoCase(name, "nearest"))
		return ret = EMirrorPolicy::PREFER_NEAREST, true;
	if (equalsNoCase(name, "declared") || equalsNoCase(name, "order"))
		return ret = EMirrorPolicy::DECLARATION_ORDER, true;
	return false;
}

tMirrorPolicy tMirrorPolicy::FromCfg()
{
	tMirrorPolicy ret;
	Parse(cfg::mirrorpolicy, ret.mode);
	ret.preferCountry = cfg::prefercountry;
	return ret;
}

tLocalPosition tLocalPosition::FromCfg()
{
	tLocalPosition ret;
	ret.countryCode = cfg::localcountry;
	ret.hasCoordinates = cfg::haveLocalPosition;
	ret.latitude = cfg::localLatitude;
	ret.longitude = cfg::localLongitude;
	return ret;
}

double GreatCircleKm(double lat1, double lon1, double lat2, double lon2)
{
	constexpr double earthRadius = 6371.0;
	constexpr double toRad = M_PI / 180.0;
	auto dLat = (lat2 - lat1) * toRad;
	auto dLon = (lon2 - lon1) * toRad;
	auto a = sin(dLat / 2) * sin(dLat / 2)
			+ cos(lat1 * toRad) * cos(lat2 * toRad) * sin(dLon / 2) * sin(dLon / 2);
	return 2 * earthRadius * atan2(sqrt(a), sqrt(1 - a));
}

double EstimateDistance(const tGeoLocation& where, const tLocalPosition& local)
{
	if (where.hasCoordinates && local.hasCoordinates)
		return GreatCircleKm(local.latitude, local.longitude, where.latitude, where.longitude);
	if (local.countryCode.empty() || where.countryCode.empty())
		return -1;
	return equalsNoCase(local.countryCode, where.countryCode) ? 0 : FOREIGN_COUNTRY_PENALTY_KM;
}

std::vector<tMirrorCandidate> RankMirrors(const std::vector<tMirrorCandidate>& candidates,
		const tMirrorPolicy& policy)
{
	auto ret(candidates);
	auto inPreferred = [&](const tMirrorCandidate& c)
	{
		return !policy.preferCountry.empty() && c.resolved
				&& equalsNoCase(c.location.countryCode, policy.preferCountry);
	};
	stable_sort(ret.begin(), ret.end(), [&](const tMirrorCandidate& a, const tMirrorCandidate& b)
	{
		bool pa = inPreferred(a), pb = inPreferred(b);
		if (pa != pb)
			return pa;
		if (policy.mode == EMirrorPolicy::PREFER_NEAREST)
		{
			bool ka = a.resolved && a.distance >= 0, kb = b.resolved && b.distance >= 0;
			if (ka != kb)
				return ka;
			if (ka && a.distance != b.distance)
				return a.distance < b.distance;
		}
		return a.index < b.index;
	});
	return ret;
}

const tMirrorCandidate* SelectMirror(const std::vector<tMirrorCandidate>& ranked)
{
	return ranked.empty() ? nullptr : &ranked.front();
}

static bool IsNumericAddress(cmstring& host)
{
	uint8_t buf[sizeof(struct in6_addr)];
	return inet_pton(AF_INET, host.c_str(), buf) == 1 || inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

struct tSelectCtx
{
	std::vector<tMirrorCandidate> candidates;
	tMirrorReporter reporter;
	unsigned pending = 0;
	// geolocation was requested, not skipped by policy
	bool locating = false;
	bool done = false;
	TFinalAction deadline;
	mstring lastError;
};

class tMirrorSelector : public IMirrorSelector
{
	IEventClock& m_clock;
	IHostResolver* m_hostRes;
	IGeoResolver* m_geo;
	tMirrorPolicy m_policy;
	tLocalPosition m_local;
	unsigned m_timeout;

	// first address with a known location wins, the database covers one family only
	void Locate(tMirrorCandidate& cand, const tStrVec& ips)
	{
		for (const auto& ip: ips)
		{
			cand.resolved = m_geo->Lookup(ip, cand.location);
			if (cand.resolved)
				break;
		}
		if (cand.resolved)
		{
			cand.distance = EstimateDistance(cand.location, m_local);
			ldbg("Mirror " << cand.uri << " at " << cand.location.countryCode << ", " << cand.distance << " km");
		}
	}

	void Finish(std::shared_ptr<tSelectCtx> ctx)
	{
		if (ctx->done)
			return;
		ctx->done = true;
		ctx->deadline.reset();
		auto ranked = RankMirrors(ctx->candidates, m_policy);
		tTransferError geoErr;
		if (ctx->locating && none_of(ranked.begin(), ranked.end(), [](const tMirrorCandidate& c) { return c.resolved; }))
		{
			geoErr = tTransferError::Geo(ctx->lastError.empty() ? "No mirror location known"s : ctx->lastError);
			USRDBG("Mirror selection falls back to declaration order, " << geoErr.reason);
		}
		tStrVec ordered;
		for (const auto& c: ranked)
			ordered.emplace_back(c.uri);
		auto rep = move(ctx->reporter);
		rep(move(ordered), move(geoErr));
	}

public:
	tMirrorSelector(IEventClock& clock, IHostResolver* hostRes, IGeoResolver* geo,
			const tMirrorPolicy& policy, const tLocalPosition& local, unsigned timeoutMs)
	: m_clock(clock), m_hostRes(hostRes), m_geo(geo), m_policy(policy), m_local(local), m_timeout(timeoutMs)
	{
	}

	void Select(const tStrVec& uris, tMirrorReporter reporter) override
	{
		auto ctx = make_shared<tSelectCtx>();
		ctx->reporter = move(reporter);
		for (unsigned i = 0; i < uris.size(); ++i)
			ctx->candidates.push_back({uris[i], i});

		if (uris.size() < 2 || (m_policy.mode == EMirrorPolicy::DECLARATION_ORDER && m_policy.preferCountry.empty()))
			return Finish(ctx);
		ctx->locating = true;
		if (!m_geo)
		{
			ctx->lastError = "No GeoIP database";
			return Finish(ctx);
		}

		// held until all lookups are started, resolvers may report synchronously
		ctx->pending = 1;
		for (auto& cand: ctx->candidates)
		{
			tHttpUrl url;
			if (!url.SetHttpUrl(cand.uri, false))
				continue;
			if (IsNumericAddress(url.sHost))
			{
				Locate(cand, { url.sHost });
				continue;
			}
			if (!m_hostRes)
				continue;
			ctx->pending++;
			auto idx = cand.index;
			m_hostRes->Resolve(url.sHost, [this, ctx, idx](tStrVec ips, mstring sErr)
			{
				if (ctx->done)
					return;
				if (ips.empty())
					ctx->lastError = "Cannot resolve mirror host: " + sErr;
				else
					Locate(ctx->candidates[idx], ips);
				if (--ctx->pending == 0)
					Finish(ctx);
			});
		}
		if (--ctx->pending == 0)
			return Finish(ctx);
		weak_ptr<tSelectCtx> wctx(ctx);
		ctx->deadline = m_clock.RunAfter(m_timeout, [this, wctx]()
		{
			auto ctx = wctx.lock();
			if (!ctx)
				return;
			ctx->lastError = "GeoIP resolution timeout";
			Finish(ctx);
		});
	}
};

std::unique_ptr<IMirrorSelector> IMirrorSelector::Create(IEventClock& clock, IHostResolver* hostRes,
		IGeoResolver* geo, const tMirrorPolicy& policy, const tLocalPosition& local, unsigned timeoutMs)
{
	return std::make_unique<tMirrorSelector>(clock, hostRes, geo, policy, local, timeoutMs);
}

}
