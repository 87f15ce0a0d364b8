#include "main.h"
#include "testcommon.h"

#include "mirrorsel.h"

#include "gmock/gmock.h"

static tGeoLocation geoAt(LPCSTR cc, double lat, double lon)
{
	tGeoLocation ret;
	ret.countryCode = cc;
	ret.latitude = lat;
	ret.longitude = lon;
	ret.hasCoordinates = true;
	return ret;
}

static tMirrorCandidate cand(LPCSTR uri, unsigned idx, double dist, LPCSTR cc = "")
{
	tMirrorCandidate ret;
	ret.uri = uri;
	ret.index = idx;
	ret.distance = dist;
	ret.resolved = dist >= 0 || *cc;
	ret.location.countryCode = cc;
	return ret;
}

static std::vector<mstring> uris(const std::vector<tMirrorCandidate>& v)
{
	std::vector<mstring> ret;
	for (const auto& c: v)
		ret.emplace_back(c.uri);
	return ret;
}

TEST(mirrorsel, distances)
{
	// Berlin to Paris, roughly 880 km
	auto d = GreatCircleKm(52.52, 13.405, 48.857, 2.352);
	EXPECT_NEAR(878, d, 10);
	EXPECT_NEAR(0, GreatCircleKm(10, 10, 10, 10), 1e-9);

	tLocalPosition local;
	local.countryCode = "de";
	tGeoLocation there;
	there.countryCode = "DE";
	EXPECT_EQ(0, EstimateDistance(there, local));
	there.countryCode = "FR";
	EXPECT_EQ(FOREIGN_COUNTRY_PENALTY_KM, EstimateDistance(there, local));
	there.countryCode.clear();
	EXPECT_LT(EstimateDistance(there, local), 0);

	local.hasCoordinates = true;
	local.latitude = 52.52;
	local.longitude = 13.405;
	EXPECT_NEAR(878, EstimateDistance(geoAt("FR", 48.857, 2.352), local), 10);
}

TEST(mirrorsel, ranking)
{
	std::vector<tMirrorCandidate> in {
		cand("http://a/", 0, -1),
		cand("http://b/", 1, 900, "FR"),
		cand("http://c/", 2, 300, "DE"),
		cand("http://d/", 3, 300, "PL")
	};
	tMirrorPolicy pol;
	EXPECT_EQ(std::vector<mstring>({"http://c/", "http://d/", "http://b/", "http://a/"}),
			uris(RankMirrors(in, pol)));
	// input untouched
	EXPECT_EQ("http://a/", in[0].uri);

	pol.preferCountry = "fr";
	EXPECT_EQ(std::vector<mstring>({"http://b/", "http://c/", "http://d/", "http://a/"}),
			uris(RankMirrors(in, pol)));

	pol.mode = EMirrorPolicy::DECLARATION_ORDER;
	pol.preferCountry.clear();
	auto ranked = RankMirrors(in, pol);
	EXPECT_EQ(std::vector<mstring>({"http://a/", "http://b/", "http://c/", "http://d/"}), uris(ranked));
	ASSERT_TRUE(SelectMirror(ranked));
	EXPECT_EQ("http://a/", SelectMirror(ranked)->uri);
	EXPECT_EQ(nullptr, SelectMirror({}));

	EMirrorPolicy mode;
	EXPECT_TRUE(tMirrorPolicy::Parse(" Nearest ", mode));
	EXPECT_EQ(EMirrorPolicy::PREFER_NEAREST, mode);
	EXPECT_TRUE(tMirrorPolicy::Parse("declared", mode));
	EXPECT_EQ(EMirrorPolicy::DECLARATION_ORDER, mode);
	EXPECT_FALSE(tMirrorPolicy::Parse("fastest", mode));
}

class mirrorseltest : public testing::Test
{
protected:
	tVirtualClock clock;
	tFakeGeo geo;
	tFakeHostResolver hostRes;
	tLocalPosition local;
	tMirrorPolicy policy;
	std::unique_ptr<IMirrorSelector> sel;

	tStrVec result;
	tTransferError geoErr;
	int reports = 0;

	void SetUp() override
	{
		local.hasCoordinates = true;
		local.latitude = 52.52;
		local.longitude = 13.405;
		geo.db["192.0.2.1"] = geoAt("US", 40.7, -74.0);
		geo.db["192.0.2.2"] = geoAt("DE", 50.1, 8.7);
		geo.db["192.0.2.3"] = geoAt("JP", 35.7, 139.7);
		hostRes.hosts["us.mirror.test"] = { "192.0.2.1" };
		hostRes.hosts["de.mirror.test"] = { "192.0.2.2" };
		hostRes.hosts["jp.mirror.test"] = { "192.0.2.3" };
	}

	void Make(IGeoResolver* pGeo, unsigned timeout = 500)
	{
		sel = IMirrorSelector::Create(clock, &hostRes, pGeo, policy, local, timeout);
	}

	void Run(const tStrVec& in)
	{
		sel->Select(in, [this](tStrVec ordered, tTransferError err)
		{
			reports++;
			result = std::move(ordered);
			geoErr = std::move(err);
		});
	}
};

TEST_F(mirrorseltest, nearest_first)
{
	Make(&geo);
	Run({"http://us.mirror.test/f.iso", "http://jp.mirror.test/f.iso", "ftp://de.mirror.test/f.iso"});
	ASSERT_EQ(1, reports);
	EXPECT_FALSE(geoErr.IsError());
	EXPECT_EQ(tStrVec({"ftp://de.mirror.test/f.iso", "http://us.mirror.test/f.iso", "http://jp.mirror.test/f.iso"}), result);
	// nothing left behind
	clock.Advance(1000);
	EXPECT_EQ(1, reports);
}

TEST_F(mirrorseltest, numeric_hosts_and_unknowns)
{
	Make(&geo);
	Run({"http://unknown.mirror.test/x", "http://192.0.2.3/x", "http://192.0.2.2:8080/x"});
	ASSERT_EQ(1, reports);
	EXPECT_FALSE(geoErr.IsError());
	EXPECT_EQ(tStrVec({"http://192.0.2.2:8080/x", "http://192.0.2.3/x", "http://unknown.mirror.test/x"}), result);
}

TEST_F(mirrorseltest, all_addresses_considered)
{
	// the database knows only the second address family
	hostRes.hosts["dual.mirror.test"] = { "2001:db8::2", "192.0.2.2" };
	hostRes.hosts["v6only.mirror.test"] = { "2001:db8::3" };
	Make(&geo);
	Run({"http://us.mirror.test/x", "http://v6only.mirror.test/x", "http://dual.mirror.test/x"});
	ASSERT_EQ(1, reports);
	EXPECT_FALSE(geoErr.IsError());
	EXPECT_EQ(tStrVec({"http://dual.mirror.test/x", "http://us.mirror.test/x", "http://v6only.mirror.test/x"}), result);
}

TEST_F(mirrorseltest, timeout_falls_back)
{
	Make(&geo, 500);
	hostRes.hold = true;
	Run({"http://jp.mirror.test/a", "http://de.mirror.test/a"});
	EXPECT_EQ(0, reports);
	clock.Advance(499);
	EXPECT_EQ(0, reports);
	clock.Advance(1);
	ASSERT_EQ(1, reports);
	EXPECT_EQ(EErrorKind::GEO_RESOLUTION, geoErr.kind);
	EXPECT_EQ("GeoIP resolution timeout", geoErr.reason);
	EXPECT_EQ(tStrVec({"http://jp.mirror.test/a", "http://de.mirror.test/a"}), result);
	// late answers are ignored
	hostRes.Flush();
	EXPECT_EQ(1, reports);
}

TEST_F(mirrorseltest, late_but_complete)
{
	Make(&geo, 500);
	hostRes.hold = true;
	Run({"http://jp.mirror.test/a", "http://de.mirror.test/a"});
	clock.Advance(100);
	hostRes.Flush();
	ASSERT_EQ(1, reports);
	EXPECT_FALSE(geoErr.IsError());
	EXPECT_EQ(tStrVec({"http://de.mirror.test/a", "http://jp.mirror.test/a"}), result);
	EXPECT_EQ(0u, clock.TimerCount());
}

TEST_F(mirrorseltest, without_database)
{
	Make(nullptr);
	Run({"http://jp.mirror.test/a", "http://de.mirror.test/a"});
	ASSERT_EQ(1, reports);
	EXPECT_EQ(EErrorKind::GEO_RESOLUTION, geoErr.kind);
	EXPECT_EQ(tStrVec({"http://jp.mirror.test/a", "http://de.mirror.test/a"}), result);
}

TEST_F(mirrorseltest, unresolvable_hosts)
{
	Make(&geo);
	Run({"http://nowhere.test/a", "http://void.test/a"});
	ASSERT_EQ(1, reports);
	EXPECT_EQ(EErrorKind::GEO_RESOLUTION, geoErr.kind);
	EXPECT_THAT(geoErr.reason, testing::StartsWith("Cannot resolve mirror host"));
	EXPECT_EQ(tStrVec({"http://nowhere.test/a", "http://void.test/a"}), result);
}

TEST_F(mirrorseltest, single_source_shortcut)
{
	Make(&geo);
	Run({"http://jp.mirror.test/a"});
	ASSERT_EQ(1, reports);
	EXPECT_FALSE(geoErr.IsError());
	EXPECT_EQ(0u, hostRes.held.size());
}
