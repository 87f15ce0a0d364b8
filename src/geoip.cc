#include "geoip.h"
#include "caddrinfo.h"
#include "debug.h"

#ifdef HAVE_GEOIP
#include <GeoIP.h>
#include <GeoIPCity.h>
#endif

using namespace std;

namespace orca
{

#ifdef HAVE_GEOIP

using unique_geoip = auto_raii<GeoIP*, GeoIP_delete, nullptr>;

class tGeoIpDb : public IGeoResolver
{
	unique_geoip m_db;
	bool m_bCity, m_bV6;
public:
	tGeoIpDb(GeoIP* db) : m_db(db)
	{
		auto ed = GeoIP_database_edition(db);
		m_bCity = ed == GEOIP_CITY_EDITION_REV0 || ed == GEOIP_CITY_EDITION_REV1
				|| ed == GEOIP_CITY_EDITION_REV0_V6 || ed == GEOIP_CITY_EDITION_REV1_V6;
		m_bV6 = ed == GEOIP_COUNTRY_EDITION_V6 || ed == GEOIP_CITY_EDITION_REV0_V6
				|| ed == GEOIP_CITY_EDITION_REV1_V6;
		USRDBG("GeoIP database: " << (GeoIP_database_info(db) ? GeoIP_database_info(db) : "unknown"));
	}

	bool Lookup(cmstring& ip, tGeoLocation& ret) override
	{
		bool isV6 = ip.find(':') != stmiss;
		if (isV6 != m_bV6)
			return false;
		if (m_bCity)
		{
			auto rec = isV6 ? GeoIP_record_by_addr_v6(m_db.get(), ip.c_str())
					: GeoIP_record_by_addr(m_db.get(), ip.c_str());
			if (!rec)
				return false;
			ret.countryCode = rec->country_code ? rec->country_code : "";
			ret.region = rec->region ? rec->region : "";
			ret.latitude = rec->latitude;
			ret.longitude = rec->longitude;
			ret.hasCoordinates = true;
			GeoIPRecord_delete(rec);
			return true;
		}
		auto cc = isV6 ? GeoIP_country_code_by_addr_v6(m_db.get(), ip.c_str())
				: GeoIP_country_code_by_addr(m_db.get(), ip.c_str());
		if (!cc)
			return false;
		ret.countryCode = cc;
		ret.hasCoordinates = false;
		return true;
	}
};

std::unique_ptr<IGeoResolver> IGeoResolver::Open(cmstring& dbPath, mstring& sErr)
{
	if (dbPath.empty())
	{
		sErr = "No GeoIP database configured";
		return nullptr;
	}
	auto db = GeoIP_open(dbPath.c_str(), GEOIP_MEMORY_CACHE | GEOIP_SILENCE);
	if (!db)
	{
		sErr = "Cannot open GeoIP database " + dbPath;
		return nullptr;
	}
	return std::make_unique<tGeoIpDb>(db);
}

#else

std::unique_ptr<IGeoResolver> IGeoResolver::Open(cmstring&, mstring& sErr)
{
	sErr = "Built without GeoIP support";
	return nullptr;
}

#endif

class tAresHostResolver : public IHostResolver
{
public:
	void Resolve(cmstring& host, tReporter reporter) override
	{
		CAddrInfo::Resolve(host, se, [reporter = move(reporter)](CAddrInfoPtr res)
		{
			if (!res)
				return reporter({}, "DNS error");
			if (res->HasError() || res->getAddrs().empty())
				return reporter({}, res->HasError() ? res->getError() : "No address"s);
			std::vector<mstring> ips;
			for (const auto& a: res->getAddrs())
				ips.emplace_back(a.formatIp());
			reporter(move(ips), se);
		});
	}
};

std::unique_ptr<IHostResolver> IHostResolver::Create()
{
	return std::make_unique<tAresHostResolver>();
}

}
