#ifndef GEOIP_H
#define GEOIP_H

#include "octypes.h"

#include <memory>
#include <functional>
#include <vector>

namespace orca
{

struct tGeoLocation
{
	// ISO 3166 code, upper case
	mstring countryCode;
	mstring region;
	double latitude = 0, longitude = 0;
	// false with country-only databases
	bool hasCoordinates = false;
};

/**
 * Address to location lookup.
 */
class ORCA_API IGeoResolver
{
public:
	virtual ~IGeoResolver() =default;
	// numeric IPv4 or IPv6 address; false if the database has no data for it
	virtual bool Lookup(cmstring& ipAddress, tGeoLocation& ret) =0;

	/**
	 * Open a legacy GeoIP database (city or country edition).
	 * @return nullptr with a description in sErr if not available
	 */
	static std::unique_ptr<IGeoResolver> Open(cmstring& dbPath, mstring& sErr);
};

/**
 * Host name to numeric address, asynchronous.
 */
class ORCA_API IHostResolver
{
public:
	// all addresses in resolver order, or none with error text
	using tReporter = std::function<void(std::vector<mstring> ips, mstring sErr)>;
	virtual ~IHostResolver() =default;
	virtual void Resolve(cmstring& host, tReporter reporter) =0;

	// based on CAddrInfo
	static std::unique_ptr<IHostResolver> Create();
};

}

#endif // GEOIP_H
