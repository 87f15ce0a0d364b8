#ifndef MIRRORSEL_H
#define MIRRORSEL_H

#include "geoip.h"
#include "jobtypes.h"
#include "meta.h"

#include <vector>

namespace orca
{

class IEventClock;

enum class EMirrorPolicy
{
	PREFER_NEAREST,
	DECLARATION_ORDER
};

struct tMirrorPolicy
{
	EMirrorPolicy mode = EMirrorPolicy::PREFER_NEAREST;
	// candidates in this country rank first, if set
	mstring preferCountry;

	// "nearest" or "declared"
	static bool Parse(string_view name, EMirrorPolicy& ret);
	static tMirrorPolicy FromCfg();
};

struct tLocalPosition
{
	mstring countryCode;
	double latitude = 0, longitude = 0;
	bool hasCoordinates = false;

	static tLocalPosition FromCfg();
};

struct tMirrorCandidate
{
	mstring uri;
	// position in the declaration
	unsigned index = 0;
	bool resolved = false;
	tGeoLocation location;
	// km, negative if unknown
	double distance = -1;
};

// used for other countries when the database has no coordinates
#define FOREIGN_COUNTRY_PENALTY_KM 10000.0

ORCA_API double GreatCircleKm(double lat1, double lon1, double lat2, double lon2);
// network distance estimate of a resolved location, negative if not computable
ORCA_API double EstimateDistance(const tGeoLocation& where, const tLocalPosition& local);

/**
 * Order the candidates by policy, the input is not modified.
 * Preferred country first, then resolved before unresolved, then by distance, then by
 * declaration order.
 */
ORCA_API std::vector<tMirrorCandidate> RankMirrors(const std::vector<tMirrorCandidate>& candidates,
		const tMirrorPolicy& policy);

// the head of RankMirrors, nullptr for an empty list
ORCA_API const tMirrorCandidate* SelectMirror(const std::vector<tMirrorCandidate>& ranked);

// ordered source list, and the (absorbed) geolocation problem if there was one
using tMirrorReporter = std::function<void(tStrVec ordered, tTransferError geoError)>;

/**
 * Orders download sources by geographic distance.
 */
class ORCA_API IMirrorSelector
{
public:
	virtual ~IMirrorSelector() =default;
	/**
	 * The reporter is called exactly once, at latest after the configured deadline.
	 */
	virtual void Select(const tStrVec& uris, tMirrorReporter reporter) =0;

	/**
	 * @param hostRes Name resolution, may be nullptr when only numeric hosts are used
	 * @param geo Location database, declaration order is used without it
	 */
	static std::unique_ptr<IMirrorSelector> Create(IEventClock& clock, IHostResolver* hostRes,
			IGeoResolver* geo, const tMirrorPolicy& policy, const tLocalPosition& local, unsigned timeoutMs);
};

}

#endif // MIRRORSEL_H
