#include "jobtypes.h"
#include "meta.h"
#include "ahttpurl.h"

namespace orca
{

static const LPCSTR stateNames[] = { "Pending", "Resolving", "Active", "PostProcessing",
		"Completed", "Failed", "Cancelled" };
static const LPCSTR kindNames[] = { "Invalid", "HttpFtp", "BitTorrent" };

LPCSTR ToString(EJobState s)
{
	return stateNames[(unsigned) s];
}

LPCSTR ToString(EResourceKind k)
{
	return kindNames[(unsigned) k];
}

LPCSTR ToString(EErrorClass c)
{
	switch(c)
	{
	case EErrorClass::TRANSIENT: return "Transient";
	case EErrorClass::PERMANENT: return "Permanent";
	case EErrorClass::CANCELLED: return "Cancelled";
	}
	return "";
}

LPCSTR ToString(EErrorKind k)
{
	switch(k)
	{
	case EErrorKind::NONE: return "";
	case EErrorKind::UNSUPPORTED_RESOURCE: return "UnsupportedResourceError";
	case EErrorKind::RESOURCE_UNAVAILABLE: return "ResourceUnavailableError";
	case EErrorKind::TRANSIENT_TRANSFER: return "TransientTransferError";
	case EErrorKind::PERMANENT_TRANSFER: return "PermanentTransferError";
	case EErrorKind::POSTPROCESSING: return "PostProcessingError";
	case EErrorKind::GEO_RESOLUTION: return "GeoResolutionError";
	case EErrorKind::CANCELLATION_REQUESTED: return "CancellationRequested";
	}
	return "";
}

bool FromString(string_view s, EJobState& ret)
{
	for (unsigned i = 0; i < _countof(stateNames); ++i)
	{
		if (equalsNoCase(s, stateNames[i]))
		{
			ret = (EJobState) i;
			return true;
		}
	}
	return false;
}

bool FromString(string_view s, EResourceKind& ret)
{
	for (unsigned i = 1; i < _countof(kindNames); ++i)
	{
		if (equalsNoCase(s, kindNames[i]))
		{
			ret = (EResourceKind) i;
			return true;
		}
	}
	// short forms used on the command line
	if (equalsNoCase(s, "http") || equalsNoCase(s, "ftp"))
		return ret = EResourceKind::HTTP_FTP, true;
	if (equalsNoCase(s, "bt") || equalsNoCase(s, "torrent"))
		return ret = EResourceKind::BITTORRENT, true;
	return false;
}

mstring tTransferError::ToString() const
{
	if (!IsError())
		return se;
	return mstring(orca::ToString(kind)) + ": " + reason;
}

#define MKERR(name, k, c) tTransferError tTransferError::name(mstring reason) \
{ \
	tTransferError ret; \
	ret.kind = EErrorKind::k; \
	ret.errClass = EErrorClass::c; \
	ret.reason = reason.empty() ? "unknown error" : std::move(reason); \
	return ret; \
}

MKERR(Unsupported, UNSUPPORTED_RESOURCE, PERMANENT)
MKERR(Unavailable, RESOURCE_UNAVAILABLE, TRANSIENT)
MKERR(Transient, TRANSIENT_TRANSFER, TRANSIENT)
MKERR(Permanent, PERMANENT_TRANSFER, PERMANENT)
MKERR(PostProcessing, POSTPROCESSING, PERMANENT)
MKERR(Geo, GEO_RESOLUTION, TRANSIENT)
MKERR(Cancelled, CANCELLATION_REQUESTED, CANCELLED)

void tProgressSnapshot::CalcEta()
{
	if (total < 0 || rate <= 0)
		eta = -1;
	else if (done >= total)
		eta = 0;
	else
		eta = (total - done) / rate;
}

EResourceKind InferResourceKind(string_view uri)
{
	uri = trimBoth(uri);
	if (uri.empty())
		return EResourceKind::INVALID;
	if (startsWithNoCase(uri, "magnet:"sv))
		return EResourceKind::BITTORRENT;
	// torrent file, local or remote, query part ignored
	auto path = uri.substr(0, uri.find_first_of("?#"));
	if (endsWithNoCase(path, ".torrent"sv))
		return EResourceKind::BITTORRENT;
	if ((uri.size() == 40 || uri.size() == 64) && IsHexString(uri))
		return EResourceKind::BITTORRENT;
	if (uri.find("://") == stmiss)
		return EResourceKind::INVALID;
	tHttpUrl url;
	if (url.SetHttpUrl(uri, false))
		return EResourceKind::HTTP_FTP;
	return EResourceKind::INVALID;
}

bool IsTorrentReference(string_view uri)
{
	uri = trimBoth(uri);
	if (uri.empty())
		return false;
	if (InferResourceKind(uri) == EResourceKind::BITTORRENT)
		return true;
	// a local file of any name
	if (uri.find("://") == stmiss)
		return true;
	tHttpUrl url;
	return url.SetHttpUrl(uri, false) && !url.sHost.empty()
			&& (url.m_schema == tHttpUrl::EProtoType::HTTP || url.m_schema == tHttpUrl::EProtoType::HTTPS);
}

}
