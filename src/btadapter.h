#ifndef BTADAPTER_H
#define BTADAPTER_H

#include "backend.h"
#include "meta.h"

namespace Json
{
class Value;
}

namespace orca
{

class IHttpClient;
class IEventClock;

struct tQbtConfig
{
	// base URL of the web UI, like http://127.0.0.1:8080
	mstring url;
	// no login if empty (local authentication bypass)
	mstring user, password;
	mstring category;
	// added to every torrent
	tStrVec trackers;
	bool deleteFilesOnCancel = false;
	// how long a freshly added torrent may stay invisible
	unsigned visibilityTimeoutMs = 20000;

	static tQbtConfig FromCfg();
};

/**
 * Adapter for qBittorrent, controlled through the Web API v2. Each job's torrent
 * is tagged with orcadl-<jobid>, the tag is the resume token.
 */
ORCA_API std::unique_ptr<IBackendAdapter> CreateBitTorrentAdapter(IHttpClient& http, IEventClock& clock, const tQbtConfig& conf);

/**
 * Translate one element of torrents/info into a poll result.
 */
ORCA_API tPollResult MapQbtTorrent(const Json::Value& torrent);

// magnet link for a bare info-hash, other descriptors are returned unchanged
ORCA_API mstring NormalizeTorrentSource(string_view src);

}

#endif // BTADAPTER_H
