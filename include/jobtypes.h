#ifndef JOBTYPES_H_
#define JOBTYPES_H_

#include "octypes.h"

#include <vector>
#include <cstdint>
#include <ctime>

namespace orca
{

using tJobId = mstring;

enum class EJobState : uint8_t
{
	PENDING,
	RESOLVING,
	ACTIVE,
	POSTPROCESSING,
	COMPLETED,
	FAILED,
	CANCELLED
};

enum class EResourceKind : uint8_t
{
	INVALID,
	HTTP_FTP,
	BITTORRENT
};

enum class EErrorClass : uint8_t
{
	TRANSIENT,
	PERMANENT,
	CANCELLED
};

enum class EErrorKind : uint8_t
{
	NONE,
	UNSUPPORTED_RESOURCE,
	RESOURCE_UNAVAILABLE,
	TRANSIENT_TRANSFER,
	PERMANENT_TRANSFER,
	POSTPROCESSING,
	GEO_RESOLUTION,
	CANCELLATION_REQUESTED
};

ORCA_API LPCSTR ToString(EJobState);
ORCA_API LPCSTR ToString(EResourceKind);
ORCA_API LPCSTR ToString(EErrorClass);
ORCA_API LPCSTR ToString(EErrorKind);
ORCA_API bool FromString(string_view, EJobState&);
ORCA_API bool FromString(string_view, EResourceKind&);

inline bool IsTerminal(EJobState s)
{
	return s == EJobState::COMPLETED || s == EJobState::FAILED || s == EJobState::CANCELLED;
}

/**
 * Classified failure, the reason is never empty for a real error.
 */
struct ORCA_API tTransferError
{
	EErrorKind kind = EErrorKind::NONE;
	EErrorClass errClass = EErrorClass::PERMANENT;
	mstring reason;

	bool IsError() const { return kind != EErrorKind::NONE; }
	bool IsTransient() const { return IsError() && errClass == EErrorClass::TRANSIENT; }
	// like "TransientTransferError: connection refused"
	mstring ToString() const;

	static tTransferError Unsupported(mstring reason);
	static tTransferError Unavailable(mstring reason);
	static tTransferError Transient(mstring reason);
	static tTransferError Permanent(mstring reason);
	static tTransferError PostProcessing(mstring reason);
	static tTransferError Geo(mstring reason);
	static tTransferError Cancelled(mstring reason = "Cancelled by request");
};

struct ORCA_API tProgressSnapshot
{
	off_t done = 0;
	// -1 if unknown
	off_t total = -1;
	// bytes per second
	off_t rate = 0;
	// seconds, -1 if unknown
	int64_t eta = -1;

	// derive the ETA from the other fields
	void CalcEta();
	bool operator==(const tProgressSnapshot& o) const
	{
		return done == o.done && total == o.total && rate == o.rate && eta == o.eta;
	}
};

struct tPostProcessResult
{
	bool ok = false;
	mstring finalPath;
	mstring message;
};

struct tSubmitRequest
{
	std::vector<mstring> uris;
	EResourceKind kindHint = EResourceKind::INVALID;
	mstring outputPath;
	// container extension, empty for none
	mstring format;
	// "sha256:<hex>" or just hex, empty for none
	mstring checksum;
	int priority = 0;
};

/**
 * Public view on one job, a copy of the scheduler's state.
 */
struct tJobInfo
{
	tJobId id;
	EJobState state = EJobState::PENDING;
	EResourceKind kind = EResourceKind::INVALID;
	int priority = 0;
	unsigned retries = 0;
	time_t created = 0;
	tProgressSnapshot progress;
	tTransferError error;
	mstring outputPath, finalPath, stagedPath;
	std::vector<mstring> uris;
};

/**
 * Persisted form of a non-terminal job.
 */
struct tJobRecord
{
	tJobId id;
	EJobState state = EJobState::PENDING;
	EResourceKind kind = EResourceKind::INVALID;
	int priority = 0;
	uint64_t seq = 0;
	unsigned retries = 0;
	time_t created = 0;
	mstring outputPath, format, checksum, resumeToken, stagedPath;
	std::vector<mstring> uris;
};

/**
 * Kind of the download source by its shape: magnet links, torrent files and bare
 * info-hashes are for BitTorrent, http/https/ftp/sftp URLs for HTTP/FTP.
 */
ORCA_API EResourceKind InferResourceKind(string_view uri);

/**
 * Whether qBittorrent can take the source as a torrent: magnet links, bare info-hashes,
 * local torrent files and http/https links to torrent files, with or without the suffix.
 */
ORCA_API bool IsTorrentReference(string_view uri);

}

#endif /* JOBTYPES_H_ */
