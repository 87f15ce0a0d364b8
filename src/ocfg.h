#ifndef OCFG_H_
#define OCFG_H_

#include "octypes.h"

namespace orca
{

namespace cfg
{

extern ORCA_API mstring confdir, logdir, statedir, udspath, bindaddr, pidfile,
geoipdb, localcountry, locallat, locallon, prefercountry, mirrorpolicy,
aria2rpc, aria2secret, qbturl, qbtuser, qbtpass, qbtcategory, bttrackers,
ffmpegpath, dnsresconf;

extern ORCA_API int foreground, port, debug, httpslots, btslots, pollinterval,
ckptinterval, retrymax, backoffbase, backoffmax, retention, geotimeout,
aria2split, ppthreads, pptimeout, minfreespace, nettimeout, dnscachetime,
dirperms, fileperms, btdelcancel;

// derived in PostProcConfig
extern ORCA_API double localLatitude, localLongitude;
extern ORCA_API bool haveLocalPosition;

// suppress warnings about unknown options, for tools
extern ORCA_API bool g_bQuiet;

/**
 * Apply one "Key: value" or "Key=value" assignment.
 * @return false if the key is unknown or the value is invalid
 */
ORCA_API bool SetOption(const mstring &line, bool bQuiet = false);

/**
 * Read all *.conf files from the directory, in alphabetical order.
 */
ORCA_API void ReadConfigDirectory(const char*, bool bReadErrorIsFatal = true);

/**
 * Validate and normalize the values and compute derived settings.
 * @return Empty string or a description of the fatal problem
 */
ORCA_API mstring PostProcConfig();

ORCA_API void dump_config(bool includeDelicate);

ORCA_API mstring* GetStringPtr(string_view key);
ORCA_API int* GetIntPtr(string_view key);

ORCA_API mstring GetCheckpointPath();

}

}

#endif /*OCFG_H_*/
