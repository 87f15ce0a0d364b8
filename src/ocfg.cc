#include "ocfg.h"
#include "meta.h"
#include "debug.h"

#include <iostream>
#include <fstream>
#include <cmath>

using namespace std;

namespace orca
{

namespace cfg
{

mstring confdir(CFGDIR), logdir(LOGDIR), statedir(STATEDIR),
udspath(SOCKETDIR "/orcadl.sock"), bindaddr, pidfile,
geoipdb("/usr/share/GeoIP/GeoIPCity.dat"), localcountry, locallat, locallon, prefercountry,
mirrorpolicy("nearest"),
aria2rpc("http://127.0.0.1:6800/jsonrpc"), aria2secret,
qbturl("http://127.0.0.1:8080"), qbtuser, qbtpass, qbtcategory,
bttrackers("udp://tracker.opentrackr.org:1337/announce udp://open.tracker.cl:1337/announce"),
ffmpegpath("ffmpeg"), dnsresconf("/etc/resolv.conf");

int foreground(0), port(0), debug(0), httpslots(4), btslots(2), pollinterval(1000),
ckptinterval(30), retrymax(3), backoffbase(2000), backoffmax(60000), retention(3600),
geotimeout(3000), aria2split(8), ppthreads(2), pptimeout(0), minfreespace(0),
nettimeout(20), dnscachetime(1800), dirperms(00755), fileperms(00664), btdelcancel(0);

double localLatitude(0), localLongitude(0);
bool haveLocalPosition(false);

bool g_bQuiet(false);

struct MapNameToString
{
	const char *name; mstring *ptr;
	// not printed in dumps unless requested
	bool delicate;
};

struct MapNameToInt
{
	const char *name; int *ptr;
	const char *warn; uint8_t base;
};

MapNameToString n2sTbl[] = {
		{ "LogDir", &logdir, false },
		{ "StateDir", &statedir, false },
		{ "SocketPath", &udspath, false },
		{ "BindAddress", &bindaddr, false },
		{ "PidFile", &pidfile, false },
		{ "GeoIpDatabase", &geoipdb, false },
		{ "LocalCountry", &localcountry, false },
		{ "LocalLatitude", &locallat, false },
		{ "LocalLongitude", &locallon, false },
		{ "PreferCountry", &prefercountry, false },
		{ "MirrorPolicy", &mirrorpolicy, false },
		{ "Aria2Rpc", &aria2rpc, false },
		{ "Aria2Secret", &aria2secret, true },
		{ "QbtUrl", &qbturl, false },
		{ "QbtUser", &qbtuser, false },
		{ "QbtPassword", &qbtpass, true },
		{ "QbtCategory", &qbtcategory, false },
		{ "BtTrackers", &bttrackers, false },
		{ "FfmpegPath", &ffmpegpath, false },
		{ "DnsResolvConf", &dnsresconf, false },
};

MapNameToInt n2iTbl[] = {
		{ "ForeGround", &foreground, nullptr, 10 },
		{ "Port", &port, nullptr, 10 },
		{ "Debug", &debug, nullptr, 10 },
		{ "HttpSlots", &httpslots, nullptr, 10 },
		{ "TorrentSlots", &btslots, nullptr, 10 },
		{ "PollInterval", &pollinterval, nullptr, 10 },
		{ "CheckpointInterval", &ckptinterval, nullptr, 10 },
		{ "RetryMax", &retrymax, nullptr, 10 },
		{ "BackoffBase", &backoffbase, nullptr, 10 },
		{ "BackoffMax", &backoffmax, nullptr, 10 },
		{ "RetentionTime", &retention, nullptr, 10 },
		{ "GeoTimeout", &geotimeout, nullptr, 10 },
		{ "Aria2Split", &aria2split, nullptr, 10 },
		{ "PostProcThreads", &ppthreads, nullptr, 10 },
		{ "PostProcTimeout", &pptimeout, nullptr, 10 },
		{ "MinFreeSpace", &minfreespace, nullptr, 10 },
		{ "NetTimeout", &nettimeout, nullptr, 10 },
		{ "DnsCacheSeconds", &dnscachetime, nullptr, 10 },
		{ "DirPerms", &dirperms, nullptr, 8 },
		{ "FilePerms", &fileperms, nullptr, 8 },
		{ "BtDeleteOnCancel", &btdelcancel, nullptr, 10 },
		// legacy names from early setups
		{ "MaxActiveDownloads", &httpslots, "Option MaxActiveDownloads is deprecated, use HttpSlots", 10 },
};

mstring* GetStringPtr(string_view key)
{
	for(auto &ent : n2sTbl)
		if(equalsNoCase(key, ent.name))
			return ent.ptr;
	return nullptr;
}

int* GetIntPtr(string_view key, int &base)
{
	for(auto &ent : n2iTbl)
	{
		if(equalsNoCase(key, ent.name))
		{
			if(ent.warn && !g_bQuiet)
				cerr << "Warning, " << ent.warn << endl;
			base = ent.base;
			return ent.ptr;
		}
	}
	return nullptr;
}

int* GetIntPtr(string_view key)
{
	int dummy;
	return GetIntPtr(key, dummy);
}

// split "Key: value" or "Key=value", whichever separator comes first
bool ParseOptionLine(const string &sLine, string &key, string &val)
{
	auto pos = sLine.find_first_of(":=");
	if (pos == stmiss)
		return false;
	key = sLine.substr(0, pos);
	val = sLine.substr(pos + 1);
	trimBoth(key);
	trimBoth(val);
	return !key.empty();
}

bool SetOption(const mstring &sLine, bool bQuiet)
{
	string key, value;

	if(!ParseOptionLine(sLine, key, value))
		return false;

	if (auto ps = GetStringPtr(key))
	{
		*ps = value;
		return true;
	}

	int base(10);
	if (auto pi = GetIntPtr(key, base))
	{
		if(value.empty())
		{
			*pi = 0;
			return true;
		}
		// temporary for error checking
		char *pEnd(nullptr);
		errno = 0;
		long nVal = strtol(value.c_str(), &pEnd, base);
		if (errno || !pEnd || *pEnd || nVal > MAX_VAL(int) || nVal < MIN_VAL(int))
		{
			if (!bQuiet && !g_bQuiet)
				cerr << "Invalid number for " << key << ": " << value << endl;
			return false;
		}
		*pi = int(nVal);
		return true;
	}
	if (!bQuiet && !g_bQuiet)
		cerr << "Warning, unknown configuration directive: " << key << endl;
	return false;
}

void ReadOneConfFile(cmstring & szFilename, bool bReadErrorIsFatal)
{
	ifstream reader(szFilename);
	if (!reader.is_open())
	{
		if (bReadErrorIsFatal)
		{
			cerr << "Error opening file " << szFilename << ", terminating." << endl;
			exit(EXIT_FAILURE);
		}
		return;
	}
	mstring sLine;
	unsigned nLine = 0;
	while (getline(reader, sLine))
	{
		++nLine;
		trimBoth(sLine);
		if (sLine.empty() || sLine[0] == '#')
			continue;
		if (SetOption(sLine))
			continue;
		if (bReadErrorIsFatal)
		{
			cerr << "Error reading main options, terminating." << endl
					<< "Check line " << nLine << " of " << szFilename << endl;
			exit(EXIT_FAILURE);
		}
	}
}

void ReadConfigDirectory(const char *szPath, bool bReadErrorIsFatal)
{
	confdir = szPath;
	trimBack(confdir, SZPATHSEP);
	for(const auto& src: ExpandFilePattern(confdir + SZPATHSEP "*.conf", true))
		ReadOneConfFile(src, bReadErrorIsFatal);
}

mstring PostProcConfig()
{
	auto atLeast = [](int& val, int lim, LPCSTR name)
	{
		if (val >= lim)
			return;
		if (!g_bQuiet)
			cerr << "Warning, " << name << " raised to " << lim << endl;
		val = lim;
	};
	atLeast(httpslots, 1, "HttpSlots");
	atLeast(btslots, 1, "TorrentSlots");
	atLeast(pollinterval, 10, "PollInterval");
	atLeast(ckptinterval, 1, "CheckpointInterval");
	atLeast(retrymax, 0, "RetryMax");
	atLeast(backoffbase, 0, "BackoffBase");
	atLeast(backoffmax, backoffbase, "BackoffMax");
	atLeast(ppthreads, 1, "PostProcThreads");
	atLeast(aria2split, 1, "Aria2Split");
	atLeast(nettimeout, 1, "NetTimeout");

	if (!InRange(0, port, 65535))
		return "Invalid TCP port number";

	if (mirrorpolicy != "nearest" && mirrorpolicy != "declared")
		return "MirrorPolicy must be nearest or declared";

	tolower_inplace(localcountry);
	tolower_inplace(prefercountry);

	haveLocalPosition = false;
	if (!locallat.empty() || !locallon.empty())
	{
		bool okLat(false), okLon(false);
		localLatitude = atodbl(locallat, 0, &okLat);
		localLongitude = atodbl(locallon, 0, &okLon);
		if (!okLat || !okLon || fabs(localLatitude) > 90 || fabs(localLongitude) > 180)
			return "LocalLatitude/LocalLongitude must be valid coordinates in degrees";
		haveLocalPosition = true;
	}

	if (!statedir.empty())
		trimBack(statedir, SZPATHSEP);
	if (!logdir.empty())
		trimBack(logdir, SZPATHSEP);

	return se;
}

mstring GetCheckpointPath()
{
	if (statedir.empty())
		return se;
	return statedir + SZPATHSEP "jobs.ckpt.gz";
}

void dump_config(bool includeDelicate)
{
	ostream &cmine(cout);

	for (auto& n2s : n2sTbl)
	{
		if (n2s.ptr)
			cmine << n2s.name << " = " << ((n2s.delicate && !includeDelicate) ? mstring("#") : *n2s.ptr) << endl;
	}

	for (auto& n2i : n2iTbl)
	{
		if (!n2i.ptr || n2i.warn)
			continue;
		if (n2i.base == 8)
		{
			char buf[20];
			snprintf(buf, sizeof(buf), "0%o", *n2i.ptr);
			cmine << n2i.name << " = " << buf << endl;
		}
		else
			cmine << n2i.name << " = " << *n2i.ptr << endl;
	}
}

}

}
