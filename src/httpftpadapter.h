#ifndef HTTPFTPADAPTER_H
#define HTTPFTPADAPTER_H

#include "backend.h"

namespace Json
{
class Value;
}

namespace orca
{

class IHttpClient;

struct tAria2Config
{
	// JSON-RPC endpoint
	mstring rpcUrl;
	// value of --rpc-secret, empty if not used
	mstring secret;
	// connections per download
	int split = 8;
	// transport failures in a row which end a transfer
	unsigned maxPollFailures = 3;

	static tAria2Config FromCfg();
};

/**
 * Adapter for an aria2 daemon, controlled through its JSON-RPC interface.
 */
ORCA_API std::unique_ptr<IBackendAdapter> CreateHttpFtpAdapter(IHttpClient& http, const tAria2Config& conf);

/**
 * Translate the result of aria2.tellStatus into a poll result.
 * @param stagedPath reported with a completed download
 */
ORCA_API tPollResult MapAria2Status(const Json::Value& status, cmstring& stagedPath);

// failure class of an aria2 exit/error code
ORCA_API EErrorClass ClassifyAria2Error(int code);

}

#endif // HTTPFTPADAPTER_H
