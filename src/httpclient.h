#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include "meta.h"

#include <functional>
#include <memory>
#include <vector>

namespace Json
{
class Value;
}

namespace orca
{

// compact serialization
ORCA_API mstring WriteJson(const Json::Value&);
// false with a description in sErr if the document is malformed
ORCA_API bool ParseJson(string_view doc, Json::Value& ret, mstring& sErr);

struct tHttpRequest
{
	enum class EMethod
	{
		GET,
		POST
	} method = EMethod::POST;
	// absolute URL including the query part
	mstring url;
	mstring contentType;
	mstring body;
	std::vector<tStrPair> headers;
};

struct tHttpResponse
{
	// 0 for transport failures
	int status = 0;
	mstring body;
	// transport failure description
	mstring error;
	std::vector<tStrPair> headers;

	bool ok() const { return status >= 200 && status < 300; }
	// first header with that name, case-insensitive, or empty string
	mstring GetHeader(string_view name) const;
	// the error or the status line, for diagnostics
	mstring Describe() const;
};

using tHttpReporter = std::function<void(tHttpResponse&&)>;

/**
 * Minimal asynchronous HTTP client for the backend control endpoints.
 */
class ORCA_API IHttpClient
{
public:
	virtual ~IHttpClient() =default;
	/**
	 * Send the request, the reporter is called exactly once on the event thread.
	 */
	virtual void Send(tHttpRequest&& req, tHttpReporter reporter) =0;

	// evhttp based implementation, with name resolution through CAddrInfo
	static std::unique_ptr<IHttpClient> Create();
};

}

#endif // HTTPCLIENT_H
