#include "httpclient.h"
#include "ahttpurl.h"
#include "caddrinfo.h"
#include "evabase.h"
#include "ocfg.h"
#include "debug.h"

#include <event2/http.h>
#include <event2/buffer.h>
#include <event2/keyvalq_struct.h>
#include <event2/bufferevent.h>
#include <event2/bufferevent_ssl.h>

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <json/json.h>

using namespace std;

namespace orca
{

static const mstring pfxSslError("SSL error: ");

mstring WriteJson(const Json::Value& v)
{
	Json::StreamWriterBuilder writerBuilder;
	writerBuilder["indentation"] = "";
	return Json::writeString(writerBuilder, v);
}

bool ParseJson(string_view doc, Json::Value& ret, mstring& sErr)
{
	Json::CharReaderBuilder readerBuilder;
	std::unique_ptr<Json::CharReader> reader(readerBuilder.newCharReader());
	if (doc.empty())
	{
		sErr = "Empty document";
		return false;
	}
	return reader->parse(doc.data(), doc.data() + doc.size(), &ret, &sErr);
}

mstring tHttpResponse::GetHeader(string_view name) const
{
	for (const auto& h: headers)
	{
		if (equalsNoCase(h.first, name))
			return h.second;
	}
	return se;
}

mstring tHttpResponse::Describe() const
{
	if (status == 0)
		return error.empty() ? "Connection failed"s : error;
	return "HTTP status "s + to_string(status);
}

using unique_ssl_ctx = auto_raii<SSL_CTX*, SSL_CTX_free, nullptr>;

// one context for all outgoing connections, system trust store
SSL_CTX* GetSslContext(mstring& sErr)
{
	static unique_ssl_ctx ctx;
	static mstring ctxErr;
	if (ctx.valid() || !ctxErr.empty())
	{
		sErr = ctxErr;
		return ctx.get();
	}
	ctx.reset(SSL_CTX_new(TLS_client_method()));
	if (!ctx.valid() || !SSL_CTX_set_default_verify_paths(ctx.get()))
	{
		auto serr = ERR_reason_error_string(ERR_get_error());
		ctxErr = pfxSslError + (serr ? serr : "Cannot create SSL context");
		ctx.reset();
		sErr = ctxErr;
		return nullptr;
	}
	return ctx.get();
}

struct tRequestContext
{
	tHttpRequest req;
	tHttpUrl url;
	tHttpReporter reporter;
	mstring sError;

	void Report(tHttpResponse&& resp)
	{
		auto rep = move(reporter);
		delete this;
		if (rep)
			rep(move(resp));
	}
	void Fail(mstring msg)
	{
		tHttpResponse r;
		r.error = move(msg);
		Report(move(r));
	}
};

void cbRequestError(enum evhttp_request_error err, void *arg)
{
	auto ctx = (tRequestContext*) arg;
	switch(err)
	{
	case EVREQ_HTTP_TIMEOUT: ctx->sError = "Timeout"; break;
	case EVREQ_HTTP_EOF: ctx->sError = "Connection closed by peer"; break;
	case EVREQ_HTTP_INVALID_HEADER: ctx->sError = "Invalid response header"; break;
	case EVREQ_HTTP_BUFFER_ERROR: ctx->sError = "Connection failed"; break;
	case EVREQ_HTTP_REQUEST_CANCEL: ctx->sError = "Request cancelled"; break;
	case EVREQ_HTTP_DATA_TOO_LONG: ctx->sError = "Response too long"; break;
	}
}

void cbRequestDone(struct evhttp_request *req, void *arg)
{
	auto ctx = (tRequestContext*) arg;
	if (!req || !evhttp_request_get_response_code(req))
		return ctx->Fail(ctx->sError.empty() ? "Connection failed"s : ctx->sError);

	tHttpResponse resp;
	resp.status = evhttp_request_get_response_code(req);
	auto hdrs = evhttp_request_get_input_headers(req);
	for (auto h = hdrs->tqh_first; h; h = h->next.tqe_next)
		resp.headers.emplace_back(h->key, h->value);
	auto buf = evhttp_request_get_input_buffer(req);
	auto len = evbuffer_get_length(buf);
	resp.body.resize(len);
	if (len)
		evbuffer_copyout(buf, &resp.body[0], len);
	ldbg("HTTP " << resp.status << " from " << ctx->url.sHost << ", " << len << " bytes");
	ctx->Report(move(resp));
}

class tEvHttpClient : public IHttpClient
{
public:
	void Send(tHttpRequest &&req, tHttpReporter reporter) override
	{
		auto ctx = new tRequestContext { move(req), tHttpUrl(), move(reporter), se };
		if (!ctx->url.SetHttpUrl(ctx->req.url, false)
				|| ctx->url.m_schema == tHttpUrl::EProtoType::FTP
				|| ctx->url.m_schema == tHttpUrl::EProtoType::SFTP)
		{
			return ctx->Fail("Bad endpoint URL: " + ctx->req.url);
		}
		CAddrInfo::Resolve(ctx->url.sHost, to_string(ctx->url.GetPort()), [ctx](CAddrInfoPtr res)
		{
			if (!res || res->HasError() || res->getAddrs().empty())
				return ctx->Fail(res ? res->getError() : "DNS error"s);
			Connect(ctx, res->getAddrs().front().formatIp());
		});
	}

	static void Connect(tRequestContext* ctx, mstring ip)
	{
		auto& url = ctx->url;
		struct bufferevent* bev = nullptr;
		if (url.m_schema == tHttpUrl::EProtoType::HTTPS)
		{
			mstring sErr;
			auto sslctx = GetSslContext(sErr);
			if (!sslctx)
				return ctx->Fail(sErr);
			auto ssl = SSL_new(sslctx);
			if (!ssl)
				return ctx->Fail(pfxSslError + "cannot create session");
			// for SNI
			SSL_set_tlsext_host_name(ssl, url.sHost.c_str());
			auto param = SSL_get0_param(ssl);
			X509_VERIFY_PARAM_set_hostflags(param, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
			X509_VERIFY_PARAM_set1_host(param, url.sHost.c_str(), 0);
			SSL_set_verify(ssl, SSL_VERIFY_PEER, nullptr);
			bev = bufferevent_openssl_socket_new(evabase::base, -1, ssl,
					BUFFEREVENT_SSL_CONNECTING, BEV_OPT_CLOSE_ON_FREE | BEV_OPT_DEFER_CALLBACKS);
			if (!bev)
			{
				SSL_free(ssl);
				return ctx->Fail(pfxSslError + "cannot create stream");
			}
			bufferevent_openssl_set_allow_dirty_shutdown(bev, 1);
		}
		auto conn = evhttp_connection_base_bufferevent_new(evabase::base, nullptr, bev,
				ip.c_str(), url.GetPort());
		if (!conn)
		{
			if (bev)
				bufferevent_free(bev);
			return ctx->Fail("Cannot create connection");
		}
		evhttp_connection_set_timeout(conn, cfg::nettimeout);
		auto req = evhttp_request_new(cbRequestDone, ctx);
		if (!req)
		{
			evhttp_connection_free(conn);
			return ctx->Fail("Cannot create request");
		}
		evhttp_request_set_error_cb(req, cbRequestError);
		auto out = evhttp_request_get_output_headers(req);
		evhttp_add_header(out, "Host", url.sHost.c_str());
		evhttp_add_header(out, "Connection", "close");
		evhttp_add_header(out, "User-Agent", "orcadl/" ORCA_VERSION);
		if (!ctx->req.contentType.empty())
			evhttp_add_header(out, "Content-Type", ctx->req.contentType.c_str());
		for (const auto& h: ctx->req.headers)
			evhttp_add_header(out, h.first.c_str(), h.second.c_str());
		if (!ctx->req.body.empty())
			evbuffer_add(evhttp_request_get_output_buffer(req), ctx->req.body.data(), ctx->req.body.size());

		auto method = ctx->req.method == tHttpRequest::EMethod::POST ? EVHTTP_REQ_POST : EVHTTP_REQ_GET;
		if (0 != evhttp_make_request(conn, req, method, url.sPath.c_str()))
		{
			// not queued, not owned by the connection
			evhttp_request_free(req);
			evhttp_connection_free(conn);
			return ctx->Fail("Cannot send request");
		}
		evhttp_connection_free_on_completion(conn);
	}
};

std::unique_ptr<IHttpClient> IHttpClient::Create()
{
	return std::make_unique<tEvHttpClient>();
}

}
