#ifndef AHTTPURL_H
#define AHTTPURL_H

#include "octypes.h"

namespace orca
{

/**
 * Decomposed URL of a download source, a backend endpoint or a listen address.
 */
class ORCA_API tHttpUrl
{
	uint16_t nPort = 0;

public:
	enum class EProtoType
	{
		HTTP,
		HTTPS,
		FTP,
		SFTP
	} m_schema = EProtoType::HTTP;

	mstring sHost, sPath, sUserPass;

	/**
	 * @param uri Absolute URL, the schema is optional (then HTTP is assumed)
	 * @param unescape Decode percent-escaped characters before parsing
	 */
	bool SetHttpUrl(string_view uri, bool unescape = true);

	uint16_t GetDefaultPortForProto() const;
	uint16_t GetPort(uint16_t defVal) const { return nPort ? nPort : defVal; }
	uint16_t GetPort() const { return GetPort(GetDefaultPortForProto()); }
};

}

#endif // AHTTPURL_H
