#include "csmapping.h"
#include "fileio.h"

#include <fcntl.h>

#include <openssl/evp.h>

using namespace std;

namespace orca
{

static const LPCSTR csTypeNames[] = { "", "md5", "sha1", "sha256", "sha512" };

LPCSTR GetCSTypeName(CSTYPES t)
{
	return (unsigned) t < _countof(csTypeNames) ? csTypeNames[(unsigned) t] : "";
}

CSTYPES GetCSTypeByName(string_view name)
{
	for (unsigned i = 1; i < _countof(csTypeNames); ++i)
	{
		if (equalsNoCase(name, csTypeNames[i]))
			return (CSTYPES) i;
	}
	return CSTYPE_INVALID;
}

class csumEvp : public csumBase
{
	EVP_MD_CTX* m_ctx;
public:
	csumEvp(const EVP_MD* md) : m_ctx(EVP_MD_CTX_new())
	{
		if (!m_ctx || !EVP_DigestInit_ex(m_ctx, md, nullptr))
			throw std::bad_alloc();
	}
	~csumEvp()
	{
		EVP_MD_CTX_free(m_ctx);
	}
	void add(const uint8_t *data, size_t size) override
	{
		EVP_DigestUpdate(m_ctx, data, size);
	}
	void finish(uint8_t* ret) override
	{
		unsigned len = 0;
		EVP_DigestFinal_ex(m_ctx, ret, &len);
	}
};

std::unique_ptr<csumBase> csumBase::GetChecker(CSTYPES type)
{
	switch(type)
	{
	case CSTYPE_MD5: return make_unique<csumEvp>(EVP_md5());
	case CSTYPE_SHA1: return make_unique<csumEvp>(EVP_sha1());
	case CSTYPE_SHA256: return make_unique<csumEvp>(EVP_sha256());
	case CSTYPE_SHA512: return make_unique<csumEvp>(EVP_sha512());
	default: return std::unique_ptr<csumBase>();
	}
}

bool tFingerprint::SetCs(string_view hexString, CSTYPES eCstype)
{
	auto l = hexString.size();
	if(!l || l%2 || !IsHexString(hexString))
		return false;
	if(eCstype == CSTYPE_INVALID)
	{
		eCstype = GuessCStype(l / 2);
		if(eCstype == CSTYPE_INVALID)
			return false;
	}
	else if(l != 2 * GetCSTypeLen(eCstype))
		return false;

	csType = eCstype;
	return CsAsciiToBin(mstring(hexString).c_str(), csum, l/2);
}

bool tFingerprint::Parse(string_view spec)
{
	spec = trimBoth(spec);
	auto pos = spec.find(':');
	if (pos == stmiss)
		return SetCs(spec);
	auto t = GetCSTypeByName(spec.substr(0, pos));
	if (t == CSTYPE_INVALID)
		return false;
	return SetCs(spec.substr(pos + 1), t);
}

bool tFingerprint::ScanFile(cmstring &path, CSTYPES eCstype, mstring* psErr)
{
	auto summer = csumBase::GetChecker(eCstype);
	if (!summer)
	{
		if (psErr)
			*psErr = "Unsupported checksum type";
		return false;
	}
	unique_fd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
	if (!fd.valid())
	{
		if (psErr)
			*psErr = tErrnoFmter("Cannot open file: ");
		return false;
	}
	uint8_t buf[64 * 1024];
	while (true)
	{
		auto n = read(fd.get(), buf, sizeof(buf));
		if (n == 0)
			break;
		if (n < 0)
		{
			if (errno == EINTR)
				continue;
			if (psErr)
				*psErr = tErrnoFmter("Cannot read file: ");
			return false;
		}
		summer->add(buf, n);
	}
	summer->finish(csum);
	csType = eCstype;
	return true;
}

bool tFingerprint::CheckFile(cmstring &path, mstring* psErr) const
{
	tFingerprint probe;
	if(!probe.ScanFile(path, csType, psErr))
		return false;
	if (probe == *this)
		return true;
	if (psErr)
		*psErr = mstring("Checksum mismatch, expected ") + GetCsAsString() + ", got " + probe.GetCsAsString();
	return false;
}

mstring tFingerprint::GetCsAsString() const
{
	return BytesToHexString(csum, GetCSTypeLen(csType));
}

tFingerprint::operator mstring() const
{
	return mstring(GetCSTypeName(csType)) + ":" + GetCsAsString();
}

}
