#ifndef CSMAPPING_H_
#define CSMAPPING_H_

#include "meta.h"

#include <memory>

namespace orca
{

typedef enum : char
{
	CSTYPE_INVALID = 0,
	CSTYPE_MD5 = 1,
	CSTYPE_SHA1 = 2,
	CSTYPE_SHA256 = 3,
	CSTYPE_SHA512 = 4
} CSTYPES;

#define MAXCSLEN 64

inline unsigned short GetCSTypeLen(CSTYPES t)
{
	switch(t)
	{
	case CSTYPE_MD5: return 16;
	case CSTYPE_SHA1: return 20;
	case CSTYPE_SHA256: return 32;
	case CSTYPE_SHA512: return 64;
	default: return 0;
	}
}

inline CSTYPES GuessCStype(unsigned short len)
{
	switch(len)
	{
	case 16: return CSTYPE_MD5;
	case 20: return CSTYPE_SHA1;
	case 32: return CSTYPE_SHA256;
	case 64: return CSTYPE_SHA512;
	default: return CSTYPE_INVALID;
	}
}

LPCSTR GetCSTypeName(CSTYPES t);
CSTYPES GetCSTypeByName(string_view name);

// incremental digest calculation
class csumBase
{
public:
	virtual ~csumBase() =default;
	virtual void add(const uint8_t *data, size_t size) = 0;
	void add(string_view sv) { return add((const uint8_t*) sv.data(), sv.size()); }
	virtual void finish(uint8_t* ret) = 0;
	static std::unique_ptr<csumBase> GetChecker(CSTYPES);
};

/**
 * Expected digest of a file, written as "<type>:<hex>" or just as hex string where the
 * type is guessed from the length.
 */
struct tFingerprint
{
	CSTYPES csType = CSTYPE_INVALID;
	uint8_t csum[MAXCSLEN];

	tFingerprint() { memset(csum, 0, sizeof(csum)); }

	bool SetCs(string_view hexString, CSTYPES eCstype = CSTYPE_INVALID);
	bool Parse(string_view spec);
	/**
	 * Calculate the digest of the file contents.
	 * @return false on IO errors, with the description in *psErr if set
	 */
	bool ScanFile(cmstring &path, CSTYPES eCstype, mstring* psErr = nullptr);
	// calculate and compare
	bool CheckFile(cmstring &path, mstring* psErr = nullptr) const;

	mstring GetCsAsString() const;
	// in the format accepted by Parse
	operator mstring() const;
	bool operator==(const tFingerprint& other) const
	{
		return other.csType == csType && 0 == memcmp(csum, other.csum, GetCSTypeLen(csType));
	}
	bool operator!=(const tFingerprint& other) const { return !(*this == other); }
	bool valid() const { return csType != CSTYPE_INVALID; }
};

}

#endif /* CSMAPPING_H_ */
