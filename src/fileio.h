#ifndef FILEIO_H_
#define FILEIO_H_

#include "octypes.h"
#include "octemplates.h"

#include <errno.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <string.h>

extern "C"
{
struct event;
}

namespace orca
{

// stat(2) result holder
class Cstat : public stat
{
	bool m_bValid = false;
public:
	Cstat() { memset(static_cast<struct stat*>(this), 0, sizeof(struct stat)); }
	explicit Cstat(cmstring &s) : Cstat() { update(s); }
	bool update(cmstring& path) { return (m_bValid = (0 == ::stat(path.c_str(), this))); }
	operator bool() const { return m_bValid; }
	const struct stat& info() const { return *this; }
	bool isReg() const { return m_bValid && S_ISREG(st_mode); }
	bool isDir() const { return m_bValid && S_ISDIR(st_mode); }
	off_t size() const { return st_size; }

	// identity of a file version, changes when the file is replaced or modified
	struct tID
	{
		struct timespec mtime;
		dev_t dev;
		ino_t ino;
		bool operator==(const tID& other) const
		{
			return dev == other.dev && ino == other.ino
					&& mtime.tv_sec == other.mtime.tv_sec && mtime.tv_nsec == other.mtime.tv_nsec;
		}
	};
	tID fpr() const { return { st_mtim, st_dev, st_ino }; }
};

/**
 * @brief Free space for unprivileged users on the filesystem holding the path.
 * @return Byte count or -1 if not determinable
 */
off_t GetFreeSpace(cmstring &path);

/**
 * @brief Move a file or directory tree, copying when a rename is not possible
 * (different filesystems).
 * @param sErrorMsg Receives a description of the failure
 */
bool MoveFileOrTree(cmstring &from, cmstring &to, mstring& sErrorMsg);

void DelTree(cmstring &what);

inline void justforceclose(int fd)
{
	while (0 != ::close(fd) && errno == EINTR)
		;
}

// create all missing directories with the configured permissions
bool mkdirhier(string_view path);
bool mkbasedir(cmstring& path);

// write everything or fail, -1 on errors
ssize_t dumpall(int fd, string_view data);

using unique_fd = auto_raii<int, justforceclose, -1>;

// also closes the watched descriptor
void event_and_fd_free(event*);
using unique_fdevent = auto_raii<event*, event_and_fd_free, nullptr>;

}

#endif /* FILEIO_H_ */
