#include "config.h"
#include "fileio.h"
#include "ocfg.h"
#include "meta.h"
#include "debug.h"
#include "ocutilpath.h"

#include <fcntl.h>
#include <filesystem>

#ifdef HAVE_STATVFS
#include <sys/statvfs.h>
#endif

#include <event2/event.h>

using namespace std;
namespace fs = std::filesystem;

namespace orca
{

off_t GetFreeSpace(cmstring &path)
{
#ifdef HAVE_STATVFS
	struct statvfs stfs;
	if (0 != statvfs(path.c_str(), &stfs))
		return -1;
	return off_t(stfs.f_bavail) * off_t(stfs.f_frsize);
#else
	std::error_code ec;
	auto info = fs::space(path, ec);
	return ec ? -1 : off_t(info.available);
#endif
}

bool MoveFileOrTree(cmstring &from, cmstring &to, mstring& sErrorMsg)
{
	if (!mkbasedir(to))
	{
		sErrorMsg = tErrnoFmter("Cannot create target directory");
		return false;
	}
	if (0 == rename(from.c_str(), to.c_str()))
		return true;
	if (errno != EXDEV)
	{
		sErrorMsg = tErrnoFmter("Cannot move the file");
		return false;
	}
	std::error_code ec;
	fs::copy(from, to, fs::copy_options::overwrite_existing | fs::copy_options::recursive, ec);
	if (ec)
	{
		sErrorMsg = "Cannot copy the file: " + ec.message();
		return false;
	}
	fs::remove_all(from, ec);
	if (ec)
		USRERR("Cannot remove " << from << " after copying: " << ec.message());
	return true;
}

void DelTree(cmstring &what)
{
	std::error_code ec;
	fs::remove_all(what, ec);
}

bool mkdirhier(string_view path)
{
	mstring cur;
	cur.reserve(path.size());
	if (startsWith(path, "/"))
		cur = "/";
	for (auto part: tSplitWalk(path, "/"))
	{
		if (!cur.empty() && cur.back() != '/')
			cur += '/';
		cur += part;
		// errno of the failed level is kept for the caller
		if (0 != mkdir(cur.c_str(), cfg::dirperms) && errno != EEXIST)
			return false;
	}
	return true;
}

bool mkbasedir(cmstring & path)
{
	return mkdirhier(GetDirPart(path));
}

ssize_t dumpall(int fd, string_view data)
{
	auto total = data.size();
	while (!data.empty())
	{
		auto n = ::write(fd, data.data(), data.size());
		if (n >= 0)
			data.remove_prefix(n);
		else if (errno != EINTR && errno != EAGAIN)
			return -1;
	}
	return total;
}

void event_and_fd_free(event *e)
{
	if (!e)
		return;
	auto fd = event_get_fd(e);
	event_free(e);
	if (fd != -1)
		justforceclose(fd);
}

}
