#include "gtest/gtest.h"
#include "evabase.h"
#include "meta.h"

using namespace orca;
using namespace std;

// run the global event loop until the flag is set or the time is over
void pushEvents(int secTimeout, bool* abortVar);

/**
 * Scratch directory below the working directory, removed with its contents at the end.
 */
struct tTempDir
{
	mstring path;
	tTempDir();
	~tTempDir();
	mstring operator/(string_view name) const;
};

// write the file, creating the directory when needed
void WriteFile(cmstring& path, string_view content, int mode = 0644);
mstring ReadFile(cmstring& path);
