#include "gtest/gtest.h"
#include "evabase.h"
#include "oc3rdparty.h"
#include "fileio.h"
#include "main.h"

#include <stdlib.h>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <locale.h>
#include <sys/stat.h>

using namespace orca;

void pushEvents(int secTimeout, bool* abortVar)
{
	for(auto dateEnd = time(0) + secTimeout;
		time(0) < dateEnd
		&& (abortVar == nullptr || !*abortVar)
		&& ! evabase::GetGlobal().IsShuttingDown()
		;)
	{
		event_base_loop(evabase::base, EVLOOP_NONBLOCK | EVLOOP_ONCE);
	}
}

tTempDir::tTempDir()
{
	char cwd[4096];
	if (!getcwd(cwd, sizeof(cwd)))
		throw std::runtime_error("getcwd failed");
	mstring templ = mstring(cwd) + "/orcatest.XXXXXX";
	if (!mkdtemp(&templ[0]))
		throw std::runtime_error("mkdtemp failed");
	path = templ;
}

tTempDir::~tTempDir()
{
	DelTree(path);
}

mstring tTempDir::operator/(string_view name) const
{
	return path + "/" + mstring(name);
}

void WriteFile(cmstring& path, string_view content, int mode)
{
	mkbasedir(path);
	{
		std::ofstream out(path, std::ios::binary | std::ios::trunc);
		out.write(content.data(), content.size());
	}
	chmod(path.c_str(), mode);
}

mstring ReadFile(cmstring& path)
{
	std::ifstream inp(path, std::ios::binary);
	std::stringstream buf;
	buf << inp.rdbuf();
	return buf.str();
}

int main(int argc, char **argv)
{
	setlocale(LC_ALL, "C");
	oc3rdparty_init();
	auto p = orca::evabase::Create();

	::testing::InitGoogleTest(&argc, argv);
	auto r = RUN_ALL_TESTS();
	p->SignalStop();
	pushEvents(2, nullptr);
	oc3rdparty_deinit();
	return r;
}
