#include "main.h"
#include "testcommon.h"

#include "conserver.h"
#include "ctlproto.h"
#include "scheduler.h"
#include "evabase.h"

#include "gmock/gmock.h"

#include <event2/event.h>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>

#include <cstring>

using testing::StartsWith;

class servertest : public testing::Test
{
protected:
	tVirtualClock clock;
	tFakeAdapter http { EResourceKind::HTTP_FTP }, bt { EResourceKind::BITTORRENT };
	tFakePostProcessor pp;
	std::shared_ptr<tInlinePool> pool = std::make_shared<tInlinePool>();
	tSchedulerEnv env;
	std::unique_ptr<jobscheduler> sched;
	std::unique_ptr<ctlhandler> handler;
	std::unique_ptr<conserver> server;
	std::vector<int> clients;

	void SetUp() override
	{
		env.clock = &clock;
		env.httpAdapter = &http;
		env.btAdapter = &bt;
		env.postProc = &pp;
		env.pool = pool;
		sched = jobscheduler::Create(env);
		handler = std::make_unique<ctlhandler>(*sched);
		server = conserver::Create(*handler);
	}

	void TearDown() override
	{
		for (auto fd: clients)
			close(fd);
		server.reset();
		Pump();
	}

	// one round of pending event work
	void Pump()
	{
		for (int i = 0; i < 10; ++i)
			event_base_loop(evabase::base, EVLOOP_NONBLOCK | EVLOOP_ONCE);
	}

	int ConnectTcp(int port)
	{
		int fd = socket(AF_INET, SOCK_STREAM, 0);
		EXPECT_GE(fd, 0);
		sockaddr_in sa = sockaddr_in();
		sa.sin_family = AF_INET;
		sa.sin_port = htons(port);
		sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
		EXPECT_EQ(0, connect(fd, (sockaddr*) &sa, sizeof(sa))) << tErrnoFmter();
		clients.push_back(fd);
		return fd;
	}

	// pass data until the reply is complete or the peer closed; false on timeout
	bool Exchange(int fd, string_view request, mstring& reply, std::function<bool(cmstring&)> complete,
			bool* eof = nullptr)
	{
		reply.clear();
		if (eof)
			*eof = false;
		auto deadline = time(0) + 10;
		while (time(0) < deadline)
		{
			if (!request.empty())
			{
				auto n = ::send(fd, request.data(), request.size(), MSG_DONTWAIT | MSG_NOSIGNAL);
				if (n > 0)
					request.remove_prefix(n);
			}
			event_base_loop(evabase::base, EVLOOP_NONBLOCK | EVLOOP_ONCE);
			char buf[4096];
			auto n = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
			if (n > 0)
				reply.append(buf, n);
			else if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK))
			{
				if (eof)
					*eof = true;
				return true;
			}
			if (request.empty() && complete && complete(reply))
				return true;
		}
		return false;
	}

	mstring Ask(int fd, string_view request, unsigned nLines = 1)
	{
		mstring reply;
		EXPECT_TRUE(Exchange(fd, request, reply, [nLines](cmstring& r)
		{
			return std::count(r.begin(), r.end(), '\n') >= (long) nLines;
		}));
		return reply;
	}
};

TEST_F(servertest, tcp_session)
{
	auto port = server->SetupTcp("127.0.0.1", 0);
	ASSERT_GT(port, 0);
	auto fd = ConnectTcp(port);

	auto reply = Ask(fd, "SUBMIT uri=http://example.org/a.iso out=/srv/a.iso\r\n");
	ASSERT_THAT(reply, StartsWith("OK id="));
	EXPECT_EQ(1u, server->GetConnectionCount());
	EXPECT_EQ(1u, sched->List().size());

	auto id = reply.substr(6, reply.size() - 7);
	reply = Ask(fd, "QUERY " + id + "\n");
	EXPECT_THAT(reply, StartsWith("OK id=" + id + " state=Pending"));

	mstring list;
	ASSERT_TRUE(Exchange(fd, "LIST\n", list, [](cmstring& r) { return endsWith(r, "\n.\n"); }));
	EXPECT_THAT(list, StartsWith("OK count=1\nid=" + id + " "));

	// the connection is closed after the answer
	bool eof = false;
	ASSERT_TRUE(Exchange(fd, "QUIT\n", reply, nullptr, &eof));
	EXPECT_TRUE(eof);
	EXPECT_EQ("OK\n", reply);
	Pump();
	EXPECT_EQ(0u, server->GetConnectionCount());
}

TEST_F(servertest, pipelined_requests)
{
	auto port = server->SetupTcp("127.0.0.1", 0);
	ASSERT_GT(port, 0);
	auto fd = ConnectTcp(port);
	auto reply = Ask(fd, "STATS\nQUERY nope\nHELLO\n", 3);
	std::vector<mstring> lines;
	for (auto l: tSplitWalk(reply, "\n"))
		lines.emplace_back(l);
	ASSERT_EQ(3u, lines.size());
	EXPECT_THAT(lines[0], StartsWith("OK pending_http=0 "));
	EXPECT_EQ("ERR Unknown job nope", lines[1]);
	EXPECT_EQ("ERR Unknown command HELLO", lines[2]);
}

TEST_F(servertest, unix_socket)
{
	tTempDir tmp;
	auto path = tmp / "run/ctl.sock";
	if (path.size() >= sizeof(sockaddr_un::sun_path))
		GTEST_SKIP() << "working directory path too long for a socket";
	ASSERT_TRUE(server->SetupUnix(path));
	struct stat st;
	ASSERT_EQ(0, stat(path.c_str(), &st));
	EXPECT_TRUE(S_ISSOCK(st.st_mode));
	EXPECT_EQ(0770u, st.st_mode & 0777);

	int fd = socket(AF_UNIX, SOCK_STREAM, 0);
	ASSERT_GE(fd, 0);
	clients.push_back(fd);
	auto sa = sockaddr_un();
	sa.sun_family = AF_UNIX;
	memcpy(sa.sun_path, path.c_str(), path.size());
	ASSERT_EQ(0, connect(fd, (sockaddr*) &sa, sizeof(sa))) << tErrnoFmter();
	EXPECT_THAT(Ask(fd, "STATS\n"), StartsWith("OK "));
	EXPECT_EQ("ERR Unknown job 1-0\n", Ask(fd, "CANCEL 1-0\n"));

	// a stale socket file is replaced
	server->Abandon();
	auto server2 = conserver::Create(*handler);
	EXPECT_TRUE(server2->SetupUnix(path));
}

TEST_F(servertest, oversized_request)
{
	auto port = server->SetupTcp("127.0.0.1", 0);
	ASSERT_GT(port, 0);
	auto fd = ConnectTcp(port);
	mstring junk(100000, 'x');
	mstring reply;
	bool eof = false;
	ASSERT_TRUE(Exchange(fd, junk, reply, nullptr, &eof));
	EXPECT_TRUE(eof);
	EXPECT_TRUE(reply.empty());
	Pump();
	EXPECT_EQ(0u, server->GetConnectionCount());
}

TEST_F(servertest, abandon_closes_clients)
{
	auto port = server->SetupTcp("127.0.0.1", 0);
	ASSERT_GT(port, 0);
	auto fd = ConnectTcp(port);
	ASSERT_THAT(Ask(fd, "STATS\n"), StartsWith("OK "));
	EXPECT_EQ(1u, server->GetConnectionCount());
	server->Abandon();
	EXPECT_EQ(0u, server->GetConnectionCount());
	mstring reply;
	bool eof = false;
	ASSERT_TRUE(Exchange(fd, "", reply, nullptr, &eof));
	EXPECT_TRUE(eof);

	// and no new ones are accepted
	int fd2 = socket(AF_INET, SOCK_STREAM, 0);
	ASSERT_GE(fd2, 0);
	clients.push_back(fd2);
	sockaddr_in sa = sockaddr_in();
	sa.sin_family = AF_INET;
	sa.sin_port = htons(port);
	sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	EXPECT_NE(0, connect(fd2, (sockaddr*) &sa, sizeof(sa)));
}
