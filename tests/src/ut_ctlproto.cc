#include "main.h"
#include "testcommon.h"

#include "ctlproto.h"
#include "scheduler.h"

#include "gmock/gmock.h"

#include <climits>

using testing::HasSubstr;
using testing::StartsWith;

static std::vector<mstring> Lines(cmstring& reply)
{
	std::vector<mstring> ret;
	tSplitWalk split(reply, "\n");
	while (split.Next())
		ret.emplace_back(split.view());
	return ret;
}

TEST(ctlproto, fields)
{
	tCtlFields f { {"id", "1-2"}, {"out", "/srv/My Movie.mkv"}, {"reason", "a=b & c"} };
	auto line = FormatFields(f);
	EXPECT_EQ("id=1-2 out=/srv/My%20Movie.mkv reason=a%3db%20%26%20c", line);
	tCtlFields back;
	ASSERT_TRUE(ParseFields(line, back));
	EXPECT_EQ(f, back);
	ASSERT_TRUE(FindField(back, "out"));
	EXPECT_EQ("/srv/My Movie.mkv", *FindField(back, "out"));
	EXPECT_FALSE(FindField(back, "uri"));

	ASSERT_TRUE(ParseFields("  ", back));
	EXPECT_TRUE(back.empty());
	ASSERT_TRUE(ParseFields("empty=", back));
	EXPECT_EQ("", back.at(0).second);
	EXPECT_FALSE(ParseFields("id=1 word", back));
	EXPECT_FALSE(ParseFields("=1", back));
	EXPECT_FALSE(ParseFields("x=bad%2", back));
}

TEST(ctlproto, job_info)
{
	tJobInfo info;
	info.id = "a-1";
	info.state = EJobState::FAILED;
	info.kind = EResourceKind::BITTORRENT;
	info.priority = 5;
	info.retries = 3;
	info.created = 1700000000;
	info.progress.done = 10;
	info.progress.total = 100;
	info.progress.rate = 9;
	info.progress.CalcEta();
	info.outputPath = "/srv/show";
	info.stagedPath = "/srv/show.part";
	info.error = tTransferError::Transient("tracker down\n(gave up)");
	info.uris = { "magnet:?xt=urn:btih:00", "/tmp/x.torrent" };

	auto fields = JobInfoToFields(info);
	ASSERT_TRUE(FindField(fields, "error"));
	EXPECT_EQ("TransientTransferError", *FindField(fields, "error"));
	EXPECT_EQ("Transient", *FindField(fields, "class"));
	EXPECT_FALSE(FindField(fields, "final"));

	// through the wire format
	tCtlFields parsed;
	ASSERT_TRUE(ParseFields(FormatFields(fields), parsed));
	tJobInfo back;
	ASSERT_TRUE(FieldsToJobInfo(parsed, back));
	EXPECT_EQ(info.id, back.id);
	EXPECT_EQ(info.state, back.state);
	EXPECT_EQ(info.kind, back.kind);
	EXPECT_EQ(5, back.priority);
	EXPECT_EQ(3u, back.retries);
	EXPECT_EQ(info.created, back.created);
	EXPECT_EQ(info.progress, back.progress);
	EXPECT_EQ(info.outputPath, back.outputPath);
	EXPECT_EQ(info.stagedPath, back.stagedPath);
	EXPECT_EQ(EErrorKind::TRANSIENT_TRANSFER, back.error.kind);
	EXPECT_EQ(EErrorClass::TRANSIENT, back.error.errClass);
	EXPECT_EQ(info.error.reason, back.error.reason);
	EXPECT_EQ(info.uris, back.uris);

	// unknown keys are ignored, id and state are required
	ASSERT_TRUE(FieldsToJobInfo({{"id", "x"}, {"state", "Pending"}, {"color", "red"}}, back));
	EXPECT_EQ(-1, back.progress.total);
	EXPECT_FALSE(back.error.IsError());
	EXPECT_FALSE(FieldsToJobInfo({{"id", "x"}}, back));
	EXPECT_FALSE(FieldsToJobInfo({{"id", "x"}, {"state", "Sleeping"}}, back));
	EXPECT_FALSE(FieldsToJobInfo({{"state", "Pending"}}, back));
}

TEST(ctlproto, submit_requests)
{
	tSubmitRequest req;
	req.uris = { "http://example.org/a b.ts", "ftp://example.org/a b.ts" };
	req.outputPath = "/srv/a b";
	req.kindHint = EResourceKind::HTTP_FTP;
	req.priority = -4;
	req.format = "mkv";
	req.checksum = "sha1:86066905b1d39b2d19561611adc5cacf07b40d48";
	auto line = FormatSubmitRequest(req);
	EXPECT_THAT(line, StartsWith("SUBMIT uri=http://example.org/a%20b.ts uri=ftp://"));

	tSubmitRequest back;
	mstring sErr;
	ASSERT_TRUE(ParseSubmitRequest(line.substr(7), back, sErr)) << sErr;
	EXPECT_EQ(req.uris, back.uris);
	EXPECT_EQ(req.outputPath, back.outputPath);
	EXPECT_EQ(req.kindHint, back.kindHint);
	EXPECT_EQ(-4, back.priority);
	EXPECT_EQ("mkv", back.format);
	EXPECT_EQ(req.checksum, back.checksum);

	// defaults are not sent
	tSubmitRequest plain;
	plain.uris = { "magnet:?xt=urn:btih:00" };
	plain.outputPath = "/srv/b";
	EXPECT_EQ("SUBMIT uri=magnet:%3fxt%3durn:btih:00 out=/srv/b", FormatSubmitRequest(plain));

	EXPECT_FALSE(ParseSubmitRequest("out=/x", back, sErr));
	EXPECT_EQ("No source given", sErr);
	EXPECT_FALSE(ParseSubmitRequest("uri=http://h/a", back, sErr));
	EXPECT_EQ("No output path given", sErr);
	EXPECT_FALSE(ParseSubmitRequest("uri=http://h/a out=/x prio=high", back, sErr));
	EXPECT_EQ("Bad priority high", sErr);
	// no wrap-around
	EXPECT_FALSE(ParseSubmitRequest("uri=http://h/a out=/x prio=99999999999", back, sErr));
	EXPECT_EQ("Bad priority 99999999999", sErr);
	EXPECT_FALSE(ParseSubmitRequest("uri=http://h/a out=/x prio=-99999999999999999999", back, sErr));
	EXPECT_TRUE(ParseSubmitRequest("uri=http://h/a out=/x prio=-2147483648", back, sErr)) << sErr;
	EXPECT_EQ(INT_MIN, back.priority);
	EXPECT_FALSE(ParseSubmitRequest("uri=http://h/a out=/x kind=ed2k", back, sErr));
	EXPECT_EQ("Unknown resource kind ed2k", sErr);
	EXPECT_FALSE(ParseSubmitRequest("uri=http://h/a out=/x speed=1", back, sErr));
	EXPECT_EQ("Unknown argument speed", sErr);
	EXPECT_FALSE(ParseSubmitRequest("uri=http://h/a /x", back, sErr));
	EXPECT_EQ("Malformed arguments", sErr);
}

TEST(ctlproto, stats)
{
	tSchedulerStats st;
	st.pendingHttp = 3;
	st.activeBt = 1;
	st.slotsHttp = 4;
	st.slotsBt = 2;
	st.byState[(int) EJobState::PENDING] = 3;
	st.byState[(int) EJobState::POSTPROCESSING] = 2;
	st.total = 6;
	auto f = StatsToFields(st);
	EXPECT_EQ("3", *FindField(f, "pending_http"));
	EXPECT_EQ("1", *FindField(f, "active_bt"));
	EXPECT_EQ("4", *FindField(f, "slots_http"));
	EXPECT_EQ("3", *FindField(f, "pending"));
	EXPECT_EQ("2", *FindField(f, "postprocessing"));
	EXPECT_EQ("0", *FindField(f, "cancelled"));
	EXPECT_EQ("6", *FindField(f, "total"));
}

class ctltest : public testing::Test
{
protected:
	tVirtualClock clock;
	tFakeAdapter http { EResourceKind::HTTP_FTP }, bt { EResourceKind::BITTORRENT };
	tFakePostProcessor pp;
	std::shared_ptr<tInlinePool> pool = std::make_shared<tInlinePool>();
	tSchedulerEnv env;
	std::unique_ptr<jobscheduler> sched;
	std::unique_ptr<ctlhandler> handler;

	void SetUp() override
	{
		env.clock = &clock;
		env.httpAdapter = &http;
		env.btAdapter = &bt;
		env.postProc = &pp;
		env.pool = pool;
		env.httpSlots = 1;
		sched = jobscheduler::Create(env);
		handler = std::make_unique<ctlhandler>(*sched);
	}

	mstring Do(string_view line)
	{
		bool bQuit = false;
		auto ret = handler->Dispatch(line, bQuit);
		EXPECT_FALSE(bQuit);
		return ret;
	}

	tJobId SubmitOk(string_view args)
	{
		auto reply = Do("SUBMIT " + mstring(args));
		EXPECT_THAT(reply, StartsWith("OK id="));
		tCtlFields f;
		EXPECT_TRUE(ParseFields(trimBoth(string_view(reply).substr(2)), f));
		auto id = FindField(f, "id");
		return id ? *id : tJobId();
	}

	tJobInfo QueryOk(const tJobId& id)
	{
		auto reply = Do("QUERY " + id);
		EXPECT_THAT(reply, StartsWith("OK "));
		tCtlFields f;
		tJobInfo ret;
		EXPECT_TRUE(ParseFields(trimBoth(string_view(reply).substr(2)), f));
		EXPECT_TRUE(FieldsToJobInfo(f, ret));
		return ret;
	}
};

TEST_F(ctltest, submit_and_query)
{
	auto id = SubmitOk("uri=http://example.org/a.iso uri=ftp://example.org/a.iso out=/srv/a.iso prio=2");
	ASSERT_FALSE(id.empty());
	auto info = QueryOk(id);
	EXPECT_EQ(id, info.id);
	EXPECT_EQ(EJobState::PENDING, info.state);
	EXPECT_EQ(EResourceKind::HTTP_FTP, info.kind);
	EXPECT_EQ(2, info.priority);
	EXPECT_EQ("/srv/a.iso", info.outputPath);
	EXPECT_EQ(2u, info.uris.size());

	clock.RunPending();
	EXPECT_EQ(EJobState::ACTIVE, QueryOk(id).state);
	// the id= form works too
	EXPECT_EQ(EJobState::ACTIVE, QueryOk("id=" + id).state);

	EXPECT_EQ("ERR Unknown job 99-0\n", Do("QUERY 99-0"));
	EXPECT_EQ("ERR Job id expected\n", Do("QUERY"));
	EXPECT_EQ("ERR Job id expected\n", Do("QUERY two words"));
}

TEST_F(ctltest, submit_rejections)
{
	EXPECT_EQ("ERR No source given\n", Do("SUBMIT out=/srv/x"));
	EXPECT_EQ("ERR Malformed arguments\n", Do("SUBMIT http://example.org/a"));
	auto reply = Do("SUBMIT uri=gopher://example.org/a out=/srv/x");
	EXPECT_THAT(reply, StartsWith("ERR UnsupportedResourceError: "));
	EXPECT_THAT(reply, HasSubstr("gopher://example.org/a"));
	reply = Do("SUBMIT uri=http://example.org/a uri=magnet:%3fxt%3durn:btih:00 out=/srv/x");
	EXPECT_THAT(reply, StartsWith("ERR "));
	EXPECT_TRUE(sched->List().empty());
}

TEST_F(ctltest, list_and_cancel)
{
	auto a = SubmitOk("uri=http://example.org/a out=/srv/a");
	auto b = SubmitOk("uri=http://example.org/b out=/srv/b");
	auto c = SubmitOk("uri=magnet:%3fxt%3durn:btih:0123456789abcdef0123456789abcdef01234567 out=/srv/c");
	clock.RunPending();

	EXPECT_TRUE(IsMultiLineCommand("list"));
	EXPECT_FALSE(IsMultiLineCommand("QUERY 1"));
	auto lines = Lines(Do("LIST"));
	ASSERT_EQ(5u, lines.size());
	EXPECT_EQ("OK count=3", lines[0]);
	EXPECT_EQ(CTL_END_MARK, lines[4]);
	tJobId order[] = { a, b, c };
	for (unsigned i = 0; i < 3; ++i)
	{
		tCtlFields f;
		tJobInfo info;
		ASSERT_TRUE(ParseFields(lines[i + 1], f));
		ASSERT_TRUE(FieldsToJobInfo(f, info));
		EXPECT_EQ(order[i], info.id);
	}

	// b waits for the only HTTP slot, cancelled right away
	EXPECT_EQ(EJobState::PENDING, QueryOk(b).state);
	EXPECT_EQ("OK\n", Do("CANCEL " + b));
	auto info = QueryOk(b);
	EXPECT_EQ(EJobState::CANCELLED, info.state);
	EXPECT_EQ(EErrorKind::CANCELLATION_REQUESTED, info.error.kind);
	// repeated and terminal, still fine
	EXPECT_EQ("OK\n", Do("cancel id=" + b));

	EXPECT_EQ("ERR Unknown job nope\n", Do("CANCEL nope"));
	EXPECT_EQ("ERR Job id expected\n", Do("CANCEL"));
}

TEST_F(ctltest, stats)
{
	SubmitOk("uri=http://example.org/a out=/srv/a");
	SubmitOk("uri=http://example.org/b out=/srv/b");
	clock.RunPending();
	auto reply = Do("STATS");
	ASSERT_THAT(reply, StartsWith("OK "));
	tCtlFields f;
	ASSERT_TRUE(ParseFields(trimBoth(string_view(reply).substr(2)), f));
	EXPECT_EQ("1", *FindField(f, "active_http"));
	EXPECT_EQ("1", *FindField(f, "pending_http"));
	EXPECT_EQ("1", *FindField(f, "slots_http"));
	EXPECT_EQ("1", *FindField(f, "active"));
	EXPECT_EQ("1", *FindField(f, "pending"));
	EXPECT_EQ("2", *FindField(f, "total"));
}

TEST_F(ctltest, framing)
{
	EXPECT_EQ("ERR Empty request\n", Do("   "));
	EXPECT_EQ("ERR Unknown command FETCH\n", Do("FETCH x"));

	bool bQuit = false;
	EXPECT_EQ("OK\n", handler->Dispatch("QUIT", bQuit));
	EXPECT_TRUE(bQuit);

	// error reasons never break the line framing
	auto reply = Do("SUBMIT uri=gopher://x%0ay out=/srv/x");
	EXPECT_THAT(reply, StartsWith("ERR "));
	EXPECT_EQ(1u, Lines(reply).size());
	EXPECT_EQ('\n', reply.back());
}
