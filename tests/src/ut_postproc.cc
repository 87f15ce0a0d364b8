#include "main.h"

#include "postproc.h"
#include "fileio.h"
#include "tpool.h"

#include "gmock/gmock.h"

#include <thread>
#include <chrono>
#include <atomic>
#include <stdexcept>

using testing::StartsWith;

class postproctest : public testing::Test
{
protected:
	tTempDir tmp;
	tPostProcConfig conf;
	std::atomic_bool cancelled { false };

	// fake ffmpeg, the arguments are: -nostdin -y -i <in> -c copy <out>
	mstring MakeTool(LPCSTR name, LPCSTR body)
	{
		auto path = tmp / name;
		WriteFile(path, mstring("#!/bin/sh\n") + body + "\n", 0755);
		return path;
	}

	tPostProcessResult Run(const tPostProcRequest& req)
	{
		auto pp = IPostProcessor::Create(conf);
		return pp->Process(req, cancelled);
	}

	tPostProcRequest Req(cmstring& staged, cmstring& out, LPCSTR fmt = "", LPCSTR sum = "")
	{
		return tPostProcRequest { "1-1", staged, out, fmt, sum };
	}
};

TEST_F(postproctest, final_paths)
{
	EXPECT_EQ("/a/b", GetFinalPath("/a/b", ""));
	EXPECT_EQ("/a/b.mkv", GetFinalPath("/a/b", "MKV"));
	EXPECT_EQ("/a/b.MKV", GetFinalPath("/a/b.MKV", "mkv"));
	EXPECT_EQ("/a/b.ts.mp4", GetFinalPath("/a/b.ts", "mp4"));
}

TEST_F(postproctest, plain_placement)
{
	auto staged = tmp / "dl/a.iso.part";
	WriteFile(staged, "payload");
	auto res = Run(Req(staged, tmp / "out/sub/a.iso"));
	ASSERT_TRUE(res.ok) << res.message;
	EXPECT_EQ(tmp / "out/sub/a.iso", res.finalPath);
	EXPECT_EQ("payload", ReadFile(res.finalPath));
	EXPECT_FALSE(Cstat(staged));
}

TEST_F(postproctest, torrent_staging_directory)
{
	// single-file torrent, the staging directory goes away with the asset
	auto staged = tmp / "a.iso.part/a.iso";
	WriteFile(staged, "payload");
	auto res = Run(Req(staged, tmp / "a.iso"));
	ASSERT_TRUE(res.ok) << res.message;
	EXPECT_EQ("payload", ReadFile(tmp / "a.iso"));
	EXPECT_FALSE(Cstat(tmp / "a.iso.part"));

	// other leftovers keep it
	staged = tmp / "b.iso.part/b.iso";
	WriteFile(staged, "payload");
	WriteFile(tmp / "b.iso.part/.unwanted", "x");
	res = Run(Req(staged, tmp / "b.iso"));
	ASSERT_TRUE(res.ok) << res.message;
	EXPECT_TRUE(Cstat(tmp / "b.iso.part").isDir());
	EXPECT_TRUE(Cstat(tmp / "b.iso.part/.unwanted").isReg());
}

TEST_F(postproctest, checksum_verification)
{
	auto staged = tmp / "a.part";
	WriteFile(staged, "payload");
	auto res = Run(Req(staged, tmp / "a", "", "sha256:239f59ed55e737c77147cf55ad0c1b030b6d7ee748a7426952f9b852d5a935e5"));
	ASSERT_TRUE(res.ok) << res.message;
	EXPECT_EQ("payload", ReadFile(tmp / "a"));

	// mismatch keeps the raw asset
	auto staged2 = tmp / "b.part";
	WriteFile(staged2, "payload, modified");
	res = Run(Req(staged2, tmp / "b", "", "239f59ed55e737c77147cf55ad0c1b030b6d7ee748a7426952f9b852d5a935e5"));
	EXPECT_FALSE(res.ok);
	EXPECT_THAT(res.message, StartsWith("Checksum mismatch, expected 239f59ed"));
	EXPECT_EQ(staged2, res.finalPath);
	EXPECT_TRUE(Cstat(staged2));
	EXPECT_FALSE(Cstat(tmp / "b"));

	res = Run(Req(staged2, tmp / "b", "", "crc:1234"));
	EXPECT_FALSE(res.ok);
	EXPECT_THAT(res.message, StartsWith("Unusable checksum"));
}

TEST_F(postproctest, remuxing)
{
	conf.ffmpegPath = MakeTool("ffmpeg", "cp \"$4\" \"$7\"");
	auto staged = tmp / "dl/movie.ts.part";
	WriteFile(staged, "frames");
	auto res = Run(Req(staged, tmp / "out/movie", "mkv"));
	ASSERT_TRUE(res.ok) << res.message;
	EXPECT_EQ(tmp / "out/movie.mkv", res.finalPath);
	EXPECT_EQ("frames", ReadFile(res.finalPath));
	EXPECT_FALSE(Cstat(staged));
	EXPECT_FALSE(Cstat(res.finalPath + ".remux.mkv"));
}

TEST_F(postproctest, remuxing_not_needed)
{
	conf.ffmpegPath = tmp / "not-there";
	auto staged = tmp / "movie.MKV.part";
	WriteFile(staged, "frames");
	auto res = Run(Req(staged, tmp / "out/movie", "mkv"));
	ASSERT_TRUE(res.ok) << res.message;
	EXPECT_EQ(tmp / "out/movie.mkv", res.finalPath);
	EXPECT_EQ("frames", ReadFile(res.finalPath));
}

TEST_F(postproctest, remuxing_failures)
{
	auto staged = tmp / "movie.ts";
	WriteFile(staged, "frames");

	conf.ffmpegPath = MakeTool("ffmpeg-broken", "exit 3");
	auto res = Run(Req(staged, tmp / "out/movie", "mp4"));
	EXPECT_FALSE(res.ok);
	EXPECT_EQ("Remuxing failed, exit code 3", res.message);
	EXPECT_EQ(staged, res.finalPath);
	EXPECT_TRUE(Cstat(staged));

	conf.ffmpegPath = tmp / "not-there";
	res = Run(Req(staged, tmp / "out/movie", "mp4"));
	EXPECT_FALSE(res.ok);
	EXPECT_EQ("Remuxing failed, cannot execute " + conf.ffmpegPath, res.message);

	// exits fine but writes nothing
	conf.ffmpegPath = MakeTool("ffmpeg-lazy", "exit 0");
	res = Run(Req(staged, tmp / "out/movie", "mp4"));
	EXPECT_FALSE(res.ok);
	EXPECT_EQ("Remuxing produced no output", res.message);
	EXPECT_TRUE(Cstat(staged));
	EXPECT_FALSE(Cstat(tmp / "out/movie.mp4"));
}

TEST_F(postproctest, remuxing_timeout)
{
	conf.ffmpegPath = MakeTool("ffmpeg-slow", "exec sleep 30");
	conf.timeout = 1;
	auto staged = tmp / "movie.ts";
	WriteFile(staged, "frames");
	auto started = time(0);
	auto res = Run(Req(staged, tmp / "movie", "mkv"));
	EXPECT_FALSE(res.ok);
	EXPECT_EQ("Remuxing timed out after 1s", res.message);
	EXPECT_LT(time(0) - started, 10);
	EXPECT_TRUE(Cstat(staged));
}

TEST_F(postproctest, remuxing_cancelled)
{
	conf.ffmpegPath = MakeTool("ffmpeg-slow", "exec sleep 30");
	auto staged = tmp / "movie.ts";
	WriteFile(staged, "frames");
	std::thread stopper([this]()
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(300));
		cancelled = true;
	});
	auto started = time(0);
	auto res = Run(Req(staged, tmp / "movie", "mkv"));
	stopper.join();
	EXPECT_FALSE(res.ok);
	EXPECT_EQ("Cancelled", res.message);
	EXPECT_LT(time(0) - started, 10);
	EXPECT_TRUE(Cstat(staged));
	EXPECT_FALSE(Cstat(tmp / "movie.mkv"));
}

TEST_F(postproctest, directories)
{
	auto staged = tmp / "show.part";
	WriteFile(staged + "/s01/e01.mkv", "one");
	WriteFile(staged + "/s01/e02.mkv", "two");

	auto res = Run(Req(staged, tmp / "show", "mp4"));
	EXPECT_FALSE(res.ok);
	EXPECT_EQ("Cannot remux a multi-file asset to mp4", res.message);

	res = Run(Req(staged, tmp / "show", "", "sha256:239f59ed55e737c77147cf55ad0c1b030b6d7ee748a7426952f9b852d5a935e5"));
	EXPECT_FALSE(res.ok);
	EXPECT_EQ(staged, res.finalPath);

	res = Run(Req(staged, tmp / "library/show"));
	ASSERT_TRUE(res.ok) << res.message;
	EXPECT_EQ("two", ReadFile(tmp / "library/show/s01/e02.mkv"));
	EXPECT_FALSE(Cstat(staged));
}

TEST_F(postproctest, missing_asset)
{
	cancelled = true;
	auto res = Run(Req(tmp / "gone.part", tmp / "gone"));
	EXPECT_FALSE(res.ok);
	EXPECT_EQ("Downloaded asset is missing", res.message);

	WriteFile(tmp / "here.part", "x");
	res = Run(Req(tmp / "here.part", tmp / "here"));
	EXPECT_FALSE(res.ok);
	EXPECT_EQ("Cancelled", res.message);
}

TEST(threadpool, runs_and_stops)
{
	auto pool = tpool::Create(100, 3, 1);
	std::atomic_int done { 0 };
	for (int i = 0; i < 20; ++i)
		ASSERT_TRUE(pool->schedule([&done]() { ++done; }));
	for (int i = 0; i < 500 && done.load() < 20; ++i)
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	EXPECT_EQ(20, done.load());

	// a failing task does not take the worker down
	ASSERT_TRUE(pool->schedule([]() { throw std::runtime_error("boom"); }));
	ASSERT_TRUE(pool->schedule([&done]() { ++done; }));
	for (int i = 0; i < 500 && done.load() < 21; ++i)
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	EXPECT_EQ(21, done.load());

	pool->stop();
	EXPECT_FALSE(pool->schedule([&done]() { ++done; }));
}

TEST(threadpool, stop_waits_for_running_task)
{
	auto pool = tpool::Create(100, 1, 0);
	std::atomic_bool started { false }, finished { false };
	ASSERT_TRUE(pool->schedule([&]()
	{
		started = true;
		std::this_thread::sleep_for(std::chrono::milliseconds(200));
		finished = true;
	}));
	for (int i = 0; i < 500 && !started.load(); ++i)
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	ASSERT_TRUE(started.load());
	pool->stop();
	EXPECT_TRUE(finished.load());
}
