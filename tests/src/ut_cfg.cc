#include "main.h"

#include "ocfg.h"

// values are global, keep them sane for the other tests
class cfgtest : public testing::Test
{
protected:
	mstring m_statedir = cfg::statedir, m_policy = cfg::mirrorpolicy, m_lat = cfg::locallat,
			m_lon = cfg::locallon, m_country = cfg::localcountry;
	int m_httpslots = cfg::httpslots, m_port = cfg::port, m_dirperms = cfg::dirperms,
			m_backoffmax = cfg::backoffmax;
	void SetUp() override
	{
		cfg::g_bQuiet = true;
	}
	void TearDown() override
	{
		cfg::statedir = m_statedir;
		cfg::mirrorpolicy = m_policy;
		cfg::locallat = m_lat;
		cfg::locallon = m_lon;
		cfg::localcountry = m_country;
		cfg::httpslots = m_httpslots;
		cfg::port = m_port;
		cfg::dirperms = m_dirperms;
		cfg::backoffmax = m_backoffmax;
		cfg::PostProcConfig();
		cfg::g_bQuiet = false;
	}
};

TEST_F(cfgtest, set_options)
{
	ASSERT_TRUE(cfg::SetOption("HttpSlots: 7"));
	EXPECT_EQ(7, cfg::httpslots);
	ASSERT_TRUE(cfg::SetOption("httpslots=9"));
	EXPECT_EQ(9, cfg::httpslots);
	// legacy alias
	ASSERT_TRUE(cfg::SetOption("MaxActiveDownloads = 3"));
	EXPECT_EQ(3, cfg::httpslots);
	ASSERT_TRUE(cfg::SetOption("DirPerms: 0750"));
	EXPECT_EQ(0750, cfg::dirperms);
	ASSERT_TRUE(cfg::SetOption("StateDir: /var/lib/foo/"));
	EXPECT_EQ("/var/lib/foo/", cfg::statedir);

	EXPECT_FALSE(cfg::SetOption("HttpSlots: many"));
	EXPECT_EQ(3, cfg::httpslots);
	EXPECT_FALSE(cfg::SetOption("NoSuchThing: 1"));
	EXPECT_FALSE(cfg::SetOption("no separator"));

	EXPECT_EQ(&cfg::mirrorpolicy, cfg::GetStringPtr("mirrorpolicy"));
	EXPECT_EQ(&cfg::port, cfg::GetIntPtr("Port"));
	EXPECT_EQ(nullptr, cfg::GetIntPtr("MirrorPolicy"));
}

TEST_F(cfgtest, postprocessing)
{
	cfg::httpslots = 0;
	cfg::statedir = "/var/lib/foo//";
	cfg::localcountry = "DE";
	ASSERT_EQ("", cfg::PostProcConfig());
	EXPECT_EQ(1, cfg::httpslots);
	EXPECT_EQ("/var/lib/foo", cfg::statedir);
	EXPECT_EQ("de", cfg::localcountry);
	EXPECT_EQ("/var/lib/foo/jobs.ckpt.gz", cfg::GetCheckpointPath());
	EXPECT_FALSE(cfg::haveLocalPosition);

	cfg::locallat = "52.5";
	cfg::locallon = "13.4";
	ASSERT_EQ("", cfg::PostProcConfig());
	EXPECT_TRUE(cfg::haveLocalPosition);
	EXPECT_DOUBLE_EQ(52.5, cfg::localLatitude);

	cfg::locallat = "95";
	EXPECT_NE("", cfg::PostProcConfig());
	cfg::locallat = cfg::locallon = "";

	cfg::mirrorpolicy = "random";
	EXPECT_NE("", cfg::PostProcConfig());
	cfg::mirrorpolicy = "declared";

	cfg::port = 70000;
	EXPECT_NE("", cfg::PostProcConfig());
	cfg::port = 0;

	cfg::statedir = "";
	ASSERT_EQ("", cfg::PostProcConfig());
	EXPECT_EQ("", cfg::GetCheckpointPath());
}
