#include "main.h"

#include "jobqueue.h"

static tQueueEntry mk(LPCSTR id, int prio, uint64_t seq)
{
	return tQueueEntry { id, prio, seq };
}

TEST(jobqueue, fifo_per_priority)
{
	tJobPrioQ q;
	q.push(mk("a", 0, 1));
	q.push(mk("b", 0, 2));
	q.push(mk("c", 5, 3));
	q.push(mk("d", 0, 4));
	q.push(mk("e", 5, 5));
	q.push(mk("f", -1, 6));
	ASSERT_EQ(6u, q.size());
	EXPECT_EQ("c", q.top().id);

	std::vector<mstring> order;
	while (!q.empty())
		order.emplace_back(q.pop().id);
	EXPECT_EQ(std::vector<mstring>({"c", "e", "a", "b", "d", "f"}), order);
}

TEST(jobqueue, removal)
{
	tJobPrioQ q;
	for (unsigned i = 1; i <= 20; ++i)
		q.push(mk(std::to_string(i).c_str(), i % 3, i));
	EXPECT_TRUE(q.contains("7"));
	EXPECT_TRUE(q.erase("7"));
	EXPECT_FALSE(q.contains("7"));
	EXPECT_FALSE(q.erase("7"));
	EXPECT_FALSE(q.erase("nope"));
	ASSERT_EQ(19u, q.size());

	// heap order survives the removal
	int lastPrio = 100;
	uint64_t lastSeq = 0;
	while (!q.empty())
	{
		auto e = q.pop();
		ASSERT_LE(e.priority, lastPrio);
		if (e.priority == lastPrio)
			ASSERT_GT(e.seq, lastSeq);
		lastPrio = e.priority;
		lastSeq = e.seq;
	}
	q.push(mk("x", 0, 1));
	q.clear();
	EXPECT_TRUE(q.empty());
}
