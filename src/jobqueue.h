#ifndef JOBQUEUE_H
#define JOBQUEUE_H

#include "jobtypes.h"

#include <vector>

namespace orca
{

struct tQueueEntry
{
	tJobId id;
	int priority = 0;
	uint64_t seq = 0;
};

/**
 * Admission queue of one backend kind: higher priority first, then submission order.
 * Priority queue which also supports removal of specific entries.
 */
class ORCA_API tJobPrioQ
{
public:
	struct tCompEntry
	{
		bool operator() (const tQueueEntry &a, const tQueueEntry &b) const;
	} m_comparator;

	void push(tQueueEntry element);
	tQueueEntry pop();
	const tQueueEntry& top() const { return m_data.at(0); }
	bool empty() const { return m_data.empty(); }
	size_t size() const { return m_data.size(); }
	void clear() { m_data.clear(); }
	// false if not queued
	bool erase(const tJobId& id);
	bool contains(const tJobId& id) const;
private:
	std::vector<tQueueEntry> m_data;
};

}

#endif // JOBQUEUE_H
