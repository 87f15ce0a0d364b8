#include "jobqueue.h"

#include <algorithm>

using namespace std;

namespace orca
{

bool tJobPrioQ::tCompEntry::operator()(const tQueueEntry &a, const tQueueEntry &b) const
{
	// max-heap on priority, then a min-heap on the sequence
	if (a.priority != b.priority)
		return a.priority < b.priority;
	return b.seq < a.seq;
}

void tJobPrioQ::push(tQueueEntry element)
{
	m_data.push_back(move(element));
	push_heap(m_data.begin(), m_data.end(), m_comparator);
}

tQueueEntry tJobPrioQ::pop()
{
	pop_heap(m_data.begin(), m_data.end(), m_comparator);
	auto ret = move(m_data.back());
	m_data.pop_back();
	return ret;
}

bool tJobPrioQ::erase(const tJobId &id)
{
	auto it = find_if(m_data.begin(), m_data.end(), [&id](const tQueueEntry& e) { return e.id == id; });
	if (it == m_data.end())
		return false;
	m_data.erase(it);
	make_heap(m_data.begin(), m_data.end(), m_comparator);
	return true;
}

bool tJobPrioQ::contains(const tJobId &id) const
{
	return any_of(m_data.begin(), m_data.end(), [&id](const tQueueEntry& e) { return e.id == id; });
}

}
