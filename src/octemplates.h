#ifndef OCTEMPLATES_H
#define OCTEMPLATES_H

#include <functional>
#include <utility>

namespace orca
{

using tAction = std::function<void()>;

template<typename T, typename V>
bool InRange(const T&a, const V&val, const T&b)
{
	return val >=a && val <= b;
}

// unique_ptr semantics (almost) on a non-pointer type
template<typename T, void TFreeFunc(T), T inval_default>
struct auto_raii
{
	T m_p;
	auto_raii() : m_p(inval_default) {}
	explicit auto_raii(T xp) : m_p(xp) {}
	~auto_raii()
	{
		if (m_p != inval_default)
			TFreeFunc(m_p);
	}
	T release()
	{
		auto ret = m_p;
		m_p = inval_default;
		return ret;
	}
	T get() const { return m_p; }
	auto_raii(const auto_raii&) = delete;
	auto_raii(auto_raii && other) : m_p(other.m_p)
	{
		other.m_p = inval_default;
	}
	auto_raii& reset(T rawNew)
	{
		if (m_p == rawNew)
			return *this;
		if(valid())
			TFreeFunc(m_p);
		m_p = rawNew;
		return *this;
	}
	void reset()
	{
		if (valid())
			TFreeFunc(m_p);
		m_p = inval_default;
	}
	bool valid() const { return inval_default != m_p;}
};

/**
 * @brief Single-owner function carrier.
 *
 * Runs the action ONCE when the carrier is destroyed or reset. Used as
 * cancellation token for timers and as subscription handle.
 */
struct TFinalAction
{
private:
	tAction m_p;
public:
	TFinalAction() =default;
	explicit TFinalAction(tAction&& xp)
		: m_p(std::move(xp))
	{
	}
	~TFinalAction()
	{
		if (m_p)
			m_p();
	}
	TFinalAction(const TFinalAction&) = delete;
	TFinalAction(TFinalAction&& other)
	{
		m_p.swap(other.m_p);
	}
	TFinalAction& operator=(TFinalAction &&other)
	{
		if (&other == this)
			return *this;
		reset();
		m_p.swap(other.m_p);
		return *this;
	}
	void reset()
	{
		tAction todo;
		todo.swap(m_p);
		if (todo)
			todo();
	}
	// forget the action without running it
	void release()
	{
		m_p = tAction();
	}
	operator bool() const { return m_p.operator bool(); }
};

}

#endif // OCTEMPLATES_H
