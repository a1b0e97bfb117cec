/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "SessionPool.hh"
#include "RemoteSession.hh"

#include "util/Log.hh"

#include <boost/exception/info.hpp>

#include <algorithm>
#include <utility>

namespace cgw {

SessionPool::SessionPool(std::vector<std::shared_ptr<RemoteSession>> sessions) :
	m_sessions{std::move(sessions)},
	m_loads(m_sessions.size(), 0)
{
	if (m_sessions.empty() || std::find(m_sessions.begin(), m_sessions.end(), nullptr) != m_sessions.end())
		BOOST_THROW_EXCEPTION(Error() << Message{"session pool requires at least one valid session"});
}

SessionPool::Lease SessionPool::acquire()
{
	std::unique_lock lock{m_mx};

	// min_element() returns the first minimum, i.e. the lowest index on ties
	auto index = static_cast<std::size_t>(std::min_element(m_loads.begin(), m_loads.end()) - m_loads.begin());
	++m_loads[index];
	return Lease{*this, index};
}

void SessionPool::release(std::size_t index)
{
	std::unique_lock lock{m_mx};
	if (index < m_loads.size() && m_loads[index] > 0)
		--m_loads[index];
	else
		Log(LOG_WARNING, "releasing session %1% which has no active lease", index);
}

std::vector<std::size_t> SessionPool::loads() const
{
	std::unique_lock lock{m_mx};
	return m_loads;
}

SessionPool::Lease::Lease(Lease&& other) noexcept :
	m_pool{std::exchange(other.m_pool, nullptr)},
	m_index{other.m_index}
{
}

SessionPool::Lease::~Lease()
{
	release();
}

SessionPool::Lease& SessionPool::Lease::operator=(Lease&& other) noexcept
{
	if (this != &other)
	{
		release();
		m_pool  = std::exchange(other.m_pool, nullptr);
		m_index = other.m_index;
	}
	return *this;
}

RemoteSession& SessionPool::Lease::session() const
{
	if (!m_pool)
		BOOST_THROW_EXCEPTION(Error() << Message{"lease already released"});
	return m_pool->session(m_index);
}

void SessionPool::Lease::release()
{
	if (auto pool = std::exchange(m_pool, nullptr))
		pool->release(m_index);
}

} // end of namespace cgw
