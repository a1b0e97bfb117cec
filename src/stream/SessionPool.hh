/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "util/Exception.hh"

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace cgw {

class RemoteSession;

/// \brief  Fixed set of remote sessions with an advisory load counter each.
///
/// acquire() never blocks and never fails: it picks the session with the
/// smallest number of active leases, preferring the lowest index on ties.
class SessionPool
{
public:
	struct Error : virtual Exception {};

	class Lease
	{
	public:
		Lease() = default;
		Lease(SessionPool& pool, std::size_t index) : m_pool{&pool}, m_index{index} {}
		Lease(Lease&& other) noexcept;
		Lease(const Lease&) = delete;
		~Lease();

		Lease& operator=(Lease&& other) noexcept;
		Lease& operator=(const Lease&) = delete;

		RemoteSession& session() const;
		std::size_t index() const {return m_index;}
		explicit operator bool() const {return m_pool != nullptr;}

		/// Return the session to the pool. Further calls do nothing.
		void release();

	private:
		SessionPool *m_pool{};
		std::size_t m_index{};
	};

public:
	explicit SessionPool(std::vector<std::shared_ptr<RemoteSession>> sessions);
	SessionPool(const SessionPool&) = delete;
	SessionPool& operator=(const SessionPool&) = delete;

	[[nodiscard]] Lease acquire();
	void release(std::size_t index);

	std::size_t size() const {return m_sessions.size();}
	RemoteSession& session(std::size_t index) const {return *m_sessions.at(index);}
	std::vector<std::size_t> loads() const;

private:
	std::vector<std::shared_ptr<RemoteSession>> m_sessions;

	mutable std::mutex          m_mx;
	std::vector<std::size_t>    m_loads;
};

} // end of namespace cgw
