/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "FileID.hh"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace cgw {

struct PendingAssociation
{
	FileID      id;
	std::string display_name;
	std::string size_label;
	std::chrono::steady_clock::time_point created;
};

/// \brief  Remembers which registry record an inbound interaction refers to,
/// for a limited time.
///
/// Entries live in memory only and are lost on restart. put() and get() drop
/// the expired entries of their own user. The server calls sweep()
/// periodically for everyone else.
class PendingAssociationCache
{
public:
	using Clock = std::chrono::steady_clock;

public:
	explicit PendingAssociationCache(std::chrono::seconds ttl = std::chrono::hours{24}) : m_ttl{ttl} {}

	/// Overwrites any previous entry of the same interaction. The creation
	/// time is taken from \a value if set, otherwise from \a now.
	void put(std::int64_t user, std::int64_t interaction, PendingAssociation value, Clock::time_point now = Clock::now());
	std::optional<PendingAssociation> get(std::int64_t user, std::int64_t interaction, Clock::time_point now = Clock::now());

	/// Drop all entries older than the TTL and return the number dropped.
	std::size_t sweep(Clock::time_point now = Clock::now());

	std::size_t size() const;
	std::size_t users() const;
	std::chrono::seconds ttl() const {return m_ttl;}

private:
	using Interactions = std::map<std::int64_t, PendingAssociation>;

	bool expired(const PendingAssociation& entry, Clock::time_point now) const;
	std::size_t sweep_interactions(Interactions& interactions, Clock::time_point now) const;
	std::size_t sweep_locked(Clock::time_point now);

private:
	const std::chrono::seconds m_ttl;

	mutable std::mutex m_mx;
	std::map<std::int64_t, Interactions> m_entries;
};

} // end of namespace cgw
