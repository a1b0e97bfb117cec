/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "PendingAssociationCache.hh"

namespace cgw {

bool PendingAssociationCache::expired(const PendingAssociation& entry, Clock::time_point now) const
{
	return now - entry.created > m_ttl;
}

void PendingAssociationCache::put(std::int64_t user, std::int64_t interaction, PendingAssociation value, Clock::time_point now)
{
	if (value.created == Clock::time_point{})
		value.created = now;

	std::unique_lock lock{m_mx};
	auto& interactions = m_entries[user];
	sweep_interactions(interactions, now);
	interactions.insert_or_assign(interaction, std::move(value));
}

std::optional<PendingAssociation> PendingAssociationCache::get(std::int64_t user, std::int64_t interaction, Clock::time_point now)
{
	std::unique_lock lock{m_mx};

	auto uit = m_entries.find(user);
	if (uit == m_entries.end())
		return std::nullopt;

	sweep_interactions(uit->second, now);

	std::optional<PendingAssociation> result;
	if (auto it = uit->second.find(interaction); it != uit->second.end())
		result = it->second;

	if (uit->second.empty())
		m_entries.erase(uit);
	return result;
}

std::size_t PendingAssociationCache::sweep(Clock::time_point now)
{
	std::unique_lock lock{m_mx};
	return sweep_locked(now);
}

std::size_t PendingAssociationCache::sweep_interactions(Interactions& interactions, Clock::time_point now) const
{
	std::size_t count = 0;
	for (auto it = interactions.begin(); it != interactions.end(); )
	{
		if (expired(it->second, now))
		{
			it = interactions.erase(it);
			++count;
		}
		else
			++it;
	}
	return count;
}

std::size_t PendingAssociationCache::sweep_locked(Clock::time_point now)
{
	std::size_t count = 0;
	for (auto uit = m_entries.begin(); uit != m_entries.end(); )
	{
		count += sweep_interactions(uit->second, now);

		// no empty sub-maps
		uit = uit->second.empty() ? m_entries.erase(uit) : std::next(uit);
	}
	return count;
}

std::size_t PendingAssociationCache::size() const
{
	std::unique_lock lock{m_mx};
	std::size_t count = 0;
	for (auto&& [user, interactions] : m_entries)
		count += interactions.size();
	return count;
}

std::size_t PendingAssociationCache::users() const
{
	std::unique_lock lock{m_mx};
	return m_entries.size();
}

} // end of namespace cgw
