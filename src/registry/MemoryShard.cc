/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "MemoryShard.hh"

namespace cgw {

void MemoryShard::insert(const FileRecord& record, InsertCallback&& callback)
{
	std::unique_lock lock{m_mx};
	if (auto it = m_hashes.find(record.content_hash); it != m_hashes.end())
	{
		auto existing = it->second;
		lock.unlock();
		callback(existing, false, {});
		return;
	}

	m_files.insert_or_assign(record.id, record);
	m_hashes.emplace(record.content_hash, record.id);
	lock.unlock();

	callback(record.id, true, {});
}

std::optional<FileRecord> MemoryShard::find(const FileID& id) const
{
	std::unique_lock lock{m_mx};
	auto it = m_files.find(id);
	return it != m_files.end() ? std::optional<FileRecord>{it->second} : std::nullopt;
}

void MemoryShard::find_by_hash(const std::string& content_hash, FindCallback&& callback)
{
	std::optional<FileID> id;
	{
		std::unique_lock lock{m_mx};
		if (auto it = m_hashes.find(content_hash); it != m_hashes.end())
			id = it->second;
	}
	callback(id ? find(*id) : std::nullopt, {});
}

void MemoryShard::find_by_id(const FileID& id, FindCallback&& callback)
{
	callback(find(id), {});
}

void MemoryShard::increment_access(const FileID& id, BoolCallback&& callback)
{
	std::unique_lock lock{m_mx};
	auto it = m_files.find(id);
	auto found = (it != m_files.end());
	if (found)
		++it->second.access_count;
	lock.unlock();

	callback(found, {});
}

void MemoryShard::remove(const FileID& id, BoolCallback&& callback)
{
	std::unique_lock lock{m_mx};
	auto it = m_files.find(id);
	auto found = (it != m_files.end());
	if (found)
	{
		if (auto hit = m_hashes.find(it->second.content_hash); hit != m_hashes.end() && hit->second == id)
			m_hashes.erase(hit);
		m_files.erase(it);
	}
	lock.unlock();

	callback(found, {});
}

void MemoryShard::find_all(ListCallback&& callback)
{
	std::vector<FileRecord> result;
	{
		std::unique_lock lock{m_mx};
		result.reserve(m_files.size());
		for (auto&& [id, record] : m_files)
			result.push_back(record);
	}
	callback(std::move(result), {});
}

std::size_t MemoryShard::size() const
{
	std::unique_lock lock{m_mx};
	return m_files.size();
}

} // end of namespace cgw
