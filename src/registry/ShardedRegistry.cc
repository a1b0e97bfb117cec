/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "ShardedRegistry.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/exception/info.hpp>

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace cgw {
namespace {

using Shards = std::vector<std::unique_ptr<ShardStore>>;

// Visit shards from index onwards until one of them finds a record.
template <typename Operation>
void find_first(const Shards& shards, std::size_t index, Operation op, ShardStore::FindCallback&& callback)
{
	if (index >= shards.size())
		return callback(std::nullopt, {});

	op(*shards[index], [&shards, index, op, callback=std::move(callback)](std::optional<FileRecord> record, std::error_code ec) mutable
	{
		if (ec || record)
			return callback(std::move(record), ec);

		find_first(shards, index + 1, op, std::move(callback));
	});
}

// Visit shards from index onwards until one of them reports true.
template <typename Operation>
void first_true(const Shards& shards, std::size_t index, Operation op, ShardStore::BoolCallback&& callback)
{
	if (index >= shards.size())
		return callback(false, {});

	op(*shards[index], [&shards, index, op, callback=std::move(callback)](bool done, std::error_code ec) mutable
	{
		if (ec || done)
			return callback(done, ec);

		first_true(shards, index + 1, op, std::move(callback));
	});
}

} // end of local namespace

ShardedRegistry::ShardedRegistry(std::vector<std::unique_ptr<ShardStore>> shards, std::size_t current) :
	m_shards{std::move(shards)},
	m_current{current}
{
	if (m_shards.empty())
		BOOST_THROW_EXCEPTION(Error() << Message{"registry requires at least one shard"});

	current_shard(current);
}

void ShardedRegistry::current_shard(std::size_t current)
{
	if (current < 1 || current > m_shards.size())
		BOOST_THROW_EXCEPTION(Error() << Message{"current shard out of range: " + std::to_string(current)});

	m_current = current;
}

ShardStore& ShardedRegistry::shard(std::size_t index) const
{
	if (index < 1 || index > m_shards.size())
		BOOST_THROW_EXCEPTION(Error() << Message{"shard out of range: " + std::to_string(index)});

	return *m_shards[index-1];
}

void ShardedRegistry::insert(const FileRecord& record, InsertCallback&& callback)
{
	shard(m_current).insert(record, std::move(callback));
}

void ShardedRegistry::insert_unique(const FileRecord& record, UniqueCallback&& callback)
{
	find_by_hash(record.content_hash, [this, record, callback=std::move(callback)](auto existing, auto ec) mutable
	{
		if (ec)
			return callback(std::move(record), false, ec);

		if (existing)
			return increment_existing(std::move(*existing), std::move(callback));

		insert(record, [this, record, callback=std::move(callback)](FileID stored, bool inserted, std::error_code ec) mutable
		{
			if (ec || inserted)
				return callback(std::move(record), inserted, ec);

			// another upload of the same content got into the current shard first
			find_by_id(stored, [this, record, callback=std::move(callback)](auto existing, auto ec) mutable
			{
				if (ec || !existing)
					return callback(std::move(record), false, ec ? ec : std::error_code{cgw::Error::registry_io});

				increment_existing(std::move(*existing), std::move(callback));
			});
		});
	});
}

void ShardedRegistry::increment_existing(FileRecord&& existing, UniqueCallback&& callback)
{
	auto id = existing.id;
	update_access(id, [existing=std::move(existing), callback=std::move(callback)](std::error_code ec) mutable
	{
		if (!ec)
			++existing.access_count;
		callback(std::move(existing), false, ec);
	});
}

void ShardedRegistry::find_by_hash(const std::string& content_hash, FindCallback&& callback)
{
	find_first(m_shards, 0, [content_hash](ShardStore& shard, FindCallback&& next)
	{
		shard.find_by_hash(content_hash, std::move(next));
	}, std::move(callback));
}

void ShardedRegistry::find_by_id(const FileID& id, FindCallback&& callback)
{
	find_first(m_shards, 0, [id](ShardStore& shard, FindCallback&& next)
	{
		shard.find_by_id(id, std::move(next));
	}, std::move(callback));
}

void ShardedRegistry::update_access(const FileID& id, ErrorCallback&& callback)
{
	first_true(m_shards, 0, [id](ShardStore& shard, BoolCallback&& next)
	{
		shard.increment_access(id, std::move(next));
	}, [callback=std::move(callback)](bool found, std::error_code ec)
	{
		callback(ec ? ec : (found ? std::error_code{} : std::error_code{cgw::Error::record_not_found}));
	});
}

void ShardedRegistry::remove(const FileID& id, BoolCallback&& callback)
{
	first_true(m_shards, 0, [id](ShardStore& shard, BoolCallback&& next)
	{
		shard.remove(id, std::move(next));
	}, [id, callback=std::move(callback)](bool removed, std::error_code ec)
	{
		if (removed)
			Log(LOG_NOTICE, "file %1% removed from registry", id);
		callback(removed, ec);
	});
}

void ShardedRegistry::collect(std::size_t index, Collection&& acc, CollectCallback&& callback)
{
	if (index >= m_shards.size())
		return callback(std::move(acc), {});

	m_shards[index]->find_all([this, index, acc=std::move(acc), callback=std::move(callback)](auto records, auto ec) mutable
	{
		if (ec)
			return callback({}, ec);

		acc.push_back(std::move(records));
		collect(index + 1, std::move(acc), std::move(callback));
	});
}

void ShardedRegistry::list_page(const std::string& filter, std::size_t page, std::size_t page_size, PageCallback&& callback)
{
	collect(0, {}, [filter, page, page_size, callback=std::move(callback)](Collection shards, std::error_code ec)
	{
		if (ec)
			return callback({}, ec);

		std::vector<FileRecord> all;
		for (auto&& records : shards)
		{
			for (auto&& record : records)
			{
				if (filter.empty() || boost::algorithm::icontains(record.display_name, filter))
					all.push_back(std::move(record));
			}
		}

		std::stable_sort(all.begin(), all.end(), [](auto& lhs, auto& rhs)
		{
			return lhs.uploaded_at > rhs.uploaded_at;
		});

		Page result;
		result.total = all.size();

		auto first = std::max<std::size_t>(page, 1) - 1;
		if (page_size > 0 && first <= all.size() / page_size)
		{
			auto begin = std::min(all.size(), first * page_size);
			auto end   = std::min(all.size(), begin + page_size);
			std::move(all.begin() + begin, all.begin() + end, std::back_inserter(result.records));
		}
		callback(std::move(result), {});
	});
}

void ShardedRegistry::stats(StatsCallback&& callback)
{
	collect(0, {}, [this, callback=std::move(callback)](Collection shards, std::error_code ec)
	{
		if (ec)
			return callback({}, ec);

		Stats result;
		std::unordered_set<std::int64_t> owners;
		for (std::size_t i = 0; i < shards.size(); ++i)
		{
			result.shards.push_back({m_shards[i]->name(), shards[i].size()});
			result.total_files += shards[i].size();
			for (auto&& record : shards[i])
			{
				result.total_size += record.size;
				owners.insert(record.owner);
			}
		}
		result.unique_owners = owners.size();
		callback(std::move(result), {});
	});
}

} // end of namespace cgw
