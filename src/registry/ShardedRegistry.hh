/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "ShardStore.hh"

#include "util/Exception.hh"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace cgw {

/// \brief  Capacity-partitioned file registry.
///
/// New records always go to the current shard. Every lookup fans out to the
/// shards in order, 1 to K, one shard at a time, so each call costs O(K)
/// round trips.
class ShardedRegistry
{
public:
	struct Error : virtual Exception {};

	struct Page
	{
		std::vector<FileRecord> records;
		std::size_t total{};
	};

	struct ShardStats
	{
		std::string name;
		std::size_t files{};
	};

	struct Stats
	{
		std::size_t total_files{};
		std::int64_t total_size{};
		std::size_t unique_owners{};
		std::vector<ShardStats> shards;
	};

	using InsertCallback = ShardStore::InsertCallback;
	using UniqueCallback = std::function<void(FileRecord record, bool created, std::error_code)>;
	using FindCallback   = ShardStore::FindCallback;
	using BoolCallback   = ShardStore::BoolCallback;
	using ErrorCallback  = std::function<void(std::error_code)>;
	using PageCallback   = std::function<void(Page, std::error_code)>;
	using StatsCallback  = std::function<void(Stats, std::error_code)>;

public:
	/// \a current is 1-based.
	ShardedRegistry(std::vector<std::unique_ptr<ShardStore>> shards, std::size_t current);
	ShardedRegistry(const ShardedRegistry&) = delete;
	ShardedRegistry& operator=(const ShardedRegistry&) = delete;

	std::size_t size() const {return m_shards.size();}
	std::size_t current_shard() const {return m_current;}
	void current_shard(std::size_t current);
	ShardStore& shard(std::size_t index) const;

	void insert(const FileRecord& record, InsertCallback&& callback);
	void insert_unique(const FileRecord& record, UniqueCallback&& callback);
	void find_by_hash(const std::string& content_hash, FindCallback&& callback);
	void find_by_id(const FileID& id, FindCallback&& callback);

	/// Error::record_not_found if no shard holds \a id.
	void update_access(const FileID& id, ErrorCallback&& callback);

	/// \a page is 1-based. \a filter is a case-insensitive substring of the
	/// display name. Records are sorted by upload time, newest first.
	void list_page(const std::string& filter, std::size_t page, std::size_t page_size, PageCallback&& callback);
	void stats(StatsCallback&& callback);
	void remove(const FileID& id, BoolCallback&& callback);

private:
	using Collection = std::vector<std::vector<FileRecord>>;
	using CollectCallback = std::function<void(Collection, std::error_code)>;
	void collect(std::size_t index, Collection&& acc, CollectCallback&& callback);

	void increment_existing(FileRecord&& existing, UniqueCallback&& callback);

private:
	std::vector<std::unique_ptr<ShardStore>> m_shards;
	std::atomic<std::size_t> m_current;
};

} // end of namespace cgw
