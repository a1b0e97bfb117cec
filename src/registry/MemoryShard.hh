/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "ShardStore.hh"

#include <mutex>
#include <unordered_map>

namespace cgw {

/// In-process shard guarded by a mutex. Callbacks are called synchronously.
class MemoryShard : public ShardStore
{
public:
	explicit MemoryShard(std::string name) : m_name{std::move(name)} {}

	const std::string& name() const override {return m_name;}

	void insert(const FileRecord& record, InsertCallback&& callback) override;
	void find_by_hash(const std::string& content_hash, FindCallback&& callback) override;
	void find_by_id(const FileID& id, FindCallback&& callback) override;
	void increment_access(const FileID& id, BoolCallback&& callback) override;
	void remove(const FileID& id, BoolCallback&& callback) override;
	void find_all(ListCallback&& callback) override;

	std::size_t size() const;

private:
	std::optional<FileRecord> find(const FileID& id) const;

private:
	const std::string m_name;

	mutable std::mutex m_mx;
	std::unordered_map<FileID, FileRecord>  m_files;
	std::unordered_map<std::string, FileID> m_hashes;
};

} // end of namespace cgw
