/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "FileRecord.hh"

#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cgw {

/// \brief  One partition of the file registry.
///
/// Every operation completes through its callback exactly once. Backends
/// may call it synchronously from within the operation.
class ShardStore
{
public:
	/// \a stored is the ID of the record holding the content hash after the
	/// call. It differs from the ID of the inserted record if \a inserted is false.
	using InsertCallback = std::function<void(FileID stored, bool inserted, std::error_code)>;
	using FindCallback   = std::function<void(std::optional<FileRecord>, std::error_code)>;
	using BoolCallback   = std::function<void(bool, std::error_code)>;
	using ListCallback   = std::function<void(std::vector<FileRecord>, std::error_code)>;

public:
	virtual ~ShardStore() = default;

	virtual const std::string& name() const = 0;

	/// Atomically insert \a record unless a record with the same content hash exists.
	virtual void insert(const FileRecord& record, InsertCallback&& callback) = 0;
	virtual void find_by_hash(const std::string& content_hash, FindCallback&& callback) = 0;
	virtual void find_by_id(const FileID& id, FindCallback&& callback) = 0;

	/// Reports false if there is no such record.
	virtual void increment_access(const FileID& id, BoolCallback&& callback) = 0;
	virtual void remove(const FileID& id, BoolCallback&& callback) = 0;
	virtual void find_all(ListCallback&& callback) = 0;
};

} // end of namespace cgw
