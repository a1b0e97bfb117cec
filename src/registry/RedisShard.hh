/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "ShardStore.hh"

#include "net/Redis.hh"

#include <boost/asio/io_context.hpp>

#include <memory>

namespace cgw {

/// \brief  A shard stored in three redis hashes.
///
/// <name>:files maps the hex ID to the record in JSON without its access
/// count, <name>:access maps the hex ID to the access count and
/// <name>:hashes maps the content hash to the hex ID. All writes are Lua
/// scripts so each of them is atomic.
class RedisShard : public ShardStore
{
public:
	RedisShard(boost::asio::io_context& ioc, std::string name, const boost::asio::ip::tcp::endpoint& remote);

	const std::string& name() const override {return m_name;}

	void insert(const FileRecord& record, InsertCallback&& callback) override;
	void find_by_hash(const std::string& content_hash, FindCallback&& callback) override;
	void find_by_id(const FileID& id, FindCallback&& callback) override;
	void increment_access(const FileID& id, BoolCallback&& callback) override;
	void remove(const FileID& id, BoolCallback&& callback) override;
	void find_all(ListCallback&& callback) override;

private:
	std::shared_ptr<redis::Connection> connect(std::error_code& ec);

	static std::optional<FileRecord> parse(const redis::Reply& json, const redis::Reply& access, std::error_code& ec);

private:
	const std::string m_name;
	const std::string m_files;
	const std::string m_access;
	const std::string m_hashes;

	redis::Pool m_pool;
};

} // end of namespace cgw
