/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "RedisShard.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <unordered_map>

namespace cgw {

RedisShard::RedisShard(boost::asio::io_context& ioc, std::string name, const boost::asio::ip::tcp::endpoint& remote) :
	m_name{std::move(name)},
	m_files{m_name + ":files"},
	m_access{m_name + ":access"},
	m_hashes{m_name + ":hashes"},
	m_pool{ioc, remote}
{
}

std::shared_ptr<redis::Connection> RedisShard::connect(std::error_code& ec)
{
	try
	{
		return m_pool.alloc();
	}
	catch (boost::system::system_error& e)
	{
		Log(LOG_ERR, "cannot connect to redis shard %1% at %2%: %3%", m_name, m_pool.remote(), e.what());
		ec = Error::registry_io;
		return {};
	}
}

std::optional<FileRecord> RedisShard::parse(const redis::Reply& json, const redis::Reply& access, std::error_code& ec)
{
	if (!json.is_string())
		return std::nullopt;

	auto parsed = nlohmann::json::parse(json.as_string(), nullptr, false);
	try
	{
		auto record = parsed.get<FileRecord>();
		record.access_count = access.to_int();
		return record;
	}
	catch (std::exception& e)
	{
		Log(LOG_WARNING, "invalid record in redis: %1%", e.what());
		ec = Error::registry_io;
		return std::nullopt;
	}
}

void RedisShard::insert(const FileRecord& record, InsertCallback&& callback)
{
	std::error_code ec;
	auto db = connect(ec);
	if (!db)
		return callback(record.id, false, ec);

	auto json = nlohmann::json(record);
	json.erase("access_count");
	auto str    = json.dump();
	auto id     = record.id.hex();
	auto access = std::to_string(record.access_count);

	static const char lua[] = R"__(
		local id, hash, record, access = ARGV[1], ARGV[2], ARGV[3], ARGV[4]
		local existing = redis.call('HGET', KEYS[3], hash)
		if existing then
			return {0, existing}
		end

		redis.call('HSET', KEYS[1], id, record)
		redis.call('HSET', KEYS[2], id, access)
		redis.call('HSET', KEYS[3], hash, id)
		return {1, id}
	)__";
	db->command(
		[callback=std::move(callback), fallback=record.id](auto&& reply, auto ec) mutable
		{
			if (!reply || ec)
			{
				Log(LOG_WARNING, "RedisShard::insert(): reply %1% %2%", reply.as_error(), ec);
				return callback(fallback, false, ec ? ec : std::error_code{Error::registry_io});
			}

			auto stored = FileID::from_hex(reply[1].as_string());
			if (!stored)
				return callback(fallback, false, Error::registry_io);

			callback(*stored, reply[0].as_int() == 1, {});
		},
		"EVAL %s 3 %b %b %b   %b %b %b %b", lua,

		// KEYS[1], KEYS[2], KEYS[3]: files, access and hashes
		m_files.data(), m_files.size(),
		m_access.data(), m_access.size(),
		m_hashes.data(), m_hashes.size(),

		// ARGV[1]: hex ID
		id.data(), id.size(),

		// ARGV[2]: content hash
		record.content_hash.data(), record.content_hash.size(),

		// ARGV[3]: record JSON
		str.data(), str.size(),

		// ARGV[4]: initial access count
		access.data(), access.size()
	);
}

void RedisShard::find_by_hash(const std::string& content_hash, FindCallback&& callback)
{
	std::error_code ec;
	auto db = connect(ec);
	if (!db)
		return callback(std::nullopt, ec);

	static const char lua[] = R"__(
		local id = redis.call('HGET', KEYS[1], ARGV[1])
		if not id then
			return false
		end
		return {redis.call('HGET', KEYS[2], id), redis.call('HGET', KEYS[3], id)}
	)__";
	db->command(
		[callback=std::move(callback)](auto&& reply, auto ec) mutable
		{
			if (reply.is_error() || ec)
			{
				Log(LOG_WARNING, "RedisShard::find_by_hash(): reply %1% %2%", reply.as_error(), ec);
				return callback(std::nullopt, ec ? ec : std::error_code{Error::registry_io});
			}

			auto record = parse(reply[0], reply[1], ec);
			callback(std::move(record), ec);
		},
		"EVAL %s 3 %b %b %b   %b", lua,
		m_hashes.data(), m_hashes.size(),
		m_files.data(), m_files.size(),
		m_access.data(), m_access.size(),
		content_hash.data(), content_hash.size()
	);
}

void RedisShard::find_by_id(const FileID& id, FindCallback&& callback)
{
	std::error_code ec;
	auto db = connect(ec);
	if (!db)
		return callback(std::nullopt, ec);

	auto hex = id.hex();
	static const char lua[] = R"__(
		local record = redis.call('HGET', KEYS[1], ARGV[1])
		if not record then
			return false
		end
		return {record, redis.call('HGET', KEYS[2], ARGV[1])}
	)__";
	db->command(
		[callback=std::move(callback)](auto&& reply, auto ec) mutable
		{
			if (reply.is_error() || ec)
			{
				Log(LOG_WARNING, "RedisShard::find_by_id(): reply %1% %2%", reply.as_error(), ec);
				return callback(std::nullopt, ec ? ec : std::error_code{Error::registry_io});
			}

			auto record = parse(reply[0], reply[1], ec);
			callback(std::move(record), ec);
		},
		"EVAL %s 2 %b %b   %b", lua,
		m_files.data(), m_files.size(),
		m_access.data(), m_access.size(),
		hex.data(), hex.size()
	);
}

void RedisShard::increment_access(const FileID& id, BoolCallback&& callback)
{
	std::error_code ec;
	auto db = connect(ec);
	if (!db)
		return callback(false, ec);

	auto hex = id.hex();
	static const char lua[] = R"__(
		if redis.call('HEXISTS', KEYS[1], ARGV[1]) == 0 then
			return 0
		end
		redis.call('HINCRBY', KEYS[2], ARGV[1], 1)
		return 1
	)__";
	db->command(
		[callback=std::move(callback)](auto&& reply, auto ec) mutable
		{
			if (!reply || ec)
			{
				Log(LOG_WARNING, "RedisShard::increment_access(): reply %1% %2%", reply.as_error(), ec);
				return callback(false, ec ? ec : std::error_code{Error::registry_io});
			}
			callback(reply.as_int() == 1, {});
		},
		"EVAL %s 2 %b %b   %b", lua,
		m_files.data(), m_files.size(),
		m_access.data(), m_access.size(),
		hex.data(), hex.size()
	);
}

void RedisShard::remove(const FileID& id, BoolCallback&& callback)
{
	std::error_code ec;
	auto db = connect(ec);
	if (!db)
		return callback(false, ec);

	auto hex = id.hex();
	static const char lua[] = R"__(
		local record = redis.call('HGET', KEYS[1], ARGV[1])
		if not record then
			return 0
		end

		local hash = cjson.decode(record)['content_hash']
		redis.call('HDEL', KEYS[1], ARGV[1])
		redis.call('HDEL', KEYS[2], ARGV[1])
		if hash and redis.call('HGET', KEYS[3], hash) == ARGV[1] then
			redis.call('HDEL', KEYS[3], hash)
		end
		return 1
	)__";
	db->command(
		[callback=std::move(callback)](auto&& reply, auto ec) mutable
		{
			if (!reply || ec)
			{
				Log(LOG_WARNING, "RedisShard::remove(): reply %1% %2%", reply.as_error(), ec);
				return callback(false, ec ? ec : std::error_code{Error::registry_io});
			}
			callback(reply.as_int() == 1, {});
		},
		"EVAL %s 3 %b %b %b   %b", lua,
		m_files.data(), m_files.size(),
		m_access.data(), m_access.size(),
		m_hashes.data(), m_hashes.size(),
		hex.data(), hex.size()
	);
}

void RedisShard::find_all(ListCallback&& callback)
{
	std::error_code ec;
	auto db = connect(ec);
	if (!db)
		return callback({}, ec);

	static const char lua[] = R"__(
		return {redis.call('HGETALL', KEYS[1]), redis.call('HGETALL', KEYS[2])}
	)__";
	db->command(
		[callback=std::move(callback)](auto&& reply, auto ec) mutable
		{
			if (!reply || ec)
			{
				Log(LOG_WARNING, "RedisShard::find_all(): reply %1% %2%", reply.as_error(), ec);
				return callback({}, ec ? ec : std::error_code{Error::registry_io});
			}

			std::unordered_map<std::string_view, redis::Reply> access;
			auto counts = reply[1];
			counts.foreach_kv_pair([&access](auto id, auto&& count)
			{
				access.emplace(id, count);
			});

			std::vector<FileRecord> result;
			auto files = reply[0];
			files.foreach_kv_pair([&](auto id, auto&& json)
			{
				auto it = access.find(id);
				auto record = parse(json, it != access.end() ? it->second : redis::Reply{}, ec);
				if (record)
					result.push_back(std::move(*record));
			});
			callback(std::move(result), ec);
		},
		"EVAL %s 2 %b %b", lua,
		m_files.data(), m_files.size(),
		m_access.data(), m_access.size()
	);
}

} // end of namespace cgw
