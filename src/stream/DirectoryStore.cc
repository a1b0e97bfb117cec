/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "DirectoryStore.hh"

#include "crypto/Blake2.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"
#include "util/Magic.hh"

#include <boost/asio/post.hpp>
#include <boost/beast/core/file.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <fstream>

namespace cgw {

DirectoryStore::DirectoryStore(boost::asio::io_context& ioc, std::filesystem::path root, std::string name) :
	m_ioc{ioc}, m_root{std::move(root)}, m_name{std::move(name)}
{
}

std::filesystem::path DirectoryStore::path(const ObjectCoordinate& coord) const
{
	return m_root / std::to_string(coord.container) / std::to_string(coord.object);
}

void DirectoryStore::resolve_object(const ObjectCoordinate& coord, ResolveCallback&& callback)
{
	boost::asio::post(m_ioc, [this, coord, callback=std::move(callback)]
	{
		std::error_code ec;
		auto meta = resolve(coord, ec);
		callback(std::move(meta), ec);
	});
}

void DirectoryStore::read_chunk(
	const ObjectMetadata& meta,
	std::int64_t chunk_index,
	std::int64_t chunk_size,
	ChunkCallback&& callback
)
{
	boost::asio::post(m_ioc, [this, meta, chunk_index, chunk_size, callback=std::move(callback)]
	{
		std::error_code ec;
		auto chunk = read(meta, chunk_index, chunk_size, ec);
		callback(std::move(chunk), ec);
	});
}

ObjectMetadata DirectoryStore::resolve(const ObjectCoordinate& coord, std::error_code& ec) const
{
	auto file = path(coord);

	std::error_code fs_err;
	auto status = std::filesystem::status(file, fs_err);
	if (!std::filesystem::is_regular_file(status))
	{
		ec = Error::object_not_found;
		return {};
	}

	ObjectMetadata meta;
	meta.location = coord;

	auto size  = std::filesystem::file_size(file, fs_err);
	auto mtime = fs_err ? std::filesystem::file_time_type{} : std::filesystem::last_write_time(file, fs_err);
	if (fs_err)
	{
		Log(LOG_WARNING, "cannot stat %1%: %2%", file, fs_err.message());
		ec = Error::upstream_unavailable;
		return {};
	}
	meta.size = static_cast<std::int64_t>(size);

	auto sidecar = file;
	sidecar += ".json";
	if (std::ifstream in{sidecar}; in)
	{
		auto json = nlohmann::json::parse(in, nullptr, false);
		if (json.is_discarded() || !json.is_object())
		{
			Log(LOG_WARNING, "invalid metadata in %1%", sidecar);
			ec = Error::upstream_unavailable;
			return {};
		}
		meta.unique_id = json.value("unique_id", std::string{});
		meta.file_name = json.value("file_name", std::string{});
		meta.mime_type = json.value("mime_type", std::string{});
	}

	if (meta.unique_id.empty())
	{
		Blake2 hash;
		hash.update(file.string());
		hash.update(&meta.size, sizeof(meta.size));
		auto ticks = mtime.time_since_epoch().count();
		hash.update(&ticks, sizeof(ticks));

		auto digest = hash.finalize();
		std::array<unsigned char, 16> id{};
		std::copy_n(digest.begin(), id.size(), id.begin());
		meta.unique_id = to_hex(id);
	}

	if (meta.mime_type.empty())
		meta.mime_type = Magic::instance().mime(file);

	return meta;
}

ChunkBuffer DirectoryStore::read(const ObjectMetadata& meta, std::int64_t chunk_index, std::int64_t chunk_size, std::error_code& ec) const
{
	auto file = path(meta.location);

	boost::system::error_code bec;
	boost::beast::file object;
	object.open(file.string().c_str(), boost::beast::file_mode::scan, bec);
	if (bec)
	{
		ec = (bec == boost::system::errc::no_such_file_or_directory) ?
			Error::object_not_found : Error::upstream_unavailable;
		return {};
	}

	auto offset = static_cast<std::uint64_t>(chunk_index * chunk_size);
	ChunkBuffer chunk(static_cast<std::size_t>(chunk_size));
	std::size_t count = 0;

	if (offset < object.size(bec) && !bec)
	{
		object.seek(offset, bec);
		if (!bec)
			count = object.read(chunk.data(), chunk.size(), bec);
	}

	if (bec)
	{
		Log(LOG_WARNING, "cannot read chunk %1% of %2%: %3%", chunk_index, file, bec.message());
		ec = Error::upstream_unavailable;
		return {};
	}

	chunk.resize(count);
	return chunk;
}

} // end of namespace cgw
