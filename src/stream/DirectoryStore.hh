/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "RemoteSession.hh"

#include <boost/asio/io_context.hpp>

#include <filesystem>

namespace cgw {

/// \brief  A remote store session backed by a local directory.
///
/// The object at (container, object) is the file <root>/<container>/<object>.
/// An optional sidecar <object>.json beside it may carry "unique_id",
/// "file_name" and "mime_type". Without a unique_id one is derived from the
/// path, size and modification time of the file. Completions are posted to
/// the io_context.
class DirectoryStore : public RemoteSession
{
public:
	DirectoryStore(boost::asio::io_context& ioc, std::filesystem::path root, std::string name);

	const std::string& name() const override {return m_name;}

	void resolve_object(const ObjectCoordinate& coord, ResolveCallback&& callback) override;
	void read_chunk(
		const ObjectMetadata& meta,
		std::int64_t chunk_index,
		std::int64_t chunk_size,
		ChunkCallback&& callback
	) override;

	std::filesystem::path path(const ObjectCoordinate& coord) const;

	ObjectMetadata resolve(const ObjectCoordinate& coord, std::error_code& ec) const;
	ChunkBuffer read(const ObjectMetadata& meta, std::int64_t chunk_index, std::int64_t chunk_size, std::error_code& ec) const;

private:
	boost::asio::io_context&    m_ioc;
	std::filesystem::path       m_root;
	std::string                 m_name;
};

} // end of namespace cgw
