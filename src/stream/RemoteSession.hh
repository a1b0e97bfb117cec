/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

namespace cgw {

/// Internal address of an object in the remote store.
struct ObjectCoordinate
{
	std::int64_t container{};
	std::int64_t object{};

	bool operator==(const ObjectCoordinate& rhs) const {return container == rhs.container && object == rhs.object;}
	bool operator!=(const ObjectCoordinate& rhs) const {return !(*this == rhs);}
	bool operator<(const ObjectCoordinate& rhs) const
	{
		return std::tie(container, object) < std::tie(rhs.container, rhs.object);
	}
};

struct ObjectMetadata
{
	ObjectCoordinate location;
	std::string unique_id;
	std::int64_t size{};
	std::string file_name;
	std::string mime_type;
};

using ChunkBuffer = std::vector<char>;

/// One authenticated connection to the remote object store. Completions
/// may be called on any thread of the io_context that drives the session.
class RemoteSession
{
public:
	using ResolveCallback = std::function<void(ObjectMetadata, std::error_code)>;
	using ChunkCallback   = std::function<void(ChunkBuffer, std::error_code)>;

public:
	virtual ~RemoteSession() = default;

	virtual const std::string& name() const = 0;

	/// Error::object_not_found if the coordinate no longer resolves.
	/// Error::upstream_unavailable on transient failures.
	virtual void resolve_object(const ObjectCoordinate& coord, ResolveCallback&& callback) = 0;

	/// Read the whole chunk at \a chunk_index. Only the last chunk of an
	/// object may be shorter than \a chunk_size.
	virtual void read_chunk(
		const ObjectMetadata& meta,
		std::int64_t chunk_index,
		std::int64_t chunk_size,
		ChunkCallback&& callback
	) = 0;
};

} // end of namespace cgw
