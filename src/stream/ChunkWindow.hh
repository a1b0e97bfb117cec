/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include <cstdint>
#include <utility>

namespace cgw {

struct ByteRange;

/// Projection of a byte window onto the fixed chunk grid of the remote store.
/// Chunk i of the plan is the upstream chunk first_chunk() + i.
struct ChunkWindow
{
	std::int64_t start_offset{};
	std::int64_t first_cut{};
	std::int64_t last_cut{};
	std::int64_t req_length{};
	std::int64_t chunk_count{};
	std::int64_t chunk_size{1};

	static ChunkWindow plan(std::int64_t from, std::int64_t until, std::int64_t chunk_size);
	static ChunkWindow plan(const ByteRange& range, std::int64_t chunk_size);

	std::int64_t first_chunk() const {return start_offset / chunk_size;}

	/// The part [begin, end) of the i-th chunk of the plan that belongs
	/// to the window. The first and last chunk may be the same one.
	std::pair<std::int64_t, std::int64_t> slice(std::int64_t i) const;
};

} // end of namespace cgw
