/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "ChunkWindow.hh"
#include "ByteRange.hh"

namespace cgw {

ChunkWindow ChunkWindow::plan(std::int64_t from, std::int64_t until, std::int64_t chunk_size)
{
	ChunkWindow result;
	result.chunk_size   = chunk_size;
	result.start_offset = from - (from % chunk_size);
	result.first_cut    = from - result.start_offset;
	result.req_length   = until - from + 1;

	if (result.req_length <= 0)
	{
		result.req_length = 0;
		return result;
	}

	result.last_cut     = (until % chunk_size) + 1;
	result.chunk_count  = until / chunk_size - result.start_offset / chunk_size + 1;
	return result;
}

ChunkWindow ChunkWindow::plan(const ByteRange& range, std::int64_t chunk_size)
{
	return plan(range.from, range.until, chunk_size);
}

std::pair<std::int64_t, std::int64_t> ChunkWindow::slice(std::int64_t i) const
{
	return {
		i == 0 ? first_cut : 0,
		i == chunk_count - 1 ? last_cut : chunk_size
	};
}

} // end of namespace cgw
