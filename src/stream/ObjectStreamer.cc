/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "ObjectStreamer.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <algorithm>
#include <utility>

namespace cgw {

ChunkStream::ChunkStream(SessionPool::Lease lease, ObjectMetadata meta, const ChunkWindow& window) :
	m_meta{std::move(meta)},
	m_window{window},
	m_lease{std::move(lease)}
{
	// nothing to read for an empty window
	if (m_window.chunk_count == 0)
		m_lease.release();
}

bool ChunkStream::done() const
{
	std::unique_lock lock{m_mx};
	return m_cancelled || m_failed || m_next >= m_window.chunk_count;
}

void ChunkStream::cancel()
{
	std::unique_lock lock{m_mx};
	m_cancelled = true;
	m_lease.release();
}

void ChunkStream::next(Callback&& callback)
{
	std::unique_lock lock{m_mx};
	if (m_cancelled)
	{
		lock.unlock();
		callback({}, std::make_error_code(std::errc::operation_canceled));
		return;
	}
	if (m_failed || m_next >= m_window.chunk_count)
	{
		lock.unlock();
		callback({}, {});
		return;
	}

	// only one outstanding read at a time
	if (m_pending)
	{
		lock.unlock();
		callback({}, std::make_error_code(std::errc::operation_in_progress));
		return;
	}

	m_pending = true;
	auto index   = m_next;
	auto& remote = m_lease.session();
	lock.unlock();

	remote.read_chunk(
		m_meta,
		m_window.first_chunk() + index,
		m_window.chunk_size,
		[self=shared_from_this(), index, callback=std::move(callback)](ChunkBuffer chunk, std::error_code ec)
		{
			self->on_chunk(index, std::move(chunk), ec, callback);
		}
	);
}

void ChunkStream::on_chunk(std::int64_t index, ChunkBuffer&& chunk, std::error_code ec, const Callback& callback)
{
	std::unique_lock lock{m_mx};
	m_pending = false;

	if (m_cancelled)
	{
		lock.unlock();
		callback({}, std::make_error_code(std::errc::operation_canceled));
		return;
	}

	auto [begin, end] = m_window.slice(index);
	if (!ec && static_cast<std::int64_t>(chunk.size()) < end)
	{
		Log(LOG_WARNING, "chunk %1% of object %2% is too short: %3% bytes, expecting %4%",
			m_window.first_chunk() + index, m_meta.unique_id, chunk.size(), end
		);
		ec = Error::upstream_unavailable;
	}

	if (ec)
	{
		m_failed = true;
		m_lease.release();
		lock.unlock();
		callback({}, ec);
		return;
	}

	chunk.resize(static_cast<std::size_t>(end));
	chunk.erase(chunk.begin(), chunk.begin() + begin);

	if (++m_next >= m_window.chunk_count)
		m_lease.release();

	lock.unlock();
	callback(std::move(chunk), {});
}

ObjectStreamer::ObjectStreamer(RemoteSession& session, std::size_t cache_size) :
	m_session{session},
	m_cache_size{cache_size}
{
}

void ObjectStreamer::resolve(const ObjectCoordinate& coord, RemoteSession::ResolveCallback&& callback)
{
	// upstream is always asked: the object may have been deleted or replaced
	m_session.resolve_object(coord, [this, coord, callback=std::move(callback)](ObjectMetadata meta, std::error_code ec)
	{
		if (!ec)
		{
			add_cache(meta);
			return callback(std::move(meta), ec);
		}

		if (ec == Error::object_not_found)
		{
			evict_cache(coord);
			return callback(std::move(meta), ec);
		}

		// last known metadata while upstream is unreachable
		if (auto cached = find_cache(coord))
		{
			Log(LOG_WARNING, "cannot resolve object %1%/%2% (%3%): using cached metadata",
				coord.container, coord.object, ec.message()
			);
			return callback(std::move(*cached), {});
		}
		callback(std::move(meta), ec);
	});
}

std::optional<ObjectMetadata> ObjectStreamer::find_cache(const ObjectCoordinate& coord) const
{
	std::unique_lock lock{m_mx};
	if (auto it = m_cache.find(coord); it != m_cache.end())
		return it->second;
	return std::nullopt;
}

void ObjectStreamer::evict_cache(const ObjectCoordinate& coord)
{
	std::unique_lock lock{m_mx};
	if (m_cache.erase(coord) > 0)
		m_cache_order.erase(std::remove(m_cache_order.begin(), m_cache_order.end(), coord), m_cache_order.end());
}

void ObjectStreamer::add_cache(const ObjectMetadata& meta)
{
	std::unique_lock lock{m_mx};
	if (m_cache_size == 0)
		return;

	if (m_cache.insert_or_assign(meta.location, meta).second)
		m_cache_order.push_back(meta.location);

	// oldest first
	while (m_cache.size() > m_cache_size && !m_cache_order.empty())
	{
		m_cache.erase(m_cache_order.front());
		m_cache_order.pop_front();
	}
}

std::size_t ObjectStreamer::cached() const
{
	std::unique_lock lock{m_mx};
	return m_cache.size();
}

std::shared_ptr<ChunkStream> ObjectStreamer::fetch(SessionPool::Lease lease, const ObjectMetadata& meta, const ChunkWindow& window)
{
	return std::make_shared<ChunkStream>(std::move(lease), meta, window);
}

ObjectStreamer& StreamerCache::get(RemoteSession& session)
{
	std::unique_lock lock{m_mx};
	auto& streamer = m_streamers[&session];
	if (!streamer)
	{
		Log(LOG_INFO, "creating object streamer for session %1%", session.name());
		streamer = std::make_unique<ObjectStreamer>(session, m_cache_size);
	}
	return *streamer;
}

std::size_t StreamerCache::size() const
{
	std::unique_lock lock{m_mx};
	return m_streamers.size();
}

} // end of namespace cgw
