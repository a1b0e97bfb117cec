/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "ChunkWindow.hh"
#include "RemoteSession.hh"
#include "SessionPool.hh"

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace cgw {

/// \brief  Lazy, forward-only sequence of trimmed chunks covering one ChunkWindow.
///
/// Each call to next() issues exactly one upstream read. The lease is
/// returned to the pool after the last chunk, on the first error, on
/// cancel() and on destruction, whichever comes first.
class ChunkStream : public std::enable_shared_from_this<ChunkStream>
{
public:
	using Callback = std::function<void(ChunkBuffer, std::error_code)>;

public:
	ChunkStream(SessionPool::Lease lease, ObjectMetadata meta, const ChunkWindow& window);
	ChunkStream(const ChunkStream&) = delete;
	ChunkStream& operator=(const ChunkStream&) = delete;
	~ChunkStream() = default;

	/// Yields an empty buffer without error when the stream is exhausted,
	/// and std::errc::operation_canceled after cancel().
	void next(Callback&& callback);
	void cancel();

	bool done() const;
	const ChunkWindow& window() const {return m_window;}
	const ObjectMetadata& metadata() const {return m_meta;}

private:
	void on_chunk(std::int64_t index, ChunkBuffer&& chunk, std::error_code ec, const Callback& callback);

private:
	const ObjectMetadata    m_meta;
	const ChunkWindow       m_window;

	mutable std::mutex  m_mx;
	SessionPool::Lease  m_lease;
	std::int64_t        m_next{};
	bool                m_pending{false};
	bool                m_cancelled{false};
	bool                m_failed{false};
};

/// \brief  Per-session adapter that resolves objects and creates ChunkStreams.
///
/// resolve() always asks the upstream session. The metadata cache is only
/// consulted when upstream cannot be reached.
class ObjectStreamer
{
public:
	ObjectStreamer(RemoteSession& session, std::size_t cache_size);
	ObjectStreamer(const ObjectStreamer&) = delete;
	ObjectStreamer& operator=(const ObjectStreamer&) = delete;

	void resolve(const ObjectCoordinate& coord, RemoteSession::ResolveCallback&& callback);

	std::shared_ptr<ChunkStream> fetch(SessionPool::Lease lease, const ObjectMetadata& meta, const ChunkWindow& window);

	RemoteSession& session() const {return m_session;}
	std::size_t cached() const;

private:
	void add_cache(const ObjectMetadata& meta);
	void evict_cache(const ObjectCoordinate& coord);
	std::optional<ObjectMetadata> find_cache(const ObjectCoordinate& coord) const;

private:
	RemoteSession&      m_session;
	const std::size_t   m_cache_size;

	mutable std::mutex  m_mx;
	std::map<ObjectCoordinate, ObjectMetadata>  m_cache;
	std::deque<ObjectCoordinate>                m_cache_order;
};

/// One ObjectStreamer per remote session, created on first use.
class StreamerCache
{
public:
	explicit StreamerCache(std::size_t metadata_cache_size) : m_cache_size{metadata_cache_size} {}
	StreamerCache(const StreamerCache&) = delete;
	StreamerCache& operator=(const StreamerCache&) = delete;

	ObjectStreamer& get(RemoteSession& session);
	std::size_t size() const;

private:
	const std::size_t m_cache_size;

	mutable std::mutex m_mx;
	std::map<const RemoteSession*, std::unique_ptr<ObjectStreamer>> m_streamers;
};

} // end of namespace cgw
