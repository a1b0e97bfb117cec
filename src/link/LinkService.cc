/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "LinkService.hh"
#include "LinkCodec.hh"
#include "IntegrityGuard.hh"

#include "crypto/SHA2.hh"
#include "registry/PendingAssociationCache.hh"
#include "registry/ShardedRegistry.hh"
#include "stream/ObjectStreamer.hh"
#include "stream/SessionPool.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

#include <algorithm>
#include <memory>

namespace cgw {
namespace {

using HashCallback = std::function<void(std::string, std::error_code)>;

void read_all(std::shared_ptr<ChunkStream> stream, std::shared_ptr<SHA2> hash, HashCallback&& callback)
{
	if (stream->done())
		return callback(to_hex(hash->finalize()), {});

	auto s = stream.get();
	s->next([stream=std::move(stream), hash=std::move(hash), callback=std::move(callback)](ChunkBuffer chunk, std::error_code ec) mutable
	{
		if (ec)
			return callback({}, ec);

		hash->update(chunk.data(), chunk.size());
		read_all(std::move(stream), std::move(hash), std::move(callback));
	});
}

} // end of local namespace

LinkService::LinkService(
	SessionPool& pool,
	StreamerCache& streamers,
	ShardedRegistry& registry,
	PendingAssociationCache& pending,
	const LinkCodec& codec,
	Settings settings
) :
	m_pool{pool},
	m_streamers{streamers},
	m_registry{registry},
	m_pending{pending},
	m_codec{codec},
	m_settings{std::move(settings)}
{
}

void LinkService::on_upload(const UploadEvent& event, UploadCallback&& callback)
{
	auto lease = std::make_shared<SessionPool::Lease>(m_pool.acquire());
	auto& streamer = m_streamers.get(lease->session());

	streamer.resolve(event.location, [this, lease, event, callback=std::move(callback)](ObjectMetadata meta, std::error_code ec) mutable
	{
		if (ec)
		{
			Log(LOG_WARNING, "cannot resolve uploaded object %1%/%2%: %3%", event.location.container, event.location.object, ec.message());
			return callback({}, false, ec);
		}

		hash_prefix(std::move(*lease), meta, [this, meta, event, callback=std::move(callback)](std::string hash, std::error_code ec) mutable
		{
			if (ec)
				return callback({}, false, ec);

			m_registry.insert_unique(
				make_record(event, meta, std::move(hash)),
				[this, event, callback=std::move(callback)](FileRecord record, bool created, std::error_code ec) mutable
				{
					if (!ec)
					{
						Log(LOG_INFO, "upload %1% from user %2%: %3% record %4%",
							event.interaction, event.user, created ? "new" : "existing", record.id
						);
						remember(event, record);
					}
					callback(std::move(record), created, ec);
				}
			);
		});
	});
}

void LinkService::hash_prefix(SessionPool::Lease lease, const ObjectMetadata& meta, HashCallback&& callback)
{
	auto length = std::min(meta.size, m_settings.hash_prefix_limit);
	auto window = ChunkWindow::plan(0, length - 1, m_settings.chunk_size);

	auto& streamer = m_streamers.get(lease.session());
	auto stream = streamer.fetch(std::move(lease), meta, window);
	read_all(std::move(stream), std::make_shared<SHA2>(), std::move(callback));
}

FileRecord LinkService::make_record(const UploadEvent& event, const ObjectMetadata& meta, std::string&& hash) const
{
	FileRecord record;
	record.id           = FileID::randomize();
	record.owner        = event.user;
	record.location     = event.location;
	record.display_name = !event.display_name.empty() ? event.display_name :
		!meta.file_name.empty() ? meta.file_name : synthesize_filename(meta.mime_type);
	record.url_safe_name = sanitize_filename(record.display_name);
	record.size         = meta.size;
	record.size_label   = readable_size(meta.size);
	record.content_hash = std::move(hash);
	record.fingerprint  = std::string{IntegrityGuard::fingerprint(meta.unique_id)};
	record.access_count = 0;
	record.uploaded_at  = Timestamp::now();
	return record;
}

void LinkService::remember(const UploadEvent& event, const FileRecord& record)
{
	m_pending.put(event.user, event.interaction, PendingAssociation{record.id, record.display_name, record.size_label, {}});
}

std::string LinkService::link_path(const FileRecord& record) const
{
	return record.fingerprint + m_codec.encode(record.location) + "/" + url_encode(record.url_safe_name);
}

void LinkService::issue(std::int64_t user, std::int64_t interaction, IssueCallback&& callback)
{
	auto pending = m_pending.get(user, interaction);
	if (!pending)
		return callback({}, Error::pending_not_found);

	m_registry.find_by_id(pending->id, [this, callback=std::move(callback)](auto record, auto ec) mutable
	{
		if (ec)
			return callback({}, ec);
		if (!record)
			return callback({}, Error::record_not_found);

		auto path = link_path(*record);
		callback(IssuedLink{
			m_settings.base_url + "/dl/" + path,
			m_settings.base_url + "/watch/" + path
		}, {});
	});
}

} // end of namespace cgw
