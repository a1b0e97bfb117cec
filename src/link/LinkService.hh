/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "registry/FileRecord.hh"
#include "stream/RemoteSession.hh"
#include "stream/SessionPool.hh"

#include <cstdint>
#include <functional>
#include <string>
#include <system_error>

namespace cgw {

class LinkCodec;
class PendingAssociationCache;
class ShardedRegistry;
class StreamerCache;

struct UploadEvent
{
	std::int64_t        user{};
	std::int64_t        interaction{};
	ObjectCoordinate    location;
	std::string         display_name;
};

struct IssuedLink
{
	std::string download_url;
	std::string watch_url;
};

/// \brief  Registers uploaded objects and issues public links for them.
class LinkService
{
public:
	struct Settings
	{
		std::string  base_url;
		std::int64_t chunk_size{1024*1024};
		std::int64_t hash_prefix_limit{10*1024*1024};
	};

	using UploadCallback = std::function<void(FileRecord record, bool created, std::error_code)>;
	using IssueCallback  = std::function<void(IssuedLink, std::error_code)>;

public:
	LinkService(
		SessionPool& pool,
		StreamerCache& streamers,
		ShardedRegistry& registry,
		PendingAssociationCache& pending,
		const LinkCodec& codec,
		Settings settings
	);

	/// Hash a prefix of the object, register it unless its content is
	/// already known, and remember it for the interaction.
	void on_upload(const UploadEvent& event, UploadCallback&& callback);

	/// Error::pending_not_found if the interaction is unknown or expired.
	/// Error::record_not_found if the record was removed since.
	void issue(std::int64_t user, std::int64_t interaction, IssueCallback&& callback);

	/// <fingerprint><token>/<name>
	std::string link_path(const FileRecord& record) const;

private:
	void hash_prefix(SessionPool::Lease lease, const ObjectMetadata& meta, std::function<void(std::string, std::error_code)>&& callback);
	FileRecord make_record(const UploadEvent& event, const ObjectMetadata& meta, std::string&& hash) const;
	void remember(const UploadEvent& event, const FileRecord& record);

private:
	SessionPool&                m_pool;
	StreamerCache&              m_streamers;
	ShardedRegistry&            m_registry;
	PendingAssociationCache&    m_pending;
	const LinkCodec&            m_codec;
	const Settings              m_settings;
};

} // end of namespace cgw
