/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 4/8/18.
//

#pragma once

#include "net/Request.hh"
#include "net/Response.hh"
#include "stream/RemoteSession.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace cgw {

class LinkCodec;
class LinkService;
class SessionPool;
class ShardedRegistry;
class StreamerCache;

/// \brief  Routes one HTTP request to the download, watch or JSON API handlers.
///
/// The handler itself keeps no per-request state. Responses may be sent from
/// any thread.
class RequestHandler
{
public:
	struct Settings
	{
		std::string     base_url;
		std::string     admin_username;
		std::string     admin_password;
		std::int64_t    chunk_size{1024*1024};
	};

	static constexpr std::size_t default_page_size = 20;
	static constexpr std::size_t max_page_size = 100;

public:
	RequestHandler(
		SessionPool& pool,
		StreamerCache& streamers,
		ShardedRegistry& registry,
		LinkService& links,
		const LinkCodec& codec,
		Settings settings
	);

	void handle(StringRequest&& req, ResponseSender&& send);

	static http::status status_of(std::error_code ec);
	static StringResponse error_response(std::error_code ec, unsigned version);
	static StringResponse json_response(const nlohmann::json& json, http::status status, unsigned version);

private:
	void on_download(const StringRequest& req, std::string_view segment, std::string_view name, ResponseSender&& send);
	void on_watch(const StringRequest& req, std::string_view segment, std::string_view name, ResponseSender&& send);
	void on_api(const StringRequest& req, std::string_view path, std::string_view query, ResponseSender&& send);

	void on_upload(const StringRequest& req, ResponseSender&& send);
	void on_issue(const StringRequest& req, ResponseSender&& send);
	void on_list(const StringRequest& req, std::string_view query, ResponseSender&& send);
	void on_stats(const StringRequest& req, ResponseSender&& send);
	void on_delete(const StringRequest& req, std::string_view id, ResponseSender&& send);

	bool authorized(const StringRequest& req) const;
	ObjectCoordinate decode_segment(std::string_view segment, std::string_view& fingerprint, std::error_code& ec) const;

private:
	SessionPool&        m_pool;
	StreamerCache&      m_streamers;
	ShardedRegistry&    m_registry;
	LinkService&        m_links;
	const LinkCodec&    m_codec;
	const Settings      m_settings;
};

} // end of namespace cgw
