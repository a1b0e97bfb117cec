/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/7/18.
//

#include "Server.hh"

#include "net/Listener.hh"
#include "net/Session.hh"
#include "registry/MemoryShard.hh"
#include "registry/RedisShard.hh"
#include "stream/DirectoryStore.hh"
#include "util/Configuration.hh"
#include "util/Log.hh"

namespace cgw {
namespace {

std::vector<std::shared_ptr<RemoteSession>> remote_sessions(boost::asio::io_context& ioc, const Configuration& cfg)
{
	std::vector<std::shared_ptr<RemoteSession>> sessions;
	for (std::size_t i = 0; i < cfg.remote_sessions(); ++i)
		sessions.push_back(std::make_shared<DirectoryStore>(ioc, cfg.remote_root(), "session" + std::to_string(i+1)));
	return sessions;
}

std::vector<std::unique_ptr<ShardStore>> shard_stores(boost::asio::io_context& ioc, const Configuration& cfg)
{
	std::vector<std::unique_ptr<ShardStore>> shards;
	for (auto&& setting : cfg.shards())
	{
		if (cfg.registry_backend() == "redis")
			shards.push_back(std::make_unique<RedisShard>(ioc, setting.name, setting.redis));
		else
			shards.push_back(std::make_unique<MemoryShard>(setting.name));
	}
	return shards;
}

} // end of local namespace

Server::Server(const Configuration& cfg) :
	m_cfg{cfg},
	m_pool{remote_sessions(m_ioc, cfg)},
	m_streamers{cfg.metadata_cache_size()},
	m_registry{shard_stores(m_ioc, cfg), cfg.current_shard()},
	m_pending{cfg.pending_ttl()},
	m_codec{cfg.link_secret()},
	m_links{
		m_pool, m_streamers, m_registry, m_pending, m_codec,
		LinkService::Settings{cfg.base_url(), cfg.chunk_size(), cfg.hash_prefix_limit()}
	},
	m_handler{
		m_pool, m_streamers, m_registry, m_links, m_codec,
		RequestHandler::Settings{cfg.base_url(), cfg.admin_username(), cfg.admin_password(), cfg.chunk_size()}
	},
	m_sweep{m_ioc}
{
	Log(LOG_INFO, "%1% remote sessions on %2%, %3% %4% shards, writing to shard %5%",
		m_pool.size(), cfg.remote_root(), m_registry.size(), cfg.registry_backend(), m_registry.current_shard()
	);
}

Server::~Server() = default;

void Server::listen()
{
	m_listener = std::make_shared<Listener>(
		m_ioc,
		m_cfg.listen_http(),
		[this](auto&& sock, auto nth)
		{
			return start_session(std::move(sock), nth);
		}
	);
	m_listener->run();
	Log(LOG_NOTICE, "listening to %1%", m_listener->local_endpoint());

	schedule_sweep();
}

void Server::stop()
{
	if (m_listener)
		m_listener->stop();
	m_sweep.cancel();
}

EndPoint Server::local_endpoint() const
{
	return m_listener ? m_listener->local_endpoint() : m_cfg.listen_http();
}

std::shared_ptr<Session> Server::start_session(boost::asio::ip::tcp::socket&& socket, std::size_t nth)
{
	return std::make_shared<Session>(
		std::move(socket),
		[this](StringRequest&& req, const EndPoint&, ResponseSender&& send)
		{
			m_handler.handle(std::move(req), std::move(send));
		},
		m_cfg.body_limit(),
		nth
	);
}

void Server::schedule_sweep()
{
	m_sweep.expires_after(m_cfg.sweep_interval());
	m_sweep.async_wait([this](boost::system::error_code ec)
	{
		if (ec == boost::asio::error::operation_aborted)
			return;

		auto swept = m_pending.sweep();
		if (swept > 0)
			Log(LOG_INFO, "swept %1% expired pending associations, %2% remaining", swept, m_pending.size());

		schedule_sweep();
	});
}

} // end of namespace
