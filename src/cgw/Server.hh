/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/7/18.
//

#pragma once

#include "RequestHandler.hh"

#include "link/LinkCodec.hh"
#include "link/LinkService.hh"
#include "registry/PendingAssociationCache.hh"
#include "registry/ShardedRegistry.hh"
#include "stream/ObjectStreamer.hh"
#include "stream/SessionPool.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <memory>

namespace cgw {

class Configuration;
class Listener;
class Session;

/// The main application object of chunkgate.
/// It owns every long-lived component and wires them together. Requests
/// reach the RequestHandler through the Sessions created by the Listener.
class Server
{
public:
	explicit Server(const Configuration& cfg);
	Server(const Server&) = delete;
	Server& operator=(const Server&) = delete;
	~Server();

	boost::asio::io_context& get_io_context() {return m_ioc;}

	/// Open the listening port and start the periodic sweep of pending
	/// associations.
	void listen();
	void stop();

	std::shared_ptr<Session> start_session(boost::asio::ip::tcp::socket&& socket, std::size_t nth);

	RequestHandler& handler() {return m_handler;}
	LinkService& links() {return m_links;}
	ShardedRegistry& registry() {return m_registry;}
	PendingAssociationCache& pending() {return m_pending;}
	SessionPool& pool() {return m_pool;}
	const LinkCodec& codec() const {return m_codec;}

	EndPoint local_endpoint() const;

private:
	void schedule_sweep();

private:
	const Configuration&    m_cfg;
	boost::asio::io_context m_ioc;

	SessionPool             m_pool;
	StreamerCache           m_streamers;
	ShardedRegistry         m_registry;
	PendingAssociationCache m_pending;
	LinkCodec               m_codec;
	LinkService             m_links;
	RequestHandler          m_handler;

	std::shared_ptr<Listener>   m_listener;
	boost::asio::steady_timer   m_sweep;
};

} // end of namespace
