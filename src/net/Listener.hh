/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/1/18.
//

#pragma once

#include "Request.hh"
#include "Response.hh"

#include <boost/asio/ip/tcp.hpp>

#include <functional>
#include <memory>

namespace cgw {

class Session;

// Accepts incoming connections and launches the sessions
class Listener : public std::enable_shared_from_this<Listener>
{
public:
	using SessionFactory = std::function<std::shared_ptr<Session>(
		boost::asio::ip::tcp::socket&&,
		std::size_t
	)>;

public:
	Listener(
		boost::asio::io_context &ioc,
		boost::asio::ip::tcp::endpoint endpoint,
		SessionFactory session_factory
	);

	void run();
	void stop();

	boost::asio::ip::tcp::endpoint local_endpoint() const;

private:
	void do_accept();
	void on_accept(boost::system::error_code ec);

private:
	boost::asio::ip::tcp::acceptor  m_acceptor;
	boost::asio::ip::tcp::socket    m_socket;
	SessionFactory                  m_session_factory;

	// stats
	std::size_t m_session_count{};
};

} // end of cgw namespace
