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

#include "stream/RemoteSession.hh"

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <functional>
#include <memory>
#include <optional>

namespace cgw {

// Handles an HTTP server connection
class Session : public std::enable_shared_from_this<Session>
{
public:
	using Handler = std::function<void(StringRequest&&, const EndPoint&, ResponseSender&&)>;

public:
	// Take ownership of the socket
	Session(
		boost::asio::ip::tcp::socket socket,
		Handler handler,
		std::size_t body_limit,
		std::size_t nth
	);

	// Start the asynchronous operation
	void run();

private:
	struct StreamWriter;

	void do_read();
	void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
	bool validate_request(const StringRequest& req, const EndPoint& peer);

	void send_response(Response&& response);
	template <class Message>
	void write_message(Message&& message);
	void write_stream(StreamResponse&& response);
	void pump(std::shared_ptr<StreamWriter> writer);
	void on_chunk(std::shared_ptr<StreamWriter> writer, ChunkBuffer&& chunk, std::error_code ec);
	void abort_stream(const std::shared_ptr<StreamWriter>& writer);

	void handle_read_error(boost::system::error_code ec);
	void on_write(boost::system::error_code ec, std::size_t bytes_transferred, bool close);
	void do_close();

private:
	boost::asio::ip::tcp::socket                                m_socket;
	boost::asio::strand<tcp::socket::executor_type>             m_strand;
	boost::beast::flat_buffer                                   m_buffer;

	// The parsed message is stored inside the parser.
	// Use parser::get() or release() to get the message.
	std::optional<StringRequestParser> m_parser;

	Handler     m_handler;
	std::size_t m_body_limit;
	bool        m_keep_alive{false};

	// stats
	std::size_t m_nth_session;
	std::size_t m_nth_transaction{};
};

} // end of namespace
