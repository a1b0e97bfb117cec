/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/1/18.
//

#include "Session.hh"

#include "stream/ObjectStreamer.hh"
#include "util/Log.hh"

#include "config.hh"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <boost/format.hpp>

namespace cgw {

// The serializer keeps a reference to the response, so both of them
// must live until the last write completes.
struct Session::StreamWriter
{
	explicit StreamWriter(StreamResponse&& res) :
		response{std::move(res.header)},
		serializer{response},
		stream{std::move(res.stream)}
	{
	}

	HeaderResponse                              response;
	http::response_serializer<http::buffer_body> serializer;
	std::shared_ptr<ChunkStream>                stream;
	ChunkBuffer                                 chunk;
};

Session::Session(
	boost::asio::ip::tcp::socket socket,
	Handler handler,
	std::size_t body_limit,
	std::size_t nth
) :
	m_socket{std::move(socket)},
	m_strand{m_socket.get_executor()},
	m_handler{std::move(handler)},
	m_body_limit{body_limit},
	m_nth_session{nth}
{
}

// Start the asynchronous operation
void Session::run()
{
	boost::asio::post(m_strand, [self = shared_from_this()]{self->do_read();});
}

void Session::do_read()
{
	// Destroy and re-construct the parser for a new HTTP transaction
	m_parser.emplace();
	m_parser->body_limit(m_body_limit);

	async_read(m_socket, m_buffer, *m_parser, boost::asio::bind_executor(
		m_strand,
		[self=shared_from_this()](auto ec, auto bytes) {self->on_read(ec, bytes);}
	));
}

void Session::on_read(boost::system::error_code ec, std::size_t)
{
	if (ec)
		return handle_read_error(ec);

	auto req = m_parser->release();
	m_keep_alive = req.keep_alive();

	boost::system::error_code peer_ec;
	auto peer = m_socket.remote_endpoint(peer_ec);
	if (peer_ec)
		Log(LOG_WARNING, "remote_endpoint() error: %1% %2%", peer_ec, peer_ec.message());

	if (validate_request(req, peer))
	{
		m_handler(std::move(req), peer, [self=shared_from_this()](Response&& response)
		{
			// the handler may complete on any thread
			boost::asio::post(self->m_strand, [self, response=std::move(response)]() mutable
			{
				self->send_response(std::move(response));
			});
		});
	}
	m_nth_transaction++;
}

bool Session::validate_request(const StringRequest& req, const EndPoint& peer)
{
	Log(
		LOG_INFO,
		"%1%:%2% %5% request %3% from %4% %6% bytes",
		m_nth_session,
		m_nth_transaction,
		req.target(),
		peer,
		req.method_string(),
		req.body().size()
	);

	// Make sure we can handle the method
	if (req.method() != http::verb::get  &&
	    req.method() != http::verb::post &&
		req.method() != http::verb::delete_ &&
		req.method() != http::verb::head)
	{
		send_response(text_response(http::status::bad_request, "Unknown HTTP-method", req.version()));
		return false;
	}

	// Request path must be absolute and not contain "..".
	if (req.target().empty() ||
	    req.target()[0] != '/' ||
	    req.target().find("..") != boost::beast::string_view::npos)
	{
		send_response(text_response(http::status::bad_request, "Illegal request-target", req.version()));
		return false;
	}

	return true;
}

void Session::send_response(Response&& response)
{
	std::visit([this](auto&& res)
	{
		using Type = std::decay_t<decltype(res)>;
		if constexpr (std::is_same_v<Type, StreamResponse>)
			write_stream(std::move(res));
		else
			write_message(std::move(res));
	}, std::move(response));
}

template <class Message>
void Session::write_message(Message&& message)
{
	// The lifetime of the message has to extend
	// for the duration of the async operation so
	// we use a shared_ptr to manage it.
	auto sp = std::make_shared<std::remove_reference_t<Message>>(std::forward<Message>(message));
	sp->set(http::field::server, (boost::format("%1% chunkgate/%2%") % BOOST_BEAST_VERSION_STRING % constants::version).str());
	sp->keep_alive(m_keep_alive);
	sp->prepare_payload();

	async_write(m_socket, *sp, boost::asio::bind_executor(
		m_strand,
		[self=shared_from_this(), sp](auto&& ec, auto bytes)
		{ self->on_write(ec, bytes, sp->need_eof()); }
	));
}

void Session::write_stream(StreamResponse&& response)
{
	// Content-Length is already set by the handler, so no prepare_payload() here
	response.header.set(http::field::server, (boost::format("%1% chunkgate/%2%") % BOOST_BEAST_VERSION_STRING % constants::version).str());
	response.header.keep_alive(m_keep_alive);
	response.header.body().data = nullptr;
	response.header.body().more = static_cast<bool>(response.stream);

	auto writer = std::make_shared<StreamWriter>(std::move(response));
	http::async_write_header(m_socket, writer->serializer, boost::asio::bind_executor(
		m_strand,
		[self=shared_from_this(), writer](auto ec, auto bytes)
		{
			if (ec || !writer->stream)
				return self->on_write(ec, bytes, ec || writer->response.need_eof());

			self->pump(writer);
		}
	));
}

void Session::pump(std::shared_ptr<StreamWriter> writer)
{
	auto stream = writer->stream.get();
	stream->next([self=shared_from_this(), writer=std::move(writer)](ChunkBuffer chunk, std::error_code ec) mutable
	{
		boost::asio::post(self->m_strand, [self, writer=std::move(writer), chunk=std::move(chunk), ec]() mutable
		{
			self->on_chunk(std::move(writer), std::move(chunk), ec);
		});
	});
}

void Session::on_chunk(std::shared_ptr<StreamWriter> writer, ChunkBuffer&& chunk, std::error_code ec)
{
	// The header is already out. The only way to tell the client is to
	// close the connection before Content-Length bytes are sent.
	if (ec)
	{
		Log(LOG_WARNING, "%1%:%2% upstream read error: %3% (%4%)", m_nth_session, m_nth_transaction, ec, ec.message());
		return abort_stream(writer);
	}

	auto last = chunk.empty();
	writer->chunk = std::move(chunk);
	writer->response.body().data = last ? nullptr : writer->chunk.data();
	writer->response.body().size = writer->chunk.size();
	writer->response.body().more = !last;

	async_write(m_socket, writer->serializer, boost::asio::bind_executor(
		m_strand,
		[self=shared_from_this(), writer, last](boost::system::error_code ec, std::size_t bytes)
		{
			if (ec == http::error::need_buffer)
				ec = {};

			if (ec)
			{
				Log(LOG_INFO, "%1%:%2% client went away: %3%", self->m_nth_session, self->m_nth_transaction, ec.message());
				return self->abort_stream(writer);
			}

			if (last)
				self->on_write(ec, bytes, writer->response.need_eof());
			else
				self->pump(writer);
		}
	));
}

void Session::abort_stream(const std::shared_ptr<StreamWriter>& writer)
{
	writer->stream->cancel();
	do_close();
}

void Session::handle_read_error(boost::system::error_code ec)
{
	// This means they closed the connection
	if (ec == http::error::end_of_stream)
		return do_close();

	if (ec == http::error::body_limit)
	{
		m_keep_alive = false;
		return send_response(text_response(http::status::payload_too_large, ec.message(), 11));
	}

	if (ec == boost::asio::error::operation_aborted || ec == boost::asio::error::connection_reset)
		return do_close();

	m_keep_alive = false;
	send_response(text_response(http::status::bad_request, ec.message(), 11));
}

void Session::on_write(boost::system::error_code ec, std::size_t, bool close)
{
	if (ec)
		Log(LOG_INFO, "%1%:%2% write error: %3%", m_nth_session, m_nth_transaction, ec.message());

	if (ec || close)
	{
		// This means we should close the connection, usually because
		// the response indicated the "Connection: close" semantic.
		return do_close();
	}

	// Read another request
	do_read();
}

void Session::do_close()
{
	// Send a TCP shutdown
	boost::system::error_code ec;
	m_socket.shutdown(tcp::socket::shutdown_send, ec);
	m_socket.close(ec);

	// At this point the connection is closed gracefully
}

} // end of namespace
