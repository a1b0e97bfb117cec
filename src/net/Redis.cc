/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "Redis.hh"

#include "util/Log.hh"

#include <charconv>

namespace cgw {
namespace redis {

Connection::Connection(PoolBase& parent, boost::asio::ip::tcp::socket socket) :
	m_socket{std::move(socket)},
	m_strand{m_socket.get_executor()},
	m_read_buf(256*1024),
	m_parent{parent}
{
}

Connection::~Connection()
{
	m_parent.dealloc(std::move(m_socket));
}

void Connection::do_write(CommandString&& cmd, Completion&& completion)
{
	auto buffer = cmd.buffer();
	boost::asio::async_write(
		m_socket,
		buffer,
		boost::asio::bind_executor(
			m_strand,
			[this, cmd=std::move(cmd), comp=std::move(completion), self=shared_from_this()](auto ec, std::size_t)
			{
				if (ec)
					return comp(Reply{}, std::error_code{ec.value(), ec.category()});

				// only one read outstanding for all pipelined commands
				m_callbacks.push_back(std::move(comp));
				if (m_callbacks.size() == 1)
					do_read();
			}
		)
	);
}

void Connection::do_read()
{
	m_socket.async_read_some(
		boost::asio::buffer(m_read_buf),
		boost::asio::bind_executor(
			m_strand,
			[this, self=shared_from_this()](auto ec, auto read){on_read(ec, read);}
		)
	);
}

void Connection::on_read(boost::system::error_code ec, std::size_t bytes)
{
	if (ec)
	{
		Log(LOG_WARNING, "redis read error: %1% (%2%). Disconnecting.", ec, ec.message());
		fail_all(Error::io);
		disconnect();
		return;
	}

	m_reader.feed(m_read_buf.data(), bytes);

	auto [reply, result] = m_reader.get();
	while (!m_callbacks.empty() && result == ReplyReader::Result::ok)
	{
		auto callback = std::move(m_callbacks.front());
		m_callbacks.pop_front();
		callback(std::move(reply), {});

		std::tie(reply, result) = m_reader.get();
	}

	if (result == ReplyReader::Result::ok)
		Log(LOG_WARNING, "redis sends more replies than requested. Ignoring reply.");

	if (result == ReplyReader::Result::error)
	{
		Log(LOG_WARNING, "redis reply parse error. Disconnecting.");
		fail_all(Error::protocol);
		disconnect();
	}

	// keep reading until all outstanding commands are finished
	else if (!m_callbacks.empty())
		do_read();
}

void Connection::fail_all(std::error_code ec)
{
	auto callbacks = std::move(m_callbacks);
	m_callbacks.clear();
	for (auto&& callback : callbacks)
		callback(Reply{}, ec);
}

void Connection::disconnect()
{
	boost::system::error_code ec;
	m_socket.close(ec);
}

Reply::Reply(::redisReply *r) noexcept :
	m_reply{r, [](::redisReply *r){if (r) ::freeReplyObject(r);}}
{
	// take ownership of the array elements
	for (std::size_t i = 0 ; m_reply && m_reply->type == REDIS_REPLY_ARRAY && i < m_reply->elements; i++)
	{
		m_array.emplace_back(m_reply->element[i]);
		m_reply->element[i] = nullptr;
	}
}

Reply::operator bool() const noexcept
{
	return m_reply && m_reply->type != REDIS_REPLY_ERROR && m_reply->type != REDIS_REPLY_NIL;
}

std::string_view Reply::raw_string() const noexcept
{
	return m_reply && m_reply->str ?
		std::string_view{m_reply->str, static_cast<std::size_t>(m_reply->len)} : std::string_view{};
}

std::string_view Reply::as_string() const noexcept
{
	return is_string() ? raw_string() : std::string_view{};
}

std::string_view Reply::as_error() const noexcept
{
	return is_error() ? raw_string() : std::string_view{};
}

long Reply::as_int() const noexcept
{
	return m_reply && m_reply->type == REDIS_REPLY_INTEGER ? static_cast<long>(m_reply->integer) : 0;
}

long Reply::to_int() const noexcept
{
	auto s = as_string();
	long result{};
	return std::from_chars(s.data(), s.data() + s.size(), result).ec == std::errc{} ? result : 0;
}

Reply Reply::operator[](std::size_t i) const noexcept
{
	return i < m_array.size() ? m_array[i] : Reply{};
}

std::size_t Reply::array_size() const noexcept
{
	return m_array.size();
}

const std::error_category& redis_error_category()
{
	struct Cat : std::error_category
	{
		const char *name() const noexcept override {return "redis";}

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "success";
				case Error::io: return "IO error";
				case Error::eof: return "EOF error";
				case Error::protocol: return "protocol error";
				case Error::oom: return "out-of-memory error";
				case Error::other: return "other error";
				default: return "unknown error";
			}
		}
	};
	static const Cat cat{};
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), redis_error_category());
}

CommandString::CommandString(CommandString&& other) noexcept
{
	swap(other);
}

CommandString::~CommandString()
{
	::redisFreeCommand(m_cmd);
}

CommandString& CommandString::operator=(CommandString&& other) noexcept
{
	CommandString tmp{std::move(other)};
	swap(tmp);
	return *this;
}

void CommandString::swap(CommandString& other) noexcept
{
	std::swap(m_cmd, other.m_cmd);
	std::swap(m_length, other.m_length);
}

void ReplyReader::feed(const char *data, std::size_t size)
{
	::redisReaderFeed(m_reader.get(), data, size);
}

std::tuple<Reply, ReplyReader::Result> ReplyReader::get()
{
	void *reply{};
	if (::redisReaderGetReply(m_reader.get(), &reply) != REDIS_OK)
		return {Reply{}, Result::error};

	return {Reply{static_cast<::redisReply*>(reply)}, reply ? Result::ok : Result::not_ready};
}

void ReplyReader::Deleter::operator()(::redisReader *reader) const noexcept
{
	::redisReaderFree(reader);
}

Pool::Pool(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& remote) :
	m_ioc{ioc},
	m_remote{remote}
{
}

boost::asio::ip::tcp::socket Pool::get_sock()
{
	{
		std::unique_lock lock{m_mx};
		if (!m_socks.empty())
		{
			auto sock = std::move(m_socks.back());
			m_socks.pop_back();
			return sock;
		}
	}

	boost::asio::ip::tcp::socket sock{m_ioc};
	sock.connect(m_remote);
	return sock;
}

std::shared_ptr<Connection> Pool::alloc()
{
	return std::make_shared<Connection>(*this, get_sock());
}

void Pool::dealloc(boost::asio::ip::tcp::socket socket)
{
	// closed sockets cannot be reused
	if (!socket.is_open())
		return;

	std::unique_lock lock{m_mx};
	m_socks.push_back(std::move(socket));
}

}} // end of namespace
