/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include <boost/asio.hpp>

#include <hiredis/hiredis.h>

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <vector>

namespace cgw {
namespace redis {

enum class Error
{
	ok = REDIS_OK,
	io = REDIS_ERR_IO,
	eof = REDIS_ERR_EOF,
	protocol = REDIS_ERR_PROTOCOL,
	oom = REDIS_ERR_OOM,
	other = REDIS_ERR_OTHER,
};

std::error_code make_error_code(Error err);
const std::error_category& redis_error_category();

/// \brief  Shared, read-only view of a hiredis reply.
///
/// Array elements are owned by the Reply so that they can outlive their parent.
class Reply
{
public:
	explicit Reply(redisReply *r = nullptr) noexcept;

	bool is_string() const {return m_reply && m_reply->type == REDIS_REPLY_STRING;}
	bool is_error() const {return m_reply && m_reply->type == REDIS_REPLY_ERROR;}

	/// False for nil and error replies.
	explicit operator bool() const noexcept;

	std::string_view as_string() const noexcept;
	std::string_view as_error() const noexcept;

	/// Value of an integer reply, or 0.
	long as_int() const noexcept;

	/// Parses a string reply as an integer, e.g. a hash field. Returns 0
	/// if it is not a number.
	long to_int() const noexcept;

	Reply operator[](std::size_t i) const noexcept;
	std::size_t array_size() const noexcept;

	/// Calls \a func(key, value) for each pair of an HGETALL-style array.
	template <typename Func>
	void foreach_kv_pair(Func&& func) const
	{
		for (std::size_t i = 0; i+1 < array_size(); i += 2)
			func((*this)[i].as_string(), (*this)[i+1]);
	}

private:
	std::string_view raw_string() const noexcept;

private:
	std::shared_ptr<::redisReply> m_reply;
	std::vector<Reply> m_array;
};

/// Incremental RESP parser.
class ReplyReader
{
public:
	enum class Result {ok, error, not_ready};

public:
	void feed(const char *data, std::size_t size);
	std::tuple<Reply, Result> get();

private:
	struct Deleter {void operator()(::redisReader*) const noexcept;};
	std::unique_ptr<::redisReader, Deleter> m_reader{::redisReaderCreate()};
};

/// \brief  A formatted command, ready to be sent.
///
/// The format string is a hiredis format, e.g. "EVAL %s 2 %b %b". Only
/// string literals are accepted so that user input never becomes part of
/// the format.
class CommandString
{
public:
	template <std::size_t N, typename... Args>
	explicit CommandString(const char (&cmd)[N], Args... args) :
		m_length{::redisFormatCommand(&m_cmd, cmd, args...)}
	{
		if (m_length < 0)
			throw std::logic_error("invalid command string");
	}
	CommandString(CommandString&& other) noexcept;
	CommandString(const CommandString&) = delete;
	~CommandString();
	CommandString& operator=(CommandString&& other) noexcept;
	CommandString& operator=(const CommandString&) = delete;

	void swap(CommandString& other) noexcept;

	std::size_t length() const {return static_cast<std::size_t>(m_length);}
	auto buffer() const {return boost::asio::buffer(m_cmd, length());}

private:
	char    *m_cmd{};
	int     m_length{};
};

class PoolBase
{
public:
	virtual void dealloc(boost::asio::ip::tcp::socket socket) = 0;
};

/// \brief  One pipelined connection to a redis server.
///
/// Replies are matched to commands in the order the commands were written.
/// The socket goes back to its pool when the last reference is dropped.
class Connection : public std::enable_shared_from_this<Connection>
{
public:
	using Completion = std::function<void(Reply, std::error_code)>;

public:
	Connection(PoolBase& parent, boost::asio::ip::tcp::socket socket);
	Connection(const Connection&) = delete;
	~Connection();
	Connection& operator=(const Connection&) = delete;

	template <typename Callback, std::size_t N, typename... Args>
	std::enable_if_t<std::is_invocable_v<Callback, Reply, std::error_code>>
	command(Callback&& callback, const char (&cmd)[N], Args... args)
	{
		std::optional<CommandString> str;
		try
		{
			str.emplace(cmd, args...);
		}
		catch (std::logic_error&)
		{
			callback(Reply{}, std::error_code{Error::protocol});
			return;
		}

		do_write(
			std::move(*str),
			[callback=std::forward<Callback>(callback), self=shared_from_this()](Reply r, std::error_code ec) mutable
			{
				callback(std::move(r), ec);
			}
		);
	}

	void disconnect();

private:
	void do_write(CommandString&& cmd, Completion&& completion);
	void do_read();
	void on_read(boost::system::error_code ec, std::size_t bytes);
	void fail_all(std::error_code ec);

private:
	boost::asio::ip::tcp::socket m_socket;
	boost::asio::strand<boost::asio::ip::tcp::socket::executor_type> m_strand;

	// records are small but find_all() returns a whole shard at once
	std::vector<char> m_read_buf;

	std::deque<Completion> m_callbacks;

	ReplyReader m_reader;
	PoolBase&   m_parent;
};

/// Idle sockets to one redis server, shared by all connections to it.
class Pool : public PoolBase
{
public:
	Pool(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& remote);

	/// Reuse an idle connection or open a new one. Throws boost::system::system_error
	/// if the redis server cannot be reached.
	std::shared_ptr<Connection> alloc();
	const boost::asio::ip::tcp::endpoint& remote() const {return m_remote;}
	void dealloc(boost::asio::ip::tcp::socket socket) override;

private:
	boost::asio::ip::tcp::socket get_sock();

private:
	boost::asio::io_context&                    m_ioc;
	const boost::asio::ip::tcp::endpoint        m_remote;

	std::mutex                                  m_mx;
	std::vector<boost::asio::ip::tcp::socket>   m_socks;
};

}} // end of namespace

namespace std
{
	template <> struct is_error_code_enum<cgw::redis::Error> : true_type {};
}
