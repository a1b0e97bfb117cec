/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/6/18.
//

#pragma once

#include "Exception.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace cgw {

struct ShardSetting
{
	std::string name;
	boost::asio::ip::tcp::endpoint redis{
		boost::asio::ip::make_address("127.0.0.1"),
		6379
	};
};

/// \brief  Parsing command line options and configuration file
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	struct MissingSecret : virtual Error {};
	struct InvalidShard : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    std::filesystem::path>;

public:
	Configuration() = default;
	Configuration(int argc, const char *const *argv, const char *env);

	boost::asio::ip::tcp::endpoint listen_http() const { return m_listen_http;}
	const std::string& base_url() const {return m_base_url;}
	std::size_t thread_count() const {return m_thread_count;}
	std::size_t body_limit() const {return m_body_limit;}

	const std::string& admin_username() const {return m_admin_username;}
	const std::string& admin_password() const {return m_admin_password;}
	const std::string& link_secret() const {return m_link_secret;}

	std::int64_t chunk_size() const {return m_chunk_size;}
	std::int64_t hash_prefix_limit() const {return m_hash_prefix_limit;}
	std::chrono::seconds pending_ttl() const {return m_pending_ttl;}
	std::chrono::seconds sweep_interval() const {return m_sweep_interval;}
	std::size_t metadata_cache_size() const {return m_metadata_cache_size;}

	const std::filesystem::path& remote_root() const {return m_remote_root;}
	std::size_t remote_sessions() const {return m_remote_sessions;}

	const std::string& registry_backend() const {return m_registry_backend;}
	std::size_t current_shard() const {return m_current_shard;}
	const std::vector<ShardSetting>& shards() const {return m_shards;}

	bool help() const {return m_args.count("help") > 0;}

	void usage(std::ostream& out) const;

	// for unit tests
	void change_listen_port(std::uint16_t http);
	void remote_root(std::filesystem::path path) {m_remote_root = std::move(path);}

private:
	void load_config(const std::filesystem::path& path);

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	boost::asio::ip::tcp::endpoint m_listen_http{
		boost::asio::ip::make_address("0.0.0.0"),
		8080
	};
	std::string m_base_url{"http://localhost:8080"};
	std::size_t m_thread_count{1};
	std::size_t m_body_limit{64 * 1024};

	std::string m_admin_username{"admin"};
	std::string m_admin_password;
	std::string m_link_secret;

	std::int64_t m_chunk_size{1024 * 1024};
	std::int64_t m_hash_prefix_limit{10 * 1024 * 1024};
	std::chrono::seconds m_pending_ttl{86400};
	std::chrono::seconds m_sweep_interval{3600};
	std::size_t m_metadata_cache_size{1024};

	std::filesystem::path m_remote_root;
	std::size_t m_remote_sessions{1};

	std::string m_registry_backend{"memory"};
	std::size_t m_current_shard{1};
	std::vector<ShardSetting> m_shards{ShardSetting{"shard1"}};
};

} // end of namespace
