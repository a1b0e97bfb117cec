/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/6/18.
//

#include "Configuration.hh"

#include "config.hh"

#include <nlohmann/json.hpp>

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include <fstream>

namespace po = boost::program_options;
namespace ip = boost::asio::ip;

namespace cgw {
namespace {

ip::tcp::endpoint parse_endpoint(const nlohmann::json& json, const ip::tcp::endpoint& def)
{
	return {
		ip::make_address(json.value("address", def.address().to_string())),
		json.value("port", def.port())
	};
}

} // end of local namespace

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	using namespace std::literals;
	m_desc.add_options()
		("help",      "produce help message")
		("cfg",       po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable CHUNKGATE_CONFIG to set default path.")
	;

	if (argc > 0)
	{
		store(po::parse_command_line(argc, argv, m_desc), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (!help())
		load_config(
			m_args.count("cfg") > 0 ? m_args["cfg"].as<std::string>() :
			env ? std::string{env} : std::string{constants::config_filename}
		);
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

void Configuration::load_config(const std::filesystem::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		auto json = nlohmann::json::parse(config_file);
		using jptr = nlohmann::json::json_pointer;

		m_link_secret = json.value(jptr{"/link_secret"}, std::string{});
		if (m_link_secret.empty())
			BOOST_THROW_EXCEPTION(MissingSecret() << Message{"link_secret must not be empty"});

		m_base_url      = json.value(jptr{"/base_url"}, m_base_url);
		while (!m_base_url.empty() && m_base_url.back() == '/')
			m_base_url.pop_back();

		m_thread_count  = json.value(jptr{"/thread_count"}, m_thread_count);
		m_body_limit    = json.value(jptr{"/body_limit_kb"}, m_body_limit/1024) * 1024;

		m_admin_username = json.value(jptr{"/admin/username"}, m_admin_username);
		m_admin_password = json.value(jptr{"/admin/password"}, m_admin_password);

		m_chunk_size        = json.value(jptr{"/chunk_size"}, m_chunk_size);
		m_hash_prefix_limit = static_cast<std::int64_t>(
			json.value(jptr{"/hash_prefix_limit_mb"}, m_hash_prefix_limit/1024.0/1024.0) * 1024 * 1024
		);
		m_pending_ttl    = std::chrono::seconds{json.value(jptr{"/pending_ttl_sec"}, m_pending_ttl.count())};
		m_sweep_interval = std::chrono::seconds{json.value(jptr{"/sweep_interval_sec"}, m_sweep_interval.count())};
		m_metadata_cache_size = json.value(jptr{"/metadata_cache_size"}, m_metadata_cache_size);

		if (m_chunk_size <= 0 || m_thread_count == 0)
			BOOST_THROW_EXCEPTION(Error() << Message{"chunk_size and thread_count must be positive"});

		// Paths are relative to the configuration file
		m_remote_root = std::filesystem::weakly_canonical(
			path.parent_path() / json.at(jptr{"/remote/root"}).get<std::string>()
		);
		m_remote_sessions = std::max<std::size_t>(json.value(jptr{"/remote/sessions"}, m_remote_sessions), 1);

		if (auto http = json.value(jptr{"/http"}, nlohmann::json::object_t{}); !http.empty())
			m_listen_http = parse_endpoint(http, m_listen_http);

		m_registry_backend = json.value(jptr{"/registry/backend"}, m_registry_backend);
		if (m_registry_backend != "memory" && m_registry_backend != "redis")
			BOOST_THROW_EXCEPTION(InvalidShard() << Message{"unknown registry backend: " + m_registry_backend});

		if (auto shards = json.value(jptr{"/registry/shards"}, nlohmann::json::array_t{}); !shards.empty())
		{
			m_shards.clear();
			for (auto&& shard : shards)
			{
				ShardSetting setting;
				setting.name  = shard.at("name").get<std::string>();
				setting.redis = parse_endpoint(shard, setting.redis);
				m_shards.push_back(std::move(setting));
			}
		}

		m_current_shard = json.value(jptr{"/registry/current_shard"}, m_current_shard);
		if (m_current_shard < 1 || m_current_shard > m_shards.size())
			BOOST_THROW_EXCEPTION(InvalidShard() << Message{"current_shard out of range"});
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
	catch (std::exception& e)
	{
		throw boost::enable_error_info(e) << Path{path};
	}
}

void Configuration::change_listen_port(std::uint16_t http)
{
	m_listen_http.port(http);
}

} // end of namespace
