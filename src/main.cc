/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "cgw/Server.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include "config.hh"

#include <boost/asio/signal_set.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

namespace cgw {

void run(Server& server, const Configuration& cfg)
{
	OpenSSL_add_all_digests();
	auto const threads = std::max<std::size_t>(1, cfg.thread_count());

	server.listen();

	boost::asio::signal_set signals{server.get_io_context(), SIGINT, SIGTERM};
	signals.async_wait([&server](boost::system::error_code ec, int sig)
	{
		if (!ec)
		{
			Log(LOG_NOTICE, "signal %1% received, shutting down", sig);
			server.stop();
			server.get_io_context().stop();
		}
	});

	// Run the I/O service on the requested number of threads
	std::vector<std::thread> v;
	v.reserve(threads - 1);
	for (auto i = threads - 1; i > 0; --i)
		v.emplace_back([&server]{server.get_io_context().run();});

	server.get_io_context().run();

	for (auto&& t : v)
		t.join();
}

int StartServer(const Configuration& cfg)
{
	Server server{cfg};
	Log(LOG_NOTICE, "chunkgate (version %1%) starting", constants::version);
	run(server, cfg);
	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char *argv[])
{
	using namespace cgw;
	try
	{
		Configuration cfg{argc, argv, ::getenv("CHUNKGATE_CONFIG")};
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		return StartServer(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		std::cerr << boost::diagnostic_information(e) << std::endl;
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", boost::diagnostic_information(e));
		std::cerr << boost::diagnostic_information(e) << std::endl;
		return EXIT_FAILURE;
	}
}
