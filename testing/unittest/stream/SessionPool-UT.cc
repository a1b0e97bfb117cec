/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "stream/SessionPool.hh"

#include "common/MemoryRemote.hh"

#include <random>
#include <thread>

using namespace cgw;

namespace {

std::vector<std::shared_ptr<RemoteSession>> sessions(std::size_t count)
{
	std::vector<std::shared_ptr<RemoteSession>> result;
	for (std::size_t i = 0; i < count; ++i)
		result.push_back(std::make_shared<MemoryRemote>("session" + std::to_string(i)));
	return result;
}

} // end of local namespace

TEST_CASE("acquire the least loaded session", "[normal]")
{
	SessionPool subject{sessions(3)};
	REQUIRE(subject.size() == 3);

	auto a = subject.acquire();
	auto b = subject.acquire();
	auto c = subject.acquire();
	REQUIRE(a.index() == 0);
	REQUIRE(b.index() == 1);
	REQUIRE(c.index() == 2);
	REQUIRE(subject.loads() == std::vector<std::size_t>{1, 1, 1});

	// ties go to the lowest index
	auto d = subject.acquire();
	REQUIRE(d.index() == 0);

	b.release();
	REQUIRE(subject.loads() == std::vector<std::size_t>{2, 0, 1});

	auto e = subject.acquire();
	REQUIRE(e.index() == 1);
	REQUIRE(&e.session() == &subject.session(1));
	REQUIRE(e.session().name() == "session1");
}

TEST_CASE("leases return their session on destruction", "[normal]")
{
	SessionPool subject{sessions(2)};
	{
		auto a = subject.acquire();
		auto b = subject.acquire();
		REQUIRE(subject.loads() == std::vector<std::size_t>{1, 1});
	}
	REQUIRE(subject.loads() == std::vector<std::size_t>{0, 0});
}

TEST_CASE("moved leases release only once", "[normal]")
{
	SessionPool subject{sessions(2)};

	auto a = subject.acquire();
	SessionPool::Lease b{std::move(a)};
	REQUIRE_FALSE(a);
	REQUIRE(b);
	REQUIRE(subject.loads() == std::vector<std::size_t>{1, 0});

	a = subject.acquire();
	REQUIRE(a.index() == 1);

	// move assignment releases the old session of the target
	a = std::move(b);
	REQUIRE(subject.loads() == std::vector<std::size_t>{1, 0});
	REQUIRE(a.index() == 0);

	a.release();
	a.release();
	REQUIRE(subject.loads() == std::vector<std::size_t>{0, 0});
	REQUIRE_THROWS_AS(a.session(), SessionPool::Error);
}

TEST_CASE("pool needs valid sessions", "[error]")
{
	REQUIRE_THROWS_AS(SessionPool{std::vector<std::shared_ptr<RemoteSession>>{}}, SessionPool::Error);

	auto list = sessions(2);
	list.push_back(nullptr);
	REQUIRE_THROWS_AS(SessionPool{list}, SessionPool::Error);
}

TEST_CASE("no leaked load after concurrent acquire and release", "[normal]")
{
	SessionPool subject{sessions(4)};

	std::vector<std::thread> threads;
	for (unsigned t = 0; t < 4; ++t)
	{
		threads.emplace_back([&subject, t]
		{
			std::mt19937 gen{t};
			std::uniform_int_distribution<int> dist{0, 3};

			std::vector<SessionPool::Lease> held;
			for (int i = 0; i < 1000; ++i)
			{
				if (dist(gen) > 0 || held.empty())
					held.push_back(subject.acquire());
				else
					held.erase(held.begin() + dist(gen) % held.size());

				if (held.size() > 8)
					held.clear();
			}
		});
	}
	for (auto&& t : threads)
		t.join();

	REQUIRE(subject.loads() == std::vector<std::size_t>{0, 0, 0, 0});
}
