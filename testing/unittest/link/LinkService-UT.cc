/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "common/MemoryRemote.hh"

#include "link/IntegrityGuard.hh"
#include "link/LinkCodec.hh"
#include "link/LinkService.hh"
#include "registry/MemoryShard.hh"
#include "registry/PendingAssociationCache.hh"
#include "registry/ShardedRegistry.hh"
#include "stream/ObjectStreamer.hh"
#include "stream/SessionPool.hh"
#include "util/Error.hh"

using namespace cgw;

namespace {

struct Fixture
{
	Fixture() : registry{make_shards(), 1}
	{
	}

	static std::vector<std::unique_ptr<ShardStore>> make_shards()
	{
		std::vector<std::unique_ptr<ShardStore>> shards;
		shards.push_back(std::make_unique<MemoryShard>("shard1"));
		shards.push_back(std::make_unique<MemoryShard>("shard2"));
		return shards;
	}

	// returns the record, whether it is new, and the error
	std::tuple<FileRecord, bool, std::error_code> upload(const UploadEvent& event)
	{
		bool called = false;
		std::tuple<FileRecord, bool, std::error_code> result;
		subject.on_upload(event, [&](FileRecord record, bool created, std::error_code ec)
		{
			called = true;
			result = {std::move(record), created, ec};
		});
		REQUIRE(called);
		return result;
	}

	std::pair<IssuedLink, std::error_code> issue(std::int64_t user, std::int64_t interaction)
	{
		bool called = false;
		std::pair<IssuedLink, std::error_code> result;
		subject.issue(user, interaction, [&](IssuedLink link, std::error_code ec)
		{
			called = true;
			result = {std::move(link), ec};
		});
		REQUIRE(called);
		return result;
	}

	std::shared_ptr<MemoryRemote> remote{std::make_shared<MemoryRemote>()};
	SessionPool pool{std::vector<std::shared_ptr<RemoteSession>>{remote}};
	StreamerCache streamers{16};
	ShardedRegistry registry;
	PendingAssociationCache pending;
	LinkCodec codec{"link service test secret"};
	LinkService subject{pool, streamers, registry, pending, codec, LinkService::Settings{"https://example.com", 256, 1000}};
};

} // end of local namespace

TEST_CASE_METHOD(Fixture, "upload registers a new record", "[normal]")
{
	ObjectCoordinate coord{-1001234567890, 42};
	remote->add(coord, pattern(3000));

	auto [record, created, ec] = upload({100, 7, coord, "My Movie (2024).mp4"});
	REQUIRE(!ec);
	REQUIRE(created);
	REQUIRE(record.owner == 100);
	REQUIRE(record.location == coord);
	REQUIRE(record.display_name == "My Movie (2024).mp4");
	REQUIRE(record.url_safe_name == "My_Movie_2024.mp4");
	REQUIRE(record.size == 3000);
	REQUIRE(record.size_label == "2.93 KB");
	REQUIRE(record.fingerprint == "AgADBQ");
	REQUIRE(record.access_count == 0);
	REQUIRE(record.content_hash.size() == 64);

	// new records go to the current shard
	REQUIRE(dynamic_cast<MemoryShard&>(registry.shard(1)).size() == 1);
	REQUIRE(dynamic_cast<MemoryShard&>(registry.shard(2)).size() == 0);

	auto entry = pending.get(100, 7);
	REQUIRE(entry.has_value());
	REQUIRE(entry->id == record.id);
	REQUIRE(entry->display_name == record.display_name);
	REQUIRE(entry->size_label == record.size_label);

	// all sessions are returned to the pool
	REQUIRE(pool.loads() == std::vector<std::size_t>{0});
}

TEST_CASE_METHOD(Fixture, "upload without display name uses the stored name", "[normal]")
{
	ObjectCoordinate coord{5, 6};
	remote->add(coord, pattern(10));

	auto [record, created, ec] = upload({100, 8, coord, ""});
	REQUIRE(!ec);
	REQUIRE(created);
	REQUIRE(record.display_name == "movie.mp4");
	REQUIRE(record.url_safe_name == "movie.mp4");
}

TEST_CASE_METHOD(Fixture, "same content is registered once", "[normal]")
{
	ObjectCoordinate first{1, 1}, second{2, 2};
	remote->add(first,  pattern(3000));
	remote->add(second, pattern(3000), "BQADBAAD");

	auto [original, created1, ec1] = upload({100, 1, first, "one.mp4"});
	REQUIRE(!ec1);
	REQUIRE(created1);

	auto [duplicate, created2, ec2] = upload({200, 2, second, "two.mp4"});
	REQUIRE(!ec2);
	REQUIRE(!created2);
	REQUIRE(duplicate.id == original.id);
	REQUIRE(duplicate.location == first);
	REQUIRE(duplicate.access_count == 1);

	// the second interaction refers to the existing record
	auto entry = pending.get(200, 2);
	REQUIRE(entry.has_value());
	REQUIRE(entry->id == original.id);
	REQUIRE(entry->display_name == "one.mp4");
}

TEST_CASE_METHOD(Fixture, "only the prefix of the content is hashed", "[normal]")
{
	auto content = pattern(3000);
	remote->add({1, 1}, content);

	auto differ_late = content;
	differ_late[2000] ^= 0x55;
	remote->add({1, 2}, differ_late);

	auto differ_early = content;
	differ_early[500] ^= 0x55;
	remote->add({1, 3}, differ_early);

	auto [original, created1, ec1] = upload({100, 1, {1, 1}, "a.bin"});
	REQUIRE(created1);

	auto [late, created2, ec2] = upload({100, 2, {1, 2}, "b.bin"});
	REQUIRE(!ec2);
	REQUIRE(!created2);
	REQUIRE(late.id == original.id);

	auto [early, created3, ec3] = upload({100, 3, {1, 3}, "c.bin"});
	REQUIRE(!ec3);
	REQUIRE(created3);
	REQUIRE(early.id != original.id);
	REQUIRE(early.content_hash != original.content_hash);
}

TEST_CASE_METHOD(Fixture, "issued links decode to the uploaded object", "[normal]")
{
	ObjectCoordinate coord{-1001234567890, 42};
	remote->add(coord, pattern(3000));

	auto [record, created, uec] = upload({100, 7, coord, "My Movie (2024).mp4"});
	REQUIRE(!uec);

	auto [link, ec] = issue(100, 7);
	REQUIRE(!ec);

	std::string dl_prefix{"https://example.com/dl/"};
	std::string watch_prefix{"https://example.com/watch/"};
	REQUIRE(link.download_url.substr(0, dl_prefix.size()) == dl_prefix);
	REQUIRE(link.watch_url.substr(0, watch_prefix.size()) == watch_prefix);
	REQUIRE(link.download_url.substr(dl_prefix.size()) == link.watch_url.substr(watch_prefix.size()));

	auto path = link.download_url.substr(dl_prefix.size());
	auto slash = path.find('/');
	REQUIRE(slash == IntegrityGuard::fingerprint_length + LinkCodec::token_length);
	REQUIRE(path.substr(slash + 1) == "My_Movie_2024.mp4");

	std::error_code dec;
	auto [fingerprint, token] = IntegrityGuard::split(std::string_view{path}.substr(0, slash), dec);
	REQUIRE(!dec);
	REQUIRE(fingerprint == "AgADBQ");
	REQUIRE(codec.decode(token, dec) == coord);
	REQUIRE(!dec);
	REQUIRE(subject.link_path(record) == path);
}

TEST_CASE_METHOD(Fixture, "issue without a pending upload", "[error]")
{
	auto [link, ec] = issue(100, 7);
	REQUIRE(ec == Error::pending_not_found);
	REQUIRE(link.download_url.empty());

	remote->add({1, 1}, pattern(100));
	upload({100, 7, {1, 1}, "a.bin"});

	// another user cannot use the same interaction
	REQUIRE(issue(200, 7).second == Error::pending_not_found);
	REQUIRE(!issue(100, 7).second);
}

TEST_CASE_METHOD(Fixture, "issue after the record is removed", "[error]")
{
	remote->add({1, 1}, pattern(100));
	auto [record, created, uec] = upload({100, 7, {1, 1}, "a.bin"});
	REQUIRE(!uec);

	bool removed = false;
	registry.remove(record.id, [&removed](bool done, std::error_code ec)
	{
		REQUIRE(!ec);
		removed = done;
	});
	REQUIRE(removed);

	REQUIRE(issue(100, 7).second == Error::record_not_found);
}

TEST_CASE_METHOD(Fixture, "upload of an unknown object", "[error]")
{
	auto [record, created, ec] = upload({100, 7, {9, 9}, "a.bin"});
	REQUIRE(ec == Error::object_not_found);
	REQUIRE(!created);
	REQUIRE(!pending.get(100, 7).has_value());
	REQUIRE(pool.loads() == std::vector<std::size_t>{0});
}

TEST_CASE_METHOD(Fixture, "upload fails if the content cannot be read", "[error]")
{
	remote->add({1, 1}, pattern(1000));
	remote->fail_at(2);

	auto [record, created, ec] = upload({100, 7, {1, 1}, "a.bin"});
	REQUIRE(ec == Error::upstream_unavailable);
	REQUIRE(!created);
	REQUIRE(dynamic_cast<MemoryShard&>(registry.shard(1)).size() == 0);
	REQUIRE(!pending.get(100, 7).has_value());
}
