/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "stream/DirectoryStore.hh"
#include "util/Error.hh"

#include "common/MemoryRemote.hh"
#include "common/TempDirectory.hh"

using namespace cgw;

TEST_CASE("resolve object with sidecar metadata", "[normal]")
{
	TempDirectory dir;
	dir.write("100/7", pattern(1000));
	dir.write("100/7.json", R"({"unique_id": "AgADxyzw1234", "file_name": "Big Buck Bunny.mp4", "mime_type": "video/mp4"})");

	boost::asio::io_context ioc;
	DirectoryStore subject{ioc, dir.path(), "dir"};
	REQUIRE(subject.name() == "dir");
	REQUIRE(subject.path({100, 7}).string() == (dir.path() / "100" / "7").string());

	std::error_code ec;
	auto meta = subject.resolve({100, 7}, ec);
	REQUIRE(!ec);
	REQUIRE((meta.location == ObjectCoordinate{100, 7}));
	REQUIRE(meta.size == 1000);
	REQUIRE(meta.unique_id == "AgADxyzw1234");
	REQUIRE(meta.file_name == "Big Buck Bunny.mp4");
	REQUIRE(meta.mime_type == "video/mp4");
}

TEST_CASE("resolve object without sidecar", "[normal]")
{
	TempDirectory dir;
	dir.write("1/2", "just some plain text\n");

	boost::asio::io_context ioc;
	DirectoryStore subject{ioc, dir.path(), "dir"};

	std::error_code ec;
	auto meta = subject.resolve({1, 2}, ec);
	REQUIRE(!ec);
	REQUIRE(meta.size == 21);
	REQUIRE(meta.unique_id.size() == 32);
	REQUIRE(meta.file_name.empty());
	REQUIRE(!meta.mime_type.empty());

	// the derived unique ID is stable
	REQUIRE(subject.resolve({1, 2}, ec).unique_id == meta.unique_id);
}

TEST_CASE("resolve missing object", "[error]")
{
	TempDirectory dir;
	boost::asio::io_context ioc;
	DirectoryStore subject{ioc, dir.path(), "dir"};

	std::error_code ec;
	subject.resolve({1, 2}, ec);
	REQUIRE(ec == Error::object_not_found);
}

TEST_CASE("empty and non-regular objects", "[error]")
{
	TempDirectory dir;
	dir.write("1/2", "");
	dir.write("1/3/inside", "not an object");

	boost::asio::io_context ioc;
	DirectoryStore subject{ioc, dir.path(), "dir"};

	std::error_code ec;
	auto meta = subject.resolve({1, 2}, ec);
	REQUIRE(!ec);
	REQUIRE(meta.size == 0);

	// a directory at the object path is not an object
	meta = subject.resolve({1, 3}, ec);
	REQUIRE(ec == Error::object_not_found);
	REQUIRE(meta.size == 0);
}

TEST_CASE("invalid sidecar is an upstream error", "[error]")
{
	TempDirectory dir;
	dir.write("1/2", "content");
	dir.write("1/2.json", "{not json");

	boost::asio::io_context ioc;
	DirectoryStore subject{ioc, dir.path(), "dir"};

	std::error_code ec;
	subject.resolve({1, 2}, ec);
	REQUIRE(ec == Error::upstream_unavailable);
}

TEST_CASE("read whole chunks", "[normal]")
{
	TempDirectory dir;
	auto content = pattern(2500);
	dir.write("5/6", content);

	boost::asio::io_context ioc;
	DirectoryStore subject{ioc, dir.path(), "dir"};

	std::error_code ec;
	auto meta = subject.resolve({5, 6}, ec);
	REQUIRE(!ec);

	auto chunk = subject.read(meta, 0, 1000, ec);
	REQUIRE(!ec);
	REQUIRE(std::string(chunk.begin(), chunk.end()) == content.substr(0, 1000));

	chunk = subject.read(meta, 2, 1000, ec);
	REQUIRE(!ec);
	REQUIRE(std::string(chunk.begin(), chunk.end()) == content.substr(2000));

	chunk = subject.read(meta, 3, 1000, ec);
	REQUIRE(!ec);
	REQUIRE(chunk.empty());
}

TEST_CASE("asynchronous reads complete on the io_context", "[normal]")
{
	TempDirectory dir;
	auto content = pattern(300);
	dir.write("5/6", content);

	boost::asio::io_context ioc;
	DirectoryStore subject{ioc, dir.path(), "dir"};

	bool resolved = false, read = false;
	subject.resolve_object({5, 6}, [&](ObjectMetadata meta, std::error_code ec)
	{
		REQUIRE(!ec);
		resolved = true;
		subject.read_chunk(meta, 1, 256, [&](ChunkBuffer chunk, std::error_code ec)
		{
			REQUIRE(!ec);
			REQUIRE(std::string(chunk.begin(), chunk.end()) == content.substr(256));
			read = true;
		});
	});
	REQUIRE_FALSE(resolved);

	ioc.run();
	REQUIRE(resolved);
	REQUIRE(read);
}
