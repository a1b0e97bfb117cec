/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "cgw/RequestHandler.hh"

#include "common/MemoryRemote.hh"
#include "common/TempDirectory.hh"

#include "link/LinkCodec.hh"
#include "link/LinkService.hh"
#include "registry/MemoryShard.hh"
#include "registry/PendingAssociationCache.hh"
#include "registry/ShardedRegistry.hh"
#include "stream/DirectoryStore.hh"
#include "stream/ObjectStreamer.hh"
#include "stream/SessionPool.hh"

#include <boost/asio/io_context.hpp>

#include <optional>

using namespace cgw;

namespace {

const std::string base_url{"https://example.com"};
const std::string admin_auth{"Basic YWRtaW46c2VjcmV0"};     // admin:secret
const std::int64_t three_mib = 3 * 1024 * 1024;

template <typename Message>
std::string field(const Message& msg, http::field f)
{
	auto value = msg[f];
	return {value.data(), value.size()};
}

struct Fixture
{
	Fixture()
	{
		movie = pattern(three_mib);
		dir.write("100/7", movie);
		dir.write("100/7.json", R"({"unique_id": "AgADBQADq0cAAk", "file_name": "Big Buck Bunny.mp4", "mime_type": "video/mp4"})");

		dir.write("100/8", pattern(1000));
		dir.write("100/8.json", R"({"unique_id": "BQACAgUAAxkB", "file_name": "small.bin"})");

		// same content as 100/7
		dir.write("200/1", movie);
		dir.write("200/1.json", R"({"unique_id": "CAACAgIAAxkB", "file_name": "copy.mp4", "mime_type": "video/mp4"})");
	}

	static std::vector<std::unique_ptr<ShardStore>> make_shards()
	{
		std::vector<std::unique_ptr<ShardStore>> shards;
		shards.push_back(std::make_unique<MemoryShard>("shard1"));
		shards.push_back(std::make_unique<MemoryShard>("shard2"));
		return shards;
	}

	std::string download_path(const ObjectCoordinate& coord, const std::string& fingerprint = "AgADBQ") const
	{
		return "/dl/" + fingerprint + codec.encode(coord) + "/Big_Buck_Bunny.mp4";
	}

	Response call(StringRequest&& req)
	{
		std::optional<Response> result;
		subject.handle(std::move(req), [&result](Response&& res)
		{
			REQUIRE(!result.has_value());
			result = std::move(res);
		});
		ioc.restart();
		ioc.run();

		REQUIRE(result.has_value());
		return std::move(*result);
	}

	Response get(const std::string& target, const std::string& range = {})
	{
		StringRequest req{http::verb::get, target, 11};
		if (!range.empty())
			req.set(http::field::range, range);
		return call(std::move(req));
	}

	StringResponse api(http::verb method, const std::string& target, const std::string& body = {}, const std::string& auth = admin_auth)
	{
		StringRequest req{method, target, 11};
		if (!auth.empty())
			req.set(http::field::authorization, auth);
		req.body() = body;
		req.prepare_payload();

		auto res = call(std::move(req));
		REQUIRE(std::holds_alternative<StringResponse>(res));
		return std::get<StringResponse>(std::move(res));
	}

	std::string drain(ChunkStream& stream)
	{
		std::string result;
		while (!stream.done())
		{
			bool called = false;
			stream.next([&result, &called](ChunkBuffer chunk, std::error_code ec)
			{
				REQUIRE(!ec);
				called = true;
				result.append(chunk.begin(), chunk.end());
			});
			ioc.restart();
			ioc.run();
			REQUIRE(called);
		}
		return result;
	}

	TempDirectory dir;
	std::string movie;

	boost::asio::io_context ioc;
	SessionPool pool{std::vector<std::shared_ptr<RemoteSession>>{
		std::make_shared<DirectoryStore>(ioc, dir.path(), "session1"),
		std::make_shared<DirectoryStore>(ioc, dir.path(), "session2")
	}};
	StreamerCache streamers{16};
	ShardedRegistry registry{make_shards(), 1};
	PendingAssociationCache pending;
	LinkCodec codec{"request handler test secret"};
	LinkService links{pool, streamers, registry, pending, codec, LinkService::Settings{base_url, 1024*1024, 10*1024*1024}};
	RequestHandler subject{pool, streamers, registry, links, codec, RequestHandler::Settings{base_url, "admin", "secret", 1024*1024}};
};

} // end of local namespace

TEST_CASE("error codes map to HTTP status", "[normal]")
{
	REQUIRE(RequestHandler::status_of(Error::malformed_range) == http::status::bad_request);
	REQUIRE(RequestHandler::status_of(Error::malformed_token) == http::status::bad_request);
	REQUIRE(RequestHandler::status_of(Error::range_not_satisfiable) == http::status::range_not_satisfiable);
	REQUIRE(RequestHandler::status_of(Error::invalid_fingerprint) == http::status::not_found);
	REQUIRE(RequestHandler::status_of(Error::object_not_found) == http::status::not_found);
	REQUIRE(RequestHandler::status_of(Error::upstream_unavailable) == http::status::service_unavailable);
	REQUIRE(RequestHandler::status_of(Error::registry_io) == http::status::internal_server_error);
	REQUIRE(RequestHandler::status_of(std::make_error_code(std::errc::io_error)) == http::status::internal_server_error);

	// foreign error messages are not shown to clients
	auto res = RequestHandler::error_response(std::make_error_code(std::errc::io_error), 11);
	REQUIRE(nlohmann::json::parse(res.body())["error"] == "internal error");
	REQUIRE(field(res, http::field::content_type) == "application/json");
}

TEST_CASE_METHOD(Fixture, "download a byte range across chunk boundaries", "[normal]")
{
	auto res = get(download_path({100, 7}), "bytes=1048000-2100000");
	REQUIRE(std::holds_alternative<StreamResponse>(res));

	auto& stream_res = std::get<StreamResponse>(res);
	auto& header = stream_res.header;
	REQUIRE(header.result() == http::status::partial_content);
	REQUIRE(field(header, http::field::content_length) == "1052001");
	REQUIRE(field(header, http::field::content_range) == "bytes 1048000-2100000/3145728");
	REQUIRE(field(header, http::field::accept_ranges) == "bytes");
	REQUIRE(field(header, http::field::content_type) == "video/mp4");
	REQUIRE(field(header, http::field::content_disposition) == "inline; filename=\"Big Buck Bunny.mp4\"");
	REQUIRE(field(header, http::field::access_control_allow_origin) == "*");

	REQUIRE(stream_res.stream);
	REQUIRE(stream_res.stream->window().chunk_count == 2);
	REQUIRE(pool.loads() == std::vector<std::size_t>{1, 0});

	auto body = drain(*stream_res.stream);
	REQUIRE(body.size() == 1052001);
	REQUIRE(body == movie.substr(1048000, 1052001));

	REQUIRE(pool.loads() == std::vector<std::size_t>{0, 0});
}

TEST_CASE_METHOD(Fixture, "download the whole object", "[normal]")
{
	auto res = get(download_path({100, 7}));
	REQUIRE(std::holds_alternative<StreamResponse>(res));

	auto& stream_res = std::get<StreamResponse>(res);
	REQUIRE(stream_res.header.result() == http::status::ok);
	REQUIRE(field(stream_res.header, http::field::content_length) == "3145728");
	REQUIRE(field(stream_res.header, http::field::content_range).empty());
	REQUIRE(stream_res.stream->window().chunk_count == 3);

	REQUIRE(drain(*stream_res.stream) == movie);
}

TEST_CASE_METHOD(Fixture, "open-ended range", "[normal]")
{
	auto res = get(download_path({100, 7}), "bytes=3145000-");
	auto& stream_res = std::get<StreamResponse>(res);
	REQUIRE(stream_res.header.result() == http::status::partial_content);
	REQUIRE(field(stream_res.header, http::field::content_range) == "bytes 3145000-3145727/3145728");
	REQUIRE(drain(*stream_res.stream) == movie.substr(3145000));
}

TEST_CASE_METHOD(Fixture, "HEAD sends headers only", "[normal]")
{
	StringRequest req{http::verb::head, download_path({100, 7}), 11};
	auto res = call(std::move(req));
	REQUIRE(std::holds_alternative<StreamResponse>(res));

	auto& stream_res = std::get<StreamResponse>(res);
	REQUIRE(stream_res.header.result() == http::status::ok);
	REQUIRE(field(stream_res.header, http::field::content_length) == "3145728");
	REQUIRE(!stream_res.stream);
	REQUIRE(pool.loads() == std::vector<std::size_t>{0, 0});
}

TEST_CASE_METHOD(Fixture, "unsatisfiable range", "[error]")
{
	auto res = get("/dl/BQACAg" + codec.encode({100, 8}) + "/small.bin", "bytes=900-1500");
	REQUIRE(std::holds_alternative<StringResponse>(res));

	auto& str = std::get<StringResponse>(res);
	REQUIRE(str.result() == http::status::range_not_satisfiable);
	REQUIRE(field(str, http::field::content_range) == "bytes */1000");
	REQUIRE(pool.loads() == std::vector<std::size_t>{0, 0});
}

TEST_CASE_METHOD(Fixture, "malformed range", "[error]")
{
	for (auto range : {"items=0-1", "bytes=0-1,5-6", "bytes=-500", "bytes=a-b"})
	{
		INFO(range);
		auto res = get(download_path({100, 7}), range);
		REQUIRE(std::holds_alternative<StringResponse>(res));
		REQUIRE(std::get<StringResponse>(res).result() == http::status::bad_request);
	}
}

TEST_CASE_METHOD(Fixture, "tampered download links", "[error]")
{
	auto status = [this](const std::string& target)
	{
		auto res = get(target);
		REQUIRE(std::holds_alternative<StringResponse>(res));
		return std::get<StringResponse>(res).result();
	};

	// token too short
	REQUIRE(status("/dl/AgADBQ" + codec.encode({100, 7}).substr(1) + "/a.mp4") == http::status::bad_request);

	// token does not decode
	REQUIRE(status("/dl/AgADBQ" + std::string(LinkCodec::token_length, 'x') + "/a.mp4") == http::status::bad_request);

	// token from another secret
	LinkCodec other{"another secret"};
	REQUIRE(status("/dl/AgADBQ" + other.encode({100, 7}) + "/a.mp4") == http::status::bad_request);

	// wrong fingerprint looks like a missing object
	REQUIRE(status(download_path({100, 7}, "ZZZZZZ")) == http::status::not_found);

	// valid token of an object that does not exist
	REQUIRE(status(download_path({100, 99})) == http::status::not_found);

	REQUIRE(pool.loads() == std::vector<std::size_t>{0, 0});
}

TEST_CASE_METHOD(Fixture, "deleted object is not found after a download", "[error]")
{
	auto first = get("/dl/BQACAg" + codec.encode({100, 8}) + "/small.bin");
	REQUIRE(std::holds_alternative<StreamResponse>(first));
	REQUIRE(drain(*std::get<StreamResponse>(first).stream) == pattern(1000));

	std::filesystem::remove(dir.path() / "100" / "8");

	auto again = get("/dl/BQACAg" + codec.encode({100, 8}) + "/small.bin");
	REQUIRE(std::holds_alternative<StringResponse>(again));
	REQUIRE(std::get<StringResponse>(again).result() == http::status::not_found);
	REQUIRE(pool.loads() == std::vector<std::size_t>{0, 0});
}

TEST_CASE_METHOD(Fixture, "replaced object fails the old fingerprint", "[error]")
{
	REQUIRE(std::holds_alternative<StreamResponse>(get("/dl/BQACAg" + codec.encode({100, 8}) + "/small.bin")));

	dir.write("100/8.json", R"({"unique_id": "DQACAgUAAxkB", "file_name": "small.bin"})");

	auto res = get("/dl/BQACAg" + codec.encode({100, 8}) + "/small.bin");
	REQUIRE(std::holds_alternative<StringResponse>(res));
	REQUIRE(std::get<StringResponse>(res).result() == http::status::not_found);
}

TEST_CASE_METHOD(Fixture, "watch page", "[normal]")
{
	auto res = get("/watch/AgADBQ" + codec.encode({100, 7}) + "/Big_Buck_Bunny.mp4");
	REQUIRE(std::holds_alternative<StringResponse>(res));

	auto& page = std::get<StringResponse>(res);
	REQUIRE(page.result() == http::status::ok);
	REQUIRE(field(page, http::field::content_type) == "text/html; charset=utf-8");
	REQUIRE(page.body().find("<title>Big_Buck_Bunny.mp4</title>") != std::string::npos);
	REQUIRE(page.body().find("src=\"" + base_url + download_path({100, 7}) + "\"") != std::string::npos);

	auto bad = get("/watch/AgADBQ" + std::string(LinkCodec::token_length, 'x') + "/a.mp4");
	REQUIRE(std::get<StringResponse>(bad).result() == http::status::bad_request);
}

TEST_CASE_METHOD(Fixture, "unknown resources", "[error]")
{
	REQUIRE(std::get<StringResponse>(get("/")).result() == http::status::not_found);
	REQUIRE(std::get<StringResponse>(get("/dl/")).result() == http::status::not_found);
	REQUIRE(api(http::verb::get, "/api/nothing").result() == http::status::not_found);
}

TEST_CASE_METHOD(Fixture, "API requires basic authentication", "[error]")
{
	auto none = api(http::verb::get, "/api/files", {}, {});
	REQUIRE(none.result() == http::status::unauthorized);
	REQUIRE(field(none, http::field::www_authenticate) == R"(Basic realm="chunkgate")");

	// admin:wrong
	REQUIRE(api(http::verb::get, "/api/files", {}, "Basic YWRtaW46d3Jvbmc=").result() == http::status::unauthorized);
	REQUIRE(api(http::verb::get, "/api/files", {}, "Bearer YWRtaW46c2VjcmV0").result() == http::status::unauthorized);
	REQUIRE(api(http::verb::get, "/api/files", {}, "Basic !!!").result() == http::status::unauthorized);

	REQUIRE(api(http::verb::get, "/api/files").result() == http::status::ok);
}

TEST_CASE_METHOD(Fixture, "upload, issue link, list, stats and delete", "[normal]")
{
	auto uploaded = api(http::verb::post, "/api/uploads",
		R"({"user_id": 1, "interaction_id": 2, "container_id": 100, "object_id": 7, "display_name": "My Movie.mp4"})");
	REQUIRE(uploaded.result() == http::status::created);

	auto upload_json = nlohmann::json::parse(uploaded.body());
	REQUIRE(upload_json["created"] == true);
	REQUIRE(upload_json["display_name"] == "My Movie.mp4");
	REQUIRE(upload_json["size_label"] == "3.00 MB");
	auto id = upload_json["id"].get<std::string>();

	// same content from another object
	auto again = api(http::verb::post, "/api/uploads",
		R"({"user_id": 3, "interaction_id": 4, "container_id": 200, "object_id": 1})");
	REQUIRE(again.result() == http::status::ok);
	REQUIRE(nlohmann::json::parse(again.body())["created"] == false);
	REQUIRE(nlohmann::json::parse(again.body())["id"] == id);

	auto issued = api(http::verb::post, "/api/links", R"({"user_id": 1, "interaction_id": 2})");
	REQUIRE(issued.result() == http::status::ok);
	auto link_json = nlohmann::json::parse(issued.body());
	auto download_url = link_json["download_url"].get<std::string>();
	REQUIRE(download_url == base_url + "/dl/AgADBQ" + codec.encode({100, 7}) + "/My_Movie.mp4");
	REQUIRE(link_json["watch_url"] == base_url + "/watch/AgADBQ" + codec.encode({100, 7}) + "/My_Movie.mp4");

	// the issued link works
	auto downloaded = get(download_url.substr(base_url.size()), "bytes=0-99");
	auto& stream_res = std::get<StreamResponse>(downloaded);
	REQUIRE(stream_res.header.result() == http::status::partial_content);
	REQUIRE(drain(*stream_res.stream) == movie.substr(0, 100));

	auto list = nlohmann::json::parse(api(http::verb::get, "/api/files?page=1&page_size=10&search=movie").body());
	REQUIRE(list["total_count"] == 1);
	REQUIRE(list["page"] == 1);
	REQUIRE(list["page_size"] == 10);
	REQUIRE(list["files"].size() == 1);
	REQUIRE(list["files"][0]["id"] == id);
	REQUIRE(list["files"][0]["access_count"] == 1);
	REQUIRE(list["files"][0]["download_url"] == download_url);

	auto clamped = nlohmann::json::parse(api(http::verb::get, "/api/files?page_size=1000").body());
	REQUIRE(clamped["page_size"] == RequestHandler::max_page_size);
	REQUIRE(clamped["page"] == 1);

	REQUIRE(nlohmann::json::parse(api(http::verb::get, "/api/files?search=nothing").body())["total_count"] == 0);
	REQUIRE(api(http::verb::get, "/api/files?page=0").result() == http::status::bad_request);
	REQUIRE(api(http::verb::get, "/api/files?page=abc").result() == http::status::bad_request);

	auto stats = nlohmann::json::parse(api(http::verb::get, "/api/files/stats").body());
	REQUIRE(stats["total_files"] == 1);
	REQUIRE(stats["total_size"] == three_mib);
	REQUIRE(stats["total_size_label"] == "3.00 MB");
	REQUIRE(stats["unique_users"] == 1);
	REQUIRE(stats["shards"].size() == 2);
	REQUIRE(stats["shards"][0]["name"] == "shard1");
	REQUIRE(stats["shards"][0]["files"] == 1);

	auto deleted = api(http::verb::delete_, "/api/files/" + id);
	REQUIRE(deleted.result() == http::status::ok);
	REQUIRE(nlohmann::json::parse(deleted.body())["success"] == true);

	REQUIRE(api(http::verb::delete_, "/api/files/" + id).result() == http::status::not_found);
	REQUIRE(api(http::verb::delete_, "/api/files/not-an-id").result() == http::status::bad_request);

	// the pending interaction now refers to a removed record
	REQUIRE(api(http::verb::post, "/api/links", R"({"user_id": 1, "interaction_id": 2})").result() == http::status::not_found);
}

TEST_CASE_METHOD(Fixture, "invalid API requests", "[error]")
{
	REQUIRE(api(http::verb::post, "/api/uploads", "not json").result() == http::status::bad_request);
	REQUIRE(api(http::verb::post, "/api/uploads", R"({"user_id": 1})").result() == http::status::bad_request);
	REQUIRE(api(http::verb::post, "/api/uploads", R"({"user_id": "x", "interaction_id": 2, "container_id": 100, "object_id": 7})").result() == http::status::bad_request);
	REQUIRE(api(http::verb::post, "/api/links", "[]").result() == http::status::bad_request);

	// upload of an object the store does not have
	REQUIRE(api(http::verb::post, "/api/uploads",
		R"({"user_id": 1, "interaction_id": 2, "container_id": 100, "object_id": 99})").result() == http::status::not_found);

	REQUIRE(api(http::verb::post, "/api/links", R"({"user_id": 1, "interaction_id": 2})").result() == http::status::not_found);
}

TEST_CASE("API is disabled without admin password", "[error]")
{
	auto remote = std::make_shared<MemoryRemote>();
	SessionPool pool{std::vector<std::shared_ptr<RemoteSession>>{remote}};
	StreamerCache streamers{16};
	ShardedRegistry registry{Fixture::make_shards(), 1};
	PendingAssociationCache pending;
	LinkCodec codec{"secret"};
	LinkService links{pool, streamers, registry, pending, codec, LinkService::Settings{base_url}};
	RequestHandler subject{pool, streamers, registry, links, codec, RequestHandler::Settings{base_url, "", "", 1024*1024}};

	StringRequest req{http::verb::get, "/api/files", 11};
	req.set(http::field::authorization, "Basic Og==");     // ":"

	bool called = false;
	subject.handle(std::move(req), [&called](Response&& res)
	{
		called = true;
		REQUIRE(std::get<StringResponse>(res).result() == http::status::unauthorized);
	});
	REQUIRE(called);
}
