/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 4/8/18.
//

#include "RequestHandler.hh"

#include "link/IntegrityGuard.hh"
#include "link/LinkCodec.hh"
#include "link/LinkService.hh"
#include "registry/ShardedRegistry.hh"
#include "stream/ByteRange.hh"
#include "stream/ChunkWindow.hh"
#include "stream/ObjectStreamer.hh"
#include "stream/SessionPool.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"
#include "util/Magic.hh"
#include "util/StringFields.hh"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>

#include <openssl/crypto.h>

#include <algorithm>
#include <charconv>
#include <optional>

namespace cgw {
namespace {

const char watch_page[] = R"__(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<title>%1%</title>
<style>
body {margin: 0; background: #111; color: #eee; font-family: sans-serif;}
main {max-width: 960px; margin: 2em auto; padding: 0 1em;}
video {width: 100%%; background: #000;}
a {color: #9cf;}
</style>
</head>
<body>
<main>
<h1>%1%</h1>
<video controls preload="metadata" src="%2%"></video>
<p><a href="%2%" download>Download</a></p>
</main>
</body>
</html>
)__";

std::string_view to_view(boost::beast::string_view s)
{
	return {s.data(), s.size()};
}

// Remove "prefix" from the front of "path" if it is there.
bool consume(std::string_view& path, std::string_view prefix)
{
	if (path.substr(0, prefix.size()) != prefix)
		return false;

	path.remove_prefix(prefix.size());
	return true;
}

template <typename Integer>
std::optional<Integer> to_integer(std::string_view text)
{
	Integer result{};
	auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
	if (ec != std::errc{} || end != text.data() + text.size())
		return std::nullopt;
	return result;
}

std::string quote_safe(std::string name)
{
	name.erase(std::remove_if(name.begin(), name.end(), [](char c)
	{
		return c == '"' || c == '\\' || c == '\r' || c == '\n';
	}), name.end());
	return name;
}

} // end of local namespace

RequestHandler::RequestHandler(
	SessionPool& pool,
	StreamerCache& streamers,
	ShardedRegistry& registry,
	LinkService& links,
	const LinkCodec& codec,
	Settings settings
) :
	m_pool{pool},
	m_streamers{streamers},
	m_registry{registry},
	m_links{links},
	m_codec{codec},
	m_settings{std::move(settings)}
{
}

void RequestHandler::handle(StringRequest&& req, ResponseSender&& send)
{
	auto query = to_view(req.target());
	auto path  = std::get<0>(split_left(query, "?"));
	auto method = req.method();

	auto remain = path;
	if (consume(remain, "/dl/") && (method == http::verb::get || method == http::verb::head))
	{
		auto segment = std::get<0>(split_left(remain, "/"));
		if (!remain.empty())
			return on_download(req, segment, remain, std::move(send));
	}

	remain = path;
	if (consume(remain, "/watch/") && method == http::verb::get)
	{
		auto segment = std::get<0>(split_left(remain, "/"));
		if (!remain.empty())
			return on_watch(req, segment, remain, std::move(send));
	}

	remain = path;
	if (consume(remain, "/api/"))
		return on_api(req, remain, query, std::move(send));

	send(text_response(http::status::not_found, "The requested resource was not found.", req.version()));
}

ObjectCoordinate RequestHandler::decode_segment(std::string_view segment, std::string_view& fingerprint, std::error_code& ec) const
{
	auto [presented, token] = IntegrityGuard::split(segment, ec);
	if (ec)
		return {};

	fingerprint = presented;
	return m_codec.decode(token, ec);
}

void RequestHandler::on_download(const StringRequest& req, std::string_view segment, std::string_view, ResponseSender&& send)
{
	auto version = req.version();

	std::error_code ec;
	std::string_view fingerprint;
	auto coord = decode_segment(segment, fingerprint, ec);
	if (ec)
	{
		Log(LOG_INFO, "rejected download link: %1%", ec.message());
		return send(error_response(ec, version));
	}

	// Everything the completion needs must be copied out of the request.
	// It is gone by the time the object is resolved.
	auto lease = std::make_shared<SessionPool::Lease>(m_pool.acquire());
	auto& streamer = m_streamers.get(lease->session());
	streamer.resolve(coord, [
		this, &streamer, lease, version, send=std::move(send),
		fingerprint=std::string{fingerprint},
		range_header=std::string{to_view(req[http::field::range])},
		head=(req.method() == http::verb::head)
	](ObjectMetadata meta, std::error_code ec)
	{
		if (!ec)
			ec = IntegrityGuard::verify(meta, fingerprint);
		if (ec)
		{
			Log(LOG_INFO, "download rejected: %1%", ec.message());
			return send(error_response(ec, version));
		}

		auto range = parse_range(range_header, meta.size, ec);
		if (ec)
		{
			auto res = error_response(ec, version);
			if (ec == Error::range_not_satisfiable)
				res.set(http::field::content_range, unsatisfiable_range(meta.size));
			return send(std::move(res));
		}

		auto mime = !meta.mime_type.empty() ? meta.mime_type : std::string{mime_from_extension(meta.file_name)};
		if (mime.empty())
			mime = "application/octet-stream";
		auto file_name = !meta.file_name.empty() ? meta.file_name : synthesize_filename(mime);

		StreamResponse res;
		res.header.result(range.partial ? http::status::partial_content : http::status::ok);
		res.header.version(version);
		res.header.set(http::field::content_type, mime);
		res.header.set(http::field::content_disposition, "inline; filename=\"" + quote_safe(file_name) + "\"");
		res.header.set(http::field::accept_ranges, "bytes");
		res.header.set(http::field::cache_control, "public, max-age=3600, immutable");
		res.header.set(http::field::access_control_allow_origin, "*");
		res.header.set(http::field::access_control_expose_headers, "Content-Length, Content-Range, Accept-Ranges");
		if (range.partial)
			res.header.set(http::field::content_range, range.content_range(meta.size));
		res.header.content_length(static_cast<std::uint64_t>(range.length()));

		// HEAD requests drop the lease here
		if (!head)
			res.stream = streamer.fetch(
				std::move(*lease), meta, ChunkWindow::plan(range, m_settings.chunk_size)
			);

		send(std::move(res));
	});
}

void RequestHandler::on_watch(const StringRequest& req, std::string_view segment, std::string_view name, ResponseSender&& send)
{
	std::error_code ec;
	std::string_view fingerprint;
	decode_segment(segment, fingerprint, ec);
	if (ec)
		return send(error_response(ec, req.version()));

	auto source = m_settings.base_url + "/dl/" + std::string{segment} + "/" + std::string{name};
	StringResponse res{
		std::piecewise_construct,
		std::make_tuple((boost::format(watch_page) % html_escape(url_decode(name)) % html_escape(source)).str()),
		std::make_tuple(http::status::ok, req.version())
	};
	res.set(http::field::content_type, "text/html; charset=utf-8");
	res.set(http::field::cache_control, "no-cache");
	send(std::move(res));
}

bool RequestHandler::authorized(const StringRequest& req) const
{
	// no password, no API
	if (m_settings.admin_password.empty())
		return false;

	auto auth = to_view(req[http::field::authorization]);
	if (auth.size() < 6 || !boost::algorithm::iequals(auth.substr(0, 6), "Basic "))
		return false;

	auto credential = base64_decode(auth.substr(6));
	if (!credential)
		return false;

	auto expected = m_settings.admin_username + ":" + m_settings.admin_password;
	return credential->size() == expected.size() &&
		CRYPTO_memcmp(credential->data(), expected.data(), expected.size()) == 0;
}

void RequestHandler::on_api(const StringRequest& req, std::string_view path, std::string_view query, ResponseSender&& send)
{
	if (!authorized(req))
	{
		auto res = json_response({{"error", "authentication required"}}, http::status::unauthorized, req.version());
		res.set(http::field::www_authenticate, R"(Basic realm="chunkgate")");
		return send(std::move(res));
	}

	auto method = req.method();
	if (path == "uploads" && method == http::verb::post)
		return on_upload(req, std::move(send));

	if (path == "links" && method == http::verb::post)
		return on_issue(req, std::move(send));

	if (path == "files" && method == http::verb::get)
		return on_list(req, query, std::move(send));

	if (path == "files/stats" && method == http::verb::get)
		return on_stats(req, std::move(send));

	if (consume(path, "files/") && method == http::verb::delete_)
		return on_delete(req, path, std::move(send));

	send(json_response({{"error", "not found"}}, http::status::not_found, req.version()));
}

void RequestHandler::on_upload(const StringRequest& req, ResponseSender&& send)
{
	auto version = req.version();
	auto json = nlohmann::json::parse(req.body(), nullptr, false);

	UploadEvent event;
	try
	{
		event.user                  = json.at("user_id").get<std::int64_t>();
		event.interaction           = json.at("interaction_id").get<std::int64_t>();
		event.location.container    = json.at("container_id").get<std::int64_t>();
		event.location.object       = json.at("object_id").get<std::int64_t>();

		if (auto name = json.find("display_name"); name != json.end() && name->is_string())
			event.display_name = name->get<std::string>();
	}
	catch (nlohmann::json::exception& e)
	{
		Log(LOG_INFO, "invalid upload event: %1%", e.what());
		return send(error_response(Error::invalid_request, version));
	}

	m_links.on_upload(event, [version, send=std::move(send)](FileRecord record, bool created, std::error_code ec)
	{
		if (ec)
			return send(error_response(ec, version));

		send(json_response(
			{
				{"id",              record.id.hex()},
				{"created",         created},
				{"display_name",    record.display_name},
				{"size_label",      record.size_label}
			},
			created ? http::status::created : http::status::ok,
			version
		));
	});
}

void RequestHandler::on_issue(const StringRequest& req, ResponseSender&& send)
{
	auto version = req.version();
	auto json = nlohmann::json::parse(req.body(), nullptr, false);

	std::int64_t user{}, interaction{};
	try
	{
		user        = json.at("user_id").get<std::int64_t>();
		interaction = json.at("interaction_id").get<std::int64_t>();
	}
	catch (nlohmann::json::exception& e)
	{
		Log(LOG_INFO, "invalid link request: %1%", e.what());
		return send(error_response(Error::invalid_request, version));
	}

	m_links.issue(user, interaction, [version, send=std::move(send)](IssuedLink link, std::error_code ec)
	{
		if (ec)
			return send(error_response(ec, version));

		send(json_response(
			{{"download_url", link.download_url}, {"watch_url", link.watch_url}},
			http::status::ok,
			version
		));
	});
}

void RequestHandler::on_list(const StringRequest& req, std::string_view query, ResponseSender&& send)
{
	auto version = req.version();
	auto [page_arg, size_arg, search] = urlform.find_optional(query, "page", "page_size", "search");

	auto page = page_arg ? to_integer<std::size_t>(*page_arg) : std::optional<std::size_t>{1};
	auto page_size = size_arg ? to_integer<std::size_t>(*size_arg) : std::optional<std::size_t>{default_page_size};
	if (!page || *page == 0 || !page_size)
		return send(error_response(Error::invalid_request, version));

	auto size = std::clamp(*page_size, std::size_t{1}, max_page_size);
	m_registry.list_page(
		search ? url_decode(*search) : std::string{},
		*page, size,
		[this, version, page=*page, size, send=std::move(send)](ShardedRegistry::Page result, std::error_code ec)
		{
			if (ec)
				return send(error_response(ec, version));

			auto files = nlohmann::json::array();
			for (auto&& record : result.records)
			{
				nlohmann::json entry(record);
				entry.emplace("download_url", m_settings.base_url + "/dl/" + m_links.link_path(record));
				files.push_back(std::move(entry));
			}

			send(json_response(
				{
					{"files",       std::move(files)},
					{"total_count", result.total},
					{"page",        page},
					{"page_size",   size}
				},
				http::status::ok,
				version
			));
		}
	);
}

void RequestHandler::on_stats(const StringRequest& req, ResponseSender&& send)
{
	m_registry.stats([version=req.version(), send=std::move(send)](ShardedRegistry::Stats stats, std::error_code ec)
	{
		if (ec)
			return send(error_response(ec, version));

		auto shards = nlohmann::json::array();
		for (auto&& shard : stats.shards)
			shards.push_back(nlohmann::json{{"name", shard.name}, {"files", shard.files}});

		send(json_response(
			{
				{"total_files",         stats.total_files},
				{"total_size",          stats.total_size},
				{"total_size_label",    readable_size(stats.total_size)},
				{"unique_users",        stats.unique_owners},
				{"shards",              std::move(shards)}
			},
			http::status::ok,
			version
		));
	});
}

void RequestHandler::on_delete(const StringRequest& req, std::string_view id, ResponseSender&& send)
{
	auto version = req.version();
	auto file_id = FileID::from_hex(id);
	if (!file_id)
		return send(error_response(Error::invalid_request, version));

	m_registry.remove(*file_id, [version, send=std::move(send)](bool removed, std::error_code ec)
	{
		if (ec)
			return send(error_response(ec, version));
		if (!removed)
			return send(error_response(Error::record_not_found, version));

		send(json_response({{"success", true}, {"message", "File deleted"}}, http::status::ok, version));
	});
}

http::status RequestHandler::status_of(std::error_code ec)
{
	if (ec.category() != chunkgate_error_category())
		return http::status::internal_server_error;

	switch (static_cast<Error>(ec.value()))
	{
		case Error::ok:                     return http::status::ok;
		case Error::malformed_range:
		case Error::malformed_token:
		case Error::invalid_request:        return http::status::bad_request;
		case Error::range_not_satisfiable:  return http::status::range_not_satisfiable;
		case Error::invalid_fingerprint:
		case Error::object_not_found:
		case Error::record_not_found:
		case Error::pending_not_found:      return http::status::not_found;
		case Error::upstream_unavailable:   return http::status::service_unavailable;
		default:                            return http::status::internal_server_error;
	}
}

StringResponse RequestHandler::error_response(std::error_code ec, unsigned version)
{
	auto status = status_of(ec);

	// Only our own taxonomy is safe to show. Redis and system errors may
	// carry internal details.
	auto message = (ec.category() == chunkgate_error_category()) ? ec.message() : std::string{"internal error"};
	if (status == http::status::internal_server_error)
		Log(LOG_WARNING, "request failed: %1% (%2%)", ec, ec.message());

	return json_response({{"error", message}}, status, version);
}

StringResponse RequestHandler::json_response(const nlohmann::json& json, http::status status, unsigned version)
{
	StringResponse res{
		std::piecewise_construct,
		std::make_tuple(json.dump()),
		std::make_tuple(status, version)
	};
	res.set(http::field::content_type, "application/json");
	res.set(http::field::cache_control, "no-cache, no-store, must-revalidate");
	return res;
}

} // end of namespace cgw
