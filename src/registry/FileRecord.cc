/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "FileRecord.hh"

#include "crypto/Random.hh"
#include "util/Escape.hh"
#include "util/Magic.hh"

#include <boost/format.hpp>

#include <array>
#include <cctype>

namespace cgw {

void to_json(nlohmann::json& dest, const FileRecord& src)
{
	dest = nlohmann::json{
		{"id",              src.id},
		{"owner",           src.owner},
		{"container_id",    src.location.container},
		{"object_id",       src.location.object},
		{"display_name",    src.display_name},
		{"url_safe_name",   src.url_safe_name},
		{"size",            src.size},
		{"size_label",      src.size_label},
		{"content_hash",    src.content_hash},
		{"fingerprint",     src.fingerprint},
		{"access_count",    src.access_count},
		{"uploaded_at",     src.uploaded_at}
	};
}

void from_json(const nlohmann::json& src, FileRecord& dest)
{
	dest.id                 = src.at("id").get<FileID>();
	dest.owner              = src.at("owner").get<std::int64_t>();
	dest.location.container = src.at("container_id").get<std::int64_t>();
	dest.location.object    = src.at("object_id").get<std::int64_t>();
	dest.display_name       = src.value("display_name", std::string{});
	dest.url_safe_name      = src.value("url_safe_name", std::string{});
	dest.size               = src.value("size", std::int64_t{});
	dest.size_label         = src.value("size_label", std::string{});
	dest.content_hash       = src.at("content_hash").get<std::string>();
	dest.fingerprint        = src.value("fingerprint", std::string{});
	dest.access_count       = src.value("access_count", std::int64_t{});
	dest.uploaded_at        = src.at("uploaded_at").get<Timestamp>();
}

std::string sanitize_filename(std::string_view filename)
{
	auto dot = filename.rfind('.');
	auto stem = filename.substr(0, dot);
	auto ext  = dot == filename.npos ? std::string_view{} : filename.substr(dot + 1);

	std::string result;
	for (auto c : stem)
	{
		if (c == ' ')
			c = '_';

		if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-')
			continue;

		if (c == '_' && !result.empty() && result.back() == '_')
			continue;

		result.push_back(c);
	}

	while (!result.empty() && result.front() == '_')
		result.erase(result.begin());
	while (!result.empty() && result.back() == '_')
		result.pop_back();

	if (!ext.empty())
		(result += '.') += ext;
	return result;
}

std::string readable_size(std::int64_t size)
{
	if (size == 0)
		return "0 B";

	static const std::array<const char*, 5> units{"B", "KB", "MB", "GB", "TB"};

	auto value = static_cast<double>(size);
	std::size_t unit = 0;
	while (value >= 1024 && unit + 1 < units.size())
	{
		value /= 1024.0;
		++unit;
	}
	return (boost::format("%.2f %s") % value % units[unit]).str();
}

std::string synthesize_filename(std::string_view mime)
{
	auto subtype = mime_subtype(mime);
	return to_hex(insecure_random_array<unsigned char, 2>()) + "." +
		(subtype.empty() ? std::string{"unknown"} : std::string{subtype});
}

} // end of namespace cgw
