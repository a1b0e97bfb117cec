/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "FileID.hh"

#include "stream/RemoteSession.hh"
#include "util/Timestamp.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace cgw {

/// One uploaded object known to the registry. Only access_count changes
/// after insertion.
struct FileRecord
{
	FileID              id;
	std::int64_t        owner{};
	ObjectCoordinate    location;
	std::string         display_name;
	std::string         url_safe_name;
	std::int64_t        size{};
	std::string         size_label;
	std::string         content_hash;
	std::string         fingerprint;
	std::int64_t        access_count{};
	Timestamp           uploaded_at;
};

void to_json(nlohmann::json& dest, const FileRecord& src);
void from_json(const nlohmann::json& src, FileRecord& dest);

/// Keep the extension. In the rest, spaces become '_', characters outside
/// [A-Za-z0-9._-] are dropped, repeated '_' are collapsed and leading or
/// trailing '_' are stripped.
std::string sanitize_filename(std::string_view filename);

/// e.g. "0 B", "512.00 B", "1.50 MB"
std::string readable_size(std::int64_t size);

/// Name for objects stored without one: 4 random hex digits and the mime
/// subtype as extension, or ".unknown".
std::string synthesize_filename(std::string_view mime);

} // end of namespace cgw
