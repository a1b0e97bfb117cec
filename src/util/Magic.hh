/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#pragma once

#include <magic.h>

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>

namespace cgw {

/// libmagic is not thread-safe. All lookups through the same cookie are serialized.
class Magic
{
public:
	Magic();
	Magic(const Magic&) = delete;
	Magic(Magic&&) = delete;
	~Magic();

	std::string mime(const void *buffer, std::size_t size) const;
	std::string mime(const std::filesystem::path& path) const;

	static const Magic& instance();

private:
	::magic_t m_cookie;
	mutable std::mutex m_mx;
};

/// Guess a mime type from the file name extension only. Returns an empty
/// string if the extension is unknown.
std::string_view mime_from_extension(std::string_view filename);

/// The part after '/' of a mime type, e.g. "mp4" for "video/mp4".
std::string_view mime_subtype(std::string_view mime);

} // end of namespace
