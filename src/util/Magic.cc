/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#include "Magic.hh"
#include "Log.hh"

#include <boost/algorithm/string/predicate.hpp>

#include <array>
#include <utility>

namespace cgw {

Magic::Magic() : m_cookie{::magic_open(MAGIC_MIME_TYPE)}
{
	if (!m_cookie || ::magic_load(m_cookie, nullptr) != 0)
		Log(LOG_WARNING, "cannot load magic database: %1%", m_cookie ? ::magic_error(m_cookie) : "out of memory");
}

Magic::~Magic()
{
	if (m_cookie)
		::magic_close(m_cookie);
}

const Magic& Magic::instance()
{
	static const Magic inst;
	return inst;
}

std::string Magic::mime(const void *buffer, std::size_t size) const
{
	std::unique_lock lock{m_mx};
	auto result = m_cookie ? ::magic_buffer(m_cookie, buffer, size) : nullptr;
	return result ? std::string{result} : std::string{};
}

std::string Magic::mime(const std::filesystem::path& path) const
{
	std::unique_lock lock{m_mx};
	auto result = m_cookie ? ::magic_file(m_cookie, path.string().c_str()) : nullptr;
	return result ? std::string{result} : std::string{};
}

std::string_view mime_from_extension(std::string_view filename)
{
	static const std::array<std::pair<std::string_view, std::string_view>, 20> table{{
		{".mp4",  "video/mp4"},
		{".m4v",  "video/mp4"},
		{".mkv",  "video/x-matroska"},
		{".webm", "video/webm"},
		{".mov",  "video/quicktime"},
		{".avi",  "video/x-msvideo"},
		{".mp3",  "audio/mpeg"},
		{".m4a",  "audio/mp4"},
		{".ogg",  "audio/ogg"},
		{".flac", "audio/flac"},
		{".wav",  "audio/wav"},
		{".jpg",  "image/jpeg"},
		{".jpeg", "image/jpeg"},
		{".png",  "image/png"},
		{".gif",  "image/gif"},
		{".webp", "image/webp"},
		{".pdf",  "application/pdf"},
		{".zip",  "application/zip"},
		{".txt",  "text/plain"},
		{".json", "application/json"},
	}};

	for (auto&& [ext, mime] : table)
	{
		if (boost::algorithm::iends_with(filename, ext))
			return mime;
	}
	return {};
}

std::string_view mime_subtype(std::string_view mime)
{
	auto slash = mime.find('/');
	if (slash == mime.npos || slash + 1 == mime.size())
		return {};

	mime.remove_prefix(slash + 1);

	// drop parameters like "; charset=utf-8"
	return mime.substr(0, mime.find(';'));
}

} // end of namespace
