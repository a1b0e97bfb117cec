/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "crypto/Random.hh"
#include "util/Escape.hh"

#include <filesystem>
#include <fstream>
#include <string_view>

namespace cgw {

/// A unique directory under the system temporary directory. It is removed
/// with everything in it on destruction.
class TempDirectory
{
public:
	TempDirectory() :
		m_path{std::filesystem::temp_directory_path() / ("chunkgate-" + to_hex(insecure_random_array<unsigned char, 8>()))}
	{
		std::filesystem::create_directories(m_path);
	}
	TempDirectory(const TempDirectory&) = delete;
	TempDirectory& operator=(const TempDirectory&) = delete;

	~TempDirectory()
	{
		std::error_code ec;
		std::filesystem::remove_all(m_path, ec);
	}

	const std::filesystem::path& path() const {return m_path;}

	void write(const std::filesystem::path& relative, std::string_view content) const
	{
		auto file = m_path / relative;
		std::filesystem::create_directories(file.parent_path());

		std::ofstream out{file, std::ios::binary};
		out.write(content.data(), static_cast<std::streamsize>(content.size()));
	}

private:
	std::filesystem::path m_path;
};

} // end of namespace cgw
