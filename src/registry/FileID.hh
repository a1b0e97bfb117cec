/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 12 Feb 2018.
//

#pragma once

#include <boost/functional/hash.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace cgw {

/// 12 random bytes identifying a FileRecord across all shards.
struct FileID : std::array<unsigned char, 12>
{
	static constexpr std::size_t length = 12;

	FileID() = default;
	explicit FileID(const std::array<unsigned char, length>& array);

	static std::optional<FileID> from_hex(std::string_view hex);
	static FileID randomize();

	std::string hex() const;
};

static_assert(std::is_standard_layout<FileID>::value);

std::ostream& operator<<(std::ostream& os, const FileID& id);

void from_json(const nlohmann::json& src, FileID& dest);
void to_json(nlohmann::json& dest, const FileID& src);

} // end of namespace

// inject hash<> to std namespace for unordered_map
namespace std
{
    template<> struct hash<cgw::FileID>
    {
        typedef cgw::FileID argument_type;
        typedef std::size_t result_type;
        result_type operator()(const argument_type& s) const noexcept
		{
			return boost::hash_range(s.begin(), s.end());
		}
   };
}
