/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/15/18.
//

#include "FileID.hh"

#include "crypto/Random.hh"
#include "util/Escape.hh"

#include <ostream>
#include <stdexcept>

namespace cgw {

FileID::FileID(const std::array<unsigned char, length>& array)
{
	std::copy(array.begin(), array.end(), begin());
}

std::optional<FileID> FileID::from_hex(std::string_view hex)
{
	auto opt_array = hex_to_array<length>(hex);
	if (opt_array.has_value())
		return FileID{*opt_array};
	else
		return std::nullopt;
}

FileID FileID::randomize()
{
	return FileID{secure_random_array<unsigned char, length>()};
}

std::string FileID::hex() const
{
	return to_hex(*this);
}

std::ostream& operator<<(std::ostream& os, const FileID& id)
{
	return os << id.hex();
}

void from_json(const nlohmann::json& src, FileID& dest)
{
	if (auto opt = FileID::from_hex(src.get<std::string>()); opt.has_value())
		dest = *opt;
	else
		throw std::invalid_argument("invalid file ID");
}

void to_json(nlohmann::json& dest, const FileID& src)
{
	dest = src.hex();
}

} // end of namespace
