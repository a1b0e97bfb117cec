/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include <boost/algorithm/hex.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace cgw {

template <std::size_t N>
std::string to_hex(const std::array<unsigned char, N>& arr)
{
	std::string result(arr.size()*2, '\0');
	boost::algorithm::hex_lower(arr.begin(), arr.end(), result.begin());
	return result;
}

template <std::size_t N>
std::optional<std::array<unsigned char, N>> hex_to_array(std::string_view hex)
{
	try
	{
		std::array<unsigned char, N> result{};
		if (hex.size() == result.size()*2)
		{
			boost::algorithm::unhex(hex.begin(), hex.end(), result.begin());
			return result;
		}
	}
	catch (boost::algorithm::hex_decode_error&)
	{
	}
	return std::nullopt;
}

std::string url_encode(std::string_view in);
std::string url_decode(std::string_view in);
std::string html_escape(std::string_view in);

/// RFC 4648 section 5 encoding without padding.
std::string base64url_encode(std::string_view bin);
std::optional<std::string> base64url_decode(std::string_view text);

/// Plain RFC 4648 base64 with padding, as used by HTTP basic authentication.
std::optional<std::string> base64_decode(std::string_view text);

std::tuple<std::string_view, char> split_left(std::string_view& in, std::string_view value);
std::string_view split_front_substring(std::string_view& in, std::string_view substring);

} // end of namespace
